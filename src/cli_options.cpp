#include "pokercards/cli_options.h"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace pokercards {

namespace {

bool all_digits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

uint32_t parse_seed(const std::string& text) {
    // stoul accepte "-1" (valeur repliée) et les blancs en tête : on filtre avant
    if (!all_digits(text)) {
        throw std::invalid_argument("--seed: expected an unsigned integer, got '" + text + "'");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--seed: value out of range: '" + text + "'");
    }
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("--seed: value out of range: '" + text + "'");
    }
    return static_cast<uint32_t>(value);
}

int parse_players(const std::string& text) {
    std::size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--players: value out of range: '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("--players: expected an integer, got '" + text + "'");
    }
    return value;
}

Options parse_options(int argc, const char* const argv[]) {
    Options opts;
    if (argc < 2) {
        throw std::invalid_argument("missing command");
    }
    opts.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--players" || arg == "--seed") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            const std::string value = argv[++i];
            if (arg == "--players") {
                opts.num_players = parse_players(value);
            } else {
                opts.seed = parse_seed(value);
            }
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option '" + arg + "'");
        } else {
            opts.cards.push_back(arg);
        }
    }
    return opts;
}

} // namespace pokercards
