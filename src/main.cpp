#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include "core/deck.hpp"
#include "eval/hand_evaluator.hpp"
#include "pokercards/cli_options.h"
#include "pokercards/game_utils.hpp"
#include "pokercards/logging.h"
#include "pokercards/showdown.h"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"

#include <exception>  // std::exception
#include <iostream>   // std::cerr
#include <memory>
#include <stdexcept>  // std::invalid_argument
#include <string>     // std::string
#include <vector>     // std::vector

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  pokercards eval <CARD> <CARD> <CARD> <CARD> <CARD> [CARD...] [--verbose]\n"
              << "  pokercards deal [--players N] [--seed S] [--verbose]\n"
              << "Card codes: rank (23456789TJQKA) + suit (SHDC), e.g. AS TH 2C.\n"
              << "Log levels: SPDLOG_LEVEL=debug|info|warn|...\n";
}

int run_eval(const pokercards::Options& opts, const std::shared_ptr<spdlog::logger>& trace) {
    const std::vector<pokercards::Card> cards = pokercards::card_list(opts.cards);
    if (pokercards::has_duplicates(cards)) {
        spdlog::warn("La main contient des cartes en double : {}", pokercards::cards_to_string(cards));
    }
    pokercards::PokerHand hand(cards, true, trace);
    std::cout << hand.to_string() << '\n'
              << "rank " << hand.hand_rank() << " - " << hand.describe() << '\n';
    return 0;
}

int run_deal(const pokercards::Options& opts, const std::shared_ptr<spdlog::logger>& trace) {
    pokercards::Deck deck = opts.seed ? pokercards::Deck(*opts.seed) : pokercards::Deck();
    deck.shuffle();
    const pokercards::HoldemDeal deal = pokercards::deal_holdem(deck, opts.num_players);
    const auto stats = deck.stats();
    spdlog::info("Paquet : {} actives, {} distribuées, {} brûlées", stats.active, stats.popped, stats.discarded);

    std::vector<pokercards::PokerHand> hands;
    hands.reserve(deal.holes.size());
    for (const auto& hole : deal.holes) {
        hands.push_back(pokercards::make_player_hand(hole, deal.board, trace));
    }

    std::cout << "Board: " << pokercards::cards_to_string(deal.board, " ") << '\n';
    for (std::size_t idx : pokercards::order_hands(hands)) {
        std::cout << "  P" << idx << " [" << pokercards::cards_to_string(deal.holes[idx], " ") << "]  "
                  << hands[idx].describe() << '\n';
    }
    std::cout << "Winner(s):";
    for (std::size_t idx : pokercards::find_winners(hands)) {
        std::cout << " P" << idx;
    }
    std::cout << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    try
    {
        const pokercards::Options opts = pokercards::parse_options(argc, argv);

        // Traces de l'évaluateur uniquement en mode verbeux
        std::shared_ptr<spdlog::logger> trace;
        if (opts.verbose)
            trace = pokercards::logging::make_console_logger("pokercards.eval", spdlog::level::debug);

        if (opts.command == "eval")
            return run_eval(opts, trace);
        if (opts.command == "deal")
            return run_deal(opts, trace);

        spdlog::error("Commande inconnue : {}", opts.command);
        print_usage();
        return 1;
    }
    catch (const std::invalid_argument& e)
    {
        spdlog::error("Argument invalide : {}", e.what());
        print_usage();
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        return 1;
    }
}
