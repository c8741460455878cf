#include "core/cards.hpp"
#include "pokercards/errors.h"
#include <array>
#include <cctype>
#include <stdexcept>

namespace pokercards {

namespace {

// Tables indexées par l'enum (pas de recherche dans une chaîne)
constexpr std::array<char, 13> RANK_TO_CHAR = {
    '2', '3', '4', '5', '6', '7', '8', '9', 'T', 'J', 'Q', 'K', 'A'
};
constexpr std::array<char, 4> SUIT_TO_CHAR = { 'S', 'H', 'D', 'C' };

} // namespace

// --- Implémentations des fonctions de conversion ---

Rank rank_from_char(char r) {
    const char up = static_cast<char>(std::toupper(static_cast<unsigned char>(r)));
    for (std::size_t i = 0; i < RANK_TO_CHAR.size(); ++i) {
        if (RANK_TO_CHAR[i] == up) {
            return static_cast<Rank>(i);
        }
    }
    throw InvalidRank("Invalid rank character: " + std::string(1, r));
}

Suit suit_from_char(char s) {
    const char up = static_cast<char>(std::toupper(static_cast<unsigned char>(s)));
    for (std::size_t i = 0; i < SUIT_TO_CHAR.size(); ++i) {
        if (SUIT_TO_CHAR[i] == up) {
            return static_cast<Suit>(i);
        }
    }
    throw InvalidSuit("Invalid suit character: " + std::string(1, s));
}

std::string to_string(Rank r) {
    const auto i = static_cast<std::size_t>(r);
    if (i >= RANK_TO_CHAR.size()) {
        return "?";
    }
    return std::string(1, RANK_TO_CHAR[i]);
}

std::string to_string(Suit s) {
    const auto i = static_cast<std::size_t>(s);
    if (i >= SUIT_TO_CHAR.size()) {
        return "?";
    }
    return std::string(1, SUIT_TO_CHAR[i]);
}

std::string to_string(const Card& c) {
    return to_string(c.rank()) + to_string(c.suit());
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'RS'.");
    }
    // InvalidRank / InvalidSuit se propagent tels quels
    return Card(rank_from_char(s[0]), suit_from_char(s[1]));
}

Card::Card(const std::string& code) : Card(card_from_string(code)) {}

std::vector<Card> card_list(std::initializer_list<std::string> codes) {
    std::vector<Card> cards;
    cards.reserve(codes.size());
    for (const auto& code : codes) {
        cards.push_back(card_from_string(code));
    }
    return cards;
}

std::vector<Card> card_list(const std::vector<std::string>& codes) {
    std::vector<Card> cards;
    cards.reserve(codes.size());
    for (const auto& code : codes) {
        cards.push_back(card_from_string(code));
    }
    return cards;
}

std::ostream& operator<<(std::ostream& os, const Card& c) {
    return os << to_string(c);
}

} // namespace pokercards
