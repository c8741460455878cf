#ifndef POKERCARDS_COMMON_TYPES_H
#define POKERCARDS_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>

namespace pokercards {

constexpr int NUM_CARDS = 52;
constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;

constexpr std::size_t HAND_SIZE  = 5; // Taille d'une main évaluée
constexpr std::size_t HOLE_SIZE  = 2;
constexpr std::size_t BOARD_SIZE = 5;

constexpr int MIN_PLAYERS = 2;
constexpr int MAX_PLAYERS = 10;

// Position de retour des cartes dans le paquet (face cachée sur la table)
enum class Position : uint8_t {
    TOP,
    BOTTOM
};

// Catégories de mains, de la plus faible à la plus forte
enum class HandCategory : uint8_t {
    HIGH_CARD = 0,
    ONE_PAIR,
    TWO_PAIR,
    THREE_OF_A_KIND,
    STRAIGHT,
    FLUSH,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    STRAIGHT_FLUSH
};

inline const char* position_to_string(Position pos) {
    switch (pos) {
        case Position::TOP: return "TOP";
        case Position::BOTTOM: return "BOTTOM";
        default: return "INVALID";
    }
}

inline const char* hand_category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD: return "High Card";
        case HandCategory::ONE_PAIR: return "One Pair";
        case HandCategory::TWO_PAIR: return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT: return "Straight";
        case HandCategory::FLUSH: return "Flush";
        case HandCategory::FULL_HOUSE: return "Full House";
        case HandCategory::FOUR_OF_A_KIND: return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH: return "Straight Flush";
        default: return "Unknown";
    }
}

} // namespace pokercards

#endif // POKERCARDS_COMMON_TYPES_H
