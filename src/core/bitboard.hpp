#ifndef POKERCARDS_BITBOARD_HPP
#define POKERCARDS_BITBOARD_HPP

#include <bit>
#include <cstdint>
#include <vector>

#include "core/cards.hpp"
#include "pokercards/common_types.h"

namespace pokercards {

// Masque de bits des cartes : bit Card::index() à 1 pour chaque carte présente
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1; // 52 bits set

inline void set_card(Bitboard& board, const Card& c) {
    board |= (1ULL << c.index());
}

inline bool test_card(Bitboard board, const Card& c) {
    return (board & (1ULL << c.index())) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

Bitboard cards_to_board(const std::vector<Card>& cards);

// Vrai si une même carte (rang + couleur) apparaît deux fois
bool has_duplicates(const std::vector<Card>& cards);

} // namespace pokercards

#endif // POKERCARDS_BITBOARD_HPP
