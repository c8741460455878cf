#include "core/bitboard.hpp"
#include "core/cards.hpp"

namespace pokercards {

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (const Card& c : cards) {
        set_card(board, c);
    }
    return board;
}

bool has_duplicates(const std::vector<Card>& cards) {
    return static_cast<std::size_t>(count_set_bits(cards_to_board(cards))) != cards.size();
}

} // namespace pokercards
