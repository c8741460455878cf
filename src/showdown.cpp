#include "pokercards/showdown.h"
#include "pokercards/common_types.h"
#include "pokercards/game_utils.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace pokercards {

HoldemDeal deal_holdem(Deck& deck, int num_players) {
    if (num_players < MIN_PLAYERS || num_players > MAX_PLAYERS) {
        throw std::invalid_argument("deal_holdem: num_players must be in [" + std::to_string(MIN_PLAYERS) +
                                    ", " + std::to_string(MAX_PLAYERS) + "], got " +
                                    std::to_string(num_players));
    }
    HoldemDeal deal;
    deal.holes.resize(num_players);
    for (auto& hole : deal.holes) {
        hole.reserve(HOLE_SIZE);
    }
    // Une carte par joueur et par tour
    for (std::size_t round = 0; round < HOLE_SIZE; ++round) {
        for (auto& hole : deal.holes) {
            hole.push_back(deck.deal());
        }
    }

    deal.board.reserve(BOARD_SIZE);
    deck.burn();
    for (int i = 0; i < 3; ++i) {
        deal.board.push_back(deck.deal()); // flop
    }
    deck.burn();
    deal.board.push_back(deck.deal()); // turn
    deck.burn();
    deal.board.push_back(deck.deal()); // river

    spdlog::debug("deal_holdem: {} joueurs, board {}", num_players, vec_to_string(deal.board));
    return deal;
}

PokerHand make_player_hand(const std::vector<Card>& hole, const std::vector<Card>& board,
                           std::shared_ptr<spdlog::logger> logger) {
    std::vector<Card> cards;
    cards.reserve(hole.size() + board.size());
    cards.insert(cards.end(), hole.begin(), hole.end());
    cards.insert(cards.end(), board.begin(), board.end());
    return PokerHand(std::move(cards), true, std::move(logger));
}

std::vector<std::size_t> order_hands(const std::vector<PokerHand>& hands) {
    std::vector<std::size_t> order(hands.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&hands](std::size_t a, std::size_t b) { return hands[a] > hands[b]; });
    return order;
}

std::vector<std::size_t> find_winners(const std::vector<PokerHand>& hands) {
    std::vector<std::size_t> winners;
    for (std::size_t i = 0; i < hands.size(); ++i) {
        if (winners.empty()) {
            winners.push_back(i);
            continue;
        }
        const int cmp = hands[i].compare(hands[winners.front()]);
        if (cmp > 0) {
            winners.assign(1, i);
        } else if (cmp == 0) {
            winners.push_back(i);
        }
    }
    return winners;
}

} // namespace pokercards
