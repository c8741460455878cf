#ifndef POKERCARDS_SHOWDOWN_H
#define POKERCARDS_SHOWDOWN_H

#include <cstddef>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/cards.hpp"
#include "core/deck.hpp"
#include "eval/hand_evaluator.hpp"

namespace pokercards {

// Résultat d'une donne Texas Hold'em : 2 cartes privées par joueur + 5 communes
struct HoldemDeal {
    std::vector<std::vector<Card>> holes;
    std::vector<Card> board;
};

/**
 * @brief Distribue une donne Hold'em depuis le paquet (déjà mélangé ou non).
 *
 * Cartes privées en deux tours de table, puis brûle + flop (3), brûle + turn,
 * brûle + river. Lance std::invalid_argument si num_players est hors de
 * [MIN_PLAYERS, MAX_PLAYERS], EmptyDeck si le paquet s'épuise.
 */
HoldemDeal deal_holdem(Deck& deck, int num_players);

// Main d'un joueur : cartes privées + board
PokerHand make_player_hand(const std::vector<Card>& hole, const std::vector<Card>& board,
                           std::shared_ptr<spdlog::logger> logger = nullptr);

// Indices des mains, de la plus forte à la plus faible (stable en cas d'égalité)
std::vector<std::size_t> order_hands(const std::vector<PokerHand>& hands);

// Indices de toutes les mains à égalité pour la meilleure
std::vector<std::size_t> find_winners(const std::vector<PokerHand>& hands);

} // namespace pokercards

#endif // POKERCARDS_SHOWDOWN_H
