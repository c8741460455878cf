// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluation d'une main "high" par regroupement des cartes :
//  rangs (paires / brelans / carrés), couleurs (fenêtres de flush) et
//  fenêtres glissantes de 5 cartes (quintes).
//
//  NB : l'ordre de parcours fixe le départage "premier trouvé" : rangs de
//  l'As vers le 2, couleurs dans l'ordre de première apparition.
//  L'As ne compte jamais comme carte basse (pas de quinte A-2-3-4-5).
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "pokercards/errors.h"
#include "pokercards/game_utils.hpp"
#include "pokercards/logging.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace pokercards {

namespace {

using CardGroup = std::vector<Card>;

// Tri décroissant par rang, stable pour les rangs égaux
void sort_descending(std::vector<Card>& cards) {
    std::stable_sort(cards.begin(), cards.end(),
                     [](const Card& a, const Card& b) { return a > b; });
}

// Un seau par rang, indexé par Rank
std::array<CardGroup, NUM_RANKS> group_by_rank(const std::vector<Card>& cards) {
    std::array<CardGroup, NUM_RANKS> buckets;
    for (const Card& c : cards) {
        buckets[rank_index(c.rank())].push_back(c);
    }
    return buckets;
}

// Un seau par couleur, dans l'ordre de première apparition
std::vector<CardGroup> group_by_suit(const std::vector<Card>& cards) {
    std::array<CardGroup, NUM_SUITS> buckets;
    std::vector<Suit> order;
    order.reserve(NUM_SUITS);
    for (const Card& c : cards) {
        auto& bucket = buckets[suit_index(c.suit())];
        if (bucket.empty()) {
            order.push_back(c.suit());
        }
        bucket.push_back(c);
    }
    std::vector<CardGroup> suited;
    suited.reserve(order.size());
    for (Suit s : order) {
        suited.push_back(std::move(buckets[suit_index(s)]));
    }
    return suited;
}

// Toutes les fenêtres de 5 cartes d'une même couleur
std::vector<CardGroup> find_flushes(const std::vector<Card>& cards) {
    std::vector<CardGroup> flushes;
    for (const CardGroup& suited : group_by_suit(cards)) {
        if (suited.size() < HAND_SIZE) {
            continue;
        }
        for (std::size_t i = 0; i + HAND_SIZE <= suited.size(); ++i) {
            flushes.emplace_back(suited.begin() + i, suited.begin() + i + HAND_SIZE);
        }
    }
    return flushes;
}

// Fenêtres glissantes dont les rangs se suivent exactement (r, r-1, ..., r-4).
// Deux cartes de même rang dans la fenêtre cassent la suite.
std::vector<CardGroup> find_straights(const std::vector<Card>& cards) {
    std::vector<CardGroup> straights;
    for (std::size_t i = 0; i + HAND_SIZE <= cards.size(); ++i) {
        const int top = rank_index(cards[i].rank());
        if (top - static_cast<int>(HAND_SIZE - 1) < rank_index(Rank::TWO)) {
            continue;
        }
        bool consecutive = true;
        for (std::size_t k = 1; k < HAND_SIZE; ++k) {
            if (rank_index(cards[i + k].rank()) != top - static_cast<int>(k)) {
                consecutive = false;
                break;
            }
        }
        if (consecutive) {
            straights.emplace_back(cards.begin() + i, cards.begin() + i + HAND_SIZE);
        }
    }
    return straights;
}

CardGroup concat(const CardGroup& a, const CardGroup& b, std::size_t take_from_b) {
    CardGroup out = a;
    out.insert(out.end(), b.begin(), b.begin() + std::min(take_from_b, b.size()));
    return out;
}

int compare_cards(const std::vector<Card>& a, const std::vector<Card>& b) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int cmp = compare_rank(a[i], b[i]);
        if (cmp != 0) {
            return cmp;
        }
    }
    return 0;
}

} // namespace

PokerHand::PokerHand(std::vector<Card> cards, bool evaluate, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : logging::null_logger())
{
    set_cards(std::move(cards));
    if (evaluate) {
        this->evaluate();
    }
}

void PokerHand::set_cards(std::vector<Card> cards) {
    if (cards.size() < HAND_SIZE) {
        throw NotEnoughCards("PokerHand(): at least " + std::to_string(HAND_SIZE) +
                             " cards required, got " + std::to_string(cards.size()));
    }
    sort_descending(cards);
    cards_ = std::move(cards);
    evaluated_ = false;
    hand_rank_ = 0;
    hand_cards_.clear();
    kickers_.clear();
}

void PokerHand::evaluate() {
    eval_hand_rank();
    fill_kickers();
    evaluated_ = true;
}

void PokerHand::eval_hand_rank() {
    logger_->debug("--- Évaluation de {} ---", cards_to_string(cards_));

    const std::vector<CardGroup> straights = find_straights(cards_);
    if (!straights.empty()) logger_->debug("quintes: {}", card_groups_to_string(straights));
    const std::vector<CardGroup> flushes = find_flushes(cards_);
    if (!flushes.empty()) logger_->debug("couleurs: {}", card_groups_to_string(flushes));

    std::vector<CardGroup> pairs;
    std::vector<CardGroup> threes;
    std::vector<CardGroup> fours;
    const auto by_rank = group_by_rank(cards_);
    for (Rank r : RANKS_DESCENDING) {
        const CardGroup& group = by_rank[rank_index(r)];
        if (group.size() >= 4) {
            fours.emplace_back(group.begin(), group.begin() + 4);
        } else if (group.size() == 3) {
            threes.push_back(group);
        } else if (group.size() == 2) {
            pairs.push_back(group);
        }
    }
    if (!pairs.empty()) logger_->debug("paires: {}", card_groups_to_string(pairs));
    if (!threes.empty()) logger_->debug("brelans: {}", card_groups_to_string(threes));
    if (!fours.empty()) logger_->debug("carrés: {}", card_groups_to_string(fours));

    auto pick = [this](HandCategory category, CardGroup cards) {
        hand_rank_ = static_cast<int>(category);
        hand_cards_ = std::move(cards);
        logger_->debug("* {}: {}", hand_category_to_string(category), cards_to_string(hand_cards_));
    };

    for (const CardGroup& straight : straights) {
        if (std::find(flushes.begin(), flushes.end(), straight) != flushes.end()) {
            pick(HandCategory::STRAIGHT_FLUSH, straight);
            return;
        }
    }
    if (!fours.empty()) {
        pick(HandCategory::FOUR_OF_A_KIND, fours[0]);
        return;
    }
    if (threes.size() > 1) {
        pick(HandCategory::FULL_HOUSE, concat(threes[0], threes[1], 2));
        return;
    }
    if (threes.size() == 1 && !pairs.empty()) {
        pick(HandCategory::FULL_HOUSE, concat(threes[0], pairs[0], 2));
        return;
    }
    if (!flushes.empty()) {
        pick(HandCategory::FLUSH, flushes[0]);
        return;
    }
    if (!straights.empty()) {
        pick(HandCategory::STRAIGHT, straights[0]);
        return;
    }
    if (!threes.empty()) {
        pick(HandCategory::THREE_OF_A_KIND, threes[0]);
        return;
    }
    if (pairs.size() > 1) {
        pick(HandCategory::TWO_PAIR, concat(pairs[0], pairs[1], 2));
        return;
    }
    if (pairs.size() == 1) {
        pick(HandCategory::ONE_PAIR, pairs[0]);
        return;
    }
    pick(HandCategory::HIGH_CARD, CardGroup{cards_.front()});
}

void PokerHand::fill_kickers() {
    kickers_.clear();
    if (hand_cards_.size() < HAND_SIZE) {
        const std::size_t kicker_count = HAND_SIZE - hand_cards_.size();
        std::vector<Card> remaining = cards_;
        for (const Card& card : hand_cards_) {
            auto it = std::find(remaining.begin(), remaining.end(), card);
            if (it != remaining.end()) {
                remaining.erase(it);
            }
        }
        const std::size_t n = std::min(kicker_count, remaining.size());
        kickers_.assign(remaining.begin(), remaining.begin() + n);
    }
    logger_->debug("kickers: {}", cards_to_string(kickers_));
}

void PokerHand::require_evaluated(const char* what) const {
    if (!evaluated_) {
        throw std::logic_error(std::string("PokerHand::") + what + ": hand not evaluated");
    }
}

int PokerHand::hand_rank() const {
    require_evaluated("hand_rank");
    return hand_rank_;
}

HandCategory PokerHand::category() const {
    require_evaluated("category");
    return static_cast<HandCategory>(hand_rank_);
}

const std::vector<Card>& PokerHand::hand_cards() const {
    require_evaluated("hand_cards");
    return hand_cards_;
}

const std::vector<Card>& PokerHand::kickers() const {
    require_evaluated("kickers");
    return kickers_;
}

int PokerHand::compare(const PokerHand& other) const {
    require_evaluated("compare");
    other.require_evaluated("compare");
    if (hand_rank_ != other.hand_rank_) {
        return hand_rank_ > other.hand_rank_ ? 1 : -1;
    }
    const int by_cards = compare_cards(hand_cards_, other.hand_cards_);
    if (by_cards != 0) {
        return by_cards;
    }
    return compare_cards(kickers_, other.kickers_);
}

std::string PokerHand::to_string() const {
    return "[" + cards_to_string(cards_) + "]";
}

std::string PokerHand::describe() const {
    require_evaluated("describe");
    std::string out = hand_rank_to_string(hand_rank_) + ": " + cards_to_string(hand_cards_);
    if (!kickers_.empty()) {
        out += " / kickers: " + cards_to_string(kickers_);
    }
    return out;
}

} // namespace pokercards
