#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include "pokercards/errors.h"
#include "pokercards/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <random>

namespace pokercards {

namespace {

// Retire la première occurrence de card ; faux si absente
bool remove_card(std::vector<Card>& cards, const Card& card) {
    auto it = std::find(cards.begin(), cards.end(), card);
    if (it == cards.end()) {
        return false;
    }
    cards.erase(it);
    return true;
}

} // namespace

Deck::Deck() {
    initialize();
    std::random_device rd;
    rng_.seed(rd());
}

Deck::Deck(uint32_t seed) : rng_(seed) {
    initialize();
}

void Deck::shuffle() {
    std::shuffle(active_.begin(), active_.end(), rng_);
    spdlog::trace("Deck::shuffle: {} cartes actives mélangées", active_.size());
}

Card Deck::deal() {
    if (active_.empty()) {
        throw EmptyDeck();
    }
    Card card = active_.back();
    active_.pop_back();
    popped_.push_back(card);
    spdlog::trace("Deck::deal: {} ({} restantes)", pokercards::to_string(card), active_.size());
    return card;
}

void Deck::burn() {
    if (active_.empty()) {
        throw EmptyDeck("Deck is empty, cannot burn card.");
    }
    Card card = active_.back();
    active_.pop_back();
    discarded_.push_back(card);
    spdlog::trace("Deck::burn: {} ({} restantes)", pokercards::to_string(card), active_.size());
}

void Deck::return_cards(const std::vector<Card>& cards, Position pos) {
    // Copie : cards peut référencer popped_ ou discarded_
    const std::vector<Card> batch = cards;
    for (const Card& card : batch) {
        if (!remove_card(discarded_, card) && !remove_card(popped_, card)) {
            throw CardNotRemoved("Deck::return_cards(): card " + pokercards::to_string(card) +
                                 " not among removed cards");
        }
        if (pos == Position::BOTTOM) {
            active_.insert(active_.begin(), card);
        } else {
            active_.push_back(card);
        }
    }
    spdlog::trace("Deck::return_cards: {} cartes remises ({})", batch.size(), position_to_string(pos));
}

void Deck::return_discarded(Position pos) {
    return_cards(discarded_, pos);
}

void Deck::return_popped(Position pos) {
    return_cards(popped_, pos);
}

void Deck::return_all(Position /*pos*/) {
    // pos ignoré : les deux retours se font en dessous
    return_popped();
    return_discarded();
}

void Deck::reset() {
    initialize();
}

DeckStats Deck::stats() const {
    return DeckStats{active_.size(), popped_.size(), discarded_.size()};
}

bool Deck::is_consistent() const {
    const std::size_t total = active_.size() + popped_.size() + discarded_.size();
    if (total != static_cast<std::size_t>(NUM_CARDS)) {
        return false;
    }
    Bitboard seen = EMPTY_BOARD;
    for (const auto* part : { &active_, &popped_, &discarded_ }) {
        for (const Card& c : *part) {
            if (test_card(seen, c)) {
                return false; // doublon
            }
            set_card(seen, c);
        }
    }
    return seen == FULL_DECK;
}

std::string Deck::to_string() const {
    return vec_to_string(active_);
}

} // namespace pokercards
