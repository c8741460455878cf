#ifndef POKERCARDS_CORE_DECK_HPP
#define POKERCARDS_CORE_DECK_HPP

#include "core/cards.hpp"
#include "pokercards/common_types.h"
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace pokercards {

// Nombre de cartes dans chaque partition du paquet
struct DeckStats {
    std::size_t active = 0;
    std::size_t popped = 0;
    std::size_t discarded = 0;

    std::size_t total() const { return active + popped + discarded; }

    bool operator==(const DeckStats& other) const {
        return active == other.active && popped == other.popped && discarded == other.discarded;
    }
};

/**
 * @brief Paquet de 52 cartes, face cachée sur la table.
 *
 * Les cartes sont réparties en trois séquences disjointes : active (non
 * distribuées), popped (distribuées) et discarded (brûlées). Chaque séquence
 * est ordonnée du bas vers le haut : la carte du dessus est le dernier
 * élément de active.
 */
class Deck {
public:
    Deck();
    explicit Deck(uint32_t seed);
    ~Deck() = default;

    // Mélange uniquement les cartes actives
    void shuffle();

    // Distribue la carte du dessus (active -> popped). Lance EmptyDeck.
    Card deal();
    // Brûle la carte du dessus (active -> discarded). Lance EmptyDeck.
    void burn();

    /**
     * @brief Remet des cartes distribuées ou brûlées dans le paquet.
     *
     * Traitement carte par carte : si une carte n'est ni dans discarded ni
     * dans popped, CardNotRemoved est lancée et les cartes déjà traitées
     * restent remises. En BOTTOM chaque carte est insérée à l'index 0.
     */
    void return_cards(const std::vector<Card>& cards, Position pos = Position::BOTTOM);
    void return_discarded(Position pos = Position::BOTTOM);
    void return_popped(Position pos = Position::BOTTOM);
    // Remet popped puis discarded, toujours en dessous (pos ignoré)
    void return_all(Position pos = Position::BOTTOM);

    // Remet toutes les cartes et restaure l'ordre standard non mélangé
    void reset();

    DeckStats stats() const;
    std::size_t size() const { return active_.size(); }
    bool empty() const { return active_.empty(); }

    const std::vector<Card>& active() const { return active_; }
    const std::vector<Card>& popped() const { return popped_; }
    const std::vector<Card>& discarded() const { return discarded_; }

    // Vrai si active + popped + discarded forment exactement les 52 cartes
    bool is_consistent() const;

    // "[AS KS ... 2C]" du bas vers le haut
    std::string to_string() const;

private:
    // Ordre standard : couleurs S, H, D, C puis rangs A..2, rien de distribué
    void initialize() {
        active_.clear();
        popped_.clear();
        discarded_.clear();
        active_.reserve(NUM_CARDS);
        for (Suit s : ALL_SUITS) {
            for (Rank r : RANKS_DESCENDING) {
                active_.emplace_back(r, s);
            }
        }
    }

    std::vector<Card> active_;
    std::vector<Card> popped_;
    std::vector<Card> discarded_;
    std::mt19937      rng_;
};

} // namespace pokercards

#endif // POKERCARDS_CORE_DECK_HPP
