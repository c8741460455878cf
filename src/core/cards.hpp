#ifndef POKERCARDS_CARDS_HPP
#define POKERCARDS_CARDS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include "pokercards/errors.h"

namespace pokercards {

// Enum pour les couleurs (suits). Pas d'ordre entre couleurs.
enum class Suit : uint8_t { SPADES = 0, HEARTS = 1, DIAMONDS = 2, CLUBS = 3 };
// Enum pour les rangs (ranks). L'index sous-jacent définit l'ordre (A le plus haut).
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr int rank_index(Rank r) { return static_cast<int>(r); }
constexpr int suit_index(Suit s) { return static_cast<int>(s); }

/**
 * @brief Carte immuable (rang + couleur).
 *
 * L'égalité porte sur le rang ET la couleur. Les opérateurs relationnels
 * ne comparent que le rang : deux cartes de même rang et de couleurs
 * différentes sont à la fois <= et >= sans être ==.
 */
class Card {
public:
    constexpr Card(Rank r, Suit s) : rank_(r), suit_(s) {
        if (static_cast<int>(r) > static_cast<int>(Rank::ACE)) {
            throw InvalidRank("Card(): invalid rank value");
        }
        if (static_cast<int>(s) > static_cast<int>(Suit::CLUBS)) {
            throw InvalidSuit("Card(): invalid suit value");
        }
    }
    // Construit depuis un code de 2 caractères ("AS", "th", ...)
    explicit Card(const std::string& code);

    constexpr Rank rank() const { return rank_; }
    constexpr Suit suit() const { return suit_; }

    // Index dense 0-51 : suit * 13 + rank
    constexpr int index() const { return suit_index(suit_) * 13 + rank_index(rank_); }

    friend constexpr bool operator==(const Card& a, const Card& b) {
        return a.rank_ == b.rank_ && a.suit_ == b.suit_;
    }
    friend constexpr bool operator!=(const Card& a, const Card& b) { return !(a == b); }

    friend constexpr bool operator<(const Card& a, const Card& b) { return a.rank_ < b.rank_; }
    friend constexpr bool operator>(const Card& a, const Card& b) { return a.rank_ > b.rank_; }
    friend constexpr bool operator<=(const Card& a, const Card& b) { return a.rank_ <= b.rank_; }
    friend constexpr bool operator>=(const Card& a, const Card& b) { return a.rank_ >= b.rank_; }

private:
    Rank rank_;
    Suit suit_;
};

// Signe de la différence de rang (-1, 0, 1), indépendant de la couleur
constexpr int compare_rank(const Card& a, const Card& b) {
    return (a.rank() > b.rank()) - (a.rank() < b.rank());
}

// Ordre standard d'un paquet neuf : couleurs S, H, D, C puis rangs A..2
constexpr Suit ALL_SUITS[] = { Suit::SPADES, Suit::HEARTS, Suit::DIAMONDS, Suit::CLUBS };
constexpr Rank RANKS_DESCENDING[] = {
    Rank::ACE, Rank::KING, Rank::QUEEN, Rank::JACK, Rank::TEN, Rank::NINE, Rank::EIGHT,
    Rank::SEVEN, Rank::SIX, Rank::FIVE, Rank::FOUR, Rank::THREE, Rank::TWO
};

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(const Card& c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// Crée une liste de cartes, une par code
std::vector<Card> card_list(std::initializer_list<std::string> codes);
std::vector<Card> card_list(const std::vector<std::string>& codes);

std::ostream& operator<<(std::ostream& os, const Card& c);

} // namespace pokercards

namespace std {
template <>
struct hash<pokercards::Card> {
    std::size_t operator()(const pokercards::Card& c) const noexcept {
        return std::hash<int>{}(c.index());
    }
};
} // namespace std

#endif // POKERCARDS_CARDS_HPP
