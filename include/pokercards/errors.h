#ifndef POKERCARDS_ERRORS_H
#define POKERCARDS_ERRORS_H

#include <stdexcept>
#include <string>

namespace pokercards {

// Rang inconnu lors de la construction d'une carte
class InvalidRank : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Couleur inconnue lors de la construction d'une carte
class InvalidSuit : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Plus aucune carte active dans le paquet (deal / burn)
class EmptyDeck : public std::runtime_error {
public:
    EmptyDeck() : std::runtime_error("Deck is empty, cannot deal card.") {}
    using std::runtime_error::runtime_error;
};

// Carte rendue au paquet alors qu'elle n'a été ni distribuée ni brûlée
class CardNotRemoved : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Une main doit contenir au moins 5 cartes
class NotEnoughCards : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace pokercards

#endif // POKERCARDS_ERRORS_H
