#include <catch2/catch_test_macros.hpp>
#include "core/deck.hpp"
#include "core/cards.hpp"
#include "pokercards/errors.h"
#include <random>
#include <vector>

using namespace pokercards;

namespace {

// Vrai si initialize() est accessible depuis l'extérieur
template <typename T>
concept PublicInitialize = requires(T& t) { t.initialize(); };

DeckStats make_stats(std::size_t active, std::size_t popped, std::size_t discarded) {
    DeckStats s;
    s.active = active;
    s.popped = popped;
    s.discarded = discarded;
    return s;
}

} // namespace

TEST_CASE("New deck", "[deck]") {
    Deck deck(1);

    REQUIRE(deck.stats() == make_stats(52, 0, 0));
    REQUIRE(deck.is_consistent());

    SECTION("Standard order: suits S, H, D, C and ranks A down to 2") {
        const auto& active = deck.active();
        REQUIRE(active.front() == Card("AS"));
        REQUIRE(active[1] == Card("KS"));
        REQUIRE(active[12] == Card("2S"));
        REQUIRE(active[13] == Card("AH"));
        REQUIRE(active.back() == Card("2C"));
    }

    SECTION("Top card is the last active card") {
        REQUIRE(deck.deal() == Card("2C"));
        REQUIRE(deck.deal() == Card("3C"));
    }

    SECTION("to_string lists active cards bottom to top") {
        const std::string s = deck.to_string();
        REQUIRE(s.substr(0, 7) == "[AS KS ");
        REQUIRE(s.substr(s.size() - 4) == " 2C]");
    }
}

TEST_CASE("Shuffle only touches active cards", "[deck]") {
    Deck deck(7);
    deck.shuffle();
    deck.deal();
    deck.burn();
    const std::vector<Card> popped = deck.popped();
    const std::vector<Card> discarded = deck.discarded();

    deck.shuffle();
    REQUIRE(deck.popped() == popped);
    REQUIRE(deck.discarded() == discarded);
    REQUIRE(deck.stats() == make_stats(50, 1, 1));
    REQUIRE(deck.is_consistent());
}

TEST_CASE("Popping and returning cards", "[deck]") {
    Deck deck(2024);
    deck.shuffle();

    std::vector<Card> stack;
    stack.push_back(deck.deal());
    stack.push_back(deck.deal());
    stack.push_back(deck.deal());

    REQUIRE(deck.popped().size() == 3);
    REQUIRE(deck.active().size() == 52 - 3);
    REQUIRE(deck.popped() == stack);

    SECTION("Return to top keeps the dealt order on top") {
        deck.return_popped(Position::TOP);
        REQUIRE(deck.popped().empty());
        REQUIRE(deck.active().size() == 52);
        const std::vector<Card> top(deck.active().end() - 3, deck.active().end());
        REQUIRE(top == stack);
    }

    SECTION("Return to bottom inserts each card at index 0") {
        deck.return_popped(Position::BOTTOM);
        REQUIRE(deck.popped().empty());
        const auto& active = deck.active();
        REQUIRE(active[0] == stack[2]);
        REQUIRE(active[1] == stack[1]);
        REQUIRE(active[2] == stack[0]);
    }

    REQUIRE(deck.is_consistent());
}

TEST_CASE("Discarding and returning cards", "[deck]") {
    Deck deck(99);
    deck.shuffle();

    std::vector<Card> stack;
    for (int i = 0; i < 3; ++i) {
        deck.burn();
        stack.push_back(deck.discarded().back());
    }

    REQUIRE(deck.discarded().size() == 3);
    REQUIRE(deck.active().size() == 52 - 3);
    REQUIRE(deck.discarded() == stack);

    deck.return_discarded(Position::TOP);
    REQUIRE(deck.discarded().empty());
    REQUIRE(deck.active().size() == 52);
    const std::vector<Card> top(deck.active().end() - 3, deck.active().end());
    REQUIRE(top == stack);
}

TEST_CASE("Returning cards that were not removed", "[deck][errors]") {
    Deck deck(3);

    SECTION("Card still active") {
        REQUIRE_THROWS_AS(deck.return_cards({Card("AS")}), CardNotRemoved);
        REQUIRE(deck.stats() == make_stats(52, 0, 0));
    }

    SECTION("Partial batch stays moved") {
        const Card top = deck.deal(); // 2C
        REQUIRE_THROWS_AS(deck.return_cards({top, Card("AS")}, Position::TOP), CardNotRemoved);
        // La première carte a déjà été remise
        REQUIRE(deck.stats() == make_stats(52, 0, 0));
        REQUIRE(deck.active().back() == top);
        REQUIRE(deck.is_consistent());
    }

    SECTION("Returning twice") {
        const Card c = deck.deal();
        deck.return_cards({c});
        REQUIRE_THROWS_AS(deck.return_cards({c}), CardNotRemoved);
    }
}

TEST_CASE("Empty deck", "[deck][errors]") {
    Deck deck(5);
    for (int i = 0; i < 26; ++i) {
        deck.deal();
        deck.burn();
    }
    REQUIRE(deck.empty());
    REQUIRE(deck.stats() == make_stats(0, 26, 26));
    REQUIRE_THROWS_AS(deck.deal(), EmptyDeck);
    REQUIRE_THROWS_AS(deck.burn(), EmptyDeck);
    REQUIRE(deck.is_consistent());
}

TEST_CASE("return_all ignores the requested position", "[deck]") {
    Deck deck(11);
    const Card dealt = deck.deal();   // 2C
    deck.burn();                      // 3C
    const Card burned = deck.discarded().back();

    deck.return_all(Position::TOP);
    REQUIRE(deck.stats() == make_stats(52, 0, 0));
    // popped puis discarded, chacun inséré en dessous
    REQUIRE(deck.active()[0] == burned);
    REQUIRE(deck.active()[1] == dealt);
    REQUIRE(deck.active().back() == Card("4C"));
}

TEST_CASE("Stats always sum to 52", "[deck][invariant]") {
    Deck deck(123);
    std::mt19937 rng(456);
    std::uniform_int_distribution<int> op(0, 5);

    for (int step = 0; step < 500; ++step) {
        switch (op(rng)) {
            case 0: deck.shuffle(); break;
            case 1: if (!deck.empty()) deck.deal(); break;
            case 2: if (!deck.empty()) deck.burn(); break;
            case 3: deck.return_popped(Position::TOP); break;
            case 4: deck.return_discarded(Position::BOTTOM); break;
            case 5: deck.return_all(); break;
        }
        REQUIRE(deck.stats().total() == 52);
        REQUIRE(deck.is_consistent());
    }
}

TEST_CASE("Reset restores the standard deck", "[deck]") {
    Deck deck(8);
    deck.shuffle();
    deck.deal();
    deck.burn();
    deck.reset();
    REQUIRE(deck.stats() == make_stats(52, 0, 0));
    REQUIRE(deck.active() == Deck(9).active());
    REQUIRE(deck.is_consistent());

    // reset() est le seul point d'entrée public
    STATIC_REQUIRE_FALSE(PublicInitialize<Deck>);
}
