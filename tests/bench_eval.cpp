#include <catch2/catch_test_macros.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include "core/deck.hpp"
#include <vector>

using namespace pokercards;

namespace {
    // Mains aléatoires de 7 cartes tirées d'un paquet mélangé à chaque main
    std::vector<std::vector<Card>> make_random_hands(int count, uint32_t seed) {
        Deck deck(seed);
        std::vector<std::vector<Card>> hands;
        hands.reserve(count);
        for (int i = 0; i < count; ++i) {
            deck.return_all();
            deck.shuffle();
            std::vector<Card> hand;
            hand.reserve(7);
            for (int j = 0; j < 7; ++j) {
                hand.push_back(deck.deal());
            }
            hands.push_back(std::move(hand));
        }
        return hands;
    }
} // namespace anonyme

TEST_CASE("Evaluate Performance", "[evaluator][!benchmark]") {
    const int num_hands_to_eval = 10000;
    const std::vector<std::vector<Card>> random_hands = make_random_hands(num_hands_to_eval, 2024);
    REQUIRE(random_hands.size() == static_cast<std::size_t>(num_hands_to_eval));

    BENCHMARK("Evaluate 10k Hands (7 Cards)") {
        int rank_sum = 0;
        for (const auto& cards : random_hands) {
            PokerHand hand(cards);
            rank_sum += hand.hand_rank();
        }
        return rank_sum;
    };

    BENCHMARK("Compare 5k Hand Pairs") {
        int wins = 0;
        for (std::size_t i = 0; i + 1 < random_hands.size(); i += 2) {
            PokerHand a(random_hands[i]);
            PokerHand b(random_hands[i + 1]);
            wins += a.compare(b);
        }
        return wins;
    };
}
