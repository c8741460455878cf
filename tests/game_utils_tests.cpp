#include <catch2/catch_test_macros.hpp>
#include "pokercards/game_utils.hpp"
#include "pokercards/common_types.h"
#include "core/cards.hpp"
#include <string>
#include <vector>

using namespace pokercards;

TEST_CASE("cards_to_string", "[utils]") {
    const std::vector<Card> cards = card_list({"AS", "KH", "2C"});
    REQUIRE(cards_to_string(cards) == "AS,KH,2C");
    REQUIRE(cards_to_string(cards, " ") == "AS KH 2C");
    REQUIRE(cards_to_string({}).empty());
}

TEST_CASE("card_groups_to_string", "[utils]") {
    const std::vector<std::vector<Card>> groups = {
        card_list({"AS", "AC"}),
        card_list({"5C", "5H"}),
    };
    REQUIRE(card_groups_to_string(groups) == "AS,AC / 5C,5H");
    REQUIRE(card_groups_to_string(groups, "|") == "AS,AC|5C,5H");
    REQUIRE(card_groups_to_string({}).empty());
}

TEST_CASE("vec_to_string", "[utils]") {
    REQUIRE(vec_to_string(card_list({"AS", "KS", "2C"})) == "[AS KS 2C]");
    REQUIRE(vec_to_string({}) == "[]");
}

TEST_CASE("hand_rank_to_string", "[utils]") {
    REQUIRE(hand_rank_to_string(0) == "High Card");
    REQUIRE(hand_rank_to_string(2) == "Two Pair");
    REQUIRE(hand_rank_to_string(6) == "Full House");
    REQUIRE(hand_rank_to_string(8) == "Straight Flush");
    REQUIRE(hand_rank_to_string(-1) == "Unknown");
    REQUIRE(hand_rank_to_string(9) == "Unknown");
    REQUIRE(std::string(hand_category_to_string(HandCategory::THREE_OF_A_KIND)) == "Three of a Kind");
}

TEST_CASE("position_to_string", "[utils]") {
    REQUIRE(std::string(position_to_string(Position::TOP)) == "TOP");
    REQUIRE(std::string(position_to_string(Position::BOTTOM)) == "BOTTOM");
}
