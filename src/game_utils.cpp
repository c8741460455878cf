#include "pokercards/game_utils.hpp"
#include "core/cards.hpp"
#include <sstream>

namespace pokercards {

std::string cards_to_string(const std::vector<Card>& cards, const std::string& sep) {
    std::stringstream ss;
    for (std::size_t i = 0; i < cards.size(); ++i) {
        ss << to_string(cards[i]);
        if (i + 1 < cards.size()) {
            ss << sep;
        }
    }
    return ss.str();
}

std::string card_groups_to_string(const std::vector<std::vector<Card>>& groups, const std::string& sep) {
    std::stringstream ss;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        ss << cards_to_string(groups[i]);
        if (i + 1 < groups.size()) {
            ss << sep;
        }
    }
    return ss.str();
}

std::string vec_to_string(const std::vector<Card>& cards) {
    return "[" + cards_to_string(cards, " ") + "]";
}

std::string hand_rank_to_string(int hand_rank) {
    if (hand_rank < 0 || hand_rank > static_cast<int>(HandCategory::STRAIGHT_FLUSH)) {
        return "Unknown";
    }
    return hand_category_to_string(static_cast<HandCategory>(hand_rank));
}

} // namespace pokercards
