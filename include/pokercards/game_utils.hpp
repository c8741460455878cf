#ifndef POKERCARDS_GAME_UTILS_HPP
#define POKERCARDS_GAME_UTILS_HPP

#include <string>
#include <vector>
#include "core/cards.hpp" // Pour Card et to_string(Card)
#include "pokercards/common_types.h"

namespace pokercards {

// "AS,KH,2C" (séparateur au choix)
std::string cards_to_string(const std::vector<Card>& cards, const std::string& sep = ",");

// "AS,AC / 5C,5H" : groupes de cartes, utilisé pour les traces de l'évaluateur
std::string card_groups_to_string(const std::vector<std::vector<Card>>& groups,
                                  const std::string& sep = " / ");

// "[AS KS 2C]"
std::string vec_to_string(const std::vector<Card>& cards);

// Nom de la catégorie pour un hand_rank 0-8 ("Unknown" sinon)
std::string hand_rank_to_string(int hand_rank);

} // namespace pokercards

#endif // POKERCARDS_GAME_UTILS_HPP
