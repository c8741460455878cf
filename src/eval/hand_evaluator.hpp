#ifndef POKERCARDS_HAND_EVALUATOR_HPP
#define POKERCARDS_HAND_EVALUATOR_HPP

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/cards.hpp"
#include "pokercards/common_types.h"

namespace pokercards {

/**
 * @brief Meilleure main "high" de 5 cartes parmi un nombre quelconque (>= 5)
 * de cartes, par exemple 2 cartes privées + 5 cartes communes.
 *
 * Les cartes sont triées par rang décroissant à la construction (tri stable).
 * Après évaluation : hand_rank() (0 = carte haute ... 8 = quinte flush),
 * hand_cards() (cartes qui forment la combinaison) et kickers() (cartes
 * complétant la comparaison à 5 cartes).
 *
 * Les mains évaluées se comparent par hand_rank, puis hand_cards deux à deux
 * (par rang), puis kickers deux à deux. Aucune décision = égalité.
 */
class PokerHand {
public:
    /**
     * @param cards Au moins 5 cartes, sinon NotEnoughCards.
     * @param evaluate Évaluer immédiatement.
     * @param logger Reçoit les traces de l'évaluation (niveau debug). nullptr = aucune sortie.
     */
    explicit PokerHand(std::vector<Card> cards, bool evaluate = true,
                       std::shared_ptr<spdlog::logger> logger = nullptr);

    // Calcule hand_rank / hand_cards / kickers. Idempotent.
    void evaluate();

    // Remplace les cartes (re-triées) ; la main doit être ré-évaluée
    void set_cards(std::vector<Card> cards);

    const std::vector<Card>& cards() const { return cards_; }
    bool is_evaluated() const { return evaluated_; }

    // Les accesseurs suivants lancent std::logic_error si la main n'est pas évaluée
    int hand_rank() const;
    HandCategory category() const;
    const std::vector<Card>& hand_cards() const;
    const std::vector<Card>& kickers() const;

    // -1 / 0 / 1
    int compare(const PokerHand& other) const;
    bool ties_with(const PokerHand& other) const { return compare(other) == 0; }

    // "[KC,QH,JH,TH,9H,8H,7H]"
    std::string to_string() const;
    // "Four of a Kind: JS,JD,JC,JH / kickers: AH"
    std::string describe() const;

    friend bool operator<(const PokerHand& a, const PokerHand& b) { return a.compare(b) < 0; }
    friend bool operator>(const PokerHand& a, const PokerHand& b) { return a.compare(b) > 0; }
    friend bool operator<=(const PokerHand& a, const PokerHand& b) { return a.compare(b) <= 0; }
    friend bool operator>=(const PokerHand& a, const PokerHand& b) { return a.compare(b) >= 0; }

private:
    void eval_hand_rank();
    void fill_kickers();
    void require_evaluated(const char* what) const;

    std::vector<Card> cards_;
    std::shared_ptr<spdlog::logger> logger_;

    bool evaluated_ = false;
    int hand_rank_ = 0;
    std::vector<Card> hand_cards_;
    std::vector<Card> kickers_;
};

} // namespace pokercards

#endif // POKERCARDS_HAND_EVALUATOR_HPP
