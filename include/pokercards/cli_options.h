#ifndef POKERCARDS_CLI_OPTIONS_H
#define POKERCARDS_CLI_OPTIONS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pokercards {

// Paramètres de la ligne de commande
struct Options {
    std::string command;
    std::vector<std::string> cards;
    int num_players = 2;
    std::optional<uint32_t> seed;
    bool verbose = false;
};

// Lance std::invalid_argument sur commande absente, option inconnue ou valeur invalide
Options parse_options(int argc, const char* const argv[]);

// Entier décimal sans signe dans [0, 2^32 - 1], rien d'autre
uint32_t parse_seed(const std::string& text);

// Entier décimal complet (la plage des joueurs est vérifiée par deal_holdem)
int parse_players(const std::string& text);

} // namespace pokercards

#endif // POKERCARDS_CLI_OPTIONS_H
