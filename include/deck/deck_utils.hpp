#ifndef DECK_DECK_UTILS_HPP
#define DECK_DECK_UTILS_HPP

#include "core/deck.hpp"
#include "deck/deck_manager.h"
#include <string>
#include <vector>

namespace deck_sim {

// "a, b, c"
std::string join_names(const std::vector<std::string>& names, const std::string& separator = ", ");

// "Deck '<id>' contains <remaining> of <total> cards"
std::string deck_summary(const std::string& id, const Deck& deck);

// "<id>: <remaining>/<total>" (+ " (reshuffles)")
std::string status_to_string(const DeckStatus& status);

// Minuscules + espaces retirés aux extrémités, pour les commandes de la console
std::string trim(const std::string& s);
std::string to_lower(std::string s);

} // namespace deck_sim

#endif // DECK_DECK_UTILS_HPP
