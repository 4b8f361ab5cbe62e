#ifndef DECK_DECK_MANAGER_H
#define DECK_DECK_MANAGER_H

#include "core/card_types.hpp"
#include "core/deck.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace deck_sim {

// Résumé d'un deck pour la commande de statut
struct DeckStatus {
    std::string id;
    std::size_t remaining = 0;
    std::size_t total = 0;
    bool        reshuffle = false;
};

// Registre id -> Deck, ordonné par création. Le manager possède ses decks;
// les références rendues restent valides jusqu'à remove_deck(id) ou la destruction du manager.
// Pas thread-safe: l'appelant sérialise les accès.
class DeckManager {
public:
    DeckManager() = default;
    DeckManager(const DeckManager&) = delete;
    DeckManager& operator=(const DeckManager&) = delete;

    // DuplicateDeckError si id est déjà enregistré (le registre n'est pas modifié)
    Deck& create_deck(const std::string& id, CardTypeTable table, DeckOptions options = {});

    // UnknownDeckError si id est absent
    Deck&       get_deck(const std::string& id);
    const Deck& get_deck(const std::string& id) const;

    // UnknownDeckError si id est absent
    void remove_deck(const std::string& id);

    const std::vector<std::string>& list_deck_ids() const { return order_; }
    bool        contains(const std::string& id) const;
    std::size_t size() const { return order_.size(); }
    bool        empty() const { return order_.empty(); }

    std::vector<DeckStatus> status() const;

private:
    std::vector<std::string>                               order_;
    std::unordered_map<std::string, std::unique_ptr<Deck>> decks_;
};

} // namespace deck_sim

#endif // DECK_DECK_MANAGER_H
