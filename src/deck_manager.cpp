#include "deck/deck_manager.h"
#include "deck/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::find
#include <utility>

namespace deck_sim {

Deck& DeckManager::create_deck(const std::string& id, CardTypeTable table, DeckOptions options) {
    if (decks_.count(id) != 0) {
        throw DuplicateDeckError(id);
    }

    auto deck = std::make_unique<Deck>(std::move(table), options);
    Deck& ref = *deck;

    order_.push_back(id);
    try {
        decks_.emplace(id, std::move(deck));
    } catch (...) {
        order_.pop_back(); // Garder order_ et decks_ cohérents
        throw;
    }

    spdlog::debug("Deck '{}' créé: {} types, {} cartes{}", id, ref.table().size(), ref.total(),
                  options.reshuffle ? " (reshuffle)" : "");
    return ref;
}

Deck& DeckManager::get_deck(const std::string& id) {
    auto it = decks_.find(id);
    if (it == decks_.end()) {
        throw UnknownDeckError(id);
    }
    return *it->second;
}

const Deck& DeckManager::get_deck(const std::string& id) const {
    auto it = decks_.find(id);
    if (it == decks_.end()) {
        throw UnknownDeckError(id);
    }
    return *it->second;
}

void DeckManager::remove_deck(const std::string& id) {
    auto it = decks_.find(id);
    if (it == decks_.end()) {
        throw UnknownDeckError(id);
    }
    order_.erase(std::find(order_.begin(), order_.end(), id));
    decks_.erase(it);
    spdlog::debug("Deck '{}' supprimé ({} restants)", id, order_.size());
}

bool DeckManager::contains(const std::string& id) const {
    return decks_.count(id) != 0;
}

std::vector<DeckStatus> DeckManager::status() const {
    std::vector<DeckStatus> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        const Deck& deck = *decks_.at(id);
        result.push_back({id, deck.remaining(), deck.total(), deck.reshuffles_when_empty()});
    }
    return result;
}

} // namespace deck_sim
