#include "core/deck.hpp"
#include "deck/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::find, std::min
#include <iterator>  // Pour std::next
#include <stdexcept> // Pour std::out_of_range
#include <utility>

namespace deck_sim {

Deck::Deck(CardTypeTable table, DeckOptions options)
    : table_(std::move(table)),
      options_(options)
{
    remaining_.reserve(table_.size());
    for (const auto& entry : table_.entries()) {
        remaining_.push_back(entry.original_count);
    }
    total_remaining_ = table_.total_count();
}

std::string Deck::draw(RandomSource& rng) {
    const bool needs_reshuffle = (total_remaining_ == 0);
    if (needs_reshuffle && !options_.reshuffle) {
        throw EmptyDeckError("Deck is empty, cannot draw card.");
    }

    // Pour un deck à reshuffle, l'indice est tiré sur le deck complet AVANT le reset:
    // si la source échoue, rien n'a encore bougé.
    const std::size_t range = needs_reshuffle ? table_.total_count() : total_remaining_;
    const std::size_t k = rng.next_index(range);
    if (k >= range) {
        throw std::out_of_range("Random source returned index " + std::to_string(k)
                                + " outside [0, " + std::to_string(range) + ")");
    }

    if (needs_reshuffle) {
        reset();
        ++reshuffle_count_;
        spdlog::debug("Deck vide remélangé ({} cartes).", total_remaining_);
    }

    const std::size_t selected = select_entry(k);
    const std::string& name = table_[selected].name;

    drawn_.push_back(name); // Avant les décréments: seul point qui peut lever (bad_alloc)
    --remaining_[selected];
    --total_remaining_;

    spdlog::trace("Tirage k={} -> '{}' ({} restantes)", k, name, total_remaining_);
    return name;
}

std::vector<std::string> Deck::draw_many(std::size_t count, RandomSource& rng) {
    std::vector<std::string> result;
    result.reserve(std::min(count, total_remaining_));
    for (std::size_t i = 0; i < count; ++i) {
        // Un deck à reshuffle ne s'arrête jamais, les autres s'arrêtent à vide
        if (is_empty() && !options_.reshuffle) {
            break;
        }
        result.push_back(draw(rng));
    }
    return result;
}

void Deck::reset() {
    for (std::size_t i = 0; i < table_.size(); ++i) {
        remaining_[i] = table_[i].original_count;
    }
    total_remaining_ = table_.total_count();
    drawn_.clear();
    spdlog::trace("Deck remis à zéro: {} cartes.", total_remaining_);
}

bool Deck::return_card(const std::string& name) {
    auto index = table_.index_of(name);
    if (!index || remaining_[*index] >= table_[*index].original_count) {
        return false;
    }

    // Retirer l'occurrence la plus récente de l'historique
    auto it = std::find(drawn_.rbegin(), drawn_.rend(), name);
    if (it == drawn_.rend()) {
        return false; // Ne peut pas arriver si les invariants tiennent
    }
    drawn_.erase(std::next(it).base());
    ++remaining_[*index];
    ++total_remaining_;

    spdlog::trace("Carte '{}' remise dans le deck ({} restantes)", name, total_remaining_);
    return true;
}

int Deck::remaining_count(const std::string& name) const {
    return remaining_[lookup(name)];
}

int Deck::original_count(const std::string& name) const {
    return table_[lookup(name)].original_count;
}

std::size_t Deck::lookup(const std::string& name) const {
    auto index = table_.index_of(name);
    if (!index) {
        throw std::out_of_range("Unknown card '" + name + "'");
    }
    return *index;
}

std::size_t Deck::select_entry(std::size_t k) const {
    std::size_t cumulative = 0;
    for (std::size_t i = 0; i < remaining_.size(); ++i) {
        cumulative += static_cast<std::size_t>(remaining_[i]);
        if (k < cumulative) {
            return i; // Les entrées à 0 ont un intervalle vide, jamais choisies
        }
    }
    // k < total_remaining_ == somme des remaining_: inatteignable
    throw std::logic_error("Deck counts out of sync with total_remaining");
}

} // namespace deck_sim
