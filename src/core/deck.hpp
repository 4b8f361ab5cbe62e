#ifndef DECK_CORE_DECK_HPP
#define DECK_CORE_DECK_HPP

#include "core/card_types.hpp"
#include "core/random_source.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace deck_sim {

struct DeckOptions {
    // Un deck vide se remet automatiquement à son état d'origine au prochain tirage
    bool reshuffle = false;
};

// Multiset des cartes restantes, construit depuis une CardTypeTable qu'il conserve
// (reset n'a besoin d'aucune donnée externe).
//
// Invariants:
//   0 <= remaining_count(i) <= original_count(i)
//   remaining() == somme des remaining_count
//   l'ordre des entrées est celui de la table, jamais modifié
// Toute opération qui échoue laisse le deck inchangé.
class Deck {
public:
    explicit Deck(CardTypeTable table, DeckOptions options = {});
    ~Deck() = default;

    // Tire une unité uniformément parmi les unités restantes (pas parmi les types).
    // Lève EmptyDeckError si le deck est vide (sauf reshuffle), std::out_of_range si
    // la source renvoie un indice hors de [0, remaining()).
    std::string draw(RandomSource& rng);

    // Tire jusqu'à count cartes, s'arrête sans erreur quand le deck est vide.
    std::vector<std::string> draw_many(std::size_t count, RandomSource& rng);

    // Remet toutes les cartes et vide l'historique. Idempotent.
    void reset();

    // Remet dans le deck une carte tirée depuis le dernier reset.
    // false (et aucun changement) si aucune unité de ce nom n'est actuellement tirée.
    bool return_card(const std::string& name);

    std::size_t remaining() const { return total_remaining_; }
    bool        is_empty() const { return total_remaining_ == 0; }
    std::size_t total() const { return table_.total_count(); }

    // std::out_of_range si le nom est inconnu
    int remaining_count(const std::string& name) const;
    int original_count(const std::string& name) const;

    const CardTypeTable&            table() const { return table_; }
    const std::vector<int>&         remaining_counts() const { return remaining_; } // aligné sur table().entries()
    const std::vector<std::string>& drawn() const { return drawn_; }

    bool        reshuffles_when_empty() const { return options_.reshuffle; }
    std::size_t reshuffle_count() const { return reshuffle_count_; }

private:
    std::size_t lookup(const std::string& name) const;
    // Entrée dont l'intervalle cumulé contient k (k < total_remaining_)
    std::size_t select_entry(std::size_t k) const;

    CardTypeTable            table_;
    DeckOptions              options_;
    std::vector<int>         remaining_;
    std::size_t              total_remaining_ = 0;
    std::vector<std::string> drawn_;
    std::size_t              reshuffle_count_ = 0;
};

} // namespace deck_sim

#endif // DECK_CORE_DECK_HPP
