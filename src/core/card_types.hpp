#ifndef DECK_CORE_CARD_TYPES_HPP
#define DECK_CORE_CARD_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp> // Pour nlohmann::json (déclaration anticipée)

namespace deck_sim {

// Un type de carte: nom unique dans la table + nombre d'exemplaires d'origine (> 0)
struct CardTypeEntry {
    std::string name;
    int original_count = 0;

    bool operator==(const CardTypeEntry& other) const {
        return name == other.name && original_count == other.original_count;
    }
};

// Table immuable des types de cartes d'un deck, dans l'ordre de la définition.
// Ne se construit que via parse(), donc toujours valide (non vide, noms uniques, counts > 0).
class CardTypeTable {
public:
    // Valide une définition déjà typée. Lève ValidationError si la liste est vide,
    // si un nom est vide ou dupliqué, ou si un count est <= 0.
    static CardTypeTable parse(const std::vector<CardTypeEntry>& definition);

    // Même chose depuis un document JSON déjà parsé: un tableau d'objets {"name", "count"}.
    // Lève ValidationError si ce n'est pas un tableau, si un champ manque ou si
    // "count" n'est pas un entier strictement positif.
    static CardTypeTable parse(const nlohmann::json& definition);

    const std::vector<CardTypeEntry>& entries() const { return entries_; }
    const CardTypeEntry& operator[](std::size_t index) const { return entries_[index]; }
    std::size_t size() const { return entries_.size(); }

    // Somme des original_count
    std::size_t total_count() const { return total_count_; }

    // Position du nom dans entries(), std::nullopt si absent. O(1).
    std::optional<std::size_t> index_of(const std::string& name) const;

private:
    CardTypeTable() = default;

    std::vector<CardTypeEntry>                   entries_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t                                  total_count_ = 0;
};

} // namespace deck_sim

#endif // DECK_CORE_CARD_TYPES_HPP
