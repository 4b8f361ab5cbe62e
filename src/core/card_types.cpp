#include "core/card_types.hpp"
#include "deck/errors.h"
#include <cstdint>
#include <limits>
#include <utility>
#include <nlohmann/json.hpp>

namespace deck_sim {

CardTypeTable CardTypeTable::parse(const std::vector<CardTypeEntry>& definition) {
    if (definition.empty()) {
        throw ValidationError("Deck definition must contain at least one card");
    }

    CardTypeTable table;
    table.entries_.reserve(definition.size());

    for (std::size_t i = 0; i < definition.size(); ++i) {
        const CardTypeEntry& entry = definition[i];
        if (entry.name.empty()) {
            throw ValidationError("Card #" + std::to_string(i) + " has an empty name");
        }
        if (entry.original_count <= 0) {
            throw ValidationError("Card '" + entry.name + "': count must be a positive integer (got "
                                  + std::to_string(entry.original_count) + ")");
        }
        // emplace échoue si le nom existe déjà -> doublon
        if (!table.index_.emplace(entry.name, i).second) {
            throw ValidationError("Duplicate card name '" + entry.name + "'");
        }
        table.entries_.push_back(entry);
        table.total_count_ += static_cast<std::size_t>(entry.original_count);
    }
    return table;
}

CardTypeTable CardTypeTable::parse(const nlohmann::json& definition) {
    if (!definition.is_array()) {
        throw ValidationError("Deck definition must be a list of cards");
    }

    std::vector<CardTypeEntry> entries;
    entries.reserve(definition.size());

    std::size_t position = 0;
    for (const auto& card_json : definition) {
        const std::string where = "Card #" + std::to_string(position);
        if (!card_json.is_object()) {
            throw ValidationError(where + " must be an object with 'name' and 'count' keys");
        }
        if (!card_json.contains("name") || !card_json.contains("count")) {
            throw ValidationError(where + ": each card must have 'name' and 'count' keys");
        }

        const auto& name_json  = card_json["name"];
        const auto& count_json = card_json["count"];
        if (!name_json.is_string()) {
            throw ValidationError(where + ": 'name' must be a string");
        }
        // is_number_integer() est faux pour les booléens et les flottants (2.0 refusé)
        if (!count_json.is_number_integer()) {
            throw ValidationError(where + " ('" + name_json.get<std::string>()
                                  + "'): count must be a positive integer");
        }

        CardTypeEntry entry;
        entry.name = name_json.get<std::string>();
        if (count_json.is_number_unsigned()) {
            const auto count = count_json.get<std::uint64_t>();
            if (count > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw ValidationError("Card '" + entry.name + "': count is too large");
            }
            entry.original_count = static_cast<int>(count);
        } else {
            const auto count = count_json.get<std::int64_t>();
            // Négatif ici (sinon nlohmann l'aurait classé unsigned): rejeté par parse() plus bas
            entry.original_count = count < std::numeric_limits<int>::min()
                                       ? std::numeric_limits<int>::min()
                                       : static_cast<int>(count);
        }
        entries.push_back(std::move(entry));
        ++position;
    }

    return parse(entries);
}

std::optional<std::size_t> CardTypeTable::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace deck_sim
