#include "deck/definition_loader.h"
#include "deck/errors.h"
#include "spdlog/spdlog.h"
#include <algorithm>  // Pour std::sort
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

namespace deck_sim {

namespace fs = std::filesystem;

DeckDefinition parse_definition_document(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ValidationError("Deck file must contain a JSON object");
    }
    if (!document.contains("cards")) {
        throw ValidationError("JSON file must contain a 'cards' key");
    }

    DeckOptions options;
    if (document.contains("reshuffle")) {
        const auto& reshuffle = document["reshuffle"];
        if (!reshuffle.is_boolean()) {
            throw ValidationError("'reshuffle' must be true or false");
        }
        options.reshuffle = reshuffle.get<bool>();
    }

    return DeckDefinition{CardTypeTable::parse(document["cards"]), options};
}

DeckDefinition load_definition_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Card file '" + path + "' not found or unreadable");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Invalid JSON in card file '" + path + "': " + e.what());
    }

    try {
        DeckDefinition definition = parse_definition_document(document);
        spdlog::debug("Définition chargée depuis {}: {} types, {} cartes",
                      path, definition.table.size(), definition.table.total_count());
        return definition;
    } catch (const ValidationError& e) {
        // Propage l'erreur avec le chemin du fichier
        throw ValidationError("Invalid card file format '" + path + "': " + e.what());
    }
}

std::string deck_id_from_path(const std::string& path) {
    return fs::path(path).stem().string();
}

std::vector<std::string> load_decks_from_directory(DeckManager& manager, const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw std::runtime_error("Deck directory '" + directory + "' does not exist");
    }

    std::vector<fs::path> files;
    for (const auto& item : fs::directory_iterator(directory)) {
        if (item.is_regular_file() && item.path().extension() == ".json") {
            files.push_back(item.path());
        }
    }
    if (files.empty()) {
        throw std::runtime_error("No .json deck files found in '" + directory + "'");
    }
    std::sort(files.begin(), files.end());

    // 1. Tout parser et vérifier les ids avant de toucher au manager
    std::vector<std::pair<std::string, DeckDefinition>> pending;
    pending.reserve(files.size());
    for (const auto& file : files) {
        std::string id = file.stem().string();
        if (manager.contains(id)) {
            throw DuplicateDeckError(id);
        }
        pending.emplace_back(std::move(id), load_definition_file(file.string()));
    }

    // 2. Enregistrer
    std::vector<std::string> ids;
    ids.reserve(pending.size());
    for (auto& [id, definition] : pending) {
        manager.create_deck(id, std::move(definition.table), definition.options);
        ids.push_back(id);
    }
    spdlog::info("{} decks chargés depuis {}", ids.size(), directory);
    return ids;
}

std::vector<std::string> load_configured_decks(DeckManager& manager, const AppConfig& config) {
    if (config.decks_directory) {
        return load_decks_from_directory(manager, *config.decks_directory);
    }

    DeckDefinition definition = load_definition_file(config.cards_file);
    std::string id = deck_id_from_path(config.cards_file);
    manager.create_deck(id, std::move(definition.table), definition.options);
    return {id};
}

} // namespace deck_sim
