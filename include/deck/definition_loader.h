#ifndef DECK_DEFINITION_LOADER_H
#define DECK_DEFINITION_LOADER_H

#include "core/card_types.hpp"
#include "core/deck.hpp"
#include "deck/app_config.h"
#include "deck/deck_manager.h"
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace deck_sim {

// Contenu d'un fichier de définition: {"cards": [...], "reshuffle": bool optionnel}
struct DeckDefinition {
    CardTypeTable table;
    DeckOptions   options;
};

// ValidationError si le document n'est pas un objet avec une clé "cards" valide,
// ou si "reshuffle" est présent mais n'est pas un booléen.
DeckDefinition parse_definition_document(const nlohmann::json& document);

// Lit et parse un fichier JSON.
// std::runtime_error si le fichier ne peut pas être ouvert, ValidationError si le JSON
// est invalide (le message contient le chemin).
DeckDefinition load_definition_file(const std::string& path);

// Identifiant de deck dérivé d'un chemin: le nom du fichier sans extension
std::string deck_id_from_path(const std::string& path);

// Enregistre chaque *.json du répertoire sous son nom de fichier (ordre alphabétique).
// Retourne les ids ajoutés. std::runtime_error si le répertoire n'existe pas ou ne contient
// aucun fichier .json. Tous les fichiers sont parsés avant le premier enregistrement: une erreur
// (fichier invalide, DuplicateDeckError) laisse le manager inchangé.
std::vector<std::string> load_decks_from_directory(DeckManager& manager, const std::string& directory);

// Charge les decks demandés par la configuration: --decks prioritaire, sinon le fichier --cards
// enregistré sous son nom de fichier. Retourne les ids ajoutés.
std::vector<std::string> load_configured_decks(DeckManager& manager, const AppConfig& config);

} // namespace deck_sim

#endif // DECK_DEFINITION_LOADER_H
