#ifndef DECK_APP_CONFIG_H
#define DECK_APP_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h> // Pour spdlog::level::level_enum

namespace deck_sim {

struct AppConfig {
    std::string                  cards_file = "data/cards.json";
    std::optional<std::string>   decks_directory;       // --decks, prioritaire sur --cards
    std::optional<std::uint64_t> seed;                  // absent -> std::random_device
    spdlog::level::level_enum    log_level = spdlog::level::warn;
    bool                         show_help = false;
};

// Parse argv (argv[0] ignoré). Lève std::invalid_argument pour une option inconnue,
// une valeur manquante, une graine non numérique ou un niveau de log inconnu.
AppConfig parse_command_line(const std::vector<std::string>& args);
AppConfig parse_command_line(int argc, char* argv[]);

std::string usage(const std::string& program_name);

} // namespace deck_sim

#endif // DECK_APP_CONFIG_H
