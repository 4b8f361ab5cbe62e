#include "deck/app_config.h"
#include <cctype>    // Pour std::isdigit
#include <map>
#include <sstream>
#include <stdexcept>

namespace deck_sim {

namespace {

const std::map<std::string, spdlog::level::level_enum> LOG_LEVELS = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    {"off", spdlog::level::off}
};

std::uint64_t parse_seed(const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("--seed expects a non-negative integer");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("--seed expects a non-negative integer, got '" + value + "'");
        }
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--seed value '" + value + "' is too large");
    }
}

} // namespace

AppConfig parse_command_line(const std::vector<std::string>& args) {
    AppConfig config;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            continue;
        }

        // Toutes les autres options attendent une valeur
        if (arg != "--cards" && arg != "--decks" && arg != "--seed" && arg != "--log-level") {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--cards") {
            config.cards_file = value;
        } else if (arg == "--decks") {
            config.decks_directory = value;
        } else if (arg == "--seed") {
            config.seed = parse_seed(value);
        } else {
            auto it = LOG_LEVELS.find(value);
            if (it == LOG_LEVELS.end()) {
                throw std::invalid_argument("Unknown log level: " + value);
            }
            config.log_level = it->second;
        }
    }
    return config;
}

AppConfig parse_command_line(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    return parse_command_line(args);
}

std::string usage(const std::string& program_name) {
    std::stringstream ss;
    ss << "Usage: " << program_name << " [options]\n"
       << "Draw cards from a deck interactively.\n\n"
       << "Options:\n"
       << "  --cards <file>       JSON file with card definitions (default: data/cards.json)\n"
       << "  --decks <dir>        load every .json deck in <dir> (overrides --cards)\n"
       << "  --seed <n>           seed the random generator for a reproducible session\n"
       << "  --log-level <level>  trace, debug, info, warn, error, critical or off (default: warn)\n"
       << "  -h, --help           show this message and exit\n";
    return ss.str();
}

} // namespace deck_sim
