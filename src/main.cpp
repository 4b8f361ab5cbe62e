#include "deck/app_config.h"
#include "deck/console.h"
#include "deck/deck_manager.h"
#include "deck/definition_loader.h"
#include "core/random_source.hpp"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cin, std::cout, std::cerr
#include <memory>     // std::unique_ptr
#include <string>     // std::string
#include <exception>  // std::exception
#include <stdexcept>  // std::invalid_argument

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────
    deck_sim::AppConfig config;
    try
    {
        config = deck_sim::parse_command_line(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n" << deck_sim::usage(argv[0]);
        return 2;
    }
    if (config.show_help)
    {
        std::cout << deck_sim::usage(argv[0]);
        return 0;
    }

    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(config.log_level);
    spdlog::info("Démarrage du simulateur de deck…");

    try
    {
        // 1. Charger les decks
        deck_sim::DeckManager manager;
        std::cout << "Loading decks from: "
                  << (config.decks_directory ? *config.decks_directory : config.cards_file) << "\n";
        deck_sim::load_configured_decks(manager, config);

        for (const auto& id : manager.list_deck_ids())
        {
            const deck_sim::Deck& deck = manager.get_deck(id);
            std::cout << "Loaded " << deck.total() << " cards into deck '" << id << "'\n";
            spdlog::info("Deck '{}' : {} types de cartes, {} cartes.", id, deck.table().size(), deck.total());
        }

        // 2. Source d'aléa (graine fixe si demandée, pour rejouer une session)
        std::unique_ptr<deck_sim::RandomSource> rng;
        if (config.seed)
        {
            spdlog::info("Graine fixe : {}", *config.seed);
            rng = std::make_unique<deck_sim::MersenneTwisterSource>(*config.seed);
        }
        else
        {
            rng = std::make_unique<deck_sim::MersenneTwisterSource>();
        }

        // 3. Boucle interactive
        deck_sim::ConsoleSession session(manager, *rng, std::cin, std::cout);
        session.print_deck_status();
        session.run();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
