#include "deck/console.h"
#include "deck/deck_utils.hpp"
#include "deck/errors.h"
#include "spdlog/spdlog.h"
#include <istream>
#include <ostream>
#include <stdexcept>

namespace deck_sim {

ConsoleSession::ConsoleSession(DeckManager& manager, RandomSource& rng, std::istream& in, std::ostream& out)
    : manager_(manager), rng_(rng), in_(in), out_(out)
{
    if (manager_.empty()) {
        throw std::invalid_argument("ConsoleSession needs at least one loaded deck");
    }
    active_ = manager_.list_deck_ids().front();
}

void ConsoleSession::run() {
    out_ << "Random Card Deck - Interactive Mode\n";
    out_ << "Type 'h' or '?' for help\n";

    std::string line;
    while (true) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line)) {
            // Fin d'entrée (Ctrl-D ou pipe fermé)
            out_ << "\nGoodbye!\n";
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
}

bool ConsoleSession::execute(const std::string& line) {
    const std::string input = trim(line);
    if (input.empty()) {
        return true;
    }

    // Seule "u" prend un argument; les autres commandes doivent correspondre à la ligne entière
    const std::string lowered = to_lower(input);
    const auto space = input.find_first_of(" \t");
    const bool use_command = to_lower(input.substr(0, space)) == "u";
    const std::string command  = use_command ? "u" : lowered;
    const std::string argument = use_command && space != std::string::npos ? trim(input.substr(space)) : "";

    try {
        if (command == "d") {
            draw_card();
        } else if (command == "r") {
            reset_deck();
        } else if (command == "s") {
            show_all_status();
        } else if (command == "l") {
            list_decks();
        } else if (command == "u") {
            use_deck(argument);
        } else if (command == "h" || command == "?" || command == "help") {
            print_help();
        } else if (command == "q" || command == "quit" || command == "exit") {
            out_ << "Goodbye!\n";
            return false;
        } else {
            out_ << "Unknown command: " << lowered << "\n";
            out_ << "Type 'h' or '?' for help\n";
        }
    } catch (const EmptyDeckError& e) {
        out_ << "The deck is empty! (" << e.what() << ")\n";
    } catch (const UnknownDeckError& e) {
        out_ << "Error: " << e.what() << "\n";
    }
    return true;
}

void ConsoleSession::print_help() {
    out_ << "\nAvailable commands:\n";
    out_ << "  d - Draw a random card\n";
    out_ << "  r - Reset the deck to its original state\n";
    out_ << "  s - Show the state of all loaded decks\n";
    out_ << "  l - List loaded decks\n";
    out_ << "  u <deck> - Use another deck\n";
    out_ << "  q - Quit the application\n";
    out_ << "  h, ? - Show this help message\n";
    out_ << "\n";
}

void ConsoleSession::print_deck_status() {
    const Deck& deck = manager_.get_deck(active_);
    out_ << "\n" << deck_summary(active_, deck) << "\n";
    if (!deck.drawn().empty()) {
        out_ << "Drawn cards: " << join_names(deck.drawn()) << "\n";
    }
    out_ << "\n";
}

void ConsoleSession::draw_card() {
    Deck& deck = manager_.get_deck(active_);
    if (deck.is_empty() && !deck.reshuffles_when_empty()) {
        out_ << "The deck is empty!\n";
    } else {
        const bool reshuffling = deck.is_empty();
        const std::string card = deck.draw(rng_);
        if (reshuffling) {
            out_ << "Deck '" << active_ << "' was empty and has been reshuffled.\n";
        }
        out_ << "Drew: " << card << "\n";
    }
    print_deck_status();
}

void ConsoleSession::reset_deck() {
    manager_.get_deck(active_).reset();
    out_ << "Deck reset to original state\n";
    print_deck_status();
}

void ConsoleSession::show_all_status() {
    out_ << "\nStatus of all loaded decks:\n";
    for (const auto& status : manager_.status()) {
        out_ << (status.id == active_ ? "* " : "  ") << status_to_string(status) << "\n";
    }
    out_ << "\n";
}

void ConsoleSession::list_decks() {
    out_ << "Loaded decks: " << join_names(manager_.list_deck_ids()) << "\n";
}

void ConsoleSession::use_deck(const std::string& id) {
    if (id.empty()) {
        out_ << "Usage: u <deck>\n";
        return;
    }
    manager_.get_deck(id); // UnknownDeckError si absent, active_ inchangé
    active_ = id;
    spdlog::debug("Deck actif: {}", active_);
    out_ << "Using deck '" << active_ << "'\n";
    print_deck_status();
}

} // namespace deck_sim
