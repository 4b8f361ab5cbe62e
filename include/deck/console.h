#ifndef DECK_CONSOLE_H
#define DECK_CONSOLE_H

#include "core/random_source.hpp"
#include "deck/deck_manager.h"
#include <iosfwd>
#include <string>

namespace deck_sim {

// Boucle interactive: une commande par ligne, chaque commande appelle une opération
// du moteur et affiche son résultat. Les erreurs du moteur (deck vide, id inconnu)
// sont affichées sans interrompre la boucle.
class ConsoleSession {
public:
    // Le manager doit contenir au moins un deck (std::invalid_argument sinon);
    // le premier deck enregistré est actif au départ.
    ConsoleSession(DeckManager& manager, RandomSource& rng, std::istream& in, std::ostream& out);

    // Jusqu'à q/quit/exit ou fin d'entrée
    void run();

    // Exécute une ligne. Retourne false si la session doit s'arrêter.
    bool execute(const std::string& line);

    const std::string& active_deck() const { return active_; }

    void print_help();
    void print_deck_status();

private:
    void draw_card();
    void reset_deck();
    void show_all_status();
    void list_decks();
    void use_deck(const std::string& id);

    DeckManager&  manager_;
    RandomSource& rng_;
    std::istream& in_;
    std::ostream& out_;
    std::string   active_;
};

} // namespace deck_sim

#endif // DECK_CONSOLE_H
