#ifndef DECK_ERRORS_H
#define DECK_ERRORS_H

#include <stdexcept> // Pour std::invalid_argument, std::runtime_error, std::out_of_range
#include <string>

namespace deck_sim {

// Définition de deck invalide (nom manquant/dupliqué, count <= 0, liste vide...).
// Levée uniquement au parsing, jamais pendant draw/reset.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Tirage demandé alors que total_remaining == 0. Le deck n'est pas modifié.
class EmptyDeckError : public std::runtime_error {
public:
    explicit EmptyDeckError(const std::string& what) : std::runtime_error(what) {}
};

// Identifiant déjà présent dans le registre du DeckManager.
class DuplicateDeckError : public std::invalid_argument {
public:
    explicit DuplicateDeckError(const std::string& id)
        : std::invalid_argument("Deck '" + id + "' already exists"), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Identifiant absent du registre (get_deck / remove_deck).
class UnknownDeckError : public std::out_of_range {
public:
    explicit UnknownDeckError(const std::string& id)
        : std::out_of_range("Unknown deck '" + id + "'"), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

} // namespace deck_sim

#endif // DECK_ERRORS_H
