#ifndef DECK_CORE_RANDOM_SOURCE_HPP
#define DECK_CORE_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>   // Pour std::mt19937_64
#include <vector>

namespace deck_sim {

// Source d'aléa injectée dans chaque tirage: un entier uniforme dans [0, n).
// Aucun générateur global, pour garder les tirages reproductibles en test.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // n > 0. Le résultat doit être dans [0, n).
    virtual std::size_t next_index(std::size_t n) = 0;
};

// Implémentation par défaut: Mersenne Twister 64 bits
class MersenneTwisterSource : public RandomSource {
public:
    MersenneTwisterSource(); // Graine tirée de std::random_device
    explicit MersenneTwisterSource(std::uint64_t seed);

    std::size_t next_index(std::size_t n) override;

private:
    std::mt19937_64 rng_;
};

// Rejoue une séquence fixe d'indices (tests, sessions scriptées).
// Lève std::logic_error une fois la séquence épuisée.
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<std::size_t> indices);
    explicit ScriptedRandomSource(std::initializer_list<std::size_t> indices)
        : indices_(indices) {}

    std::size_t next_index(std::size_t n) override;

    std::size_t consumed() const { return next_; }
    std::size_t pending() const { return indices_.size() - next_; }

private:
    std::vector<std::size_t> indices_;
    std::size_t              next_ = 0;
};

} // namespace deck_sim

#endif // DECK_CORE_RANDOM_SOURCE_HPP
