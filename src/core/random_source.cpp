#include "core/random_source.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace deck_sim {

MersenneTwisterSource::MersenneTwisterSource() {
    std::random_device rd;
    // random_device ne fournit que 32 bits par appel
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    rng_.seed(seq);
}

MersenneTwisterSource::MersenneTwisterSource(std::uint64_t seed)
    : rng_(seed) {}

std::size_t MersenneTwisterSource::next_index(std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("next_index: range must not be empty");
    }
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng_);
}

ScriptedRandomSource::ScriptedRandomSource(std::vector<std::size_t> indices)
    : indices_(std::move(indices)) {}

std::size_t ScriptedRandomSource::next_index(std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("next_index: range must not be empty");
    }
    if (next_ >= indices_.size()) {
        throw std::logic_error("Scripted random source exhausted after "
                               + std::to_string(indices_.size()) + " values");
    }
    // La validation de l'intervalle est faite par l'appelant (Deck::draw)
    return indices_[next_++];
}

} // namespace deck_sim
