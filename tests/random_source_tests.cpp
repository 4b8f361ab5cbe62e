#include <catch2/catch_test_macros.hpp>
#include <set>
#include <stdexcept>
#include <vector>
#include "core/random_source.hpp"

using namespace deck_sim;

TEST_CASE("MersenneTwisterSource stays in range", "[random]") {
    MersenneTwisterSource rng;

    for (std::size_t n : {1u, 2u, 3u, 17u, 1000u}) {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(rng.next_index(n) < n);
        }
    }
    REQUIRE(rng.next_index(1) == 0);
    REQUIRE_THROWS_AS(rng.next_index(0), std::invalid_argument);
}

TEST_CASE("MersenneTwisterSource is reproducible with a seed", "[random]") {
    MersenneTwisterSource a(2024);
    MersenneTwisterSource b(2024);

    std::vector<std::size_t> seq_a, seq_b;
    for (int i = 0; i < 50; ++i) {
        seq_a.push_back(a.next_index(52));
        seq_b.push_back(b.next_index(52));
    }
    REQUIRE(seq_a == seq_b);

    // Toutes les valeurs ne doivent pas être identiques
    std::set<std::size_t> distinct(seq_a.begin(), seq_a.end());
    REQUIRE(distinct.size() > 1);
}

TEST_CASE("ScriptedRandomSource replays its sequence", "[random]") {
    ScriptedRandomSource rng({2, 0, 0});

    REQUIRE(rng.pending() == 3);
    REQUIRE(rng.next_index(3) == 2);
    REQUIRE(rng.next_index(2) == 0);
    REQUIRE(rng.consumed() == 2);
    REQUIRE(rng.next_index(1) == 0);
    REQUIRE(rng.pending() == 0);

    SECTION("exhausted source throws") {
        REQUIRE_THROWS_AS(rng.next_index(3), std::logic_error);
    }
    SECTION("empty range is rejected") {
        REQUIRE_THROWS_AS(rng.next_index(0), std::invalid_argument);
    }
}
