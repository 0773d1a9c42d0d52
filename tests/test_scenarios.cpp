// test_scenarios.cpp
// End-to-end runs on fixed environments.

#include <doctest/doctest.h>

#include "simulation.hpp"

using namespace colony;

namespace {
    // 5x5 grid, nest in the middle, one morsel right next to it, one agent.
    SimConfig next_door(std::uint64_t food, std::uint64_t seed) {
        SimConfig config;
        config.width = 5;
        config.height = 5;
        config.nest = Position(2, 2);
        config.morsel_positions = {Position(3, 2)};
        config.morsel_food = static_cast<int>(food);
        config.num_ants = 1;
        config.sensing_radius = 1;
        config.seed = seed;
        return config;
    }

    std::uint64_t run_to_end(Simulation& sim, std::uint64_t ceiling) {
        while (!sim.is_simulation_over() && sim.generation() < ceiling) {
            sim.nextgen();
        }
        return sim.generation();
    }
}

TEST_CASE("a single unit next to the nest is brought home in two generations") {
    for (std::uint64_t seed = 0; seed < 5; seed++) {
        Simulation sim(next_door(1, seed));
        CHECK(sim.nextgen() == 1);
        CHECK(sim.agents()[0].is_carrying());
        CHECK(sim.agents()[0].position() == Position(3, 2));

        CHECK(sim.nextgen() == 2);
        CHECK(sim.is_simulation_over());
        CHECK(sim.nest().accumulated == 1);
        CHECK(sim.agents()[0].position() == Position(2, 2));
    }

    // Same seed, same ending
    Simulation a(next_door(1, 99));
    Simulation b(next_door(1, 99));
    CHECK(run_to_end(a, 10) == run_to_end(b, 10));
}

TEST_CASE("three units mean exactly three pickups") {
    Simulation sim(next_door(3, 42));
    std::uint64_t generations = run_to_end(sim, 100);

    REQUIRE(sim.is_simulation_over());
    CHECK(generations == 6);
    CHECK(sim.stats().pickups == 3);
    CHECK(sim.agents()[0].pickups() == 3);
    CHECK(sim.agents()[0].deliveries() == 3);
    CHECK(sim.nest().accumulated == 3);
    CHECK(sim.morsels()[0].remaining == 0);
}

TEST_CASE("doubling the colony speeds it up less than twofold") {
    const int seeds = 30;
    const std::uint64_t ceiling = 150000;

    // Default environment: many morsels spread around the nest, so the
    // search effort is shared across the colony.
    SimConfig config;

    double total_small = 0.0, total_large = 0.0;
    for (int s = 0; s < seeds; s++) {
        config.seed = 1000 + s;

        config.num_ants = 10;
        Simulation small(config);
        std::uint64_t t_small = run_to_end(small, ceiling);
        REQUIRE(small.is_simulation_over());

        config.num_ants = 20;
        Simulation large(config);
        std::uint64_t t_large = run_to_end(large, ceiling);
        REQUIRE(large.is_simulation_over());

        total_small += static_cast<double>(t_small);
        total_large += static_cast<double>(t_large);
    }

    double mean_small = total_small / seeds;
    double mean_large = total_large / seeds;
    MESSAGE("mean generations with 10 ants: " << mean_small << ", with 20 ants: " << mean_large);
    CHECK(mean_large < mean_small);
    CHECK(mean_large > 0.5 * mean_small);
}
