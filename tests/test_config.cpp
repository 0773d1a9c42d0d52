// test_config.cpp
// Parameter validation and the deposit strength laws.

#include <doctest/doctest.h>

#include <limits>

#include "config.hpp"
#include "simulation.hpp"

using namespace colony;

TEST_CASE("default configuration is valid") {
    SimConfig config;
    CHECK_NOTHROW(config.validate());
    CHECK(config.morsel_count() == COLONY_NUM_MORSELS);
}

TEST_CASE("invalid parameters are rejected at construction") {
    SimConfig config;

    SUBCASE("zero-size grid") {
        config.width = 0;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("zero agents") {
        config.num_ants = 0;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("negative evaporation") {
        config.evaporation_rate = -0.1;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("evaporation above one") {
        config.evaporation_rate = 1.5;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("nest outside the grid") {
        config.nest = Position(config.width, 0);
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("morsel outside the grid") {
        config.morsel_positions = {Position(-1, 3)};
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("morsel on the nest") {
        config.morsel_positions = {config.nest};
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("non-positive maximum concentration") {
        config.max_concentration = 0.0;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("sensing radius below one") {
        config.sensing_radius = 0;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("more morsels than free cells") {
        config.width = 2;
        config.height = 2;
        config.nest = Position(0, 0);
        config.num_morsels = 4;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("cell count beyond int range") {
        config.width = 50000;
        config.height = 50000;
        CHECK_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("non-finite trace parameters are rejected") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    SimConfig config;

    SUBCASE("evaporation rate") {
        config.evaporation_rate = nan;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("maximum concentration") {
        config.max_concentration = nan;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
        config.max_concentration = inf;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("deposit amount") {
        config.deposit_amount = inf;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("deposit decrease") {
        config.deposit_decrease = nan;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("reinforce ratio") {
        config.reinforce_ratio = inf;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
    SUBCASE("negligible concentration") {
        config.negligible_concentration = nan;
        CHECK_THROWS_AS(Simulation{config}, ConfigurationError);
    }
}

TEST_CASE("configuration errors are invalid_argument") {
    SimConfig config;
    config.num_ants = -3;
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);
}

TEST_CASE("deposit strength follows the configured law") {
    SimConfig config;
    config.deposit_amount = 100.0;
    config.deposit_decrease = 10.0;

    SUBCASE("linear falls off and floors at zero") {
        config.deposit_law = DepositLaw::LINEAR;
        CHECK(deposit_strength(config, 0) == doctest::Approx(100.0));
        CHECK(deposit_strength(config, 3) == doctest::Approx(70.0));
        CHECK(deposit_strength(config, 10) == doctest::Approx(0.0));
        CHECK(deposit_strength(config, 50) == doctest::Approx(0.0));
    }
    SUBCASE("inverse never reaches zero") {
        config.deposit_law = DepositLaw::INVERSE;
        CHECK(deposit_strength(config, 0) == doctest::Approx(100.0));
        CHECK(deposit_strength(config, 1) == doctest::Approx(100.0 / 11.0));
        CHECK(deposit_strength(config, 1000) > 0.0);
    }
    SUBCASE("constant ignores the distance") {
        config.deposit_law = DepositLaw::CONSTANT;
        CHECK(deposit_strength(config, 0) == doctest::Approx(100.0));
        CHECK(deposit_strength(config, 1000) == doctest::Approx(100.0));
    }
    SUBCASE("shorter trips always deposit at least as much") {
        for (DepositLaw law : {DepositLaw::CONSTANT, DepositLaw::LINEAR, DepositLaw::INVERSE}) {
            config.deposit_law = law;
            for (std::uint64_t s = 0; s < 30; s++) {
                CHECK(deposit_strength(config, s) >= deposit_strength(config, s + 1));
            }
        }
    }
}
