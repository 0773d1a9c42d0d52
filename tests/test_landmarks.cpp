// test_landmarks.cpp
// Nest and morsel bookkeeping, plus random morsel placement.

#include <doctest/doctest.h>

#include "landmarks.hpp"

using namespace colony;

TEST_CASE("morsels never go below zero") {
    Morsel morsel(Position(1, 1), 2);
    CHECK(morsel.take());
    CHECK(morsel.take());
    CHECK_FALSE(morsel.take());
    CHECK(morsel.remaining == 0);
    CHECK_FALSE(morsel.is_active());
}

TEST_CASE("exhausted morsels drop out of lookups") {
    Landmarks landmarks(Position(0, 0), {Morsel(Position(2, 2), 1), Morsel(Position(3, 3), 4)});
    CHECK(landmarks.initial_food() == 5);
    CHECK(landmarks.active_morsel_at(Position(2, 2)) == 0);

    landmarks.morsel(0).take();
    CHECK(landmarks.active_morsel_at(Position(2, 2)) == -1);
    CHECK_FALSE(landmarks.has_active_morsel_at(Position(2, 2)));
    CHECK(landmarks.active_morsels() == 1);
    CHECK(landmarks.remaining_food() == 4);
    CHECK(landmarks.initial_food() == 5);
}

TEST_CASE("nest storage only grows") {
    Nest nest(Position(4, 4));
    CHECK(nest.accumulated == 0);
    nest.store();
    nest.store();
    CHECK(nest.accumulated == 2);
}

TEST_CASE("explicit morsel positions are used as given") {
    SimConfig config;
    config.morsel_positions = {Position(1, 1), Position(2, 7)};
    config.morsel_food = 6;
    RNG rng(1);

    Landmarks landmarks = Landmarks::create(config, rng);
    REQUIRE(landmarks.morsels().size() == 2);
    CHECK(landmarks.morsels()[1].position == Position(2, 7));
    CHECK(landmarks.initial_food() == 12);
    CHECK(landmarks.nest().position == config.nest);
}

TEST_CASE("random placement stays inside, off the nest and on distinct cells") {
    SimConfig config;
    config.width = 12;
    config.height = 9;
    config.nest = Position(6, 4);
    config.num_morsels = 15;
    RNG rng(7);

    Landmarks landmarks = Landmarks::create(config, rng);
    const std::vector<Morsel>& morsels = landmarks.morsels();
    REQUIRE(morsels.size() == 15);
    for (size_t i = 0; i < morsels.size(); i++) {
        CHECK(morsels[i].position.x >= 0);
        CHECK(morsels[i].position.x < config.width);
        CHECK(morsels[i].position.y >= 0);
        CHECK(morsels[i].position.y < config.height);
        CHECK(morsels[i].position != config.nest);
        for (size_t j = i + 1; j < morsels.size(); j++) {
            CHECK(morsels[i].position != morsels[j].position);
        }
    }
}

TEST_CASE("random placement fills a tiny grid completely") {
    SimConfig config;
    config.width = 2;
    config.height = 2;
    config.nest = Position(0, 0);
    config.num_morsels = 3;
    RNG rng(3);

    Landmarks landmarks = Landmarks::create(config, rng);
    REQUIRE(landmarks.morsels().size() == 3);
    CHECK_FALSE(landmarks.has_active_morsel_at(Position(0, 0)));
    CHECK(landmarks.has_active_morsel_at(Position(1, 0)));
    CHECK(landmarks.has_active_morsel_at(Position(0, 1)));
    CHECK(landmarks.has_active_morsel_at(Position(1, 1)));
}
