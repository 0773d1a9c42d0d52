// test_grid.cpp
// Neighborhood clipping and the occupancy index.

#include <doctest/doctest.h>

#include <algorithm>

#include "grid.hpp"

using namespace colony;

namespace {
    bool has(const std::vector<Position>& cells, const Position& p) {
        return std::find(cells.begin(), cells.end(), p) != cells.end();
    }
}

TEST_CASE("neighborhood of an interior cell is the full Moore square") {
    Grid grid(10, 10);
    std::vector<Position> cells = grid.neighborhood(Position(5, 5), 1);
    CHECK(cells.size() == 9);
    CHECK(has(cells, Position(5, 5)));
    CHECK(has(cells, Position(4, 4)));
    CHECK(has(cells, Position(6, 6)));

    CHECK(grid.neighborhood(Position(5, 5), 2).size() == 25);
}

TEST_CASE("neighborhood is clipped at the grid bounds") {
    Grid grid(5, 4);

    SUBCASE("corner") {
        std::vector<Position> cells = grid.neighborhood(Position(0, 0), 1);
        CHECK(cells.size() == 4);
        for (const Position& p : cells) {
            CHECK(grid.in_bounds(p));
        }
    }
    SUBCASE("radius larger than the grid covers every cell once") {
        std::vector<Position> cells = grid.neighborhood(Position(2, 2), 100);
        CHECK(cells.size() == 20);
    }
    SUBCASE("negative radius yields the center only") {
        std::vector<Position> cells = grid.neighborhood(Position(2, 2), -3);
        REQUIRE(cells.size() == 1);
        CHECK(cells[0] == Position(2, 2));
    }
}

TEST_CASE("border keeps only the ring at the given distance") {
    Grid grid(10, 10);
    std::vector<Position> ring = grid.border(Position(5, 5), 2);
    CHECK(ring.size() == 16);
    for (const Position& p : ring) {
        CHECK(chebyshev(p, Position(5, 5)) == 2);
    }

    CHECK(grid.border(Position(0, 0), 1).size() == 3);
    CHECK(grid.border(Position(5, 5), 0).size() == 1);
}

TEST_CASE("occupancy follows moves and allows shared cells") {
    Grid grid(6, 6);
    EntityRef a{EntityKind::AGENT, 0};
    EntityRef b{EntityKind::AGENT, 1};
    EntityRef nest{EntityKind::NEST, 0};

    grid.place(nest, Position(2, 2));
    grid.place(a, Position(2, 2));
    grid.place(b, Position(2, 2));
    CHECK(grid.occupants_at(Position(2, 2)).size() == 3);

    grid.move(a, Position(3, 2));
    CHECK(grid.position_of(a) == Position(3, 2));
    CHECK(grid.position_of(b) == Position(2, 2));
    CHECK(grid.position_of(nest) == Position(2, 2));
    CHECK(grid.occupants_at(Position(2, 2)).size() == 2);
    REQUIRE(grid.occupants_at(Position(3, 2)).size() == 1);
    CHECK(grid.occupants_at(Position(3, 2))[0] == a);

    // Moving onto the same cell is a no-op
    grid.move(a, Position(3, 2));
    CHECK(grid.occupants_at(Position(3, 2)).size() == 1);

    CHECK(grid.occupants_at(Position(-1, 0)).empty());
}

TEST_CASE("clamp pulls positions back inside") {
    Grid grid(4, 3);
    CHECK(grid.clamp(Position(-2, 1)) == Position(0, 1));
    CHECK(grid.clamp(Position(7, 9)) == Position(3, 2));
    CHECK(grid.clamp(Position(1, 1)) == Position(1, 1));
    CHECK(grid.position(grid.index(Position(3, 2))) == Position(3, 2));
}

TEST_CASE("entities cannot be placed outside the grid") {
    Grid grid(3, 3);
    CHECK_THROWS_AS(grid.place(EntityRef{EntityKind::AGENT, 0}, Position(3, 0)), std::out_of_range);
    CHECK_THROWS_AS(grid.place(EntityRef{EntityKind::TRACE, 0}, Position(1, 1)), std::invalid_argument);
}
