#pragma once

#include <vector>

#include "types.hpp"

namespace colony {

// Fixed-size positional index mapping cells to the entities standing on them.
// Several entities may share a cell; there is no exclusivity.
class Grid {
   public:
    Grid(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    int size() const { return width_ * height_; }

    bool in_bounds(const Position& p) const {
        return p.x >= 0 && p.x < width_ && p.y >= 0 && p.y < height_;
    }
    int index(const Position& p) const { return p.y * width_ + p.x; }
    Position position(int index) const { return Position(index % width_, index / width_); }
    Position clamp(const Position& p) const;

    // Occupancy. An entity is placed once and then only moved.
    void place(const EntityRef& entity, const Position& p);
    void move(const EntityRef& entity, const Position& to);
    Position position_of(const EntityRef& entity) const;
    const std::vector<EntityRef>& occupants_at(const Position& p) const;

    // Cells within Chebyshev distance `radius` of `center`, clipped to the
    // grid, in row-major order and including the center itself.
    std::vector<Position> neighborhood(const Position& center, int radius) const;

    // Cells at exactly Chebyshev distance `radius`, clipped to the grid.
    std::vector<Position> border(const Position& center, int radius) const;

   private:
    std::vector<Position>& positions_for(EntityKind kind);
    const std::vector<Position>& positions_for(EntityKind kind) const;

    int width_;
    int height_;
    std::vector<std::vector<EntityRef>> cells_;
    std::vector<Position> nest_positions_;
    std::vector<Position> morsel_positions_;
    std::vector<Position> agent_positions_;
    std::vector<EntityRef> empty_;
};

}  // namespace colony
