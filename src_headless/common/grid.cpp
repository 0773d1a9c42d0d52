#include "grid.hpp"

#include <algorithm>
#include <stdexcept>

namespace colony {

Grid::Grid(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("grid dimensions must be positive");
    }
    cells_.resize(static_cast<size_t>(width) * height);
}

Position Grid::clamp(const Position& p) const {
    return Position(std::max(0, std::min(width_ - 1, p.x)), std::max(0, std::min(height_ - 1, p.y)));
}

std::vector<Position>& Grid::positions_for(EntityKind kind) {
    return const_cast<std::vector<Position>&>(static_cast<const Grid&>(*this).positions_for(kind));
}

const std::vector<Position>& Grid::positions_for(EntityKind kind) const {
    switch (kind) {
        case EntityKind::NEST:
            return nest_positions_;
        case EntityKind::MORSEL:
            return morsel_positions_;
        case EntityKind::AGENT:
            return agent_positions_;
        case EntityKind::TRACE:
            break;
    }
    throw std::invalid_argument("traces are not indexed by the grid");
}

void Grid::place(const EntityRef& entity, const Position& p) {
    if (!in_bounds(p)) {
        throw std::out_of_range("cannot place an entity outside the grid");
    }
    std::vector<Position>& positions = positions_for(entity.kind);
    if (entity.index < 0) {
        throw std::out_of_range("negative entity index");
    }
    if (static_cast<size_t>(entity.index) >= positions.size()) {
        positions.resize(entity.index + 1);
    }
    positions[entity.index] = p;
    cells_[index(p)].push_back(entity);
}

void Grid::move(const EntityRef& entity, const Position& to) {
    if (!in_bounds(to)) {
        throw std::out_of_range("cannot move an entity outside the grid");
    }
    Position& from = positions_for(entity.kind).at(entity.index);
    if (from == to) {
        return;
    }
    std::vector<EntityRef>& old_cell = cells_[index(from)];
    old_cell.erase(std::find(old_cell.begin(), old_cell.end(), entity));
    cells_[index(to)].push_back(entity);
    from = to;
}

Position Grid::position_of(const EntityRef& entity) const {
    return positions_for(entity.kind).at(entity.index);
}

const std::vector<EntityRef>& Grid::occupants_at(const Position& p) const {
    if (!in_bounds(p)) {
        return empty_;
    }
    return cells_[index(p)];
}

std::vector<Position> Grid::neighborhood(const Position& center, int radius) const {
    std::vector<Position> cells;
    radius = std::max(0, radius);
    int y_min = std::max(0, center.y - radius);
    int y_max = std::min(height_ - 1, center.y + radius);
    int x_min = std::max(0, center.x - radius);
    int x_max = std::min(width_ - 1, center.x + radius);
    for (int y = y_min; y <= y_max; y++) {
        for (int x = x_min; x <= x_max; x++) {
            cells.emplace_back(x, y);
        }
    }
    return cells;
}

std::vector<Position> Grid::border(const Position& center, int radius) const {
    std::vector<Position> cells;
    for (const Position& p : neighborhood(center, radius)) {
        if (chebyshev(p, center) == std::max(0, radius)) {
            cells.push_back(p);
        }
    }
    return cells;
}

}  // namespace colony
