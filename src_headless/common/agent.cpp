#include "agent.hpp"

#include <algorithm>
#include <array>

namespace colony {

Agent::Agent(int id, const Position& nest, int memory_span)
    : id_(id),
      position_(nest),
      home_(nest),
      task_(TaskState::FORAGING),
      memory_(memory_span),
      steps_(0),
      pickups_(0),
      deliveries_(0) {}

bool Agent::is_target(const Surroundings& world, const Position& p) const {
    switch (task_) {
        case TaskState::FORAGING:
            return world.landmarks.has_active_morsel_at(p);
        case TaskState::CARRYING:
            return world.landmarks.is_nest(p);
    }
    return false;
}

// Closest cell holding the current target; equally close ones are drawn at
// random.
bool Agent::nearest_target(const Surroundings& world, const std::vector<Position>& around, RNG& rng,
                           Position& target) const {
    std::vector<Position> closest;
    int best = -1;
    for (const Position& p : around) {
        if (p == position_ || !is_target(world, p))
            continue;
        int d = chebyshev(p, position_);
        if (best < 0 || d < best) {
            best = d;
            closest.clear();
        }
        if (d == best)
            closest.push_back(p);
    }
    if (closest.empty())
        return false;
    target = closest.size() == 1 ? closest[0] : closest[rng.random_int(0, static_cast<int>(closest.size()) - 1)];
    return true;
}

// Cell with the strongest trace leading to the target, skipping cells still
// in memory and anything at or below the negligible level.
bool Agent::strongest_trace(const Surroundings& world, const std::vector<Position>& around, RNG& rng,
                            Position& best) const {
    const TraceKind scent = scent_followed(task_);
    const double floor = world.config.negligible_concentration;
    std::vector<Position> strongest;
    double best_value = floor;
    for (const Position& p : around) {
        if (p == position_ || memory_.contains(p))
            continue;
        double value = world.field.concentration_at(p, scent);
        if (value <= floor)
            continue;
        if (value > best_value) {
            best_value = value;
            strongest.clear();
        }
        if (value == best_value)
            strongest.push_back(p);
    }
    if (strongest.empty())
        return false;
    best = strongest.size() == 1 ? strongest[0] : strongest[rng.random_int(0, static_cast<int>(strongest.size()) - 1)];
    return true;
}

// With no target in sight, a cell that holds more of the target trace than
// any of its neighbors is the dead end of a trail.
bool Agent::is_misleading(const Surroundings& world, const std::vector<Position>& around) const {
    const TraceKind scent = scent_followed(task_);
    double here = world.field.concentration_at(position_, scent);
    if (here <= world.config.negligible_concentration)
        return false;
    double strongest_neighbor = 0.0;
    for (const Position& p : around) {
        if (p != position_)
            strongest_neighbor = std::max(strongest_neighbor, world.field.concentration_at(p, scent));
    }
    return here > strongest_neighbor;
}

// Out of deposit strength and standing on no trace at all.
bool Agent::is_lost(const Surroundings& world) const {
    if (deposit_strength(world.config, steps_) > 0.0)
        return false;
    const double floor = world.config.negligible_concentration;
    return world.field.concentration_at(position_, TraceKind::HOME_BOUND) <= floor &&
           world.field.concentration_at(position_, TraceKind::FOOD_BOUND) <= floor;
}

double Agent::next_deposit(const Surroundings& world) const {
    double amount = deposit_strength(world.config, steps_);
    if (scent_left(task_) == TraceKind::HOME_BOUND) {
        // Reinforce the way home
        amount += world.field.concentration_at(position_, TraceKind::HOME_BOUND) * world.config.reinforce_ratio;
    }
    return amount;
}

// Heads for the nest with an accuracy that grows as the distance shrinks: the
// aim point is a random cell on a ring of random radius around the nest.
Position Agent::towards_nest(const Surroundings& world, RNG& rng) const {
    int dist = manhattan(position_, home_);
    if (dist == 0)
        return random_step(world, rng);

    Position aim = home_;
    int radius = rng.random_int(0, dist - 1);
    if (radius > 0) {
        std::vector<Position> ring = world.grid.border(home_, radius);
        if (!ring.empty())
            aim = ring[rng.random_int(0, static_cast<int>(ring.size()) - 1)];
    }

    Position next = world.grid.clamp(step_towards(position_, aim));
    if (next == position_)
        next = world.grid.clamp(step_towards(position_, home_));
    return next;
}

// Uniformly random legal step, preferring cells not in memory.
Position Agent::random_step(const Surroundings& world, RNG& rng) const {
    std::array<int, 8> directions = {0, 1, 2, 3, 4, 5, 6, 7};
    rng.shuffle(directions);

    Position fallback = position_;
    bool has_fallback = false;
    for (int d : directions) {
        Position p(position_.x + DX[d], position_.y + DY[d]);
        if (!world.grid.in_bounds(p))
            continue;
        if (!memory_.contains(p))
            return p;
        if (!has_fallback) {
            fallback = p;
            has_fallback = true;
        }
    }
    return fallback;
}

Intent Agent::decide(const Surroundings& world, RNG& rng) const {
    Intent intent;
    intent.from = position_;
    intent.to = position_;
    intent.deposit_kind = scent_left(task_);
    intent.deposit_amount = next_deposit(world);

    std::vector<Position> around = world.grid.neighborhood(position_, world.config.sensing_radius);

    Position dest;
    if (nearest_target(world, around, rng, dest)) {
        intent.to = step_towards(position_, dest);
    } else {
        if (world.config.suppress_misleading_trails && is_misleading(world, around)) {
            intent.suppress = true;
            intent.suppress_kind = scent_followed(task_);
        }

        if (strongest_trace(world, around, rng, dest)) {
            intent.to = step_towards(position_, dest);
        } else if (task_ == TaskState::CARRYING || is_lost(world)) {
            intent.to = towards_nest(world, rng);
        } else {
            intent.to = random_step(world, rng);
        }
    }

    // Illegal destinations hold position
    if (!world.grid.in_bounds(intent.to))
        intent.to = position_;
    return intent;
}

void Agent::commit(const Intent& intent) {
    memory_.push(position_);
    position_ = intent.to;
    steps_++;
}

Arrival Agent::arrive(Landmarks& landmarks) {
    switch (task_) {
        case TaskState::FORAGING: {
            int m = landmarks.active_morsel_at(position_);
            if (m >= 0 && landmarks.morsel(m).take()) {
                task_ = TaskState::CARRYING;
                memory_.clear();
                steps_ = 0;
                pickups_++;
                return Arrival::PICKUP;
            }
            if (landmarks.is_nest(position_)) {
                steps_ = 0;
                return Arrival::REFRESH;
            }
            break;
        }
        case TaskState::CARRYING: {
            if (landmarks.is_nest(position_)) {
                landmarks.nest().store();
                task_ = TaskState::FORAGING;
                memory_.clear();
                steps_ = 0;
                deliveries_++;
                return Arrival::DELIVERY;
            }
            if (landmarks.has_active_morsel_at(position_)) {
                steps_ = 0;
                return Arrival::REFRESH;
            }
            break;
        }
    }
    return Arrival::NONE;
}

}  // namespace colony
