#pragma once

#include <cstdint>
#include <vector>

#include "config.hpp"
#include "grid.hpp"
#include "landmarks.hpp"
#include "trace_field.hpp"
#include "trail_memory.hpp"
#include "types.hpp"

namespace colony {

// Everything an agent may read while deciding. All of it is the state at the
// start of the generation; nothing here is mutated during the decision phase.
struct Surroundings {
    const Grid& grid;
    const TraceField& field;
    const Landmarks& landmarks;
    const SimConfig& config;
};

// What an agent wants to do this generation, applied later by the Simulation.
struct Intent {
    Position from;
    Position to;
    TraceKind deposit_kind = TraceKind::HOME_BOUND;
    double deposit_amount = 0.0;
    bool suppress = false;  // Zero `suppress_kind` at `from`
    TraceKind suppress_kind = TraceKind::FOOD_BOUND;
};

// Outcome of landing on a cell.
enum class Arrival : int {
    NONE = 0,
    PICKUP = 1,    // Foraging -> Carrying at a morsel
    DELIVERY = 2,  // Carrying -> Foraging at the nest
    REFRESH = 3    // On a target without switching task; deposit strength restored
};

class Agent {
   public:
    Agent(int id, const Position& nest, int memory_span);

    int id() const { return id_; }
    const Position& position() const { return position_; }
    const Position& home() const { return home_; }
    TaskState task() const { return task_; }
    bool is_carrying() const { return task_ == TaskState::CARRYING; }
    std::uint64_t steps_since_refresh() const { return steps_; }
    std::uint64_t pickups() const { return pickups_; }
    std::uint64_t deliveries() const { return deliveries_; }
    const TrailMemory& memory() const { return memory_; }

    // Reads only `world`; draws only from `rng`.
    Intent decide(const Surroundings& world, RNG& rng) const;

    // Remembers the cell being left, then moves.
    void commit(const Intent& intent);

    // Task transitions for the cell the agent now stands on.
    Arrival arrive(Landmarks& landmarks);

   private:
    bool is_target(const Surroundings& world, const Position& p) const;
    bool nearest_target(const Surroundings& world, const std::vector<Position>& around, RNG& rng,
                        Position& target) const;
    bool strongest_trace(const Surroundings& world, const std::vector<Position>& around, RNG& rng,
                         Position& best) const;
    bool is_misleading(const Surroundings& world, const std::vector<Position>& around) const;
    bool is_lost(const Surroundings& world) const;
    double next_deposit(const Surroundings& world) const;
    Position towards_nest(const Surroundings& world, RNG& rng) const;
    Position random_step(const Surroundings& world, RNG& rng) const;

    int id_;
    Position position_;
    Position home_;
    TaskState task_;
    TrailMemory memory_;
    std::uint64_t steps_;
    std::uint64_t pickups_;
    std::uint64_t deliveries_;
};

}  // namespace colony
