#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "agent.hpp"
#include "config.hpp"
#include "grid.hpp"
#include "landmarks.hpp"
#include "trace_field.hpp"
#include "types.hpp"

namespace colony {

// nextgen() called on a simulation that is already over.
class SimulationOverError : public std::logic_error {
   public:
    explicit SimulationOverError(const std::string& what) : std::logic_error(what) {}
};

// Simulation statistics
struct SimStats {
    std::uint64_t food_collected = 0;   // Stored in the nest
    std::uint64_t food_available = 0;   // Initially in the morsels
    std::uint64_t food_remaining = 0;   // Still in the morsels
    std::uint64_t food_in_transit = 0;  // Carried by agents
    std::uint64_t pickups = 0;
    std::uint64_t generation = 0;
};

// Owns the environment and the colony and advances them one generation at a
// time. Each generation runs in three phases:
//   1. every agent decides from the state at the start of the generation
//      (parallel, read-only);
//   2. suppressions, deposits, moves and arrivals are applied in agent order;
//   3. the trace field decays once.
// Each agent draws from its own generator seeded from (seed, agent index), so
// a run is reproducible for any number of threads.
class Simulation {
   public:
    // Throws ConfigurationError when `config` is invalid.
    explicit Simulation(const SimConfig& config);

    // Advances one generation and returns the new generation number.
    // Throws SimulationOverError once is_simulation_over() holds.
    std::uint64_t nextgen();

    std::uint64_t generation() const { return generation_; }

    // All morsels are empty and no agent is still carrying food.
    bool is_simulation_over() const;

    SimStats stats() const;

    const SimConfig& config() const { return config_; }
    const Grid& grid() const { return grid_; }
    const TraceField& trace_field() const { return field_; }
    const Landmarks& landmarks() const { return landmarks_; }
    const Nest& nest() const { return landmarks_.nest(); }
    const std::vector<Morsel>& morsels() const { return landmarks_.morsels(); }
    const std::vector<Agent>& agents() const { return agents_; }

    // Nest, active morsels, agents and existing trace cells, in that order.
    std::vector<EntityView> snapshot() const;

   private:
    void decide_all();
    void apply_all();

    SimConfig config_;
    RNG master_rng_;
    Grid grid_;
    TraceField field_;
    Landmarks landmarks_;
    std::vector<Agent> agents_;
    std::vector<RNG> agent_rngs_;
    std::vector<Intent> intents_;
    std::uint64_t generation_;
    std::uint64_t pickups_;
};

}  // namespace colony
