#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

// Grid configuration - 30x30 grid
#define COLONY_GRID_WIDTH 30
#define COLONY_GRID_HEIGHT 30
#define COLONY_NEST_X 15
#define COLONY_NEST_Y 15

// Population and food
#define COLONY_NUM_ANTS 10
#define COLONY_NUM_MORSELS 20
#define COLONY_MORSEL_FOOD 30  // Amount of food at each morsel

// Agent sensing
#define COLONY_SENSING_RADIUS 1
#define COLONY_MEMORY_SPAN 30

// Trace dynamics
#define COLONY_EVAPORATION_RATE 0.01     // Fraction lost per generation
#define COLONY_MAX_CONCENTRATION 200.0
#define COLONY_DEPOSIT_AMOUNT 200.0      // Strength right after leaving a target
#define COLONY_DEPOSIT_DECREASE 2.0      // Strength lost per step away from it
#define COLONY_REINFORCE_RATIO 0.1       // Extra HomeBound deposit, relative to what is there
#define COLONY_NEGLIGIBLE_CONCENTRATION 0.01

#define COLONY_SEED 42

namespace colony {

// Invalid or out-of-range parameters, raised at construction only.
class ConfigurationError : public std::invalid_argument {
   public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// How the strength of a deposit falls off with the steps taken since the
// agent last left a target.
enum class DepositLaw : int {
    CONSTANT = 0,
    LINEAR = 1,   // amount - decrease * steps, floored at zero
    INVERSE = 2   // amount / (1 + decrease * steps)
};

struct SimConfig {
    int width = COLONY_GRID_WIDTH;
    int height = COLONY_GRID_HEIGHT;
    Position nest{COLONY_NEST_X, COLONY_NEST_Y};

    int num_ants = COLONY_NUM_ANTS;
    int num_morsels = COLONY_NUM_MORSELS;
    int morsel_food = COLONY_MORSEL_FOOD;
    // When non-empty, overrides random placement; num_morsels is ignored.
    std::vector<Position> morsel_positions;

    int sensing_radius = COLONY_SENSING_RADIUS;
    int memory_span = COLONY_MEMORY_SPAN;

    double evaporation_rate = COLONY_EVAPORATION_RATE;
    double max_concentration = COLONY_MAX_CONCENTRATION;
    DepositLaw deposit_law = DepositLaw::LINEAR;
    double deposit_amount = COLONY_DEPOSIT_AMOUNT;
    double deposit_decrease = COLONY_DEPOSIT_DECREASE;
    double reinforce_ratio = COLONY_REINFORCE_RATIO;
    double negligible_concentration = COLONY_NEGLIGIBLE_CONCENTRATION;
    bool suppress_misleading_trails = true;

    std::uint64_t seed = COLONY_SEED;

    // Number of morsels the simulation will actually hold.
    int morsel_count() const {
        return morsel_positions.empty() ? num_morsels : static_cast<int>(morsel_positions.size());
    }

    // Throws ConfigurationError on the first invalid parameter.
    void validate() const;
};

// Strength of a deposit made `steps` generations after the last refresh.
double deposit_strength(const SimConfig& config, std::uint64_t steps);

const char* to_string(DepositLaw law);

}  // namespace colony
