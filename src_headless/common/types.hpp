#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <random>

namespace colony {

// Integer cell coordinate; (0, 0) is the top-left cell.
struct Position {
    int x = 0;
    int y = 0;

    Position() = default;
    Position(int x, int y) : x(x), y(y) {}

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// The two trace kinds an agent can leave behind.
enum class TraceKind : int {
    HOME_BOUND = 0,  // Leads back to the nest
    FOOD_BOUND = 1   // Leads to a morsel
};

constexpr int NUM_TRACE_KINDS = 2;

// Agent tasks
enum class TaskState : int {
    FORAGING = 0,  // Looking for a morsel
    CARRYING = 1   // Returning to the nest with one unit of food
};

// Closed set of entity kinds that can be observed from outside the engine.
enum class EntityKind : int {
    NEST = 0,
    MORSEL = 1,
    AGENT = 2,
    TRACE = 3
};

// Reference to an entity held in the grid index.
struct EntityRef {
    EntityKind kind = EntityKind::AGENT;
    int index = 0;

    bool operator==(const EntityRef& other) const { return kind == other.kind && index == other.index; }
};

// Read-only view of one entity for drawing and inspection. Only the fields
// relevant to `kind` are meaningful:
//   NEST   - position, food (accumulated)
//   MORSEL - position, food (remaining)
//   AGENT  - position, index, task
//   TRACE  - position, scent, concentration
struct EntityView {
    EntityKind kind = EntityKind::NEST;
    Position position;
    int index = 0;
    std::uint64_t food = 0;
    TaskState task = TaskState::FORAGING;
    TraceKind scent = TraceKind::HOME_BOUND;
    double concentration = 0.0;
};

// Direction offsets for 8 neighbors
constexpr int DX[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int DY[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

inline int sign(int v) {
    return (v > 0) - (v < 0);
}

inline int chebyshev(const Position& a, const Position& b) {
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

inline int manhattan(const Position& a, const Position& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// A single Moore step from `from` in the direction of `to`.
inline Position step_towards(const Position& from, const Position& to) {
    return Position(from.x + sign(to.x - from.x), from.y + sign(to.y - from.y));
}

inline TraceKind scent_followed(TaskState task) {
    return task == TaskState::FORAGING ? TraceKind::FOOD_BOUND : TraceKind::HOME_BOUND;
}

inline TraceKind scent_left(TaskState task) {
    return task == TaskState::FORAGING ? TraceKind::HOME_BOUND : TraceKind::FOOD_BOUND;
}

// Random number generator wrapper
class RNG {
   public:
    explicit RNG(std::uint64_t seed = 42) : gen(static_cast<std::mt19937::result_type>(seed)), dist(0.0, 1.0) {}

    // Independent stream for one agent, derived from the master seed.
    RNG(std::uint64_t seed, std::uint64_t stream) : dist(0.0, 1.0) {
        std::seed_seq seq{static_cast<std::uint32_t>(seed), static_cast<std::uint32_t>(seed >> 32),
                          static_cast<std::uint32_t>(stream), static_cast<std::uint32_t>(stream >> 32)};
        gen.seed(seq);
    }

    double random_double(double min, double max) { return min + (max - min) * dist(gen); }
    int random_int(int min, int max) {
        std::uniform_int_distribution<int> d(min, max);
        return d(gen);
    }

    template <typename Container>
    void shuffle(Container& items) {
        std::shuffle(items.begin(), items.end(), gen);
    }

   private:
    std::mt19937 gen;
    std::uniform_real_distribution<double> dist;
};

}  // namespace colony
