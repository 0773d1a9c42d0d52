#pragma once

#include <cstdint>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace colony {

struct Nest {
    Position position;
    std::uint64_t accumulated = 0;

    Nest() = default;
    explicit Nest(const Position& p) : position(p) {}

    void store() { accumulated++; }
};

struct Morsel {
    Position position;
    std::uint64_t remaining = 0;

    Morsel() = default;
    Morsel(const Position& p, std::uint64_t food) : position(p), remaining(food) {}

    bool is_active() const { return remaining > 0; }

    // Takes a single unit; false once the morsel is exhausted.
    bool take() {
        if (remaining == 0)
            return false;
        remaining--;
        return true;
    }
};

// The nest and the morsels of one run. Both are fixed in place.
class Landmarks {
   public:
    Landmarks(const Position& nest, std::vector<Morsel> morsels);

    // Nest plus morsels laid out from the configuration; random placement
    // draws from `rng`.
    static Landmarks create(const SimConfig& config, RNG& rng);

    const Nest& nest() const { return nest_; }
    Nest& nest() { return nest_; }
    const std::vector<Morsel>& morsels() const { return morsels_; }

    bool is_nest(const Position& p) const { return nest_.position == p; }
    bool has_active_morsel_at(const Position& p) const { return active_morsel_at(p) >= 0; }
    // Index of the first active morsel on `p`, or -1.
    int active_morsel_at(const Position& p) const;
    Morsel& morsel(int index) { return morsels_.at(index); }

    std::uint64_t initial_food() const { return initial_food_; }
    std::uint64_t remaining_food() const;
    int active_morsels() const;

   private:
    Nest nest_;
    std::vector<Morsel> morsels_;
    std::uint64_t initial_food_ = 0;
};

}  // namespace colony
