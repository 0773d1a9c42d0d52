#pragma once

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace colony {

// Per-cell, per-kind trace concentration. Deposits accumulate additively and
// are capped at the maximum; decay is a separate end-of-generation pass.
// A cell exists once something has been deposited on it and keeps existing,
// possibly at zero, for the rest of the run.
class TraceField {
   public:
    TraceField(int width, int height, double max_concentration, double negligible = 0.01);

    int width() const { return width_; }
    int height() const { return height_; }
    double max_concentration() const { return max_concentration_; }
    double negligible() const { return negligible_; }

    void deposit(const Position& p, TraceKind kind, double amount);
    void suppress(const Position& p, TraceKind kind);
    double concentration_at(const Position& p, TraceKind kind) const;
    bool exists(const Position& p, TraceKind kind) const;

    // new = max(0, old * (1 - rate)); values at or below the negligible
    // threshold snap to zero.
    void decay_all(double evaporation_rate);

    double total(TraceKind kind) const;
    size_t cell_count() const;

    // Visits every existing cell as fn(position, kind, concentration).
    template <typename Fn>
    void for_each_cell(Fn&& fn) const {
        for (int k = 0; k < NUM_TRACE_KINDS; k++) {
            const std::vector<double>& values = values_[k];
            const std::vector<std::uint8_t>& touched = touched_[k];
            for (int i = 0; i < width_ * height_; i++) {
                if (touched[i]) {
                    fn(Position(i % width_, i / width_), static_cast<TraceKind>(k), values[i]);
                }
            }
        }
    }

   private:
    bool in_bounds(const Position& p) const {
        return p.x >= 0 && p.x < width_ && p.y >= 0 && p.y < height_;
    }
    int index(const Position& p) const { return p.y * width_ + p.x; }

    int width_;
    int height_;
    double max_concentration_;
    double negligible_;
    std::vector<double> values_[NUM_TRACE_KINDS];
    std::vector<std::uint8_t> touched_[NUM_TRACE_KINDS];
};

}  // namespace colony
