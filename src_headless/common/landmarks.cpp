#include "landmarks.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace colony {

namespace {

double distance_squared(const Position& a, const Position& b) {
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    return dx * dx + dy * dy;
}

bool taken(const std::vector<Morsel>& morsels, const Position& p) {
    for (const Morsel& m : morsels) {
        if (m.position == p)
            return true;
    }
    return false;
}

// First free cell scanning row-major from `start`; used when every random
// attempt lands on an occupied cell.
Position first_free_cell(const SimConfig& config, const std::vector<Morsel>& morsels, const Position& start) {
    int cells = config.width * config.height;
    int first = start.y * config.width + start.x;
    for (int offset = 0; offset < cells; offset++) {
        int i = (first + offset) % cells;
        Position p(i % config.width, i / config.width);
        if (p != config.nest && !taken(morsels, p))
            return p;
    }
    return start;
}

}  // namespace

Landmarks::Landmarks(const Position& nest, std::vector<Morsel> morsels)
    : nest_(nest), morsels_(std::move(morsels)) {
    for (const Morsel& m : morsels_) {
        initial_food_ += m.remaining;
    }
}

Landmarks Landmarks::create(const SimConfig& config, RNG& rng) {
    std::vector<Morsel> morsels;
    const std::uint64_t food = static_cast<std::uint64_t>(config.morsel_food);

    if (!config.morsel_positions.empty()) {
        for (const Position& p : config.morsel_positions) {
            morsels.emplace_back(p, food);
        }
        return Landmarks(config.nest, std::move(morsels));
    }

    // Place morsels at 30% to 80% of the half-extent from the nest, spread
    // out from each other
    double half_extent = std::min(config.width, config.height) / 2.0;
    double max_radius = std::max(1.0, half_extent * 0.8);
    double min_radius = std::max(1.0, half_extent * 0.3);

    for (int i = 0; i < config.num_morsels; i++) {
        Position best(-1, -1);
        double best_score = -1;

        for (int attempt = 0; attempt < 50; attempt++) {
            double angle = rng.random_double(0, 2 * M_PI);
            double radius = rng.random_double(min_radius, max_radius);
            int fx = static_cast<int>(std::lround(config.nest.x + radius * std::cos(angle)));
            int fy = static_cast<int>(std::lround(config.nest.y + radius * std::sin(angle)));

            fx = std::max(0, std::min(config.width - 1, fx));
            fy = std::max(0, std::min(config.height - 1, fy));
            Position candidate(fx, fy);
            if (candidate == config.nest || taken(morsels, candidate))
                continue;

            double score = 0;
            for (const Morsel& m : morsels) {
                score += distance_squared(candidate, m.position);
            }
            if (morsels.empty())
                score = 1;

            if (score > best_score) {
                best_score = score;
                best = candidate;
            }
        }

        if (best_score < 0) {
            best = first_free_cell(config, morsels, Position(rng.random_int(0, config.width - 1),
                                                             rng.random_int(0, config.height - 1)));
        }
        morsels.emplace_back(best, food);
    }

    return Landmarks(config.nest, std::move(morsels));
}

int Landmarks::active_morsel_at(const Position& p) const {
    for (size_t i = 0; i < morsels_.size(); i++) {
        if (morsels_[i].position == p && morsels_[i].is_active())
            return static_cast<int>(i);
    }
    return -1;
}

std::uint64_t Landmarks::remaining_food() const {
    std::uint64_t total = 0;
    for (const Morsel& m : morsels_) {
        total += m.remaining;
    }
    return total;
}

int Landmarks::active_morsels() const {
    return static_cast<int>(std::count_if(morsels_.begin(), morsels_.end(),
                                          [](const Morsel& m) { return m.is_active(); }));
}

}  // namespace colony
