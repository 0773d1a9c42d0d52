#include "config.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <sstream>

namespace colony {

namespace {

bool inside(const SimConfig& config, const Position& p) {
    return p.x >= 0 && p.x < config.width && p.y >= 0 && p.y < config.height;
}

void fail(const std::string& what) {
    throw ConfigurationError(what);
}

}  // namespace

void SimConfig::validate() const {
    if (width <= 0 || height <= 0) {
        std::ostringstream msg;
        msg << "grid must have a positive size, got " << width << "x" << height;
        fail(msg.str());
    }
    if (static_cast<long long>(width) * height > INT_MAX) {
        std::ostringstream msg;
        msg << "grid of " << width << "x" << height << " cells is too large";
        fail(msg.str());
    }
    if (num_ants <= 0) {
        fail("at least one ant is required");
    }
    if (!inside(*this, nest)) {
        std::ostringstream msg;
        msg << "nest (" << nest.x << ", " << nest.y << ") lies outside the " << width << "x" << height << " grid";
        fail(msg.str());
    }
    if (morsel_positions.empty() && num_morsels < 0) {
        fail("morsel count cannot be negative");
    }
    if (morsel_food < 0) {
        fail("morsel food cannot be negative");
    }
    for (const Position& p : morsel_positions) {
        if (!inside(*this, p)) {
            std::ostringstream msg;
            msg << "morsel (" << p.x << ", " << p.y << ") lies outside the grid";
            fail(msg.str());
        }
        if (p == nest) {
            fail("a morsel cannot share the nest cell");
        }
    }
    // Random placement needs one free cell per morsel, the nest excluded.
    long long free_cells = static_cast<long long>(width) * height - 1;
    if (morsel_positions.empty() && num_morsels > free_cells) {
        fail("not enough free cells for the requested morsels");
    }
    if (sensing_radius < 1) {
        fail("sensing radius must be at least 1");
    }
    if (memory_span < 0) {
        fail("memory span cannot be negative");
    }
    if (!std::isfinite(evaporation_rate) || !std::isfinite(max_concentration) || !std::isfinite(deposit_amount) ||
        !std::isfinite(deposit_decrease) || !std::isfinite(reinforce_ratio) ||
        !std::isfinite(negligible_concentration)) {
        fail("trace parameters must be finite numbers");
    }
    if (evaporation_rate < 0.0 || evaporation_rate > 1.0) {
        fail("evaporation rate must lie in [0, 1]");
    }
    if (max_concentration <= 0.0) {
        fail("maximum concentration must be positive");
    }
    if (deposit_amount < 0.0 || deposit_decrease < 0.0) {
        fail("deposit amount and decrease cannot be negative");
    }
    if (reinforce_ratio < 0.0) {
        fail("reinforce ratio cannot be negative");
    }
    if (negligible_concentration < 0.0) {
        fail("negligible concentration cannot be negative");
    }
}

double deposit_strength(const SimConfig& config, std::uint64_t steps) {
    double s = static_cast<double>(steps);
    switch (config.deposit_law) {
        case DepositLaw::CONSTANT:
            return config.deposit_amount;
        case DepositLaw::LINEAR:
            return std::max(0.0, config.deposit_amount - config.deposit_decrease * s);
        case DepositLaw::INVERSE:
            return config.deposit_amount / (1.0 + config.deposit_decrease * s);
    }
    return 0.0;
}

const char* to_string(DepositLaw law) {
    switch (law) {
        case DepositLaw::CONSTANT:
            return "constant";
        case DepositLaw::LINEAR:
            return "linear";
        case DepositLaw::INVERSE:
            return "inverse";
    }
    return "unknown";
}

}  // namespace colony
