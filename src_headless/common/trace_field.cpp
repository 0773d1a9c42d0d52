#include "trace_field.hpp"

#include <algorithm>

namespace colony {

TraceField::TraceField(int width, int height, double max_concentration, double negligible)
    : width_(width), height_(height), max_concentration_(max_concentration), negligible_(negligible) {
    for (int k = 0; k < NUM_TRACE_KINDS; k++) {
        values_[k].assign(static_cast<size_t>(width) * height, 0.0);
        touched_[k].assign(static_cast<size_t>(width) * height, 0);
    }
}

void TraceField::deposit(const Position& p, TraceKind kind, double amount) {
    if (!in_bounds(p) || !(amount > 0.0)) {
        return;
    }
    int k = static_cast<int>(kind);
    int idx = index(p);
    values_[k][idx] = std::min(max_concentration_, values_[k][idx] + amount);
    touched_[k][idx] = 1;
}

void TraceField::suppress(const Position& p, TraceKind kind) {
    if (!in_bounds(p)) {
        return;
    }
    values_[static_cast<int>(kind)][index(p)] = 0.0;
}

double TraceField::concentration_at(const Position& p, TraceKind kind) const {
    if (!in_bounds(p)) {
        return 0.0;
    }
    return values_[static_cast<int>(kind)][index(p)];
}

bool TraceField::exists(const Position& p, TraceKind kind) const {
    return in_bounds(p) && touched_[static_cast<int>(kind)][index(p)] != 0;
}

void TraceField::decay_all(double evaporation_rate) {
    const double keep = std::max(0.0, 1.0 - evaporation_rate);
    const int cells = width_ * height_;
    for (int k = 0; k < NUM_TRACE_KINDS; k++) {
        double* values = values_[k].data();
#pragma omp parallel for schedule(static)
        for (int i = 0; i < cells; i++) {
            values[i] *= keep;
            if (values[i] <= negligible_) {
                values[i] = 0;
            }
        }
    }
}

double TraceField::total(TraceKind kind) const {
    const std::vector<double>& values = values_[static_cast<int>(kind)];
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum;
}

size_t TraceField::cell_count() const {
    size_t count = 0;
    for (int k = 0; k < NUM_TRACE_KINDS; k++) {
        count += std::count(touched_[k].begin(), touched_[k].end(), 1);
    }
    return count;
}

}  // namespace colony
