#include "simulation.hpp"

#include <sstream>

namespace colony {

namespace {

const SimConfig& validated(const SimConfig& config) {
    config.validate();
    return config;
}

}  // namespace

Simulation::Simulation(const SimConfig& config)
    : config_(validated(config)),
      master_rng_(config_.seed),
      grid_(config_.width, config_.height),
      field_(config_.width, config_.height, config_.max_concentration, config_.negligible_concentration),
      landmarks_(Landmarks::create(config_, master_rng_)),
      generation_(0),
      pickups_(0) {
    grid_.place(EntityRef{EntityKind::NEST, 0}, landmarks_.nest().position);
    for (size_t i = 0; i < landmarks_.morsels().size(); i++) {
        grid_.place(EntityRef{EntityKind::MORSEL, static_cast<int>(i)}, landmarks_.morsels()[i].position);
    }

    // Every agent starts in the nest
    agents_.reserve(config_.num_ants);
    agent_rngs_.reserve(config_.num_ants);
    for (int i = 0; i < config_.num_ants; i++) {
        agents_.emplace_back(i, config_.nest, config_.memory_span);
        agent_rngs_.emplace_back(config_.seed, static_cast<std::uint64_t>(i));
        grid_.place(EntityRef{EntityKind::AGENT, i}, config_.nest);
    }
    intents_.resize(agents_.size());
}

void Simulation::decide_all() {
    const Surroundings world{grid_, field_, landmarks_, config_};
    const int count = static_cast<int>(agents_.size());

#pragma omp parallel for schedule(static)
    for (int i = 0; i < count; i++) {
        intents_[i] = agents_[i].decide(world, agent_rngs_[i]);
    }
}

void Simulation::apply_all() {
    const int count = static_cast<int>(agents_.size());

    // Suppressions go first so that this generation's deposits survive them
    for (int i = 0; i < count; i++) {
        if (intents_[i].suppress) {
            field_.suppress(intents_[i].from, intents_[i].suppress_kind);
        }
    }

    for (int i = 0; i < count; i++) {
        const Intent& intent = intents_[i];
        field_.deposit(intent.from, intent.deposit_kind, intent.deposit_amount);
    }

    // Agent order settles who gets the last unit of a morsel
    for (int i = 0; i < count; i++) {
        Agent& agent = agents_[i];
        agent.commit(intents_[i]);
        grid_.move(EntityRef{EntityKind::AGENT, i}, agent.position());
        if (agent.arrive(landmarks_) == Arrival::PICKUP) {
            pickups_++;
        }
    }
}

std::uint64_t Simulation::nextgen() {
    if (is_simulation_over()) {
        std::ostringstream msg;
        msg << "simulation is already over at generation " << generation_;
        throw SimulationOverError(msg.str());
    }

    decide_all();
    apply_all();
    field_.decay_all(config_.evaporation_rate);

    return ++generation_;
}

bool Simulation::is_simulation_over() const {
    if (landmarks_.remaining_food() > 0) {
        return false;
    }
    for (const Agent& agent : agents_) {
        if (agent.is_carrying()) {
            return false;
        }
    }
    return true;
}

SimStats Simulation::stats() const {
    SimStats stats;
    stats.food_collected = landmarks_.nest().accumulated;
    stats.food_available = landmarks_.initial_food();
    stats.food_remaining = landmarks_.remaining_food();
    for (const Agent& agent : agents_) {
        if (agent.is_carrying()) {
            stats.food_in_transit++;
        }
    }
    stats.pickups = pickups_;
    stats.generation = generation_;
    return stats;
}

std::vector<EntityView> Simulation::snapshot() const {
    std::vector<EntityView> views;
    views.reserve(1 + landmarks_.morsels().size() + agents_.size());

    EntityView nest;
    nest.kind = EntityKind::NEST;
    nest.position = landmarks_.nest().position;
    nest.food = landmarks_.nest().accumulated;
    views.push_back(nest);

    const std::vector<Morsel>& morsels = landmarks_.morsels();
    for (size_t i = 0; i < morsels.size(); i++) {
        if (!morsels[i].is_active())
            continue;
        EntityView view;
        view.kind = EntityKind::MORSEL;
        view.position = morsels[i].position;
        view.index = static_cast<int>(i);
        view.food = morsels[i].remaining;
        views.push_back(view);
    }

    for (const Agent& agent : agents_) {
        EntityView view;
        view.kind = EntityKind::AGENT;
        view.position = agent.position();
        view.index = agent.id();
        view.task = agent.task();
        views.push_back(view);
    }

    field_.for_each_cell([&views](const Position& p, TraceKind kind, double concentration) {
        EntityView view;
        view.kind = EntityKind::TRACE;
        view.position = p;
        view.scent = kind;
        view.concentration = concentration;
        views.push_back(view);
    });

    return views;
}

}  // namespace colony
