#include <omp.h>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>

#include "../common/config.hpp"
#include "../common/simulation.hpp"

// Generation ceiling enforced by this runner; the engine itself has none.
#define MAX_GENERATIONS 150000
#define PROGRESS_INTERVAL 1000

using colony::SimConfig;
using colony::SimStats;
using colony::Simulation;

namespace {

// Runs to completion or to the ceiling. Returns false on timeout.
bool run(Simulation& simulation, std::uint64_t max_generations) {
    auto start_time = std::chrono::high_resolution_clock::now();

    while (!simulation.is_simulation_over() && simulation.generation() < max_generations) {
        std::uint64_t generation = simulation.nextgen();

        if (generation % PROGRESS_INTERVAL == 0) {
            SimStats stats = simulation.stats();
            std::cout << "Generation " << generation << ": Collected " << stats.food_collected << "/"
                      << stats.food_available << " food, " << stats.food_in_transit << " in transit"
                      << std::endl;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    SimStats stats = simulation.stats();

    if (!simulation.is_simulation_over()) {
        std::cerr << "Timeout: simulation not over after " << stats.generation << " generations ("
                  << stats.food_collected << "/" << stats.food_available << " food collected)" << std::endl;
        return false;
    }

    std::cout << "\n=== Simulation Complete (OpenMP Version) ===" << std::endl;
    std::cout << "Total generations: " << stats.generation << std::endl;
    std::cout << "Food collected: " << stats.food_collected << "/" << stats.food_available << std::endl;
    std::cout << "Execution time: " << duration.count() << " ms" << std::endl;
    if (stats.generation > 0) {
        std::cout << "Time per generation: " << (double)duration.count() / stats.generation << " ms"
                  << std::endl;
    }
    return true;
}

}  // namespace

// Usage: colony_headless [seed] [threads] [ants] [max_generations]
int main(int argc, char* argv[]) {
    SimConfig config;
    int num_threads = omp_get_max_threads();
    std::uint64_t max_generations = MAX_GENERATIONS;

    if (argc > 1) {
        config.seed = std::strtoull(argv[1], nullptr, 10);
    }
    if (argc > 2) {
        num_threads = std::atoi(argv[2]);
        if (num_threads > 0)
            omp_set_num_threads(num_threads);
    }
    if (argc > 3) {
        config.num_ants = std::atoi(argv[3]);
    }
    if (argc > 4) {
        max_generations = std::strtoull(argv[4], nullptr, 10);
    }

    std::cout << "=== Ant Colony Simulation (OpenMP Version) ===" << std::endl;
    std::cout << "Grid size: " << config.width << " x " << config.height << std::endl;
    std::cout << "Nest: (" << config.nest.x << ", " << config.nest.y << ")" << std::endl;
    std::cout << "Number of ants: " << config.num_ants << std::endl;
    std::cout << "Number of morsels: " << config.morsel_count() << std::endl;
    std::cout << "Food per morsel: " << config.morsel_food << std::endl;
    std::cout << "Evaporation rate: " << config.evaporation_rate << std::endl;
    std::cout << "Deposit law: " << colony::to_string(config.deposit_law) << std::endl;
    std::cout << "Number of threads: " << num_threads << std::endl;
    std::cout << "Random seed: " << config.seed << std::endl;
    std::cout << "=============================================\n" << std::endl;

    try {
        Simulation simulation(config);
        if (!run(simulation, max_generations)) {
            return 2;
        }
    } catch (const colony::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
