#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include "../common/config.hpp"
#include "../common/simulation.hpp"

// Maximum number of generations before a run is reported as a timeout
#define MAX_GENERATIONS 150000

using colony::SimConfig;
using colony::Simulation;

// Runs the same environment for a range of colony sizes and reports the
// generation at which each run finished.
//
// Usage: colony_sweep [seed] [min_ants] [max_ants] [step] [max_generations]
int main(int argc, char* argv[]) {
    SimConfig config;
    int min_ants = 10;
    int max_ants = 150;
    int step = 5;
    std::uint64_t max_generations = MAX_GENERATIONS;

    if (argc > 1)
        config.seed = std::strtoull(argv[1], nullptr, 10);
    if (argc > 2)
        min_ants = std::atoi(argv[2]);
    if (argc > 3)
        max_ants = std::atoi(argv[3]);
    if (argc > 4)
        step = std::atoi(argv[4]);
    if (argc > 5)
        max_generations = std::strtoull(argv[5], nullptr, 10);

    if (min_ants <= 0 || max_ants < min_ants || step <= 0) {
        std::cerr << "Invalid ant range: " << min_ants << ".." << max_ants << " step " << step << std::endl;
        return 1;
    }

    std::cout << "=== Ant Colony Simulation (Sweep) ===" << std::endl;
    std::cout << "Grid size: " << config.width << " x " << config.height << std::endl;
    std::cout << "Morsels: " << config.morsel_count() << " x " << config.morsel_food << " food" << std::endl;
    std::cout << "Ants: " << min_ants << " to " << max_ants << " step " << step << std::endl;
    std::cout << "Random seed: " << config.seed << std::endl;
    std::cout << "=====================================\n" << std::endl;

    int timeouts = 0;
    for (int count = min_ants; count <= max_ants; count += step) {
        config.num_ants = count;

        auto start_time = std::chrono::high_resolution_clock::now();
        try {
            Simulation simulation(config);
            while (!simulation.is_simulation_over() && simulation.generation() < max_generations) {
                simulation.nextgen();
            }

            auto end_time = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

            if (simulation.is_simulation_over()) {
                std::cout << "Simulation over after " << simulation.generation() << " generations with " << count
                          << " ants (" << duration.count() << " ms)" << std::endl;
            } else {
                std::cerr << "Timeout with " << count << " ants!" << std::endl;
                timeouts++;
            }
        } catch (const colony::ConfigurationError& e) {
            std::cerr << "Invalid configuration: " << e.what() << std::endl;
            return 1;
        }
    }

    return timeouts > 0 ? 2 : 0;
}
