/**
 * @file config-based.cpp
 * @brief Configuration-driven evolution using TOML files
 *
 * Minimises the sphere function with an engine assembled entirely from a TOML file:
 * rankers, selectors, alterers and termination criteria can all be changed without
 * recompiling.
 *
 * Compile with:
 *   g++ -std=c++23 -I../../include config-based.cpp -o config-based
 *
 * Run with:
 *   ./config-based example-config.toml
 */

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <evocore/evocore.hpp>

using namespace evocore;
using genes::DoubleGene;

namespace {

constexpr std::size_t DIMENSIONS = 8;
constexpr double BOUND = 5.12;

double sphere(const core::Genotype<DoubleGene>& genotype) {
    double sum = 0.0;
    for (const auto& gene : genotype[0]) {
        sum += gene.value() * gene.value();
    }
    return sum;
}

// Write a default configuration when none is supplied
void create_sample_config(const std::string& filename) {
    config::Config cfg;
    cfg.engine.ranker = "min";
    cfg.alterers = {config::AltererSettings{.type = "single_point"},
                    config::AltererSettings{.type = "random", .gene_rate = 0.1}};
    cfg.termination.max_generations = 300;
    cfg.termination.target_fitness = 1e-3;
    cfg.termination.target_comparison = "at_most";
    cfg.logging.verbose = true;

    std::ofstream config_file(filename);
    if (!config_file) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }
    config_file << cfg.to_toml();

    std::cout << "Created sample configuration file: " << filename << "\n";
}

void print_config_summary(const config::Config& cfg) {
    std::cout << "Configuration Summary:\n";
    std::cout << "=====================\n";
    std::cout << "Population size:    " << cfg.engine.population_size << "\n";
    std::cout << "Survival rate:      " << cfg.engine.survival_rate << "\n";
    std::cout << "Random seed:        " << cfg.engine.seed << "\n";
    std::cout << "Ranker:             " << cfg.engine.ranker << "\n";
    std::cout << "Parent selector:    " << cfg.selection.parents.type << "\n";
    std::cout << "Survivor selector:  " << cfg.selection.survivors.type << "\n";
    std::cout << "Alterers:           ";
    for (std::size_t i = 0; i < cfg.alterers.size(); ++i) {
        std::cout << (i > 0 ? ", " : "") << cfg.alterers[i].type;
    }
    std::cout << "\n";
    std::cout << "Max generations:    " << cfg.termination.max_generations << "\n";
    std::cout << "Parallel:           " << (cfg.parallel.enabled ? "Enabled" : "Disabled") << "\n";
    std::cout << "Verbose logging:    " << (cfg.logging.verbose ? "Yes" : "No") << "\n\n";
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "EvoCore Configuration-Based Example\n";
    std::cout << "===================================\n\n";

    std::string config_filename;

    if (argc < 2) {
        config_filename = "example-config.toml";
        std::cout << "No configuration file provided. Creating sample config...\n\n";
        try {
            create_sample_config(config_filename);
        } catch (const std::exception& e) {
            std::cerr << "Error creating config file: " << e.what() << "\n";
            return 1;
        }
    } else {
        config_filename = argv[1];
    }

    std::cout << "Loading configuration from: " << config_filename << "\n\n";

    config::Config cfg;
    try {
        cfg = config::Config::from_file(config_filename);
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << "\n";
        return 1;
    }

    print_config_summary(cfg);

    std::unique_ptr<core::EvolutionEngine<DoubleGene>> engine;
    try {
        auto engine_config = factory::make_engine_config<DoubleGene>(
            cfg,
            core::make_genotype_factory<DoubleGene>(
                {genes::DoubleChromosomeFactory(DIMENSIONS, -BOUND, BOUND)}),
            sphere);
        if (cfg.logging.verbose) {
            engine_config.listeners.push_back(
                std::make_shared<listeners::EvolutionPrinter<DoubleGene>>(cfg.logging.log_interval));
        }
        engine = std::make_unique<core::EvolutionEngine<DoubleGene>>(std::move(engine_config));
    } catch (const std::exception& e) {
        std::cerr << "Error building the engine: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Starting evolution with configured parameters...\n\n";

    const auto start_time = std::chrono::steady_clock::now();
    const auto result = engine->evolve();
    const auto duration =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    std::cout << "\nEvolution Results:\n";
    std::cout << "=================\n";
    std::cout << "Best fitness:     " << std::scientific << std::setprecision(4)
              << result.best().fitness() << "\n";
    std::cout << "Generations:      " << result.generation() << "\n";
    std::cout << "Runtime:          " << std::fixed << std::setprecision(3) << duration
              << " seconds\n";

    const auto& history = engine->history().generations();
    if (cfg.logging.verbose && !history.empty()) {
        std::cout << "\nEvolution History (last 10 generations):\n";
        std::cout << "========================================\n";
        std::cout << std::setw(10) << "Gen" << std::setw(15) << "Best Fitness" << std::setw(15)
                  << "Mean Fitness" << std::setw(12) << "Steady\n";
        std::cout << std::string(52, '-') << "\n";

        const std::size_t start_idx = history.size() > 10 ? history.size() - 10 : 0;
        for (std::size_t i = start_idx; i < history.size(); ++i) {
            const auto& record = history[i];
            std::cout << std::setw(10) << record.generation << std::setw(15) << std::scientific
                      << std::setprecision(3) << record.best_fitness << std::setw(15)
                      << record.mean_fitness << std::setw(12) << record.steady_generations << "\n";
        }
    }

    std::cout << "\nConfiguration-based evolution completed successfully!\n";
    std::cout << "\nTo experiment with different settings:\n";
    std::cout << "1. Edit " << config_filename << "\n";
    std::cout << "2. Run: ./config-based " << config_filename << "\n";

    return 0;
}
