/**
 * @file parallel-evaluation.cpp
 * @brief Parallel fitness evaluation with the oneTBB-backed evaluator
 *
 * Evaluates one population of Rastrigin genotypes sequentially and in parallel, checks that
 * both produce the same fitness values in the same order, then runs two seeded engines that
 * differ only in their evaluator and compares the final populations.
 *
 * Compile with TBB:
 *   g++ -std=c++23 -DEVOCORE_HAVE_TBB -I../../include parallel-evaluation.cpp -ltbb \
 *       -o parallel-evaluation
 *
 * Run with:
 *   ./parallel-evaluation
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <thread>

#include <evocore/evocore.hpp>
#ifdef EVOCORE_HAVE_TBB
#include <evocore/parallel/tbb_evaluator.hpp>
#endif

using namespace evocore;
using genes::DoubleGene;

namespace {

constexpr std::size_t DIMENSIONS = 200;
constexpr double BOUND = 5.12;
constexpr double PI = 3.14159265358979323846;

double rastrigin(const core::Genotype<DoubleGene>& genotype) {
    double sum = 10.0 * static_cast<double>(genotype[0].size());
    for (const auto& gene : genotype[0]) {
        const double x = gene.value();
        sum += x * x - 10.0 * std::cos(2.0 * PI * x);
    }
    return sum;
}

core::EngineConfig<DoubleGene> rastrigin_config(std::uint64_t seed) {
    core::EngineConfig<DoubleGene> config;
    config.genotype_factory = core::make_genotype_factory<DoubleGene>(
        {genes::DoubleChromosomeFactory(DIMENSIONS, -BOUND, BOUND)});
    config.fitness_function = rastrigin;
    config.population_size = 200;
    config.ranker = std::make_shared<core::MinRanker<DoubleGene>>();
    config.alterers = {std::make_shared<operators::MultiPointCrossover<DoubleGene>>(4),
                       std::make_shared<operators::RandomMutator<DoubleGene>>(0.3, 1.0, 0.02)};
    config.limits = {std::make_shared<limits::MaxGenerations<DoubleGene>>(50)};
    config.seed = seed;
    return config;
}

} // namespace

int main() {
    std::cout << "EvoCore Parallel Evaluation Example\n";
    std::cout << "===================================\n\n";

#ifdef EVOCORE_HAVE_TBB
    std::cout << "oneTBB: Available\n";
#else
    std::cout << "oneTBB: Not available\n";
    std::cout << "This example requires oneTBB for parallel evaluation.\n";
    std::cout << "Please install TBB and rebuild with -DEVOCORE_USE_TBB=ON\n";
    return 1;
#endif

#ifdef EVOCORE_HAVE_TBB
    constexpr std::size_t population_size = 5000;

    std::mt19937 rng(456);
    const genes::DoubleChromosomeFactory factory(DIMENSIONS, -BOUND, BOUND);
    core::Population<DoubleGene> population;
    population.reserve(population_size);
    for (std::size_t i = 0; i < population_size; ++i) {
        population.emplace_back(core::Genotype<DoubleGene>({factory(rng)}));
    }
    const core::EvolutionState<DoubleGene> state(
        0, std::make_shared<core::MinRanker<DoubleGene>>(), std::move(population));

    std::cout << "Problem setup:\n";
    std::cout << "  Rastrigin dimensions: " << DIMENSIONS << "\n";
    std::cout << "  Population:           " << population_size << "\n";
    std::cout << "  Hardware threads:     " << std::thread::hardware_concurrency() << "\n\n";

    const evaluation::SequentialEvaluator<DoubleGene> sequential(rastrigin);
    const parallel::TbbEvaluator<DoubleGene> tbb_evaluator(rastrigin);

    std::cout << "Sequential evaluation...\n";
    const auto start_seq = std::chrono::steady_clock::now();
    const auto sequential_state = sequential(state);
    const auto seq_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_seq).count();

    std::cout << "Parallel evaluation...\n";
    const auto start_par = std::chrono::steady_clock::now();
    const auto parallel_state = tbb_evaluator(state);
    const auto par_time =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_par).count();

    std::cout << "\nPerformance Results:\n";
    std::cout << "===================\n";
    std::cout << "Sequential time: " << std::fixed << std::setprecision(3) << seq_time
              << " seconds\n";
    std::cout << "Parallel time:   " << std::fixed << std::setprecision(3) << par_time
              << " seconds\n";
    if (par_time > 0) {
        std::cout << "Speedup:         " << std::fixed << std::setprecision(2)
                  << seq_time / par_time << "x\n";
    }

    const bool results_match = sequential_state.population() == parallel_state.population();
    std::cout << "\nCorrectness Verification:\n";
    std::cout << "========================\n";
    std::cout << "Results identical: " << (results_match ? "Yes" : "No") << "\n";
    if (!results_match) {
        std::cout << "ERROR: Parallel and sequential results differ!\n";
        return 1;
    }

    std::cout << "\nSeeded engine runs:\n";
    std::cout << "==================\n";
    core::EvolutionEngine<DoubleGene> sequential_engine(rastrigin_config(789));

    auto parallel_config = rastrigin_config(789);
    parallel_config.evaluator = std::make_shared<parallel::TbbEvaluator<DoubleGene>>(rastrigin);
    core::EvolutionEngine<DoubleGene> parallel_engine(std::move(parallel_config));

    const auto sequential_result = sequential_engine.evolve();
    const auto parallel_result = parallel_engine.evolve();

    std::cout << "Sequential best: " << std::setprecision(4) << sequential_result.best().fitness()
              << "\n";
    std::cout << "Parallel best:   " << std::setprecision(4) << parallel_result.best().fitness()
              << "\n";

    const bool deterministic = sequential_result.population() == parallel_result.population();
    std::cout << "Final populations identical: " << (deterministic ? "Yes" : "No") << "\n";
    if (!deterministic) {
        std::cout << "ERROR: The evaluator changed the course of a seeded run!\n";
        return 1;
    }

    std::cout << "\nExample completed successfully!\n";
    return 0;
#endif
}
