/**
 * @file basic-tour.cpp
 * @brief Shortest closed tour through points on a circle with EvoCore
 *
 * Each genotype holds one permutation chromosome of city indices. Ordered crossover and
 * inversion mutation keep every offspring a valid permutation, so the fitness function never
 * has to repair a tour. The optimum visits the cities in angular order.
 *
 * Compile with:
 *   g++ -std=c++23 -I../../include basic-tour.cpp -o basic-tour
 *
 * Run with:
 *   ./basic-tour
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <vector>

#include <evocore/evocore.hpp>

using namespace evocore;
using genes::IntGene;

namespace {

constexpr int NUM_CITIES = 24;
constexpr double RADIUS = 100.0;
constexpr double PI = 3.14159265358979323846;

struct City {
    double x;
    double y;
};

// Cities on a circle, listed in shuffled order so the identity permutation is not optimal
std::vector<City> make_cities(std::uint32_t seed) {
    std::vector<int> order(NUM_CITIES);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<City> cities;
    cities.reserve(NUM_CITIES);
    for (int slot : order) {
        const double angle = 2.0 * PI * slot / NUM_CITIES;
        cities.push_back({RADIUS * std::cos(angle), RADIUS * std::sin(angle)});
    }
    return cities;
}

double tour_length(const std::vector<City>& cities, const core::Chromosome<IntGene>& tour) {
    double length = 0.0;
    for (std::size_t i = 0; i < tour.size(); ++i) {
        const auto& from = cities[static_cast<std::size_t>(tour[i].value())];
        const auto& to = cities[static_cast<std::size_t>(tour[(i + 1) % tour.size()].value())];
        length += std::hypot(from.x - to.x, from.y - to.y);
    }
    return length;
}

core::Chromosome<IntGene> random_tour(std::mt19937& rng) {
    std::vector<int> order(NUM_CITIES);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<IntGene> genes;
    genes.reserve(order.size());
    for (int city : order) {
        genes.emplace_back(city, 0, NUM_CITIES - 1);
    }
    return core::Chromosome<IntGene>(std::move(genes));
}

} // namespace

int main() {
    std::cout << "EvoCore Basic Tour Example\n";
    std::cout << "==========================\n\n";

    const auto cities = make_cities(7);
    const double optimum = 2.0 * NUM_CITIES * RADIUS * std::sin(PI / NUM_CITIES);

    std::cout << "Problem: closed tour through " << NUM_CITIES << " cities on a circle\n";
    std::cout << "Optimal length: " << std::fixed << std::setprecision(2) << optimum << "\n\n";

    core::EngineConfig<IntGene> config;
    config.genotype_factory = core::make_genotype_factory<IntGene>({random_tour});
    config.fitness_function = [&cities](const core::Genotype<IntGene>& genotype) {
        return tour_length(cities, genotype[0]);
    };
    config.population_size = 150;
    config.survival_rate = 0.3;
    config.ranker = std::make_shared<core::MinRanker<IntGene>>();
    config.parent_selector = std::make_shared<operators::TournamentSelector<IntGene>>(4);
    config.survivor_selector = std::make_shared<operators::TournamentSelector<IntGene>>(2);
    config.alterers = {std::make_shared<operators::OrderedCrossover<IntGene>>(),
                       std::make_shared<operators::InversionMutator<IntGene>>(0.4, 1.0, 0.5),
                       std::make_shared<operators::SwapMutator<IntGene>>(0.1, 1.0, 0.05)};
    config.limits = {
        std::make_shared<limits::MaxGenerations<IntGene>>(1500),
        std::make_shared<limits::SteadyGenerations<IntGene>>(300),
        std::make_shared<limits::TargetFitness<IntGene>>(optimum + 1e-6,
                                                         limits::TargetComparison::at_most)};
    config.listeners = {std::make_shared<listeners::EvolutionPrinter<IntGene>>(100)};
    config.seed = 123;

    std::cout << "Algorithm Configuration:\n";
    std::cout << "  Population size: " << config.population_size << "\n";
    std::cout << "  Survival rate:   " << config.survival_rate << "\n";
    std::cout << "  Random seed:     " << config.seed << "\n\n";

    core::EvolutionEngine<IntGene> engine(std::move(config));

    const auto start_time = std::chrono::steady_clock::now();
    const auto result = engine.evolve();
    const auto duration =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    const auto& best = result.best();
    std::cout << "\nResults:\n";
    std::cout << "========\n";
    std::cout << "Best length:  " << std::fixed << std::setprecision(2) << best.fitness() << "\n";
    std::cout << "Gap:          " << std::setprecision(2)
              << 100.0 * (best.fitness() - optimum) / optimum << "%\n";
    std::cout << "Generations:  " << result.generation() << "\n";
    std::cout << "Runtime:      " << std::setprecision(3) << duration << " seconds\n";

    if (!best.genotype().verify()) {
        std::cout << "Solution:     Invalid genotype\n";
        return 1;
    }

    std::cout << "\nBest tour (first 10 cities): ";
    const auto& tour = best.genotype()[0];
    for (std::size_t i = 0; i < std::min<std::size_t>(10, tour.size()); ++i) {
        std::cout << tour[i].value() << (i + 1 < std::min<std::size_t>(10, tour.size()) ? " -> " : "");
    }
    std::cout << " -> ...\n";

    std::cout << "\nExample completed successfully!\n";
    return 0;
}
