#include <atomic>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <evocore/evocore.hpp>
#include <evocore/parallel/tbb_evaluator.hpp>

#include "test_helper.hpp"

using namespace evocore;
using genes::DoubleGene;

namespace {

double sphere(const core::Genotype<DoubleGene>& genotype) {
    double sum = 0.0;
    for (const auto& gene : genotype[0]) {
        sum += gene.value() * gene.value();
    }
    return sum;
}

core::EvolutionState<DoubleGene> random_state(std::size_t size, std::mt19937& rng) {
    genes::DoubleChromosomeFactory factory(16, -5.0, 5.0);
    core::Population<DoubleGene> population;
    for (std::size_t i = 0; i < size; ++i) {
        population.emplace_back(core::Genotype<DoubleGene>({factory(rng)}));
    }
    return core::EvolutionState<DoubleGene>(0, std::make_shared<core::MinRanker<DoubleGene>>(),
                                            std::move(population));
}

} // namespace

bool test_evaluators_agree() {
    TestResult result;
    std::mt19937 rng(17);

    const auto state = random_state(500, rng);
    evaluation::SequentialEvaluator<DoubleGene> sequential(sphere);
    parallel::TbbEvaluator<DoubleGene> tbb_evaluator(sphere);

    const auto expected = sequential(state);
    const auto actual = tbb_evaluator(state);
    result.assert_eq(expected.size(), actual.size(), "Parallel evaluation keeps the size");
    result.assert_true(expected.population() == actual.population(),
                       "Parallel and sequential fitness agree in population order");

    return result.finish();
}

bool test_skips_evaluated() {
    TestResult result;
    std::mt19937 rng(18);

    auto calls = std::make_shared<std::atomic<int>>(0);
    parallel::TbbEvaluator<DoubleGene> counting([calls](const core::Genotype<DoubleGene>& g) {
        calls->fetch_add(1);
        return sphere(g);
    });

    const auto once = counting(random_state(100, rng));
    result.assert_eq(100, calls->load(), "Every unevaluated individual is evaluated once");

    const auto twice = counting(once);
    result.assert_eq(100, calls->load(), "Evaluated individuals are skipped");
    result.assert_true(twice.population() == once.population(), "Skipping keeps the population");

    (void)counting.evaluate(once, true);
    result.assert_eq(200, calls->load(), "force re-evaluates every individual");

    return result.finish();
}

bool test_errors_propagate() {
    TestResult result;
    std::mt19937 rng(19);

    parallel::TbbEvaluator<DoubleGene> failing([](const core::Genotype<DoubleGene>&) -> double {
        throw std::runtime_error("fitness failure");
    });
    const auto state = random_state(50, rng);
    result.assert_throws<std::runtime_error>([&] { (void)failing(state); },
                                             "Fitness exceptions propagate");
    result.assert_true(!state.population()[0].is_evaluated(), "Input state is left untouched");

    parallel::TbbEvaluator<DoubleGene> nan_fitness(
        [](const core::Genotype<DoubleGene>&) { return std::nan(""); });
    result.assert_throws<core::InvariantViolation>([&] { (void)nan_fitness(state); },
                                                   "NaN fitness is rejected");

    result.assert_throws<core::EngineConfigError>(
        [] { (void)parallel::TbbEvaluator<DoubleGene>(nullptr); }, "A fitness function is required");

    return result.finish();
}

bool test_parallel_engine() {
    TestResult result;

    const auto run = [](bool parallel_evaluation) {
        core::EngineConfig<DoubleGene> config;
        config.genotype_factory = core::make_genotype_factory<DoubleGene>(
            {genes::DoubleChromosomeFactory(16, -5.0, 5.0)});
        config.fitness_function = sphere;
        config.population_size = 80;
        config.ranker = std::make_shared<core::MinRanker<DoubleGene>>();
        config.alterers = {std::make_shared<operators::SinglePointCrossover<DoubleGene>>(),
                           std::make_shared<operators::RandomMutator<DoubleGene>>(0.3, 1.0, 0.1)};
        config.limits = {std::make_shared<limits::MaxGenerations<DoubleGene>>(30)};
        config.seed = 99;
        if (parallel_evaluation) {
            config.evaluator = std::make_shared<parallel::TbbEvaluator<DoubleGene>>(sphere);
        }
        core::EvolutionEngine<DoubleGene> engine(std::move(config));
        return engine.evolve();
    };

    const auto sequential = run(false);
    const auto parallel_run = run(true);
    result.assert_true(sequential.population() == parallel_run.population(),
                       "Parallel evaluation does not change a seeded run");
    result.assert_lt(parallel_run.best().fitness(), 16.0 * 25.0 / 3.0,
                     "Evolution improves on the random expectation");

    return result.finish();
}

int main() {
    std::cout << "Running EvoCore Parallel Evaluation Tests\n";
    std::cout << std::string(30, '=') << "\n";

    bool ok = true;

    std::cout << "\nTest: Sequential and TBB evaluators agree\n";
    ok = test_evaluators_agree() && ok;

    std::cout << "\nTest: Evaluated individuals are skipped\n";
    ok = test_skips_evaluated() && ok;

    std::cout << "\nTest: Error propagation\n";
    ok = test_errors_propagate() && ok;

    std::cout << "\nTest: Parallel engine run\n";
    ok = test_parallel_engine() && ok;

    return ok ? 0 : 1;
}
