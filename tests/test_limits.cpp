#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <evocore/evocore.hpp>

#include "test_helper.hpp"

using namespace evocore;
using genes::IntGene;

namespace {

core::EvolutionState<IntGene> state_with(std::size_t generation,
                                         const std::vector<double>& fitnesses,
                                         std::shared_ptr<const core::Ranker<IntGene>> ranker) {
    core::Population<IntGene> population;
    for (double f : fitnesses) {
        population.emplace_back(
            core::Genotype<IntGene>({core::Chromosome<IntGene>({IntGene(0, 0, 1)})}), f);
    }
    return core::EvolutionState<IntGene>(generation, std::move(ranker), std::move(population));
}

} // namespace

bool test_max_generations() {
    TestResult result;

    auto max = std::make_shared<core::MaxRanker<IntGene>>();
    core::EvolutionHistory history;
    limits::MaxGenerations<IntGene> limit(5);

    result.assert_true(!limit(state_with(4, {1.0}, max), history), "Generation 4 of 5 continues");
    result.assert_true(limit(state_with(5, {1.0}, max), history), "Generation 5 of 5 stops");
    result.assert_true(limit(state_with(9, {1.0}, max), history), "Later generations stop too");
    result.assert_eq(std::string("MaxGenerations(5)"), limit.name(), "Limit name");

    return result.finish();
}

bool test_target_fitness() {
    TestResult result;

    auto max = std::make_shared<core::MaxRanker<IntGene>>();
    auto min = std::make_shared<core::MinRanker<IntGene>>();
    core::EvolutionHistory history;

    limits::TargetFitness<IntGene> reach_ten(10.0, limits::TargetComparison::at_least);
    result.assert_true(!reach_ten(state_with(1, {3.0, 9.5}, max), history),
                       "Best below the target continues");
    result.assert_true(reach_ten(state_with(1, {3.0, 10.0}, max), history),
                       "Best at the target stops");

    limits::TargetFitness<IntGene> below_one(1.0, limits::TargetComparison::at_most);
    result.assert_true(below_one(state_with(1, {0.5, 8.0}, min), history),
                       "Target uses the best individual under the state's ranker");
    result.assert_true(!below_one(state_with(1, {0.5, 8.0}, max), history),
                       "Max ranker best is the largest value");

    limits::TargetFitness<IntGene> exact(4.0, limits::TargetComparison::equal_to);
    result.assert_true(exact(state_with(1, {4.0}, max), history), "Exact target matches");

    limits::TargetFitness<IntGene> custom([](double f) { return f > 100.0; }, "> 100");
    result.assert_true(custom(state_with(1, {101.0}, max), history), "Custom predicate");
    result.assert_eq(std::string("TargetFitness(> 100)"), custom.name(), "Custom predicate name");

    result.assert_true(!reach_ten(core::EvolutionState<IntGene>::empty(max), history),
                       "Empty population never reaches a target");

    result.assert_throws<core::LimitConfigError>(
        [] {
            limits::TargetFitness<IntGene>(std::numeric_limits<double>::quiet_NaN(),
                                           limits::TargetComparison::at_least);
        },
        "NaN target is rejected");
    result.assert_throws<core::LimitConfigError>(
        [] { limits::TargetFitness<IntGene>(limits::TargetFitness<IntGene>::Predicate{}); },
        "Empty predicate is rejected");

    return result.finish();
}

bool test_steady_generations() {
    TestResult result;

    auto max = std::make_shared<core::MaxRanker<IntGene>>();
    limits::SteadyGenerations<IntGene> limit(3);
    core::EvolutionHistory history;
    history.start();

    const auto stuck = state_with(1, {5.0, 2.0}, max);
    history.record(stuck, std::chrono::nanoseconds{0});
    bool fired_early = false;
    for (int i = 0; i < 2; ++i) {
        history.record(stuck, std::chrono::nanoseconds{0});
        fired_early = fired_early || limit(stuck, history);
    }
    result.assert_true(!fired_early, "Two steady generations do not fire a limit of three");
    history.record(stuck, std::chrono::nanoseconds{0});
    result.assert_true(limit(stuck, history), "Third steady generation fires");

    history.record(state_with(2, {6.0}, max), std::chrono::nanoseconds{0});
    result.assert_true(!limit(stuck, history), "Improvement resets the limit");

    result.assert_throws<core::LimitConfigError>(
        [] { limits::SteadyGenerations<IntGene>(0); }, "Zero steady generations is rejected");

    return result.finish();
}

bool test_time_limit() {
    TestResult result;

    auto max = std::make_shared<core::MaxRanker<IntGene>>();
    const auto state = state_with(1, {1.0}, max);

    core::EvolutionHistory history;
    history.start();
    limits::TimeLimit<IntGene> generous(std::chrono::hours(1));
    result.assert_true(!generous(state, history), "Fresh run is within the time limit");

    limits::TimeLimit<IntGene> short_limit(std::chrono::milliseconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    result.assert_true(short_limit(state, history), "Expired time limit fires");

    limits::TimeLimit<IntGene> zero(std::chrono::seconds(0));
    result.assert_true(zero(state, history), "Zero duration fires immediately");

    result.assert_throws<core::LimitConfigError>(
        [] { limits::TimeLimit<IntGene>(std::chrono::seconds(-1)); },
        "Negative duration is rejected");

    std::vector<limits::LimitPtr<IntGene>> limits_list = {
        std::make_shared<limits::MaxGenerations<IntGene>>(10),
        std::make_shared<limits::TimeLimit<IntGene>>(std::chrono::hours(1))};
    result.assert_true(!limits::any_limit_reached(limits_list, state, history),
                       "No limit fired yet");
    limits_list.push_back(std::make_shared<limits::MaxGenerations<IntGene>>(1));
    result.assert_true(limits::any_limit_reached(limits_list, state, history),
                       "Any single limit stops the run");

    return result.finish();
}

int main() {
    std::cout << "Running EvoCore Limit Tests\n";
    std::cout << std::string(30, '=') << "\n";

    bool ok = true;

    std::cout << "\nTest: Max generations\n";
    ok = test_max_generations() && ok;

    std::cout << "\nTest: Target fitness\n";
    ok = test_target_fitness() && ok;

    std::cout << "\nTest: Steady generations\n";
    ok = test_steady_generations() && ok;

    std::cout << "\nTest: Time limit\n";
    ok = test_time_limit() && ok;

    return ok ? 0 : 1;
}
