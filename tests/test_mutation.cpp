#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <evocore/evocore.hpp>

#include "test_helper.hpp"

using namespace evocore;
using genes::BoolGene;
using genes::IntGene;

namespace {

core::Individual<IntGene> permutation_individual(int n, double fitness) {
    std::vector<IntGene> genes;
    for (int i = 0; i < n; ++i) {
        genes.emplace_back(i, 0, n - 1);
    }
    return core::Individual<IntGene>(
        core::Genotype<IntGene>({core::Chromosome<IntGene>(std::move(genes))}), fitness);
}

core::EvolutionState<IntGene> permutation_state(std::size_t count, int n) {
    core::Population<IntGene> population;
    for (std::size_t i = 0; i < count; ++i) {
        population.push_back(permutation_individual(n, static_cast<double>(i)));
    }
    return core::EvolutionState<IntGene>(0, std::make_shared<core::MaxRanker<IntGene>>(),
                                         std::move(population));
}

core::EvolutionState<BoolGene> bool_state(std::size_t count, std::size_t bits, bool value) {
    core::Population<BoolGene> population;
    for (std::size_t i = 0; i < count; ++i) {
        std::vector<BoolGene> genes(bits, BoolGene(value));
        population.emplace_back(
            core::Genotype<BoolGene>({core::Chromosome<BoolGene>(std::move(genes))}), 1.0);
    }
    return core::EvolutionState<BoolGene>(0, std::make_shared<core::MaxRanker<BoolGene>>(),
                                          std::move(population));
}

bool is_permutation_of_range(const core::Chromosome<IntGene>& chromosome) {
    auto values = chromosome.values();
    std::sort(values.begin(), values.end());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i] != static_cast<int>(i)) {
            return false;
        }
    }
    return true;
}

} // namespace

bool test_mutator_rates() {
    TestResult result;
    std::mt19937 rng(1);

    const auto state = permutation_state(20, 8);

    operators::SwapMutator<IntGene> never(0.0, 1.0, 1.0);
    const auto untouched = never(state, state.size(), rng);
    bool shared = true;
    for (std::size_t i = 0; i < state.size(); ++i) {
        shared = shared && untouched.population()[i].shared_genotype() ==
                               state.population()[i].shared_genotype();
        shared = shared && untouched.population()[i].is_evaluated();
    }
    result.assert_true(shared, "Unselected individuals keep their genotype and fitness");

    operators::RandomMutator<IntGene> no_chromosome(1.0, 0.0, 1.0);
    const auto same = no_chromosome(state, state.size(), rng);
    result.assert_true(same.population()[0].shared_genotype() ==
                           state.population()[0].shared_genotype(),
                       "Individuals with no mutated chromosome are returned unchanged");

    operators::RandomMutator<IntGene> always(1.0, 1.0, 1.0);
    const auto mutated = always(state, state.size(), rng);
    bool all_fresh = true;
    for (const auto& individual : mutated.population()) {
        all_fresh = all_fresh && !individual.is_evaluated() && individual.genotype().verify();
    }
    result.assert_true(all_fresh, "Mutated individuals are unevaluated and valid");
    result.assert_true(state.population()[0].is_evaluated(), "Input population is unchanged");

    result.assert_throws<core::MutatorConfigError>(
        [] { operators::SwapMutator<IntGene>(1.5, 0.5, 0.5); }, "Individual rate above 1 throws");
    result.assert_throws<core::MutatorConfigError>(
        [] { operators::RandomMutator<IntGene>(0.5, -0.1, 0.5); }, "Negative chromosome rate throws");
    result.assert_throws<core::MutatorConfigError>(
        [] { operators::BitFlipMutator<BoolGene>(0.5, 0.5, 2.0); }, "Gene rate above 1 throws");
    result.assert_throws<core::InvariantViolation>(
        [&] { (void)always(state, state.size() + 1, rng); },
        "Output size mismatch is an invariant violation");

    return result.finish();
}

bool test_bit_flip() {
    TestResult result;
    std::mt19937 rng(2);

    const auto zeros = bool_state(5, 16, false);
    operators::BitFlipMutator<BoolGene> flip_all(1.0, 1.0, 1.0);
    const auto ones = flip_all(zeros, zeros.size(), rng);
    bool all_set = true;
    for (const auto& individual : ones.population()) {
        all_set = all_set && genes::to_bit_string(individual.genotype()[0]) == std::string(16, '1');
    }
    result.assert_true(all_set, "Bit flip with every rate at 1 negates every gene");

    operators::BitFlipMutator<BoolGene> sparse(1.0, 1.0, 0.25);
    const auto partial = sparse(bool_state(200, 16, false), 200, rng);
    std::size_t set_bits = 0;
    for (const auto& individual : partial.population()) {
        for (const auto& gene : individual.genotype()[0]) {
            set_bits += gene.value() ? 1 : 0;
        }
    }
    const double share = static_cast<double>(set_bits) / (200.0 * 16.0);
    result.assert_true(share > 0.2 && share < 0.3,
                       "Gene rate controls the share of flipped bits (" + std::to_string(share) +
                           ")");

    return result.finish();
}

bool test_order_preserving_mutators() {
    TestResult result;
    std::mt19937 rng(3);

    const auto state = permutation_state(50, 12);

    operators::SwapMutator<IntGene> swap(1.0, 1.0, 0.5);
    operators::InversionMutator<IntGene> inversion(1.0, 1.0, 0.5);
    operators::PartialShuffleMutator<IntGene> shuffle;

    bool swap_ok = true;
    bool inversion_ok = true;
    bool shuffle_ok = true;
    bool any_changed = false;
    for (const auto& individual : swap(state, state.size(), rng).population()) {
        swap_ok = swap_ok && is_permutation_of_range(individual.genotype()[0]);
        any_changed = any_changed || individual.genotype()[0].values() !=
                                         state.population()[0].genotype()[0].values();
    }
    for (const auto& individual : inversion(state, state.size(), rng).population()) {
        inversion_ok = inversion_ok && is_permutation_of_range(individual.genotype()[0]);
    }
    for (const auto& individual : shuffle(state, state.size(), rng).population()) {
        shuffle_ok = shuffle_ok && is_permutation_of_range(individual.genotype()[0]);
    }
    result.assert_true(swap_ok, "Swap mutation preserves the gene multiset");
    result.assert_true(any_changed, "Swap mutation reorders genes");
    result.assert_true(inversion_ok, "Inversion preserves the gene multiset");
    result.assert_true(shuffle_ok, "Partial shuffle preserves the gene multiset");

    // A reversed segment is contiguous: values outside it stay in place
    const auto inverted = inversion.mutate_chromosome(state.population()[0].genotype()[0], rng);
    const auto values = inverted.values();
    std::size_t first = 0;
    while (first < values.size() && values[first] == static_cast<int>(first)) {
        ++first;
    }
    std::size_t last = values.size();
    while (last > first && values[last - 1] == static_cast<int>(last - 1)) {
        --last;
    }
    bool descending = true;
    for (std::size_t i = first; i + 1 < last; ++i) {
        descending = descending && values[i] > values[i + 1];
    }
    result.assert_true(descending, "Inversion reverses one contiguous segment");

    operators::InversionMutator<IntGene> no_boundary(1.0, 1.0, 0.0);
    const auto unchanged = no_boundary.mutate_chromosome(state.population()[0].genotype()[0], rng);
    result.assert_true(unchanged == state.population()[0].genotype()[0],
                       "Boundary probability 0 leaves chromosomes unchanged");

    const auto single = permutation_state(3, 1);
    result.assert_true(inversion.mutate_chromosome(single.population()[0].genotype()[0], rng) ==
                           single.population()[0].genotype()[0],
                       "Single-gene chromosomes are left alone");

    std::size_t size = 10;
    bool segments_ok = true;
    for (int i = 0; i < 1000; ++i) {
        const auto [start, end] = operators::detail::pick_segment(size, 0.3, rng);
        segments_ok = segments_ok && start <= end && end < size;
    }
    result.assert_true(segments_ok, "Picked segments are ordered and in range");

    return result.finish();
}

bool test_alterer_pipeline() {
    TestResult result;
    std::mt19937 rng(4);

    const auto zeros = bool_state(6, 4, false);
    std::vector<operators::AltererPtr<BoolGene>> none;
    const auto passthrough = operators::alter(none, zeros, zeros.size(), rng);
    result.assert_true(passthrough.population() == zeros.population(),
                       "Empty alterer list returns the input unchanged");

    std::vector<operators::AltererPtr<BoolGene>> twice = {
        std::make_shared<operators::BitFlipMutator<BoolGene>>(1.0, 1.0, 1.0),
        std::make_shared<operators::BitFlipMutator<BoolGene>>(1.0, 1.0, 1.0)};
    const auto back = operators::alter(twice, zeros, zeros.size(), rng);
    bool restored = true;
    for (const auto& individual : back.population()) {
        restored = restored && genes::to_bit_string(individual.genotype()[0]) == "0000";
    }
    result.assert_true(restored, "Alterers are applied in order");
    result.assert_eq(zeros.size(), back.size(), "Pipeline keeps the population size");

    return result.finish();
}

int main() {
    std::cout << "Running EvoCore Mutation Tests\n";
    std::cout << std::string(30, '=') << "\n";

    bool ok = true;

    std::cout << "\nTest: Mutation rates\n";
    ok = test_mutator_rates() && ok;

    std::cout << "\nTest: Bit flip mutation\n";
    ok = test_bit_flip() && ok;

    std::cout << "\nTest: Order-preserving mutators\n";
    ok = test_order_preserving_mutators() && ok;

    std::cout << "\nTest: Alterer pipeline\n";
    ok = test_alterer_pipeline() && ok;

    return ok ? 0 : 1;
}
