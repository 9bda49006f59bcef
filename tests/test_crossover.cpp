#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <evocore/evocore.hpp>

#include "test_helper.hpp"

using namespace evocore;
using genes::IntGene;

namespace {

std::vector<IntGene> int_genes(const std::vector<int>& values) {
    std::vector<IntGene> genes;
    for (int v : values) {
        genes.emplace_back(v, -100, 100);
    }
    return genes;
}

std::vector<int> values_of(const std::vector<IntGene>& genes) {
    std::vector<int> values;
    for (const auto& gene : genes) {
        values.push_back(gene.value());
    }
    return values;
}

core::Genotype<IntGene> genotype_of(const std::vector<std::vector<int>>& chromosomes) {
    std::vector<core::Chromosome<IntGene>> result;
    for (const auto& values : chromosomes) {
        result.emplace_back(int_genes(values));
    }
    return core::Genotype<IntGene>(std::move(result));
}

core::EvolutionState<IntGene> state_of(const std::vector<core::Genotype<IntGene>>& genotypes) {
    core::Population<IntGene> population;
    for (const auto& genotype : genotypes) {
        population.emplace_back(genotype, 1.0);
    }
    return core::EvolutionState<IntGene>(3, std::make_shared<core::MaxRanker<IntGene>>(),
                                         std::move(population));
}

std::vector<int> range(int from, int to) {
    std::vector<int> values;
    for (int i = from; i < to; ++i) {
        values.push_back(i);
    }
    return values;
}

} // namespace

bool test_fixed_cut_points() {
    TestResult result;

    const auto a = int_genes({0, 1, 2, 3});
    const auto b = int_genes({4, 5, 6, 7});

    auto [first, second] = operators::SinglePointCrossover<IntGene>::crossover_at(2, a, b);
    result.assert_true(values_of(first) == std::vector<int>{0, 1, 6, 7},
                       "Single point: first child takes the second tail");
    result.assert_true(values_of(second) == std::vector<int>{4, 5, 2, 3},
                       "Single point: second child takes the first tail");

    auto [same_a, same_b] = operators::SinglePointCrossover<IntGene>::crossover_at(4, a, b);
    result.assert_true(same_a == a && same_b == b, "Cut at the end copies the parents");
    result.assert_throws<core::CrossoverError>(
        [&] { (void)operators::SinglePointCrossover<IntGene>::crossover_at(5, a, b); },
        "Cut beyond the length throws");
    result.assert_throws<core::CrossoverError>(
        [&] {
            (void)operators::SinglePointCrossover<IntGene>::crossover_at(1, a, int_genes({1}));
        },
        "Parents of different length throw");

    auto [m1, m2] = operators::MultiPointCrossover<IntGene>::crossover_at({1, 3}, a, b);
    result.assert_true(values_of(m1) == std::vector<int>{0, 5, 6, 3},
                       "Multi point alternates segments");
    result.assert_true(values_of(m2) == std::vector<int>{4, 1, 2, 7},
                       "Multi point second child mirrors the first");

    const auto donor = int_genes(range(0, 8));
    const auto filler = int_genes({7, 6, 5, 4, 3, 2, 1, 0});
    const auto child = operators::OrderedCrossover<IntGene>::exchange_segment(donor, filler, 2, 4);
    result.assert_true(values_of(child) == std::vector<int>{7, 6, 2, 3, 4, 5, 1, 0},
                       "Ordered crossover keeps the segment in place and fills in order");
    result.assert_throws<core::CrossoverError>(
        [&] { (void)operators::OrderedCrossover<IntGene>::exchange_segment(donor, filler, 3, 8); },
        "Segment outside the chromosome throws");

    return result.finish();
}

bool test_conservation() {
    TestResult result;
    std::mt19937 rng(9);

    const auto p1 = genotype_of({range(0, 10), range(0, 5)});
    const auto p2 = genotype_of({range(100 - 10, 100), range(50, 55)});
    const std::vector<const core::Genotype<IntGene>*> parents = {&p1, &p2};

    operators::SinglePointCrossover<IntGene> single;
    operators::MultiPointCrossover<IntGene> multi(3);

    bool conserved = true;
    for (int round = 0; round < 200; ++round) {
        for (const operators::Crossover<IntGene>* crossover :
             {static_cast<const operators::Crossover<IntGene>*>(&single),
              static_cast<const operators::Crossover<IntGene>*>(&multi)}) {
            const auto children = crossover->crossover(parents, rng);
            conserved = conserved && children.size() == 2;
            for (std::size_t j = 0; j < p1.size(); ++j) {
                for (std::size_t i = 0; i < p1[j].size(); ++i) {
                    std::vector<int> before = {p1[j][i].value(), p2[j][i].value()};
                    std::vector<int> after = {children[0][j][i].value(),
                                              children[1][j][i].value()};
                    std::sort(before.begin(), before.end());
                    std::sort(after.begin(), after.end());
                    conserved = conserved && before == after;
                }
            }
        }
    }
    result.assert_true(conserved, "Crossovers redistribute parent genes position by position");

    operators::SinglePointCrossover<IntGene> never(0.0);
    const auto copies = never.crossover(parents, rng);
    result.assert_true(copies[0] == p1 && copies[1] == p2,
                       "Unpicked chromosomes are inherited from parent k mod num_parents");

    result.assert_throws<core::CrossoverError>(
        [&] { (void)single.crossover({&p1}, rng); }, "Wrong number of parents throws");
    const auto short_genotype = genotype_of({range(0, 10)});
    result.assert_throws<core::CrossoverError>(
        [&] { (void)single.crossover({&p1, &short_genotype}, rng); },
        "Parents with different chromosome counts throw");

    operators::MultiPointCrossover<IntGene> too_many(20);
    result.assert_throws<core::CrossoverError>(
        [&] { (void)too_many.crossover(parents, rng); }, "More cut points than genes throws");
    result.assert_throws<core::CrossoverError>(
        [] { operators::MultiPointCrossover<IntGene>(0); }, "Zero cut points is rejected");
    result.assert_throws<core::CrossoverError>(
        [] { operators::SinglePointCrossover<IntGene>(1.5); }, "Chromosome rate above 1 is rejected");

    return result.finish();
}

bool test_ordered_crossover() {
    TestResult result;
    std::mt19937 rng(10);

    const auto p1 = genotype_of({range(0, 12)});
    auto reversed = range(0, 12);
    std::reverse(reversed.begin(), reversed.end());
    const auto p2 = genotype_of({reversed});

    operators::OrderedCrossover<IntGene> ordered;
    bool permutations = true;
    for (int round = 0; round < 200; ++round) {
        for (const auto& child : ordered.crossover({&p1, &p2}, rng)) {
            auto values = child[0].values();
            std::sort(values.begin(), values.end());
            permutations = permutations && values == range(0, 12);
        }
    }
    result.assert_true(permutations, "Ordered crossover always yields permutations");

    const auto duplicated = genotype_of({{1, 1, 2, 3}});
    const auto valid = genotype_of({{0, 1, 2, 3}});
    result.assert_throws<core::CrossoverError>(
        [&] { (void)ordered.crossover({&duplicated, &valid}, rng); },
        "Ordered crossover rejects repeated genes");

    return result.finish();
}

bool test_mapped_and_position_crossovers() {
    TestResult result;
    std::mt19937 rng(12);

    using PMX = operators::PartiallyMappedCrossover<IntGene>;
    using PBX = operators::PositionBasedCrossover<IntGene>;

    const auto a = int_genes(range(0, 8));
    const auto b = int_genes({7, 6, 5, 4, 3, 2, 1, 0});

    result.assert_true(values_of(PMX::map_region(a, b, 2, 5)) ==
                           std::vector<int>{0, 1, 5, 4, 3, 2, 6, 7},
                       "PMX takes the region from the donor and remaps the conflicting gene");
    result.assert_true(values_of(PMX::map_region(b, a, 2, 5)) ==
                           std::vector<int>{7, 6, 2, 3, 4, 5, 1, 0},
                       "PMX second child mirrors the first");
    result.assert_true(PMX::map_region(a, b, 0, 8) == b, "A full region copies the donor");
    result.assert_true(PMX::map_region(a, b, 3, 3) == a, "An empty region copies the keeper");
    result.assert_throws<core::CrossoverError>([&] { (void)PMX::map_region(a, b, 4, 9); },
                                               "PMX region outside the chromosome throws");

    const std::vector<bool> mask{false, true, false, false, true, false, true, false};
    result.assert_true(values_of(PBX::keep_positions(a, b, mask)) ==
                           std::vector<int>{7, 1, 5, 3, 4, 2, 6, 0},
                       "PBX keeps the masked genes and fills in the other parent's order");
    result.assert_true(PBX::keep_positions(a, b, std::vector<bool>(8, true)) == a,
                       "Keeping every position copies the keeper");
    result.assert_true(PBX::keep_positions(a, b, std::vector<bool>(8, false)) == b,
                       "Keeping no position copies the filler");
    result.assert_throws<core::CrossoverError>(
        [&] { (void)PBX::keep_positions(a, b, std::vector<bool>(3, true)); },
        "PBX mask of the wrong size throws");

    // Random permutations of several lengths must stay permutations of the same genes
    PMX pmx;
    PBX pbx;
    bool pmx_permutations = true;
    bool pbx_permutations = true;
    for (int length : {2, 3, 7, 16}) {
        auto first = range(0, length);
        auto second = range(0, length);
        for (int round = 0; round < 100; ++round) {
            std::shuffle(first.begin(), first.end(), rng);
            std::shuffle(second.begin(), second.end(), rng);
            const auto p1 = genotype_of({first});
            const auto p2 = genotype_of({second});
            for (const auto& child : pmx.crossover({&p1, &p2}, rng)) {
                auto values = child[0].values();
                std::sort(values.begin(), values.end());
                pmx_permutations = pmx_permutations && values == range(0, length);
            }
            for (const auto& child : pbx.crossover({&p1, &p2}, rng)) {
                auto values = child[0].values();
                std::sort(values.begin(), values.end());
                pbx_permutations = pbx_permutations && values == range(0, length);
            }
        }
    }
    result.assert_true(pmx_permutations, "Partially mapped crossover always yields permutations");
    result.assert_true(pbx_permutations, "Position-based crossover always yields permutations");

    const auto duplicated = genotype_of({{1, 1, 2, 3}});
    const auto valid = genotype_of({{0, 1, 2, 3}});
    result.assert_throws<core::CrossoverError>(
        [&] { (void)pmx.crossover({&duplicated, &valid}, rng); },
        "Partially mapped crossover rejects repeated genes");
    result.assert_throws<core::CrossoverError>(
        [&] { (void)pbx.crossover({&valid, &duplicated}, rng); },
        "Position-based crossover rejects repeated genes");

    return result.finish();
}

bool test_combine_crossover() {
    TestResult result;
    std::mt19937 rng(11);

    auto mean = [](const std::vector<IntGene>& column) {
        int sum = 0;
        for (const auto& gene : column) {
            sum += gene.value();
        }
        return column.front().duplicate_with_value(sum / static_cast<int>(column.size()));
    };

    operators::CombineCrossover<IntGene> combine(mean, 1.0, 1.0, 3);
    const auto a = genotype_of({{0, 3, 6}});
    const auto b = genotype_of({{3, 6, 9}});
    const auto c = genotype_of({{6, 9, 12}});
    const auto children = combine.crossover({&a, &b, &c}, rng);
    result.assert_eq(std::size_t{1}, children.size(), "Combine crossover yields one child");
    result.assert_true(children[0][0].values() == std::vector<int>{3, 6, 9},
                       "Combiner is applied column by column");

    operators::CombineCrossover<IntGene> keep_first(mean, 1.0, 0.0);
    const auto kept = keep_first.crossover({&a, &b}, rng);
    result.assert_true(kept[0] == a, "Gene rate 0 keeps the first parent's genes");

    result.assert_throws<core::CrossoverError>(
        [&] { operators::CombineCrossover<IntGene>(mean, 1.0, 1.0, 1); },
        "Combine crossover needs two parents");
    result.assert_throws<core::CrossoverError>(
        [] { operators::CombineCrossover<IntGene>(nullptr); }, "Combine crossover needs a combiner");

    return result.finish();
}

bool test_population_alteration() {
    TestResult result;
    std::mt19937 rng(12);

    const auto state = state_of({genotype_of({range(0, 6)}), genotype_of({range(10, 16)}),
                                 genotype_of({range(20, 26)})});
    operators::SinglePointCrossover<IntGene> single;

    const auto odd = single(state, 5, rng);
    result.assert_eq(std::size_t{5}, odd.size(), "Surplus offspring of the last batch are dropped");
    result.assert_eq(std::size_t{3}, odd.generation(), "Alteration keeps the generation");
    bool unevaluated = true;
    for (const auto& individual : odd.population()) {
        unevaluated = unevaluated && !individual.is_evaluated();
    }
    result.assert_true(unevaluated, "Offspring are unevaluated");

    result.assert_true(single(state, 0, rng).is_empty(), "Output size 0 yields no offspring");

    const auto empty =
        core::EvolutionState<IntGene>::empty(std::make_shared<core::MaxRanker<IntGene>>());
    result.assert_throws<core::CrossoverError>([&] { (void)single(empty, 2, rng); },
                                               "Empty population cannot be recombined");

    operators::SinglePointCrossover<IntGene> exclusive(1.0, true);
    const auto lonely = state_of({genotype_of({range(0, 6)})});
    result.assert_throws<core::CrossoverError>([&] { (void)exclusive(lonely, 2, rng); },
                                               "Exclusive crossover needs distinct parents");
    result.assert_eq(std::size_t{4}, exclusive(state, 4, rng).size(),
                     "Exclusive crossover fills the requested size");

    return result.finish();
}

int main() {
    std::cout << "Running EvoCore Crossover Tests\n";
    std::cout << std::string(30, '=') << "\n";

    bool ok = true;

    std::cout << "\nTest: Fixed cut points\n";
    ok = test_fixed_cut_points() && ok;

    std::cout << "\nTest: Gene conservation\n";
    ok = test_conservation() && ok;

    std::cout << "\nTest: Ordered crossover\n";
    ok = test_ordered_crossover() && ok;

    std::cout << "\nTest: Partially mapped and position-based crossovers\n";
    ok = test_mapped_and_position_crossovers() && ok;

    std::cout << "\nTest: Combine crossover\n";
    ok = test_combine_crossover() && ok;

    std::cout << "\nTest: Population alteration\n";
    ok = test_population_alteration() && ok;

    return ok ? 0 : 1;
}
