#pragma once

/// @file crossover.hpp
/// @brief Recombination operators
///
/// A crossover repeatedly picks `num_parents` parents from its input, recombines their genotypes
/// chromosome by chromosome and collects offspring until the requested output size is reached.
/// Every offspring is unevaluated.

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/chromosome.hpp>
#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/genotype.hpp>
#include <evocore/core/individual.hpp>
#include <evocore/core/state.hpp>
#include <evocore/operators/alterer.hpp>

namespace evocore::operators {

/// Base class of every crossover
///
/// ## Algorithm:
/// 1. Draw `num_parents` parents uniformly (without replacement when `exclusivity` is set)
/// 2. Pick each chromosome index with probability `chromosome_rate`
/// 3. Recombine the parents' chromosomes at every picked index with crossover_chromosomes()
/// 4. Offspring k inherits parent (k mod num_parents)'s chromosome at every other index
/// 5. Repeat until `output_size` offspring exist, dropping the surplus of the last batch
template <core::Gene G>
class Crossover : public Alterer<G> {
    std::size_t num_parents_;
    std::size_t num_offspring_;
    double chromosome_rate_;
    bool exclusivity_;

  public:
    /// @throws core::CrossoverError on zero parents/offspring or a rate outside [0, 1]
    Crossover(std::size_t num_parents, std::size_t num_offspring, double chromosome_rate,
              bool exclusivity)
        : num_parents_(num_parents), num_offspring_(num_offspring),
          chromosome_rate_(chromosome_rate), exclusivity_(exclusivity) {
        if (num_parents_ == 0) {
            throw core::CrossoverError("A crossover needs at least one parent");
        }
        if (num_offspring_ == 0) {
            throw core::CrossoverError("A crossover must produce at least one offspring");
        }
        if (!(chromosome_rate_ >= 0.0 && chromosome_rate_ <= 1.0)) {
            throw core::CrossoverError("The chromosome rate must be in [0, 1], got " +
                                       std::to_string(chromosome_rate_));
        }
    }

    /// @throws core::CrossoverError if no parents can be drawn from the population
    [[nodiscard]] core::EvolutionState<G> operator()(const core::EvolutionState<G>& state,
                                                     std::size_t output_size,
                                                     std::mt19937& rng) const override {
        core::Population<G> offspring;
        if (output_size == 0) {
            return state.with_population(std::move(offspring));
        }
        if (state.is_empty()) {
            throw core::CrossoverError(this->name() + " cannot recombine an empty population");
        }
        if (exclusivity_ && state.size() < num_parents_) {
            throw core::CrossoverError(this->name() + " needs " +
                                       std::to_string(num_parents_) +
                                       " distinct parents, population has " +
                                       std::to_string(state.size()));
        }

        offspring.reserve(output_size);
        while (offspring.size() < output_size) {
            const auto parents = draw_parents(state.population(), rng);
            for (auto& genotype : crossover(parents, rng)) {
                if (offspring.size() == output_size) {
                    break;
                }
                offspring.emplace_back(std::move(genotype));
            }
        }
        return state.with_population(std::move(offspring));
    }

    /// Recombine exactly num_parents genotypes into num_offspring genotypes
    ///
    /// @throws core::CrossoverError if the parent count is wrong, a parent has no chromosomes,
    ///         or the parents disagree on their chromosome count
    [[nodiscard]] std::vector<core::Genotype<G>>
    crossover(const std::vector<const core::Genotype<G>*>& parents, std::mt19937& rng) const {
        if (parents.size() != num_parents_) {
            throw core::CrossoverError("The number of inputs (" + std::to_string(parents.size()) +
                                       ") must equal the number of parents (" +
                                       std::to_string(num_parents_) + ")");
        }
        const std::size_t chromosome_count = parents.front()->size();
        for (std::size_t p = 0; p < parents.size(); ++p) {
            if (parents[p]->empty()) {
                throw core::CrossoverError("Parent " + std::to_string(p) +
                                           " has no chromosomes");
            }
            if (parents[p]->size() != chromosome_count) {
                throw core::CrossoverError("Genotypes must have the same number of chromosomes");
            }
        }

        std::bernoulli_distribution pick(chromosome_rate_);
        // recombined[j] holds the offspring chromosomes at index j, empty when j was not picked
        std::vector<std::vector<core::Chromosome<G>>> recombined(chromosome_count);
        for (std::size_t j = 0; j < chromosome_count; ++j) {
            if (!pick(rng)) {
                continue;
            }
            std::vector<core::Chromosome<G>> mates;
            mates.reserve(num_parents_);
            for (const auto* parent : parents) {
                mates.push_back((*parent)[j]);
            }
            recombined[j] = crossover_chromosomes(mates, rng);
            if (recombined[j].size() != num_offspring_) {
                throw core::InvariantViolation(this->name() + " returned " +
                                               std::to_string(recombined[j].size()) +
                                               " chromosomes, expected " +
                                               std::to_string(num_offspring_));
            }
        }

        std::vector<core::Genotype<G>> children;
        children.reserve(num_offspring_);
        for (std::size_t k = 0; k < num_offspring_; ++k) {
            std::vector<core::Chromosome<G>> chromosomes;
            chromosomes.reserve(chromosome_count);
            for (std::size_t j = 0; j < chromosome_count; ++j) {
                if (recombined[j].empty()) {
                    chromosomes.push_back((*parents[k % num_parents_])[j]);
                } else {
                    chromosomes.push_back(std::move(recombined[j][k]));
                }
            }
            children.emplace_back(std::move(chromosomes));
        }
        return children;
    }

    /// Recombine the num_parents chromosomes found at one index
    [[nodiscard]] virtual std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const = 0;

    [[nodiscard]] std::size_t num_parents() const noexcept { return num_parents_; }
    [[nodiscard]] std::size_t num_offspring() const noexcept { return num_offspring_; }
    [[nodiscard]] double chromosome_rate() const noexcept { return chromosome_rate_; }
    [[nodiscard]] bool exclusivity() const noexcept { return exclusivity_; }

  private:
    [[nodiscard]] std::vector<const core::Genotype<G>*>
    draw_parents(const core::Population<G>& population, std::mt19937& rng) const {
        std::vector<const core::Genotype<G>*> parents;
        parents.reserve(num_parents_);
        if (exclusivity_) {
            // Partial Fisher-Yates over the population indices
            std::vector<std::size_t> indices(population.size());
            std::iota(indices.begin(), indices.end(), std::size_t{0});
            for (std::size_t i = 0; i < num_parents_; ++i) {
                std::uniform_int_distribution<std::size_t> dist(i, indices.size() - 1);
                std::swap(indices[i], indices[dist(rng)]);
                parents.push_back(&population[indices[i]].genotype());
            }
        } else {
            std::uniform_int_distribution<std::size_t> dist(0, population.size() - 1);
            for (std::size_t i = 0; i < num_parents_; ++i) {
                parents.push_back(&population[dist(rng)].genotype());
            }
        }
        return parents;
    }
};

/// @private
namespace detail {

template <core::Gene G>
void require_mates_of_equal_length(const std::vector<core::Chromosome<G>>& chromosomes) {
    if (chromosomes.size() != 2) {
        throw core::CrossoverError("The number of parent chromosomes must be 2, got " +
                                   std::to_string(chromosomes.size()));
    }
    if (chromosomes[0].size() != chromosomes[1].size()) {
        throw core::CrossoverError("Both parents must have the same size");
    }
}

template <core::Gene G>
[[nodiscard]] bool is_permutation(const std::vector<G>& genes) {
    for (std::size_t i = 0; i < genes.size(); ++i) {
        for (std::size_t j = i + 1; j < genes.size(); ++j) {
            if (genes[i] == genes[j]) {
                return false;
            }
        }
    }
    return true;
}

/// @throws core::CrossoverError if the mates differ in length or either repeats a gene
template <core::Gene G>
void require_permutation_mates(const std::vector<core::Chromosome<G>>& chromosomes,
                               const std::string& operator_name) {
    require_mates_of_equal_length(chromosomes);
    for (const auto& chromosome : chromosomes) {
        if (!detail::is_permutation(chromosome.genes())) {
            throw core::CrossoverError(operator_name +
                                       " requires chromosomes without duplicate genes");
        }
    }
}

} // namespace detail

/// Exchange the tails of two chromosomes after one random cut point
template <core::Gene G>
class SinglePointCrossover final : public Crossover<G> {
  public:
    explicit SinglePointCrossover(double chromosome_rate = 1.0, bool exclusivity = false)
        : Crossover<G>(2, 2, chromosome_rate, exclusivity) {}

    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        detail::require_mates_of_equal_length(chromosomes);
        if (chromosomes[0].empty()) {
            return chromosomes;
        }
        std::uniform_int_distribution<std::size_t> dist(0, chromosomes[0].size() - 1);
        auto [first, second] =
            crossover_at(dist(rng), chromosomes[0].genes(), chromosomes[1].genes());
        return {chromosomes[0].duplicate_with_genes(std::move(first)),
                chromosomes[0].duplicate_with_genes(std::move(second))};
    }

    /// Offspring a[:cut] + b[cut:] and b[:cut] + a[cut:]
    ///
    /// @throws core::CrossoverError if the parents differ in length or cut exceeds it
    [[nodiscard]] static std::pair<std::vector<G>, std::vector<G>>
    crossover_at(std::size_t cut, const std::vector<G>& a, const std::vector<G>& b) {
        if (a.size() != b.size()) {
            throw core::CrossoverError("Parents must have the same size");
        }
        if (cut > a.size()) {
            throw core::CrossoverError("The crossover point must be in [0, " +
                                       std::to_string(a.size()) + "], got " + std::to_string(cut));
        }
        const auto c = static_cast<std::ptrdiff_t>(cut);
        std::vector<G> first(a.begin(), a.begin() + c);
        first.insert(first.end(), b.begin() + c, b.end());
        std::vector<G> second(b.begin(), b.begin() + c);
        second.insert(second.end(), a.begin() + c, a.end());
        return {std::move(first), std::move(second)};
    }

    [[nodiscard]] std::string name() const override { return "SinglePointCrossover"; }
};

/// Alternate parent segments between `points` distinct sorted cut indices
template <core::Gene G>
class MultiPointCrossover final : public Crossover<G> {
    std::size_t points_;

  public:
    explicit MultiPointCrossover(std::size_t points = 2, double chromosome_rate = 1.0,
                                 bool exclusivity = false)
        : Crossover<G>(2, 2, chromosome_rate, exclusivity), points_(points) {
        if (points_ == 0) {
            throw core::CrossoverError("Multi-point crossover needs at least one cut point");
        }
    }

    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        detail::require_mates_of_equal_length(chromosomes);
        const std::size_t length = chromosomes[0].size();
        if (points_ > length) {
            throw core::CrossoverError("Cannot place " + std::to_string(points_) +
                                       " cut points in a chromosome of length " +
                                       std::to_string(length));
        }

        std::vector<std::size_t> positions(length);
        std::iota(positions.begin(), positions.end(), std::size_t{0});
        std::vector<std::size_t> cuts;
        cuts.reserve(points_);
        std::sample(positions.begin(), positions.end(), std::back_inserter(cuts), points_, rng);
        std::sort(cuts.begin(), cuts.end());

        auto [first, second] = crossover_at(cuts, chromosomes[0].genes(), chromosomes[1].genes());
        return {chromosomes[0].duplicate_with_genes(std::move(first)),
                chromosomes[0].duplicate_with_genes(std::move(second))};
    }

    /// Swap the parents' roles at every cut index (cuts sorted ascending)
    [[nodiscard]] static std::pair<std::vector<G>, std::vector<G>>
    crossover_at(const std::vector<std::size_t>& cuts, const std::vector<G>& a,
                 const std::vector<G>& b) {
        if (a.size() != b.size()) {
            throw core::CrossoverError("Parents must have the same size");
        }
        std::vector<G> first;
        std::vector<G> second;
        first.reserve(a.size());
        second.reserve(b.size());
        bool swapped = false;
        std::size_t next_cut = 0;
        for (std::size_t i = 0; i < a.size(); ++i) {
            while (next_cut < cuts.size() && cuts[next_cut] == i) {
                swapped = !swapped;
                ++next_cut;
            }
            first.push_back(swapped ? b[i] : a[i]);
            second.push_back(swapped ? a[i] : b[i]);
        }
        return {std::move(first), std::move(second)};
    }

    [[nodiscard]] std::size_t points() const noexcept { return points_; }

    [[nodiscard]] std::string name() const override { return "MultiPointCrossover"; }
};

/// Order crossover (OX1) for permutation chromosomes
///
/// Each offspring keeps a segment of one parent in place and fills the remaining positions with
/// the other parent's genes, in that parent's order, skipping genes already in the segment.
template <core::Gene G>
class OrderedCrossover final : public Crossover<G> {
  public:
    explicit OrderedCrossover(double chromosome_rate = 1.0, bool exclusivity = false)
        : Crossover<G>(2, 2, chromosome_rate, exclusivity) {}

    /// @throws core::CrossoverError if a parent repeats a gene or the parents differ in length
    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        detail::require_permutation_mates(chromosomes, "Ordered crossover");
        const std::size_t length = chromosomes[0].size();
        if (length < 2) {
            return chromosomes;
        }

        std::uniform_int_distribution<std::size_t> dist(0, length - 1);
        std::size_t start = dist(rng);
        std::size_t end = dist(rng);
        while (end == start) {
            end = dist(rng);
        }
        if (start > end) {
            std::swap(start, end);
        }

        const auto& a = chromosomes[0].genes();
        const auto& b = chromosomes[1].genes();
        return {chromosomes[0].duplicate_with_genes(exchange_segment(a, b, start, end)),
                chromosomes[0].duplicate_with_genes(exchange_segment(b, a, start, end))};
    }

    /// Keep donor[start..end] in place and fill around it from filler's remaining genes in order
    ///
    /// @throws core::CrossoverError if the segment is out of bounds
    [[nodiscard]] static std::vector<G> exchange_segment(const std::vector<G>& donor,
                                                         const std::vector<G>& filler,
                                                         std::size_t start, std::size_t end) {
        if (start > end || end >= donor.size()) {
            throw core::CrossoverError("Invalid crossover segment [" + std::to_string(start) +
                                       ", " + std::to_string(end) + "]");
        }
        const auto segment_begin = donor.begin() + static_cast<std::ptrdiff_t>(start);
        const auto segment_end = donor.begin() + static_cast<std::ptrdiff_t>(end) + 1;

        std::vector<G> remaining;
        remaining.reserve(filler.size());
        for (const auto& gene : filler) {
            if (std::find(segment_begin, segment_end, gene) == segment_end) {
                remaining.push_back(gene);
            }
        }

        const auto head = static_cast<std::ptrdiff_t>(std::min(start, remaining.size()));
        std::vector<G> child(remaining.begin(), remaining.begin() + head);
        child.insert(child.end(), segment_begin, segment_end);
        child.insert(child.end(), remaining.begin() + head, remaining.end());
        return child;
    }

    [[nodiscard]] std::string name() const override { return "OrderedCrossover"; }
};

/// Partially mapped crossover (PMX) for permutation chromosomes
///
/// Offspring 1 takes the second parent's genes inside a random region [lo, hi) and the first
/// parent's genes elsewhere. An outside gene that already appears in the region is replaced by
/// following the region mapping (second parent -> first parent) until the gene is free;
/// offspring 2 is built the same way with the parents' roles exchanged.
template <core::Gene G>
class PartiallyMappedCrossover final : public Crossover<G> {
  public:
    explicit PartiallyMappedCrossover(double chromosome_rate = 1.0, bool exclusivity = false)
        : Crossover<G>(2, 2, chromosome_rate, exclusivity) {}

    /// @throws core::CrossoverError if a parent repeats a gene or the parents differ in length
    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        detail::require_permutation_mates(chromosomes, "Partially mapped crossover");
        const std::size_t length = chromosomes[0].size();
        if (length < 2) {
            return chromosomes;
        }

        // Two distinct bounds in [0, length], so the region holds at least one gene
        std::uniform_int_distribution<std::size_t> dist(0, length);
        std::size_t lo = dist(rng);
        std::size_t hi = dist(rng);
        while (hi == lo) {
            hi = dist(rng);
        }
        if (lo > hi) {
            std::swap(lo, hi);
        }

        const auto& a = chromosomes[0].genes();
        const auto& b = chromosomes[1].genes();
        return {chromosomes[0].duplicate_with_genes(map_region(a, b, lo, hi)),
                chromosomes[0].duplicate_with_genes(map_region(b, a, lo, hi))};
    }

    /// keeper outside [lo, hi), donor inside, conflicts resolved through the region mapping
    ///
    /// Both inputs must be permutations of the same genes.
    /// @throws core::CrossoverError if the region is out of bounds or the inputs differ in size
    [[nodiscard]] static std::vector<G> map_region(const std::vector<G>& keeper,
                                                   const std::vector<G>& donor, std::size_t lo,
                                                   std::size_t hi) {
        if (keeper.size() != donor.size()) {
            throw core::CrossoverError("Parents must have the same size");
        }
        if (lo > hi || hi > keeper.size()) {
            throw core::CrossoverError("Invalid crossover region [" + std::to_string(lo) + ", " +
                                       std::to_string(hi) + ")");
        }
        const auto region_begin = donor.begin() + static_cast<std::ptrdiff_t>(lo);
        const auto region_end = donor.begin() + static_cast<std::ptrdiff_t>(hi);

        std::vector<G> child = keeper;
        std::copy(region_begin, region_end, child.begin() + static_cast<std::ptrdiff_t>(lo));
        for (std::size_t i = 0; i < child.size(); ++i) {
            if (i >= lo && i < hi) {
                continue;
            }
            // Each step moves to a different region slot, so at most hi - lo steps are taken
            for (std::size_t steps = 0; steps <= hi - lo; ++steps) {
                const auto found = std::find(region_begin, region_end, child[i]);
                if (found == region_end) {
                    break;
                }
                child[i] = keeper[static_cast<std::size_t>(found - donor.begin())];
            }
        }
        return child;
    }

    [[nodiscard]] std::string name() const override { return "PartiallyMappedCrossover"; }
};

/// Position-based crossover (PBX) for permutation chromosomes
///
/// Each offspring keeps one parent's genes at a random set of positions (every position is kept
/// with probability 1/2) and fills the other positions with the other parent's genes, in that
/// parent's order, skipping genes already kept.
template <core::Gene G>
class PositionBasedCrossover final : public Crossover<G> {
  public:
    explicit PositionBasedCrossover(double chromosome_rate = 1.0, bool exclusivity = false)
        : Crossover<G>(2, 2, chromosome_rate, exclusivity) {}

    /// @throws core::CrossoverError if a parent repeats a gene or the parents differ in length
    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        detail::require_permutation_mates(chromosomes, "Position-based crossover");
        const std::size_t length = chromosomes[0].size();

        const auto& a = chromosomes[0].genes();
        const auto& b = chromosomes[1].genes();
        return {chromosomes[0].duplicate_with_genes(keep_positions(a, b, draw_mask(length, rng))),
                chromosomes[0].duplicate_with_genes(keep_positions(b, a, draw_mask(length, rng)))};
    }

    /// keeper's genes where keep[i] is set, filler's remaining genes in order everywhere else
    ///
    /// Both inputs must be permutations of the same genes.
    /// @throws core::CrossoverError if the sizes of keeper, filler and keep differ
    [[nodiscard]] static std::vector<G> keep_positions(const std::vector<G>& keeper,
                                                       const std::vector<G>& filler,
                                                       const std::vector<bool>& keep) {
        if (keeper.size() != filler.size() || keep.size() != keeper.size()) {
            throw core::CrossoverError("Parents and position mask must have the same size");
        }
        std::vector<G> kept;
        for (std::size_t i = 0; i < keeper.size(); ++i) {
            if (keep[i]) {
                kept.push_back(keeper[i]);
            }
        }

        std::vector<G> child;
        child.reserve(keeper.size());
        auto next = filler.begin();
        for (std::size_t i = 0; i < keeper.size(); ++i) {
            if (keep[i]) {
                child.push_back(keeper[i]);
                continue;
            }
            while (next != filler.end() &&
                   std::find(kept.begin(), kept.end(), *next) != kept.end()) {
                ++next;
            }
            if (next == filler.end()) {
                throw core::CrossoverError("Parents are not permutations of the same genes");
            }
            child.push_back(*next++);
        }
        return child;
    }

    [[nodiscard]] std::string name() const override { return "PositionBasedCrossover"; }

  private:
    [[nodiscard]] static std::vector<bool> draw_mask(std::size_t length, std::mt19937& rng) {
        std::bernoulli_distribution coin(0.5);
        std::vector<bool> keep(length);
        for (std::size_t i = 0; i < length; ++i) {
            keep[i] = coin(rng);
        }
        return keep;
    }
};

/// Gene-wise combination of `num_parents` chromosomes into one offspring
///
/// Position i of the offspring is combiner(parent genes at i) with probability gene_rate and
/// the first parent's gene otherwise.
template <core::Gene G>
class CombineCrossover final : public Crossover<G> {
  public:
    using Combiner = std::function<G(const std::vector<G>&)>;

  private:
    Combiner combiner_;
    double gene_rate_;

  public:
    /// @throws core::CrossoverError if the combiner is empty, gene_rate lies outside [0, 1] or
    ///         fewer than two parents are requested
    explicit CombineCrossover(Combiner combiner, double chromosome_rate = 1.0,
                              double gene_rate = 1.0, std::size_t num_parents = 2,
                              bool exclusivity = false)
        : Crossover<G>(num_parents, 1, chromosome_rate, exclusivity),
          combiner_(std::move(combiner)), gene_rate_(gene_rate) {
        if (!combiner_) {
            throw core::CrossoverError("CombineCrossover requires a combiner");
        }
        if (!(gene_rate_ >= 0.0 && gene_rate_ <= 1.0)) {
            throw core::CrossoverError("The gene rate must be in [0, 1], got " +
                                       std::to_string(gene_rate_));
        }
        if (num_parents < 2) {
            throw core::CrossoverError("The number of parents (" + std::to_string(num_parents) +
                                       ") must be greater than 1");
        }
    }

    [[nodiscard]] std::vector<core::Chromosome<G>>
    crossover_chromosomes(const std::vector<core::Chromosome<G>>& chromosomes,
                          std::mt19937& rng) const override {
        return {chromosomes.front().duplicate_with_genes(combine(chromosomes, rng))};
    }

    /// @throws core::CrossoverError if the inputs are not num_parents chromosomes of one length
    [[nodiscard]] std::vector<G> combine(const std::vector<core::Chromosome<G>>& chromosomes,
                                         std::mt19937& rng) const {
        if (chromosomes.size() != this->num_parents()) {
            throw core::CrossoverError("Number of inputs (" + std::to_string(chromosomes.size()) +
                                       ") must equal the number of parents (" +
                                       std::to_string(this->num_parents()) + ")");
        }
        const std::size_t length = chromosomes.front().size();
        for (const auto& chromosome : chromosomes) {
            if (chromosome.size() != length) {
                throw core::CrossoverError("All chromosomes must have the same length");
            }
        }

        std::bernoulli_distribution gene_trial(gene_rate_);
        std::vector<G> genes;
        genes.reserve(length);
        std::vector<G> column;
        column.reserve(chromosomes.size());
        for (std::size_t i = 0; i < length; ++i) {
            if (!gene_trial(rng)) {
                genes.push_back(chromosomes.front()[i]);
                continue;
            }
            column.clear();
            for (const auto& chromosome : chromosomes) {
                column.push_back(chromosome[i]);
            }
            genes.push_back(combiner_(column));
        }
        return genes;
    }

    [[nodiscard]] double gene_rate() const noexcept { return gene_rate_; }

    [[nodiscard]] std::string name() const override { return "CombineCrossover"; }
};

} // namespace evocore::operators
