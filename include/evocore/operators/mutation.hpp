#pragma once

/// @file mutation.hpp
/// @brief Mutation operators
///
/// Every mutator runs two nested Bernoulli trials: one per individual (individual_rate) and,
/// for selected individuals, one per chromosome (chromosome_rate). Only chromosomes that pass
/// both trials are handed to mutate_chromosome(). Individuals that lose no chromosome keep their
/// genotype handle and their fitness; the rest come out unevaluated.

#include <algorithm>
#include <cstddef>
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

/// @private
namespace detail {

/// @throws core::MutatorConfigError unless 0 <= rate <= 1
inline double checked_rate(double rate, const char* what) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        throw core::MutatorConfigError(std::string(what) + " must be in [0, 1], got " +
                                       std::to_string(rate));
    }
    return rate;
}

/// Pick the inclusive segment [start, end] of a chromosome of `size` genes
///
/// start is the first index whose draw falls below `boundary`; end is the first index from start
/// onward whose draw rises above it. Missing boundaries default to the chromosome ends.
inline std::pair<std::size_t, std::size_t> pick_segment(std::size_t size, double boundary,
                                                        std::mt19937& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::size_t start = 0;
    std::size_t end = size - 1;
    for (std::size_t i = 0; i < size; ++i) {
        if (unit(rng) < boundary) {
            start = i;
            break;
        }
    }
    for (std::size_t i = start; i < size; ++i) {
        if (unit(rng) > boundary) {
            end = i;
            break;
        }
    }
    return {start, end};
}

} // namespace detail

/// Base class of chromosome-level mutators
template <core::Gene G>
class Mutator : public Alterer<G> {
    double individual_rate_;
    double chromosome_rate_;

  public:
    /// @throws core::MutatorConfigError if a rate lies outside [0, 1]
    Mutator(double individual_rate, double chromosome_rate)
        : individual_rate_(detail::checked_rate(individual_rate, "Individual rate")),
          chromosome_rate_(detail::checked_rate(chromosome_rate, "Chromosome rate")) {}

    /// @throws core::InvariantViolation if the result does not hold output_size individuals
    [[nodiscard]] core::EvolutionState<G> operator()(const core::EvolutionState<G>& state,
                                                     std::size_t output_size,
                                                     std::mt19937& rng) const override {
        std::bernoulli_distribution individual_trial(individual_rate_);

        core::Population<G> result;
        result.reserve(state.size());
        for (const auto& individual : state.population()) {
            if (individual_trial(rng)) {
                result.push_back(mutate_individual(individual, rng));
            } else {
                result.push_back(individual);
            }
        }

        if (result.size() != output_size) {
            throw core::InvariantViolation(this->name() + " produced " +
                                           std::to_string(result.size()) +
                                           " individuals, expected " + std::to_string(output_size));
        }
        return state.with_population(std::move(result));
    }

    /// Run the chromosome trials over one individual
    [[nodiscard]] core::Individual<G> mutate_individual(const core::Individual<G>& individual,
                                                        std::mt19937& rng) const {
        std::bernoulli_distribution chromosome_trial(chromosome_rate_);

        std::vector<core::Chromosome<G>> chromosomes;
        chromosomes.reserve(individual.size());
        bool changed = false;
        for (const auto& chromosome : individual.genotype()) {
            if (chromosome_trial(rng)) {
                chromosomes.push_back(mutate_chromosome(chromosome, rng));
                changed = true;
            } else {
                chromosomes.push_back(chromosome);
            }
        }

        if (!changed) {
            return individual;
        }
        return core::Individual<G>(
            individual.genotype().duplicate_with_chromosomes(std::move(chromosomes)));
    }

    /// Produce the replacement of one selected chromosome
    [[nodiscard]] virtual core::Chromosome<G> mutate_chromosome(const core::Chromosome<G>& chromosome,
                                                                std::mt19937& rng) const = 0;

    [[nodiscard]] double individual_rate() const noexcept { return individual_rate_; }
    [[nodiscard]] double chromosome_rate() const noexcept { return chromosome_rate_; }
};

/// Mutator that additionally rolls a per-gene trial with probability gene_rate
template <core::Gene G>
class GeneMutator : public Mutator<G> {
    double gene_rate_;

  public:
    GeneMutator(double individual_rate, double chromosome_rate, double gene_rate)
        : Mutator<G>(individual_rate, chromosome_rate),
          gene_rate_(detail::checked_rate(gene_rate, "Gene rate")) {}

    [[nodiscard]] core::Chromosome<G> mutate_chromosome(const core::Chromosome<G>& chromosome,
                                                        std::mt19937& rng) const override {
        std::bernoulli_distribution gene_trial(gene_rate_);
        std::vector<G> genes;
        genes.reserve(chromosome.size());
        for (const auto& gene : chromosome) {
            genes.push_back(gene_trial(rng) ? mutate_gene(gene, rng) : gene);
        }
        return chromosome.duplicate_with_genes(std::move(genes));
    }

    [[nodiscard]] virtual G mutate_gene(const G& gene, std::mt19937& rng) const = 0;

    [[nodiscard]] double gene_rate() const noexcept { return gene_rate_; }
};

/// Replaces selected genes with a fresh random value from their own domain
template <core::MutableGene G>
class RandomMutator final : public GeneMutator<G> {
  public:
    explicit RandomMutator(double individual_rate = 0.5, double chromosome_rate = 0.5,
                           double gene_rate = 0.5)
        : GeneMutator<G>(individual_rate, chromosome_rate, gene_rate) {}

    [[nodiscard]] G mutate_gene(const G& gene, std::mt19937& rng) const override {
        return gene.mutate(rng);
    }

    [[nodiscard]] std::string name() const override { return "RandomMutator"; }
};

/// Negates selected boolean genes
template <core::BooleanGene G>
class BitFlipMutator final : public GeneMutator<G> {
  public:
    explicit BitFlipMutator(double individual_rate = 0.5, double chromosome_rate = 0.5,
                            double gene_rate = 0.5)
        : GeneMutator<G>(individual_rate, chromosome_rate, gene_rate) {}

    [[nodiscard]] G mutate_gene(const G& gene, std::mt19937&) const override {
        return gene.duplicate_with_value(!gene.value());
    }

    [[nodiscard]] std::string name() const override { return "BitFlipMutator"; }
};

/// Each position, with probability swap_rate, swaps with a uniformly drawn position
///
/// The multiset of genes in a chromosome is preserved, which makes it safe for permutations.
template <core::Gene G>
class SwapMutator final : public Mutator<G> {
    double swap_rate_;

  public:
    explicit SwapMutator(double individual_rate = 0.5, double chromosome_rate = 0.5,
                         double swap_rate = 0.5)
        : Mutator<G>(individual_rate, chromosome_rate),
          swap_rate_(detail::checked_rate(swap_rate, "Swap rate")) {}

    [[nodiscard]] core::Chromosome<G> mutate_chromosome(const core::Chromosome<G>& chromosome,
                                                        std::mt19937& rng) const override {
        if (chromosome.empty()) {
            return chromosome;
        }
        std::vector<G> genes = chromosome.genes();
        std::bernoulli_distribution swap_trial(swap_rate_);
        std::uniform_int_distribution<std::size_t> position(0, genes.size() - 1);
        for (std::size_t i = 0; i < genes.size(); ++i) {
            if (swap_trial(rng)) {
                std::swap(genes[i], genes[position(rng)]);
            }
        }
        return chromosome.duplicate_with_genes(std::move(genes));
    }

    [[nodiscard]] double swap_rate() const noexcept { return swap_rate_; }

    [[nodiscard]] std::string name() const override { return "SwapMutator"; }
};

/// Reverses a randomly bounded segment of each selected chromosome
template <core::Gene G>
class InversionMutator final : public Mutator<G> {
    double boundary_probability_;

  public:
    explicit InversionMutator(double individual_rate = 0.5, double chromosome_rate = 0.5,
                              double boundary_probability = 0.5)
        : Mutator<G>(individual_rate, chromosome_rate),
          boundary_probability_(
              detail::checked_rate(boundary_probability, "Inversion boundary probability")) {}

    [[nodiscard]] core::Chromosome<G> mutate_chromosome(const core::Chromosome<G>& chromosome,
                                                        std::mt19937& rng) const override {
        if (chromosome.size() < 2 || boundary_probability_ == 0.0) {
            return chromosome;
        }
        const auto [start, end] = detail::pick_segment(chromosome.size(), boundary_probability_, rng);
        std::vector<G> genes = chromosome.genes();
        std::reverse(genes.begin() + static_cast<std::ptrdiff_t>(start),
                     genes.begin() + static_cast<std::ptrdiff_t>(end) + 1);
        return chromosome.duplicate_with_genes(std::move(genes));
    }

    [[nodiscard]] double boundary_probability() const noexcept { return boundary_probability_; }

    [[nodiscard]] std::string name() const override { return "InversionMutator"; }
};

/// Shuffles a randomly bounded segment of each selected chromosome
template <core::Gene G>
class PartialShuffleMutator final : public Mutator<G> {
    double boundary_probability_;

  public:
    explicit PartialShuffleMutator(double individual_rate = 1.0, double chromosome_rate = 1.0,
                                   double boundary_probability = 0.5)
        : Mutator<G>(individual_rate, chromosome_rate),
          boundary_probability_(
              detail::checked_rate(boundary_probability, "Shuffle boundary probability")) {}

    [[nodiscard]] core::Chromosome<G> mutate_chromosome(const core::Chromosome<G>& chromosome,
                                                        std::mt19937& rng) const override {
        if (chromosome.size() < 2 || boundary_probability_ == 0.0) {
            return chromosome;
        }
        const auto [start, end] = detail::pick_segment(chromosome.size(), boundary_probability_, rng);
        std::vector<G> genes = chromosome.genes();
        std::shuffle(genes.begin() + static_cast<std::ptrdiff_t>(start),
                     genes.begin() + static_cast<std::ptrdiff_t>(end) + 1, rng);
        return chromosome.duplicate_with_genes(std::move(genes));
    }

    [[nodiscard]] double boundary_probability() const noexcept { return boundary_probability_; }

    [[nodiscard]] std::string name() const override { return "PartialShuffleMutator"; }
};

} // namespace evocore::operators
