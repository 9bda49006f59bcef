#pragma once

/// @file individual.hpp
/// @brief Individual (genotype + fitness) and Population

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/genotype.hpp>

namespace evocore::core {

/// Sentinel fitness of an individual that has not been evaluated yet
inline constexpr double unevaluated_fitness = std::numeric_limits<double>::quiet_NaN();

/// A genotype paired with its fitness score
///
/// The genotype is held through a shared immutable handle: operators that leave an individual
/// untouched hand the same genotype to the next generation without copying it.
/// Invariant: is_evaluated() == !isnan(fitness()).
template <Gene G>
class Individual {
    std::shared_ptr<const Genotype<G>> genotype_;
    double fitness_;

  public:
    explicit Individual(Genotype<G> genotype, double fitness = unevaluated_fitness)
        : genotype_(std::make_shared<const Genotype<G>>(std::move(genotype))), fitness_(fitness) {}

    /// @throws ConfigurationError if the handle is null
    explicit Individual(std::shared_ptr<const Genotype<G>> genotype,
                        double fitness = unevaluated_fitness)
        : genotype_(std::move(genotype)), fitness_(fitness) {
        if (!genotype_) {
            throw ConfigurationError("An individual requires a genotype");
        }
    }

    [[nodiscard]] const Genotype<G>& genotype() const noexcept { return *genotype_; }

    [[nodiscard]] const std::shared_ptr<const Genotype<G>>& shared_genotype() const noexcept {
        return genotype_;
    }

    [[nodiscard]] double fitness() const noexcept { return fitness_; }

    [[nodiscard]] bool is_evaluated() const noexcept { return !std::isnan(fitness_); }

    /// True only for a valid genotype with a real fitness value
    [[nodiscard]] bool verify() const { return is_evaluated() && genotype_->verify(); }

    /// Same genotype handle, new fitness
    [[nodiscard]] Individual with_fitness(double fitness) const {
        return Individual(genotype_, fitness);
    }

    [[nodiscard]] std::size_t size() const noexcept { return genotype_->size(); }

    /// Representation-based equality; two unevaluated individuals with equal genotypes are equal
    bool operator==(const Individual& other) const {
        const bool same_fitness = (std::isnan(fitness_) && std::isnan(other.fitness_)) ||
                                  fitness_ == other.fitness_;
        return same_fitness && (genotype_ == other.genotype_ || *genotype_ == *other.genotype_);
    }

    [[nodiscard]] std::size_t hash() const
        requires HashableGene<G>
    {
        std::size_t seed = std::hash<std::size_t>{}(genotype_->size());
        for (const auto& chromosome : *genotype_) {
            hash_combine(seed, chromosome.size());
            for (const auto& gene : chromosome) {
                hash_combine(seed, std::hash<typename G::value_type>{}(gene.value()));
            }
        }
        // Every NaN hashes alike so equal individuals hash equal
        hash_combine(seed, is_evaluated() ? std::hash<double>{}(fitness_) : 0);
        return seed;
    }
};

/// Ordered collection of individuals; insertion order unless explicitly sorted by a ranker
template <Gene G>
using Population = std::vector<Individual<G>>;

} // namespace evocore::core

template <evocore::core::HashableGene G>
struct std::hash<evocore::core::Individual<G>> {
    std::size_t operator()(const evocore::core::Individual<G>& individual) const {
        return individual.hash();
    }
};
