#pragma once

/// @file genotype.hpp
/// @brief Genotype (ordered chromosomes) and the factories that create them

#include <algorithm>
#include <cstddef>
#include <functional>
#include <random>
#include <utility>
#include <vector>

#include <evocore/core/chromosome.hpp>
#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>

namespace evocore::core {

/// Full encoded solution: an ordered sequence of chromosomes
///
/// The chromosome count is homogeneous across the individuals of one run; chromosome lengths may
/// differ from one position to the next.
template <Gene G>
class Genotype {
    std::vector<Chromosome<G>> chromosomes_;

  public:
    using gene_type = G;
    using value_type = typename G::value_type;
    using const_iterator = typename std::vector<Chromosome<G>>::const_iterator;

    Genotype() = default;

    explicit Genotype(std::vector<Chromosome<G>> chromosomes)
        : chromosomes_(std::move(chromosomes)) {}

    [[nodiscard]] std::size_t size() const noexcept { return chromosomes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return chromosomes_.empty(); }

    [[nodiscard]] const Chromosome<G>& operator[](std::size_t index) const noexcept {
        return chromosomes_[index];
    }

    /// @throws std::out_of_range if index is out of bounds
    [[nodiscard]] const Chromosome<G>& at(std::size_t index) const {
        return chromosomes_.at(index);
    }

    [[nodiscard]] const std::vector<Chromosome<G>>& chromosomes() const noexcept {
        return chromosomes_;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return chromosomes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return chromosomes_.end(); }

    [[nodiscard]] Genotype duplicate_with_chromosomes(std::vector<Chromosome<G>> chromosomes) const {
        return Genotype(std::move(chromosomes));
    }

    [[nodiscard]] bool verify() const {
        return std::ranges::all_of(chromosomes_,
                                   [](const Chromosome<G>& c) { return c.verify(); });
    }

    /// Concatenation of every gene value, for fitness functions working on flat vectors
    [[nodiscard]] std::vector<value_type> flatten() const {
        std::vector<value_type> values;
        std::size_t total = 0;
        for (const auto& chromosome : chromosomes_) {
            total += chromosome.size();
        }
        values.reserve(total);
        for (const auto& chromosome : chromosomes_) {
            for (const auto& gene : chromosome) {
                values.push_back(gene.value());
            }
        }
        return values;
    }

    bool operator==(const Genotype&) const = default;
};

/// Builds one fresh chromosome from the supplied random stream
template <Gene G>
using ChromosomeFactory = std::function<Chromosome<G>(std::mt19937&)>;

/// Builds one fresh, internally valid genotype from the supplied random stream
///
/// The engine calls it exactly population_size times during initialization. The random stream is
/// passed explicitly so runs stay reproducible under a fixed seed.
template <Gene G>
using GenotypeFactory = std::function<Genotype<G>(std::mt19937&)>;

/// Compose chromosome factories into a genotype factory (one chromosome per factory, in order)
///
/// @throws ConfigurationError if no factory is supplied or one of them is empty
template <Gene G>
GenotypeFactory<G> make_genotype_factory(std::vector<ChromosomeFactory<G>> factories) {
    if (factories.empty()) {
        throw ConfigurationError("A genotype needs at least one chromosome factory");
    }
    for (const auto& factory : factories) {
        if (!factory) {
            throw ConfigurationError("Chromosome factories must be callable");
        }
    }
    return [factories = std::move(factories)](std::mt19937& rng) {
        std::vector<Chromosome<G>> chromosomes;
        chromosomes.reserve(factories.size());
        for (const auto& factory : factories) {
            chromosomes.push_back(factory(rng));
        }
        return Genotype<G>(std::move(chromosomes));
    };
}

} // namespace evocore::core
