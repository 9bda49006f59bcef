#pragma once

/// @file state.hpp
/// @brief Immutable snapshot of one generation

#include <cstddef>
#include <memory>
#include <utility>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/individual.hpp>
#include <evocore/core/ranker.hpp>

namespace evocore::core {

/// Generation counter, ranker and population
///
/// States are values: every transition (selection, alteration, evaluation) yields a new state
/// through with_population() or with_generation() and leaves its input untouched.
template <Gene G>
class EvolutionState {
    std::size_t generation_ = 0;
    std::shared_ptr<const Ranker<G>> ranker_;
    Population<G> population_;

  public:
    /// @throws ConfigurationError if ranker is null
    EvolutionState(std::size_t generation, std::shared_ptr<const Ranker<G>> ranker,
                   Population<G> population = {})
        : generation_(generation), ranker_(std::move(ranker)), population_(std::move(population)) {
        if (!ranker_) {
            throw ConfigurationError("EvolutionState requires a ranker");
        }
    }

    /// State before initialization: generation 0, no individuals
    [[nodiscard]] static EvolutionState empty(std::shared_ptr<const Ranker<G>> ranker) {
        return EvolutionState(0, std::move(ranker));
    }

    [[nodiscard]] std::size_t generation() const noexcept { return generation_; }

    [[nodiscard]] const Ranker<G>& ranker() const noexcept { return *ranker_; }

    [[nodiscard]] const std::shared_ptr<const Ranker<G>>& shared_ranker() const noexcept {
        return ranker_;
    }

    [[nodiscard]] const Population<G>& population() const noexcept { return population_; }

    [[nodiscard]] std::size_t size() const noexcept { return population_.size(); }

    [[nodiscard]] bool is_empty() const noexcept { return population_.empty(); }

    [[nodiscard]] EvolutionState with_population(Population<G> population) const {
        return EvolutionState(generation_, ranker_, std::move(population));
    }

    [[nodiscard]] EvolutionState with_generation(std::size_t generation) const {
        return EvolutionState(generation, ranker_, population_);
    }

    /// Best individual under the ranker; requires a non-empty, evaluated population
    [[nodiscard]] const Individual<G>& best() const {
        if (population_.empty()) {
            throw InvariantViolation("Cannot take the best individual of an empty population");
        }
        return ranker_->best(population_);
    }
};

} // namespace evocore::core
