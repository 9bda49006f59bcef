#pragma once

/// @file evaluator.hpp
/// @brief Fitness evaluation executors

#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/genotype.hpp>
#include <evocore/core/individual.hpp>
#include <evocore/core/state.hpp>

namespace evocore::evaluation {

/// User-supplied fitness function; must be deterministic for a given genotype
template <core::Gene G>
using FitnessFunction = std::function<double(const core::Genotype<G>&)>;

/// Assigns a fitness to every unevaluated individual of a state
///
/// Implementations keep the population order and size. Individuals that already carry a fitness
/// are left untouched unless `force` is set.
template <core::Gene G>
class EvaluationExecutor {
  public:
    virtual ~EvaluationExecutor() = default;

    [[nodiscard]] virtual core::EvolutionState<G> evaluate(const core::EvolutionState<G>& state,
                                                           bool force = false) const = 0;

    [[nodiscard]] core::EvolutionState<G> operator()(const core::EvolutionState<G>& state) const {
        return evaluate(state, false);
    }

    [[nodiscard]] virtual std::string name() const = 0;
};

template <core::Gene G>
using EvaluatorPtr = std::shared_ptr<const EvaluationExecutor<G>>;

/// @private
namespace detail {

/// @throws core::InvariantViolation if the fitness function returned NaN
inline double checked_fitness(double fitness, std::size_t index) {
    if (std::isnan(fitness)) {
        throw core::InvariantViolation("Fitness function returned NaN for individual " +
                                       std::to_string(index));
    }
    return fitness;
}

} // namespace detail

/// Evaluates individuals one after the other, in population order
template <core::Gene G>
class SequentialEvaluator final : public EvaluationExecutor<G> {
    FitnessFunction<G> fitness_;

  public:
    /// @throws core::EngineConfigError if the fitness function is empty
    explicit SequentialEvaluator(FitnessFunction<G> fitness) : fitness_(std::move(fitness)) {
        if (!fitness_) {
            throw core::EngineConfigError("SequentialEvaluator requires a fitness function");
        }
    }

    [[nodiscard]] core::EvolutionState<G> evaluate(const core::EvolutionState<G>& state,
                                                   bool force = false) const override {
        core::Population<G> evaluated;
        evaluated.reserve(state.size());
        const auto& population = state.population();
        for (std::size_t i = 0; i < population.size(); ++i) {
            const auto& individual = population[i];
            if (individual.is_evaluated() && !force) {
                evaluated.push_back(individual);
            } else {
                evaluated.push_back(individual.with_fitness(
                    detail::checked_fitness(fitness_(individual.genotype()), i)));
            }
        }
        return state.with_population(std::move(evaluated));
    }

    [[nodiscard]] std::string name() const override { return "SequentialEvaluator"; }
};

} // namespace evocore::evaluation
