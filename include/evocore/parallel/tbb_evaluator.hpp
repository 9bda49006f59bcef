#pragma once

#ifdef EVOCORE_HAVE_TBB

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/state.hpp>
#include <evocore/evaluation/evaluator.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace evocore::parallel {

/// Parallel fitness evaluation backed by oneTBB
///
/// The individuals that need a fitness are gathered first; their fitness values are then computed
/// with tbb::parallel_for over a static_partitioner, so chunk boundaries are the same on every
/// run. Each task writes into its own slot of a result buffer, and the new population is only
/// assembled once every task has finished, in the original population order.
///
/// @warning The fitness function is called concurrently and must be thread-safe.
///
/// Exceptions thrown by the fitness function propagate out of evaluate() and leave the input
/// state untouched.
template <core::Gene G>
class TbbEvaluator final : public evaluation::EvaluationExecutor<G> {
    evaluation::FitnessFunction<G> fitness_;

  public:
    /// @throws core::EngineConfigError if the fitness function is empty
    explicit TbbEvaluator(evaluation::FitnessFunction<G> fitness) : fitness_(std::move(fitness)) {
        if (!fitness_) {
            throw core::EngineConfigError("TbbEvaluator requires a fitness function");
        }
    }

    [[nodiscard]] core::EvolutionState<G> evaluate(const core::EvolutionState<G>& state,
                                                   bool force = false) const override {
        const auto& population = state.population();

        std::vector<std::size_t> pending;
        pending.reserve(population.size());
        for (std::size_t i = 0; i < population.size(); ++i) {
            if (force || !population[i].is_evaluated()) {
                pending.push_back(i);
            }
        }
        if (pending.empty()) {
            return state;
        }

        std::vector<double> fitnesses(pending.size());
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, pending.size()),
            [this, &population, &pending, &fitnesses](const tbb::blocked_range<std::size_t>& range) {
                for (std::size_t k = range.begin(); k != range.end(); ++k) {
                    fitnesses[k] = fitness_(population[pending[k]].genotype());
                }
            },
            tbb::static_partitioner{});

        core::Population<G> evaluated = population;
        for (std::size_t k = 0; k < pending.size(); ++k) {
            const std::size_t index = pending[k];
            evaluated[index] =
                population[index].with_fitness(evaluation::detail::checked_fitness(fitnesses[k], index));
        }
        return state.with_population(std::move(evaluated));
    }

    [[nodiscard]] std::string name() const override { return "TbbEvaluator"; }
};

} // namespace evocore::parallel

#else

#error "\n" \
       "====================================================================\n" \
       " TBB (Threading Building Blocks) is required for parallel evaluation\n" \
       " but was not found during configuration.\n" \
       "\n" \
       " Resolution options:\n" \
       "   1. Install the oneTBB development package:\n" \
       "      - Ubuntu/Debian: apt install libtbb-dev\n" \
       "      - RHEL/CentOS:   yum install tbb-devel\n" \
       "      - macOS:         brew install tbb\n" \
       "\n" \
       "   2. Evaluate sequentially instead:\n" \
       "      cmake -DEVOCORE_USE_TBB=OFF .\n" \
       "      and use evocore::evaluation::SequentialEvaluator\n" \
       "===================================================================="

#endif // EVOCORE_HAVE_TBB
