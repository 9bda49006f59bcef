#pragma once

/// @file history.hpp
/// @brief Per-generation statistics collected while the engine evolves
///
/// The history is the read-only view termination limits and listeners get of the run so far.
/// It replaces any back-reference from a limit to the engine that owns it.

#include <chrono>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/state.hpp>

namespace evocore::core {

/// Fitness statistics of one population
struct PopulationSummary {
    double best = std::numeric_limits<double>::quiet_NaN();
    double worst = std::numeric_limits<double>::quiet_NaN();
    double mean = std::numeric_limits<double>::quiet_NaN();
    std::size_t size = 0;
};

/// Best/worst under the state's ranker, arithmetic mean over evaluated individuals
template <Gene G>
PopulationSummary summarize(const EvolutionState<G>& state) {
    PopulationSummary summary;
    summary.size = state.size();
    if (state.is_empty()) {
        return summary;
    }

    const auto& ranker = state.ranker();
    summary.best = ranker.best(state.population()).fitness();
    summary.worst = ranker.worst(state.population()).fitness();

    double total = 0.0;
    std::size_t evaluated = 0;
    for (const auto& individual : state.population()) {
        if (individual.is_evaluated()) {
            total += individual.fitness();
            ++evaluated;
        }
    }
    if (evaluated > 0) {
        summary.mean = total / static_cast<double>(evaluated);
    }
    return summary;
}

/// Record of one completed generation
struct GenerationRecord {
    std::size_t generation = 0;
    double best_fitness = 0.0;
    double worst_fitness = 0.0;
    double mean_fitness = 0.0;
    std::size_t population_size = 0;
    /// Generations since the best fitness of the run last improved
    std::size_t steady_generations = 0;
    std::chrono::nanoseconds duration{0};
};

/// Ordered generation records plus the wall clock of the current run
class EvolutionHistory {
    using clock = std::chrono::steady_clock;

    std::vector<GenerationRecord> records_;
    std::optional<clock::time_point> started_at_;
    std::size_t steady_ = 0;
    double best_so_far_ = std::numeric_limits<double>::quiet_NaN();

  public:
    /// Forget previous records and start the wall clock
    void start() {
        records_.clear();
        steady_ = 0;
        best_so_far_ = std::numeric_limits<double>::quiet_NaN();
        started_at_ = clock::now();
    }

    /// Append the record of a completed generation
    ///
    /// The steady counter resets whenever the generation's best beats the best seen so far under
    /// the state's ranker and grows by one otherwise. The first recorded generation always counts
    /// as an improvement.
    template <Gene G>
    const GenerationRecord& record(const EvolutionState<G>& state, std::chrono::nanoseconds duration) {
        if (!started_at_) {
            started_at_ = clock::now();
        }

        const auto summary = summarize(state);
        if (std::isnan(best_so_far_) || state.ranker().is_better(summary.best, best_so_far_)) {
            best_so_far_ = summary.best;
            steady_ = 0;
        } else {
            ++steady_;
        }

        GenerationRecord rec;
        rec.generation = state.generation();
        rec.best_fitness = summary.best;
        rec.worst_fitness = summary.worst;
        rec.mean_fitness = summary.mean;
        rec.population_size = summary.size;
        rec.steady_generations = steady_;
        rec.duration = duration;
        records_.push_back(rec);
        return records_.back();
    }

    [[nodiscard]] const std::vector<GenerationRecord>& generations() const noexcept {
        return records_;
    }

    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// @throws std::out_of_range if nothing has been recorded
    [[nodiscard]] const GenerationRecord& last() const {
        if (records_.empty()) {
            throw std::out_of_range("EvolutionHistory is empty");
        }
        return records_.back();
    }

    /// Generations since the best fitness last improved
    [[nodiscard]] std::size_t steady_generations() const noexcept { return steady_; }

    /// Wall-clock time since start(); zero before the run starts
    [[nodiscard]] std::chrono::nanoseconds elapsed() const {
        if (!started_at_) {
            return std::chrono::nanoseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - *started_at_);
    }
};

} // namespace evocore::core
