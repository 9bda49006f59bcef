#pragma once

/// @file limits.hpp
/// @brief Termination limits checked by the engine after every generation
///
/// A limit sees the latest state plus the run history and answers whether evolution should stop.
/// The engine stops as soon as any registered limit fires.

#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/history.hpp>
#include <evocore/core/state.hpp>

namespace evocore::limits {

template <core::Gene G>
class Limit {
  public:
    virtual ~Limit() = default;

    [[nodiscard]] virtual bool operator()(const core::EvolutionState<G>& state,
                                          const core::EvolutionHistory& history) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

template <core::Gene G>
using LimitPtr = std::shared_ptr<const Limit<G>>;

/// Fires once the state's generation counter reaches `generations`
template <core::Gene G>
class MaxGenerations final : public Limit<G> {
    std::size_t generations_;

  public:
    explicit MaxGenerations(std::size_t generations) : generations_(generations) {}

    [[nodiscard]] bool operator()(const core::EvolutionState<G>& state,
                                  const core::EvolutionHistory&) const override {
        return state.generation() >= generations_;
    }

    [[nodiscard]] std::size_t generations() const noexcept { return generations_; }

    [[nodiscard]] std::string name() const override {
        return "MaxGenerations(" + std::to_string(generations_) + ")";
    }
};

/// How TargetFitness compares the best fitness with its target value
enum class TargetComparison { at_least, at_most, equal_to };

/// Fires when the best individual under the state's ranker satisfies a predicate on its fitness
///
/// Unevaluated or empty populations never satisfy the limit.
template <core::Gene G>
class TargetFitness final : public Limit<G> {
  public:
    using Predicate = std::function<bool(double)>;

  private:
    Predicate predicate_;
    std::string description_;

  public:
    /// @throws core::LimitConfigError if the predicate is empty
    explicit TargetFitness(Predicate predicate, std::string description = "predicate")
        : predicate_(std::move(predicate)), description_(std::move(description)) {
        if (!predicate_) {
            throw core::LimitConfigError("TargetFitness requires a predicate");
        }
    }

    /// @throws core::LimitConfigError if target is NaN
    TargetFitness(double target, TargetComparison comparison)
        : TargetFitness(make_predicate(target, comparison), describe(target, comparison)) {}

    [[nodiscard]] bool operator()(const core::EvolutionState<G>& state,
                                  const core::EvolutionHistory&) const override {
        if (state.is_empty()) {
            return false;
        }
        const auto& best = state.ranker().best(state.population());
        return best.is_evaluated() && predicate_(best.fitness());
    }

    [[nodiscard]] std::string name() const override {
        return "TargetFitness(" + description_ + ")";
    }

  private:
    static Predicate make_predicate(double target, TargetComparison comparison) {
        if (std::isnan(target)) {
            throw core::LimitConfigError("TargetFitness target must not be NaN");
        }
        switch (comparison) {
        case TargetComparison::at_least:
            return [target](double fitness) { return fitness >= target; };
        case TargetComparison::at_most:
            return [target](double fitness) { return fitness <= target; };
        case TargetComparison::equal_to:
            return [target](double fitness) { return fitness == target; };
        }
        throw core::LimitConfigError("Unknown target comparison");
    }

    static std::string describe(double target, TargetComparison comparison) {
        switch (comparison) {
        case TargetComparison::at_least:
            return ">= " + std::to_string(target);
        case TargetComparison::at_most:
            return "<= " + std::to_string(target);
        case TargetComparison::equal_to:
            return "== " + std::to_string(target);
        }
        return std::to_string(target);
    }
};

/// Fires when the best fitness has not improved for `generations` consecutive generations
template <core::Gene G>
class SteadyGenerations final : public Limit<G> {
    std::size_t generations_;

  public:
    /// @throws core::LimitConfigError if generations is zero
    explicit SteadyGenerations(std::size_t generations) : generations_(generations) {
        if (generations_ == 0) {
            throw core::LimitConfigError("SteadyGenerations needs at least one generation");
        }
    }

    [[nodiscard]] bool operator()(const core::EvolutionState<G>&,
                                  const core::EvolutionHistory& history) const override {
        return history.steady_generations() >= generations_;
    }

    [[nodiscard]] std::size_t generations() const noexcept { return generations_; }

    [[nodiscard]] std::string name() const override {
        return "SteadyGenerations(" + std::to_string(generations_) + ")";
    }
};

/// Fires once the run has been going for at least `duration` of wall-clock time
template <core::Gene G>
class TimeLimit final : public Limit<G> {
    std::chrono::nanoseconds duration_;

  public:
    /// @throws core::LimitConfigError if duration is negative
    template <typename Rep, typename Period>
    explicit TimeLimit(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::nanoseconds>(duration)) {
        if (duration_.count() < 0) {
            throw core::LimitConfigError("TimeLimit duration must not be negative");
        }
    }

    [[nodiscard]] bool operator()(const core::EvolutionState<G>&,
                                  const core::EvolutionHistory& history) const override {
        return history.elapsed() >= duration_;
    }

    [[nodiscard]] std::chrono::nanoseconds duration() const noexcept { return duration_; }

    [[nodiscard]] std::string name() const override {
        return "TimeLimit(" +
               std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration_).count()) +
               "ms)";
    }
};

/// True when any limit fires
template <core::Gene G>
bool any_limit_reached(const std::vector<LimitPtr<G>>& limits,
                       const core::EvolutionState<G>& state,
                       const core::EvolutionHistory& history) {
    for (const auto& limit : limits) {
        if ((*limit)(state, history)) {
            return true;
        }
    }
    return false;
}

} // namespace evocore::limits
