#pragma once

/// @file engine.hpp
/// @brief Generational evolution engine
///
/// The engine owns its configuration, its random stream and the history of the current run.
/// One call to iterate() performs one generation:
///
/// 1. before-intercept
/// 2. initialize the population if the state is empty
/// 3. evaluate
/// 4. select floor((1 - r) * N) parents
/// 5. select ceil(r * N) survivors from the same evaluated population
/// 6. fold the alterers over the parents
/// 7. merge survivors then offspring
/// 8. evaluate the merged population
/// 9. after-intercept
/// 10. advance the generation counter
///
/// evolve() repeats iterate() until one of the configured limits fires.

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/genotype.hpp>
#include <evocore/core/history.hpp>
#include <evocore/core/individual.hpp>
#include <evocore/core/ranker.hpp>
#include <evocore/core/state.hpp>
#include <evocore/evaluation/evaluator.hpp>
#include <evocore/limits/limits.hpp>
#include <evocore/listeners/listener.hpp>
#include <evocore/operators/alterer.hpp>
#include <evocore/operators/selection.hpp>

namespace evocore::core {

/// Hooks transforming the state at the start and at the end of every generation
template <Gene G>
struct EvolutionInterceptor {
    using Hook = std::function<EvolutionState<G>(EvolutionState<G>)>;

    Hook before = [](EvolutionState<G> state) { return state; };
    Hook after = [](EvolutionState<G> state) { return state; };
};

/// Everything an EvolutionEngine needs; validated by the engine constructor
template <Gene G>
struct EngineConfig {
    GenotypeFactory<G> genotype_factory;
    evaluation::FitnessFunction<G> fitness_function;

    std::size_t population_size = 50;
    double survival_rate = 0.4;

    std::shared_ptr<const operators::Selector<G>> parent_selector =
        std::make_shared<operators::TournamentSelector<G>>(3);
    std::shared_ptr<const operators::Selector<G>> survivor_selector =
        std::make_shared<operators::TournamentSelector<G>>(3);

    // Applied in order to the parents
    std::vector<operators::AltererPtr<G>> alterers;
    // At least one is required
    std::vector<limits::LimitPtr<G>> limits;

    std::shared_ptr<const Ranker<G>> ranker = std::make_shared<MaxRanker<G>>();
    std::vector<listeners::ListenerPtr<G>> listeners;

    /// Optional; a SequentialEvaluator over fitness_function when null
    evaluation::EvaluatorPtr<G> evaluator;
    EvolutionInterceptor<G> interceptor;

    std::uint64_t seed = 1;
};

/// @private
namespace detail {

/// Products within this distance of an integer are treated as that integer
inline constexpr double count_tolerance = 1e-9;

inline double snapped(double product) noexcept {
    const double nearest = std::round(product);
    return std::abs(product - nearest) < count_tolerance ? nearest : product;
}

/// Mersenne Twister seeded from both halves of a 64-bit seed
inline std::mt19937 seeded_rng(std::uint64_t seed) {
    std::seed_seq sequence{static_cast<std::uint32_t>(seed & 0xffffffffu),
                           static_cast<std::uint32_t>(seed >> 32)};
    return std::mt19937(sequence);
}

} // namespace detail

/// ceil(survival_rate * population_size)
[[nodiscard]] inline std::size_t survivor_count(std::size_t population_size,
                                                double survival_rate) noexcept {
    return static_cast<std::size_t>(
        std::ceil(detail::snapped(survival_rate * static_cast<double>(population_size))));
}

/// floor((1 - survival_rate) * population_size)
[[nodiscard]] inline std::size_t parent_count(std::size_t population_size,
                                              double survival_rate) noexcept {
    return static_cast<std::size_t>(
        std::floor(detail::snapped((1.0 - survival_rate) * static_cast<double>(population_size))));
}

template <Gene G>
class EvolutionEngine {
  public:
    using State = EvolutionState<G>;

  private:
    EngineConfig<G> config_;
    std::mt19937 rng_;
    EvolutionHistory history_;

  public:
    /// @throws EngineConfigError if the configuration is incomplete or out of range
    explicit EvolutionEngine(EngineConfig<G> config)
        : config_(std::move(config)), rng_(detail::seeded_rng(config_.seed)) {
        validate();
        if (!config_.evaluator) {
            config_.evaluator =
                std::make_shared<evaluation::SequentialEvaluator<G>>(config_.fitness_function);
        }
    }

    /// Evolve from an empty state until a limit fires
    State evolve() { return evolve(State::empty(config_.ranker)); }

    /// Resume evolution from a caller-supplied state until a limit fires
    ///
    /// At least one generation is always performed.
    State evolve(const State& initial) {
        history_.start();
        notify([&](auto& l) { l.on_evolution_started(initial); });

        State current = initial;
        do {
            notify([&](auto& l) { l.on_generation_started(current); });
            const auto started = std::chrono::steady_clock::now();
            current = iterate(current);
            const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - started);
            const auto& record = history_.record(current, duration);
            notify([&](auto& l) { l.on_generation_ended(current, record); });
        } while (!limits::any_limit_reached(config_.limits, current, history_));

        notify([&](auto& l) { l.on_evolution_ended(current, history_); });
        return current;
    }

    /// One full generation
    ///
    /// @throws InvariantViolation if a plugin breaks the population size or evaluation contract
    State iterate(const State& state) {
        State current = config_.interceptor.before(state);
        current = start_evolution(current);
        current = evaluate_population(current);

        const State parents = select_parents(current);
        const State survivors = select_survivors(current);
        const State offspring = alter_offspring(parents);

        Population<G> merged;
        merged.reserve(survivors.size() + offspring.size());
        merged.insert(merged.end(), survivors.population().begin(), survivors.population().end());
        merged.insert(merged.end(), offspring.population().begin(), offspring.population().end());
        if (merged.size() != config_.population_size) {
            throw InvariantViolation("Merged population has " + std::to_string(merged.size()) +
                                     " individuals, expected " +
                                     std::to_string(config_.population_size));
        }

        State next = evaluate_population(current.with_population(std::move(merged)));
        next = config_.interceptor.after(std::move(next));
        return next.with_generation(next.generation() + 1);
    }

    /// Initialize the population when the state is empty; pass it through otherwise
    State start_evolution(const State& state) {
        if (!state.is_empty()) {
            return state;
        }
        notify([&](auto& l) { l.on_initialization_started(state); });
        Population<G> population;
        population.reserve(config_.population_size);
        for (std::size_t i = 0; i < config_.population_size; ++i) {
            population.emplace_back(config_.genotype_factory(rng_));
        }
        State initialized = state.with_population(std::move(population));
        notify([&](auto& l) { l.on_initialization_ended(initialized); });
        return initialized;
    }

    /// @throws InvariantViolation if the population size differs from the configured size before
    ///         or after evaluation, or if the evaluator leaves an individual unevaluated
    State evaluate_population(const State& state) {
        require_population_size(state, "before evaluation");
        notify([&](auto& l) { l.on_evaluation_started(state); });
        State evaluated = config_.evaluator->evaluate(state);
        require_population_size(evaluated, "after evaluation");
        for (const auto& individual : evaluated.population()) {
            if (!individual.is_evaluated()) {
                throw InvariantViolation(config_.evaluator->name() +
                                         " left an individual unevaluated");
            }
        }
        notify([&](auto& l) { l.on_evaluation_ended(evaluated); });
        return evaluated;
    }

    State select_parents(const State& state) {
        notify([&](auto& l) { l.on_parent_selection_started(state); });
        State parents = (*config_.parent_selector)(state, static_cast<std::ptrdiff_t>(parent_count()),
                                                   rng_);
        notify([&](auto& l) { l.on_parent_selection_ended(parents); });
        return parents;
    }

    State select_survivors(const State& state) {
        notify([&](auto& l) { l.on_survivor_selection_started(state); });
        State survivors = (*config_.survivor_selector)(
            state, static_cast<std::ptrdiff_t>(survivor_count()), rng_);
        notify([&](auto& l) { l.on_survivor_selection_ended(survivors); });
        return survivors;
    }

    /// @throws InvariantViolation if the alterers change the number of individuals
    State alter_offspring(const State& parents) {
        notify([&](auto& l) { l.on_alteration_started(parents); });
        State offspring = operators::alter(config_.alterers, parents, parents.size(), rng_);
        if (offspring.size() != parents.size()) {
            throw InvariantViolation("Alterers produced " + std::to_string(offspring.size()) +
                                     " offspring from " + std::to_string(parents.size()) +
                                     " parents");
        }
        notify([&](auto& l) { l.on_alteration_ended(offspring); });
        return offspring;
    }

    [[nodiscard]] std::size_t parent_count() const noexcept {
        return core::parent_count(config_.population_size, config_.survival_rate);
    }

    [[nodiscard]] std::size_t survivor_count() const noexcept {
        return core::survivor_count(config_.population_size, config_.survival_rate);
    }

    [[nodiscard]] const EvolutionHistory& history() const noexcept { return history_; }

    [[nodiscard]] const EngineConfig<G>& config() const noexcept { return config_; }

    [[nodiscard]] std::mt19937& rng() noexcept { return rng_; }

  private:
    void validate() const {
        if (!config_.genotype_factory) {
            throw EngineConfigError("A genotype factory is required");
        }
        if (!config_.fitness_function && !config_.evaluator) {
            throw EngineConfigError("A fitness function or an evaluator is required");
        }
        if (config_.population_size == 0) {
            throw EngineConfigError("Population size must be positive");
        }
        if (!(config_.survival_rate >= 0.0 && config_.survival_rate <= 1.0)) {
            throw EngineConfigError("Survival rate must be in [0, 1], got " +
                                    std::to_string(config_.survival_rate));
        }
        if (!config_.parent_selector || !config_.survivor_selector) {
            throw EngineConfigError("Parent and survivor selectors are required");
        }
        if (!config_.ranker) {
            throw EngineConfigError("A ranker is required");
        }
        if (config_.limits.empty()) {
            throw EngineConfigError("At least one limit is required");
        }
        for (const auto& limit : config_.limits) {
            if (!limit) {
                throw EngineConfigError("Limits must not be null");
            }
        }
        for (const auto& alterer : config_.alterers) {
            if (!alterer) {
                throw EngineConfigError("Alterers must not be null");
            }
        }
        for (const auto& listener : config_.listeners) {
            if (!listener) {
                throw EngineConfigError("Listeners must not be null");
            }
        }
        if (!config_.interceptor.before || !config_.interceptor.after) {
            throw EngineConfigError("Interceptor hooks must be callable");
        }
    }

    void require_population_size(const State& state, const char* phase) const {
        if (state.size() != config_.population_size) {
            throw InvariantViolation("Population has " + std::to_string(state.size()) +
                                     " individuals " + phase + ", expected " +
                                     std::to_string(config_.population_size));
        }
    }

    template <typename F>
    void notify(F&& hook) {
        for (const auto& listener : config_.listeners) {
            hook(*listener);
        }
    }
};

} // namespace evocore::core
