#pragma once

/// @file selection.hpp
/// @brief Selection operators: tournament, roulette wheel and uniform random
///
/// Selectors draw `count` individuals (with replacement) from a state's population and return a
/// new state with the same generation and ranker. Every comparison goes through the state's
/// Ranker, so each selector serves maximization and minimization alike.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <random>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/individual.hpp>
#include <evocore/core/ranker.hpp>
#include <evocore/core/state.hpp>

namespace evocore::operators {

/// @private
namespace detail {

/// Populations up to this size are searched linearly on the cumulative wheel
inline constexpr std::size_t linear_search_threshold = 35;

/// Running sum of a probability vector; the last entry is pinned to exactly 1
inline std::vector<double> cumulative_probabilities(std::span<const double> probabilities) {
    std::vector<double> cumulative(probabilities.size());
    std::partial_sum(probabilities.begin(), probabilities.end(), cumulative.begin());
    if (!cumulative.empty()) {
        cumulative.back() = 1.0;
    }
    return cumulative;
}

/// First index whose cumulative value is >= draw, scanning from the front
inline std::size_t linear_lookup(std::span<const double> cumulative, double draw) noexcept {
    for (std::size_t i = 0; i < cumulative.size(); ++i) {
        if (cumulative[i] >= draw) {
            return i;
        }
    }
    return cumulative.size() - 1;
}

/// First index whose cumulative value is >= draw, by binary search
inline std::size_t binary_lookup(std::span<const double> cumulative, double draw) noexcept {
    const auto it = std::lower_bound(cumulative.begin(), cumulative.end(), draw);
    if (it == cumulative.end()) {
        return cumulative.size() - 1;
    }
    return static_cast<std::size_t>(it - cumulative.begin());
}

} // namespace detail

/// Base class of every selection strategy
///
/// operator() validates the request and the result; subclasses implement select() only.
template <core::Gene G>
class Selector {
  public:
    virtual ~Selector() = default;

    /// Select `count` individuals from the state's population
    ///
    /// @throws core::SelectionError if count is negative, or positive on an empty population
    /// @throws core::InvariantViolation if select() returns the wrong number of individuals
    [[nodiscard]] core::EvolutionState<G> operator()(const core::EvolutionState<G>& state,
                                                     std::ptrdiff_t count,
                                                     std::mt19937& rng) const {
        if (count < 0) {
            throw core::SelectionError("Selection count must be non-negative, got " +
                                       std::to_string(count));
        }
        if (count > 0 && state.is_empty()) {
            throw core::SelectionError("Cannot select " + std::to_string(count) +
                                       " individuals from an empty population");
        }

        const auto requested = static_cast<std::size_t>(count);
        auto selected = select(state.population(), requested, state.ranker(), rng);
        if (selected.size() != requested) {
            throw core::InvariantViolation(name() + " returned " +
                                           std::to_string(selected.size()) +
                                           " individuals, expected " + std::to_string(requested));
        }
        return state.with_population(std::move(selected));
    }

    /// Strategy body; population is non-empty whenever count > 0
    [[nodiscard]] virtual core::Population<G> select(const core::Population<G>& population,
                                                     std::size_t count,
                                                     const core::Ranker<G>& ranker,
                                                     std::mt19937& rng) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/// Tournament selection
///
/// For every slot, `sample_size` contestants are drawn uniformly with replacement and the best
/// one under the ranker wins. Ties go to the contestant drawn first.
///
/// ## Example Usage:
/// ```cpp
/// TournamentSelector<IntGene> selector(3);
/// auto parents = selector(state, 20, rng);
/// ```
template <core::Gene G>
class TournamentSelector final : public Selector<G> {
    std::size_t sample_size_;

  public:
    /// @throws core::SelectionError if sample_size is zero
    explicit TournamentSelector(std::size_t sample_size = 3) : sample_size_(sample_size) {
        if (sample_size_ == 0) {
            throw core::SelectionError("Tournament sample size must be at least 1");
        }
    }

    [[nodiscard]] core::Population<G> select(const core::Population<G>& population,
                                             std::size_t count, const core::Ranker<G>& ranker,
                                             std::mt19937& rng) const override {
        core::Population<G> selected;
        if (count == 0) {
            return selected;
        }
        selected.reserve(count);

        std::uniform_int_distribution<std::size_t> dist(0, population.size() - 1);
        for (std::size_t slot = 0; slot < count; ++slot) {
            std::size_t best = dist(rng);
            for (std::size_t i = 1; i < sample_size_; ++i) {
                const std::size_t candidate = dist(rng);
                if (ranker.compare(population[candidate], population[best]) > 0) {
                    best = candidate;
                }
            }
            selected.push_back(population[best]);
        }
        return selected;
    }

    [[nodiscard]] std::size_t sample_size() const noexcept { return sample_size_; }

    [[nodiscard]] std::string name() const override { return "TournamentSelector"; }
};

/// Fitness-proportionate (roulette wheel) selection
///
/// ## Algorithm:
/// 1. Optionally sort the population best-first with the ranker
/// 2. Apply the ranker's fitness transform, so larger always means better
/// 3. Shift every value by -min when the minimum is negative
/// 4. Normalize to probabilities; a zero or non-finite total falls back to 1/n each
/// 5. Spin the wheel `count` times over the cumulative probabilities
///
/// Wheels of up to 35 slots are searched linearly, larger ones by binary search.
template <core::Gene G>
class RouletteWheelSelector final : public Selector<G> {
    bool sorted_;

  public:
    explicit RouletteWheelSelector(bool sorted = false) : sorted_(sorted) {}

    /// Selection probability of each individual, in population order
    ///
    /// @throws core::InvariantViolation if the normalized vector does not sum to 1
    [[nodiscard]] std::vector<double> probabilities(const core::Population<G>& population,
                                                    const core::Ranker<G>& ranker) const {
        const std::size_t n = population.size();
        if (n == 0) {
            return {};
        }

        std::vector<double> values;
        values.reserve(n);
        for (const auto& individual : population) {
            values.push_back(individual.fitness());
        }
        values = ranker.fitness_transform(std::move(values));

        const bool all_finite =
            std::ranges::all_of(values, [](double v) { return std::isfinite(v); });
        double total = 0.0;
        if (all_finite) {
            const double min_value = *std::ranges::min_element(values);
            const double shift = min_value < 0.0 ? -min_value : 0.0;
            for (auto& value : values) {
                value += shift;
            }
            total = std::accumulate(values.begin(), values.end(), 0.0);
        }

        if (!all_finite || !std::isfinite(total) || total == 0.0) {
            return std::vector<double>(n, 1.0 / static_cast<double>(n));
        }

        for (auto& value : values) {
            value /= total;
        }
        const double check = std::accumulate(values.begin(), values.end(), 0.0);
        if (std::abs(check - 1.0) > 1e-6) {
            throw core::InvariantViolation("Roulette probabilities sum to " +
                                           std::to_string(check) + " instead of 1");
        }
        return values;
    }

    [[nodiscard]] core::Population<G> select(const core::Population<G>& population,
                                             std::size_t count, const core::Ranker<G>& ranker,
                                             std::mt19937& rng) const override {
        core::Population<G> selected;
        if (count == 0) {
            return selected;
        }
        selected.reserve(count);

        const core::Population<G> wheel = sorted_ ? ranker.sorted(population) : population;
        const auto cumulative = detail::cumulative_probabilities(probabilities(wheel, ranker));
        const bool linear = cumulative.size() <= detail::linear_search_threshold;

        std::uniform_real_distribution<double> dist(0.0, 1.0);
        for (std::size_t slot = 0; slot < count; ++slot) {
            const double draw = dist(rng);
            const std::size_t index = linear ? detail::linear_lookup(cumulative, draw)
                                             : detail::binary_lookup(cumulative, draw);
            selected.push_back(wheel[index]);
        }
        return selected;
    }

    [[nodiscard]] bool is_sorted() const noexcept { return sorted_; }

    [[nodiscard]] std::string name() const override { return "RouletteWheelSelector"; }
};

/// Uniform selection with replacement; ignores fitness
template <core::Gene G>
class RandomSelector final : public Selector<G> {
  public:
    [[nodiscard]] core::Population<G> select(const core::Population<G>& population,
                                             std::size_t count, const core::Ranker<G>&,
                                             std::mt19937& rng) const override {
        core::Population<G> selected;
        if (count == 0) {
            return selected;
        }
        selected.reserve(count);
        std::uniform_int_distribution<std::size_t> dist(0, population.size() - 1);
        for (std::size_t slot = 0; slot < count; ++slot) {
            selected.push_back(population[dist(rng)]);
        }
        return selected;
    }

    [[nodiscard]] std::string name() const override { return "RandomSelector"; }
};

} // namespace evocore::operators
