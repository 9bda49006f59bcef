#pragma once

/// @file ranker.hpp
/// @brief Ranking policies unifying maximization and minimization
///
/// Every selector, limit and listener compares individuals through a Ranker rather than through
/// raw fitness values, so the same operators serve both optimization directions.

#include <algorithm>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/individual.hpp>

namespace evocore::core {

/// Stateless ordering policy over individuals
///
/// compare(a, b) > 0 means "a is better than b". Ranker instances are shared between the engine
/// and every state it produces.
template <Gene G>
class Ranker {
  public:
    virtual ~Ranker() = default;

    /// Three-way comparison of two fitness values returning -1, 0 or 1
    [[nodiscard]] virtual int compare_fitness(double a, double b) const = 0;

    /// Three-way comparison of two individuals; defaults to comparing their fitness
    [[nodiscard]] virtual int compare(const Individual<G>& a, const Individual<G>& b) const {
        return compare_fitness(a.fitness(), b.fitness());
    }

    /// Map raw fitness values so that larger means better (used by roulette selection)
    [[nodiscard]] virtual std::vector<double> fitness_transform(std::vector<double> values) const {
        return values;
    }

    [[nodiscard]] virtual std::string name() const = 0;

    /// Stable sort, best individual first
    void sort(Population<G>& population) const {
        std::ranges::stable_sort(population, [this](const Individual<G>& a,
                                                    const Individual<G>& b) {
            return compare(a, b) > 0;
        });
    }

    [[nodiscard]] Population<G> sorted(Population<G> population) const {
        sort(population);
        return population;
    }

    /// First best individual of a non-empty population
    [[nodiscard]] const Individual<G>& best(const Population<G>& population) const {
        auto best = population.begin();
        for (auto it = population.begin(); it != population.end(); ++it) {
            if (compare(*it, *best) > 0) {
                best = it;
            }
        }
        return *best;
    }

    /// First worst individual of a non-empty population
    [[nodiscard]] const Individual<G>& worst(const Population<G>& population) const {
        auto worst = population.begin();
        for (auto it = population.begin(); it != population.end(); ++it) {
            if (compare(*it, *worst) < 0) {
                worst = it;
            }
        }
        return *worst;
    }

    /// True when candidate ranks strictly above incumbent
    [[nodiscard]] bool is_better(double candidate, double incumbent) const {
        return compare_fitness(candidate, incumbent) > 0;
    }

  protected:
    [[nodiscard]] static int sign(double delta) noexcept { return (delta > 0.0) - (delta < 0.0); }
};

/// Higher fitness is better
template <Gene G>
class MaxRanker final : public Ranker<G> {
  public:
    [[nodiscard]] int compare_fitness(double a, double b) const override {
        return Ranker<G>::sign(a - b);
    }

    [[nodiscard]] std::string name() const override { return "max"; }
};

/// Lower fitness is better
///
/// The fitness transform maps v to sum(values) - v, so the smallest value gets the largest share
/// when a roulette wheel is spun over the transformed values.
template <Gene G>
class MinRanker final : public Ranker<G> {
  public:
    [[nodiscard]] int compare_fitness(double a, double b) const override {
        return Ranker<G>::sign(b - a);
    }

    [[nodiscard]] std::vector<double> fitness_transform(std::vector<double> values) const override {
        const double total = std::accumulate(values.begin(), values.end(), 0.0);
        for (auto& value : values) {
            value = total - value;
        }
        return values;
    }

    [[nodiscard]] std::string name() const override { return "min"; }
};

} // namespace evocore::core
