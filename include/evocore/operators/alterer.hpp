#pragma once

/// @file alterer.hpp
/// @brief Alterer interface and the ordered alteration pipeline

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/state.hpp>

namespace evocore::operators {

/// Genetic operator transforming a population (mutation, recombination)
///
/// An alterer receives the selected parents and the number of individuals it must return. The
/// result carries the input's generation and ranker.
template <core::Gene G>
class Alterer {
  public:
    virtual ~Alterer() = default;

    [[nodiscard]] virtual core::EvolutionState<G> operator()(const core::EvolutionState<G>& state,
                                                             std::size_t output_size,
                                                             std::mt19937& rng) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

template <core::Gene G>
using AltererPtr = std::shared_ptr<const Alterer<G>>;

/// Apply alterers left to right, each consuming the previous one's output
///
/// An empty pipeline returns the input state unchanged.
template <core::Gene G>
core::EvolutionState<G> alter(const std::vector<AltererPtr<G>>& alterers,
                              core::EvolutionState<G> state, std::size_t output_size,
                              std::mt19937& rng) {
    for (const auto& alterer : alterers) {
        state = (*alterer)(state, output_size, rng);
    }
    return state;
}

} // namespace evocore::operators
