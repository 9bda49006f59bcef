#pragma once

/// @file listener.hpp
/// @brief Observer interface notified at each phase of a run
///
/// Every hook is a no-op by default; listeners override the ones they care about. Listeners only
/// observe: they receive const views and cannot alter the run.

#include <memory>

#include <evocore/core/concepts.hpp>
#include <evocore/core/history.hpp>
#include <evocore/core/state.hpp>

namespace evocore::listeners {

template <core::Gene G>
class EvolutionListener {
  public:
    using State = core::EvolutionState<G>;

    virtual ~EvolutionListener() = default;

    virtual void on_evolution_started(const State&) {}
    virtual void on_evolution_ended(const State&, const core::EvolutionHistory&) {}

    virtual void on_generation_started(const State&) {}
    virtual void on_generation_ended(const State&, const core::GenerationRecord&) {}

    virtual void on_initialization_started(const State&) {}
    virtual void on_initialization_ended(const State&) {}

    virtual void on_evaluation_started(const State&) {}
    virtual void on_evaluation_ended(const State&) {}

    virtual void on_parent_selection_started(const State&) {}
    virtual void on_parent_selection_ended(const State&) {}

    virtual void on_survivor_selection_started(const State&) {}
    virtual void on_survivor_selection_ended(const State&) {}

    virtual void on_alteration_started(const State&) {}
    virtual void on_alteration_ended(const State&) {}
};

template <core::Gene G>
using ListenerPtr = std::shared_ptr<EvolutionListener<G>>;

} // namespace evocore::listeners
