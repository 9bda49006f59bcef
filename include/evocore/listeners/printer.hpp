#pragma once

/// @file printer.hpp
/// @brief Console progress listener

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>

#include <evocore/core/concepts.hpp>
#include <evocore/core/errors.hpp>
#include <evocore/core/history.hpp>
#include <evocore/core/state.hpp>
#include <evocore/listeners/listener.hpp>

namespace evocore::listeners {

/// Prints a progress table every `log_interval` generations and a summary at the end
///
/// Output format:
/// ```
///        Gen           Best           Mean          Worst  Steady    Time(ms)
/// ---------------------------------------------------------------------------
///          1         12.0000         8.2000         3.0000       0       0.412
/// ```
///
/// Rows are formatted into a local buffer, so the flags and precision of the target stream are
/// left as the caller set them.
template <core::Gene G>
class EvolutionPrinter final : public EvolutionListener<G> {
    std::ostream& out_;
    std::size_t log_interval_;
    int precision_;

  public:
    /// @throws core::ConfigurationError if log_interval is zero
    explicit EvolutionPrinter(std::size_t log_interval = 1, std::ostream& out = std::cout,
                              int precision = 4)
        : out_(out), log_interval_(log_interval), precision_(precision) {
        if (log_interval_ == 0) {
            throw core::ConfigurationError("EvolutionPrinter log interval must be positive");
        }
    }

    void on_evolution_started(const core::EvolutionState<G>& state) override {
        out_ << "=== Evolution started (generation " << state.generation() << ", ranker "
             << state.ranker().name() << ") ===\n";
        out_ << std::setw(10) << "Gen" << std::setw(15) << "Best" << std::setw(15) << "Mean"
             << std::setw(15) << "Worst" << std::setw(8) << "Steady" << std::setw(12)
             << "Time(ms)" << "\n";
        out_ << std::string(75, '-') << "\n";
    }

    void on_generation_ended(const core::EvolutionState<G>&,
                             const core::GenerationRecord& record) override {
        if (record.generation % log_interval_ != 0) {
            return;
        }
        const double ms = std::chrono::duration<double, std::milli>(record.duration).count();
        std::ostringstream row;
        row << std::setw(10) << record.generation << std::fixed << std::setprecision(precision_)
            << std::setw(15) << record.best_fitness << std::setw(15) << record.mean_fitness
            << std::setw(15) << record.worst_fitness << std::setw(8)
            << record.steady_generations << std::setw(12) << std::setprecision(3) << ms << "\n";
        out_ << row.str();
    }

    void on_evolution_ended(const core::EvolutionState<G>& state,
                            const core::EvolutionHistory& history) override {
        const double seconds = std::chrono::duration<double>(history.elapsed()).count();
        std::ostringstream summary;
        summary << "\n=== Evolution finished ===\n";
        summary << "Generations: " << state.generation() << "\n";
        if (!state.is_empty()) {
            summary << "Best fitness: " << std::fixed << std::setprecision(precision_)
                    << state.best().fitness() << "\n";
        }
        summary << "Steady generations: " << history.steady_generations() << "\n";
        summary << "Runtime: " << std::fixed << std::setprecision(3) << seconds << " seconds\n";
        out_ << summary.str();
    }

    [[nodiscard]] std::size_t log_interval() const noexcept { return log_interval_; }
};

} // namespace evocore::listeners
