#pragma once

/// @file json_serializer.hpp
/// @brief Listener recording a run as a JSON document

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <evocore/core/concepts.hpp>
#include <evocore/core/history.hpp>
#include <evocore/core/state.hpp>
#include <evocore/listeners/listener.hpp>
#include <nlohmann/json.hpp>

namespace evocore::listeners {

/// Collects one record per generation plus the final best individual
///
/// Document layout:
/// ```json
/// {
///   "ranker": "max",
///   "generations": [{"generation": 1, "best_fitness": 7.0, ...}, ...],
///   "result": {"generation": 42, "best_fitness": 10.0, "best_genotype": [1, 0, 1, 1],
///              "chromosome_sizes": [3, 1], "elapsed_ms": 12.5}
/// }
/// ```
template <core::Gene G>
class JsonEvolutionSerializer final : public EvolutionListener<G> {
    nlohmann::json document_ = nlohmann::json::object();

  public:
    void on_evolution_started(const core::EvolutionState<G>& state) override {
        document_ = nlohmann::json::object();
        document_["ranker"] = state.ranker().name();
        document_["generations"] = nlohmann::json::array();
    }

    void on_generation_ended(const core::EvolutionState<G>&,
                             const core::GenerationRecord& record) override {
        document_["generations"].push_back(
            {{"generation", record.generation},
             {"best_fitness", record.best_fitness},
             {"worst_fitness", record.worst_fitness},
             {"mean_fitness", record.mean_fitness},
             {"population_size", record.population_size},
             {"steady_generations", record.steady_generations},
             {"duration_ms", std::chrono::duration<double, std::milli>(record.duration).count()}});
    }

    void on_evolution_ended(const core::EvolutionState<G>& state,
                            const core::EvolutionHistory& history) override {
        nlohmann::json result;
        result["generation"] = state.generation();
        result["population_size"] = state.size();
        result["elapsed_ms"] = std::chrono::duration<double, std::milli>(history.elapsed()).count();
        if (!state.is_empty()) {
            const auto& best = state.best();
            result["best_fitness"] = best.fitness();
            // Flattened gene values; chromosome_sizes splits them back into chromosomes
            result["best_genotype"] = best.genotype().flatten();
            nlohmann::json sizes = nlohmann::json::array();
            for (const auto& chromosome : best.genotype()) {
                sizes.push_back(chromosome.size());
            }
            result["chromosome_sizes"] = sizes;
        }
        document_["result"] = result;
    }

    [[nodiscard]] const nlohmann::json& to_json() const noexcept { return document_; }

    /// Write the document, pretty printed with two-space indentation
    ///
    /// @throws std::runtime_error if the file cannot be opened
    void write(const std::string& path) const {
        std::ofstream file(path);
        if (!file) {
            throw std::runtime_error("Could not open JSON output file: " + path);
        }
        file << document_.dump(2) << "\n";
    }
};

} // namespace evocore::listeners
