#pragma once

// Core components
#include "core/chromosome.hpp"
#include "core/concepts.hpp"
#include "core/engine.hpp"
#include "core/errors.hpp"
#include "core/genotype.hpp"
#include "core/history.hpp"
#include "core/individual.hpp"
#include "core/ranker.hpp"
#include "core/state.hpp"

// Genes
#include "genes/boolean.hpp"
#include "genes/numeric.hpp"

// Operators
#include "operators/alterer.hpp"
#include "operators/crossover.hpp"
#include "operators/mutation.hpp"
#include "operators/selection.hpp"

// Termination and evaluation
#include "evaluation/evaluator.hpp"
#include "limits/limits.hpp"

// Listeners
#include "listeners/json_serializer.hpp"
#include "listeners/listener.hpp"
#include "listeners/printer.hpp"

// Configuration
#include "config/config.hpp"

#ifdef EVOCORE_HAVE_TBB
#include "parallel/tbb_evaluator.hpp"
#endif

/**
 * @file evocore.hpp
 * @brief Main header for EvoCore - a generational evolutionary computation engine
 *
 * Populations of individuals built from genes, chromosomes and genotypes evolve through
 * pluggable selectors, mutators and crossovers until one of the configured limits fires.
 *
 * Basic usage:
 * @code
 * #include <evocore/evocore.hpp>
 * using namespace evocore;
 *
 * core::EngineConfig<genes::BoolGene> config;
 * config.genotype_factory = core::make_genotype_factory<genes::BoolGene>(
 *     {genes::BoolChromosomeFactory(64)});
 * config.fitness_function = [](const core::Genotype<genes::BoolGene>& g) {
 *     double ones = 0;
 *     for (const auto& gene : g[0]) ones += gene.value() ? 1 : 0;
 *     return ones;
 * };
 * config.alterers = {std::make_shared<operators::SinglePointCrossover<genes::BoolGene>>(),
 *                    std::make_shared<operators::BitFlipMutator<genes::BoolGene>>(0.2, 1.0, 0.02)};
 * config.limits = {std::make_shared<limits::MaxGenerations<genes::BoolGene>>(200)};
 *
 * core::EvolutionEngine<genes::BoolGene> engine(std::move(config));
 * auto result = engine.evolve();
 * std::cout << "Best fitness: " << result.best().fitness() << std::endl;
 * @endcode
 */

namespace evocore {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Builders turning a config::Config into engine components
namespace factory {

template <core::Gene G>
std::shared_ptr<const operators::Selector<G>> make_selector(const config::SelectorSettings& s) {
    if (s.type == "tournament") {
        return std::make_shared<operators::TournamentSelector<G>>(s.tournament_size);
    }
    if (s.type == "roulette") {
        return std::make_shared<operators::RouletteWheelSelector<G>>(s.sorted);
    }
    if (s.type == "random") {
        return std::make_shared<operators::RandomSelector<G>>();
    }
    throw config::ConfigValidationError("Unknown selector type: " + s.type);
}

template <core::Gene G>
std::shared_ptr<const core::Ranker<G>> make_ranker(const std::string& name) {
    if (name == "max") {
        return std::make_shared<core::MaxRanker<G>>();
    }
    if (name == "min") {
        return std::make_shared<core::MinRanker<G>>();
    }
    throw config::ConfigValidationError("Unknown ranker: " + name);
}

/// One alterer per [[alterers]] entry, in file order
///
/// @throws config::ConfigValidationError if an alterer does not apply to genes of type G
template <core::Gene G>
std::vector<operators::AltererPtr<G>>
make_alterers(const std::vector<config::AltererSettings>& settings) {
    std::vector<operators::AltererPtr<G>> alterers;
    alterers.reserve(settings.size());

    for (const auto& a : settings) {
        const double individual = a.individual_rate.value_or(0.5);
        const double chromosome = a.chromosome_rate.value_or(0.5);

        if (a.type == "random") {
            if constexpr (core::MutableGene<G>) {
                alterers.push_back(std::make_shared<operators::RandomMutator<G>>(
                    individual, chromosome, a.gene_rate.value_or(0.5)));
            } else {
                throw config::ConfigValidationError(
                    "Random mutation requires genes that can draw a new value");
            }
        } else if (a.type == "bit_flip") {
            if constexpr (core::BooleanGene<G>) {
                alterers.push_back(std::make_shared<operators::BitFlipMutator<G>>(
                    individual, chromosome, a.gene_rate.value_or(0.5)));
            } else {
                throw config::ConfigValidationError("Bit flip mutation requires boolean genes");
            }
        } else if (a.type == "swap") {
            alterers.push_back(std::make_shared<operators::SwapMutator<G>>(
                individual, chromosome, a.swap_rate.value_or(0.5)));
        } else if (a.type == "inversion") {
            alterers.push_back(std::make_shared<operators::InversionMutator<G>>(
                individual, chromosome, a.boundary_probability.value_or(0.5)));
        } else if (a.type == "partial_shuffle") {
            alterers.push_back(std::make_shared<operators::PartialShuffleMutator<G>>(
                a.individual_rate.value_or(1.0), a.chromosome_rate.value_or(1.0),
                a.boundary_probability.value_or(0.5)));
        } else if (a.type == "single_point") {
            alterers.push_back(std::make_shared<operators::SinglePointCrossover<G>>(
                a.chromosome_rate.value_or(1.0), a.exclusivity));
        } else if (a.type == "multi_point") {
            alterers.push_back(std::make_shared<operators::MultiPointCrossover<G>>(
                a.points, a.chromosome_rate.value_or(1.0), a.exclusivity));
        } else if (a.type == "ordered") {
            alterers.push_back(std::make_shared<operators::OrderedCrossover<G>>(
                a.chromosome_rate.value_or(1.0), a.exclusivity));
        } else if (a.type == "partially_mapped") {
            alterers.push_back(std::make_shared<operators::PartiallyMappedCrossover<G>>(
                a.chromosome_rate.value_or(1.0), a.exclusivity));
        } else if (a.type == "position_based") {
            alterers.push_back(std::make_shared<operators::PositionBasedCrossover<G>>(
                a.chromosome_rate.value_or(1.0), a.exclusivity));
        } else {
            throw config::ConfigValidationError("Unknown alterer type: " + a.type);
        }
    }

    return alterers;
}

template <core::Gene G>
std::vector<limits::LimitPtr<G>> make_limits(const config::TerminationSettings& t) {
    std::vector<limits::LimitPtr<G>> result;

    if (t.max_generations > 0) {
        result.push_back(std::make_shared<limits::MaxGenerations<G>>(t.max_generations));
    }

    if (t.target_fitness.has_value()) {
        limits::TargetComparison comparison = limits::TargetComparison::at_least;
        if (t.target_comparison == "at_most") {
            comparison = limits::TargetComparison::at_most;
        } else if (t.target_comparison == "equal_to") {
            comparison = limits::TargetComparison::equal_to;
        }
        result.push_back(std::make_shared<limits::TargetFitness<G>>(*t.target_fitness, comparison));
    }

    if (t.steady_generations > 0) {
        result.push_back(std::make_shared<limits::SteadyGenerations<G>>(t.steady_generations));
    }

    if (t.time_limit_seconds > 0.0) {
        result.push_back(std::make_shared<limits::TimeLimit<G>>(
            std::chrono::duration<double>(t.time_limit_seconds)));
    }

    return result;
}

/// Assemble a complete EngineConfig from a validated Config
///
/// Listeners are left empty; the caller decides where output goes.
template <core::Gene G>
core::EngineConfig<G> make_engine_config(const config::Config& cfg,
                                         core::GenotypeFactory<G> genotype_factory,
                                         evaluation::FitnessFunction<G> fitness) {
    cfg.validate();

    core::EngineConfig<G> engine;
    engine.genotype_factory = std::move(genotype_factory);
    engine.fitness_function = std::move(fitness);
    engine.population_size = cfg.engine.population_size;
    engine.survival_rate = cfg.engine.survival_rate;
    engine.seed = cfg.engine.seed;
    engine.ranker = make_ranker<G>(cfg.engine.ranker);
    engine.parent_selector = make_selector<G>(cfg.selection.parents);
    engine.survivor_selector = make_selector<G>(cfg.selection.survivors);
    engine.alterers = make_alterers<G>(cfg.alterers);
    engine.limits = make_limits<G>(cfg.termination);

    if (cfg.parallel.enabled) {
#ifdef EVOCORE_HAVE_TBB
        engine.evaluator = std::make_shared<parallel::TbbEvaluator<G>>(engine.fitness_function);
#else
        throw config::ConfigValidationError(
            "Parallel evaluation requested but EvoCore was built without TBB "
            "(reconfigure with -DEVOCORE_USE_TBB=ON)");
#endif
    }

    return engine;
}

} // namespace factory

} // namespace evocore
