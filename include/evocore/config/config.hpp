#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml.hpp>

namespace evocore::config {

/// Custom exception for configuration validation errors
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Population, survival and reproducibility parameters
struct EngineSettings {
    std::size_t population_size = 50; // Matches EngineConfig defaults
    double survival_rate = 0.4;       // Fraction of the next generation drawn as survivors
    std::uint64_t seed = 1;           // Reproducible seed by default
    std::string ranker = "max";       // "max" or "min"
};

/// One selector: "tournament", "roulette" or "random"
struct SelectorSettings {
    std::string type = "tournament";
    std::size_t tournament_size = 3;
    bool sorted = false; // Roulette only
};

struct SelectionSettings {
    SelectorSettings parents;
    SelectorSettings survivors;
};

/// One entry of the [[alterers]] array
///
/// Unset rates fall back to the defaults of the operator named by `type`.
struct AltererSettings {
    std::string type;
    std::optional<double> individual_rate;
    std::optional<double> chromosome_rate;
    std::optional<double> gene_rate;
    std::optional<double> swap_rate;
    std::optional<double> boundary_probability;
    std::size_t points = 2;   // multi_point only
    bool exclusivity = false; // Crossovers only
};

/// Termination limits; a zero value disables the corresponding limit
struct TerminationSettings {
    std::size_t max_generations = 100;
    std::optional<double> target_fitness;
    std::string target_comparison = "at_least"; // "at_least", "at_most" or "equal_to"
    std::size_t steady_generations = 0;
    double time_limit_seconds = 0.0;
};

/// Console output configuration
struct LoggingSettings {
    std::size_t log_interval = 10; // Print every N generations
    bool verbose = false;
};

/// Parallel evaluation configuration
struct ParallelSettings {
    bool enabled = false; // Sequential by default; requires EVOCORE_USE_TBB
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::size_t> population_size;
    std::optional<std::size_t> max_generations;
    std::optional<double> survival_rate;
    std::optional<std::uint64_t> seed;
};

/// Complete configuration structure
struct Config {
    EngineSettings engine;
    SelectionSettings selection;
    std::vector<AltererSettings> alterers;
    TerminationSettings termination;
    LoggingSettings logging;
    ParallelSettings parallel;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// Apply command-line overrides to configuration
    /// Overrides take precedence over loaded values
    void apply_overrides(const ConfigOverrides& overrides);

  private:
    static Config from_value(const toml::value& data);

    static EngineSettings parse_engine(const toml::value& data);
    static SelectionSettings parse_selection(const toml::value& data);
    static SelectorSettings parse_selector(const toml::value& table);
    static std::vector<AltererSettings> parse_alterers(const toml::value& data);
    static TerminationSettings parse_termination(const toml::value& data);
    static LoggingSettings parse_logging(const toml::value& data);
    static ParallelSettings parse_parallel(const toml::value& data);
};

/// @private
namespace detail {

/// Read a real number that may have been written as a TOML integer
inline double find_number(const toml::value& table, const std::string& key) {
    const auto& value = table.at(key);
    if (value.is_integer()) {
        return static_cast<double>(toml::find<std::int64_t>(table, key));
    }
    return toml::find<double>(table, key);
}

inline bool in_unit_interval(double value) { return value >= 0.0 && value <= 1.0; }

inline bool is_known_selector(const std::string& type) {
    return type == "tournament" || type == "roulette" || type == "random";
}

inline bool is_known_alterer(const std::string& type) {
    return type == "random" || type == "bit_flip" || type == "swap" || type == "inversion" ||
           type == "partial_shuffle" || type == "single_point" || type == "multi_point" ||
           type == "ordered" || type == "partially_mapped" || type == "position_based";
}

inline void validate_selector(const SelectorSettings& selector, const std::string& role) {
    if (!is_known_selector(selector.type)) {
        throw ConfigValidationError("Unknown " + role + " selector type: " + selector.type);
    }
    if (selector.type == "tournament" && selector.tournament_size == 0) {
        throw ConfigValidationError("Tournament size must be positive");
    }
}

inline void validate_rate(const std::optional<double>& rate, const std::string& name) {
    if (rate.has_value() && !in_unit_interval(*rate)) {
        throw ConfigValidationError(name + " must be in [0,1]");
    }
}

} // namespace detail

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    return from_value(toml::parse(filepath));
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    return from_value(toml::parse(iss, "config_string"));
}

inline Config Config::from_value(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("engine")) {
        config.engine = parse_engine(data);
    }

    if (data.contains("selection")) {
        config.selection = parse_selection(data);
    }

    if (data.contains("alterers")) {
        config.alterers = parse_alterers(data);
    }

    if (data.contains("termination")) {
        config.termination = parse_termination(data);
    }

    if (data.contains("logging")) {
        config.logging = parse_logging(data);
    }

    if (data.contains("parallel")) {
        config.parallel = parse_parallel(data);
    }

    config.validate();
    return config;
}

inline void Config::validate() const {
    if (engine.population_size == 0) {
        throw ConfigValidationError("Population size must be positive");
    }

    if (!detail::in_unit_interval(engine.survival_rate)) {
        throw ConfigValidationError("Survival rate must be in [0,1]");
    }

    if (engine.ranker != "max" && engine.ranker != "min") {
        throw ConfigValidationError("Ranker must be \"max\" or \"min\", got: " + engine.ranker);
    }

    detail::validate_selector(selection.parents, "parent");
    detail::validate_selector(selection.survivors, "survivor");

    for (const auto& alterer : alterers) {
        if (!detail::is_known_alterer(alterer.type)) {
            throw ConfigValidationError("Unknown alterer type: " + alterer.type);
        }
        detail::validate_rate(alterer.individual_rate, "Individual rate");
        detail::validate_rate(alterer.chromosome_rate, "Chromosome rate");
        detail::validate_rate(alterer.gene_rate, "Gene rate");
        detail::validate_rate(alterer.swap_rate, "Swap rate");
        detail::validate_rate(alterer.boundary_probability, "Boundary probability");
        if (alterer.type == "multi_point" && alterer.points == 0) {
            throw ConfigValidationError("Multi-point crossover needs at least one point");
        }
    }

    const auto& t = termination;
    if (t.time_limit_seconds < 0.0) {
        throw ConfigValidationError("Time limit cannot be negative");
    }
    if (t.target_comparison != "at_least" && t.target_comparison != "at_most" &&
        t.target_comparison != "equal_to") {
        throw ConfigValidationError("Unknown target comparison: " + t.target_comparison);
    }
    if (t.max_generations == 0 && !t.target_fitness.has_value() && t.steady_generations == 0 &&
        t.time_limit_seconds == 0.0) {
        throw ConfigValidationError("At least one termination criterion must be enabled");
    }

    if (logging.log_interval == 0) {
        throw ConfigValidationError("Log interval must be positive");
    }
}

inline EngineSettings Config::parse_engine(const toml::value& data) {
    EngineSettings engine;
    const auto& engine_table = toml::find(data, "engine");

    if (engine_table.contains("population_size")) {
        engine.population_size = toml::find<std::size_t>(engine_table, "population_size");
    }

    if (engine_table.contains("survival_rate")) {
        engine.survival_rate = detail::find_number(engine_table, "survival_rate");
    }

    if (engine_table.contains("seed")) {
        engine.seed = toml::find<std::uint64_t>(engine_table, "seed");
    }

    if (engine_table.contains("ranker")) {
        engine.ranker = toml::find<std::string>(engine_table, "ranker");
    }

    return engine;
}

inline SelectorSettings Config::parse_selector(const toml::value& table) {
    SelectorSettings selector;

    if (table.contains("type")) {
        selector.type = toml::find<std::string>(table, "type");
    }

    if (table.contains("tournament_size")) {
        selector.tournament_size = toml::find<std::size_t>(table, "tournament_size");
    }

    if (table.contains("sorted")) {
        selector.sorted = toml::find<bool>(table, "sorted");
    }

    return selector;
}

inline SelectionSettings Config::parse_selection(const toml::value& data) {
    SelectionSettings selection;
    const auto& selection_table = toml::find(data, "selection");

    if (selection_table.contains("parents")) {
        selection.parents = parse_selector(toml::find(selection_table, "parents"));
    }

    if (selection_table.contains("survivors")) {
        selection.survivors = parse_selector(toml::find(selection_table, "survivors"));
    }

    return selection;
}

inline std::vector<AltererSettings> Config::parse_alterers(const toml::value& data) {
    std::vector<AltererSettings> alterers;

    for (const auto& table : toml::find(data, "alterers").as_array()) {
        AltererSettings alterer;
        alterer.type = toml::find<std::string>(table, "type");

        if (table.contains("individual_rate")) {
            alterer.individual_rate = detail::find_number(table, "individual_rate");
        }
        if (table.contains("chromosome_rate")) {
            alterer.chromosome_rate = detail::find_number(table, "chromosome_rate");
        }
        if (table.contains("gene_rate")) {
            alterer.gene_rate = detail::find_number(table, "gene_rate");
        }
        if (table.contains("swap_rate")) {
            alterer.swap_rate = detail::find_number(table, "swap_rate");
        }
        if (table.contains("boundary_probability")) {
            alterer.boundary_probability = detail::find_number(table, "boundary_probability");
        }
        if (table.contains("points")) {
            alterer.points = toml::find<std::size_t>(table, "points");
        }
        if (table.contains("exclusivity")) {
            alterer.exclusivity = toml::find<bool>(table, "exclusivity");
        }

        alterers.push_back(alterer);
    }

    return alterers;
}

inline TerminationSettings Config::parse_termination(const toml::value& data) {
    TerminationSettings term;
    const auto& term_table = toml::find(data, "termination");

    if (term_table.contains("max_generations")) {
        term.max_generations = toml::find<std::size_t>(term_table, "max_generations");
    }

    if (term_table.contains("target_fitness")) {
        term.target_fitness = detail::find_number(term_table, "target_fitness");
    }

    if (term_table.contains("target_comparison")) {
        term.target_comparison = toml::find<std::string>(term_table, "target_comparison");
    }

    if (term_table.contains("steady_generations")) {
        term.steady_generations = toml::find<std::size_t>(term_table, "steady_generations");
    }

    if (term_table.contains("time_limit_seconds")) {
        term.time_limit_seconds = detail::find_number(term_table, "time_limit_seconds");
    }

    return term;
}

inline LoggingSettings Config::parse_logging(const toml::value& data) {
    LoggingSettings log;
    const auto& log_table = toml::find(data, "logging");

    if (log_table.contains("log_interval")) {
        log.log_interval = toml::find<std::size_t>(log_table, "log_interval");
    }

    if (log_table.contains("verbose")) {
        log.verbose = toml::find<bool>(log_table, "verbose");
    }

    return log;
}

inline ParallelSettings Config::parse_parallel(const toml::value& data) {
    ParallelSettings par;
    const auto& par_table = toml::find(data, "parallel");

    if (par_table.contains("enabled")) {
        par.enabled = toml::find<bool>(par_table, "enabled");
    }

    return par;
}

inline std::string Config::to_toml() const {
    toml::value root;

    toml::value engine_table;
    engine_table["population_size"] = engine.population_size;
    engine_table["survival_rate"] = engine.survival_rate;
    engine_table["seed"] = engine.seed;
    engine_table["ranker"] = engine.ranker;
    root["engine"] = engine_table;

    const auto selector_table = [](const SelectorSettings& selector) {
        toml::value table;
        table["type"] = selector.type;
        table["tournament_size"] = selector.tournament_size;
        table["sorted"] = selector.sorted;
        return table;
    };
    toml::value selection_table;
    selection_table["parents"] = selector_table(selection.parents);
    selection_table["survivors"] = selector_table(selection.survivors);
    root["selection"] = selection_table;

    if (!alterers.empty()) {
        toml::array alterer_array;
        for (const auto& alterer : alterers) {
            toml::value table;
            table["type"] = alterer.type;
            if (alterer.individual_rate) {
                table["individual_rate"] = *alterer.individual_rate;
            }
            if (alterer.chromosome_rate) {
                table["chromosome_rate"] = *alterer.chromosome_rate;
            }
            if (alterer.gene_rate) {
                table["gene_rate"] = *alterer.gene_rate;
            }
            if (alterer.swap_rate) {
                table["swap_rate"] = *alterer.swap_rate;
            }
            if (alterer.boundary_probability) {
                table["boundary_probability"] = *alterer.boundary_probability;
            }
            table["points"] = alterer.points;
            table["exclusivity"] = alterer.exclusivity;
            alterer_array.push_back(table);
        }
        root["alterers"] = alterer_array;
    }

    toml::value term_table;
    term_table["max_generations"] = termination.max_generations;
    if (termination.target_fitness) {
        term_table["target_fitness"] = *termination.target_fitness;
    }
    term_table["target_comparison"] = termination.target_comparison;
    term_table["steady_generations"] = termination.steady_generations;
    term_table["time_limit_seconds"] = termination.time_limit_seconds;
    root["termination"] = term_table;

    toml::value log_table;
    log_table["log_interval"] = logging.log_interval;
    log_table["verbose"] = logging.verbose;
    root["logging"] = log_table;

    toml::value par_table;
    par_table["enabled"] = parallel.enabled;
    root["parallel"] = par_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    if (overrides.population_size.has_value()) {
        engine.population_size = overrides.population_size.value();
    }

    if (overrides.max_generations.has_value()) {
        termination.max_generations = overrides.max_generations.value();
    }

    if (overrides.survival_rate.has_value()) {
        engine.survival_rate = overrides.survival_rate.value();
    }

    if (overrides.seed.has_value()) {
        engine.seed = overrides.seed.value();
    }

    // Re-validate after applying overrides
    validate();
}

} // namespace evocore::config
