#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <evocore/evocore.hpp>
#include <nlohmann/json.hpp>

using namespace evocore;

// Benchmark problem dimensions
namespace {
constexpr std::size_t ONEMAX_BITS = 64;
constexpr std::size_t SPHERE_DIMENSIONS = 10;
constexpr double SPHERE_BOUND = 5.12;
} // namespace

/// Command-line arguments structure
/// Wraps both the configuration and runtime options
struct CLIConfig {
    std::string config_file;
    std::string problem = "onemax";
    std::size_t population = 50;
    std::size_t generations = 100;
    std::uint64_t seed = 1;
    bool verbose = false;
    bool json_output = false;
    std::string json_file;

    // Track which values were explicitly set via command line
    bool has_population_override = false;
    bool has_generations_override = false;
    bool has_seed_override = false;

    // Convert CLI overrides to configuration overrides
    config::ConfigOverrides to_overrides() const {
        config::ConfigOverrides overrides;
        if (has_population_override) {
            overrides.population_size = population;
        }
        if (has_generations_override) {
            overrides.max_generations = generations;
        }
        if (has_seed_override) {
            overrides.seed = seed;
        }
        return overrides;
    }
};

/// Get git commit hash (from CMake build)
std::string get_git_hash() {
#ifdef GIT_HASH
    return GIT_HASH;
#else
    return "unknown";
#endif
}

/// Get hostname (from CMake build)
std::string get_hostname() {
#ifdef BUILD_HOSTNAME
    return BUILD_HOSTNAME;
#else
    return "unknown";
#endif
}

std::string get_build_config() {
#ifdef NDEBUG
    std::string mode = "Release";
#else
    std::string mode = "Debug";
#endif

#ifdef __clang__
    std::string compiler =
        "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
    std::string compiler = "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#else
    std::string compiler = "Unknown";
#endif

    return mode + " (" + compiler + ")";
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --config FILE           Load configuration from TOML file\n"
              << "  -P, --problem NAME      Problem: onemax, sphere (default: onemax)\n"
              << "  -p, --population SIZE   Population size (default: 50)\n"
              << "  -g, --generations NUM   Max generations (default: 100)\n"
              << "  -s, --seed SEED         Random seed (default: 1)\n"
              << "  -v, --verbose           Print a progress table while evolving\n"
              << "  --json                  Enable JSON output format\n"
              << "  --json-file FILE        Write JSON results to file\n"
              << "\nExamples:\n"
              << "  " << program_name << " --config config/example.toml -P sphere\n"
              << "  " << program_name << " -P onemax -p 200 -g 500 --verbose\n"
              << "  " << program_name << " --json --json-file results.json\n";
}

CLIConfig parse_args(int argc, char** argv) {
    CLIConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if ((arg == "-P" || arg == "--problem") && i + 1 < argc) {
            config.problem = argv[++i];
        } else if ((arg == "-p" || arg == "--population") && i + 1 < argc) {
            config.population = std::stoull(argv[++i]);
            config.has_population_override = true;
        } else if ((arg == "-g" || arg == "--generations") && i + 1 < argc) {
            config.generations = std::stoull(argv[++i]);
            config.has_generations_override = true;
        } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            config.seed = std::stoull(argv[++i]);
            config.has_seed_override = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--json-file" && i + 1 < argc) {
            config.json_file = argv[++i];
            config.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    if (config.problem != "onemax" && config.problem != "sphere") {
        std::cerr << "Unknown problem: " << config.problem << "\n";
        print_usage(argv[0]);
        std::exit(1);
    }

    return config;
}

/// Number of set bits; maximized
double onemax(const core::Genotype<genes::BoolGene>& genotype) {
    double ones = 0.0;
    for (const auto& chromosome : genotype) {
        for (const auto& gene : chromosome) {
            ones += gene.value() ? 1.0 : 0.0;
        }
    }
    return ones;
}

/// Sum of squares; minimized at the origin
double sphere(const core::Genotype<genes::DoubleGene>& genotype) {
    double sum = 0.0;
    for (const auto& chromosome : genotype) {
        for (const auto& gene : chromosome) {
            sum += gene.value() * gene.value();
        }
    }
    return sum;
}

/// Alterers used when the configuration lists none
std::vector<config::AltererSettings> default_alterers(const std::string& problem) {
    config::AltererSettings crossover;
    crossover.type = "single_point";
    crossover.chromosome_rate = 1.0;

    config::AltererSettings mutation;
    mutation.type = problem == "onemax" ? "bit_flip" : "random";
    mutation.individual_rate = 0.3;
    mutation.chromosome_rate = 1.0;
    mutation.gene_rate = 0.05;

    return {crossover, mutation};
}

void write_json_output(const nlohmann::json& run, const CLIConfig& cli_config,
                       const config::Config& cfg, double runtime) {
    using json = nlohmann::json;

    json output;

    output["metadata"] = {{"version", VERSION},
                          {"git_hash", get_git_hash()},
                          {"hostname", get_hostname()},
                          {"build_config", get_build_config()},
                          {"timestamp", std::time(nullptr)},
                          {"runtime_seconds", runtime}};

    output["configuration"] = {{"config_file", cli_config.config_file},
                               {"problem", cli_config.problem},
                               {"population_size", cfg.engine.population_size},
                               {"survival_rate", cfg.engine.survival_rate},
                               {"max_generations", cfg.termination.max_generations},
                               {"ranker", cfg.engine.ranker},
                               {"parallel", cfg.parallel.enabled},
                               {"seed", cfg.engine.seed}};

    output["results"] = run.value("result", json::object());

    // Last 5 generations only
    json history = json::array();
    if (run.contains("generations")) {
        const auto& generations = run["generations"];
        const std::size_t start = generations.size() > 5 ? generations.size() - 5 : 0;
        for (std::size_t i = start; i < generations.size(); ++i) {
            history.push_back(generations[i]);
        }
    }
    output["evolution_history"] = history;

    if (!cli_config.json_file.empty()) {
        std::ofstream file(cli_config.json_file);
        if (!file) {
            throw std::runtime_error("Could not open JSON output file: " + cli_config.json_file);
        }
        file << output.dump(2);
    } else {
        std::cout << output.dump(2) << "\n";
    }
}

template <core::Gene G>
void print_stats(const core::EvolutionState<G>& result, const core::EvolutionHistory& history,
                 double runtime) {
    std::cout << "\n=== Results ===\n";
    std::cout << "Best fitness: " << std::fixed << std::setprecision(4)
              << result.best().fitness() << "\n";
    std::cout << "Generations: " << result.generation() << "\n";
    std::cout << "Steady generations: " << history.steady_generations() << "\n";
    std::cout << "Runtime: " << std::fixed << std::setprecision(3) << runtime << " seconds\n";
}

/// Build an engine for one problem, evolve it and report the outcome
template <core::Gene G>
int run(const CLIConfig& cli_config, const config::Config& cfg,
        core::GenotypeFactory<G> genotype_factory, evaluation::FitnessFunction<G> fitness) {
    auto engine_config =
        factory::make_engine_config<G>(cfg, std::move(genotype_factory), std::move(fitness));

    auto serializer = std::make_shared<listeners::JsonEvolutionSerializer<G>>();
    engine_config.listeners.push_back(serializer);
    if (cli_config.verbose && !cli_config.json_output) {
        engine_config.listeners.push_back(
            std::make_shared<listeners::EvolutionPrinter<G>>(cfg.logging.log_interval));
    }

    core::EvolutionEngine<G> engine(std::move(engine_config));

    if (!cli_config.json_output) {
        std::cout << "Population: " << cfg.engine.population_size << "\n";
        std::cout << "Survival rate: " << cfg.engine.survival_rate << " ("
                  << engine.survivor_count() << " survivors, " << engine.parent_count()
                  << " parents)\n";
        std::cout << "Max generations: " << cfg.termination.max_generations << "\n";
        std::cout << "Seed: " << cfg.engine.seed << "\n\n";
        std::cout << "Starting evolution...\n";
    }

    auto start_time = std::chrono::steady_clock::now();
    const auto result = engine.evolve();
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration<double>(end_time - start_time).count();

    if (cli_config.json_output) {
        write_json_output(serializer->to_json(), cli_config, cfg, duration);
    } else {
        print_stats(result, engine.history(), duration);
    }
    return 0;
}

int main(int argc, char** argv) {
    try {
        auto cli_config = parse_args(argc, argv);

        if (!cli_config.json_output) {
            std::cout << "EvoCore Evolution Runner v" << VERSION << "\n";
            std::cout << std::string(30, '=') << "\n";
        }

        config::Config cfg;
        if (!cli_config.config_file.empty()) {
            if (!cli_config.json_output) {
                std::cout << "Loading configuration from: " << cli_config.config_file << "\n";
            }
            cfg = config::Config::from_file(cli_config.config_file);
            cfg.apply_overrides(cli_config.to_overrides());
        } else {
            cfg.engine.population_size = cli_config.population;
            cfg.engine.seed = cli_config.seed;
            cfg.termination.max_generations = cli_config.generations;
            cfg.logging.verbose = cli_config.verbose;
            if (cli_config.problem == "onemax") {
                cfg.termination.target_fitness = static_cast<double>(ONEMAX_BITS);
            }
        }

        // The fitness direction belongs to the problem
        cfg.engine.ranker = cli_config.problem == "onemax" ? "max" : "min";
        if (cfg.alterers.empty()) {
            cfg.alterers = default_alterers(cli_config.problem);
        }
        cfg.validate();

        if (!cli_config.json_output) {
            std::cout << "Problem: " << cli_config.problem << "\n";
        }

        if (cli_config.problem == "onemax") {
            return run<genes::BoolGene>(
                cli_config, cfg,
                core::make_genotype_factory<genes::BoolGene>(
                    {genes::BoolChromosomeFactory(ONEMAX_BITS)}),
                onemax);
        }
        return run<genes::DoubleGene>(
            cli_config, cfg,
            core::make_genotype_factory<genes::DoubleGene>(
                {genes::DoubleChromosomeFactory(SPHERE_DIMENSIONS, -SPHERE_BOUND, SPHERE_BOUND)}),
            sphere);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
