#pragma once

/// @file errors.hpp
/// @brief Exception taxonomy shared by the engine and its operators
///
/// Configuration errors are raised at construction or at the first invocation and are never
/// retried. Invariant violations signal a misbehaving plugin (genotype factory, fitness function,
/// custom selector or alterer) and abort the current iterate()/evolve() call.

#include <stdexcept>

namespace evocore::core {

/// Root of every error raised by the library
class EvolutionError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Invalid configuration or invalid arguments handed to an operator
class ConfigurationError : public EvolutionError {
  public:
    using EvolutionError::EvolutionError;
};

/// Engine-level configuration (population size, survival rate, missing components)
class EngineConfigError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

/// Selector misuse: negative counts, empty populations, invalid tournament sizes
class SelectionError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

/// Mutation rates outside [0, 1] and similar mutator parameters
class MutatorConfigError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

/// Crossover parameters or parents that cannot be recombined
class CrossoverError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

/// Termination limits with meaningless parameters
class LimitConfigError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

/// A generational invariant was broken by a user-supplied component
class InvariantViolation : public EvolutionError {
  public:
    using EvolutionError::EvolutionError;
};

} // namespace evocore::core
