#pragma once

/// @file boolean.hpp
/// @brief Boolean gene and bit-string chromosome factory

#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/chromosome.hpp>
#include <evocore/core/errors.hpp>

namespace evocore::genes {

class BoolGene {
    bool value_;

  public:
    using value_type = bool;

    explicit BoolGene(bool value) noexcept : value_(value) {}

    [[nodiscard]] bool value() const noexcept { return value_; }

    [[nodiscard]] BoolGene duplicate_with_value(bool value) const noexcept {
        return BoolGene(value);
    }

    /// Every boolean value is valid
    [[nodiscard]] bool verify() const noexcept { return true; }

    /// Fair coin toss
    [[nodiscard]] BoolGene mutate(std::mt19937& rng) const {
        std::bernoulli_distribution coin(0.5);
        return BoolGene(coin(rng));
    }

    [[nodiscard]] BoolGene flipped() const noexcept { return BoolGene(!value_); }

    bool operator==(const BoolGene&) const = default;
};

/// Creates bit-string chromosomes where each gene is true with probability `true_rate`
class BoolChromosomeFactory {
    std::size_t size_;
    double true_rate_;

  public:
    /// @throws core::ConfigurationError if size is zero or true_rate is outside [0, 1]
    explicit BoolChromosomeFactory(std::size_t size, double true_rate = 0.5)
        : size_(size), true_rate_(true_rate) {
        if (size_ == 0) {
            throw core::ConfigurationError("Chromosome size must be positive");
        }
        if (!(true_rate_ >= 0.0 && true_rate_ <= 1.0)) {
            throw core::ConfigurationError("The probability of a gene being true must be in [0, 1], got " +
                                           std::to_string(true_rate_));
        }
    }

    core::Chromosome<BoolGene> operator()(std::mt19937& rng) const {
        std::bernoulli_distribution coin(true_rate_);
        std::vector<BoolGene> genes;
        genes.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) {
            genes.emplace_back(coin(rng));
        }
        return core::Chromosome<BoolGene>(std::move(genes));
    }
};

/// Render a bit-string chromosome as "0110..."
inline std::string to_bit_string(const core::Chromosome<BoolGene>& chromosome) {
    std::string bits;
    bits.reserve(chromosome.size());
    for (const auto& gene : chromosome) {
        bits.push_back(gene.value() ? '1' : '0');
    }
    return bits;
}

} // namespace evocore::genes
