#pragma once

/// @file numeric.hpp
/// @brief Range-constrained integer and real genes with their chromosome factories

#include <cmath>
#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <evocore/core/chromosome.hpp>
#include <evocore/core/errors.hpp>

namespace evocore::genes {

/// Integer gene constrained to the closed range [lo, hi]
class IntGene {
    int value_;
    int lo_;
    int hi_;

  public:
    using value_type = int;

    /// @throws core::ConfigurationError if lo > hi
    IntGene(int value, int lo, int hi) : value_(value), lo_(lo), hi_(hi) {
        if (lo_ > hi_) {
            throw core::ConfigurationError("IntGene range is empty: [" + std::to_string(lo_) +
                                           ", " + std::to_string(hi_) + "]");
        }
    }

    [[nodiscard]] int value() const noexcept { return value_; }
    [[nodiscard]] int lo() const noexcept { return lo_; }
    [[nodiscard]] int hi() const noexcept { return hi_; }

    [[nodiscard]] IntGene duplicate_with_value(int value) const { return IntGene(value, lo_, hi_); }

    [[nodiscard]] bool verify() const noexcept { return value_ >= lo_ && value_ <= hi_; }

    /// Uniform draw from the gene's range
    [[nodiscard]] IntGene mutate(std::mt19937& rng) const {
        std::uniform_int_distribution<int> dist(lo_, hi_);
        return duplicate_with_value(dist(rng));
    }

    bool operator==(const IntGene&) const = default;
};

/// Real gene constrained to the half-open range [lo, hi)
class DoubleGene {
    double value_;
    double lo_;
    double hi_;

  public:
    using value_type = double;

    /// @throws core::ConfigurationError unless lo < hi and both are finite
    DoubleGene(double value, double lo, double hi) : value_(value), lo_(lo), hi_(hi) {
        if (!std::isfinite(lo_) || !std::isfinite(hi_) || !(lo_ < hi_)) {
            throw core::ConfigurationError("DoubleGene range must satisfy lo < hi, got [" +
                                           std::to_string(lo_) + ", " + std::to_string(hi_) +
                                           ")");
        }
    }

    [[nodiscard]] double value() const noexcept { return value_; }
    [[nodiscard]] double lo() const noexcept { return lo_; }
    [[nodiscard]] double hi() const noexcept { return hi_; }

    [[nodiscard]] DoubleGene duplicate_with_value(double value) const {
        return DoubleGene(value, lo_, hi_);
    }

    [[nodiscard]] bool verify() const noexcept { return value_ >= lo_ && value_ < hi_; }

    [[nodiscard]] DoubleGene mutate(std::mt19937& rng) const {
        std::uniform_real_distribution<double> dist(lo_, hi_);
        return duplicate_with_value(dist(rng));
    }

    bool operator==(const DoubleGene&) const = default;
};

/// Creates chromosomes of `size` IntGenes drawn uniformly from [lo, hi]
class IntChromosomeFactory {
    std::size_t size_;
    int lo_;
    int hi_;

  public:
    /// @throws core::ConfigurationError if size is zero or lo > hi
    IntChromosomeFactory(std::size_t size, int lo, int hi) : size_(size), lo_(lo), hi_(hi) {
        if (size_ == 0) {
            throw core::ConfigurationError("Chromosome size must be positive");
        }
        if (lo_ > hi_) {
            throw core::ConfigurationError("IntChromosomeFactory range is empty");
        }
    }

    core::Chromosome<IntGene> operator()(std::mt19937& rng) const {
        std::uniform_int_distribution<int> dist(lo_, hi_);
        std::vector<IntGene> genes;
        genes.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) {
            genes.emplace_back(dist(rng), lo_, hi_);
        }
        return core::Chromosome<IntGene>(std::move(genes));
    }
};

/// Creates chromosomes of `size` DoubleGenes drawn uniformly from [lo, hi)
class DoubleChromosomeFactory {
    std::size_t size_;
    double lo_;
    double hi_;

  public:
    DoubleChromosomeFactory(std::size_t size, double lo, double hi)
        : size_(size), lo_(lo), hi_(hi) {
        if (size_ == 0) {
            throw core::ConfigurationError("Chromosome size must be positive");
        }
        if (!std::isfinite(lo_) || !std::isfinite(hi_) || !(lo_ < hi_)) {
            throw core::ConfigurationError("DoubleChromosomeFactory range must satisfy lo < hi");
        }
    }

    core::Chromosome<DoubleGene> operator()(std::mt19937& rng) const {
        std::uniform_real_distribution<double> dist(lo_, hi_);
        std::vector<DoubleGene> genes;
        genes.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i) {
            genes.emplace_back(dist(rng), lo_, hi_);
        }
        return core::Chromosome<DoubleGene>(std::move(genes));
    }
};

} // namespace evocore::genes
