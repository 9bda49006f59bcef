#pragma once

/// @file chromosome.hpp
/// @brief Ordered, fixed-arity sequence of genes of one kind

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include <evocore/core/concepts.hpp>

namespace evocore::core {

/// Immutable chromosome
///
/// The number of genes is fixed at construction; operators never edit a chromosome, they build a
/// replacement through duplicate_with_genes().
///
/// @tparam G Gene type satisfying the Gene concept
template <Gene G>
class Chromosome {
    std::vector<G> genes_;

  public:
    using gene_type = G;
    using value_type = typename G::value_type;
    using const_iterator = typename std::vector<G>::const_iterator;

    Chromosome() = default;

    explicit Chromosome(std::vector<G> genes) : genes_(std::move(genes)) {}

    [[nodiscard]] std::size_t size() const noexcept { return genes_.size(); }

    [[nodiscard]] bool empty() const noexcept { return genes_.empty(); }

    [[nodiscard]] const G& operator[](std::size_t index) const noexcept { return genes_[index]; }

    /// @throws std::out_of_range if index is out of bounds
    [[nodiscard]] const G& at(std::size_t index) const { return genes_.at(index); }

    [[nodiscard]] const std::vector<G>& genes() const noexcept { return genes_; }

    [[nodiscard]] const_iterator begin() const noexcept { return genes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return genes_.end(); }

    /// Build a chromosome of the same kind holding the given genes
    [[nodiscard]] Chromosome duplicate_with_genes(std::vector<G> genes) const {
        return Chromosome(std::move(genes));
    }

    /// True when every gene satisfies its own constraints
    [[nodiscard]] bool verify() const {
        return std::ranges::all_of(genes_, [](const G& gene) { return gene.verify(); });
    }

    /// Values of all genes in order
    [[nodiscard]] std::vector<value_type> values() const {
        std::vector<value_type> result;
        result.reserve(genes_.size());
        for (const auto& gene : genes_) {
            result.push_back(gene.value());
        }
        return result;
    }

    bool operator==(const Chromosome&) const = default;
};

} // namespace evocore::core
