#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <random>

namespace evocore::core {

/// Concept for genes, the smallest unit of encoded information
///
/// A gene holds one value plus the constraints of its "species" (a numeric range, an alphabet).
/// Genes are immutable: every change goes through duplicate_with_value(), which keeps the
/// constraints and swaps the value.
///
/// ## Requirements:
/// - `G::value_type` names the stored value type
/// - `gene.value()` returns the stored value
/// - `gene.duplicate_with_value(v)` returns a gene of the same species holding `v`
/// - `gene.verify()` reports whether the value satisfies the gene's constraints
template <typename G>
concept Gene = std::copy_constructible<G> && std::equality_comparable<G> &&
               requires(const G& gene, const typename G::value_type& value) {
                   typename G::value_type;
                   { gene.value() } -> std::convertible_to<typename G::value_type>;
                   { gene.duplicate_with_value(value) } -> std::same_as<G>;
                   { gene.verify() } -> std::same_as<bool>;
               };

/// Concept for genes that can draw a fresh random value from their own domain
template <typename G>
concept MutableGene = Gene<G> && requires(const G& gene, std::mt19937& rng) {
    { gene.mutate(rng) } -> std::same_as<G>;
};

/// Concept for genes whose value can be hashed (used by Individual hashing)
template <typename G>
concept HashableGene = Gene<G> && requires(const typename G::value_type& value) {
    { std::hash<typename G::value_type>{}(value) } -> std::convertible_to<std::size_t>;
};

/// Concept for boolean genes, the target of bit-flip mutation
template <typename G>
concept BooleanGene = Gene<G> && std::same_as<typename G::value_type, bool>;

/// Combine a hash value into a running seed
inline void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace evocore::core
