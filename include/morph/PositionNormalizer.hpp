#pragma once

#include "Errors.hpp"
#include "RandomSource.hpp"
#include "Variant.hpp"

#include <expected>
#include <span>
#include <vector>

namespace morph {

/**
 * @brief Largest point count among the variants (0 for an empty set)
 */
[[nodiscard]] std::size_t max_point_count(std::span<const Variant> variants);

/**
 * @brief Bring every variant to the same length so any pair can be interpolated
 *
 * Variants that already have max_point_count() points are returned as-is and keep
 * sharing their storage. Shorter ones get a fresh array: the original points first,
 * in order, followed by points picked uniformly (with replacement) from the same variant.
 * The inputs are never modified.
 *
 * @param variants Input point clouds, in the order they will be indexed
 * @param random Source for the padding picks
 * @return Normalized variants in input order, or NoGeometryError if the set or any variant is empty
 */
[[nodiscard]] std::expected<std::vector<Variant>, NoGeometryError> normalize_variants(
    std::span<const Variant> variants,
    RandomSource& random
);

} // namespace morph
