#pragma once

#include "RandomSource.hpp"
#include "Variant.hpp"

#include <cstddef>
#include <vector>

namespace morph {

/// Point counts of the default shapes, deliberately all different
inline constexpr std::size_t k_torus_points = 9600;
inline constexpr std::size_t k_sphere_points = 7200;
inline constexpr std::size_t k_disc_points = 3200;
inline constexpr std::size_t k_helix_points = 5400;

/**
 * @brief Points on the surface of a torus lying in the XY plane, centred at the origin
 */
[[nodiscard]] PointArray make_torus(std::size_t count, float major_radius, float minor_radius, RandomSource& random);

/**
 * @brief Points uniformly distributed on a sphere surface
 */
[[nodiscard]] PointArray make_sphere(std::size_t count, float radius, RandomSource& random);

/**
 * @brief Points uniformly distributed over a filled disc in the XY plane
 */
[[nodiscard]] PointArray make_disc(std::size_t count, float radius, RandomSource& random);

/**
 * @brief Points scattered around a double helix along the Y axis
 */
[[nodiscard]] PointArray make_helix(std::size_t count, float radius, float height, float turns, RandomSource& random);

/**
 * @brief torus, sphere, disc and helix, sized to fit a camera at distance 16
 *
 * @param scale Uniform scale applied to every shape
 */
[[nodiscard]] std::vector<ShapeInput> make_default_shapes(RandomSource& random, float scale = 1.0f);

} // namespace morph
