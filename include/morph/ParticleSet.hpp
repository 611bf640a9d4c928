#pragma once

#include "Errors.hpp"
#include "RandomSource.hpp"
#include "Variant.hpp"

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace morph {

/**
 * @brief CPU-side particle data: normalized variants plus one size scalar per particle
 *
 * Created once after the shapes are available. Variants and sizes are immutable afterwards.
 */
class ParticleSet {
public:
    /**
     * @brief Normalize the shapes and draw the per-particle sizes
     *
     * @param shapes Named point clouds, indexed in the given order
     * @param random Source used for padding and for the sizes
     * @return ParticleSet on success, NoGeometryError if there is nothing to normalize
     */
    static std::expected<ParticleSet, NoGeometryError> create(
        std::vector<ShapeInput> shapes,
        RandomSource& random
    );

    /**
     * @brief Same as create(), for callers that already hold shared variants
     */
    static std::expected<ParticleSet, NoGeometryError> create(
        std::span<const Variant> variants,
        RandomSource& random
    );

    [[nodiscard]] std::size_t variant_count() const { return m_variants.size(); }
    [[nodiscard]] std::size_t max_count() const { return m_sizes.size(); }

    [[nodiscard]] const Variant& variant(std::size_t index) const { return m_variants.at(index); }
    [[nodiscard]] std::span<const Variant> variants() const { return m_variants; }

    /// Per-particle size in [0, 1), one per slot
    [[nodiscard]] std::span<const float> sizes() const { return m_sizes; }

    /**
     * @brief Index of the first variant with the given name
     */
    [[nodiscard]] std::optional<std::size_t> find(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

private:
    ParticleSet(std::vector<Variant> variants, std::vector<float> sizes);

    std::vector<Variant> m_variants;
    std::vector<float> m_sizes;
};

} // namespace morph
