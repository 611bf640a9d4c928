#include "morph/PositionNormalizer.hpp"
#include "morph/Logger.hpp"

#include <algorithm>

namespace morph {

std::size_t max_point_count(std::span<const Variant> variants) {
    std::size_t max_count = 0;
    for (const auto& variant : variants)
        max_count = std::max(max_count, variant.count());
    return max_count;
}

std::expected<std::vector<Variant>, NoGeometryError> normalize_variants(
    std::span<const Variant> variants,
    RandomSource& random
) {
    if (variants.empty())
        return std::unexpected(NoGeometryError{"", "no variants were supplied"});

    for (const auto& variant : variants) {
        if (variant.count() == 0)
            return std::unexpected(NoGeometryError{variant.name, "variant has no points"});
    }

    const std::size_t max_count = max_point_count(variants);

    std::vector<Variant> normalized;
    normalized.reserve(variants.size());

    for (const auto& variant : variants) {
        const std::size_t count = variant.count();
        if (count == max_count) {
            normalized.push_back(variant);
            continue;
        }

        PointArray padded;
        padded.reserve(max_count);
        padded.insert(padded.end(), variant.points->begin(), variant.points->end());
        while (padded.size() < max_count)
            padded.push_back(variant[random.uniform_index(count)]);

        Logger::instance().trace("Padded variant '{}' from {} to {} points", variant.name, count, max_count);
        normalized.push_back(Variant::from_points(variant.name, std::move(padded)));
    }

    return normalized;
}

} // namespace morph
