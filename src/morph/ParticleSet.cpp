#include "morph/ParticleSet.hpp"
#include "morph/Logger.hpp"
#include "morph/PositionNormalizer.hpp"

namespace morph {

ParticleSet::ParticleSet(std::vector<Variant> variants, std::vector<float> sizes)
    : m_variants(std::move(variants))
    , m_sizes(std::move(sizes))
{
}

std::expected<ParticleSet, NoGeometryError> ParticleSet::create(
    std::vector<ShapeInput> shapes,
    RandomSource& random
) {
    std::vector<Variant> variants;
    variants.reserve(shapes.size());
    for (auto& shape : shapes)
        variants.push_back(Variant::from_shape(std::move(shape)));
    return create(std::span<const Variant>(variants), random);
}

std::expected<ParticleSet, NoGeometryError> ParticleSet::create(
    std::span<const Variant> variants,
    RandomSource& random
) {
    auto normalized = normalize_variants(variants, random);
    if (!normalized)
        return std::unexpected(normalized.error());

    const std::size_t max_count = normalized->front().count();

    std::vector<float> sizes(max_count);
    for (auto& size : sizes)
        size = random.uniform_unit();

    Logger::instance().info("Created particle set with {} variants of {} particles", normalized->size(), max_count);
    return ParticleSet(std::move(*normalized), std::move(sizes));
}

std::optional<std::size_t> ParticleSet::find(std::string_view name) const {
    for (std::size_t i = 0; i < m_variants.size(); ++i) {
        if (m_variants[i].name == name)
            return i;
    }
    return std::nullopt;
}

std::vector<std::string> ParticleSet::names() const {
    std::vector<std::string> result;
    result.reserve(m_variants.size());
    for (const auto& variant : m_variants)
        result.push_back(variant.name);
    return result;
}

} // namespace morph
