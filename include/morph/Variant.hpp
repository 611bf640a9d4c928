#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace morph {

static_assert(sizeof(glm::vec3) == 12, "Positions must be tightly packed 3-float points");

using PointArray = std::vector<glm::vec3>;

/**
 * @brief A named point cloud handed to the core by a shape source
 */
struct ShapeInput {
    std::string name;
    PointArray positions;
};

/**
 * @brief One target shape of the particle cloud
 *
 * The backing array is immutable and shared, so a variant that passes through
 * normalization untouched still refers to the caller's storage.
 */
struct Variant {
    std::string name;
    std::shared_ptr<const PointArray> points;

    static Variant from_points(std::string name, PointArray positions) {
        return Variant{std::move(name), std::make_shared<const PointArray>(std::move(positions))};
    }

    static Variant from_shape(ShapeInput shape) {
        return from_points(std::move(shape.name), std::move(shape.positions));
    }

    [[nodiscard]] std::size_t count() const { return points ? points->size() : 0; }

    [[nodiscard]] const glm::vec3& operator[](std::size_t i) const { return (*points)[i]; }

    [[nodiscard]] std::span<const glm::vec3> positions() const {
        if (!points)
            return {};
        return {points->data(), points->size()};
    }

    [[nodiscard]] bool shares_storage_with(const Variant& other) const {
        return points != nullptr && points == other.points;
    }
};

} // namespace morph
