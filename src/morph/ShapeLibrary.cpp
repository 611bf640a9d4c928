#include "morph/ShapeLibrary.hpp"
#include "morph/Logger.hpp"

#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace morph {

PointArray make_torus(std::size_t count, float major_radius, float minor_radius, RandomSource& random) {
    PointArray points;
    points.reserve(count);
    const float two_pi = glm::two_pi<float>();

    while (points.size() < count) {
        float u = random.uniform_unit() * two_pi;
        float v = random.uniform_unit() * two_pi;

        // Rejection keeps the density uniform over the surface (outer ring has more area)
        float weight = (major_radius + minor_radius * std::cos(v)) / (major_radius + minor_radius);
        if (random.uniform_unit() > weight)
            continue;

        float ring = major_radius + minor_radius * std::cos(v);
        points.emplace_back(ring * std::cos(u), ring * std::sin(u), minor_radius * std::sin(v));
    }
    return points;
}

PointArray make_sphere(std::size_t count, float radius, RandomSource& random) {
    PointArray points;
    points.reserve(count);
    const float two_pi = glm::two_pi<float>();

    for (std::size_t i = 0; i < count; ++i) {
        float z = 2.0f * random.uniform_unit() - 1.0f;
        float phi = random.uniform_unit() * two_pi;
        float r = std::sqrt(std::max(0.0f, 1.0f - z * z));
        points.emplace_back(radius * r * std::cos(phi), radius * r * std::sin(phi), radius * z);
    }
    return points;
}

PointArray make_disc(std::size_t count, float radius, RandomSource& random) {
    PointArray points;
    points.reserve(count);
    const float two_pi = glm::two_pi<float>();

    for (std::size_t i = 0; i < count; ++i) {
        float r = radius * std::sqrt(random.uniform_unit());
        float phi = random.uniform_unit() * two_pi;
        points.emplace_back(r * std::cos(phi), r * std::sin(phi), 0.0f);
    }
    return points;
}

PointArray make_helix(std::size_t count, float radius, float height, float turns, RandomSource& random) {
    PointArray points;
    points.reserve(count);
    const float two_pi = glm::two_pi<float>();
    const float jitter = radius * 0.08f;

    for (std::size_t i = 0; i < count; ++i) {
        float t = random.uniform_unit();
        float angle = t * turns * two_pi;
        if (i % 2 == 1)
            angle += glm::pi<float>();

        glm::vec3 offset(
            (random.uniform_unit() - 0.5f) * jitter,
            (random.uniform_unit() - 0.5f) * jitter,
            (random.uniform_unit() - 0.5f) * jitter
        );
        points.push_back(glm::vec3(radius * std::cos(angle), (t - 0.5f) * height, radius * std::sin(angle)) + offset);
    }
    return points;
}

std::vector<ShapeInput> make_default_shapes(RandomSource& random, float scale) {
    std::vector<ShapeInput> shapes;
    shapes.push_back({"torus", make_torus(k_torus_points, 2.4f * scale, 0.9f * scale, random)});
    shapes.push_back({"sphere", make_sphere(k_sphere_points, 3.0f * scale, random)});
    shapes.push_back({"disc", make_disc(k_disc_points, 3.2f * scale, random)});
    shapes.push_back({"helix", make_helix(k_helix_points, 1.6f * scale, 6.0f * scale, 2.5f, random)});

    for (const auto& shape : shapes)
        Logger::instance().debug("Generated shape '{}' with {} points", shape.name, shape.positions.size());
    return shapes;
}

} // namespace morph
