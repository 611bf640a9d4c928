#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/color_space.hpp>
#include <cstdint>

namespace morph {

/// Fragment falloff: alpha = k_sprite_falloff_scale / d - k_sprite_falloff_bias
inline constexpr float k_sprite_falloff_scale = 0.05f;
inline constexpr float k_sprite_falloff_bias = 0.1f;

/**
 * @brief Alpha of a point sprite fragment at distance d from the sprite centre
 *
 * Zero at d = 0.5 (the inscribed circle), negative outside it, unbounded towards the
 * centre. Deliberately not clamped; the colour attachment clamps and additive blending
 * accumulates the rest.
 */
[[nodiscard]] inline float sprite_alpha(float distance_to_center) {
    return k_sprite_falloff_scale / distance_to_center - k_sprite_falloff_bias;
}

/**
 * @brief Alpha for a point coordinate in [0,1]^2
 */
[[nodiscard]] inline float sprite_alpha(glm::vec2 point_coord) {
    return sprite_alpha(glm::distance(point_coord, glm::vec2(0.5f)));
}

[[nodiscard]] inline glm::vec3 interpolate_position(glm::vec3 current, glm::vec3 target, float progress) {
    return glm::mix(current, target, progress);
}

/**
 * @brief Rasterized point size in pixels
 *
 * @param view_depth View-space z of the particle (negative in front of the camera)
 */
[[nodiscard]] inline float point_size(float base_size, float size, float resolution_height, float view_depth) {
    return base_size * size * resolution_height * (1.0f / -view_depth);
}

[[nodiscard]] inline glm::vec3 particle_color(glm::vec3 color_a, glm::vec3 color_b, float size) {
    return glm::mix(color_a, color_b, size);
}

/**
 * @brief 0xRRGGBB to [0,1] components, still sRGB encoded
 */
[[nodiscard]] inline glm::vec3 rgb_from_hex(uint32_t hex) {
    return glm::vec3(
        static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
        static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
        static_cast<float>(hex & 0xFF) / 255.0f
    );
}

/**
 * @brief sRGB colour (as picked in the UI) to the linear value the shader blends with
 */
[[nodiscard]] inline glm::vec3 srgb_to_linear(glm::vec3 srgb) {
    return glm::convertSRGBToLinear(srgb);
}

} // namespace morph
