#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace morph {

/**
 * @brief Projection and orbit limits of the scene camera
 */
struct CameraConfig {
    float distance = 16.0f;
    float fov = 35.0f;          ///< Vertical field of view in degrees
    float near_plane = 0.1f;
    float far_plane = 100.0f;
    float min_distance = 4.0f;
    float max_distance = 40.0f;
};

/**
 * @brief Orbit camera looking at the origin
 *
 * Starts on the +Z axis at the configured distance. Mouse drag changes azimuth and
 * elevation, the scroll wheel changes the distance. Matrices are recomputed lazily.
 */
class Camera3D {
public:
    explicit Camera3D(uint32_t viewport_width = 1280, uint32_t viewport_height = 720, CameraConfig config = {});

    [[nodiscard]] glm::mat4 view_matrix();
    [[nodiscard]] glm::mat4 projection_matrix();
    [[nodiscard]] glm::mat4 view_projection_matrix();

    /**
     * @brief Orbit by a mouse delta in pixels
     */
    void handle_mouse_movement(double xoffset, double yoffset);

    /**
     * @brief Zoom by a scroll delta (positive moves closer)
     */
    void handle_mouse_scroll(double yoffset);

    void handle_resize(uint32_t width, uint32_t height);

    void set_distance(float distance);

    /**
     * @param azimuth Horizontal angle in degrees, wrapped to [0, 360)
     * @param elevation Vertical angle in degrees, clamped to [-89, 89]
     */
    void set_rotation(float azimuth, float elevation);

    void reset();

    [[nodiscard]] glm::vec3 position() const;
    [[nodiscard]] float distance() const { return m_distance; }
    [[nodiscard]] float azimuth() const { return m_azimuth; }
    [[nodiscard]] float elevation() const { return m_elevation; }
    [[nodiscard]] float aspect_ratio() const { return m_aspect_ratio; }
    [[nodiscard]] const CameraConfig& config() const { return m_config; }

private:
    void update_view_matrix();
    void update_projection_matrix();

    CameraConfig m_config;

    float m_distance;
    float m_azimuth;    ///< Degrees, 90 puts the camera on +Z
    float m_elevation;  ///< Degrees
    float m_aspect_ratio;

    glm::mat4 m_view_matrix{1.0f};
    glm::mat4 m_projection_matrix{1.0f};
    bool m_view_dirty = true;
    bool m_projection_dirty = true;

    float m_mouse_sensitivity = 0.25f;   ///< Degrees per pixel
    float m_scroll_sensitivity = 1.0f;   ///< Distance per scroll unit
};

} // namespace morph
