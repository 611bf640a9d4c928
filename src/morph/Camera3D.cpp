#include <morph/Camera3D.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace morph {

namespace {

float wrap_degrees(float angle) {
    angle = std::fmod(angle, 360.0f);
    return angle < 0.0f ? angle + 360.0f : angle;
}

} // anonymous namespace

Camera3D::Camera3D(uint32_t viewport_width, uint32_t viewport_height, CameraConfig config)
    : m_config(config)
    , m_distance(config.distance)
    , m_azimuth(90.0f)
    , m_elevation(0.0f)
    , m_aspect_ratio(viewport_height > 0 ? static_cast<float>(viewport_width) / static_cast<float>(viewport_height) : 1.0f)
{}

void Camera3D::update_view_matrix() {
    if (!m_view_dirty) return;
    m_view_matrix = glm::lookAt(position(), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    m_view_dirty = false;
}

void Camera3D::update_projection_matrix() {
    if (!m_projection_dirty) return;
    // GLM_FORCE_DEPTH_ZERO_TO_ONE gives Vulkan's depth range, Y is flipped by a negative viewport height
    m_projection_matrix = glm::perspective(glm::radians(m_config.fov), m_aspect_ratio, m_config.near_plane, m_config.far_plane);
    m_projection_dirty = false;
}

glm::mat4 Camera3D::view_matrix() {
    update_view_matrix();
    return m_view_matrix;
}

glm::mat4 Camera3D::projection_matrix() {
    update_projection_matrix();
    return m_projection_matrix;
}

glm::mat4 Camera3D::view_projection_matrix() {
    update_view_matrix();
    update_projection_matrix();
    return m_projection_matrix * m_view_matrix;
}

glm::vec3 Camera3D::position() const {
    float azimuth_rad = glm::radians(m_azimuth);
    float elevation_rad = glm::radians(m_elevation);
    return glm::vec3(
        m_distance * std::cos(elevation_rad) * std::cos(azimuth_rad),
        m_distance * std::sin(elevation_rad),
        m_distance * std::cos(elevation_rad) * std::sin(azimuth_rad)
    );
}

void Camera3D::handle_mouse_movement(double xoffset, double yoffset) {
    set_rotation(
        m_azimuth - static_cast<float>(xoffset) * m_mouse_sensitivity,
        m_elevation + static_cast<float>(yoffset) * m_mouse_sensitivity
    );
}

void Camera3D::handle_mouse_scroll(double yoffset) {
    set_distance(m_distance - static_cast<float>(yoffset) * m_scroll_sensitivity);
}

void Camera3D::handle_resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    m_aspect_ratio = static_cast<float>(width) / static_cast<float>(height);
    m_projection_dirty = true;
}

void Camera3D::set_distance(float distance) {
    m_distance = std::clamp(distance, m_config.min_distance, m_config.max_distance);
    m_view_dirty = true;
}

void Camera3D::set_rotation(float azimuth, float elevation) {
    m_azimuth = wrap_degrees(azimuth);
    m_elevation = std::clamp(elevation, -89.0f, 89.0f);
    m_view_dirty = true;
}

void Camera3D::reset() {
    m_distance = m_config.distance;
    m_azimuth = 90.0f;
    m_elevation = 0.0f;
    m_view_dirty = true;
}

} // namespace morph
