#pragma once

#include "Camera3D.hpp"
#include "MorphController.hpp"
#include "ParticleMorphRenderer.hpp"
#include "ParticleSet.hpp"
#include "RandomSource.hpp"
#include "VariantBuffers.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace morph {

/**
 * @brief Configuration for the particle morph application
 */
struct AppConfig {
    WindowConfig window;
    uint32_t seed = 0;            ///< 0 picks a random seed
    float particle_scale = 1.0f;  ///< Scale applied to the default shapes
    MorphConfig morph;
    RenderConfig render;
    CameraConfig camera;
};

/**
 * @brief Owns the window, the GPU resources and the main loop
 *
 * Ties the pieces together:
 * - ParticleSet / VariantBuffers: normalized shapes on the CPU and the GPU
 * - MorphController: which shape is shown and how far the morph has progressed
 * - ParticleMorphRenderer: draws the blended cloud
 *
 * Input, the ImGui debug panel and camera handling live here too.
 */
class MorphApplication {
public:
    /**
     * @brief Create the window, the Vulkan context and ImGui
     *
     * @param config Application configuration
     * @return Application instance or error message
     */
    static std::expected<std::unique_ptr<MorphApplication>, std::string> create(
        const AppConfig& config = {}
    );

    ~MorphApplication();

    // Non-copyable, non-movable (GLFW holds a pointer to this)
    MorphApplication(const MorphApplication&) = delete;
    MorphApplication& operator=(const MorphApplication&) = delete;
    MorphApplication(MorphApplication&&) = delete;
    MorphApplication& operator=(MorphApplication&&) = delete;

    /**
     * @brief Normalize and upload a new set of shapes, replacing the current one
     *
     * The morph restarts from the first shape.
     *
     * @param shapes Named point clouds; indices follow the given order
     */
    std::expected<void, std::string> load_shapes(std::vector<ShapeInput> shapes);

    /**
     * @brief load_shapes() with torus, sphere, disc and helix
     */
    std::expected<void, std::string> load_default_shapes();

    /**
     * @brief Queue a morph to the shape at index; applied on the next frame
     */
    std::expected<void, InvalidVariantIndexError> morph_to(std::size_t index);

    /**
     * @brief Queue a morph to the first shape with the given name
     */
    std::expected<void, std::string> morph_to(std::string_view name);

    /**
     * @brief Run the main application loop
     *
     * Blocks until the window is closed. Shapes must be loaded first.
     *
     * @return Error message if something goes wrong, or void on success
     */
    std::expected<void, std::string> run();

    [[nodiscard]] const VulkanContext& context() const { return *m_context; }
    [[nodiscard]] MorphController* controller() { return m_controller.get(); }
    [[nodiscard]] const ParticleSet* particles() const { return m_particles ? &*m_particles : nullptr; }

private:
    explicit MorphApplication(const AppConfig& config);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> setup_imgui();

    /**
     * @brief Rebuild everything that depends on the swapchain image count or extent
     */
    std::expected<void, std::string> handle_swapchain_recreation();

    std::expected<void, std::string> create_image_available_semaphores();
    void destroy_image_available_semaphores();

    void toggle_mouse_capture();

    /// Rotation applied to the whole cloud, elapsed seconds times the configured speed on every axis
    [[nodiscard]] glm::mat4 model_matrix() const;

    void render_ui();
    void render_ui_callbacks(const std::vector<UICallback>& callbacks);

    void cleanup();

    // GLFW callbacks (friends to access private members)
    friend void glfw_key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    friend void glfw_mouse_callback(GLFWwindow* window, double xpos, double ypos);
    friend void glfw_scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
    friend void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

    AppConfig m_config;
    SeededRandomSource m_random;

    // Core Vulkan resources
    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;

    // Shapes and morph state
    std::optional<ParticleSet> m_particles;
    std::unique_ptr<VariantBuffers> m_buffers;
    std::unique_ptr<MorphController> m_controller;
    std::unique_ptr<ParticleMorphRenderer> m_renderer;

    // Camera and input
    std::unique_ptr<Camera3D> m_camera;
    double m_last_mouse_x = 0.0;
    double m_last_mouse_y = 0.0;
    bool m_first_mouse = true;
    bool m_mouse_captured = false;

    vk::DescriptorPool m_imgui_descriptor_pool;
    std::vector<vk::Semaphore> m_image_available_semaphores;  // Cycled, one per swapchain image

    float m_elapsed = 0.0f;
    uint32_t m_current_frame = 0;
};

} // namespace morph
