#pragma once

#include "Camera3D.hpp"
#include "MorphController.hpp"
#include "Shader.hpp"
#include "SpriteMath.hpp"
#include "UICallback.hpp"
#include "VariantBuffers.hpp"
#include "VulkanContext.hpp"
#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace morph {

/**
 * @brief Look of the particle cloud. Colours are sRGB, as picked in the UI.
 */
struct RenderConfig {
    float base_size = 0.4f;
    glm::vec3 color_a = rgb_from_hex(0xff7300);
    glm::vec3 color_b = rgb_from_hex(0x0091ff);
    glm::vec3 clear_color = rgb_from_hex(0x160920);
    float rotation_speed = 0.02f;  ///< Radians per second around each axis
};

/**
 * @brief Information needed to render a frame
 */
struct FrameRenderInfo {
    uint32_t image_index;                      ///< Swapchain image index
    uint32_t current_frame;                    ///< Frame-in-flight index (for fence cycling)
    vk::Semaphore image_available_semaphore;   ///< Semaphore signaled when image is available
    vk::Framebuffer framebuffer;               ///< Target framebuffer
    vk::Extent2D extent;                       ///< Render area extent
    Camera3D& camera;                          ///< Camera for view/projection
    MorphSnapshot morph;                       ///< Which variants to blend, and how far
    glm::mat4 model;                           ///< Object rotation
    void* imgui_draw_data;                     ///< ImGui draw data (optional)
};

/**
 * @brief Draws the morphing cloud as additive, soft point sprites
 *
 * Each particle reads its position from the current and the target variant buffer
 * and blends them on the GPU with the morph progress. Size buffer and colours are
 * shared by every variant.
 *
 * Owns the graphics pipeline, per-frame uniform buffers and the command
 * infrastructure (one command buffer and render-finished semaphore per swapchain image).
 */
class ParticleMorphRenderer {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    /**
     * @brief Create the renderer
     *
     * @param context Vulkan context
     * @param render_pass Render pass the pipeline is used with
     * @param buffers Variant buffers to draw from; must outlive the renderer
     * @param config Initial colours and sizes
     * @return ParticleMorphRenderer instance or error message
     */
    static std::expected<std::unique_ptr<ParticleMorphRenderer>, std::string> create(
        const VulkanContext& context,
        vk::RenderPass render_pass,
        const VariantBuffers& buffers,
        const RenderConfig& config = {}
    );

    ~ParticleMorphRenderer();

    ParticleMorphRenderer(const ParticleMorphRenderer&) = delete;
    ParticleMorphRenderer& operator=(const ParticleMorphRenderer&) = delete;
    ParticleMorphRenderer(ParticleMorphRenderer&&) = delete;
    ParticleMorphRenderer& operator=(ParticleMorphRenderer&&) = delete;

    /**
     * @brief Record, submit and return the semaphore presentation has to wait on
     *
     * Waits for the frame-in-flight fence, records the render pass (particles, then
     * ImGui if draw data is given) and submits to the graphics queue.
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> render_frame(
        const FrameRenderInfo& info,
        vk::Queue graphics_queue
    );

    /**
     * @brief Recreate per-image semaphores and command buffers
     *
     * Call once after creation and whenever the swapchain image count may have changed.
     */
    std::expected<void, std::string> handle_swapchain_recreation(uint32_t new_image_count);

    /**
     * @brief Point the renderer at a different set of variant buffers
     *
     * The caller must make sure no frame using the old buffers is still in flight.
     */
    void set_variant_buffers(const VariantBuffers& buffers) { m_buffers = &buffers; }

    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

    [[nodiscard]] const RenderConfig& config() const { return m_config; }
    [[nodiscard]] float base_size() const { return m_config.base_size; }
    void set_base_size(float size) { m_config.base_size = size; }
    void set_color_a(glm::vec3 srgb) { m_config.color_a = srgb; }
    void set_color_b(glm::vec3 srgb) { m_config.color_b = srgb; }

    /// Clear colour converted for the sRGB swapchain
    [[nodiscard]] std::array<vk::ClearValue, 2> clear_values() const;

private:
    ParticleMorphRenderer(
        const VulkanContext& context,
        vk::RenderPass render_pass,
        const VariantBuffers& buffers,
        const RenderConfig& config
    );

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> load_shaders();
    std::expected<void, std::string> create_descriptor_layout();
    std::expected<void, std::string> create_pipeline();
    std::expected<void, std::string> create_uniform_buffers();
    std::expected<void, std::string> create_descriptor_sets();
    std::expected<void, std::string> create_sync_objects();

    void write_uniforms(const FrameRenderInfo& info);
    void record(vk::CommandBuffer cmd, const FrameRenderInfo& info) const;

    void destroy_per_image_resources();
    void cleanup();

    const VulkanContext* m_context;
    vk::Device m_device;
    vk::RenderPass m_render_pass;
    const VariantBuffers* m_buffers;
    RenderConfig m_config;

    std::optional<Shader> m_vertex_shader;
    std::optional<Shader> m_fragment_shader;
    vk::DescriptorSetLayout m_descriptor_layout;
    uint32_t m_uniform_binding = 0;
    vk::PipelineLayout m_pipeline_layout;
    vk::Pipeline m_graphics_pipeline;

    vk::DescriptorPool m_descriptor_pool;
    std::array<vk::DescriptorSet, MAX_FRAMES_IN_FLIGHT> m_descriptor_sets{};

    // Persistently mapped, one per frame in flight
    std::array<vk::Buffer, MAX_FRAMES_IN_FLIGHT> m_uniform_buffers{};
    std::array<vk::DeviceMemory, MAX_FRAMES_IN_FLIGHT> m_uniform_memory{};
    std::array<void*, MAX_FRAMES_IN_FLIGHT> m_uniform_mapped{};

    vk::CommandPool m_graphics_command_pool;
    std::vector<vk::CommandBuffer> m_command_buffers;        // One per swapchain image
    std::vector<vk::Semaphore> m_render_finished_semaphores; // One per swapchain image
    std::vector<vk::Fence> m_in_flight_fences;               // One per frame in flight
    std::vector<vk::Fence> m_images_in_flight;               // Fence currently using each image
};

} // namespace morph
