#pragma once

#include <morph/Common.hpp>
#include <morph/VulkanContext.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace morph {

/**
 * @brief Window creation parameters
 */
struct WindowConfig {
    int width = 1280;
    int height = 720;
    std::string title = "ParticleMorph";
    bool vsync = true;  ///< FIFO when set, mailbox (if available) otherwise
};

/**
 * @brief GLFW window plus everything needed to present into it
 *
 * Owns surface, swapchain, depth buffer, render pass and framebuffers, and rebuilds the
 * size dependent parts when the window is resized or the swapchain goes out of date.
 * The swapchain uses an sRGB format whenever the surface offers one, so shaders write
 * linear colour and the presentation engine encodes it.
 */
class Window {
public:
    /**
     * @brief Create the window and its presentation resources
     *
     * @param context Vulkan context; must outlive the window
     * @param config Size, title and present mode
     * @return Window on success, error message on failure
     */
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        const WindowConfig& config
    );

    ~Window();

    /**
     * @brief Initialize GLFW once per process
     *
     * Must run before the VulkanContext is created so the instance gets the surface extensions.
     */
    static std::expected<void, std::string> init_glfw();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    [[nodiscard]] bool should_close() const;

    [[nodiscard]] GLFWwindow* handle() const { return m_handle; }
    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] vk::Format color_format() const { return m_surface_format.format; }
    [[nodiscard]] bool is_srgb() const;

    [[nodiscard]] uint32_t image_count() const {
        return static_cast<uint32_t>(m_swapchain_images.size());
    }

    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t index) const {
        return m_framebuffers[index];
    }

    /**
     * @brief Acquire the next swapchain image
     *
     * Rebuilds the swapchain first if a resize is pending or the swapchain is out of date.
     *
     * @param signal_semaphore Signalled once the image can be rendered to
     * @return Image index, or nullopt if the swapchain was rebuilt and the frame should be skipped
     */
    [[nodiscard]] std::optional<uint32_t> acquire_next_image(vk::Semaphore signal_semaphore);

    /**
     * @brief Queue the image for presentation
     *
     * @return false if the swapchain is out of date (it is rebuilt on the next acquire)
     */
    [[nodiscard]] bool present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index);

    /**
     * @brief Request a swapchain rebuild before the next acquire
     */
    void mark_resize_needed() { m_needs_resize = true; }

private:
    Window(const VulkanContext& context, const WindowConfig& config);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> create_swapchain(vk::SwapchainKHR old_swapchain);
    std::expected<void, std::string> create_depth_resources();
    std::expected<void, std::string> create_render_pass();
    std::expected<void, std::string> create_framebuffers();
    std::expected<void, std::string> recreate_swapchain();

    std::expected<vk::ImageView, std::string> create_image_view(
        vk::Image image,
        vk::Format format,
        vk::ImageAspectFlags aspect
    ) const;

    std::expected<vk::Format, std::string> find_depth_format() const;

    /// Destroys everything that depends on the extent; keeps the swapchain if requested
    void destroy_size_dependent(bool keep_swapchain);

    vk::SurfaceFormatKHR choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats) const;
    vk::PresentModeKHR choose_present_mode(const std::vector<vk::PresentModeKHR>& modes) const;
    vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const;

    const VulkanContext* m_context;
    vk::Device m_device;
    WindowConfig m_config;
    GLFWwindow* m_handle = nullptr;

    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode = vk::PresentModeKHR::eFifo;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;
    std::vector<vk::Image> m_swapchain_images;
    std::vector<vk::ImageView> m_image_views;

    vk::Format m_depth_format = vk::Format::eUndefined;
    vk::Image m_depth_image;
    vk::DeviceMemory m_depth_memory;
    vk::ImageView m_depth_view;

    vk::RenderPass m_render_pass;
    std::vector<vk::Framebuffer> m_framebuffers;

    bool m_needs_resize = false;
};

} // namespace morph
