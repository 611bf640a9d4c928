#include <morph/Window.hpp>
#include <morph/Logger.hpp>
#include <algorithm>
#include <array>

namespace morph {

namespace {

void glfw_error_callback(int code, const char* description)
{
    Logger::instance().error("GLFW error {}: {}", code, description);
}

} // anonymous namespace

std::expected<void, std::string> Window::init_glfw() {
    static bool initialized = false;
    if (initialized)
        return {};

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
        return std::unexpected("Failed to initialize GLFW");
    if (!glfwVulkanSupported())
        return std::unexpected("GLFW reports no Vulkan loader");

    initialized = true;
    return {};
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    const WindowConfig& config
) {
    if (auto result = init_glfw(); !result)
        return std::unexpected(result.error());

    std::unique_ptr<Window> window(new Window(context, config));
    if (!window->m_handle)
        return std::unexpected("Failed to create GLFW window");

    if (auto result = window->initialize(); !result)
        return std::unexpected(result.error());

    return window;
}

Window::Window(const VulkanContext& context, const WindowConfig& config)
    : m_context(&context)
    , m_device(context.device())
    , m_config(config)
{
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    m_handle = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
}

Window::~Window() {
    if (m_device) {
        destroy_size_dependent(false);
        if (m_render_pass)
            m_device.destroyRenderPass(m_render_pass);
    }
    if (m_surface)
        m_context->instance().destroySurfaceKHR(m_surface);
    if (m_handle)
        glfwDestroyWindow(m_handle);
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_handle);
}

bool Window::is_srgb() const {
    return m_surface_format.format == vk::Format::eB8G8R8A8Srgb ||
           m_surface_format.format == vk::Format::eR8G8B8A8Srgb;
}

std::expected<void, std::string> Window::initialize() {
    if (auto result = create_surface(); !result)
        return result;
    if (auto result = create_swapchain(nullptr); !result)
        return result;

    auto depth_format = find_depth_format();
    if (!depth_format)
        return std::unexpected(depth_format.error());
    m_depth_format = *depth_format;

    if (auto result = create_depth_resources(); !result)
        return result;
    if (auto result = create_render_pass(); !result)
        return result;
    if (auto result = create_framebuffers(); !result)
        return result;

    Logger::instance().info("Window {}x{} with {} swapchain images ({})",
        m_extent.width, m_extent.height, image_count(), vk::to_string(m_surface_format.format));
    if (!is_srgb())
        Logger::instance().warn("Surface offers no sRGB format, colours will look too dark");
    return {};
}

std::expected<void, std::string> Window::create_surface() {
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context->instance()),
        m_handle,
        nullptr,
        &surface_c
    );
    if (result != VK_SUCCESS)
        return std::unexpected(std::format("Failed to create window surface: {}", vk::to_string(static_cast<vk::Result>(result))));

    auto support_res = m_context->physical_device().getSurfaceSupportKHR(m_context->graphics_family(), vk::SurfaceKHR(surface_c));
    CHECK_VK_RESULT(support_res, "Could not query present support: {}");
    m_surface = vk::SurfaceKHR(surface_c);
    if (!support_res.value)
        return std::unexpected("Graphics queue family cannot present to this surface");
    return {};
}

std::expected<void, std::string> Window::create_swapchain(vk::SwapchainKHR old_swapchain) {
    auto physical_device = m_context->physical_device();

    auto capabilities_res = physical_device.getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(capabilities_res, "Could not query surface capabilities: {}");
    auto formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats_res, "Could not query surface formats: {}");
    auto modes_res = physical_device.getSurfacePresentModesKHR(m_surface);
    CHECK_VK_RESULT(modes_res, "Could not query present modes: {}");

    if (formats_res.value.empty())
        return std::unexpected("Surface reports no formats");

    const auto& capabilities = capabilities_res.value;
    m_surface_format = choose_surface_format(formats_res.value);
    m_present_mode = choose_present_mode(modes_res.value);
    m_extent = choose_extent(capabilities);

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0)
        image_count = std::min(image_count, capabilities.maxImageCount);

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true)
        .setOldSwapchain(old_swapchain);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain: {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images: {}");
    m_swapchain_images = std::move(images_res.value);

    for (auto image : m_swapchain_images) {
        auto view = create_image_view(image, m_surface_format.format, vk::ImageAspectFlagBits::eColor);
        if (!view)
            return std::unexpected(view.error());
        m_image_views.push_back(*view);
    }
    return {};
}

std::expected<vk::ImageView, std::string> Window::create_image_view(
    vk::Image image,
    vk::Format format,
    vk::ImageAspectFlags aspect
) const {
    auto view_info = vk::ImageViewCreateInfo()
        .setImage(image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(format)
        .setSubresourceRange(vk::ImageSubresourceRange()
            .setAspectMask(aspect)
            .setLevelCount(1)
            .setLayerCount(1));
    auto view_res = m_device.createImageView(view_info);
    CHECK_VK_RESULT(view_res, "Could not create image view: {}");
    return view_res.value;
}

std::expected<vk::Format, std::string> Window::find_depth_format() const {
    for (auto format : {vk::Format::eD32Sfloat, vk::Format::eD32SfloatS8Uint, vk::Format::eD24UnormS8Uint}) {
        auto props = m_context->physical_device().getFormatProperties(format);
        if (props.optimalTilingFeatures & vk::FormatFeatureFlagBits::eDepthStencilAttachment)
            return format;
    }
    return std::unexpected("No supported depth format");
}

std::expected<void, std::string> Window::create_depth_resources() {
    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setExtent(vk::Extent3D(m_extent.width, m_extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setFormat(m_depth_format)
        .setTiling(vk::ImageTiling::eOptimal)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setUsage(vk::ImageUsageFlagBits::eDepthStencilAttachment)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setSamples(vk::SampleCountFlagBits::e1);

    auto image_res = m_device.createImage(image_info);
    CHECK_VK_RESULT(image_res, "Could not create depth image: {}");
    m_depth_image = image_res.value;

    auto requirements = m_device.getImageMemoryRequirements(m_depth_image);
    auto memory_type = m_context->find_memory_type(requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!memory_type)
        return std::unexpected(memory_type.error());

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = m_device.allocateMemory(alloc_info);
    CHECK_VK_RESULT(memory_res, "Could not allocate depth memory: {}");
    m_depth_memory = memory_res.value;

    auto bind_res = m_device.bindImageMemory(m_depth_image, m_depth_memory, 0);
    CHECK_VK_RESULT_VOID(bind_res, "Could not bind depth memory: {}");

    auto view = create_image_view(m_depth_image, m_depth_format, vk::ImageAspectFlagBits::eDepth);
    if (!view)
        return std::unexpected(view.error());
    m_depth_view = *view;
    return {};
}

std::expected<void, std::string> Window::create_render_pass() {
    std::array attachments = {
        vk::AttachmentDescription()
            .setFormat(m_surface_format.format)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setLoadOp(vk::AttachmentLoadOp::eClear)
            .setStoreOp(vk::AttachmentStoreOp::eStore)
            .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
            .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setInitialLayout(vk::ImageLayout::eUndefined)
            .setFinalLayout(vk::ImageLayout::ePresentSrcKHR),
        vk::AttachmentDescription()
            .setFormat(m_depth_format)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setLoadOp(vk::AttachmentLoadOp::eClear)
            .setStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
            .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setInitialLayout(vk::ImageLayout::eUndefined)
            .setFinalLayout(vk::ImageLayout::eDepthStencilAttachmentOptimal),
    };

    auto color_ref = vk::AttachmentReference(0, vk::ImageLayout::eColorAttachmentOptimal);
    auto depth_ref = vk::AttachmentReference(1, vk::ImageLayout::eDepthStencilAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref)
        .setPDepthStencilAttachment(&depth_ref);

    auto stages = vk::PipelineStageFlagBits::eColorAttachmentOutput | vk::PipelineStageFlagBits::eEarlyFragmentTests;
    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(stages)
        .setDstStageMask(stages)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite | vk::AccessFlagBits::eDepthStencilAttachmentWrite);

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(attachments)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto render_pass_res = m_device.createRenderPass(render_pass_info);
    CHECK_VK_RESULT(render_pass_res, "Could not create render pass: {}");
    m_render_pass = render_pass_res.value;
    return {};
}

std::expected<void, std::string> Window::create_framebuffers() {
    for (auto view : m_image_views) {
        std::array attachments = {view, m_depth_view};
        auto framebuffer_info = vk::FramebufferCreateInfo()
            .setRenderPass(m_render_pass)
            .setAttachments(attachments)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1);
        auto framebuffer_res = m_device.createFramebuffer(framebuffer_info);
        CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer: {}");
        m_framebuffers.push_back(framebuffer_res.value);
    }
    return {};
}

std::optional<uint32_t> Window::acquire_next_image(vk::Semaphore signal_semaphore) {
    if (m_needs_resize) {
        m_needs_resize = false;
        if (auto result = recreate_swapchain(); !result)
            Logger::instance().error("Failed to recreate swapchain: {}", result.error());
        return std::nullopt;
    }

    auto acquire_res = m_device.acquireNextImageKHR(m_swapchain, UINT64_MAX, signal_semaphore, nullptr);
    switch (acquire_res.result) {
        case vk::Result::eSuccess:
            return acquire_res.value;
        case vk::Result::eSuboptimalKHR:
            // The semaphore is signalled, so the image has to be used this frame
            m_needs_resize = true;
            return acquire_res.value;
        case vk::Result::eErrorOutOfDateKHR:
            if (auto result = recreate_swapchain(); !result)
                Logger::instance().error("Failed to recreate swapchain: {}", result.error());
            return std::nullopt;
        default:
            Logger::instance().error("acquireNextImageKHR error: {}", vk::to_string(acquire_res.result));
            return std::nullopt;
    }
}

bool Window::present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index) {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    // vulkan.hpp treats eErrorOutOfDateKHR as fatal here, so go through the C entry point
    auto result = static_cast<vk::Result>(VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(queue),
        reinterpret_cast<const VkPresentInfoKHR*>(&present_info)
    ));

    if (result == vk::Result::eErrorOutOfDateKHR || result == vk::Result::eSuboptimalKHR) {
        m_needs_resize = true;
        return result == vk::Result::eSuboptimalKHR;
    }
    if (result != vk::Result::eSuccess) {
        Logger::instance().error("presentKHR error: {}", vk::to_string(result));
        return false;
    }
    return true;
}

std::expected<void, std::string> Window::recreate_swapchain() {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    while (width == 0 || height == 0) {
        // Minimized, nothing to present into
        glfwWaitEvents();
        glfwGetFramebufferSize(m_handle, &width, &height);
    }
    m_config.width = width;
    m_config.height = height;

    auto wait_res = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(wait_res, "waitIdle before swapchain rebuild failed: {}");

    auto old_swapchain = m_swapchain;
    destroy_size_dependent(true);
    m_swapchain = nullptr;

    auto result = create_swapchain(old_swapchain);
    m_device.destroySwapchainKHR(old_swapchain);
    if (!result)
        return result;
    if (auto depth = create_depth_resources(); !depth)
        return depth;
    if (auto framebuffers = create_framebuffers(); !framebuffers)
        return framebuffers;

    Logger::instance().info("Swapchain recreated: {}x{}", m_extent.width, m_extent.height);
    return {};
}

void Window::destroy_size_dependent(bool keep_swapchain) {
    for (auto framebuffer : m_framebuffers)
        m_device.destroyFramebuffer(framebuffer);
    m_framebuffers.clear();

    if (m_depth_view)
        m_device.destroyImageView(m_depth_view);
    if (m_depth_image)
        m_device.destroyImage(m_depth_image);
    if (m_depth_memory)
        m_device.freeMemory(m_depth_memory);
    m_depth_view = nullptr;
    m_depth_image = nullptr;
    m_depth_memory = nullptr;

    for (auto view : m_image_views)
        m_device.destroyImageView(view);
    m_image_views.clear();
    m_swapchain_images.clear();

    if (!keep_swapchain && m_swapchain)
        m_device.destroySwapchainKHR(m_swapchain);
    if (!keep_swapchain)
        m_swapchain = nullptr;
}

vk::SurfaceFormatKHR Window::choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats) const {
    for (auto wanted : {vk::Format::eB8G8R8A8Srgb, vk::Format::eR8G8B8A8Srgb}) {
        for (const auto& format : formats) {
            if (format.format == wanted && format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear)
                return format;
        }
    }
    return formats.front();
}

vk::PresentModeKHR Window::choose_present_mode(const std::vector<vk::PresentModeKHR>& modes) const {
    if (m_config.vsync)
        return vk::PresentModeKHR::eFifo;
    if (std::ranges::find(modes, vk::PresentModeKHR::eMailbox) != modes.end())
        return vk::PresentModeKHR::eMailbox;
    if (std::ranges::find(modes, vk::PresentModeKHR::eImmediate) != modes.end())
        return vk::PresentModeKHR::eImmediate;
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D Window::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const {
    if (capabilities.currentExtent.width != UINT32_MAX)
        return capabilities.currentExtent;

    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    return vk::Extent2D(
        std::clamp(static_cast<uint32_t>(width), capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(height), capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    );
}

} // namespace morph
