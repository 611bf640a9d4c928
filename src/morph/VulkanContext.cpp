// VulkanContext.cpp

#include <morph/VulkanContext.hpp>
#include <morph/Logger.hpp>
#include <array>
#include <cstring>
#include <optional>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace morph {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

vk::Bool32 debug_callback(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
    const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
    [[maybe_unused]] void* user_data)
{
	auto& logger = Logger::instance();
	auto pattern = fmt::format("[ParticleMorph]{:<30}[%^%5l%$] %v", "[VulkanDebug]");
	logger.set_pattern(pattern);
    switch (static_cast<VkDebugUtilsMessageSeverityFlagBitsEXT>(severity)) {
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT:
            logger.trace("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT:
            logger.debug("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT:
            logger.warn("{}", callback_data->pMessage);
            break;
        case VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT:
            logger.error("{}", callback_data->pMessage);
            break;
        default:
            logger.info("{}", callback_data->pMessage);
            break;
    }

    return vk::False;
}

bool check_validation_layer_support()
{
    auto available_res = vk::enumerateInstanceLayerProperties();
	if (available_res.result != vk::Result::eSuccess)
	{
		Logger::instance().warn("Could not query InstanceLayerProperties {}", to_string(available_res.result));
		return false;
	}
    for (const char* layer_name : VALIDATION_LAYERS) {
        bool found = false;
        for (const auto& layer : available_res.value) {
            if (std::strcmp(layer_name, layer.layerName) == 0) {
                found = true;
                break;
            }
        }
        if (!found) {
            Logger::instance().warn("Validation layer {} not available", layer_name);
            return false;
        }
    }
    return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
        .setMessageType(
            vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
            vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
            vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
        .setPfnUserCallback(debug_callback);
}

std::expected<vk::PhysicalDevice, std::string> select_physical_device(vk::Instance instance)
{
    auto devices_res = instance.enumeratePhysicalDevices();
	CHECK_VK_RESULT(devices_res, "Failed to enumerate physical devices: {}");

    for (auto type : {vk::PhysicalDeviceType::eDiscreteGpu, vk::PhysicalDeviceType::eIntegratedGpu}) {
        for (const auto& dev : devices_res.value) {
            auto props = dev.getProperties();
            if (props.deviceType == type) {
                Logger::instance().info("Selected {}: {}", vk::to_string(type), props.deviceName.data());
                return dev;
            }
        }
    }

    return std::unexpected("No discrete or integrated GPU found");
}

std::optional<uint32_t> find_graphics_family(vk::PhysicalDevice physical_device)
{
    auto queue_families = physical_device.getQueueFamilyProperties();
    for (uint32_t i = 0; i < queue_families.size(); i++) {
        if (queue_families[i].queueFlags & vk::QueueFlagBits::eGraphics)
            return i;
    }
    return std::nullopt;
}

} // anonymous namespace

std::expected<std::unique_ptr<VulkanContext>, std::string> VulkanContext::create(std::string_view title)
{
	std::unique_ptr<VulkanContext> context(new VulkanContext());
	if (auto result = context->initialize(title); !result)
		return std::unexpected(result.error());
	return context;
}

std::expected<void, std::string> VulkanContext::initialize(std::string_view title)
{
	static vk::detail::DynamicLoader dl;
	auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
	VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

	std::string app_name(title);
    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(app_name.c_str())
        .setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
        .setPEngineName("ParticleMorph")
        .setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    uint32_t glfw_extension_count = 0;
    const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);

    std::vector<const char*> extensions;
    if (glfw_extensions)
        extensions.assign(glfw_extensions, glfw_extensions + glfw_extension_count);
    else
        extensions.push_back(VK_KHR_SURFACE_EXTENSION_NAME);

    const bool validation = ENABLE_VALIDATION && check_validation_layer_support();
    if (validation)
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

    Logger::instance().debug("Instance extensions:");
    for (const auto* ext : extensions) {
        Logger::instance().debug("  {}", ext);
    }

    auto create_info = vk::InstanceCreateInfo()
        .setPApplicationInfo(&app_info)
        .setPEnabledExtensionNames(extensions);

    auto debug_create_info = make_debug_messenger_create_info();
    if (validation) {
        create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
        create_info.setPNext(&debug_create_info);
        Logger::instance().info("Validation layers enabled");
    }

    auto instance_res = vk::createInstance(create_info);
	CHECK_VK_RESULT(instance_res, "Failed to create instance: {}");
	m_instance = instance_res.value;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_instance);
    Logger::instance().debug("Created Vulkan instance");

    if (validation) {
        auto messenger_res = m_instance.createDebugUtilsMessengerEXT(debug_create_info);
        CHECK_VK_RESULT(messenger_res, "Failed to create debug messenger: {}");
        m_debug_messenger = messenger_res.value;
        Logger::instance().debug("Created debug messenger");
    }

    auto physical_device = select_physical_device(m_instance);
    if (!physical_device)
        return std::unexpected(physical_device.error());
    m_physical_device = *physical_device;

    auto graphics_family = find_graphics_family(m_physical_device);
    if (!graphics_family)
        return std::unexpected("Selected GPU has no graphics queue family");
    m_graphics_family = *graphics_family;
    Logger::instance().debug("Graphics queue family: {}", m_graphics_family);

    // Particles are drawn as point sprites larger than one pixel
    auto supported = m_physical_device.getFeatures();
    vk::PhysicalDeviceFeatures features{};
    features.largePoints = supported.largePoints;
    if (supported.largePoints) {
        m_max_point_size = m_physical_device.getProperties().limits.pointSizeRange[1];
    } else {
        Logger::instance().warn("GPU does not support large points, particles will be one pixel");
    }

    float queue_priority = 1.0f;
    auto queue_create_info = vk::DeviceQueueCreateInfo()
        .setQueueFamilyIndex(m_graphics_family)
        .setQueueCount(1)
        .setPQueuePriorities(&queue_priority);

    std::array device_extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    auto device_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_info)
        .setPEnabledExtensionNames(device_extensions)
        .setPEnabledFeatures(&features);

    auto device_res = m_physical_device.createDevice(device_info);
	CHECK_VK_RESULT(device_res, "Failed to create device: {}");
	m_device = device_res.value;
	VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);
    Logger::instance().debug("Created logical device");

    m_graphics_queue = m_device.getQueue(m_graphics_family, 0);

	Logger::instance().info("VulkanContext VK_HEADER_VERSION: {}", VK_HEADER_VERSION);
    Logger::instance().info("VulkanContext initialized (max point size {})", m_max_point_size);
    return {};
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(
    uint32_t type_filter,
    vk::MemoryPropertyFlags properties
) const {
    auto mem_properties = m_physical_device.getMemoryProperties();

    for (uint32_t i = 0; i < mem_properties.memoryTypeCount; i++) {
        if ((type_filter & (1 << i)) &&
            (mem_properties.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    return std::unexpected(std::format("No memory type with properties {}", vk::to_string(properties)));
}

VulkanContext::~VulkanContext()
{
    if (m_device) {
        m_device.destroy();
        Logger::instance().trace("Destroyed logical device");
    }

    if (m_debug_messenger) {
        m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
        Logger::instance().trace("Destroyed debug messenger");
    }

    if (m_instance) {
        m_instance.destroy();
        Logger::instance().trace("Destroyed instance");
    }
}

} // namespace morph
