#ifndef PARTICLEMORPH_VULKANCONTEXT_HPP
#define PARTICLEMORPH_VULKANCONTEXT_HPP

#include "Common.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace morph {

/**
 * @brief Instance, device and the single graphics queue everything is submitted to
 *
 * Validation layers and the debug messenger are enabled in debug builds when available.
 */
class VulkanContext
{
public:
	/**
	 * @brief Create the instance, pick a GPU (discrete first) and create the logical device
	 *
	 * @param title Application name reported to the driver
	 */
	static std::expected<std::unique_ptr<VulkanContext>, std::string> create(std::string_view title);

	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] uint32_t graphics_family() const { return m_graphics_family; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }

	/// Largest point size the rasterizer accepts, in pixels
	[[nodiscard]] float max_point_size() const { return m_max_point_size; }

	/**
	 * @brief Memory type index satisfying both the resource's filter and the requested properties
	 */
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(
		uint32_t type_filter,
		vk::MemoryPropertyFlags properties
	) const;

private:
	VulkanContext() = default;

	std::expected<void, std::string> initialize(std::string_view title);

	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	uint32_t m_graphics_family = 0;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
	float m_max_point_size = 1.0f;
};

} // namespace morph

#endif // PARTICLEMORPH_VULKANCONTEXT_HPP
