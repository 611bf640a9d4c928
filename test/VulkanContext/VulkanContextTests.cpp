#include <catch2/catch_test_macros.hpp>
#include <morph/VulkanContext.hpp>
#include <morph/Logger.hpp>

using namespace morph;

TEST_CASE("VulkanContext creation", "[vulkan]")
{
	Logger::instance().set_level(spdlog::level::trace);
	auto ctx = VulkanContext::create("Test App");
	INFO((ctx ? std::string{} : ctx.error()));
	REQUIRE(ctx.has_value());
	REQUIRE(*ctx != nullptr);
}

TEST_CASE("VulkanContext provides valid handles", "[vulkan]")
{
	auto ctx_result = VulkanContext::create("Test App");
	REQUIRE(ctx_result.has_value());
	auto& ctx = **ctx_result;

	SECTION("instance is valid")
	{
		REQUIRE(ctx.instance());
	}

	SECTION("physical device is valid")
	{
		REQUIRE(ctx.physical_device());
	}

	SECTION("device is valid")
	{
		REQUIRE(ctx.device());
	}

	SECTION("graphics queue is valid")
	{
		REQUIRE(ctx.graphics_queue());
	}

	SECTION("graphics family supports graphics")
	{
		auto families = ctx.physical_device().getQueueFamilyProperties();
		REQUIRE(ctx.graphics_family() < families.size());
		REQUIRE(families[ctx.graphics_family()].queueFlags & vk::QueueFlagBits::eGraphics);
	}

	SECTION("point size limit is usable")
	{
		REQUIRE(ctx.max_point_size() >= 1.0f);
	}
}

TEST_CASE("VulkanContext finds memory types", "[vulkan]")
{
	auto ctx_result = VulkanContext::create("Memory Test");
	REQUIRE(ctx_result.has_value());
	auto& ctx = **ctx_result;

	auto buffer_res = ctx.device().createBuffer(vk::BufferCreateInfo()
		.setSize(1024)
		.setUsage(vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eTransferDst)
		.setSharingMode(vk::SharingMode::eExclusive));
	REQUIRE(buffer_res.result == vk::Result::eSuccess);
	auto reqs = ctx.device().getBufferMemoryRequirements(buffer_res.value);

	SECTION("device local memory exists for vertex buffers")
	{
		auto type = ctx.find_memory_type(reqs.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
		REQUIRE(type.has_value());
		REQUIRE((reqs.memoryTypeBits & (1u << *type)) != 0);
	}

	SECTION("an empty type filter is rejected")
	{
		auto type = ctx.find_memory_type(0, vk::MemoryPropertyFlagBits::eHostVisible);
		REQUIRE_FALSE(type.has_value());
	}

	ctx.device().destroyBuffer(buffer_res.value);
}
