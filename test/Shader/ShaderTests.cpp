#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <string_view>
#include <variant>

#include <morph/Logger.hpp>
#include <morph/Shader.hpp>
#include <morph/VulkanContext.hpp>

using namespace morph;

TEST_CASE("Particle morph vertex shader reflects its interface", "[vulkan][shader][vertex]")
{
	Logger::instance().set_level(spdlog::level::trace);
	auto ctx = VulkanContext::create("Shader Test");
	REQUIRE(ctx.has_value());

	auto shader_result = Shader::create_shader((*ctx)->device(), "morph/particle_morph.vert.slang");
	INFO((shader_result ? std::string{} : shader_result.error().describe()));
	REQUIRE(shader_result.has_value());
	auto& shader = shader_result.value();

	SECTION("shader module is valid")
	{
		REQUIRE(shader.get_shader_module());
		REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eVertex);
	}

	SECTION("one uniform buffer holding the morph uniforms")
	{
		const auto& descriptors = shader.get_descriptor_infos();
		REQUIRE(descriptors.size() == 1);

		const auto& desc = descriptors[0];
		REQUIRE(desc.name == "uniforms");
		REQUIRE(desc.set == 0);
		REQUIRE(desc.descriptor_count == 1);
		REQUIRE(desc.type == vk::DescriptorType::eUniformBuffer);
		REQUIRE(desc.stage == vk::ShaderStageFlagBits::eVertex);
		REQUIRE(desc.size == 240); // 3x float4x4 + 2x (float3, float) + 2x float2
	}

	SECTION("current, target and size come from three vertex buffers")
	{
		const auto* vertex = std::get_if<VertexDetails>(&shader.get_details());
		REQUIRE(vertex != nullptr);

		REQUIRE(vertex->bindings.size() == 3);
		REQUIRE(vertex->bindings[0].name == "CurrentPosition");
		REQUIRE(vertex->bindings[0].stride == 12);
		REQUIRE(vertex->bindings[1].name == "TargetPosition");
		REQUIRE(vertex->bindings[1].stride == 12);
		REQUIRE(vertex->bindings[2].name == "ParticleSize");
		REQUIRE(vertex->bindings[2].stride == 4);

		REQUIRE(vertex->inputs.size() == 3);
		for (uint32_t i = 0; i < 3; ++i)
		{
			REQUIRE(vertex->inputs[i].binding == i);
			REQUIRE(vertex->inputs[i].offset == 0);
		}
		REQUIRE(vertex->inputs[0].format == vk::Format::eR32G32B32Sfloat);
		REQUIRE(vertex->inputs[1].format == vk::Format::eR32G32B32Sfloat);
		REQUIRE(vertex->inputs[2].format == vk::Format::eR32Sfloat);

		// Locations are distinct so the pipeline can feed each attribute separately
		REQUIRE(vertex->inputs[0].location != vertex->inputs[1].location);
		REQUIRE(vertex->inputs[1].location != vertex->inputs[2].location);
		REQUIRE(vertex->inputs[0].location != vertex->inputs[2].location);
	}

	SECTION("only the colour is passed on, position and point size are system values")
	{
		const auto& vertex = std::get<VertexDetails>(shader.get_details());
		REQUIRE(vertex.outputs.size() == 1);
		REQUIRE(vertex.outputs[0].name == "color");
		REQUIRE(vertex.outputs[0].format == vk::Format::eR32G32B32Sfloat);
	}
}

TEST_CASE("Particle morph stages link up", "[vulkan][shader][validation]")
{
	auto ctx = VulkanContext::create("Shader Test");
	REQUIRE(ctx.has_value());

	auto vert = Shader::create_shader((*ctx)->device(), "morph/particle_morph.vert.slang");
	auto frag = Shader::create_shader((*ctx)->device(), "morph/particle_morph.frag.slang");
	REQUIRE(vert.has_value());
	REQUIRE(frag.has_value());

	SECTION("fragment stage reads the colour and nothing else from the vertex stage")
	{
		const auto* fragment = std::get_if<FragmentDetails>(&frag->get_details());
		REQUIRE(fragment != nullptr);
		REQUIRE(fragment->inputs.size() == 1);
		REQUIRE(fragment->inputs[0].name == "color");
		REQUIRE(frag->stage() == vk::ShaderStageFlagBits::eFragment);
	}

	SECTION("vertex outputs match fragment inputs")
	{
		REQUIRE(vert->get_details().matches(frag->get_details()));
	}

	SECTION("fragment is the end of the chain")
	{
		REQUIRE_FALSE(frag->get_details().matches(vert->get_details()));
	}

	SECTION("fragment stage uses no descriptors")
	{
		REQUIRE(frag->get_descriptor_infos().empty());
	}

	SECTION("stage create infos point at the compiled modules")
	{
		auto info = vert->create_pipeline_shader_stage_create_info();
		REQUIRE(info.stage == vk::ShaderStageFlagBits::eVertex);
		REQUIRE(info.module == vert->get_shader_module());
		REQUIRE(std::string_view(info.pName) == "main");
	}
}

TEST_CASE("Missing shader module reports a compile error", "[vulkan][shader][error]")
{
	auto ctx = VulkanContext::create("Shader Test");
	REQUIRE(ctx.has_value());

	auto shader = Shader::create_shader((*ctx)->device(), "morph/does_not_exist.slang");
	REQUIRE_FALSE(shader.has_value());
	REQUIRE(shader.error().shader == "morph/does_not_exist.slang");
	REQUIRE_FALSE(shader.error().diagnostics.empty());
	REQUIRE(shader.error().describe().find("does_not_exist") != std::string::npos);
}
