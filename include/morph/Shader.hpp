#ifndef PARTICLEMORPH_SHADER_HPP
#define PARTICLEMORPH_SHADER_HPP
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <slang.h>

#include "Common.hpp"
#include "Errors.hpp"

namespace morph {

struct DescriptorInfo
{
	std::string name;
	std::size_t size; // Size per descriptor
	std::size_t binding; // Binding ID
	std::size_t set; // Set ID
	std::size_t descriptor_count; // 1 if not array
	vk::DescriptorType type;
	vk::ShaderStageFlagBits stage;
};

struct StageVariable {
	std::string name;
	uint32_t location;
	vk::Format format;
};

struct ShaderDetails;

struct VertexAttribute {
	std::string name;
	uint32_t location;
	uint32_t binding;
	uint32_t offset;      // Within binding's stride
	vk::Format format;

	[[nodiscard]] vk::VertexInputAttributeDescription to_attribute_description() const {
		return vk::VertexInputAttributeDescription()
			.setLocation(location)
			.setBinding(binding)
			.setFormat(format)
			.setOffset(offset);
	}
};

/**
 * @brief One vertex buffer binding, reflected from one struct parameter of the entry point
 */
struct VertexBinding {
	uint32_t binding;
	uint32_t stride;
	std::string name;  // Struct name (e.g. "CurrentPosition")

	[[nodiscard]] vk::VertexInputBindingDescription to_binding_description() const {
		return vk::VertexInputBindingDescription()
			.setBinding(binding)
			.setStride(stride)
			.setInputRate(vk::VertexInputRate::eVertex);
	}
};

struct VertexDetails {
	std::vector<VertexAttribute> inputs;
	std::vector<VertexBinding> bindings;
	std::vector<StageVariable> outputs;

	explicit VertexDetails(slang::EntryPointReflection* entry);
	[[nodiscard]] bool matches(const ShaderDetails& next) const;
};

struct FragmentDetails {
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs;  // Color attachments

	explicit FragmentDetails(slang::EntryPointReflection* entry);
	[[nodiscard]] bool matches(const ShaderDetails& next) const;  // Always false, end of chain
};

using ShaderDetailsBase = std::variant<VertexDetails, FragmentDetails>;

/**
 * @brief Stage specific interface of a compiled entry point
 */
struct ShaderDetails : ShaderDetailsBase
{
	using ShaderDetailsBase::ShaderDetailsBase;

	[[nodiscard]] bool matches(const ShaderDetails& next) const;
	[[nodiscard]] vk::ShaderStageFlagBits stage() const;
};

/**
 * @brief A Slang entry point compiled to SPIR-V, with its reflected interface
 *
 * Modules are looked up relative to SHADER_DIR. Only vertex and fragment entry points
 * are supported.
 */
class Shader
{
public:
	/**
	 * @brief Load, link and compile a Slang module's entry point
	 *
	 * @param device Device that will own the shader module
	 * @param name Module path relative to SHADER_DIR
	 * @param entry_point Entry point name
	 * @return Shader on success, ShaderCompileError with the Slang diagnostics otherwise
	 */
	static std::expected<Shader, ShaderCompileError> create_shader(
		vk::Device device,
		std::string_view name,
		std::string_view entry_point = "main");

	[[nodiscard]] const std::vector<DescriptorInfo>& get_descriptor_infos() const { return m_descriptor_infos; }
	[[nodiscard]] vk::ShaderModule get_shader_module() const { return m_shader_module; }
	[[nodiscard]] const ShaderDetails& get_details() const { return m_details; }
	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_details.stage(); }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo create_pipeline_shader_stage_create_info() const;

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;

	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule shader_module, ShaderDetails details,
		   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_shader_module;
	ShaderDetails m_details;
	std::vector<DescriptorInfo> m_descriptor_infos;
	std::string m_entry_point;
};

} // namespace morph

#endif // PARTICLEMORPH_SHADER_HPP
