#include <morph/Logger.hpp>
#include <morph/Shader.hpp>
#include <map>
#include <optional>
#include <slang-com-ptr.h>
#include <tuple>
#include <utility>

namespace morph {

// ============================================================================
// Slang Session Management
// ============================================================================
// One global session and one SPIR-V session for the lifetime of the process.
// Matrices are laid out column major so glm matrices upload unchanged and
// shaders multiply as mul(matrix, vector).
// ============================================================================

namespace
{

Slang::ComPtr<slang::IGlobalSession> create_global_session()
{
	Slang::ComPtr<slang::IGlobalSession> session;
	SlangGlobalSessionDesc				 desc = {};
	createGlobalSession(&desc, session.writeRef());
	Logger::instance().debug("Created Slang global session");
	return session;
}

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	slang::SessionDesc session_desc = {};

	slang::TargetDesc target_desc = {};
	target_desc.format			  = SLANG_SPIRV;
	target_desc.profile			  = global->findProfile("spirv_1_5");
	session_desc.targets		  = &target_desc;
	session_desc.targetCount	  = 1;
	session_desc.defaultMatrixLayoutMode = SLANG_MATRIX_LAYOUT_COLUMN_MAJOR;

	const char* search_paths[]	 = {SHADER_DIR};
	session_desc.searchPaths	 = search_paths;
	session_desc.searchPathCount = 1;

	Slang::ComPtr<slang::ISession> session;
	global->createSession(session_desc, session.writeRef());
	Logger::instance().debug("Created SPIR-V session with search path: {}", SHADER_DIR);
	return session;
}

slang::ISession* get_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global	= create_global_session();
	static Slang::ComPtr<slang::ISession>		session = global ? create_spirv_session(global) : nullptr;
	return session.get();
}

/// Slang reports warnings through the same blob, so only a missing result counts as failure
std::string diagnostics_text(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
		return {};
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

using CompileResult = std::expected<Slang::ComPtr<slang::IComponentType>, std::string>;

CompileResult load_shader_program(std::string_view name, std::string_view entry_point)
{
	Logger::instance().debug("Loading shader module '{}' with entry point '{}'", name, entry_point);

	auto* session = get_session();
	if (!session)
		return std::unexpected{std::string("Slang session could not be created")};

	std::string module_name(name);
	std::string entry_name(entry_point);
	Slang::ComPtr<slang::IBlob> diagnostics;

	Slang::ComPtr<slang::IModule> module(session->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
		return std::unexpected{std::format("Failed to load module: {}", diagnostics_text(diagnostics.get()))};
	if (auto warnings = diagnostics_text(diagnostics.get()); !warnings.empty())
		Logger::instance().warn("Module '{}': {}", name, warnings);

	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
	if (!entry)
		return std::unexpected{std::format("Entry point '{}' not found", entry_point)};

	slang::IComponentType*				 components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> program;
	session->createCompositeComponentType(components, 2, program.writeRef(), diagnostics.writeRef());
	if (!program)
		return std::unexpected{diagnostics_text(diagnostics.get())};

	return program;
}

CompileResult link_program(Slang::ComPtr<slang::IComponentType> program)
{
	Slang::ComPtr<slang::IComponentType> linked;
	Slang::ComPtr<slang::IBlob>			 diagnostics;

	program->link(linked.writeRef(), diagnostics.writeRef());
	if (!linked)
		return std::unexpected{std::format("Link failed: {}", diagnostics_text(diagnostics.get()))};

	Logger::instance().trace("Successfully linked shader program");
	return linked;
}

std::expected<Slang::ComPtr<slang::IBlob>, std::string> get_spirv_code(slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;

	linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef());
	if (!code)
		return std::unexpected{std::format("SPIR-V generation failed: {}", diagnostics_text(diagnostics.get()))};

	Logger::instance().trace("Generated SPIR-V code: {} bytes", code->getBufferSize());
	return code;
}

std::expected<vk::ShaderModule, std::string> create_shader_module(vk::Device device, slang::IBlob* spirv)
{
	auto create_info = vk::ShaderModuleCreateInfo()
						   .setCodeSize(spirv->getBufferSize())
						   .setPCode(static_cast<const uint32_t*>(spirv->getBufferPointer()));

	auto module_res = device.createShaderModule(create_info);
	CHECK_VK_RESULT(module_res, "Failed to create shader module: {}");
	Logger::instance().debug("Created shader module ({} bytes)", spirv->getBufferSize());
	return module_res.value;
}

} // anonymous namespace

// ============================================================================
// Reflection
// ============================================================================

namespace
{

/// float, int and uint in 1-4 component vectors
vk::Format to_vk_format(slang::TypeReflection* type)
{
	auto scalar = type->getScalarType();
	auto count	= type->getElementCount();
	if (count == 0)
		count = 1;

	using ST = slang::TypeReflection::ScalarType;

	if (count <= 4)
	{
		if (scalar == ST::Float32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat,
											  vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat};
			return formats[count - 1];
		}
		if (scalar == ST::Int32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sint, vk::Format::eR32G32Sint,
											  vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint};
			return formats[count - 1];
		}
		if (scalar == ST::UInt32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Uint, vk::Format::eR32G32Uint,
											  vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint};
			return formats[count - 1];
		}
	}

	Logger::instance().warn("Unknown vertex format, defaulting to R32G32B32A32Sfloat");
	return vk::Format::eR32G32B32A32Sfloat;
}

uint32_t format_size(vk::Format format)
{
	switch (format)
	{
		case vk::Format::eR32Sfloat:
		case vk::Format::eR32Sint:
		case vk::Format::eR32Uint: return 4;
		case vk::Format::eR32G32Sfloat:
		case vk::Format::eR32G32Sint:
		case vk::Format::eR32G32Uint: return 8;
		case vk::Format::eR32G32B32Sfloat:
		case vk::Format::eR32G32B32Sint:
		case vk::Format::eR32G32B32Uint: return 12;
		default: return 16;
	}
}

vk::DescriptorType to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;

	auto base_type =
		static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(BaseMask));
	bool is_mutable = (static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base_type)
	{
		case Sampler: return vk::DescriptorType::eSampler;
		case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		default:
			Logger::instance().warn("Unhandled binding type {}, treating as uniform buffer",
									static_cast<uint32_t>(base_type));
			return vk::DescriptorType::eUniformBuffer;
	}
}

/// Unwraps arrays and constant buffers down to the element that has a size
std::size_t extract_size(slang::TypeLayoutReflection* type_layout)
{
	if (auto size = type_layout->getSize(); size > 0)
		return size;

	auto* element_type = type_layout->getElementTypeLayout();
	if (element_type && element_type != type_layout)
		return extract_size(element_type);

	return 0;
}

std::vector<DescriptorInfo> extract_descriptors(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	slang::ProgramLayout*		layout = linked->getLayout();
	std::vector<DescriptorInfo> descriptors;

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto*		param		 = layout->getParameterByIndex(i);
		auto*		type_layout	 = param->getTypeLayout();
		const char* name		 = param->getName();
		uint32_t	base_binding = param->getBindingIndex();
		uint32_t	set			 = param->getBindingSpace();

		for (unsigned r = 0; r < type_layout->getBindingRangeCount(); r++)
		{
			auto binding_type = type_layout->getBindingRangeType(r);
			if (binding_type == slang::BindingType::VaryingInput || binding_type == slang::BindingType::VaryingOutput ||
				binding_type == slang::BindingType::PushConstant)
			{
				continue;
			}

			auto*		leaf_type = type_layout->getBindingRangeLeafTypeLayout(r);
			std::size_t size	  = leaf_type ? extract_size(leaf_type) : 0;
			auto		count	  = static_cast<std::size_t>(type_layout->getBindingRangeBindingCount(r));

			Logger::instance().trace("  Binding: set={} binding={} name='{}' count={} size={}", set,
									 base_binding + r, name, count, size);
			descriptors.push_back({name, size, base_binding + r, set, count, to_vk_descriptor_type(binding_type), stage});
		}
	}

	Logger::instance().debug("Extracted {} descriptor bindings", descriptors.size());
	return descriptors;
}

slang::TypeLayoutReflection* unwrap_to_struct(slang::TypeLayoutReflection* type)
{
	if (!type)
		return nullptr;
	if (type->getKind() == slang::TypeReflection::Kind::Struct)
		return type;
	if (auto* element = type->getElementTypeLayout(); element && element != type)
		return unwrap_to_struct(element);
	return nullptr;
}

bool is_system_value(slang::VariableLayoutReflection* field)
{
	auto* semantic = field->getSemanticName();
	return semantic && std::string_view(semantic).starts_with("SV_");
}

/// Non system value fields of a varying struct; location is the struct's base plus the field's index
std::vector<StageVariable> extract_variables(slang::TypeLayoutReflection* struct_type, uint32_t base_location)
{
	std::vector<StageVariable> vars;

	for (unsigned f = 0; f < struct_type->getFieldCount(); f++)
	{
		auto* field = struct_type->getFieldByIndex(f);
		if (is_system_value(field))
			continue;

		vars.push_back({.name	  = field->getName(),
						.location = base_location + field->getBindingIndex(),
						.format	  = to_vk_format(field->getTypeLayout()->getType())});
	}

	return vars;
}

std::vector<StageVariable> extract_inputs(slang::EntryPointReflection* entry)
{
	std::vector<StageVariable> inputs;

	for (unsigned p = 0; p < entry->getParameterCount(); p++)
	{
		auto* param = entry->getParameterByIndex(p);
		if (auto* struct_type = unwrap_to_struct(param->getTypeLayout()))
			inputs.append_range(extract_variables(struct_type, param->getBindingIndex()));
	}

	return inputs;
}

std::vector<StageVariable> extract_outputs(slang::EntryPointReflection* entry)
{
	if (auto* result = entry->getResultVarLayout())
	{
		if (auto* struct_type = unwrap_to_struct(result->getTypeLayout()))
			return extract_variables(struct_type, 0);
	}
	return {};
}

/// Every consumer input needs a producer output at the same location with the same format
bool interfaces_match(const std::vector<StageVariable>& producer, const std::vector<StageVariable>& consumer,
					  std::string_view producer_name, std::string_view consumer_name)
{
	bool valid = true;

	std::map<uint32_t, const StageVariable*> producer_map;
	for (const auto& var : producer)
		producer_map[var.location] = &var;

	for (const auto& input : consumer)
	{
		auto it = producer_map.find(input.location);
		if (it == producer_map.end())
		{
			Logger::instance().error("{} input '{}' at location {} has no matching {} output", consumer_name,
									 input.name, input.location, producer_name);
			valid = false;
			continue;
		}

		if (it->second->format != input.format)
		{
			Logger::instance().error("Location {}: {} outputs {} but {} expects {}", input.location, producer_name,
									 vk::to_string(it->second->format), consumer_name, vk::to_string(input.format));
			valid = false;
		}
	}

	return valid;
}

/// Each struct parameter of the entry point is its own tightly packed vertex buffer binding
std::pair<std::vector<VertexAttribute>, std::vector<VertexBinding>> extract_vertex_inputs(
	slang::EntryPointReflection* entry)
{
	std::vector<VertexAttribute> attributes;
	std::vector<VertexBinding>	 bindings;

	for (uint32_t param_idx = 0; param_idx < entry->getParameterCount(); ++param_idx)
	{
		auto* param		  = entry->getParameterByIndex(param_idx);
		auto* type_layout = param->getTypeLayout();

		// SV_VertexID and friends are scalars
		if (type_layout->getKind() != slang::TypeReflection::Kind::Struct)
			continue;

		const char* struct_name = type_layout->getType()->getName();
		auto		binding		= static_cast<uint32_t>(bindings.size());
		uint32_t	offset		= 0;

		for (uint32_t f = 0; f < type_layout->getFieldCount(); ++f)
		{
			auto* field = type_layout->getFieldByIndex(f);
			if (is_system_value(field))
				continue;

			auto format = to_vk_format(field->getTypeLayout()->getType());
			attributes.push_back({.name		= field->getName(),
								  .location = param->getBindingIndex() + field->getBindingIndex(),
								  .binding	= binding,
								  .offset	= offset,
								  .format	= format});
			offset += format_size(format);
		}

		bindings.push_back({.binding = binding, .stride = offset, .name = struct_name ? struct_name : ""});
	}

	return {attributes, bindings};
}

} // anonymous namespace

// ============================================================================
// Stage details
// ============================================================================

VertexDetails::VertexDetails(slang::EntryPointReflection* entry)
{
	std::tie(inputs, bindings) = extract_vertex_inputs(entry);
	outputs					   = extract_outputs(entry);

	Logger::instance().debug("VertexDetails: {} inputs across {} bindings, {} outputs", inputs.size(), bindings.size(),
							 outputs.size());
	for (const auto& b : bindings)
		Logger::instance().trace("  Binding {} ({}): stride={}", b.binding, b.name, b.stride);
}

bool VertexDetails::matches(const ShaderDetails& next) const
{
	return std::visit(overloaded{[this](const FragmentDetails& f)
								 { return interfaces_match(outputs, f.inputs, "vertex", "fragment"); },
								 [](const VertexDetails&)
								 {
									 Logger::instance().error("Invalid pipeline: vertex must connect to fragment");
									 return false;
								 }},
					  next);
}

FragmentDetails::FragmentDetails(slang::EntryPointReflection* entry)
{
	inputs	= extract_inputs(entry);
	outputs = extract_outputs(entry);

	Logger::instance().debug("FragmentDetails: {} inputs, {} outputs", inputs.size(), outputs.size());
}

bool FragmentDetails::matches(const ShaderDetails&) const
{
	Logger::instance().error("Invalid pipeline: fragment is the final stage");
	return false;
}

bool ShaderDetails::matches(const ShaderDetails& next) const
{
	return std::visit([&next](const auto& self) { return self.matches(next); }, *this);
}

vk::ShaderStageFlagBits ShaderDetails::stage() const
{
	return std::visit(overloaded{[](const VertexDetails&) { return vk::ShaderStageFlagBits::eVertex; },
								 [](const FragmentDetails&) { return vk::ShaderStageFlagBits::eFragment; }},
					  *this);
}

// ============================================================================
// Shader
// ============================================================================

std::expected<Shader, ShaderCompileError> Shader::create_shader(vk::Device device, std::string_view name,
																std::string_view entry_point)
{
	Logger::instance().info("Creating shader '{}':'{}'", name, entry_point);

	auto fail = [name](std::string diagnostics)
	{
		ShaderCompileError error{std::string(name), std::move(diagnostics)};
		Logger::instance().error("{}", error.describe());
		return std::unexpected{std::move(error)};
	};

	auto linked =
		load_shader_program(name, entry_point).and_then([](auto prog) { return link_program(std::move(prog)); });
	if (!linked)
		return fail(linked.error());

	auto* layout = (*linked)->getLayout();
	auto* entry	 = layout->getEntryPointCount() > 0 ? layout->getEntryPointByIndex(0) : nullptr;
	if (!entry)
		return fail("No entry point in linked program");

	std::optional<ShaderDetails> details;
	switch (entry->getStage())
	{
		case SLANG_STAGE_VERTEX: details.emplace(VertexDetails(entry)); break;
		case SLANG_STAGE_FRAGMENT: details.emplace(FragmentDetails(entry)); break;
		default: return fail(std::format("Unsupported shader stage {}", static_cast<int>(entry->getStage())));
	}

	auto spirv = get_spirv_code(linked->get());
	if (!spirv)
		return fail(spirv.error());

	auto module = create_shader_module(device, spirv->get());
	if (!module)
		return fail(module.error());

	auto descriptors = extract_descriptors(linked->get(), details->stage());

	Logger::instance().info("Shader '{}' created successfully ({} descriptors)", name, descriptors.size());
	return Shader{device, *module, std::move(*details), std::move(descriptors), std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::create_pipeline_shader_stage_create_info() const
{
	return vk::PipelineShaderStageCreateInfo{}
		.setStage(m_details.stage())
		.setModule(m_shader_module)
		.setPName(m_entry_point.c_str());
}

Shader::~Shader()
{
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
		Logger::instance().trace("Destroyed shader module");
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_shader_module(std::exchange(other.m_shader_module, nullptr))
	, m_details(std::move(other.m_details))
	, m_descriptor_infos(std::move(other.m_descriptor_infos))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_shader_module)
			m_device.destroyShaderModule(m_shader_module);

		m_device		   = other.m_device;
		m_shader_module	   = std::exchange(other.m_shader_module, nullptr);
		m_details		   = std::move(other.m_details);
		m_descriptor_infos = std::move(other.m_descriptor_infos);
		m_entry_point	   = std::move(other.m_entry_point);
	}
	return *this;
}

Shader::Shader(vk::Device device, vk::ShaderModule shader_module, ShaderDetails details,
			   std::vector<DescriptorInfo> descriptor_infos, std::string entry_point)
	: m_device(device)
	, m_shader_module(shader_module)
	, m_details(std::move(details))
	, m_descriptor_infos(std::move(descriptor_infos))
	, m_entry_point(std::move(entry_point))
{
}

} // namespace morph
