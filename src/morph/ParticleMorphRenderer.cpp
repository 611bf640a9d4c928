#include <morph/ParticleMorphRenderer.hpp>
#include <morph/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <algorithm>
#include <cstring>
#include <format>

namespace morph {

// Uniform block matching MorphUniforms in shaders/morph/morph_common.slang
struct alignas(16) MorphUniforms {
    glm::mat4 view_projection;
    glm::mat4 model;
    glm::mat4 view;
    glm::vec3 color_a;
    float base_size;
    glm::vec3 color_b;
    float progress;
    glm::vec2 resolution;
    glm::vec2 padding;
};
static_assert(sizeof(MorphUniforms) == 240, "MorphUniforms must match the shader layout");

namespace {

constexpr uint32_t k_expected_bindings = 3;
constexpr std::array<uint32_t, k_expected_bindings> k_expected_strides = {
    sizeof(glm::vec3),  // current position
    sizeof(glm::vec3),  // target position
    sizeof(float)       // size
};

} // anonymous namespace

ParticleMorphRenderer::ParticleMorphRenderer(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    const VariantBuffers& buffers,
    const RenderConfig& config
)
    : m_context(&context)
    , m_device(context.device())
    , m_render_pass(render_pass)
    , m_buffers(&buffers)
    , m_config(config)
{}

std::expected<std::unique_ptr<ParticleMorphRenderer>, std::string> ParticleMorphRenderer::create(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    const VariantBuffers& buffers,
    const RenderConfig& config
) {
    auto renderer = std::unique_ptr<ParticleMorphRenderer>(
        new ParticleMorphRenderer(context, render_pass, buffers, config)
    );

    if (auto result = renderer->initialize(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created particle morph renderer ({} particles)", buffers.particle_count());
    return renderer;
}

ParticleMorphRenderer::~ParticleMorphRenderer() {
    cleanup();
}

std::expected<void, std::string> ParticleMorphRenderer::initialize() {
    if (auto result = load_shaders(); !result)
        return result;
    if (auto result = create_descriptor_layout(); !result)
        return result;
    if (auto result = create_pipeline(); !result)
        return result;
    if (auto result = create_uniform_buffers(); !result)
        return result;
    if (auto result = create_descriptor_sets(); !result)
        return result;
    // Command buffers and semaphores wait for handle_swapchain_recreation(), they need the image count
    return create_sync_objects();
}

std::expected<void, std::string> ParticleMorphRenderer::load_shaders() {
    auto vert_result = Shader::create_shader(m_device, "morph/particle_morph.vert.slang");
    if (!vert_result) {
        return std::unexpected(vert_result.error().describe());
    }
    m_vertex_shader.emplace(std::move(*vert_result));

    auto frag_result = Shader::create_shader(m_device, "morph/particle_morph.frag.slang");
    if (!frag_result) {
        return std::unexpected(frag_result.error().describe());
    }
    m_fragment_shader.emplace(std::move(*frag_result));

    const auto& vertex = std::get<VertexDetails>(m_vertex_shader->get_details());
    if (vertex.bindings.size() != k_expected_bindings) {
        return std::unexpected(std::format(
            "Vertex shader declares {} vertex buffer bindings, expected {}",
            vertex.bindings.size(), k_expected_bindings));
    }
    for (const auto& binding : vertex.bindings) {
        if (binding.stride != k_expected_strides[binding.binding]) {
            return std::unexpected(std::format(
                "Vertex binding {} ({}) has stride {}, expected {}",
                binding.binding, binding.name, binding.stride, k_expected_strides[binding.binding]));
        }
    }

    if (!m_vertex_shader->get_details().matches(m_fragment_shader->get_details())) {
        return std::unexpected("Vertex outputs do not match fragment inputs");
    }
    return {};
}

std::expected<void, std::string> ParticleMorphRenderer::create_descriptor_layout() {
    // Merge both stages' reflected descriptors, a binding used by both gets both stage flags
    std::vector<vk::DescriptorSetLayoutBinding> bindings;
    for (const Shader* shader : {&*m_vertex_shader, &*m_fragment_shader}) {
        for (const auto& desc : shader->get_descriptor_infos()) {
            auto existing = std::ranges::find_if(bindings, [&](const auto& b) {
                return b.binding == desc.binding;
            });
            if (existing != bindings.end()) {
                existing->stageFlags |= desc.stage;
                continue;
            }
            bindings.push_back(vk::DescriptorSetLayoutBinding()
                .setBinding(static_cast<uint32_t>(desc.binding))
                .setDescriptorType(desc.type)
                .setDescriptorCount(static_cast<uint32_t>(desc.descriptor_count))
                .setStageFlags(desc.stage)
            );
        }
    }

    auto uniform = std::ranges::find(bindings, vk::DescriptorType::eUniformBuffer,
        &vk::DescriptorSetLayoutBinding::descriptorType);
    if (bindings.size() != 1 || uniform == bindings.end()) {
        return std::unexpected(std::format(
            "Particle morph shaders must use exactly one uniform buffer, found {} descriptors", bindings.size()));
    }

    m_uniform_binding = uniform->binding;

    auto layout_res = m_device.createDescriptorSetLayout(vk::DescriptorSetLayoutCreateInfo().setBindings(bindings));
    CHECK_VK_RESULT(layout_res, "Failed to create descriptor layout: {}");
    m_descriptor_layout = layout_res.value;
    return {};
}

std::expected<void, std::string> ParticleMorphRenderer::create_pipeline() {
    auto pipeline_layout_res = m_device.createPipelineLayout(
        vk::PipelineLayoutCreateInfo().setSetLayouts(m_descriptor_layout));
    CHECK_VK_RESULT(pipeline_layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = pipeline_layout_res.value;

    std::array shader_stages = {
        m_vertex_shader->create_pipeline_shader_stage_create_info(),
        m_fragment_shader->create_pipeline_shader_stage_create_info()
    };

    // Vertex input straight from reflection: one binding per struct parameter
    const auto& vertex = std::get<VertexDetails>(m_vertex_shader->get_details());
    std::vector<vk::VertexInputBindingDescription> binding_descriptions;
    for (const auto& binding : vertex.bindings)
        binding_descriptions.push_back(binding.to_binding_description());
    std::vector<vk::VertexInputAttributeDescription> attribute_descriptions;
    for (const auto& attribute : vertex.inputs)
        attribute_descriptions.push_back(attribute.to_attribute_description());

    auto vertex_input_info = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(binding_descriptions)
        .setVertexAttributeDescriptions(attribute_descriptions);

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::ePointList)
        .setPrimitiveRestartEnable(false);

    // Viewport and scissor (dynamic)
    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(false)
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    // Additive glow
    auto color_blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(vk::ColorComponentFlagBits::eR |
                          vk::ColorComponentFlagBits::eG |
                          vk::ColorComponentFlagBits::eB |
                          vk::ColorComponentFlagBits::eA)
        .setBlendEnable(true)
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(vk::BlendFactor::eOne)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(vk::BlendFactor::eOne)
        .setAlphaBlendOp(vk::BlendOp::eAdd);

    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(color_blend_attachment);

    // Sprites overlap freely, so depth is tested but never written
    auto depth_stencil = vk::PipelineDepthStencilStateCreateInfo()
        .setDepthTestEnable(true)
        .setDepthWriteEnable(false)
        .setDepthCompareOp(vk::CompareOp::eLess)
        .setDepthBoundsTestEnable(false)
        .setStencilTestEnable(false);

    std::array dynamic_states = {
        vk::DynamicState::eViewport,
        vk::DynamicState::eScissor
    };

    auto dynamic_state = vk::PipelineDynamicStateCreateInfo()
        .setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input_info)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(&depth_stencil)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_render_pass)
        .setSubpass(0);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    CHECK_VK_RESULT(pipeline_res, "Failed to create graphics pipeline: {}");
    m_graphics_pipeline = pipeline_res.value;
    return {};
}

std::expected<void, std::string> ParticleMorphRenderer::create_uniform_buffers() {
    auto buffer_info = vk::BufferCreateInfo()
        .setSize(sizeof(MorphUniforms))
        .setUsage(vk::BufferUsageFlagBits::eUniformBuffer)
        .setSharingMode(vk::SharingMode::eExclusive);

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        auto buffer_res = m_device.createBuffer(buffer_info);
        CHECK_VK_RESULT(buffer_res, "Failed to create uniform buffer: {}");
        m_uniform_buffers[i] = buffer_res.value;

        auto mem_reqs = m_device.getBufferMemoryRequirements(m_uniform_buffers[i]);
        auto memory_type = m_context->find_memory_type(
            mem_reqs.memoryTypeBits,
            vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
        if (!memory_type)
            return std::unexpected(std::format("Uniform buffer: {}", memory_type.error()));

        auto memory_res = m_device.allocateMemory(vk::MemoryAllocateInfo()
            .setAllocationSize(mem_reqs.size)
            .setMemoryTypeIndex(*memory_type));
        CHECK_VK_RESULT(memory_res, "Failed to allocate uniform memory: {}");
        m_uniform_memory[i] = memory_res.value;

        auto bind_res = m_device.bindBufferMemory(m_uniform_buffers[i], m_uniform_memory[i], 0);
        CHECK_VK_RESULT_VOID(bind_res, "Failed to bind uniform memory: {}");

        auto map_res = m_device.mapMemory(m_uniform_memory[i], 0, sizeof(MorphUniforms));
        CHECK_VK_RESULT(map_res, "Failed to map uniform memory: {}");
        m_uniform_mapped[i] = map_res.value;
    }
    return {};
}

std::expected<void, std::string> ParticleMorphRenderer::create_descriptor_sets() {
    auto pool_size = vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, MAX_FRAMES_IN_FLIGHT);
    auto pool_res = m_device.createDescriptorPool(vk::DescriptorPoolCreateInfo()
        .setMaxSets(MAX_FRAMES_IN_FLIGHT)
        .setPoolSizes(pool_size));
    CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    std::array<vk::DescriptorSetLayout, MAX_FRAMES_IN_FLIGHT> layouts;
    layouts.fill(m_descriptor_layout);
    auto sets_res = m_device.allocateDescriptorSets(vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(layouts));
    CHECK_VK_RESULT(sets_res, "Failed to allocate descriptor sets: {}");

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        m_descriptor_sets[i] = sets_res.value[i];

        auto buffer_info = vk::DescriptorBufferInfo()
            .setBuffer(m_uniform_buffers[i])
            .setOffset(0)
            .setRange(sizeof(MorphUniforms));

        auto write = vk::WriteDescriptorSet()
            .setDstSet(m_descriptor_sets[i])
            .setDstBinding(m_uniform_binding)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(1)
            .setBufferInfo(buffer_info);

        m_device.updateDescriptorSets(write, {});
    }
    return {};
}

std::expected<void, std::string> ParticleMorphRenderer::create_sync_objects() {
    auto cmd_pool_res = m_device.createCommandPool(vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->graphics_family())
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer));
    CHECK_VK_RESULT(cmd_pool_res, "Failed to create graphics command pool: {}");
    m_graphics_command_pool = cmd_pool_res.value;

    m_in_flight_fences.reserve(MAX_FRAMES_IN_FLIGHT);
    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        // Start signaled so the first wait returns immediately
        auto fence_res = m_device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
        CHECK_VK_RESULT(fence_res, "Failed to create in-flight fence: {}");
        m_in_flight_fences.push_back(fence_res.value);
    }
    return {};
}

std::array<vk::ClearValue, 2> ParticleMorphRenderer::clear_values() const {
    auto clear = srgb_to_linear(m_config.clear_color);
    return {
        vk::ClearColorValue(std::array<float, 4>{clear.r, clear.g, clear.b, 1.0f}),
        vk::ClearDepthStencilValue(1.0f, 0)
    };
}

std::vector<UICallback> ParticleMorphRenderer::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Base size", ContinuousCallback{
        .setter = [this](float v) { set_base_size(v); },
        .getter = [this]() { return base_size(); },
        .min = 0.05f,
        .max = 2.0f,
        .logarithmic = true
    });
    callbacks.emplace_back("Colour A", ColorCallback{
        .setter = [this](glm::vec3 c) { set_color_a(c); },
        .getter = [this]() { return m_config.color_a; }
    });
    callbacks.emplace_back("Colour B", ColorCallback{
        .setter = [this](glm::vec3 c) { set_color_b(c); },
        .getter = [this]() { return m_config.color_b; }
    });
    return callbacks;
}

void ParticleMorphRenderer::write_uniforms(const FrameRenderInfo& info) {
    MorphUniforms uniforms{
        .view_projection = info.camera.view_projection_matrix(),
        .model = info.model,
        .view = info.camera.view_matrix(),
        .color_a = srgb_to_linear(m_config.color_a),
        .base_size = m_config.base_size,
        .color_b = srgb_to_linear(m_config.color_b),
        .progress = info.morph.progress,
        .resolution = glm::vec2(info.extent.width, info.extent.height),
        .padding = glm::vec2(0.0f)
    };
    std::memcpy(m_uniform_mapped[info.current_frame], &uniforms, sizeof(MorphUniforms));
}

void ParticleMorphRenderer::record(vk::CommandBuffer cmd, const FrameRenderInfo& info) const {
    // Negative height flips Y so glm's GL style projection comes out upright
    auto viewport = vk::Viewport()
        .setX(0.0f)
        .setY(static_cast<float>(info.extent.height))
        .setWidth(static_cast<float>(info.extent.width))
        .setHeight(-static_cast<float>(info.extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);

    auto scissor = vk::Rect2D()
        .setOffset({0, 0})
        .setExtent(info.extent);

    cmd.setViewport(0, viewport);
    cmd.setScissor(0, scissor);

    cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, m_graphics_pipeline);
    cmd.bindDescriptorSets(
        vk::PipelineBindPoint::eGraphics,
        m_pipeline_layout,
        0,
        m_descriptor_sets[info.current_frame],
        {}
    );

    std::array vertex_buffers = {
        m_buffers->position_buffer(info.morph.current_index),
        m_buffers->position_buffer(info.morph.target_index),
        m_buffers->size_buffer()
    };
    std::array<vk::DeviceSize, 3> offsets{};
    cmd.bindVertexBuffers(0, vertex_buffers, offsets);

    cmd.draw(m_buffers->particle_count(), 1, 0, 0);
}

std::expected<void, std::string> ParticleMorphRenderer::handle_swapchain_recreation(uint32_t new_image_count) {
    auto idle_res = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(idle_res, "Failed to wait for device idle: {}");

    destroy_per_image_resources();

    m_render_finished_semaphores.reserve(new_image_count);
    for (uint32_t i = 0; i < new_image_count; i++) {
        auto sem_res = m_device.createSemaphore({});
        CHECK_VK_RESULT(sem_res, "Failed to create render finished semaphore: {}");
        m_render_finished_semaphores.push_back(sem_res.value);
    }

    auto cmd_res = m_device.allocateCommandBuffers(vk::CommandBufferAllocateInfo()
        .setCommandPool(m_graphics_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(new_image_count));
    CHECK_VK_RESULT(cmd_res, "Failed to allocate command buffers: {}");
    m_command_buffers = std::move(cmd_res.value);

    m_images_in_flight.assign(new_image_count, nullptr);

    Logger::instance().info("Renderer swapchain resources recreated for {} images", new_image_count);
    return {};
}

std::expected<vk::Semaphore, std::string> ParticleMorphRenderer::render_frame(
    const FrameRenderInfo& info,
    vk::Queue graphics_queue
) {
    if (info.image_index >= m_command_buffers.size()) {
        return std::unexpected(std::format(
            "Image {} has no command buffer, handle_swapchain_recreation() was not called for {} images",
            info.image_index, info.image_index + 1));
    }

    auto& frame_fence = m_in_flight_fences[info.current_frame];
    auto wait_res = m_device.waitForFences(frame_fence, vk::True, UINT64_MAX);
    CHECK_VK_RESULT_VOID(wait_res, "Failed to wait for frame fence: {}");

    // If this image is still being used by a previous frame, wait for it
    if (auto image_fence = m_images_in_flight[info.image_index]; image_fence && image_fence != frame_fence) {
        auto image_wait_res = m_device.waitForFences(image_fence, vk::True, UINT64_MAX);
        CHECK_VK_RESULT_VOID(image_wait_res, "Failed to wait for image fence: {}");
    }
    m_images_in_flight[info.image_index] = frame_fence;

    auto reset_res = m_device.resetFences(frame_fence);
    CHECK_VK_RESULT_VOID(reset_res, "Failed to reset frame fence: {}");

    write_uniforms(info);

    auto& cmd = m_command_buffers[info.image_index];
    auto cmd_reset_res = cmd.reset();
    CHECK_VK_RESULT_VOID(cmd_reset_res, "Failed to reset command buffer: {}");
    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo());
    CHECK_VK_RESULT_VOID(begin_res, "Failed to begin command buffer: {}");

    auto clear = clear_values();
    auto render_pass_begin = vk::RenderPassBeginInfo()
        .setRenderPass(m_render_pass)
        .setFramebuffer(info.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, info.extent))
        .setClearValues(clear);

    cmd.beginRenderPass(render_pass_begin, vk::SubpassContents::eInline);

    record(cmd, info);

    if (info.imgui_draw_data) {
        ImGui_ImplVulkan_RenderDrawData(
            static_cast<ImDrawData*>(info.imgui_draw_data),
            static_cast<VkCommandBuffer>(cmd)
        );
    }

    cmd.endRenderPass();
    auto end_res = cmd.end();
    CHECK_VK_RESULT_VOID(end_res, "Failed to end command buffer: {}");

    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(info.image_available_semaphore)
        .setWaitDstStageMask(wait_stage)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(m_render_finished_semaphores[info.image_index]);

    auto submit_res = graphics_queue.submit(submit_info, frame_fence);
    CHECK_VK_RESULT_VOID(submit_res, "Failed to submit frame: {}");

    return m_render_finished_semaphores[info.image_index];
}

void ParticleMorphRenderer::destroy_per_image_resources() {
    for (auto& sem : m_render_finished_semaphores) {
        m_device.destroySemaphore(sem);
    }
    m_render_finished_semaphores.clear();

    if (!m_command_buffers.empty() && m_graphics_command_pool) {
        m_device.freeCommandBuffers(m_graphics_command_pool, m_command_buffers);
        m_command_buffers.clear();
    }
    m_images_in_flight.clear();
}

void ParticleMorphRenderer::cleanup() {
    if (!m_in_flight_fences.empty()) {
        if (auto result = m_device.waitForFences(m_in_flight_fences, vk::True, UINT64_MAX); result != vk::Result::eSuccess)
            Logger::instance().error("Waiting for in-flight frames failed during cleanup: {}", vk::to_string(result));
    }

    destroy_per_image_resources();

    for (auto& fence : m_in_flight_fences) {
        m_device.destroyFence(fence);
    }
    m_in_flight_fences.clear();

    if (m_graphics_command_pool) {
        m_device.destroyCommandPool(m_graphics_command_pool);
        m_graphics_command_pool = nullptr;
    }
    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
        m_descriptor_pool = nullptr;
    }
    if (m_graphics_pipeline) {
        m_device.destroyPipeline(m_graphics_pipeline);
        m_graphics_pipeline = nullptr;
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
        m_pipeline_layout = nullptr;
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
        m_descriptor_layout = nullptr;
    }
    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        if (m_uniform_buffers[i]) {
            m_device.destroyBuffer(m_uniform_buffers[i]);
            m_uniform_buffers[i] = nullptr;
        }
        if (m_uniform_memory[i]) {
            // Freeing implicitly unmaps
            m_device.freeMemory(m_uniform_memory[i]);
            m_uniform_memory[i] = nullptr;
            m_uniform_mapped[i] = nullptr;
        }
    }
}

} // namespace morph
