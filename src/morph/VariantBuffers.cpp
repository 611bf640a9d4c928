#include <morph/VariantBuffers.hpp>
#include <morph/Logger.hpp>
#include <cstddef>
#include <cstring>
#include <format>

namespace morph {

VariantBuffers::VariantBuffers(const VulkanContext& context, uint32_t particle_count)
    : m_context(&context)
    , m_device(context.device())
    , m_particle_count(particle_count)
{}

std::expected<std::unique_ptr<VariantBuffers>, std::string> VariantBuffers::create(
    const VulkanContext& context,
    const ParticleSet& particles
) {
    std::unique_ptr<VariantBuffers> buffers(
        new VariantBuffers(context, static_cast<uint32_t>(particles.max_count()))
    );

    if (auto result = buffers->upload(particles); !result)
        return std::unexpected(result.error());

    Logger::instance().info("Uploaded {} variants of {} particles ({:.2f} MB)",
        particles.variant_count(),
        particles.max_count(),
        static_cast<double>(particles.max_count() * (particles.variant_count() * sizeof(glm::vec3) + sizeof(float))) / (1024.0 * 1024.0));
    return buffers;
}

VariantBuffers::~VariantBuffers() {
    for (auto& buffer : m_positions)
        release(buffer);
    release(m_sizes);
}

std::expected<VariantBuffers::DeviceBuffer, std::string> VariantBuffers::allocate(
    vk::DeviceSize size,
    vk::BufferUsageFlags usage,
    vk::MemoryPropertyFlags properties
) const {
    DeviceBuffer result;
    result.size = size;

    auto buffer_info = vk::BufferCreateInfo()
        .setSize(size)
        .setUsage(usage)
        .setSharingMode(vk::SharingMode::eExclusive);
    auto buffer_res = m_device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "Failed to create buffer: {}");
    result.buffer = buffer_res.value;

    auto mem_reqs = m_device.getBufferMemoryRequirements(result.buffer);
    auto memory_type = m_context->find_memory_type(mem_reqs.memoryTypeBits, properties);
    if (!memory_type) {
        m_device.destroyBuffer(result.buffer);
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = m_device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        m_device.destroyBuffer(result.buffer);
        return std::unexpected(std::format("Failed to allocate buffer memory: {}", vk::to_string(memory_res.result)));
    }
    result.memory = memory_res.value;

    if (auto bind_res = m_device.bindBufferMemory(result.buffer, result.memory, 0); bind_res != vk::Result::eSuccess) {
        release(result);
        return std::unexpected(std::format("Failed to bind buffer memory: {}", vk::to_string(bind_res)));
    }
    return result;
}

void VariantBuffers::release(DeviceBuffer& buffer) const {
    if (buffer.buffer)
        m_device.destroyBuffer(buffer.buffer);
    if (buffer.memory)
        m_device.freeMemory(buffer.memory);
    buffer = {};
}

std::expected<void, std::string> VariantBuffers::upload(const ParticleSet& particles) {
    const vk::DeviceSize position_bytes = particles.max_count() * sizeof(glm::vec3);
    const vk::DeviceSize size_bytes = particles.max_count() * sizeof(float);
    const vk::DeviceSize staging_bytes = position_bytes * particles.variant_count() + size_bytes;

    const auto vertex_usage = vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eTransferDst;
    for (std::size_t i = 0; i < particles.variant_count(); ++i) {
        auto buffer = allocate(position_bytes, vertex_usage, vk::MemoryPropertyFlagBits::eDeviceLocal);
        if (!buffer)
            return std::unexpected(std::format("Variant '{}': {}", particles.variant(i).name, buffer.error()));
        m_positions.push_back(*buffer);
    }

    auto sizes = allocate(size_bytes, vertex_usage, vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!sizes)
        return std::unexpected(std::format("Size buffer: {}", sizes.error()));
    m_sizes = *sizes;

    auto staging = allocate(
        staging_bytes,
        vk::BufferUsageFlagBits::eTransferSrc,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
    );
    if (!staging)
        return std::unexpected(std::format("Staging buffer: {}", staging.error()));

    // Everything below releases the staging buffer, whichever way it leaves
    struct StagingGuard {
        const VariantBuffers* owner;
        DeviceBuffer buffer;
        ~StagingGuard() { owner->release(buffer); }
    } guard{this, *staging};

    auto map_res = m_device.mapMemory(guard.buffer.memory, 0, staging_bytes);
    CHECK_VK_RESULT(map_res, "Failed to map staging memory: {}");
    auto* bytes = static_cast<std::byte*>(map_res.value);
    for (std::size_t i = 0; i < particles.variant_count(); ++i)
        std::memcpy(bytes + i * position_bytes, particles.variant(i).positions().data(), position_bytes);
    std::memcpy(bytes + particles.variant_count() * position_bytes, particles.sizes().data(), size_bytes);
    m_device.unmapMemory(guard.buffer.memory);

    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->graphics_family())
        .setFlags(vk::CommandPoolCreateFlagBits::eTransient);
    auto pool_res = m_device.createCommandPool(pool_info);
    CHECK_VK_RESULT(pool_res, "Failed to create transfer command pool: {}");
    vk::CommandPool pool = pool_res.value;

    auto submit_copies = [&]() -> std::expected<void, std::string> {
        auto cmd_alloc_info = vk::CommandBufferAllocateInfo()
            .setCommandPool(pool)
            .setLevel(vk::CommandBufferLevel::ePrimary)
            .setCommandBufferCount(1);
        auto cmd_res = m_device.allocateCommandBuffers(cmd_alloc_info);
        CHECK_VK_RESULT(cmd_res, "Failed to allocate transfer command buffer: {}");
        vk::CommandBuffer cmd = cmd_res.value.front();

        auto begin_res = cmd.begin(vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        CHECK_VK_RESULT_VOID(begin_res, "Failed to begin transfer command buffer: {}");
        for (std::size_t i = 0; i < m_positions.size(); ++i)
            cmd.copyBuffer(guard.buffer.buffer, m_positions[i].buffer, vk::BufferCopy(i * position_bytes, 0, position_bytes));
        cmd.copyBuffer(guard.buffer.buffer, m_sizes.buffer, vk::BufferCopy(m_positions.size() * position_bytes, 0, size_bytes));
        auto end_res = cmd.end();
        CHECK_VK_RESULT_VOID(end_res, "Failed to end transfer command buffer: {}");

        auto fence_res = m_device.createFence(vk::FenceCreateInfo());
        CHECK_VK_RESULT(fence_res, "Failed to create transfer fence: {}");
        vk::Fence fence = fence_res.value;

        auto submit_res = m_context->graphics_queue().submit(vk::SubmitInfo().setCommandBuffers(cmd), fence);
        vk::Result wait_res = submit_res == vk::Result::eSuccess
            ? m_device.waitForFences(fence, vk::True, UINT64_MAX)
            : submit_res;
        m_device.destroyFence(fence);
        CHECK_VK_RESULT_VOID(wait_res, "Particle upload failed: {}");
        return {};
    };

    auto result = submit_copies();
    m_device.destroyCommandPool(pool);
    return result;
}

} // namespace morph
