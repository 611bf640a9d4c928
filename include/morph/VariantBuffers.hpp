#pragma once

#include "ParticleSet.hpp"
#include "VulkanContext.hpp"
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace morph {

/**
 * @brief Device-local vertex buffers holding a ParticleSet on the GPU
 *
 * One position buffer per variant (max_count tightly packed float3) and one size buffer
 * (max_count floats). Everything is uploaded once, through a single staging buffer, when
 * the object is created; the buffers are immutable afterwards.
 */
class VariantBuffers {
public:
    /**
     * @brief Allocate the buffers and upload the particle set
     *
     * Blocks until the transfer has finished.
     *
     * @param context Vulkan context; must outlive the buffers
     * @param particles Normalized variants and sizes to upload
     * @return VariantBuffers on success, error message on failure
     */
    static std::expected<std::unique_ptr<VariantBuffers>, std::string> create(
        const VulkanContext& context,
        const ParticleSet& particles
    );

    ~VariantBuffers();

    VariantBuffers(const VariantBuffers&) = delete;
    VariantBuffers& operator=(const VariantBuffers&) = delete;
    VariantBuffers(VariantBuffers&&) = delete;
    VariantBuffers& operator=(VariantBuffers&&) = delete;

    [[nodiscard]] vk::Buffer position_buffer(std::size_t variant) const { return m_positions.at(variant).buffer; }
    [[nodiscard]] vk::Buffer size_buffer() const { return m_sizes.buffer; }
    [[nodiscard]] std::size_t variant_count() const { return m_positions.size(); }
    [[nodiscard]] uint32_t particle_count() const { return m_particle_count; }

private:
    struct DeviceBuffer {
        vk::Buffer buffer;
        vk::DeviceMemory memory;
        vk::DeviceSize size = 0;
    };

    VariantBuffers(const VulkanContext& context, uint32_t particle_count);

    std::expected<DeviceBuffer, std::string> allocate(
        vk::DeviceSize size,
        vk::BufferUsageFlags usage,
        vk::MemoryPropertyFlags properties
    ) const;

    void release(DeviceBuffer& buffer) const;

    std::expected<void, std::string> upload(const ParticleSet& particles);

    const VulkanContext* m_context;
    vk::Device m_device;
    uint32_t m_particle_count;

    std::vector<DeviceBuffer> m_positions;
    DeviceBuffer m_sizes;
};

} // namespace morph
