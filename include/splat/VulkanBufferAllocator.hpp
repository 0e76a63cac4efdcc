#pragma once

#include "BufferPool.hpp"
#include "Common.hpp"
#include "VulkanContext.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace splat {

/**
 * @brief BufferAllocator backed by host visible, coherent Vulkan memory
 *
 * Every buffer gets its own allocation and stays mapped for its whole life.
 */
class VulkanBufferAllocator final : public BufferAllocator {
public:
    explicit VulkanBufferAllocator(const VulkanContext& context);
    ~VulkanBufferAllocator() override;

    VulkanBufferAllocator(const VulkanBufferAllocator&) = delete;
    VulkanBufferAllocator& operator=(const VulkanBufferAllocator&) = delete;

    std::optional<GpuBuffer> allocate(std::size_t size, BufferUsage usage) override;
    void release(const GpuBuffer& buffer) override;

    /// The Vulkan handle of a live buffer, null if unknown
    [[nodiscard]] vk::Buffer vk_buffer(const GpuBuffer& buffer) const;

    [[nodiscard]] std::size_t live_buffers() const;

    [[nodiscard]] static vk::BufferUsageFlags usage_flags(BufferUsage usage);

private:
    struct Allocation {
        vk::Buffer buffer;
        vk::DeviceMemory memory;
    };

    std::expected<Allocation, std::string> create(std::size_t size, BufferUsage usage, void** mapped) const;
    void destroy(const Allocation& allocation) const;

    const VulkanContext& m_context;
    vk::Device m_device;

    mutable std::mutex m_mutex;
    std::unordered_map<uint64_t, Allocation> m_allocations;
    std::atomic<uint64_t> m_next_id{1};
};

} // namespace splat
