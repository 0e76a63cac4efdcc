#include "splat/VulkanBufferAllocator.hpp"

#include "splat/Logger.hpp"

namespace splat {

VulkanBufferAllocator::VulkanBufferAllocator(const VulkanContext& context)
    : m_context(context), m_device(context.device()) {}

VulkanBufferAllocator::~VulkanBufferAllocator() {
    std::lock_guard lock(m_mutex);
    if (!m_allocations.empty()) {
        Logger::instance().warn("Destroying {} buffers that were never released", m_allocations.size());
    }
    for (const auto& [id, allocation] : m_allocations) {
        destroy(allocation);
    }
}

vk::BufferUsageFlags VulkanBufferAllocator::usage_flags(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Vertex: return vk::BufferUsageFlagBits::eVertexBuffer;
        case BufferUsage::Dots: return vk::BufferUsageFlagBits::eStorageBuffer;
        case BufferUsage::Uniforms: return vk::BufferUsageFlagBits::eUniformBuffer;
        case BufferUsage::Temporary: return vk::BufferUsageFlagBits::eTransferSrc;
    }
    return vk::BufferUsageFlagBits::eTransferSrc;
}

std::optional<GpuBuffer> VulkanBufferAllocator::allocate(std::size_t size, BufferUsage usage) {
    void* mapped = nullptr;
    auto allocation = create(size, usage, &mapped);
    if (!allocation) {
        Logger::instance().warn("Vulkan buffer allocation failed: {}", allocation.error());
        return std::nullopt;
    }

    const uint64_t id = m_next_id.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(m_mutex);
        m_allocations.emplace(id, *allocation);
    }
    return GpuBuffer{.id = id, .size = size, .usage = usage, .mapped = mapped};
}

void VulkanBufferAllocator::release(const GpuBuffer& buffer) {
    Allocation allocation;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_allocations.find(buffer.id);
        if (it == m_allocations.end()) {
            Logger::instance().warn("Release of unknown buffer #{}", buffer.id);
            return;
        }
        allocation = it->second;
        m_allocations.erase(it);
    }
    destroy(allocation);
}

vk::Buffer VulkanBufferAllocator::vk_buffer(const GpuBuffer& buffer) const {
    std::lock_guard lock(m_mutex);
    auto it = m_allocations.find(buffer.id);
    return it == m_allocations.end() ? vk::Buffer{} : it->second.buffer;
}

std::size_t VulkanBufferAllocator::live_buffers() const {
    std::lock_guard lock(m_mutex);
    return m_allocations.size();
}

std::expected<VulkanBufferAllocator::Allocation, std::string> VulkanBufferAllocator::create(
    std::size_t size, BufferUsage usage, void** mapped) const {
    auto buffer_info = vk::BufferCreateInfo()
        .setSize(size)
        .setUsage(usage_flags(usage))
        .setSharingMode(vk::SharingMode::eExclusive);

    auto buffer_res = m_device.createBuffer(buffer_info);
    CHECK_VK_RESULT(buffer_res, "createBuffer failed: {}");
    Allocation allocation{.buffer = buffer_res.value, .memory = {}};

    auto requirements = m_device.getBufferMemoryRequirements(allocation.buffer);
    auto memory_type = m_context.find_memory_type(
        requirements.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
    if (!memory_type) {
        destroy(allocation);
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type);
    auto memory_res = m_device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        destroy(allocation);
        return std::unexpected(fmt::format("allocateMemory failed: {}", vk::to_string(memory_res.result)));
    }
    allocation.memory = memory_res.value;

    if (auto res = m_device.bindBufferMemory(allocation.buffer, allocation.memory, 0); res != vk::Result::eSuccess) {
        destroy(allocation);
        return std::unexpected(fmt::format("bindBufferMemory failed: {}", vk::to_string(res)));
    }

    auto map_res = m_device.mapMemory(allocation.memory, 0, size);
    if (map_res.result != vk::Result::eSuccess) {
        destroy(allocation);
        return std::unexpected(fmt::format("mapMemory failed: {}", vk::to_string(map_res.result)));
    }
    *mapped = map_res.value;
    return allocation;
}

void VulkanBufferAllocator::destroy(const Allocation& allocation) const {
    if (allocation.buffer) {
        m_device.destroyBuffer(allocation.buffer);
    }
    if (allocation.memory) {
        // Freeing the memory implicitly unmaps it
        m_device.freeMemory(allocation.memory);
    }
}

} // namespace splat
