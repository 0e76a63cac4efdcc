#include "splat/BufferPool.hpp"

#include "splat/Logger.hpp"

#include <algorithm>
#include <utility>

namespace splat {

std::string_view to_string(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Vertex: return "vertex";
        case BufferUsage::Dots: return "dots";
        case BufferUsage::Uniforms: return "uniforms";
        case BufferUsage::Temporary: return "temporary";
    }
    return "unknown";
}

std::string_view to_string(MemoryPressure level) {
    switch (level) {
        case MemoryPressure::Normal: return "normal";
        case MemoryPressure::Warning: return "warning";
        case MemoryPressure::Critical: return "critical";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PooledBuffer
// ---------------------------------------------------------------------------

PooledBuffer::~PooledBuffer() {
    release();
}

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : m_pool(std::exchange(other.m_pool, nullptr)), m_buffer(other.m_buffer) {}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = std::exchange(other.m_pool, nullptr);
        m_buffer = other.m_buffer;
    }
    return *this;
}

void PooledBuffer::release() {
    if (auto* pool = std::exchange(m_pool, nullptr)) {
        pool->give_back(m_buffer);
    }
}

// ---------------------------------------------------------------------------
// BufferPool
// ---------------------------------------------------------------------------

std::vector<BucketSpec> BufferPool::default_buckets() {
    return {
        {.min_size = 0, .max_size = 1024, .usage = BufferUsage::Vertex, .capacity = 5},
        {.min_size = 0, .max_size = 512, .usage = BufferUsage::Uniforms, .capacity = 15},
        {.min_size = 1025, .max_size = 4096, .usage = BufferUsage::Dots, .capacity = 10},
        {.min_size = 4097, .max_size = 16384, .usage = BufferUsage::Dots, .capacity = 10},
        {.min_size = 16385, .max_size = 65536, .usage = BufferUsage::Dots, .capacity = 6},
        {.min_size = 65537, .max_size = 327680, .usage = BufferUsage::Dots, .capacity = 3},
        {.min_size = 0, .max_size = 4096, .usage = BufferUsage::Temporary, .capacity = 3},
    };
}

BufferPool::BufferPool(BufferAllocator& allocator, std::vector<BucketSpec> buckets)
    : m_allocator(allocator) {
    m_buckets.reserve(buckets.size());
    for (const auto& spec : buckets) {
        m_buckets.push_back({.spec = spec, .idle = {}, .retain_limit = spec.capacity});
    }
    m_worker = std::thread(&BufferPool::worker_loop, this);
}

BufferPool::~BufferPool() {
    {
        std::lock_guard lock(m_task_mutex);
        m_stopping = true;
    }
    m_task_condition.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }

    std::lock_guard lock(m_mutex);
    if (!m_outstanding.empty()) {
        Logger::instance().warn("Buffer pool destroyed with {} buffers still borrowed", m_outstanding.size());
    }
    for (auto& bucket : m_buckets) {
        for (const auto& buffer : bucket.idle) {
            m_allocator.release(buffer);
        }
        bucket.idle.clear();
    }
}

BufferPool::Bucket* BufferPool::find_bucket(std::size_t size, BufferUsage usage) {
    auto it = std::ranges::find_if(m_buckets, [&](const Bucket& b) { return b.spec.accepts(size, usage); });
    return it == m_buckets.end() ? nullptr : &*it;
}

PooledBuffer BufferPool::borrow(std::size_t size, BufferUsage usage) {
    const std::size_t aligned = align(std::max<std::size_t>(size, 1));

    {
        std::lock_guard lock(m_mutex);
        ++m_total_borrows;
        if (auto* bucket = find_bucket(aligned, usage); bucket != nullptr && !bucket->idle.empty()) {
            // Buckets cover a size range, idle buffers may be smaller than this request
            auto it = std::ranges::find_if(bucket->idle, [&](const GpuBuffer& b) { return b.size >= aligned; });
            if (it != bucket->idle.end()) {
                GpuBuffer buffer = *it;
                bucket->idle.erase(it);
                ++m_hits;
                m_outstanding.insert(buffer.id);
                return PooledBuffer(this, buffer);
            }
        }
        ++m_misses;
    }

    auto buffer = m_allocator.allocate(aligned, usage);
    if (!buffer) {
        std::lock_guard lock(m_mutex);
        ++m_failed;
        Logger::instance().warn("Failed to allocate {} byte {} buffer", aligned, to_string(usage));
        return {};
    }

    Logger::instance().trace("Pool miss, allocated {} byte {} buffer #{}", aligned, to_string(usage), buffer->id);
    std::lock_guard lock(m_mutex);
    m_outstanding.insert(buffer->id);
    return PooledBuffer(this, *buffer);
}

void BufferPool::give_back(const GpuBuffer& buffer) {
    {
        std::lock_guard lock(m_mutex);
        if (m_outstanding.erase(buffer.id) == 0) {
            Logger::instance().warn("Ignoring return of buffer #{} which is not borrowed", buffer.id);
            return;
        }
        if (auto* bucket = find_bucket(buffer.size, buffer.usage);
            bucket != nullptr && bucket->idle.size() < bucket->retain_limit) {
            bucket->idle.push_back(buffer);
            return;
        }
    }
    m_allocator.release(buffer);
}

void BufferPool::prewarm() {
    std::vector<PooledBuffer> warm;
    for (int i = 0; i < 4; ++i) {
        warm.push_back(borrow(256, BufferUsage::Uniforms));
    }
    // Handles return themselves here, leaving the buffers idle in the bucket
}

void BufferPool::adapt_to_memory_pressure(MemoryPressure level) {
    {
        std::lock_guard lock(m_task_mutex);
        m_tasks.push(level);
    }
    m_task_condition.notify_one();
}

void BufferPool::wait_idle() {
    std::unique_lock lock(m_task_mutex);
    m_idle_condition.wait(lock, [this] { return m_tasks.empty() && !m_task_running; });
}

void BufferPool::worker_loop() {
    while (true) {
        MemoryPressure level;
        {
            std::unique_lock lock(m_task_mutex);
            m_task_condition.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                return;
            }
            level = m_tasks.front();
            m_tasks.pop();
            m_task_running = true;
        }

        apply_pressure(level);

        {
            std::lock_guard lock(m_task_mutex);
            m_task_running = false;
        }
        m_idle_condition.notify_all();
    }
}

void BufferPool::apply_pressure(MemoryPressure level) {
    std::vector<GpuBuffer> trimmed;
    {
        std::lock_guard lock(m_mutex);
        if (level != m_pressure) {
            Logger::instance().info("Buffer pool pressure {} -> {}", to_string(m_pressure), to_string(level));
        }
        m_pressure = level;

        for (auto& bucket : m_buckets) {
            switch (level) {
                case MemoryPressure::Normal: bucket.retain_limit = bucket.spec.capacity; break;
                case MemoryPressure::Warning: bucket.retain_limit = bucket.spec.capacity / 2; break;
                case MemoryPressure::Critical: bucket.retain_limit = 0; break;
            }
            while (bucket.idle.size() > bucket.retain_limit) {
                trimmed.push_back(bucket.idle.back());
                bucket.idle.pop_back();
            }
        }
    }

    for (const auto& buffer : trimmed) {
        m_allocator.release(buffer);
    }
    if (!trimmed.empty()) {
        Logger::instance().debug("Released {} idle buffers", trimmed.size());
    }
}

PoolMetrics BufferPool::metrics() const {
    std::lock_guard lock(m_mutex);
    PoolMetrics metrics{
        .total_borrows = m_total_borrows,
        .hits = m_hits,
        .misses = m_misses,
        .failed_allocations = m_failed,
        .outstanding = m_outstanding.size(),
        .pressure = m_pressure,
    };
    metrics.buckets.reserve(m_buckets.size());
    for (const auto& bucket : m_buckets) {
        std::size_t bytes = 0;
        for (const auto& buffer : bucket.idle) {
            bytes += buffer.size;
        }
        metrics.buckets.push_back({
            .spec = bucket.spec,
            .idle_count = bucket.idle.size(),
            .idle_bytes = bytes,
            .retain_limit = bucket.retain_limit,
        });
        metrics.pooled_buffers += bucket.idle.size();
        metrics.memory_footprint += bytes;
    }
    return metrics;
}

MemoryPressure BufferPool::classify_footprint(std::size_t bytes) {
    if (bytes > CRITICAL_FOOTPRINT) {
        return MemoryPressure::Critical;
    }
    if (bytes > WARNING_FOOTPRINT) {
        return MemoryPressure::Warning;
    }
    return MemoryPressure::Normal;
}

} // namespace splat
