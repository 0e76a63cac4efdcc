#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <vector>

namespace splat {

enum class BufferUsage {
    Vertex,
    Dots,
    Uniforms,
    Temporary,
};

enum class MemoryPressure {
    Normal,
    Warning,
    Critical,
};

[[nodiscard]] std::string_view to_string(BufferUsage usage);
[[nodiscard]] std::string_view to_string(MemoryPressure level);

/**
 * @brief Backend-neutral view of a host visible GPU buffer
 */
struct GpuBuffer {
    uint64_t id = 0;          ///< Allocator assigned, unique while the buffer lives
    std::size_t size = 0;     ///< Allocated bytes, already aligned
    BufferUsage usage = BufferUsage::Temporary;
    void* mapped = nullptr;   ///< Persistent host mapping
};

/**
 * @brief Creates and destroys the buffers the pool recycles
 *
 * release() may be called from the pool's worker thread, so implementations
 * must be thread safe.
 */
class BufferAllocator {
public:
    virtual ~BufferAllocator() = default;

    /// std::nullopt when the device cannot provide the buffer
    virtual std::optional<GpuBuffer> allocate(std::size_t size, BufferUsage usage) = 0;
    virtual void release(const GpuBuffer& buffer) = 0;
};

/// A size class of recyclable buffers
struct BucketSpec {
    std::size_t min_size;
    std::size_t max_size;
    BufferUsage usage;
    std::size_t capacity; ///< Idle buffers retained under normal pressure

    [[nodiscard]] bool accepts(std::size_t size, BufferUsage requested) const {
        return usage == requested && size >= min_size && size <= max_size;
    }
};

struct BucketMetrics {
    BucketSpec spec;
    std::size_t idle_count;
    std::size_t idle_bytes;
    std::size_t retain_limit;
};

struct PoolMetrics {
    uint64_t total_borrows = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t failed_allocations = 0;
    std::size_t outstanding = 0;       ///< Borrowed and not yet returned
    std::size_t pooled_buffers = 0;    ///< Idle across all buckets
    std::size_t memory_footprint = 0;  ///< Bytes held by idle buffers
    MemoryPressure pressure = MemoryPressure::Normal;
    std::vector<BucketMetrics> buckets;

    [[nodiscard]] double hit_rate() const {
        return total_borrows == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total_borrows);
    }
};

class BufferPool;

/**
 * @brief Exclusive, return-once lease on a pooled buffer
 *
 * Move-only. The buffer goes back to the pool on release() or destruction,
 * whichever comes first; afterwards get() is nullptr and further releases do
 * nothing.
 */
class PooledBuffer {
public:
    PooledBuffer() = default;
    ~PooledBuffer();

    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;
    PooledBuffer(PooledBuffer&& other) noexcept;
    PooledBuffer& operator=(PooledBuffer&& other) noexcept;

    [[nodiscard]] const GpuBuffer* get() const { return m_pool != nullptr ? &m_buffer : nullptr; }
    [[nodiscard]] const GpuBuffer* operator->() const { return get(); }
    explicit operator bool() const { return m_pool != nullptr; }

    void release();

private:
    friend class BufferPool;
    PooledBuffer(BufferPool* pool, GpuBuffer buffer) : m_pool(pool), m_buffer(buffer) {}

    BufferPool* m_pool = nullptr; ///< nullptr once returned
    GpuBuffer m_buffer{};
};

/**
 * @brief Size bucketed recycler for GPU buffers
 *
 * All bucket state sits behind one mutex held only for bookkeeping; device
 * allocation and destruction happen outside of it. Memory pressure requests
 * are queued to a worker thread so the caller never waits for the trim.
 *
 * The pool must outlive every PooledBuffer it hands out.
 */
class BufferPool {
public:
    static constexpr std::size_t ALIGNMENT = 256;
    static constexpr std::size_t WARNING_FOOTPRINT = 50ull * 1024 * 1024;
    static constexpr std::size_t CRITICAL_FOOTPRINT = 100ull * 1024 * 1024;

    static std::vector<BucketSpec> default_buckets();

    explicit BufferPool(BufferAllocator& allocator, std::vector<BucketSpec> buckets = default_buckets());
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Leases a buffer of at least size bytes
     * @return An empty handle if the allocator failed
     */
    [[nodiscard]] PooledBuffer borrow(std::size_t size, BufferUsage usage);

    /// Fills the uniform bucket so the first frames do not allocate
    void prewarm();

    /// Queues a pressure change; returns immediately
    void adapt_to_memory_pressure(MemoryPressure level);

    /// Blocks until every queued pressure change has been applied
    void wait_idle();

    [[nodiscard]] PoolMetrics metrics() const;

    [[nodiscard]] static std::size_t align(std::size_t size) { return (size + ALIGNMENT - 1) / ALIGNMENT * ALIGNMENT; }
    [[nodiscard]] static MemoryPressure classify_footprint(std::size_t bytes);

private:
    friend class PooledBuffer;

    struct Bucket {
        BucketSpec spec;
        std::vector<GpuBuffer> idle;
        std::size_t retain_limit;
    };

    void give_back(const GpuBuffer& buffer);
    [[nodiscard]] Bucket* find_bucket(std::size_t size, BufferUsage usage);
    void apply_pressure(MemoryPressure level);
    void worker_loop();

    BufferAllocator& m_allocator;

    mutable std::mutex m_mutex;
    std::vector<Bucket> m_buckets;
    std::unordered_set<uint64_t> m_outstanding;
    MemoryPressure m_pressure = MemoryPressure::Normal;
    uint64_t m_total_borrows = 0;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_failed = 0;

    std::mutex m_task_mutex;
    std::condition_variable m_task_condition;
    std::condition_variable m_idle_condition;
    std::queue<MemoryPressure> m_tasks;
    bool m_task_running = false;
    bool m_stopping = false;
    std::thread m_worker;
};

} // namespace splat
