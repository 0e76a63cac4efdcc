#pragma once

#include "LayerStack.hpp"
#include "ParticleData.hpp"
#include "ParticleStore.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace splat {

/**
 * @brief GPU-ready particles of one layer
 *
 * particles is padded with zero-radius records up to a capacity class so
 * buffer sizes stay stable while a layer grows. Only the first count entries
 * are live.
 */
struct RenderSnapshot {
    std::vector<Particle> particles;
    uint32_t count = 0;
    uint32_t visibility_mask = 0;

    [[nodiscard]] std::size_t capacity() const { return particles.size(); }
    [[nodiscard]] std::size_t byte_size() const { return particles.size() * sizeof(Particle); }
};

/**
 * @brief Lazily rebuilt snapshot cache
 *
 * Any number of mark_dirty() calls between two frames costs a single rebuild.
 * A rebuild assembles a complete new set and publishes it with one pointer
 * swap, so readers always see either the old or the new set.
 */
class FrameCoordinator {
public:
    static constexpr std::size_t CAPACITY_GRANULARITY = 64;

    explicit FrameCoordinator(std::size_t max_capacity);

    void mark_dirty() { m_dirty.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_dirty() const { return m_dirty.load(std::memory_order_acquire); }

    /**
     * @brief Rebuilds every layer's snapshot if dirty
     * @return true when a new set was published
     */
    bool rebuild_snapshot(const ParticleStore& store, const LayerStack& layers);

    /// Latest published snapshot of a layer, an empty one for unknown layers
    [[nodiscard]] std::shared_ptr<const RenderSnapshot> snapshot(std::string_view layer) const;

    /// Number of rebuilds so far
    [[nodiscard]] uint64_t generation() const;

    [[nodiscard]] static std::size_t padded_capacity(std::size_t count, std::size_t max_capacity);

private:
    using SnapshotSet = std::map<std::string, std::shared_ptr<const RenderSnapshot>, std::less<>>;

    [[nodiscard]] std::shared_ptr<const RenderSnapshot> build(std::span<const Particle> particles,
                                                              uint32_t visibility_mask) const;

    std::size_t m_max_capacity;
    std::atomic<bool> m_dirty{true};

    mutable std::mutex m_publish_mutex;
    std::shared_ptr<const SnapshotSet> m_published;
    uint64_t m_generation = 0;
};

} // namespace splat
