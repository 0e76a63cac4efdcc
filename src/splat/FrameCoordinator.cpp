#include "splat/FrameCoordinator.hpp"

#include "splat/Logger.hpp"

#include <algorithm>

namespace splat {

FrameCoordinator::FrameCoordinator(std::size_t max_capacity)
    : m_max_capacity(std::max(max_capacity, CAPACITY_GRANULARITY)),
      m_published(std::make_shared<SnapshotSet>()) {}

std::size_t FrameCoordinator::padded_capacity(std::size_t count, std::size_t max_capacity) {
    const std::size_t wanted = std::max<std::size_t>(count, 1);
    const std::size_t rounded = (wanted + CAPACITY_GRANULARITY - 1) / CAPACITY_GRANULARITY * CAPACITY_GRANULARITY;
    return std::min(rounded, max_capacity);
}

bool FrameCoordinator::rebuild_snapshot(const ParticleStore& store, const LayerStack& layers) {
    if (!m_dirty.exchange(false, std::memory_order_acq_rel)) {
        return false;
    }

    auto next = std::make_shared<SnapshotSet>();
    for (const auto& layer : layers.layers()) {
        next->emplace(layer.name, build(store.particles(layer.name), layer.rendering.visible_types));
    }

    std::lock_guard lock(m_publish_mutex);
    m_published = std::move(next);
    ++m_generation;
    Logger::instance().trace("Published snapshot generation {} ({} particles)", m_generation, store.total_count());
    return true;
}

std::shared_ptr<const RenderSnapshot> FrameCoordinator::build(std::span<const Particle> particles,
                                                              uint32_t visibility_mask) const {
    auto snapshot = std::make_shared<RenderSnapshot>();
    snapshot->visibility_mask = visibility_mask;

    std::size_t live = particles.size();
    if (live > m_max_capacity) {
        Logger::instance().warn("Truncating layer snapshot from {} to {} particles", live, m_max_capacity);
        live = m_max_capacity;
    }

    snapshot->particles.reserve(padded_capacity(live, m_max_capacity));
    snapshot->particles.assign(particles.begin(), particles.begin() + static_cast<std::ptrdiff_t>(live));
    snapshot->particles.resize(padded_capacity(live, m_max_capacity), Particle{
        .position = {0.0f, 0.0f},
        .radius = 0.0f,
        .type = ParticleType::Central,
        .velocity = {0.0f, 0.0f},
    });
    snapshot->count = static_cast<uint32_t>(live);
    return snapshot;
}

std::shared_ptr<const RenderSnapshot> FrameCoordinator::snapshot(std::string_view layer) const {
    static const std::shared_ptr<const RenderSnapshot> empty = std::make_shared<RenderSnapshot>();

    std::shared_ptr<const SnapshotSet> published;
    {
        std::lock_guard lock(m_publish_mutex);
        published = m_published;
    }
    auto it = published->find(layer);
    return it == published->end() ? empty : it->second;
}

uint64_t FrameCoordinator::generation() const {
    std::lock_guard lock(m_publish_mutex);
    return m_generation;
}

} // namespace splat
