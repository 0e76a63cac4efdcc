#pragma once

#include "FrameCoordinator.hpp"
#include "LayerStack.hpp"
#include "ParticleStore.hpp"
#include "RandomSource.hpp"
#include "Settings.hpp"
#include "SplatGenerator.hpp"
#include "UICallback.hpp"

#include <glm/glm.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace splat {

/**
 * @brief Host facing entry point of the splatter core
 *
 * Owns the layers, the particle store and the snapshot cache. All calls are
 * expected on the thread that dispatches input; snapshots may be read from
 * any thread.
 */
class SplatterEngine {
public:
    /// Fired whenever something visible changed and a redraw should be scheduled
    using RedrawRequest = std::function<void()>;

    static constexpr int MAX_DOT_COUNT = 300; ///< Upper end of the per-type count control

    explicit SplatterEngine(SplatterSettings settings = {}, LayerStack layers = LayerStack::with_defaults());

    SplatterEngine(const SplatterEngine&) = delete;
    SplatterEngine& operator=(const SplatterEngine&) = delete;

    /**
     * @brief Splats every enabled layer at a pixel position
     * @return Number of particles added across all layers
     */
    std::size_t add_impact(glm::vec2 position, float screen_width, float screen_height);

    void clear();

    [[nodiscard]] LayerStack& layers() { return m_layers; }
    [[nodiscard]] const LayerStack& layers() const { return m_layers; }

    [[nodiscard]] SplatterSettings& settings() { return m_settings; }
    [[nodiscard]] const SplatterSettings& settings() const { return m_settings; }

    [[nodiscard]] const ParticleStore& store() const { return m_store; }

    /// Editable parameters of a dot type; the central dot has no count
    [[nodiscard]] std::vector<UICallback> dot_type_callbacks(ParticleType type);

    /// Rebuilds snapshots if particles or visibility changed since the last call
    bool rebuild_snapshot();

    /// Latest published snapshot, does not trigger a rebuild
    [[nodiscard]] std::shared_ptr<const RenderSnapshot> render_snapshot(std::string_view layer) const;

    [[nodiscard]] bool snapshot_dirty() const { return m_coordinator.is_dirty(); }

    /// Marks snapshots stale, for hosts that edited layers in bulk
    void invalidate_snapshot() { m_coordinator.mark_dirty(); }

    [[nodiscard]] std::string export_settings() const;
    std::expected<void, std::string> import_settings(std::string_view document);

    /// Replaces the RNG factory, mostly for tests
    void set_random_source_factory(std::function<std::unique_ptr<RandomSource>()> factory);

    void set_redraw_request(RedrawRequest request) { m_redraw_request = std::move(request); }

private:
    [[nodiscard]] RandomSource& impact_random_source();
    void wire_layer_listener();
    void request_redraw() const;

    SplatterSettings m_settings;
    LayerStack m_layers;
    ParticleStore m_store;
    FrameCoordinator m_coordinator;
    SplatGenerator m_generator;

    std::unique_ptr<RandomSource> m_system_random;
    std::unique_ptr<RandomSource> m_impact_random;
    std::function<std::unique_ptr<RandomSource>()> m_random_factory;
    RedrawRequest m_redraw_request;
};

} // namespace splat
