#include "splat/SplatterEngine.hpp"

#include "splat/Logger.hpp"
#include "splat/SettingsDocument.hpp"

#include <algorithm>

namespace splat {

SplatterEngine::SplatterEngine(SplatterSettings settings, LayerStack layers)
    : m_settings(std::move(settings)),
      m_layers(std::move(layers)),
      m_coordinator(m_settings.limits.max_total_particles),
      m_generator(m_settings.dots, m_settings.limits) {
    m_store.set_mutation_listener([this] {
        m_coordinator.mark_dirty();
        request_redraw();
    });
    wire_layer_listener();
}

void SplatterEngine::wire_layer_listener() {
    m_layers.set_change_listener([this](const LayerTemplate&, bool needs_rebuild) {
        if (needs_rebuild) {
            m_coordinator.mark_dirty();
        }
        request_redraw();
    });
}

RandomSource& SplatterEngine::impact_random_source() {
    if (m_random_factory) {
        m_impact_random = m_random_factory();
        return *m_impact_random;
    }
    if (m_settings.use_seeded_rng) {
        // Fresh every impact: the same seed always reproduces the same splat
        m_impact_random = std::make_unique<SeededRandomSource>(m_settings.rng_seed);
        return *m_impact_random;
    }
    if (!m_system_random) {
        m_system_random = std::make_unique<SystemRandomSource>();
    }
    return *m_system_random;
}

std::size_t SplatterEngine::add_impact(glm::vec2 position, float screen_width, float screen_height) {
    const glm::vec2 screen_size{screen_width, screen_height};
    auto& rng = impact_random_source();

    std::size_t added = 0;
    for (const auto* layer : m_layers.by_z_order()) {
        if (!layer->rendering.enabled) {
            continue;
        }
        const auto impact = SplatGenerator::make_impact(position, screen_size, layer->physics);
        auto particles = m_generator.generate(impact, *layer, rng, m_store.total_count());
        added += particles.size();
        m_store.append(layer->name, particles);
    }

    Logger::instance().debug("Impact at ({}, {}) added {} particles, {} total", position.x, position.y, added,
                             m_store.total_count());
    return added;
}

void SplatterEngine::clear() {
    m_store.clear();
    Logger::instance().debug("Cleared all layers");
}

bool SplatterEngine::rebuild_snapshot() {
    return m_coordinator.rebuild_snapshot(m_store, m_layers);
}

std::shared_ptr<const RenderSnapshot> SplatterEngine::render_snapshot(std::string_view layer) const {
    return m_coordinator.snapshot(layer);
}

std::string SplatterEngine::export_settings() const {
    return splat::export_settings(m_settings, m_layers);
}

std::expected<void, std::string> SplatterEngine::import_settings(std::string_view document) {
    auto result = splat::import_settings(document, m_settings, m_layers);
    if (!result) {
        Logger::instance().warn("Settings import failed: {}", result.error());
        return result;
    }
    m_coordinator.mark_dirty();
    request_redraw();
    return result;
}

std::vector<UICallback> SplatterEngine::dot_type_callbacks(ParticleType type) {
    std::vector<UICallback> callbacks;
    if (type == ParticleType::Central) {
        return callbacks;
    }
    callbacks.emplace_back("Count", DiscreteCallback{
        .setter = [this, type](int value) { m_settings.dots[type].count = std::clamp(value, 0, MAX_DOT_COUNT); },
        .getter = [this, type] { return m_settings.dots[type].count; },
        .min = 0,
        .max = MAX_DOT_COUNT,
    });
    return callbacks;
}

void SplatterEngine::set_random_source_factory(std::function<std::unique_ptr<RandomSource>()> factory) {
    m_random_factory = std::move(factory);
}

void SplatterEngine::request_redraw() const {
    if (m_redraw_request) {
        m_redraw_request();
    }
}

} // namespace splat
