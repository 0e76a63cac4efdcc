#include "splat/LayerStack.hpp"

#include "splat/Logger.hpp"

#include <algorithm>
#include <numeric>

namespace splat {

std::string_view to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Normal: return "normal";
    }
    return "multiply";
}

std::optional<BlendMode> blend_mode_from_string(std::string_view name) {
    if (name == "multiply") {
        return BlendMode::Multiply;
    }
    if (name == "normal") {
        return BlendMode::Normal;
    }
    return std::nullopt;
}

LayerTemplate LayerTemplate::background() {
    return {
        .name = "background",
        .display_name = "Background",
        .physics = {},
        .rendering = {},
        .z_index = 0.0,
    };
}

LayerTemplate LayerTemplate::foreground() {
    return {
        .name = "foreground",
        .display_name = "Foreground",
        .physics = {
            .velocity_x = 0.2f,
            .velocity_y = 0.15f,
            .force = 0.7f,
            .central_elongation = 2.5f,
            .particle_elongation = 1.8f,
            .time_elongation = 2.5f,
            .noise_amplitude = 0.4f,
            .velocity_roughness = 0.6f,
            .noise_frequency = 25.0f,
        },
        .rendering = {
            .enabled = true,
            .color = {0.3f, 0.5f, 0.8f},
            .opacity = 0.6f,
            .blend = BlendMode::Multiply,
            .visible_types = type_bit(ParticleType::Large) | type_bit(ParticleType::Medium) |
                             type_bit(ParticleType::Micro),
        },
        .z_index = 1.0,
    };
}

LayerTemplate LayerTemplate::dramatic() {
    return {
        .name = "dramatic",
        .display_name = "Dramatic",
        .physics = {
            .velocity_x = 1.5f,
            .velocity_y = 0.8f,
            .force = 1.0f,
            .central_elongation = 5.0f,
            .particle_elongation = 3.0f,
            .time_elongation = 4.0f,
            .noise_amplitude = 0.8f,
            .velocity_roughness = 1.2f,
            .noise_frequency = 30.0f,
        },
        .rendering = {
            .enabled = false,
            .color = {0.6f, 0.0f, 0.0f},
            .opacity = 0.8f,
            .blend = BlendMode::Multiply,
            .visible_types = ALL_TYPES_MASK,
        },
        .z_index = 2.0,
    };
}

LayerStack LayerStack::with_defaults() {
    LayerStack stack;
    stack.add(LayerTemplate::background());
    stack.add(LayerTemplate::foreground());
    stack.add(LayerTemplate::dramatic());
    return stack;
}

bool LayerStack::add(LayerTemplate layer) {
    if (find(layer.name) != nullptr) {
        Logger::instance().warn("Layer '{}' already exists", layer.name);
        return false;
    }
    // Goes on top of whatever is currently there
    layer.z_index = static_cast<double>(m_layers.size());
    m_layers.push_back(std::move(layer));
    resequence();
    notify(m_layers.back(), true);
    return true;
}

bool LayerStack::remove(std::string_view name) {
    auto it = std::ranges::find(m_layers, name, &LayerTemplate::name);
    if (it == m_layers.end()) {
        Logger::instance().warn("Cannot remove unknown layer '{}'", name);
        return false;
    }
    LayerTemplate removed = std::move(*it);
    m_layers.erase(it);
    resequence();
    notify(removed, true);
    return true;
}

bool LayerStack::move_to(std::string_view name, std::size_t z_position) {
    auto* layer = find(name);
    if (layer == nullptr) {
        Logger::instance().warn("Cannot move unknown layer '{}'", name);
        return false;
    }

    const auto self = static_cast<std::size_t>(layer - m_layers.data());
    auto ordered = z_order_indices();
    std::erase(ordered, self);
    z_position = std::min(z_position, ordered.size());
    ordered.insert(ordered.begin() + static_cast<std::ptrdiff_t>(z_position), self);

    bool changed = false;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        auto& target = m_layers[ordered[i]];
        if (target.z_index != static_cast<double>(i)) {
            target.z_index = static_cast<double>(i);
            changed = true;
        }
    }
    if (changed) {
        notify(*layer, false);
    }
    return true;
}

void LayerStack::apply_z_order(const std::unordered_map<std::string, double>& z_values) {
    for (auto& layer : m_layers) {
        if (auto it = z_values.find(layer.name); it != z_values.end()) {
            layer.z_index = it->second;
        }
    }
    resequence();
}

LayerTemplate* LayerStack::find(std::string_view name) {
    auto it = std::ranges::find(m_layers, name, &LayerTemplate::name);
    return it == m_layers.end() ? nullptr : &*it;
}

const LayerTemplate* LayerStack::find(std::string_view name) const {
    auto it = std::ranges::find(m_layers, name, &LayerTemplate::name);
    return it == m_layers.end() ? nullptr : &*it;
}

std::vector<const LayerTemplate*> LayerStack::by_z_order() const {
    std::vector<const LayerTemplate*> ordered;
    ordered.reserve(m_layers.size());
    for (auto index : z_order_indices()) {
        ordered.push_back(&m_layers[index]);
    }
    return ordered;
}

std::vector<std::size_t> LayerStack::z_order_indices() const {
    std::vector<std::size_t> indices(m_layers.size());
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    std::ranges::stable_sort(indices, {}, [this](std::size_t i) { return m_layers[i].z_index; });
    return indices;
}

bool LayerStack::set_enabled(std::string_view name, bool enabled) {
    auto* layer = find_for_update(name);
    if (layer == nullptr || layer->rendering.enabled == enabled) {
        return false;
    }
    layer->rendering.enabled = enabled;
    notify(*layer, false);
    return false;
}

bool LayerStack::set_color(std::string_view name, glm::vec3 color) {
    auto* layer = find_for_update(name);
    color = glm::clamp(color, glm::vec3(0.0f), glm::vec3(1.0f));
    if (layer == nullptr || layer->rendering.color == color) {
        return false;
    }
    layer->rendering.color = color;
    notify(*layer, false);
    return false;
}

bool LayerStack::set_opacity(std::string_view name, float opacity) {
    auto* layer = find_for_update(name);
    opacity = std::clamp(opacity, 0.0f, 1.0f);
    if (layer == nullptr || layer->rendering.opacity == opacity) {
        return false;
    }
    layer->rendering.opacity = opacity;
    notify(*layer, false);
    return false;
}

bool LayerStack::set_blend_mode(std::string_view name, BlendMode mode) {
    auto* layer = find_for_update(name);
    if (layer == nullptr || layer->rendering.blend == mode) {
        return false;
    }
    layer->rendering.blend = mode;
    notify(*layer, false);
    return false;
}

bool LayerStack::set_type_visible(std::string_view name, ParticleType type, bool visible) {
    const auto* layer = find(name);
    if (layer == nullptr) {
        Logger::instance().warn("Unknown layer '{}'", name);
        return false;
    }
    uint32_t mask = layer->rendering.visible_types;
    mask = visible ? (mask | type_bit(type)) : (mask & ~type_bit(type));
    return set_visible_types(name, mask);
}

bool LayerStack::set_visible_types(std::string_view name, uint32_t mask) {
    auto* layer = find_for_update(name);
    mask &= ALL_TYPES_MASK;
    if (layer == nullptr || layer->rendering.visible_types == mask) {
        return false;
    }
    layer->rendering.visible_types = mask;
    notify(*layer, true);
    return true;
}

bool LayerStack::set_physics(std::string_view name, const LayerPhysics& physics) {
    auto* layer = find_for_update(name);
    if (layer == nullptr) {
        return false;
    }
    LayerPhysics clamped = physics;
    clamped.force = std::clamp(clamped.force, 0.0f, 1.0f);
    if (layer->physics == clamped) {
        return false;
    }
    layer->physics = clamped;
    notify(*layer, false);
    return false;
}

bool LayerStack::set_display_name(std::string_view name, std::string display_name) {
    auto* layer = find_for_update(name);
    if (layer == nullptr || layer->display_name == display_name) {
        return false;
    }
    layer->display_name = std::move(display_name);
    notify(*layer, false);
    return false;
}

LayerTemplate* LayerStack::find_for_update(std::string_view name) {
    auto* layer = find(name);
    if (layer == nullptr) {
        Logger::instance().warn("Unknown layer '{}'", name);
    }
    return layer;
}

void LayerStack::notify(const LayerTemplate& layer, bool needs_rebuild) const {
    if (m_listener) {
        m_listener(layer, needs_rebuild);
    }
}

void LayerStack::resequence() {
    const auto ordered = z_order_indices();
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        m_layers[ordered[i]].z_index = static_cast<double>(i);
    }
}

} // namespace splat
