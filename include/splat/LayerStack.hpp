#pragma once

#include "ParticleData.hpp"

#include <glm/glm.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace splat {

enum class BlendMode {
    Multiply,
    Normal,
};

[[nodiscard]] std::string_view to_string(BlendMode mode);
[[nodiscard]] std::optional<BlendMode> blend_mode_from_string(std::string_view name);

/**
 * @brief Impact shaping and edge noise parameters of a layer
 *
 * Velocity and force only affect impacts generated after a change. The noise
 * parameters are read by the field shader every frame.
 */
struct LayerPhysics {
    float velocity_x = 0.1f;
    float velocity_y = 0.1f;
    float force = 0.5f;                ///< [0,1]
    float central_elongation = 2.0f;
    float particle_elongation = 1.5f;
    float time_elongation = 2.0f;
    float noise_amplitude = 0.3f;
    float velocity_roughness = 0.4f;
    float noise_frequency = 20.0f;

    [[nodiscard]] glm::vec2 impact_velocity() const { return {velocity_x, velocity_y}; }

    bool operator==(const LayerPhysics&) const = default;
};

struct LayerRendering {
    bool enabled = true;
    glm::vec3 color{0.8f, 0.1f, 0.1f};
    float opacity = 1.0f;                  ///< [0,1]
    BlendMode blend = BlendMode::Multiply;
    uint32_t visible_types = ALL_TYPES_MASK;

    [[nodiscard]] bool is_visible(ParticleType type) const { return (visible_types & type_bit(type)) != 0; }
};

/**
 * @brief A named, independently styled compositing pass
 */
struct LayerTemplate {
    std::string name;         ///< Unique key
    std::string display_name;
    LayerPhysics physics;
    LayerRendering rendering;
    double z_index = 0.0;     ///< Compositing order, kept contiguous by LayerStack

    static LayerTemplate background();
    static LayerTemplate foreground();
    static LayerTemplate dramatic();
};

/**
 * @brief Ordered collection of layers keyed by name
 *
 * Array order is insertion order. Compositing order comes from z_index, which is
 * re-sequenced to 0..N-1 after every add, remove and move.
 *
 * The setters return true when the change invalidates the render snapshot (the
 * visibility mask changed). Every effective change is also reported to the
 * change listener, so hosts can request a redraw for purely visual edits.
 */
class LayerStack {
public:
    /// Called with the layer after the change and whether a snapshot rebuild is needed
    using ChangeListener = std::function<void(const LayerTemplate&, bool needs_rebuild)>;

    LayerStack() = default;

    /// background, foreground and dramatic
    static LayerStack with_defaults();

    /// Appends on top of the compositing order. Fails on duplicate names.
    bool add(LayerTemplate layer);
    bool remove(std::string_view name);
    /// Moves a layer to position z_position (clamped) in the compositing order
    bool move_to(std::string_view name, std::size_t z_position);
    /**
     * @brief Reorders by explicit z values, layers not mentioned keep their relative place
     *
     * Ties are broken by the previous compositing order.
     */
    void apply_z_order(const std::unordered_map<std::string, double>& z_values);

    [[nodiscard]] LayerTemplate* find(std::string_view name);
    [[nodiscard]] const LayerTemplate* find(std::string_view name) const;
    [[nodiscard]] const std::vector<LayerTemplate>& layers() const { return m_layers; }
    [[nodiscard]] std::size_t size() const { return m_layers.size(); }
    [[nodiscard]] bool empty() const { return m_layers.empty(); }

    /// Layers sorted by ascending z_index
    [[nodiscard]] std::vector<const LayerTemplate*> by_z_order() const;

    bool set_enabled(std::string_view name, bool enabled);
    bool set_color(std::string_view name, glm::vec3 color);
    bool set_opacity(std::string_view name, float opacity);
    bool set_blend_mode(std::string_view name, BlendMode mode);
    bool set_type_visible(std::string_view name, ParticleType type, bool visible);
    bool set_visible_types(std::string_view name, uint32_t mask);
    bool set_physics(std::string_view name, const LayerPhysics& physics);
    bool set_display_name(std::string_view name, std::string display_name);

    void set_change_listener(ChangeListener listener) { m_listener = std::move(listener); }

private:
    LayerTemplate* find_for_update(std::string_view name);
    void notify(const LayerTemplate& layer, bool needs_rebuild) const;
    void resequence();
    [[nodiscard]] std::vector<std::size_t> z_order_indices() const;

    std::vector<LayerTemplate> m_layers;
    ChangeListener m_listener;
};

} // namespace splat
