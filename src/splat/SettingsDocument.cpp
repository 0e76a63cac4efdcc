#include "splat/SettingsDocument.hpp"

#include "splat/Logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace splat {

using json = nlohmann::json;

namespace {

const json* child(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        Logger::instance().warn("Settings field '{}' is not an object, ignoring it", key);
        return nullptr;
    }
    return &*it;
}

void read_float(const json& j, const char* key, float& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number()) {
        Logger::instance().warn("Settings field '{}' is not a number, keeping {}", key, out);
        return;
    }
    out = it->get<float>();
}

void read_double(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number()) {
        Logger::instance().warn("Settings field '{}' is not a number, keeping {}", key, out);
        return;
    }
    out = it->get<double>();
}

void read_int(const json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        Logger::instance().warn("Settings field '{}' is not an integer, keeping {}", key, out);
        return;
    }
    out = it->get<int>();
}

void read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_boolean()) {
        Logger::instance().warn("Settings field '{}' is not a boolean, keeping {}", key, out);
        return;
    }
    out = it->get<bool>();
}

void read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_string()) {
        Logger::instance().warn("Settings field '{}' is not a string, keeping '{}'", key, out);
        return;
    }
    out = it->get<std::string>();
}

json dot_to_json(ParticleType type, const DotTypeParams& params) {
    json j = {
        {"enabled", params.enabled},
        {"radiusMin", params.radius_min},
        {"radiusMax", params.radius_max},
    };
    if (type != ParticleType::Central) {
        j["count"] = params.count;
        j["maxDistance"] = params.max_distance;
    }
    return j;
}

void dot_from_json(const json& j, ParticleType type, DotTypeParams& params) {
    read_bool(j, "enabled", params.enabled);
    read_float(j, "radiusMin", params.radius_min);
    read_float(j, "radiusMax", params.radius_max);
    params.radius_min = std::max(params.radius_min, 0.0f);
    params.radius_max = std::max(params.radius_max, 0.0f);
    if (type != ParticleType::Central) {
        read_int(j, "count", params.count);
        read_float(j, "maxDistance", params.max_distance);
        params.count = std::max(params.count, 0);
    }
}

json physics_to_json(const LayerPhysics& physics) {
    return {
        {"velocityX", physics.velocity_x},
        {"velocityY", physics.velocity_y},
        {"force", physics.force},
        {"centralElongation", physics.central_elongation},
        {"particleElongation", physics.particle_elongation},
        {"timeElongation", physics.time_elongation},
        {"noiseAmplitude", physics.noise_amplitude},
        {"velocityRoughness", physics.velocity_roughness},
        {"noiseFrequency", physics.noise_frequency},
    };
}

void physics_from_json(const json& j, LayerPhysics& physics) {
    read_float(j, "velocityX", physics.velocity_x);
    read_float(j, "velocityY", physics.velocity_y);
    read_float(j, "force", physics.force);
    read_float(j, "centralElongation", physics.central_elongation);
    read_float(j, "particleElongation", physics.particle_elongation);
    read_float(j, "timeElongation", physics.time_elongation);
    read_float(j, "noiseAmplitude", physics.noise_amplitude);
    read_float(j, "velocityRoughness", physics.velocity_roughness);
    read_float(j, "noiseFrequency", physics.noise_frequency);
    physics.force = std::clamp(physics.force, 0.0f, 1.0f);
}

json layer_to_json(const LayerTemplate& layer) {
    json dot_types = json::object();
    for (auto type : ALL_PARTICLE_TYPES) {
        dot_types[std::string(to_string(type))] = layer.rendering.is_visible(type);
    }
    return {
        {"displayName", layer.display_name},
        {"enabled", layer.rendering.enabled},
        {"color", {{"r", layer.rendering.color.r}, {"g", layer.rendering.color.g}, {"b", layer.rendering.color.b}}},
        {"opacity", layer.rendering.opacity},
        {"blendMode", std::string(to_string(layer.rendering.blend))},
        {"zIndex", layer.z_index},
        {"dotTypes", dot_types},
        {"physics", physics_to_json(layer.physics)},
    };
}

void layer_from_json(const json& j, LayerTemplate& layer) {
    auto& rendering = layer.rendering;
    read_string(j, "displayName", layer.display_name);
    read_bool(j, "enabled", rendering.enabled);
    read_float(j, "opacity", rendering.opacity);
    rendering.opacity = std::clamp(rendering.opacity, 0.0f, 1.0f);

    if (const auto* color = child(j, "color")) {
        read_float(*color, "r", rendering.color.r);
        read_float(*color, "g", rendering.color.g);
        read_float(*color, "b", rendering.color.b);
        rendering.color = glm::clamp(rendering.color, glm::vec3(0.0f), glm::vec3(1.0f));
    }

    std::string blend(to_string(rendering.blend));
    read_string(j, "blendMode", blend);
    if (auto mode = blend_mode_from_string(blend)) {
        rendering.blend = *mode;
    } else {
        Logger::instance().warn("Unknown blend mode '{}' for layer '{}'", blend, layer.name);
    }

    if (const auto* dot_types = child(j, "dotTypes")) {
        for (auto type : ALL_PARTICLE_TYPES) {
            bool visible = rendering.is_visible(type);
            read_bool(*dot_types, std::string(to_string(type)).c_str(), visible);
            rendering.visible_types = visible ? (rendering.visible_types | type_bit(type))
                                              : (rendering.visible_types & ~type_bit(type));
        }
    }

    if (const auto* physics = child(j, "physics")) {
        physics_from_json(*physics, layer.physics);
    }
}

} // namespace

json settings_to_json(const SplatterSettings& settings, const LayerStack& layers) {
    json dots = json::object();
    for (auto type : ALL_PARTICLE_TYPES) {
        dots[std::string(to_string(type))] = dot_to_json(type, settings.dots[type]);
    }

    json layer_docs = json::object();
    for (const auto& layer : layers.layers()) {
        layer_docs[layer.name] = layer_to_json(layer);
    }

    return {
        {SETTINGS_VERSION_KEY, SETTINGS_SCHEMA_VERSION},
        {"rendering", {{"influenceThreshold", settings.influence_threshold}}},
        {"randomisation", {{"useSeededRNG", settings.use_seeded_rng}, {"rngSeed", settings.rng_seed}}},
        {"dots", dots},
        {"layers", layer_docs},
    };
}

std::string export_settings(const SplatterSettings& settings, const LayerStack& layers) {
    return settings_to_json(settings, layers).dump(2);
}

std::expected<void, std::string> import_settings(std::string_view document, SplatterSettings& settings,
                                                 LayerStack& layers) {
    const json root = json::parse(document, nullptr, false);
    if (root.is_discarded()) {
        return std::unexpected("Settings document is not valid JSON");
    }
    if (!root.is_object()) {
        return std::unexpected("Settings document must be a JSON object");
    }

    int version = SETTINGS_SCHEMA_VERSION;
    read_int(root, SETTINGS_VERSION_KEY, version);
    if (version > SETTINGS_SCHEMA_VERSION) {
        Logger::instance().warn("Settings schema {} is newer than {}, unknown fields are ignored", version,
                                SETTINGS_SCHEMA_VERSION);
    }

    SplatterSettings next_settings = settings;
    LayerStack next_layers = layers;

    if (const auto* rendering = child(root, "rendering")) {
        read_float(*rendering, "influenceThreshold", next_settings.influence_threshold);
    }

    if (const auto* randomisation = child(root, "randomisation")) {
        read_bool(*randomisation, "useSeededRNG", next_settings.use_seeded_rng);
        if (auto it = randomisation->find("rngSeed"); it != randomisation->end()) {
            if (it->is_number_unsigned() || (it->is_number_integer() && it->get<int64_t>() >= 0)) {
                next_settings.rng_seed = it->get<uint64_t>();
            } else {
                Logger::instance().warn("Settings field 'rngSeed' must be a non-negative integer");
            }
        }
    }

    if (const auto* dots = child(root, "dots")) {
        for (auto type : ALL_PARTICLE_TYPES) {
            if (const auto* params = child(*dots, std::string(to_string(type)).c_str())) {
                dot_from_json(*params, type, next_settings.dots[type]);
            }
        }
    }

    if (const auto* layer_docs = child(root, "layers")) {
        std::unordered_map<std::string, double> z_values;
        for (const auto& [name, doc] : layer_docs->items()) {
            auto* layer = next_layers.find(name);
            if (layer == nullptr) {
                Logger::instance().warn("Settings mention unknown layer '{}', skipping it", name);
                continue;
            }
            if (!doc.is_object()) {
                Logger::instance().warn("Settings for layer '{}' are not an object", name);
                continue;
            }
            layer_from_json(doc, *layer);
            double z = layer->z_index;
            read_double(doc, "zIndex", z);
            z_values.emplace(name, z);
        }
        next_layers.apply_z_order(z_values);
    }

    settings = std::move(next_settings);
    layers = std::move(next_layers);
    Logger::instance().info("Imported settings (schema {})", version);
    return {};
}

std::optional<int> read_schema_version(std::string_view document) {
    const json root = json::parse(document, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }
    auto it = root.find(SETTINGS_VERSION_KEY);
    if (it == root.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int>();
}

} // namespace splat
