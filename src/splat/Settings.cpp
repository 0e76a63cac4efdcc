#include "splat/Settings.hpp"

namespace splat {

DotSettings DotSettings::defaults() {
    DotSettings settings;
    settings[ParticleType::Central] = {.enabled = true, .count = 1, .radius_min = 0.15f, .radius_max = 0.3f};
    settings[ParticleType::Large] =
        {.enabled = true, .count = 25, .radius_min = 0.02f, .radius_max = 0.08f, .max_distance = 0.15f};
    settings[ParticleType::Medium] =
        {.enabled = true, .count = 40, .radius_min = 0.005f, .radius_max = 0.025f, .max_distance = 0.2f};
    settings[ParticleType::Small] =
        {.enabled = true, .count = 80, .radius_min = 0.001f, .radius_max = 0.008f, .max_distance = 0.35f};
    settings[ParticleType::Micro] =
        {.enabled = true, .count = 120, .radius_min = 0.0005f, .radius_max = 0.003f, .max_distance = 0.6f};
    return settings;
}

uint32_t DotSettings::enabled_mask() const {
    uint32_t mask = 0;
    for (auto type : ALL_PARTICLE_TYPES) {
        if ((*this)[type].enabled) {
            mask |= type_bit(type);
        }
    }
    return mask;
}

} // namespace splat
