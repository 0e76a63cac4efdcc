#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace splat {

/**
 * @brief Size class of a generated dot
 *
 * The numeric value doubles as the bit index in a visibility mask and is what the
 * field shader reads from Particle::type.
 */
enum class ParticleType : int32_t {
    Central = 0,
    Large = 1,
    Medium = 2,
    Small = 3,
    Micro = 4,
};

inline constexpr std::size_t PARTICLE_TYPE_COUNT = 5;

inline constexpr std::array<ParticleType, PARTICLE_TYPE_COUNT> ALL_PARTICLE_TYPES = {
    ParticleType::Central, ParticleType::Large, ParticleType::Medium, ParticleType::Small, ParticleType::Micro,
};

/// Satellite types in generation order
inline constexpr std::array<ParticleType, 4> SATELLITE_TYPES = {
    ParticleType::Large, ParticleType::Medium, ParticleType::Small, ParticleType::Micro,
};

inline constexpr uint32_t ALL_TYPES_MASK = 0b11111u;

[[nodiscard]] constexpr uint32_t type_bit(ParticleType type) {
    return 1u << static_cast<uint32_t>(type);
}

[[nodiscard]] constexpr std::string_view to_string(ParticleType type) {
    switch (type) {
        case ParticleType::Central: return "central";
        case ParticleType::Large: return "large";
        case ParticleType::Medium: return "medium";
        case ParticleType::Small: return "small";
        case ParticleType::Micro: return "micro";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ParticleType> particle_type_from_string(std::string_view name) {
    for (auto type : ALL_PARTICLE_TYPES) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

/**
 * @brief GPU-transferable dot record
 *
 * Matches the std430 layout of the Particle struct in shaders/splat/field.slang.
 * Records are created once by the generator and never modified afterwards.
 */
struct Particle {
    glm::vec2 position;      ///< Screen-normalized position in [0,1]^2
    float radius;            ///< Radius relative to the screen width
    ParticleType type;       ///< Size class, selects the visibility bit
    glm::vec2 velocity;      ///< Direction and speed used for streak orientation
    float elongation = 1.0f; ///< Stretch along the velocity, always >= 1
    float padding = 0.0f;

    bool operator==(const Particle&) const = default;
};
static_assert(sizeof(Particle) == 32, "Particle must match the 32 byte shader layout");
static_assert(sizeof(ParticleType) == 4, "Particle::type is read as a 32 bit int on the GPU");

} // namespace splat
