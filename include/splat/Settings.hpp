#pragma once

#include "ParticleData.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace splat {

/**
 * @brief Generation parameters shared by every dot of one type
 */
struct DotTypeParams {
    bool enabled = true;
    int count = 0;
    float radius_min = 0.0f;
    float radius_max = 0.0f;
    float max_distance = 0.0f; ///< Persisted with the settings, trajectories do not read it

    [[nodiscard]] float lower_radius() const { return radius_min < radius_max ? radius_min : radius_max; }
    [[nodiscard]] float upper_radius() const { return radius_min < radius_max ? radius_max : radius_min; }
};

/**
 * @brief Per-type dot parameters, indexed by ParticleType
 */
class DotSettings {
public:
    static DotSettings defaults();

    [[nodiscard]] DotTypeParams& operator[](ParticleType type) { return m_params[static_cast<std::size_t>(type)]; }
    [[nodiscard]] const DotTypeParams& operator[](ParticleType type) const {
        return m_params[static_cast<std::size_t>(type)];
    }

    /// Mask of the types that are globally enabled
    [[nodiscard]] uint32_t enabled_mask() const;

private:
    std::array<DotTypeParams, PARTICLE_TYPE_COUNT> m_params{};
};

/// Backpressure limits for generation
struct SafetyLimits {
    std::size_t max_total_particles = 10'000; ///< Across all layers
    std::size_t max_particles_per_splat = 500; ///< Per layer and impact
};

/**
 * @brief Global engine configuration
 */
struct SplatterSettings {
    float influence_threshold = 0.001f;
    bool use_seeded_rng = false;
    uint64_t rng_seed = 12345;
    DotSettings dots = DotSettings::defaults();
    SafetyLimits limits{};
};

} // namespace splat
