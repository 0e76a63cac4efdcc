#pragma once

#include "LayerStack.hpp"
#include "ParticleData.hpp"
#include "RandomSource.hpp"
#include "Settings.hpp"

#include <glm/glm.hpp>
#include <cstddef>
#include <vector>

namespace splat {

/**
 * @brief A single splatter trigger, resolved for one layer
 *
 * Velocity and force come from the layer, not from the input event.
 */
struct Impact {
    glm::vec2 position;    ///< Pixel coordinates
    glm::vec2 screen_size; ///< Pixel size of the drawing surface
    glm::vec2 velocity;
    float force;
};

/**
 * @brief Turns impacts into particle batches
 *
 * Uses a closed form parabolic flight for satellites. The constants (gravity,
 * velocity scale, jitter and flight time ranges, surface tension factor) define
 * the look and must not be tuned.
 */
class SplatGenerator {
public:
    static constexpr float GRAVITY_Y = 0.3f; ///< Screen space, pointing down
    static constexpr float MIN_VELOCITY_SCALE = 0.5f;
    static constexpr float MAX_VELOCITY_SCALE = 1.2f;
    static constexpr float JITTER_X = 0.2f;
    static constexpr float JITTER_Y = 0.1f;
    static constexpr float MIN_FLIGHT_TIME = 0.1f;
    static constexpr float MAX_FLIGHT_TIME = 0.5f;
    static constexpr float SURFACE_TENSION = 0.3f * 0.2f;

    SplatGenerator(const DotSettings& dots, const SafetyLimits& limits);

    /// Builds an impact from the layer's physics
    [[nodiscard]] static Impact make_impact(glm::vec2 position, glm::vec2 screen_size, const LayerPhysics& physics);

    /// Number of particles generate() would produce for this layer
    [[nodiscard]] std::size_t planned_count(const LayerTemplate& layer) const;

    /**
     * @brief Generates the particles of one layer for one impact
     *
     * Ceilings are checked before any random draw. When either would be exceeded
     * the result is empty and a warning is logged.
     *
     * @param current_total Particles already stored across all layers
     */
    [[nodiscard]] std::vector<Particle> generate(const Impact& impact, const LayerTemplate& layer,
                                                 RandomSource& rng, std::size_t current_total) const;

private:
    [[nodiscard]] bool type_active(const LayerTemplate& layer, ParticleType type) const;

    [[nodiscard]] static Particle central_particle(glm::vec2 center, const Impact& impact, const LayerPhysics& physics,
                                                   const DotTypeParams& params, RandomSource& rng);
    [[nodiscard]] static Particle satellite_particle(glm::vec2 center, ParticleType type, const Impact& impact,
                                                     const LayerPhysics& physics, const DotTypeParams& params,
                                                     RandomSource& rng);

    const DotSettings& m_dots;
    const SafetyLimits& m_limits;
};

} // namespace splat
