#include "splat/SplatGenerator.hpp"

#include "splat/Logger.hpp"

#include <glm/gtc/constants.hpp>
#include <algorithm>

namespace splat {

SplatGenerator::SplatGenerator(const DotSettings& dots, const SafetyLimits& limits)
    : m_dots(dots), m_limits(limits) {}

Impact SplatGenerator::make_impact(glm::vec2 position, glm::vec2 screen_size, const LayerPhysics& physics) {
    return {
        .position = position,
        .screen_size = screen_size,
        .velocity = physics.impact_velocity(),
        .force = physics.force,
    };
}

bool SplatGenerator::type_active(const LayerTemplate& layer, ParticleType type) const {
    return m_dots[type].enabled && layer.rendering.is_visible(type);
}

std::size_t SplatGenerator::planned_count(const LayerTemplate& layer) const {
    std::size_t count = 0;
    if (type_active(layer, ParticleType::Central)) {
        ++count;
    }
    for (auto type : SATELLITE_TYPES) {
        if (type_active(layer, type)) {
            count += static_cast<std::size_t>(std::max(m_dots[type].count, 0));
        }
    }
    return count;
}

std::vector<Particle> SplatGenerator::generate(const Impact& impact, const LayerTemplate& layer, RandomSource& rng,
                                               std::size_t current_total) const {
    if (impact.screen_size.x <= 0.0f || impact.screen_size.y <= 0.0f) {
        Logger::instance().warn("Ignoring impact on empty surface {}x{}", impact.screen_size.x, impact.screen_size.y);
        return {};
    }

    const auto planned = planned_count(layer);
    if (planned > m_limits.max_particles_per_splat) {
        Logger::instance().warn("Splat on layer '{}' would create {} particles, limit is {}", layer.name, planned,
                                m_limits.max_particles_per_splat);
        return {};
    }
    if (current_total + planned > m_limits.max_total_particles) {
        Logger::instance().warn("Particle ceiling reached ({} + {} > {}), dropping splat on layer '{}'",
                                current_total, planned, m_limits.max_total_particles, layer.name);
        return {};
    }

    const glm::vec2 center = glm::clamp(impact.position / impact.screen_size, glm::vec2(0.0f), glm::vec2(1.0f));

    std::vector<Particle> particles;
    particles.reserve(planned);

    if (type_active(layer, ParticleType::Central)) {
        particles.push_back(central_particle(center, impact, layer.physics, m_dots[ParticleType::Central], rng));
    }
    for (auto type : SATELLITE_TYPES) {
        if (!type_active(layer, type)) {
            continue;
        }
        const auto& params = m_dots[type];
        for (int i = 0; i < params.count; ++i) {
            particles.push_back(satellite_particle(center, type, impact, layer.physics, params, rng));
        }
    }

    Logger::instance().trace("Generated {} particles for layer '{}'", particles.size(), layer.name);
    return particles;
}

Particle SplatGenerator::central_particle(glm::vec2 center, const Impact& impact, const LayerPhysics& physics,
                                          const DotTypeParams& params, RandomSource& rng) {
    const float radius = rng.uniform_float(params.lower_radius(), params.upper_radius());
    const float speed = glm::length(impact.velocity);

    return {
        .position = center,
        .radius = radius,
        .type = ParticleType::Central,
        .velocity = impact.velocity,
        .elongation = std::max(1.0f, 1.0f + speed * impact.force * physics.central_elongation),
    };
}

Particle SplatGenerator::satellite_particle(glm::vec2 center, ParticleType type, const Impact& impact,
                                            const LayerPhysics& physics, const DotTypeParams& params,
                                            RandomSource& rng) {
    // Draw order is part of the replay contract. The launch angle is drawn to keep
    // seeded sequences aligned but does not steer the trajectory.
    [[maybe_unused]] const float angle = rng.uniform_float(0.0f, glm::two_pi<float>());
    const float scale = rng.uniform_float(MIN_VELOCITY_SCALE, MAX_VELOCITY_SCALE);
    const float jitter_x = rng.uniform_float(-JITTER_X, JITTER_X);
    const float jitter_y = rng.uniform_float(-JITTER_Y, JITTER_Y);
    const glm::vec2 launch = impact.velocity * scale + glm::vec2(jitter_x, jitter_y);

    const float t = rng.uniform_float(MIN_FLIGHT_TIME, MAX_FLIGHT_TIME);
    const glm::vec2 gravity_effect = glm::vec2(0.0f, GRAVITY_Y) * t * t * 0.5f;
    const glm::vec2 position = glm::clamp(center + launch * t + gravity_effect, glm::vec2(0.0f), glm::vec2(1.0f));

    const float max_radius = params.upper_radius();
    float radius = rng.uniform_float(params.lower_radius(), max_radius);
    if (max_radius > 0.0f) {
        radius *= 1.0f + (1.0f - radius / max_radius) * SURFACE_TENSION;
    }

    const glm::vec2 final_velocity = launch + gravity_effect * 2.0f;
    const float elongation =
        1.0f + glm::length(final_velocity) * impact.force * physics.particle_elongation + t * physics.time_elongation;

    return {
        .position = position,
        .radius = radius,
        .type = type,
        .velocity = final_velocity,
        .elongation = std::max(1.0f, elongation),
    };
}

} // namespace splat
