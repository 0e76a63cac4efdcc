#include "splat/FieldModel.hpp"

#include <algorithm>
#include <cmath>

namespace splat::field {

float smoothstep(float edge0, float edge1, float x) {
    const float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

float fract(float x) {
    return x - std::floor(x);
}

float hash(glm::vec2 p) {
    return fract(std::sin(glm::dot(p, glm::vec2(127.1f, 311.7f))) * 43758.5453123f);
}

float value_noise(glm::vec2 p) {
    const glm::vec2 i = glm::floor(p);
    const glm::vec2 f = p - i;

    const float a = hash(i);
    const float b = hash(i + glm::vec2(1.0f, 0.0f));
    const float c = hash(i + glm::vec2(0.0f, 1.0f));
    const float d = hash(i + glm::vec2(1.0f, 1.0f));

    const glm::vec2 u = f * f * (3.0f - 2.0f * f);
    return glm::mix(a, b, u.x) + (c - a) * u.y * (1.0f - u.x) + (d - b) * u.x * u.y;
}

float fbm(glm::vec2 p) {
    float value = 0.0f;
    float amplitude = 0.5f;
    float frequency = 1.0f;
    for (int octave = 0; octave < FBM_OCTAVES; ++octave) {
        value += amplitude * value_noise(p * frequency);
        amplitude *= 0.5f;
        frequency *= 2.0f;
    }
    return value;
}

float influence(glm::vec2 uv, const Particle& particle, const FieldUniforms& uniforms) {
    if ((uniforms.visibility_mask & type_bit(particle.type)) == 0) {
        return 0.0f;
    }

    glm::vec2 diff = uv - particle.position;
    diff.x *= uniforms.aspect_ratio;

    const float speed = glm::length(particle.velocity);
    glm::vec2 local = diff;
    if (speed > MIN_STREAK_SPEED) {
        const glm::vec2 dir = particle.velocity / speed;
        local = glm::vec2(dir.x * diff.x - dir.y * diff.y, dir.y * diff.x + dir.x * diff.y);
        local.y /= particle.elongation;
    }

    const float distance = glm::length(local);
    const float effective_radius = particle.radius * std::max(1.0f, particle.elongation);
    if (effective_radius <= 0.0f || distance > effective_radius * CULL_RADIUS_FACTOR) {
        return 0.0f;
    }

    const float normalized = distance / effective_radius;
    const glm::vec2 noise_coord = uv * uniforms.noise_frequency + particle.velocity * 10.0f;
    const float edge_noise = fbm(noise_coord) * uniforms.noise_amplitude;
    const float distorted = normalized + edge_noise * speed * uniforms.velocity_roughness;

    const float feather = 0.8f + 0.2f * speed;
    return 1.0f - smoothstep(0.0f, feather, distorted);
}

float accumulate(glm::vec2 uv, std::span<const Particle> particles, const FieldUniforms& uniforms) {
    const auto live = std::min<std::size_t>(particles.size(), uniforms.count);
    float total = 0.0f;
    for (std::size_t i = 0; i < live; ++i) {
        total += influence(uv, particles[i], uniforms);
    }
    return total;
}

float alpha(float total_field) {
    return smoothstep(ALPHA_EDGE_LOW, ALPHA_EDGE_HIGH, total_field);
}

FieldUniforms make_uniforms(const LayerTemplate& layer, const RenderSnapshot& snapshot, float influence_threshold,
                            float aspect_ratio) {
    return FieldUniforms{
        .color = layer.rendering.color,
        .count = snapshot.count,
        .visibility_mask = snapshot.visibility_mask,
        .influence_threshold = influence_threshold,
        .aspect_ratio = aspect_ratio,
        .opacity = layer.rendering.opacity,
        .noise_amplitude = layer.physics.noise_amplitude,
        .velocity_roughness = layer.physics.velocity_roughness,
        .noise_frequency = layer.physics.noise_frequency,
    };
}

} // namespace splat::field
