#pragma once

#include "FrameCoordinator.hpp"
#include "LayerStack.hpp"
#include "ParticleData.hpp"

#include <glm/glm.hpp>
#include <cstdint>
#include <span>

namespace splat {

/**
 * @brief Per-layer uniform block of the field shader
 *
 * std140 layout of FieldUniforms in shaders/splat/field.slang.
 */
struct FieldUniforms {
    glm::vec3 color;
    uint32_t count;
    uint32_t visibility_mask;
    float influence_threshold;
    float aspect_ratio;         ///< width / height
    float opacity;
    float noise_amplitude;
    float velocity_roughness;
    float noise_frequency;
    float padding = 0.0f;
};
static_assert(sizeof(FieldUniforms) == 48, "FieldUniforms must match the std140 shader block");

/**
 * @brief CPU evaluation of the field shader
 *
 * Mirrors field.slang step by step so the look can be regression tested
 * without a GPU. Results may differ from the GPU in the last bits.
 */
namespace field {

inline constexpr int FBM_OCTAVES = 4;
inline constexpr float ALPHA_EDGE_LOW = 0.7f;
inline constexpr float ALPHA_EDGE_HIGH = 1.0f;
inline constexpr float CULL_RADIUS_FACTOR = 2.0f;
inline constexpr float MIN_STREAK_SPEED = 0.001f;

float smoothstep(float edge0, float edge1, float x);
float fract(float x);

float hash(glm::vec2 p);
float value_noise(glm::vec2 p);
float fbm(glm::vec2 p);

/// Contribution of one particle at uv, 0 when culled or masked out
float influence(glm::vec2 uv, const Particle& particle, const FieldUniforms& uniforms);

/// Sum of the first uniforms.count particles' influence at uv
float accumulate(glm::vec2 uv, std::span<const Particle> particles, const FieldUniforms& uniforms);

/// Coverage before layer opacity is applied
float alpha(float total_field);

/// Uniform block for drawing one layer's snapshot
FieldUniforms make_uniforms(const LayerTemplate& layer, const RenderSnapshot& snapshot, float influence_threshold,
                            float aspect_ratio);

} // namespace field

} // namespace splat
