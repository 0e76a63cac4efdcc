#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace splat {

/**
 * @brief Uniform random numbers over closed ranges
 *
 * The generator only talks to this interface, which lets an impact be replayed
 * exactly with a SeededRandomSource or driven from system entropy otherwise.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual float uniform_float(float lo, float hi) = 0;
    virtual int uniform_int(int lo, int hi) = 0;
    virtual double uniform_double(double lo, double hi) = 0;
};

/**
 * @brief Non-reproducible source seeded from std::random_device
 */
class SystemRandomSource final : public RandomSource {
public:
    SystemRandomSource();

    float uniform_float(float lo, float hi) override;
    int uniform_int(int lo, int hi) override;
    double uniform_double(double lo, double hi) override;

private:
    std::mt19937 m_engine;
};

/**
 * @brief 32 bit linear congruential generator (Numerical Recipes constants)
 *
 * Produces the same sequence for the same seed on every platform. Only the low
 * 32 bits of the seed are used.
 */
class SeededRandomSource final : public RandomSource {
public:
    static constexpr uint32_t MULTIPLIER = 1664525u;
    static constexpr uint32_t INCREMENT = 1013904223u;

    explicit SeededRandomSource(uint64_t seed);

    /// Advances the state and returns it
    uint32_t next();

    /// next() scaled to [0,1]
    float next_unit();

    float uniform_float(float lo, float hi) override;
    int uniform_int(int lo, int hi) override;
    double uniform_double(double lo, double hi) override;

    [[nodiscard]] uint32_t state() const { return m_state; }

private:
    uint32_t m_state;
};

/// Seeded sources for replayable output, system entropy otherwise
std::unique_ptr<RandomSource> make_random_source(bool seeded, uint64_t seed);

} // namespace splat
