#include "splat/RandomSource.hpp"

#include <cmath>
#include <limits>

namespace splat {

SystemRandomSource::SystemRandomSource()
    : m_engine(std::random_device{}()) {}

float SystemRandomSource::uniform_float(float lo, float hi) {
    if (lo >= hi) {
        return lo;
    }
    // nextafter makes the upper bound reachable
    std::uniform_real_distribution<float> dist(lo, std::nextafter(hi, std::numeric_limits<float>::max()));
    return dist(m_engine);
}

int SystemRandomSource::uniform_int(int lo, int hi) {
    if (lo >= hi) {
        return lo;
    }
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(m_engine);
}

double SystemRandomSource::uniform_double(double lo, double hi) {
    if (lo >= hi) {
        return lo;
    }
    std::uniform_real_distribution<double> dist(lo, std::nextafter(hi, std::numeric_limits<double>::max()));
    return dist(m_engine);
}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : m_state(static_cast<uint32_t>(seed & 0xFFFFFFFFull)) {}

uint32_t SeededRandomSource::next() {
    m_state = m_state * MULTIPLIER + INCREMENT;
    return m_state;
}

float SeededRandomSource::next_unit() {
    return static_cast<float>(next()) / static_cast<float>(std::numeric_limits<uint32_t>::max());
}

float SeededRandomSource::uniform_float(float lo, float hi) {
    return lo + next_unit() * (hi - lo);
}

int SeededRandomSource::uniform_int(int lo, int hi) {
    if (lo >= hi) {
        return lo;
    }
    const auto span = static_cast<int64_t>(hi) - lo + 1;
    if (span > std::numeric_limits<uint32_t>::max()) {
        return static_cast<int>(static_cast<int64_t>(lo) + next());
    }
    return static_cast<int>(lo + static_cast<int64_t>(next() % static_cast<uint32_t>(span)));
}

double SeededRandomSource::uniform_double(double lo, double hi) {
    // Goes through the float path so doubles follow the same sequence as floats
    return static_cast<double>(uniform_float(static_cast<float>(lo), static_cast<float>(hi)));
}

std::unique_ptr<RandomSource> make_random_source(bool seeded, uint64_t seed) {
    if (seeded) {
        return std::make_unique<SeededRandomSource>(seed);
    }
    return std::make_unique<SystemRandomSource>();
}

} // namespace splat
