#pragma once

#include "ParticleData.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace splat {

/**
 * @brief Owns the accumulated particles of every layer
 *
 * Particles are only ever appended or dropped wholesale. Mutations bump the
 * revision and notify the mutation listener.
 */
class ParticleStore {
public:
    using MutationListener = std::function<void()>;

    void append(const std::string& layer, std::span<const Particle> particles);
    /// Empties every layer
    void clear();
    /// Drops the particles of one layer
    void clear_layer(std::string_view layer);

    [[nodiscard]] std::span<const Particle> particles(std::string_view layer) const;
    [[nodiscard]] std::size_t count(std::string_view layer) const;
    [[nodiscard]] std::size_t total_count() const { return m_total; }
    [[nodiscard]] uint64_t revision() const { return m_revision; }

    void set_mutation_listener(MutationListener listener) { m_listener = std::move(listener); }

private:
    void mutated();

    std::map<std::string, std::vector<Particle>, std::less<>> m_layers;
    std::size_t m_total = 0;
    uint64_t m_revision = 0;
    MutationListener m_listener;
};

} // namespace splat
