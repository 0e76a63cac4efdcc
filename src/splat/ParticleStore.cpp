#include "splat/ParticleStore.hpp"

namespace splat {

void ParticleStore::append(const std::string& layer, std::span<const Particle> particles) {
    if (particles.empty()) {
        return;
    }
    auto& target = m_layers[layer];
    target.insert(target.end(), particles.begin(), particles.end());
    m_total += particles.size();
    mutated();
}

void ParticleStore::clear() {
    if (m_total == 0) {
        return;
    }
    m_layers.clear();
    m_total = 0;
    mutated();
}

void ParticleStore::clear_layer(std::string_view layer) {
    auto it = m_layers.find(layer);
    if (it == m_layers.end()) {
        return;
    }
    m_total -= it->second.size();
    m_layers.erase(it);
    mutated();
}

std::span<const Particle> ParticleStore::particles(std::string_view layer) const {
    auto it = m_layers.find(layer);
    if (it == m_layers.end()) {
        return {};
    }
    return it->second;
}

std::size_t ParticleStore::count(std::string_view layer) const {
    return particles(layer).size();
}

void ParticleStore::mutated() {
    ++m_revision;
    if (m_listener) {
        m_listener();
    }
}

} // namespace splat
