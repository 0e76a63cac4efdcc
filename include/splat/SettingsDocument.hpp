#pragma once

#include "LayerStack.hpp"
#include "Settings.hpp"

#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace splat {

inline constexpr int SETTINGS_SCHEMA_VERSION = 1;
inline constexpr const char* SETTINGS_VERSION_KEY = "schemaVersion";

/**
 * @brief JSON persistence of the engine configuration
 *
 * Covers the RNG mode and seed, dot generation ranges and per-layer styling
 * and physics. Reading and writing the document is up to the host.
 */
[[nodiscard]] nlohmann::json settings_to_json(const SplatterSettings& settings, const LayerStack& layers);

[[nodiscard]] std::string export_settings(const SplatterSettings& settings, const LayerStack& layers);

/**
 * @brief Applies a settings document field by field
 *
 * Missing fields, fields of the wrong type and unknown layers keep their
 * current values. Nothing is modified if the document does not parse or is
 * not a JSON object.
 */
std::expected<void, std::string> import_settings(std::string_view document, SplatterSettings& settings,
                                                 LayerStack& layers);

/// Schema version recorded in a document, if it has one
[[nodiscard]] std::optional<int> read_schema_version(std::string_view document);

} // namespace splat
