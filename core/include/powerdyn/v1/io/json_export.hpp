#pragma once

// =============================================================================
// powerdyn - JSON Snapshots
// =============================================================================

#include "powerdyn/v1/system.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace powerdyn::v1::io {

[[nodiscard]] nlohmann::json to_json(const PowerSystem& system);

/// Pretty-printed snapshot; throws std::runtime_error when the file cannot be written
void write_system_json(const PowerSystem& system, const std::filesystem::path& path);

}  // namespace powerdyn::v1::io
