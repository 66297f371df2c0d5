#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/engine_config.hpp"

namespace persist {

std::optional<core::HarmonizationPolicy> harmonization_policy_from_string(std::string_view s) noexcept;

// Reads a JSON engine configuration. Fields not present keep the values
// already in `cfg`; unknown fields are rejected. The result is validated with
// core::validate_engine_config before `cfg` is touched.
//
// Durations are given in milliseconds (`*_ms`).
bool load_engine_config(const std::filesystem::path& path, core::EngineConfig& cfg, std::string& error) noexcept;

// Same schema, from an in-memory document.
bool parse_engine_config(std::string_view json, core::EngineConfig& cfg, std::string& error) noexcept;

} // namespace persist
