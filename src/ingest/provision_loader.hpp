#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/provision.hpp"

namespace ingest {

// Reads a provision snapshot:
//
//   {"provisions": [{"id": "...", "framework_id": "...", "jurisdiction": [...],
//     "authority_level": 2, "effective_date": "YYYY-MM-DD" | null,
//     "expiry_date": ..., "superseded_by": "..." | null, "revision_of": ...,
//     "polarity": "requires" | "prohibits" | "permits", "topic_tags": [...],
//     "obligation": "...", "quantity": {"value": 24, "unit": "h",
//     "bound": "at_most"} | null, "qualifiers": [...], "context_flags": [...],
//     "entity_count": 1200}]}
//
// Only "id" and "polarity" are required. Missing jurisdiction or dates are
// accepted; detection skips the checks that need them. Each provision is
// normalized. Duplicate ids are rejected. `out` is replaced only on success.
bool load_provisions(const std::filesystem::path& path, std::vector<core::NormativeProvision>& out,
                     std::string& error) noexcept;

bool parse_provisions(std::string_view json, std::vector<core::NormativeProvision>& out, std::string& error) noexcept;

} // namespace ingest
