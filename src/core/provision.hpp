#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/time.hpp"

namespace core {

using ProvisionId = std::string;
using Timestamp = std::uint64_t; // ns since Unix epoch

enum class Polarity : std::uint8_t {
    Requires = 0,
    Prohibits = 1,
    Permits = 2
};

enum class QuantityBound : std::uint8_t {
    AtMost = 0,  // value is a ceiling (e.g. "within 24h")
    AtLeast = 1  // value is a floor (e.g. "at least 10 days notice")
};

struct Quantity {
    double value{0.0};
    std::string unit{};
    QuantityBound bound{QuantityBound::AtMost};

    bool operator==(const Quantity&) const = default;
};

// Owned by the provision source; the engine never mutates one. Set-valued
// fields are kept sorted and unique (see normalize_provision).
struct NormativeProvision {
    ProvisionId id{};
    std::string framework_id{};
    std::vector<std::string> jurisdiction{};
    std::int32_t authority_level{0};
    std::optional<util::CivilDay> effective_date{};
    std::optional<util::CivilDay> expiry_date{};     // exclusive; missing = open-ended
    std::optional<ProvisionId> superseded_by{};
    std::optional<ProvisionId> revision_of{};
    Polarity polarity{Polarity::Requires};
    std::vector<std::string> topic_tags{};
    std::string obligation{};
    std::optional<Quantity> quantity{};
    std::vector<std::string> qualifiers{};
    std::vector<std::string> context_flags{};
    std::uint64_t entity_count{0};
};

// Half-open [start, end) span of civil days; missing end = open-ended.
struct DayWindow {
    util::CivilDay start{0};
    std::optional<util::CivilDay> end{};

    bool operator==(const DayWindow&) const = default;
};

[[nodiscard]] constexpr const char* to_string(Polarity p) noexcept {
    switch (p) {
    case Polarity::Requires: return "requires";
    case Polarity::Prohibits: return "prohibits";
    case Polarity::Permits: return "permits";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(QuantityBound b) noexcept {
    switch (b) {
    case QuantityBound::AtMost: return "at_most";
    case QuantityBound::AtLeast: return "at_least";
    }
    return "unknown";
}

std::optional<Polarity> parse_polarity(std::string_view s) noexcept;
std::optional<QuantityBound> parse_quantity_bound(std::string_view s) noexcept;

// Sorts and dedupes the set-valued fields.
void normalize_provision(NormativeProvision& p);

// Requires/Prohibits or Permits/Prohibits.
[[nodiscard]] constexpr bool polarities_incompatible(Polarity a, Polarity b) noexcept {
    return (a == Polarity::Prohibits) != (b == Polarity::Prohibits);
}

// Validity window, or nullopt when the effective date is unknown.
std::optional<DayWindow> validity_window(const NormativeProvision& p) noexcept;

// Overlap of two validity windows; nullopt when either is unknown or they are
// disjoint.
std::optional<DayWindow> overlap_window(const NormativeProvision& a, const NormativeProvision& b) noexcept;

// Both windows known and non-overlapping (sequential).
bool windows_disjoint(const NormativeProvision& a, const NormativeProvision& b) noexcept;

bool active_on(const NormativeProvision& p, util::CivilDay day) noexcept;

// One of the pair replaces the other via superseded_by or the revision chain.
bool supersession_link(const NormativeProvision& a, const NormativeProvision& b) noexcept;

// Scope narrowing used by Lex Specialis: a's jurisdiction is a strict subset of
// b's while covering at least b's qualifiers, or the jurisdictions are equal
// and a carries strictly more qualifiers.
bool is_narrower_scope(const NormativeProvision& a, const NormativeProvision& b);

// Same jurisdiction and qualifier sets.
bool same_scope(const NormativeProvision& a, const NormativeProvision& b) noexcept;

// Hash over every field a conflict verdict depends on.
std::uint64_t provision_fingerprint(const NormativeProvision& p) noexcept;

// Sorted-set helpers; inputs must be sorted and unique.
std::vector<std::string> sorted_intersection(const std::vector<std::string>& a, const std::vector<std::string>& b);
std::vector<std::string> sorted_union(const std::vector<std::string>& a, const std::vector<std::string>& b);
bool sorted_includes(const std::vector<std::string>& outer, const std::vector<std::string>& inner);
bool sorted_intersects(const std::vector<std::string>& a, const std::vector<std::string>& b) noexcept;

} // namespace core
