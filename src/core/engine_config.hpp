#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum class HarmonizationPolicy : std::uint8_t {
    MostRestrictive = 0,
    LeastRestrictive = 1,
    Escalate = 2
};

[[nodiscard]] constexpr const char* to_string(HarmonizationPolicy p) noexcept {
    switch (p) {
    case HarmonizationPolicy::MostRestrictive: return "most_restrictive";
    case HarmonizationPolicy::LeastRestrictive: return "least_restrictive";
    case HarmonizationPolicy::Escalate: return "escalate";
    }
    return "unknown";
}

// One row of the jurisdiction precedence table. Higher rank prevails.
struct PrecedenceEntry {
    std::string jurisdiction{};
    std::int32_t rank{0};
};

// Resolution authority for a (topic, jurisdiction) pair is held by `delegate`.
struct DelegationRule {
    std::string topic{};
    std::string jurisdiction{};
    std::string delegate{};
};

// Maps a jurisdiction tag onto the analytics bucket its outcomes are pooled in.
struct JurisdictionBucketEntry {
    std::string jurisdiction{};
    std::string bucket{};
};

struct SeverityWeights {
    double authority{0.4};
    double reach{0.3};
    double urgency{0.3};
};

// All durations are in nanoseconds.
struct EngineConfig {
    // Detection
    double similarity_threshold{0.8};
    SeverityWeights severity_weights{};
    double authority_gap_scale{3.0};         // |gap| at which the authority term saturates
    double reach_half_saturation{10'000.0};  // entity count giving a reach term of 0.5
    double urgency_horizon_days{90.0};
    std::size_t detection_workers{1};
    std::uint64_t scorer_timeout_ns{200'000'000};

    // Resolution
    double confidence_threshold{0.6};
    HarmonizationPolicy harmonization_policy{HarmonizationPolicy::MostRestrictive};
    std::vector<PrecedenceEntry> precedence{};
    std::vector<DelegationRule> delegation_rules{};
    std::vector<JurisdictionBucketEntry> jurisdiction_buckets{};
    std::uint32_t resolver_lease_attempts{4};
    std::uint64_t resolver_backoff_ns{1'000'000};
    std::uint32_t cas_attempts{3};

    // Escalation. sla_windows_ns[i] is the acknowledgement window at level i+1;
    // the vector size is the highest level.
    double escalation_level2_severity{0.8};
    std::vector<std::uint64_t> sla_windows_ns{
        48ull * 3600 * 1'000'000'000ull,
        24ull * 3600 * 1'000'000'000ull,
        8ull * 3600 * 1'000'000'000ull,
    };
    std::vector<std::vector<std::string>> stakeholders_per_level{};
    std::uint64_t sla_tick_ns{1'000'000'000};

    // Analytics
    double history_weight{1.0};
    double history_pseudo_count{5.0};
    std::uint64_t analytics_commit_interval_ns{1'000'000'000};

    // Notification delivery
    std::uint32_t notify_max_attempts{5};
    std::uint64_t notify_initial_backoff_ns{50'000'000};
    std::uint64_t notify_max_backoff_ns{5'000'000'000};
    std::size_t notify_queue_capacity{1024};
};

[[nodiscard]] inline EngineConfig default_engine_config() { return EngineConfig{}; }

// Rejects configurations the engine must refuse to start with: thresholds
// outside [0,1], all-zero or negative severity weights, empty SLA windows,
// malformed or ambiguous precedence tables, duplicate delegation rules and
// conflicting bucket mappings.
bool validate_engine_config(const EngineConfig& cfg, std::string& error);

// Highest configured level.
[[nodiscard]] inline std::uint32_t max_escalation_level(const EngineConfig& cfg) noexcept {
    return static_cast<std::uint32_t>(cfg.sla_windows_ns.size());
}

} // namespace core
