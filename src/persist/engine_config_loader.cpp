#include "persist/engine_config_loader.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "persist/json_cursor.hpp"

namespace persist {
namespace {

constexpr std::uint64_t kNanosPerMilli = 1'000'000ull;

bool read_ms(JsonCursor& cur, std::uint64_t& out_ns, std::string& error) {
    auto v = cur.parse_uint64(error);
    if (!v) {
        return false;
    }
    out_ns = *v * kNanosPerMilli;
    return true;
}

bool read_double(JsonCursor& cur, double& out, std::string& error) {
    auto v = cur.parse_double(error);
    if (!v) {
        return false;
    }
    out = *v;
    return true;
}

template <typename T>
bool read_uint(JsonCursor& cur, T& out, std::string& error) {
    auto v = cur.parse_uint64(error);
    if (!v) {
        return false;
    }
    out = static_cast<T>(*v);
    return true;
}

bool parse_weights(JsonCursor& cur, core::SeverityWeights& w, std::string& error) {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "authority") return read_double(cur, w.authority, error);
        if (key == "reach") return read_double(cur, w.reach, error);
        if (key == "urgency") return read_double(cur, w.urgency, error);
        error = "unknown severity_weights field: " + key;
        return false;
    });
}

bool parse_precedence(JsonCursor& cur, std::vector<core::PrecedenceEntry>& out, std::string& error) {
    return parse_array(cur, error, [&] {
        core::PrecedenceEntry e{};
        bool have_j = false;
        bool have_rank = false;
        const bool ok = parse_object(cur, error, [&](const std::string& key) {
            if (key == "jurisdiction") {
                auto v = cur.parse_string(error);
                if (!v) return false;
                e.jurisdiction = std::move(*v);
                have_j = true;
                return true;
            }
            if (key == "rank") {
                auto v = cur.parse_int64(error);
                if (!v) return false;
                e.rank = static_cast<std::int32_t>(*v);
                have_rank = true;
                return true;
            }
            error = "unknown precedence field: " + key;
            return false;
        });
        if (!ok) return false;
        if (!have_j || !have_rank) {
            error = "precedence entry missing jurisdiction or rank";
            return false;
        }
        out.push_back(std::move(e));
        return true;
    });
}

bool parse_delegation(JsonCursor& cur, std::vector<core::DelegationRule>& out, std::string& error) {
    return parse_array(cur, error, [&] {
        core::DelegationRule r{};
        const bool ok = parse_object(cur, error, [&](const std::string& key) {
            std::string* target = nullptr;
            if (key == "topic") target = &r.topic;
            else if (key == "jurisdiction") target = &r.jurisdiction;
            else if (key == "delegate") target = &r.delegate;
            if (!target) {
                error = "unknown delegation_rules field: " + key;
                return false;
            }
            auto v = cur.parse_string(error);
            if (!v) return false;
            *target = std::move(*v);
            return true;
        });
        if (!ok) return false;
        out.push_back(std::move(r));
        return true;
    });
}

bool parse_buckets(JsonCursor& cur, std::vector<core::JurisdictionBucketEntry>& out, std::string& error) {
    return parse_array(cur, error, [&] {
        core::JurisdictionBucketEntry e{};
        const bool ok = parse_object(cur, error, [&](const std::string& key) {
            std::string* target = nullptr;
            if (key == "jurisdiction") target = &e.jurisdiction;
            else if (key == "bucket") target = &e.bucket;
            if (!target) {
                error = "unknown jurisdiction_buckets field: " + key;
                return false;
            }
            auto v = cur.parse_string(error);
            if (!v) return false;
            *target = std::move(*v);
            return true;
        });
        if (!ok) return false;
        out.push_back(std::move(e));
        return true;
    });
}

bool parse_windows(JsonCursor& cur, std::vector<std::uint64_t>& out, std::string& error) {
    out.clear();
    return parse_array(cur, error, [&] {
        std::uint64_t ns = 0;
        if (!read_ms(cur, ns, error)) return false;
        out.push_back(ns);
        return true;
    });
}

bool parse_stakeholders(JsonCursor& cur, std::vector<std::vector<std::string>>& out, std::string& error) {
    out.clear();
    return parse_array(cur, error, [&] {
        std::vector<std::string> level;
        if (!parse_string_array(cur, level, error)) return false;
        out.push_back(std::move(level));
        return true;
    });
}

bool parse_field(JsonCursor& cur, const std::string& key, core::EngineConfig& c, std::string& error) {
    if (key == "similarity_threshold") return read_double(cur, c.similarity_threshold, error);
    if (key == "severity_weights") return parse_weights(cur, c.severity_weights, error);
    if (key == "authority_gap_scale") return read_double(cur, c.authority_gap_scale, error);
    if (key == "reach_half_saturation") return read_double(cur, c.reach_half_saturation, error);
    if (key == "urgency_horizon_days") return read_double(cur, c.urgency_horizon_days, error);
    if (key == "detection_workers") return read_uint(cur, c.detection_workers, error);
    if (key == "scorer_timeout_ms") return read_ms(cur, c.scorer_timeout_ns, error);

    if (key == "confidence_threshold") return read_double(cur, c.confidence_threshold, error);
    if (key == "harmonization_policy") {
        auto v = cur.parse_string(error);
        if (!v) return false;
        auto policy = harmonization_policy_from_string(*v);
        if (!policy) {
            error = "unknown harmonization_policy: " + *v;
            return false;
        }
        c.harmonization_policy = *policy;
        return true;
    }
    if (key == "precedence") {
        c.precedence.clear();
        return parse_precedence(cur, c.precedence, error);
    }
    if (key == "delegation_rules") {
        c.delegation_rules.clear();
        return parse_delegation(cur, c.delegation_rules, error);
    }
    if (key == "jurisdiction_buckets") {
        c.jurisdiction_buckets.clear();
        return parse_buckets(cur, c.jurisdiction_buckets, error);
    }
    if (key == "resolver_lease_attempts") return read_uint(cur, c.resolver_lease_attempts, error);
    if (key == "resolver_backoff_ms") return read_ms(cur, c.resolver_backoff_ns, error);
    if (key == "cas_attempts") return read_uint(cur, c.cas_attempts, error);

    if (key == "escalation_level2_severity") return read_double(cur, c.escalation_level2_severity, error);
    if (key == "sla_windows_ms") return parse_windows(cur, c.sla_windows_ns, error);
    if (key == "stakeholders_per_level") return parse_stakeholders(cur, c.stakeholders_per_level, error);
    if (key == "sla_tick_ms") return read_ms(cur, c.sla_tick_ns, error);

    if (key == "history_weight") return read_double(cur, c.history_weight, error);
    if (key == "history_pseudo_count") return read_double(cur, c.history_pseudo_count, error);
    if (key == "analytics_commit_interval_ms") return read_ms(cur, c.analytics_commit_interval_ns, error);

    if (key == "notify_max_attempts") return read_uint(cur, c.notify_max_attempts, error);
    if (key == "notify_initial_backoff_ms") return read_ms(cur, c.notify_initial_backoff_ns, error);
    if (key == "notify_max_backoff_ms") return read_ms(cur, c.notify_max_backoff_ns, error);
    if (key == "notify_queue_capacity") return read_uint(cur, c.notify_queue_capacity, error);

    error = "unknown field: " + key;
    return false;
}

} // namespace

std::optional<core::HarmonizationPolicy> harmonization_policy_from_string(std::string_view s) noexcept {
    if (s == "most_restrictive") return core::HarmonizationPolicy::MostRestrictive;
    if (s == "least_restrictive") return core::HarmonizationPolicy::LeastRestrictive;
    if (s == "escalate") return core::HarmonizationPolicy::Escalate;
    return std::nullopt;
}

bool parse_engine_config(std::string_view json, core::EngineConfig& cfg, std::string& error) noexcept {
    core::EngineConfig candidate = cfg;
    JsonCursor cur(json);
    const bool ok = parse_object(cur, error, [&](const std::string& key) {
        return parse_field(cur, key, candidate, error);
    });
    if (!ok) {
        return false;
    }
    if (!cur.eof()) {
        error = cur.at("trailing content");
        return false;
    }
    if (!core::validate_engine_config(candidate, error)) {
        return false;
    }
    cfg = std::move(candidate);
    return true;
}

bool load_engine_config(const std::filesystem::path& path, core::EngineConfig& cfg, std::string& error) noexcept {
    std::string contents;
    if (!read_text_file(path, contents, error)) {
        return false;
    }
    if (!parse_engine_config(contents, cfg, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace persist
