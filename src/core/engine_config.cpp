#include "core/engine_config.hpp"

#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace core {
namespace {

bool in_unit_range(double v) noexcept { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

} // namespace

bool validate_engine_config(const EngineConfig& cfg, std::string& error) {
    if (!in_unit_range(cfg.similarity_threshold)) {
        error = "similarity_threshold must be within [0,1]";
        return false;
    }
    if (!in_unit_range(cfg.confidence_threshold)) {
        error = "confidence_threshold must be within [0,1]";
        return false;
    }
    if (!in_unit_range(cfg.escalation_level2_severity)) {
        error = "escalation_level2_severity must be within [0,1]";
        return false;
    }

    const auto& w = cfg.severity_weights;
    if (!std::isfinite(w.authority) || !std::isfinite(w.reach) || !std::isfinite(w.urgency) || w.authority < 0.0 ||
        w.reach < 0.0 || w.urgency < 0.0) {
        error = "severity weights must be finite and non-negative";
        return false;
    }
    if (w.authority + w.reach + w.urgency <= 0.0) {
        error = "severity weights must not all be zero";
        return false;
    }
    if (!(cfg.authority_gap_scale > 0.0) || !(cfg.reach_half_saturation > 0.0) || !(cfg.urgency_horizon_days > 0.0)) {
        error = "severity scales must be > 0";
        return false;
    }
    if (cfg.detection_workers == 0) {
        error = "detection_workers must be >= 1";
        return false;
    }
    if (cfg.scorer_timeout_ns == 0) {
        error = "scorer_timeout_ns must be > 0";
        return false;
    }

    if (cfg.sla_windows_ns.empty()) {
        error = "sla_windows must name at least one level";
        return false;
    }
    for (std::size_t i = 0; i < cfg.sla_windows_ns.size(); ++i) {
        if (cfg.sla_windows_ns[i] == 0) {
            error = "sla window for level " + std::to_string(i + 1) + " is empty";
            return false;
        }
    }
    if (cfg.stakeholders_per_level.size() > cfg.sla_windows_ns.size()) {
        error = "stakeholders configured for a level without an SLA window";
        return false;
    }
    if (cfg.sla_tick_ns == 0) {
        error = "sla_tick_ns must be > 0";
        return false;
    }

    std::map<std::string, std::int32_t> ranks;
    for (const auto& entry : cfg.precedence) {
        if (entry.jurisdiction.empty()) {
            error = "precedence entry with empty jurisdiction";
            return false;
        }
        if (!ranks.emplace(entry.jurisdiction, entry.rank).second) {
            error = "ambiguous precedence: jurisdiction '" + entry.jurisdiction + "' listed twice";
            return false;
        }
    }

    std::set<std::pair<std::string, std::string>> delegation_keys;
    for (const auto& rule : cfg.delegation_rules) {
        if (rule.topic.empty() || rule.jurisdiction.empty() || rule.delegate.empty()) {
            error = "delegation rule must name topic, jurisdiction and delegate";
            return false;
        }
        if (!delegation_keys.emplace(rule.topic, rule.jurisdiction).second) {
            error = "duplicate delegation rule for " + rule.topic + "/" + rule.jurisdiction;
            return false;
        }
    }

    std::map<std::string, std::string> buckets;
    for (const auto& entry : cfg.jurisdiction_buckets) {
        if (entry.jurisdiction.empty() || entry.bucket.empty()) {
            error = "jurisdiction bucket entry must name jurisdiction and bucket";
            return false;
        }
        auto [it, inserted] = buckets.emplace(entry.jurisdiction, entry.bucket);
        if (!inserted && it->second != entry.bucket) {
            error = "jurisdiction '" + entry.jurisdiction + "' mapped to two buckets";
            return false;
        }
    }

    if (cfg.resolver_lease_attempts == 0 || cfg.cas_attempts == 0) {
        error = "retry bounds must be >= 1";
        return false;
    }
    if (!std::isfinite(cfg.history_weight) || cfg.history_weight < 0.0 || !(cfg.history_pseudo_count > 0.0)) {
        error = "history_weight must be >= 0 and history_pseudo_count > 0";
        return false;
    }
    if (cfg.notify_max_attempts == 0 || cfg.notify_queue_capacity == 0) {
        error = "notification retry bound and queue capacity must be >= 1";
        return false;
    }
    if (cfg.notify_initial_backoff_ns > cfg.notify_max_backoff_ns) {
        error = "notify_initial_backoff_ns exceeds notify_max_backoff_ns";
        return false;
    }
    return true;
}

} // namespace core
