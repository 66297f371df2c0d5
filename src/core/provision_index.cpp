#include "core/provision_index.hpp"

#include <algorithm>
#include <utility>

namespace core {
namespace {

void insert_sorted(std::vector<ProvisionId>& v, const ProvisionId& id) {
    auto it = std::lower_bound(v.begin(), v.end(), id);
    if (it == v.end() || *it != id) {
        v.insert(it, id);
    }
}

void erase_sorted(std::vector<ProvisionId>& v, const ProvisionId& id) {
    auto it = std::lower_bound(v.begin(), v.end(), id);
    if (it != v.end() && *it == id) {
        v.erase(it);
    }
}

const std::vector<ProvisionId> kNoMembers{};

} // namespace

std::vector<BucketKey> ProvisionIndex::buckets_of(const NormativeProvision& p) {
    std::vector<BucketKey> out;
    for (const auto& topic : p.topic_tags) {
        if (p.jurisdiction.empty()) {
            out.push_back(BucketKey{topic, {}});
            continue;
        }
        for (const auto& j : p.jurisdiction) {
            out.push_back(BucketKey{topic, j});
        }
    }
    return out;
}

void ProvisionIndex::link(const NormativeProvision& p) {
    for (const auto& key : buckets_of(p)) {
        insert_sorted(buckets_[key], p.id);
    }
    for (const auto& topic : p.topic_tags) {
        insert_sorted(by_topic_[topic], p.id);
    }
}

void ProvisionIndex::unlink(const NormativeProvision& p) {
    for (const auto& key : buckets_of(p)) {
        auto it = buckets_.find(key);
        if (it == buckets_.end()) continue;
        erase_sorted(it->second, p.id);
        if (it->second.empty()) {
            buckets_.erase(it);
        }
    }
    for (const auto& topic : p.topic_tags) {
        auto it = by_topic_.find(topic);
        if (it == by_topic_.end()) continue;
        erase_sorted(it->second, p.id);
        if (it->second.empty()) {
            by_topic_.erase(it);
        }
    }
}

bool ProvisionIndex::upsert(NormativeProvision p) {
    normalize_provision(p);
    const std::uint64_t fp = provision_fingerprint(p);
    auto it = provisions_.find(p.id);
    if (it != provisions_.end()) {
        if (it->second.fingerprint == fp) {
            return false;
        }
        unlink(it->second.provision);
        it->second.provision = std::move(p);
        it->second.fingerprint = fp;
        link(it->second.provision);
        return true;
    }
    ProvisionId id = p.id;
    auto [ins, inserted] = provisions_.emplace(std::move(id), Entry{std::move(p), fp});
    link(ins->second.provision);
    return inserted;
}

bool ProvisionIndex::remove(const ProvisionId& id) {
    auto it = provisions_.find(id);
    if (it == provisions_.end()) {
        return false;
    }
    unlink(it->second.provision);
    provisions_.erase(it);
    return true;
}

void ProvisionIndex::clear() {
    provisions_.clear();
    buckets_.clear();
    by_topic_.clear();
}

const NormativeProvision* ProvisionIndex::find(const ProvisionId& id) const {
    auto it = provisions_.find(id);
    return it == provisions_.end() ? nullptr : &it->second.provision;
}

std::uint64_t ProvisionIndex::fingerprint(const ProvisionId& id) const {
    auto it = provisions_.find(id);
    return it == provisions_.end() ? 0 : it->second.fingerprint;
}

const std::vector<ProvisionId>& ProvisionIndex::topic_members(const std::string& topic) const {
    auto it = by_topic_.find(topic);
    return it == by_topic_.end() ? kNoMembers : it->second;
}

std::vector<ProvisionId> ProvisionIndex::neighbours(const NormativeProvision& p) const {
    std::vector<ProvisionId> out;
    for (const auto& topic : p.topic_tags) {
        for (const auto& id : topic_members(topic)) {
            if (id == p.id) continue;
            const NormativeProvision* other = find(id);
            if (!other) continue;
            if (p.jurisdiction.empty() || other->jurisdiction.empty() ||
                sorted_intersects(p.jurisdiction, other->jurisdiction)) {
                out.push_back(id);
            }
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace core
