#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/provision.hpp"

namespace core {

// (topic, jurisdiction) bucket. An empty jurisdiction is the per-topic
// unscoped bucket holding provisions that carry no jurisdiction tags.
struct BucketKey {
    std::string topic{};
    std::string jurisdiction{};

    bool unscoped() const noexcept { return jurisdiction.empty(); }

    bool operator==(const BucketKey&) const = default;
    auto operator<=>(const BucketKey&) const = default;
};

// Provisions keyed by id plus the bucket membership the detector scans.
// Member lists are kept sorted by id. Not thread-safe for writers; concurrent
// readers are fine once writes stop.
class ProvisionIndex {
public:
    // Returns true when the provision is new or its fingerprint changed. The
    // stored copy is normalized.
    bool upsert(NormativeProvision p);
    bool remove(const ProvisionId& id);
    void clear();

    const NormativeProvision* find(const ProvisionId& id) const;
    std::uint64_t fingerprint(const ProvisionId& id) const;
    std::size_t size() const noexcept { return provisions_.size(); }

    const std::map<BucketKey, std::vector<ProvisionId>>& buckets() const noexcept { return buckets_; }
    const std::vector<ProvisionId>& topic_members(const std::string& topic) const;

    // Every other provision sharing a bucket with p, or a topic when either
    // side is unscoped. Sorted, without p itself.
    std::vector<ProvisionId> neighbours(const NormativeProvision& p) const;

    static std::vector<BucketKey> buckets_of(const NormativeProvision& p);

    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [id, entry] : provisions_) {
            fn(entry.provision);
        }
    }

private:
    struct Entry {
        NormativeProvision provision;
        std::uint64_t fingerprint{0};
    };

    void link(const NormativeProvision& p);
    void unlink(const NormativeProvision& p);

    std::unordered_map<ProvisionId, Entry> provisions_;
    std::map<BucketKey, std::vector<ProvisionId>> buckets_;
    std::map<std::string, std::vector<ProvisionId>> by_topic_;
};

} // namespace core
