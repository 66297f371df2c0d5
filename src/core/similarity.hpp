#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "core/provision.hpp"

namespace core {

struct SimilarityScore {
    double similarity{0.0};
    double confidence{0.0};
};

// External semantic scorer. nullopt means "unavailable", never "dissimilar".
// Implementations must tolerate calls from several detection workers at once.
class SimilarityScorer {
public:
    virtual ~SimilarityScorer() = default;
    virtual std::optional<SimilarityScore> score(const NormativeProvision& a, const NormativeProvision& b) = 0;
};

// Token Jaccard over topic tags and obligation words. Used by the batch tool
// when no model-backed scorer is wired in.
class TokenOverlapScorer final : public SimilarityScorer {
public:
    std::optional<SimilarityScore> score(const NormativeProvision& a, const NormativeProvision& b) override;
};

// Bounds every call to the wrapped scorer by a timeout. The call runs on a
// detached worker holding shared ownership of its inputs, so a hung scorer
// costs a thread, never a stalled detection pass. Calls beyond
// max_in_flight are reported unavailable immediately.
class BoundedSimilarityScorer final : public SimilarityScorer {
public:
    struct Stats {
        std::uint64_t calls{0};
        std::uint64_t timeouts{0};
        std::uint64_t unavailable{0};
        std::uint64_t rejected_in_flight{0};
    };

    BoundedSimilarityScorer(std::shared_ptr<SimilarityScorer> inner, std::uint64_t timeout_ns,
                            std::size_t max_in_flight = 64);

    std::optional<SimilarityScore> score(const NormativeProvision& a, const NormativeProvision& b) override;

    Stats stats() const noexcept;
    std::size_t in_flight() const noexcept { return in_flight_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<SimilarityScorer> inner_;
    std::uint64_t timeout_ns_;
    std::size_t max_in_flight_;
    std::shared_ptr<std::atomic<std::size_t>> in_flight_;

    std::atomic<std::uint64_t> calls_{0};
    std::atomic<std::uint64_t> timeouts_{0};
    std::atomic<std::uint64_t> unavailable_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace core
