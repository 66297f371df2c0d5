#include "core/similarity.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace core {
namespace {

std::set<std::string> tokens_of(const NormativeProvision& p) {
    std::set<std::string> out(p.topic_tags.begin(), p.topic_tags.end());
    std::string cur;
    for (char ch : p.obligation) {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch)) {
            cur.push_back(static_cast<char>(std::tolower(uch)));
        } else if (!cur.empty()) {
            out.insert(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) {
        out.insert(cur);
    }
    return out;
}

struct PendingScore {
    std::promise<std::optional<SimilarityScore>> promise;
    NormativeProvision a;
    NormativeProvision b;
};

} // namespace

std::optional<SimilarityScore> TokenOverlapScorer::score(const NormativeProvision& a, const NormativeProvision& b) {
    const auto ta = tokens_of(a);
    const auto tb = tokens_of(b);
    if (ta.empty() && tb.empty()) {
        return SimilarityScore{0.0, 0.0};
    }
    std::size_t shared = 0;
    for (const auto& t : ta) {
        shared += tb.count(t);
    }
    const std::size_t uni = ta.size() + tb.size() - shared;
    const double jaccard = static_cast<double>(shared) / static_cast<double>(uni);
    // Few tokens make the overlap estimate noisy.
    const double confidence = std::min(1.0, static_cast<double>(std::min(ta.size(), tb.size())) / 8.0);
    return SimilarityScore{jaccard, confidence};
}

BoundedSimilarityScorer::BoundedSimilarityScorer(std::shared_ptr<SimilarityScorer> inner, std::uint64_t timeout_ns,
                                                 std::size_t max_in_flight)
    : inner_(std::move(inner)),
      timeout_ns_(timeout_ns),
      max_in_flight_(max_in_flight),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0)) {
    if (!inner_) {
        throw std::invalid_argument("BoundedSimilarityScorer requires a scorer");
    }
    if (timeout_ns_ == 0 || max_in_flight_ == 0) {
        throw std::invalid_argument("BoundedSimilarityScorer timeout and max_in_flight must be > 0");
    }
}

std::optional<SimilarityScore> BoundedSimilarityScorer::score(const NormativeProvision& a,
                                                              const NormativeProvision& b) {
    calls_.fetch_add(1, std::memory_order_relaxed);
    if (in_flight_->fetch_add(1, std::memory_order_acq_rel) >= max_in_flight_) {
        in_flight_->fetch_sub(1, std::memory_order_acq_rel);
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    auto pending = std::make_shared<PendingScore>();
    pending->a = a;
    pending->b = b;
    auto fut = pending->promise.get_future();

    try {
        std::thread([pending, inner = inner_, counter = in_flight_] {
            try {
                pending->promise.set_value(inner->score(pending->a, pending->b));
            } catch (const std::exception&) {
                pending->promise.set_value(std::nullopt);
            }
            counter->fetch_sub(1, std::memory_order_acq_rel);
        }).detach();
    } catch (const std::system_error&) {
        in_flight_->fetch_sub(1, std::memory_order_acq_rel);
        unavailable_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    if (fut.wait_for(std::chrono::nanoseconds(timeout_ns_)) != std::future_status::ready) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    auto result = fut.get();
    if (!result) {
        unavailable_.fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

BoundedSimilarityScorer::Stats BoundedSimilarityScorer::stats() const noexcept {
    Stats s{};
    s.calls = calls_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.unavailable = unavailable_.load(std::memory_order_relaxed);
    s.rejected_in_flight = rejected_.load(std::memory_order_relaxed);
    return s;
}

} // namespace core
