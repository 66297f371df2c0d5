#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/conflict_engine.hpp"
#include "core/conflict_store.hpp"
#include "core/provision.hpp"
#include "util/clock.hpp"
#include "util/time.hpp"

namespace {

// Provisions spread over a few topics and jurisdictions so that a share of the
// pairs in each bucket overlap in time with opposing polarity.
std::vector<core::NormativeProvision> make_provisions(std::size_t n) {
    static const char* topics[] = {"data-retention", "breach-notification", "kyc", "reporting"};
    static const char* jurisdictions[] = {"EU", "DE", "FR", "US"};
    std::vector<core::NormativeProvision> out;
    out.reserve(n);
    const util::CivilDay base = util::days_from_civil(2024, 1, 1);
    for (std::size_t i = 0; i < n; ++i) {
        core::NormativeProvision p{};
        p.id = "P" + std::to_string(i);
        p.framework_id = "F" + std::to_string(i % 7);
        p.jurisdiction = {jurisdictions[i % 4]};
        p.authority_level = static_cast<std::int32_t>(i % 3);
        p.effective_date = base + static_cast<util::CivilDay>(i % 90);
        p.polarity = (i % 2 == 0) ? core::Polarity::Requires : core::Polarity::Prohibits;
        p.topic_tags = {topics[i % 4]};
        p.obligation = std::string("retain records for ") + topics[i % 4];
        p.entity_count = 100 + i;
        core::normalize_provision(p);
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t n = argc > 1 ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 2000;
    const auto provisions = make_provisions(n);

    util::ManualClock clock(util::start_of_day_ns(util::days_from_civil(2024, 6, 1)));
    core::InMemoryConflictStore store;
    core::ConflictEngine engine(core::default_engine_config(), store, clock);
    const core::ResolutionContext ctx{};

    auto start = std::chrono::steady_clock::now();
    const auto full = engine.run_cycle(provisions, ctx);
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Full cycle over " << n << " provisions: pairs=" << full.detection.pairs_evaluated
              << " conflicts=" << full.detected_conflicts << " took " << ns << " ns ("
              << (full.detection.pairs_evaluated ? ns / static_cast<long long>(full.detection.pairs_evaluated) : 0)
              << " ns/pair)\n";

    std::vector<core::NormativeProvision> delta(provisions.begin(), provisions.begin() + std::min<std::size_t>(n, 10));
    for (auto& p : delta) {
        p.authority_level += 1;
    }
    start = std::chrono::steady_clock::now();
    const auto inc = engine.run_incremental(delta, ctx);
    end = std::chrono::steady_clock::now();
    ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Incremental pass over " << delta.size() << " changed provisions: pairs="
              << inc.detection.pairs_evaluated << " took " << ns << " ns\n";
    return 0;
}
