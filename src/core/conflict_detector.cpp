#include "core/conflict_detector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include "core/severity.hpp"
#include "util/async_log.hpp"
#include "util/fnv.hpp"

namespace core {
namespace {

std::uint64_t candidate_fingerprint(std::uint64_t fp_a, std::uint64_t fp_b, ConflictType type) noexcept {
    util::Fnv1a64 h;
    h.add_u64(fp_a);
    h.add_u64(fp_b);
    h.add_u64(static_cast<std::uint64_t>(type));
    return h.value();
}

} // namespace

void DetectionCounters::merge(const DetectionCounters& o) noexcept {
    pairs_evaluated += o.pairs_evaluated;
    temporal_hits += o.temporal_hits;
    jurisdictional_hits += o.jurisdictional_hits;
    hierarchical_hits += o.hierarchical_hits;
    semantic_hits += o.semantic_hits;
    semantic_skipped += o.semantic_skipped;
    semantic_disabled += o.semantic_disabled;
    data_quality_skips += o.data_quality_skips;
    inserted += o.inserted;
    updated += o.updated;
    reset += o.reset;
    unchanged += o.unchanged;
}

bool DetectionScope::matches(const NormativeProvision& p) const {
    if (!frameworks.empty() && std::find(frameworks.begin(), frameworks.end(), p.framework_id) == frameworks.end()) {
        return false;
    }
    if (!jurisdictions.empty()) {
        const bool any = std::any_of(jurisdictions.begin(), jurisdictions.end(), [&](const std::string& j) {
            return std::binary_search(p.jurisdiction.begin(), p.jurisdiction.end(), j);
        });
        if (!any) {
            return false;
        }
    }
    return true;
}

ConflictDetector::ConflictDetector(ConflictStore& store, const EngineConfig& cfg, SimilarityScorer* scorer,
                                   const util::Clock& clock)
    : store_(store), cfg_(cfg), scorer_(scorer), clock_(clock) {}

std::vector<std::vector<ConflictDetector::PairTask>> ConflictDetector::bucket_tasks(const ProvisionIndex& index) {
    std::vector<std::vector<PairTask>> work;
    for (const auto& [key, members] : index.buckets()) {
        std::vector<PairTask> tasks;
        if (!key.unscoped()) {
            for (std::size_t i = 0; i < members.size(); ++i) {
                const NormativeProvision* a = index.find(members[i]);
                for (std::size_t j = i + 1; j < members.size(); ++j) {
                    const NormativeProvision* b = index.find(members[j]);
                    // Only the lowest shared bucket evaluates the pair.
                    const auto topics = sorted_intersection(a->topic_tags, b->topic_tags);
                    const auto juris = sorted_intersection(a->jurisdiction, b->jurisdiction);
                    if (topics.empty() || juris.empty() || BucketKey{topics.front(), juris.front()} != key) {
                        continue;
                    }
                    tasks.push_back(PairTask{a, b, false});
                }
            }
        } else {
            for (const auto& uid : members) {
                const NormativeProvision* u = index.find(uid);
                for (const auto& oid : index.topic_members(key.topic)) {
                    if (oid == uid) continue;
                    const NormativeProvision* o = index.find(oid);
                    if (o->jurisdiction.empty() && oid < uid) continue; // both unscoped: once
                    const auto topics = sorted_intersection(u->topic_tags, o->topic_tags);
                    if (topics.empty() || topics.front() != key.topic) continue;
                    if (uid < oid) {
                        tasks.push_back(PairTask{u, o, true});
                    } else {
                        tasks.push_back(PairTask{o, u, true});
                    }
                }
            }
        }
        if (!tasks.empty()) {
            work.push_back(std::move(tasks));
        }
    }
    return work;
}

DetectionResult ConflictDetector::detect(const std::vector<NormativeProvision>& provisions,
                                         const std::optional<DetectionScope>& scope) {
    ProvisionIndex index;
    for (const auto& p : provisions) {
        if (scope) {
            NormativeProvision normalized = p;
            normalize_provision(normalized);
            if (!scope->matches(normalized)) continue;
            index.upsert(std::move(normalized));
        } else {
            index.upsert(p);
        }
    }
    return detect_index(index);
}

DetectionResult ConflictDetector::detect_index(const ProvisionIndex& index) {
    {
        std::lock_guard lock(mutex_);
        for (auto it = recheck_.begin(); it != recheck_.end();) {
            if (index.find(it->a) && index.find(it->b)) {
                it = recheck_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return run_tasks(bucket_tasks(index));
}

DetectionResult ConflictDetector::detect_incremental(const std::vector<NormativeProvision>& new_or_changed,
                                                     ProvisionIndex& index) {
    std::vector<ProvisionId> changed;
    for (const auto& p : new_or_changed) {
        if (index.upsert(p)) {
            changed.push_back(p.id);
        }
    }

    std::set<PairKey> pairs;
    for (const auto& id : changed) {
        const NormativeProvision* p = index.find(id);
        for (const auto& other : index.neighbours(*p)) {
            pairs.insert(PairKey::make(id, other));
        }
    }
    {
        std::lock_guard lock(mutex_);
        for (auto it = recheck_.begin(); it != recheck_.end();) {
            if (index.find(it->a) && index.find(it->b)) {
                pairs.insert(*it);
                it = recheck_.erase(it);
            } else {
                ++it;
            }
        }
    }

    const std::size_t workers = std::max<std::size_t>(1, cfg_.detection_workers);
    std::vector<std::vector<PairTask>> work(std::min(workers, std::max<std::size_t>(1, pairs.size())));
    std::size_t n = 0;
    for (const auto& pk : pairs) {
        const NormativeProvision* a = index.find(pk.a);
        const NormativeProvision* b = index.find(pk.b);
        const bool semantic_only = a->jurisdiction.empty() || b->jurisdiction.empty();
        work[n++ % work.size()].push_back(PairTask{a, b, semantic_only});
    }
    return run_tasks(work);
}

DetectionResult ConflictDetector::run_tasks(const std::vector<std::vector<PairTask>>& work) {
    const Timestamp now = clock_.now_ns();
    const util::CivilDay today = util::civil_day_of(now);
    const std::size_t worker_count = std::min<std::size_t>(std::max<std::size_t>(1, cfg_.detection_workers),
                                                           std::max<std::size_t>(1, work.size()));

    std::vector<WorkerState> states(worker_count);
    std::atomic<std::size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&](std::size_t slot) {
        try {
            for (;;) {
                const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                if (i >= work.size()) break;
                for (const auto& task : work[i]) {
                    evaluate_pair(task, today, now, states[slot]);
                }
            }
        } catch (const std::exception&) {
            std::lock_guard lock(failure_mutex);
            if (!failure) failure = std::current_exception();
            next.store(work.size(), std::memory_order_relaxed);
        }
    };

    if (worker_count == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            threads.emplace_back(worker, i);
        }
        for (auto& t : threads) {
            t.join();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    DetectionResult result{};
    std::vector<ConflictId> touched;
    {
        std::lock_guard lock(mutex_);
        for (const auto& s : states) {
            result.counters.merge(s.counters);
            touched.insert(touched.end(), s.touched.begin(), s.touched.end());
            recheck_.insert(s.recheck.begin(), s.recheck.end());
        }
        totals_.merge(result.counters);
    }
    std::sort(touched.begin(), touched.end());
    touched.erase(std::unique(touched.begin(), touched.end()), touched.end());
    result.conflicts.reserve(touched.size());
    for (ConflictId id : touched) {
        if (auto c = store_.get(id)) {
            result.conflicts.push_back(std::move(*c));
        }
    }

    const auto& c = result.counters;
    LOG_WARM_FMT(util::LogLevel::Info, "DETECT",
                 "pass pairs=%llu temporal=%llu juris=%llu hier=%llu semantic=%llu sem_skip=%llu dq_skip=%llu "
                 "ins=%llu upd=%llu reset=%llu same=%llu",
                 static_cast<unsigned long long>(c.pairs_evaluated), static_cast<unsigned long long>(c.temporal_hits),
                 static_cast<unsigned long long>(c.jurisdictional_hits),
                 static_cast<unsigned long long>(c.hierarchical_hits),
                 static_cast<unsigned long long>(c.semantic_hits),
                 static_cast<unsigned long long>(c.semantic_skipped),
                 static_cast<unsigned long long>(c.data_quality_skips), static_cast<unsigned long long>(c.inserted),
                 static_cast<unsigned long long>(c.updated), static_cast<unsigned long long>(c.reset),
                 static_cast<unsigned long long>(c.unchanged));
    return result;
}

void ConflictDetector::evaluate_pair(const PairTask& task, util::CivilDay today, Timestamp now, WorkerState& state) {
    const NormativeProvision& a = *task.a;
    const NormativeProvision& b = *task.b;
    ++state.counters.pairs_evaluated;

    const double severity = compute_severity(a, b, today, cfg_);
    ConflictEvidence base{};
    base.overlap = overlap_window(a, b);
    base.jurisdiction_intersection = sorted_intersection(a.jurisdiction, b.jurisdiction);
    base.authority_gap = a.authority_level - b.authority_level;

    if (!task.semantic_only) {
        if (!a.effective_date || !b.effective_date) {
            ++state.counters.data_quality_skips;
            note_data_quality(a.effective_date ? b : a, "effective_date");
        } else if (base.overlap && !supersession_link(a, b) && a.polarity == b.polarity &&
                   (a.obligation != b.obligation || a.quantity != b.quantity)) {
            emit(a, b, ConflictType::Temporal, severity, base, now, state);
        }

        if (polarities_incompatible(a.polarity, b.polarity)) {
            if (a.authority_level == b.authority_level) {
                emit(a, b, ConflictType::Jurisdictional, severity, base, now, state);
            } else {
                emit(a, b, ConflictType::Hierarchical, severity, base, now, state);
            }
        }
    } else {
        ++state.counters.data_quality_skips;
        note_data_quality(a.jurisdiction.empty() ? a : b, "jurisdiction");
    }

    if (!scorer_) {
        ++state.counters.semantic_disabled;
        return;
    }
    const auto score = scorer_->score(a, b);
    if (!score) {
        ++state.counters.semantic_skipped;
        state.recheck.push_back(PairKey::make(a.id, b.id));
        return;
    }
    if (score->similarity > cfg_.similarity_threshold && a.polarity != b.polarity) {
        ConflictEvidence ev = base;
        ev.similarity = score->similarity;
        ev.similarity_confidence = score->confidence;
        emit(a, b, ConflictType::Semantic, severity, ev, now, state);
    }
}

void ConflictDetector::emit(const NormativeProvision& a, const NormativeProvision& b, ConflictType type,
                            double severity, const ConflictEvidence& evidence, Timestamp now, WorkerState& state) {
    switch (type) {
    case ConflictType::Temporal: ++state.counters.temporal_hits; break;
    case ConflictType::Jurisdictional: ++state.counters.jurisdictional_hits; break;
    case ConflictType::Hierarchical: ++state.counters.hierarchical_hits; break;
    case ConflictType::Semantic: ++state.counters.semantic_hits; break;
    }

    ConflictCandidate c{};
    c.pair = PairKey{a.id, b.id};
    c.type = type;
    c.severity = severity;
    c.evidence = evidence;
    c.framework_a = a.framework_id;
    c.framework_b = b.framework_id;
    c.jurisdictions = sorted_union(a.jurisdiction, b.jurisdiction);
    c.topics = sorted_intersection(a.topic_tags, b.topic_tags);
    c.input_fingerprint = candidate_fingerprint(provision_fingerprint(a), provision_fingerprint(b), type);

    const UpsertResult r = store_.upsert(c, now);
    switch (r.outcome) {
    case UpsertOutcome::Inserted: ++state.counters.inserted; break;
    case UpsertOutcome::Updated: ++state.counters.updated; break;
    case UpsertOutcome::Reset: ++state.counters.reset; break;
    case UpsertOutcome::Unchanged: ++state.counters.unchanged; break;
    }
    state.touched.push_back(r.conflict.id);
}

void ConflictDetector::note_data_quality(const NormativeProvision& p, const char* what) {
    std::lock_guard lock(mutex_);
    if (dq_limiter_.should_log(std::chrono::steady_clock::now())) {
        LOG_WARM_FMT(util::LogLevel::Warn, "DETECT", "provision %s missing %s; check skipped (suppressed=%llu)",
                     p.id.c_str(), what, static_cast<unsigned long long>(dq_limiter_.suppressed()));
    }
}

std::vector<PairKey> ConflictDetector::pending_rechecks() const {
    std::lock_guard lock(mutex_);
    return std::vector<PairKey>(recheck_.begin(), recheck_.end());
}

DetectionCounters ConflictDetector::counters() const {
    std::lock_guard lock(mutex_);
    return totals_;
}

} // namespace core
