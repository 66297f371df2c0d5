#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "core/conflict_analysis.hpp"
#include "core/conflict_engine.hpp"
#include "core/conflict_graph.hpp"
#include "core/conflict_store.hpp"
#include "core/similarity.hpp"
#include "ingest/provision_loader.hpp"
#include "notify/log_notifier.hpp"
#include "notify/notification_dispatcher.hpp"
#include "persist/engine_config_loader.hpp"
#include "persist/journal_reader.hpp"
#include "persist/journal_writer.hpp"
#include "util/async_log.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --provisions <file> [options]\n"
              << "Options:\n"
              << "  --config <file>         Engine configuration (JSON)\n"
              << "  --context <a,b,...>     Declared context flags for conditional resolution\n"
              << "  --journal <dir>         Append outcomes to a journal and warm-start analytics from it\n"
              << "  --top <N>               Rows per report section (default 10)\n"
              << "  --no-semantic           Skip the semantic check\n"
              << "  --verbose               Engine log at debug level\n";
}

std::vector<std::string> split_flags(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

void print_report(const core::CycleReport& report, core::ConflictEngine& engine, std::size_t top) {
    const auto& d = report.detection;
    std::printf("detection: pairs=%llu temporal=%llu jurisdictional=%llu hierarchical=%llu semantic=%llu "
                "semantic_skipped=%llu data_quality_skips=%llu\n",
                static_cast<unsigned long long>(d.pairs_evaluated), static_cast<unsigned long long>(d.temporal_hits),
                static_cast<unsigned long long>(d.jurisdictional_hits),
                static_cast<unsigned long long>(d.hierarchical_hits), static_cast<unsigned long long>(d.semantic_hits),
                static_cast<unsigned long long>(d.semantic_skipped),
                static_cast<unsigned long long>(d.data_quality_skips));
    std::printf("resolution: attempted=%zu resolved=%zu escalated=%zu already_handled=%zu contended=%zu\n",
                report.attempted, report.resolved, report.escalated, report.already_handled, report.contended);

    for (const auto& r : report.reports) {
        if (!r.record) {
            continue;
        }
        const auto& rec = *r.record;
        std::printf("  conflict=%llu %s strategy=%s reason=%s confidence=%.3f winner=%s\n",
                    static_cast<unsigned long long>(rec.conflict_id), core::to_string(r.status),
                    core::to_string(core::kind_of(rec.strategy)), core::to_string(rec.rationale.reason), rec.confidence,
                    rec.rationale.winner ? rec.rationale.winner->c_str() : "-");
    }

    core::ConflictGraph graph;
    graph.build(engine.store().list([](const core::Conflict&) { return true; }));
    std::printf("graph: provisions=%zu conflicts=%zu\n", graph.node_count(), graph.edge_count());
    for (const auto& c : graph.most_severe(top)) {
        const auto analysis = core::analyze_conflict(c);
        std::printf("  severe conflict=%llu %s %s <-> %s severity=%.3f status=%s impact=%s complexity=%s\n",
                    static_cast<unsigned long long>(c.id), core::to_string(c.type), c.pair.a.c_str(),
                    c.pair.b.c_str(), c.severity, core::to_string(c.status), analysis.impact,
                    core::to_string(analysis.complexity));
        for (const auto& r : analysis.recommendations) {
            std::printf("    recommend: %s\n", r.c_str());
        }
    }
    for (const auto& n : graph.most_central(top)) {
        std::printf("  central provision=%s conflicts=%zu centrality=%.3f\n", n.provision.c_str(), n.conflict_count,
                    n.centrality);
    }
    for (const auto& cluster : graph.clusters()) {
        std::printf("  cluster=%zu provisions=%zu conflicts=%zu priority=%.3f\n", cluster.index,
                    cluster.provisions.size(), cluster.conflicts.size(), cluster.priority);
    }

    core::CaseQuery open_cases;
    open_cases.statuses = {core::EscalationStatus::Open, core::EscalationStatus::Acknowledged,
                           core::EscalationStatus::InReview};
    for (const auto& c : engine.query().cases(open_cases)) {
        std::printf("  escalation case=%llu conflict=%llu level=%u reason=%s\n", static_cast<unsigned long long>(c.id),
                    static_cast<unsigned long long>(c.conflict_id), c.level, core::to_string(c.reason));
    }
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path provisions_path;
    std::filesystem::path config_path;
    std::filesystem::path journal_dir;
    core::ResolutionContext ctx;
    std::size_t top = 10;
    bool semantic = true;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--provisions" && i + 1 < argc) {
            provisions_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--context" && i + 1 < argc) {
            ctx.declared_context = split_flags(argv[++i]);
        } else if (arg == "--journal" && i + 1 < argc) {
            journal_dir = argv[++i];
        } else if (arg == "--top" && i + 1 < argc) {
            top = static_cast<std::size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (arg == "--no-semantic") {
            semantic = false;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (provisions_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::EngineConfig cfg = core::default_engine_config();
    std::string error;
    if (!config_path.empty() && !persist::load_engine_config(config_path, cfg, error)) {
        LOG_SLOW_ERROR("config rejected: %s", error.c_str());
        return 2;
    }
    if (!core::validate_engine_config(cfg, error)) {
        LOG_SLOW_ERROR("config rejected: %s", error.c_str());
        return 2;
    }

    std::vector<core::NormativeProvision> provisions;
    if (!ingest::load_provisions(provisions_path, provisions, error)) {
        LOG_SLOW_ERROR("provisions rejected: %s", error.c_str());
        return 2;
    }

    util::AsyncLogger::Config log_cfg{};
    log_cfg.min_level = verbose ? util::LogLevel::Debug : util::LogLevel::Info;
    if (!util::init_engine_logger(log_cfg)) {
        LOG_SLOW_ERROR("failed to start engine logger");
    }

    persist::JournalCounters journal_counters;
    std::unique_ptr<persist::JournalWriter> journal;
    std::vector<core::OutcomeEvent> history;
    if (!journal_dir.empty()) {
        const auto replay = persist::read_journal(journal_dir, &journal_counters);
        history = persist::outcome_events(replay.records);
        LOG_SLOW_INFO("journal: files=%llu records=%llu corrupt=%llu",
                      static_cast<unsigned long long>(replay.stats.files_read),
                      static_cast<unsigned long long>(replay.stats.records_ok),
                      static_cast<unsigned long long>(replay.stats.records_corrupt));
        persist::JournalConfig jcfg{};
        jcfg.output_dir = journal_dir;
        jcfg.sync_on_flush = true;
        journal = std::make_unique<persist::JournalWriter>(journal_counters, jcfg);
        if (!journal->start()) {
            LOG_SLOW_ERROR("failed to start journal writer in %s", journal_dir.string().c_str());
            util::shutdown_engine_logger();
            return 3;
        }
    }

    std::unique_ptr<core::BoundedSimilarityScorer> scorer;
    if (semantic) {
        scorer = std::make_unique<core::BoundedSimilarityScorer>(std::make_shared<core::TokenOverlapScorer>(),
                                                                 cfg.scorer_timeout_ns);
    }
    notify::LogNotifier log_notifier;
    notify::NotificationDispatcher dispatcher(log_notifier, cfg);
    if (!dispatcher.start()) {
        LOG_SLOW_ERROR("failed to start notification dispatcher");
    }

    util::SystemClock clock;
    core::InMemoryConflictStore store;
    int rc = 0;
    {
        core::ConflictEngine engine(cfg, store, clock, scorer.get(), &dispatcher, journal.get());
        if (!history.empty()) {
            const auto merged = engine.analytics().warm_start(history);
            LOG_SLOW_INFO("analytics warm start: %zu outcomes", merged);
        }
        LOG_SLOW_INFO("running detection over %zu provisions", provisions.size());
        const core::CycleReport report = engine.run_cycle(provisions, ctx);
        print_report(report, engine, top);
        rc = report.escalated > 0 ? 10 : 0;
    }

    if (!dispatcher.wait_idle(std::chrono::seconds(5))) {
        LOG_SLOW_WARN("notification dispatcher still busy at shutdown");
    }
    dispatcher.stop();
    if (journal) {
        journal->stop();
    }
    util::shutdown_engine_logger();
    return rc;
}
