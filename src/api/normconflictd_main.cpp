#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <Aeron.h>

#include "core/conflict_engine.hpp"
#include "core/conflict_store.hpp"
#include "core/similarity.hpp"
#include "ingest/provision_loader.hpp"
#include "notify/aeron_publication.hpp"
#include "notify/notification_dispatcher.hpp"
#include "notify/publication_notifier.hpp"
#include "persist/engine_config_loader.hpp"
#include "persist/journal_reader.hpp"
#include "persist/journal_writer.hpp"
#include "util/async_log.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --provisions-dir <dir> --journal <dir> --channel <aeron> --stream <id> [options]\n"
              << "Options:\n"
              << "  --config <file>         Engine configuration (JSON)\n"
              << "  --poll-ms <N>           Provision directory poll interval (default 1000)\n"
              << "Set NORMCONFLICTD_RUN_MS to stop after a fixed duration instead of waiting for Enter.\n";
}

using FileStamps = std::map<std::filesystem::path, std::filesystem::file_time_type>;

// Provision files that are new or modified since the last scan.
std::vector<std::filesystem::path> changed_files(const std::filesystem::path& dir, FileStamps& stamps) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        const auto mtime = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        auto it = stamps.find(entry.path());
        if (it == stamps.end() || it->second != mtime) {
            stamps[entry.path()] = mtime;
            out.push_back(entry.path());
        }
    }
    if (ec) {
        LOG_SLOW_WARN("cannot scan %s: %s", dir.string().c_str(), ec.message().c_str());
    }
    return out;
}

void run_watch_loop(core::ConflictEngine& engine, const std::filesystem::path& dir, std::chrono::milliseconds poll,
                    const std::atomic<bool>& stop_flag) {
    const core::ResolutionContext ctx{};
    FileStamps stamps;
    bool first = true;
    while (!stop_flag.load(std::memory_order_acquire)) {
        const auto files = changed_files(dir, stamps);
        std::vector<core::NormativeProvision> batch;
        for (const auto& path : files) {
            std::vector<core::NormativeProvision> loaded;
            std::string error;
            if (!ingest::load_provisions(path, loaded, error)) {
                LOG_SLOW_WARN("skipping provision file: %s", error.c_str());
                continue;
            }
            batch.insert(batch.end(), std::make_move_iterator(loaded.begin()), std::make_move_iterator(loaded.end()));
        }
        if (first || !batch.empty()) {
            const core::CycleReport report = first ? engine.run_cycle(batch, ctx) : engine.run_incremental(batch, ctx);
            LOG_SLOW_INFO("%s cycle provisions=%zu conflicts=%zu resolved=%zu escalated=%zu contended=%zu",
                          first ? "full" : "incremental", batch.size(), report.detected_conflicts, report.resolved,
                          report.escalated, report.contended);
            first = false;
        }
        const auto deadline = std::chrono::steady_clock::now() + poll;
        while (!stop_flag.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    std::filesystem::path provisions_dir;
    std::filesystem::path journal_dir;
    std::filesystem::path config_path;
    std::string channel;
    std::int32_t stream_id = -1;
    auto poll = std::chrono::milliseconds{1000};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--provisions-dir" && i + 1 < argc) {
            provisions_dir = argv[++i];
        } else if (arg == "--journal" && i + 1 < argc) {
            journal_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--channel" && i + 1 < argc) {
            channel = argv[++i];
        } else if (arg == "--stream" && i + 1 < argc) {
            stream_id = static_cast<std::int32_t>(std::strtol(argv[++i], nullptr, 10));
        } else if (arg == "--poll-ms" && i + 1 < argc) {
            poll = std::chrono::milliseconds{std::strtoul(argv[++i], nullptr, 10)};
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }
    if (provisions_dir.empty() || journal_dir.empty() || channel.empty() || stream_id < 0) {
        print_usage(argv[0]);
        return 1;
    }

    core::EngineConfig cfg = core::default_engine_config();
    std::string error;
    if (!config_path.empty() && !persist::load_engine_config(config_path, cfg, error)) {
        LOG_SLOW_FATAL("config rejected: %s", error.c_str());
        return 2;
    }
    if (!core::validate_engine_config(cfg, error)) {
        LOG_SLOW_FATAL("config rejected: %s", error.c_str());
        return 2;
    }

    util::AsyncLogger::Config log_cfg{};
    log_cfg.capacity_pow2 = 1u << 15;
    if (!util::init_engine_logger(log_cfg)) {
        LOG_SLOW_ERROR("failed to start engine logger for normconflictd");
    }

    std::atomic<bool> stop_flag{false};

    aeron::Context context;
    auto client = aeron::Aeron::connect(context);
    auto publication = notify::make_aeron_publication(client, channel, stream_id, std::chrono::seconds(10), stop_flag);
    if (!publication) {
        LOG_SLOW_FATAL("publication %s stream=%d not available", channel.c_str(), stream_id);
        util::shutdown_engine_logger();
        return 3;
    }
    notify::PublicationNotifier publisher(publication);
    notify::NotificationDispatcher dispatcher(publisher, cfg);

    persist::JournalCounters journal_counters;
    const auto replay = persist::read_journal(journal_dir, &journal_counters);
    const auto history = persist::outcome_events(replay.records);
    persist::JournalConfig jcfg{};
    jcfg.output_dir = journal_dir;
    persist::JournalWriter journal(journal_counters, jcfg);

    if (!dispatcher.start() || !journal.start()) {
        LOG_SLOW_FATAL("failed to start dispatcher or journal writer");
        dispatcher.stop();
        util::shutdown_engine_logger();
        return 3;
    }

    core::BoundedSimilarityScorer scorer(std::make_shared<core::TokenOverlapScorer>(), cfg.scorer_timeout_ns);
    util::SystemClock clock;
    core::InMemoryConflictStore store;

    {
        core::ConflictEngine engine(cfg, store, clock, &scorer, &dispatcher, &journal);
        const auto merged = engine.analytics().warm_start(history);
        LOG_SLOW_INFO("warm start: journal files=%llu records=%llu corrupt=%llu outcomes=%zu",
                      static_cast<unsigned long long>(replay.stats.files_read),
                      static_cast<unsigned long long>(replay.stats.records_ok),
                      static_cast<unsigned long long>(replay.stats.records_corrupt), merged);

        if (!engine.start_background()) {
            LOG_SLOW_FATAL("failed to start engine background threads");
            journal.stop();
            dispatcher.stop();
            util::shutdown_engine_logger();
            return 3;
        }

        LOG_SLOW_INFO("Starting normconflictd provisions=%s journal=%s channel=%s stream=%d",
                      provisions_dir.string().c_str(), journal_dir.string().c_str(), channel.c_str(), stream_id);

        std::thread watcher([&] { run_watch_loop(engine, provisions_dir, poll, stop_flag); });

        const char* duration_env = std::getenv("NORMCONFLICTD_RUN_MS");
        if (duration_env) {
            const auto duration_ms = std::chrono::milliseconds{std::strtoul(duration_env, nullptr, 10)};
            LOG_SLOW_INFO("normconflictd running for %llu ms before shutdown.",
                          static_cast<unsigned long long>(duration_ms.count()));
            std::this_thread::sleep_for(duration_ms);
        } else {
            LOG_SLOW_INFO("normconflictd running. Press Enter to exit.");
            std::cin.get();
        }
        stop_flag.store(true, std::memory_order_release);
        watcher.join();
        engine.stop_background();

        const auto esc = engine.escalation().counters();
        const auto res = engine.resolver().counters();
        LOG_SLOW_INFO("resolver resolved=%llu escalated_low_confidence=%llu contended=%llu reverted=%llu",
                      static_cast<unsigned long long>(res.resolved),
                      static_cast<unsigned long long>(res.escalated_low_confidence),
                      static_cast<unsigned long long>(res.contended), static_cast<unsigned long long>(res.reverted));
        LOG_SLOW_INFO("escalation opened=%llu advanced=%llu closed_auto=%llu notify_failures=%llu",
                      static_cast<unsigned long long>(esc.opened), static_cast<unsigned long long>(esc.advanced),
                      static_cast<unsigned long long>(esc.closed_auto),
                      static_cast<unsigned long long>(esc.notify_failures));
    }

    dispatcher.stop();
    journal.stop();
    const auto dc = dispatcher.counters();
    LOG_SLOW_INFO("notices delivered=%llu retries=%llu dropped_full=%llu dropped_exhausted=%llu",
                  static_cast<unsigned long long>(dc.delivered), static_cast<unsigned long long>(dc.retries),
                  static_cast<unsigned long long>(dc.dropped_queue_full),
                  static_cast<unsigned long long>(dc.dropped_exhausted));
    LOG_SLOW_INFO("journal written=%llu dropped_ring_full=%llu io_errors=%llu",
                  static_cast<unsigned long long>(journal_counters.records_written.load()),
                  static_cast<unsigned long long>(journal_counters.drop_ring_full.load()),
                  static_cast<unsigned long long>(journal_counters.io_errors.load()));

    util::shutdown_engine_logger();
    return 0;
}
