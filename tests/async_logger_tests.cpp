#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "util/async_log.hpp"

namespace {
using util::AsyncLogger;
using util::LogLevel;

std::filesystem::path make_temp_log_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return path;
}

AsyncLogger::Config base_config(const std::filesystem::path& path) {
    AsyncLogger::Config cfg{};
    cfg.capacity_pow2 = 1u << 10;
    cfg.flush_every = 1;
    cfg.file_path = path.string();
    cfg.consumer_sleep_ns = 1'000;
    return cfg;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}
} // namespace

TEST(AsyncLoggerTests, WritesRecords) {
    auto path = make_temp_log_path("normconflict_async_basic.log");
    AsyncLogger logger;
    ASSERT_TRUE(logger.start(base_config(path)));

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(logger.try_logf(LogLevel::Info, "DETECT", "pair-%d", i));
    }
    logger.stop();

    EXPECT_EQ(logger.written(), 10u);
    EXPECT_EQ(read_lines(path).size(), 10u);
}

TEST(AsyncLoggerTests, LineCarriesLevelAndCategory) {
    auto path = make_temp_log_path("normconflict_async_format.log");
    AsyncLogger logger;
    ASSERT_TRUE(logger.start(base_config(path)));
    EXPECT_TRUE(logger.try_logf(LogLevel::Warn, "ESCAL", "case=%d level=%d", 7, 2));
    logger.stop();

    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[WARN]"), std::string::npos);
    EXPECT_NE(lines[0].find("[ESCAL]"), std::string::npos);
    EXPECT_NE(lines[0].find("case=7 level=2"), std::string::npos);
}

TEST(AsyncLoggerTests, FiltersBelowMinLevel) {
    auto path = make_temp_log_path("normconflict_async_filter.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.min_level = LogLevel::Warn;
    ASSERT_TRUE(logger.start(cfg));
    EXPECT_FALSE(logger.try_logf(LogLevel::Info, "RESOLVE", "quiet"));
    EXPECT_TRUE(logger.try_logf(LogLevel::Error, "RESOLVE", "loud"));
    logger.stop();
    EXPECT_EQ(logger.filtered(), 1u);
    EXPECT_EQ(logger.written(), 1u);
}

TEST(AsyncLoggerTests, DropsOnOverflow) {
    auto path = make_temp_log_path("normconflict_async_drop.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.capacity_pow2 = 8;
    cfg.consumer_sleep_ns = 500'000;
    ASSERT_TRUE(logger.start(cfg));

    for (int i = 0; i < 200; ++i) {
        logger.try_logf(LogLevel::Info, "DROP", "event-%d", i);
    }
    logger.stop();
    EXPECT_GT(logger.dropped(), 0u);
    EXPECT_EQ(logger.written() + logger.dropped(), 200u);
}

TEST(AsyncLoggerTests, MultipleProducersAccountForEveryRecord) {
    auto path = make_temp_log_path("normconflict_async_threads.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.capacity_pow2 = 1u << 12;
    cfg.consumer_sleep_ns = 0;
    ASSERT_TRUE(logger.start(cfg));

    constexpr int producers = 4;
    constexpr int per_thread = 250;
    std::vector<std::thread> threads;
    threads.reserve(producers);
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&logger, p] {
            for (int i = 0; i < per_thread; ++i) {
                logger.try_logf(LogLevel::Info, "MP", "p%d-%d", p, i);
            }
        });
    }
    for (auto& t : threads) t.join();
    logger.stop();

    EXPECT_EQ(logger.written() + logger.dropped(), static_cast<std::uint64_t>(producers * per_thread));
}

TEST(AsyncLoggerTests, ReturnsFalseWhenNotStarted) {
    AsyncLogger logger;
    EXPECT_FALSE(logger.try_log(LogLevel::Info, "NA", "msg", 3));
    EXPECT_EQ(logger.written(), 0u);
    EXPECT_EQ(logger.dropped(), 0u);
}
