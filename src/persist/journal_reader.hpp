#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

#include "core/resolution_analytics.hpp"
#include "persist/journal_format.hpp"

namespace persist {

struct JournalReadStats {
    std::uint64_t files_read{0};
    std::uint64_t records_ok{0};
    std::uint64_t records_corrupt{0}; // skipped frames with intact framing
    std::uint64_t truncated_tail{0};
    std::uint64_t unframed_tail{0};   // length field unusable; rest of file skipped
    std::uint64_t io_errors{0};
};

struct JournalReadResult {
    std::vector<DecodedJournalRecord> records{};
    JournalReadStats stats{};
};

// Journal files in the directory ordered by (timestamp, sequence) from their
// names; files that do not parse sort last by path.
std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir,
                                                      std::string_view prefix = journal_filename_prefix());

// Appends every decodable record of one file. Corrupt frames with a usable
// length are skipped; a truncated tail ends the file.
bool read_journal_file(const std::filesystem::path& path, std::vector<DecodedJournalRecord>& out,
                       JournalReadStats& stats, JournalCounters* counters = nullptr);

JournalReadResult read_journal(const std::filesystem::path& dir, JournalCounters* counters = nullptr);

// Terminal outcomes for analytics warm start: Applied records count as
// successes, Failed records and reverts as failures.
std::vector<core::OutcomeEvent> outcome_events(const std::vector<DecodedJournalRecord>& records);

} // namespace persist
