#include "persist/journal_reader.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>
#include <span>
#include <string>
#include <system_error>

#include "persist/byte_codec.hpp"
#include "util/log.hpp"

namespace persist {
namespace {

struct JournalFileInfo {
    std::filesystem::path path;
    std::uint64_t timestamp_key{0};
    std::uint64_t sequence{0};
    bool parsed{false};
};

bool parse_number(std::string_view s, std::uint64_t& out) noexcept {
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

// Expected: <prefix>YYYYMMDD_HHMMSS_seqNNN.bin
bool parse_journal_filename(const std::filesystem::path& path, std::string_view prefix, JournalFileInfo& out) {
    const std::string stem = path.stem().string();
    const std::string_view view(stem);
    if (view.rfind(prefix, 0) != 0 || view.size() <= prefix.size() + 15) {
        return false;
    }
    const auto seq_pos = view.find("_seq", prefix.size() + 15);
    if (seq_pos == std::string_view::npos) {
        return false;
    }
    std::uint64_t date = 0;
    std::uint64_t time = 0;
    std::uint64_t seq = 0;
    if (!parse_number(view.substr(prefix.size(), 8), date) || !parse_number(view.substr(prefix.size() + 9, 6), time) ||
        !parse_number(view.substr(seq_pos + 4), seq)) {
        return false;
    }
    out.timestamp_key = date * 1'000'000ull + time;
    out.sequence = seq;
    out.parsed = true;
    out.path = path;
    return true;
}

} // namespace

std::vector<std::filesystem::path> scan_journal_files(const std::filesystem::path& dir, std::string_view prefix) {
    std::vector<JournalFileInfo> infos;
    std::error_code ec;
    if (dir.empty()) {
        return {};
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().filename().string().rfind(prefix, 0) != 0) {
            continue;
        }
        JournalFileInfo info;
        if (!parse_journal_filename(entry.path(), prefix, info)) {
            info.path = entry.path();
        }
        infos.push_back(std::move(info));
    }
    std::sort(infos.begin(), infos.end(), [](const JournalFileInfo& a, const JournalFileInfo& b) {
        if (a.parsed != b.parsed) {
            return a.parsed;
        }
        if (a.parsed && a.timestamp_key != b.timestamp_key) {
            return a.timestamp_key < b.timestamp_key;
        }
        if (a.parsed && a.sequence != b.sequence) {
            return a.sequence < b.sequence;
        }
        return a.path < b.path;
    });
    std::vector<std::filesystem::path> out;
    out.reserve(infos.size());
    for (auto& info : infos) {
        out.push_back(std::move(info.path));
    }
    return out;
}

bool read_journal_file(const std::filesystem::path& path, std::vector<DecodedJournalRecord>& out,
                       JournalReadStats& stats, JournalCounters* counters) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size > static_cast<std::uintmax_t>(std::numeric_limits<std::size_t>::max())) {
        ++stats.io_errors;
        return false;
    }
    std::vector<std::byte> buffer(static_cast<std::size_t>(size));
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        ++stats.io_errors;
        return false;
    }
    if (!buffer.empty() && !in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()))) {
        ++stats.io_errors;
        return false;
    }
    ++stats.files_read;

    std::size_t offset = 0;
    while (offset < buffer.size()) {
        const std::span<const std::byte> rest(buffer.data() + offset, buffer.size() - offset);
        DecodedJournalRecord rec{};
        const DecodeError err = decode_record(rest, rec, counters);
        if (err == DecodeError::Ok) {
            offset += record_size_from_payload(rec.payload_len);
            out.push_back(std::move(rec));
            ++stats.records_ok;
            continue;
        }
        if (is_graceful_eof(err)) {
            ++stats.truncated_tail;
            break;
        }
        if (rest.size() < header_size) {
            ++stats.unframed_tail;
            break;
        }
        // payload_len sits right after the type word.
        const std::uint32_t payload_len = load_le32(rest.data() + 4);
        if (payload_len > journal_max_frame || record_size_from_payload(payload_len) > rest.size()) {
            ++stats.unframed_tail;
            break;
        }
        ++stats.records_corrupt;
        offset += record_size_from_payload(payload_len);
    }
    return true;
}

JournalReadResult read_journal(const std::filesystem::path& dir, JournalCounters* counters) {
    JournalReadResult result{};
    for (const auto& path : scan_journal_files(dir)) {
        if (!read_journal_file(path, result.records, result.stats, counters)) {
            util::log(util::LogLevel::Warn, "journal: cannot read %s", path.string().c_str());
        }
    }
    return result;
}

std::vector<core::OutcomeEvent> outcome_events(const std::vector<DecodedJournalRecord>& records) {
    std::vector<core::OutcomeEvent> out;
    for (const auto& rec : records) {
        if (rec.type == JournalRecordType::Resolution) {
            const auto& r = rec.resolution;
            if (r.outcome == core::ResolutionOutcome::Reverted) {
                continue;
            }
            out.push_back(core::OutcomeEvent{core::StatKey{r.conflict_type, r.jurisdiction_bucket, r.strategy},
                                             r.outcome == core::ResolutionOutcome::Applied, r.applied_at});
        } else if (rec.type == JournalRecordType::Revert) {
            const auto& r = rec.revert;
            out.push_back(core::OutcomeEvent{core::StatKey{r.conflict_type, r.jurisdiction_bucket, r.strategy}, false,
                                             r.reverted_at});
        }
    }
    return out;
}

} // namespace persist
