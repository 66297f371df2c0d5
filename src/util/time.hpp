#pragma once

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace util {

constexpr std::uint64_t kNanosPerSecond = 1'000'000'000ull;
constexpr std::uint64_t kNanosPerDay = 86'400ull * kNanosPerSecond;

// Days since 1970-01-01 (proleptic Gregorian).
using CivilDay = std::int32_t;

// Howard Hinnant's days_from_civil.
constexpr CivilDay days_from_civil(int y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<CivilDay>(era * 146097 + static_cast<int>(doe) - 719468);
}

struct CivilDate {
    int year{1970};
    unsigned month{1};
    unsigned day{1};
};

constexpr CivilDate civil_from_days(CivilDay z) noexcept {
    const int zz = z + 719468;
    const int era = (zz >= 0 ? zz : zz - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(zz - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
}

// Strict "YYYY-MM-DD".
inline std::optional<CivilDay> parse_civil_day(std::string_view s) noexcept {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    auto digits = [&](std::size_t pos, std::size_t n, int& out) {
        out = 0;
        for (std::size_t i = pos; i < pos + n; ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
            out = out * 10 + (s[i] - '0');
        }
        return true;
    };
    int y = 0, m = 0, d = 0;
    if (!digits(0, 4, y) || !digits(5, 2, m) || !digits(8, 2, d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1) {
        return std::nullopt;
    }
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    const int max_day = (m == 2 && leap) ? 29 : kDays[m - 1];
    if (d > max_day) {
        return std::nullopt;
    }
    return days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

inline std::string format_civil_day(CivilDay day) {
    const CivilDate cd = civil_from_days(day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", cd.year, cd.month, cd.day);
    return std::string(buf);
}

constexpr CivilDay civil_day_of(std::uint64_t ns_since_epoch) noexcept {
    return static_cast<CivilDay>(ns_since_epoch / kNanosPerDay);
}

constexpr std::uint64_t start_of_day_ns(CivilDay day) noexcept {
    return day <= 0 ? 0 : static_cast<std::uint64_t>(day) * kNanosPerDay;
}

} // namespace util
