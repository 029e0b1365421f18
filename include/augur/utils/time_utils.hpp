#pragma once
#include <cstdint>
#include <string>

namespace augur::utils {

// All timestamps in the system are seconds since the Unix epoch (UTC).
using Timestamp = int64_t;

constexpr int64_t kSecondsPerMinute = 60;
constexpr int64_t kSecondsPerHour = 3600;
constexpr int64_t kSecondsPerDay = 86400;

struct CivilTime {
    int year = 1970;
    int month = 1;      // 1..12
    int day = 1;        // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
    int weekday = 4;    // 0 = Monday .. 6 = Sunday
};

// Breaks a timestamp into calendar fields after shifting it by utc_offset_minutes.
CivilTime to_civil(Timestamp ts, int utc_offset_minutes = 0);

// Inverse of to_civil for the date/time fields (weekday is ignored).
Timestamp from_civil(const CivilTime& civil, int utc_offset_minutes = 0);

// Calendar day number (days since epoch) in the market's local time zone.
int64_t trade_day(Timestamp ts, int utc_offset_minutes = 0);

int days_in_month(int year, int month);

// ISO-8601 form, e.g. 2026-10-19T09:00:00Z (UTC)
std::string format_iso8601(Timestamp ts);

// Parses "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z', or a plain
// integer epoch value. Returns false on malformed input.
bool parse_timestamp(const std::string& text, Timestamp& out);

Timestamp now_seconds();

} // namespace augur::utils
