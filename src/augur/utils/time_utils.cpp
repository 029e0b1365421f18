#include <augur/utils/time_utils.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace augur::utils {

namespace {

// Days-from-civil and civil-from-days over the proleptic Gregorian calendar.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(y + (month <= 2));
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // namespace

CivilTime to_civil(Timestamp ts, int utc_offset_minutes) {
    const int64_t local = ts + static_cast<int64_t>(utc_offset_minutes) * kSecondsPerMinute;
    const int64_t days = floor_div(local, kSecondsPerDay);
    const int64_t secs = local - days * kSecondsPerDay;

    CivilTime civil;
    civil_from_days(days, civil.year, civil.month, civil.day);
    civil.hour = static_cast<int>(secs / kSecondsPerHour);
    civil.minute = static_cast<int>((secs % kSecondsPerHour) / kSecondsPerMinute);
    civil.second = static_cast<int>(secs % kSecondsPerMinute);
    // 1970-01-01 was a Thursday (3 when Monday is 0)
    int64_t weekday = (days + 3) % 7;
    if (weekday < 0) {
        weekday += 7;
    }
    civil.weekday = static_cast<int>(weekday);
    return civil;
}

Timestamp from_civil(const CivilTime& civil, int utc_offset_minutes) {
    const int64_t days = days_from_civil(civil.year, static_cast<unsigned>(civil.month),
                                         static_cast<unsigned>(civil.day));
    const int64_t local = days * kSecondsPerDay + civil.hour * kSecondsPerHour
                        + civil.minute * kSecondsPerMinute + civil.second;
    return local - static_cast<int64_t>(utc_offset_minutes) * kSecondsPerMinute;
}

int64_t trade_day(Timestamp ts, int utc_offset_minutes) {
    return floor_div(ts + static_cast<int64_t>(utc_offset_minutes) * kSecondsPerMinute,
                     kSecondsPerDay);
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[(month - 1) % 12];
}

std::string format_iso8601(Timestamp ts) {
    CivilTime c = to_civil(ts);
    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << c.year << '-' << std::setw(2) << c.month << '-' << std::setw(2) << c.day
        << 'T' << std::setw(2) << c.hour << ':' << std::setw(2) << c.minute << ':'
        << std::setw(2) << c.second << 'Z';
    return out.str();
}

bool parse_timestamp(const std::string& text, Timestamp& out) {
    if (text.empty()) {
        return false;
    }

    if (text.find('-') == std::string::npos || text.find('T') == std::string::npos) {
        char* end = nullptr;
        long long value = std::strtoll(text.c_str(), &end, 10);
        if (end == text.c_str() || *end != '\0') {
            return false;
        }
        out = static_cast<Timestamp>(value);
        return true;
    }

    CivilTime c;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &c.year, &c.month, &c.day, &c.hour, &c.minute, &c.second, &consumed) != 6) {
        return false;
    }
    std::string rest = text.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest != "Z") {
        return false;
    }
    if (c.month < 1 || c.month > 12 || c.day < 1 || c.day > days_in_month(c.year, c.month)
        || c.hour > 23 || c.minute > 59 || c.second > 59) {
        return false;
    }
    out = from_civil(c);
    return true;
}

Timestamp now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace augur::utils
