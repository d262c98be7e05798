/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace spool::infrastructure {

namespace {

using std::chrono::milliseconds;

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

// Days since 1970-01-01 of a proleptic Gregorian date (H. Hinnant's algorithm).
long long DaysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

bool IsLeap(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(long long y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

bool ReadDigits(const std::string& s, size_t pos, size_t count, long long& out) {
    if (pos + count > s.size()) return false;
    long long value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

long long FloorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

TimeUtils::TimePoint TimeUtils::NowMillis() {
    return std::chrono::time_point_cast<milliseconds>(std::chrono::system_clock::now());
}

std::string TimeUtils::FormatIso8601(TimePoint tp) {
    const long long ms = std::chrono::duration_cast<milliseconds>(tp.time_since_epoch()).count();
    const long long secs = FloorDiv(ms, 1000);
    const int millis = static_cast<int>(ms - secs * 1000);

    std::tm tm = ToUtcTime(static_cast<std::time_t>(secs));
    char dateBuf[32];
    std::strftime(dateBuf, sizeof(dateBuf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", dateBuf, millis);
    return out;
}

std::optional<TimeUtils::TimePoint> TimeUtils::ParseIso8601(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS
    long long year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (text.size() < 20) return std::nullopt;
    if (!ReadDigits(text, 0, 4, year) || text[4] != '-' ||
        !ReadDigits(text, 5, 2, month) || text[7] != '-' ||
        !ReadDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !ReadDigits(text, 11, 2, hour) || text[13] != ':' ||
        !ReadDigits(text, 14, 2, minute) || text[16] != ':' ||
        !ReadDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > DaysInMonth(year, static_cast<unsigned>(month))) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    size_t pos = 19;
    long long millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t i = digits; i < 3; ++i) millis *= 10;
    }
    if (pos + 1 != text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
        return std::nullopt;
    }

    const long long days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const long long totalMs = ((days * 24 + hour) * 60 + minute) * 60000 + second * 1000 + millis;
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(milliseconds(totalMs)));
}

std::string TimeUtils::FormatDate(TimePoint tp) {
    return FormatIso8601(tp).substr(0, 10);
}

std::string TimeUtils::FormatMonth(TimePoint tp) {
    return FormatIso8601(tp).substr(0, 7);
}

TimeUtils::TimePoint TimeUtils::StartOfMonth(TimePoint tp) {
    const std::string month = FormatMonth(tp);
    auto parsed = ParseIso8601(month + "-01T00:00:00Z");
    // FormatMonth always yields a parsable prefix.
    return parsed ? *parsed : tp;
}

} // namespace spool::infrastructure
