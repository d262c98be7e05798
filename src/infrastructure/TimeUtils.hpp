/**
 * @file TimeUtils.hpp
 * @brief UTC timestamp formatting and parsing for log lines and file partitions.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace spool::infrastructure {

class TimeUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /** @brief Current time truncated to milliseconds, the precision the log stores. */
    static TimePoint NowMillis();

    /** @brief "2026-01-02T03:04:05.678Z" */
    static std::string FormatIso8601(TimePoint tp);

    /**
     * @brief Parses "YYYY-MM-DDTHH:MM:SS[.fraction]Z". Fractions finer than a
     * millisecond are truncated; event_id settles the ties that leaves in the
     * canonical order.
     * @return nullopt when the text is not in that form.
     */
    static std::optional<TimePoint> ParseIso8601(const std::string& text);

    /** @brief "YYYY-MM-DD" in UTC, names the active log file. */
    static std::string FormatDate(TimePoint tp);

    /** @brief "YYYY-MM" in UTC, names the archive file. */
    static std::string FormatMonth(TimePoint tp);

    /** @brief First instant of the UTC month containing tp. */
    static TimePoint StartOfMonth(TimePoint tp);
};

} // namespace spool::infrastructure
