#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <QDate>

namespace timekeep {

using TimePoint = std::chrono::system_clock::time_point;

// Effective interval of an entry inside a query window.
struct Interval {
    TimePoint start;
    TimePoint end;

    // Positive overlap in whole seconds, 0 when the interval is empty.
    int64_t seconds() const;
};

// [-]HH:MM:SS of the absolute value; hours are at least two digits wide.
std::string formatDuration(int64_t seconds);

// H:MM or H:MM:SS to seconds. Minutes and seconds must lie in [0,60).
std::optional<int64_t> parseClock(const std::string &text);

Interval clampInterval(TimePoint start,
                       TimePoint end,
                       TimePoint windowStart,
                       TimePoint windowEnd);

int64_t wholeSecondsBetween(TimePoint from, TimePoint to);

TimePoint truncateToSeconds(TimePoint timestamp);

// Persisted timestamp form: yyyy-MM-ddTHH:mm:ss, host local time, no offset.
std::string toLocalIso8601(TimePoint timestamp);

// Accepts the persisted form, a space instead of 'T', a trailing fraction
// (dropped) and a bare yyyy-MM-dd (midnight).
std::optional<TimePoint> fromLocalIso8601(const std::string &value);

std::optional<QDate> parseIsoDate(const std::string &value);

TimePoint startOfDay(const QDate &date);
TimePoint endOfDay(const QDate &date);

QDate localDateOf(TimePoint timestamp);

} // namespace timekeep
