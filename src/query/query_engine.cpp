#include "query/query_engine.hpp"

#include <QString>

#include "common/errors.hpp"
#include "common/time_utils.hpp"
#include "store/timekeep_store.hpp"

namespace timekeep {

QueryEngine::QueryEngine(const TimekeepStore &store)
    : m_store(store)
{
}

std::vector<TimeEntry> QueryEngine::queryEntries(
    const QDate &rangeStart,
    const QDate &rangeEnd,
    const std::optional<std::string> &projectFilter) const
{
    if (!rangeStart.isValid() || !rangeEnd.isValid()) {
        throw ValidationError("Enter valid ISO dates YYYY-MM-DD.");
    }
    if (rangeEnd < rangeStart) {
        throw ValidationError("End date "
                              + rangeEnd.toString(Qt::ISODate).toStdString()
                              + " is before start date "
                              + rangeStart.toString(Qt::ISODate).toStdString());
    }

    std::optional<std::string> project;
    if (projectFilter && !projectFilter->empty()) {
        project = projectFilter;
    }

    return m_store.getEntriesStartedBetween(startOfDay(rangeStart),
                                            endOfDay(rangeEnd),
                                            project);
}

int64_t QueryEngine::sumToday() const
{
    return sumForDay(today());
}

int64_t QueryEngine::sumForDay(const QDate &day) const
{
    const TimePoint windowStart = startOfDay(day);
    const TimePoint windowEnd = endOfDay(day);
    const TimePoint current = m_store.now();

    int64_t total = 0;
    for (const TimeEntry &entry : m_store.getEntriesOverlapping(windowStart, windowEnd)) {
        const TimePoint end = entry.end.value_or(current);
        total += clampInterval(entry.start, end, windowStart, windowEnd).seconds();
    }
    return total;
}

int64_t QueryEngine::elapsedSeconds(const TimeEntry &entry) const
{
    if (entry.isOpen()) {
        return wholeSecondsBetween(entry.start, m_store.now());
    }
    return effectiveDuration(entry);
}

QDate QueryEngine::today() const
{
    return localDateOf(m_store.now());
}

int64_t effectiveDuration(const TimeEntry &entry)
{
    if (entry.durationSeconds) {
        return *entry.durationSeconds;
    }
    if (entry.end) {
        return wholeSecondsBetween(entry.start, *entry.end);
    }
    return 0;
}

std::pair<QDate, QDate> defaultFilterRange(const QDate &today)
{
    return {QDate(today.year(), today.month(), 1), today};
}

} // namespace timekeep
