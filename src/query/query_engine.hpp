#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <QDate>

#include "common/models.hpp"

namespace timekeep {

class TimekeepStore;

// Read side over a TimekeepStore: date-range filtering and day totals.
// Nothing is cached; every call reads the store and the store's clock.
class QueryEngine {
public:
    explicit QueryEngine(const TimekeepStore &store);

    // Entries starting within [rangeStart 00:00:00, rangeEnd 23:59:59],
    // most recent start first. An empty filter matches every project.
    // Throws ValidationError for invalid dates or rangeEnd < rangeStart.
    std::vector<TimeEntry> queryEntries(const QDate &rangeStart,
                                        const QDate &rangeEnd,
                                        const std::optional<std::string> &projectFilter) const;

    // Active seconds that fall inside today, open entries counted up to now.
    int64_t sumToday() const;
    int64_t sumForDay(const QDate &day) const;

    // Live elapsed time of an open entry, or the closed entry's duration.
    int64_t elapsedSeconds(const TimeEntry &entry) const;

    QDate today() const;

private:
    const TimekeepStore &m_store;
};

// Cached duration, recomputed from end - start when the cache is missing.
// Open entries without a cached value count as 0.
int64_t effectiveDuration(const TimeEntry &entry);

// First day of today's month through today.
std::pair<QDate, QDate> defaultFilterRange(const QDate &today);

} // namespace timekeep
