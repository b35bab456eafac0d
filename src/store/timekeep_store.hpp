#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace timekeep {

// TimekeepStore is the SQLite access layer for projects and time entries.
// It owns the "at most one open entry" rule for every mutation that goes
// through it; range and overlap reads are shaped by QueryEngine.
class TimekeepStore {
public:
    using Clock = std::function<TimePoint()>;

    // Opens the database at defaultDatabasePath().
    TimekeepStore();
    // An empty clock means std::chrono::system_clock::now.
    explicit TimekeepStore(const std::string &dbPath, Clock clock = Clock());
    ~TimekeepStore();

    // Current time as seen by this store, truncated to whole seconds.
    TimePoint now() const;

    // Projects. Names are unique case-sensitively, listed case-insensitively.
    ProjectId upsertProjectByName(const std::string &name);
    std::vector<std::string> listProjectNames() const;

    // Entry lifecycle. startEntry closes any open entry in the same
    // transaction before inserting the new one.
    EntryId startEntry(const std::string &projectName,
                       const std::string &task,
                       const std::string &notes);
    void stopEntry(EntryId id);
    void deleteEntry(EntryId id);

    // Rewrites every field of an entry. start and end are timestamp text as
    // typed by the user; an empty end re-opens the entry.
    void updateEntry(EntryId id,
                     const std::string &projectName,
                     const std::string &task,
                     const std::string &notes,
                     const std::string &start,
                     const std::optional<std::string> &end);

    std::optional<TimeEntry> getRunningEntry() const;
    std::optional<TimeEntry> getEntry(EntryId id) const;

    // Entries whose start lies in [from, to], most recent start first.
    std::vector<TimeEntry> getEntriesStartedBetween(
        TimePoint from,
        TimePoint to,
        const std::optional<std::string> &projectName) const;

    // Entries whose interval (open entries extend forever) touches [from, to].
    std::vector<TimeEntry> getEntriesOverlapping(TimePoint from, TimePoint to) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace timekeep
