#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace timekeep {

using ProjectId = int64_t;
using EntryId = int64_t;

// One row of the entries table joined with its project name. end and
// durationSeconds are empty while the entry is running.
struct TimeEntry {
    EntryId id = 0;
    ProjectId projectId = 0;
    std::string project;
    std::string task;
    std::string notes;
    std::chrono::system_clock::time_point start;
    std::optional<std::chrono::system_clock::time_point> end;
    std::optional<int64_t> durationSeconds;

    bool isOpen() const
    {
        return !end.has_value();
    }
};

} // namespace timekeep
