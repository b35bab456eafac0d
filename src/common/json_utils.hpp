#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace timekeep {

inline void to_json(nlohmann::json &j, const TimeEntry &entry)
{
    j = nlohmann::json{
        {"id", entry.id},
        {"projectId", entry.projectId},
        {"project", entry.project},
        {"task", entry.task},
        {"notes", entry.notes},
        {"start", toLocalIso8601(entry.start)},
        {"end", nullptr},
        {"durationSeconds", nullptr}
    };
    if (entry.end) {
        j["end"] = toLocalIso8601(*entry.end);
    }
    if (entry.durationSeconds) {
        j["durationSeconds"] = *entry.durationSeconds;
    }
}

// Logging context for a single entry; keeps log lines short.
inline nlohmann::json entryLogContext(const TimeEntry &entry)
{
    return nlohmann::json{
        {"id", entry.id},
        {"project", entry.project},
        {"start", toLocalIso8601(entry.start)},
        {"open", entry.isOpen()}
    };
}

} // namespace timekeep
