/**
 * @file ScheduleEntry.hpp
 * @brief Schedule entries, day schedules and the weekly plan.
 */

#pragma once

#include <string>
#include <vector>

#include "CalendarTime.hpp"
#include "Task.hpp"

namespace fieldplan::domain {

/**
 * @enum EntrySource
 * @brief Which upstream source produced an entry.
 */
enum class EntrySource {
    Routine,
    AdHoc,
    Route,
    Calendar
};

inline std::string EntrySourceToString(EntrySource source) {
    switch (source) {
        case EntrySource::Routine: return "routine";
        case EntrySource::AdHoc: return "adhoc";
        case EntrySource::Route: return "route";
        case EntrySource::Calendar: return "calendar";
        default: return "routine";
    }
}

/**
 * @struct ScheduleEntry
 * @brief One unit of planned work at a building in a time window.
 *
 * Invariant: endTime >= startTime. An empty buildingId marks work that could
 * not be attributed to any building.
 */
struct ScheduleEntry {
    std::string id;
    std::string buildingId;
    std::string title;
    TimePoint startTime;
    TimePoint endTime;
    int taskCount = 1;

    EntrySource source = EntrySource::Routine;
    TaskCategory category = TaskCategory::Unknown;
    TaskUrgency urgency = TaskUrgency::Normal;
    std::string circuitId;          ///< Non-empty only for calendar-injected entries.
    bool isCompleted = false;       ///< True only when every merged member is completed.
    bool requiresPhoto = false;     ///< True when any merged member asks for photo evidence.
    bool timeWindowClamped = false; ///< endTime was raised to startTime.

    double durationHours() const { return HoursBetween(startTime, endTime); }

    bool isActiveAt(TimePoint t) const { return t >= startTime && t <= endTime; }
};

/**
 * @struct DaySchedule
 * @brief Ordered, deduplicated entries of one calendar day.
 */
struct DaySchedule {
    CivilDate date;
    std::vector<ScheduleEntry> items;
    double totalHours = 0.0;
};

/**
 * @struct WeeklyPlan
 * @brief Today plus the next six days, one DaySchedule per date.
 */
struct WeeklyPlan {
    std::vector<DaySchedule> days;

    const DaySchedule* find(const CivilDate& date) const {
        for (const auto& day : days) {
            if (day.date == date) return &day;
        }
        return nullptr;
    }
};

} // namespace fieldplan::domain
