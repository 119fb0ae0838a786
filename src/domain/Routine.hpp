/**
 * @file Routine.hpp
 * @brief Recurring routine definitions, their concrete instances and route plans.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CalendarTime.hpp"
#include "Task.hpp"

namespace fieldplan::domain {

/**
 * @struct RoutineSchedule
 * @brief A recurring obligation described by an RRULE-style string.
 *
 * Supported rule keys: FREQ (DAILY, WEEKLY, MONTHLY), BYDAY, BYHOUR, BYMINUTE.
 */
struct RoutineSchedule {
    std::string id;
    std::string workerId;
    std::string buildingId;
    std::string buildingName;
    std::string name;
    std::string rrule;
    TaskCategory category = TaskCategory::Unknown;
    std::optional<int> estimatedDurationMinutes; ///< Absent: frequency default.
    bool isWeatherDependent = false;
};

/**
 * @struct RoutineInstance
 * @brief One concrete occurrence of a routine on a specific date.
 */
struct RoutineInstance {
    std::string id;
    std::string routineId;
    std::string buildingId;
    std::string title;
    TimePoint startTime;
    TimePoint endTime;
    TaskCategory category = TaskCategory::Unknown;
    bool isWeatherDependent = false;
};

/**
 * @struct OperationTask
 * @brief A single operation performed during a route stop.
 */
struct OperationTask {
    std::string id;
    std::string name;
    TaskCategory category = TaskCategory::Unknown;
    bool isWeatherSensitive = false;
    bool requiresPhoto = false;
};

/**
 * @struct RouteSequence
 * @brief A stop of a worker's day-of-week route plan (read-only input).
 *
 * arrivalMinuteOfDay is a time of day; the concrete instant is obtained by
 * anchoring it to a date with windowStart().
 */
struct RouteSequence {
    std::string id;
    Weekday weekday = Weekday::Monday;
    std::string buildingId;
    std::string buildingName;
    int arrivalMinuteOfDay = 0;
    Seconds estimatedDuration{3600};
    std::vector<OperationTask> operations;

    TimePoint windowStart(const CivilDate& date) const { return date.atMinuteOfDay(arrivalMinuteOfDay); }
    TimePoint windowEnd(const CivilDate& date) const { return windowStart(date) + estimatedDuration; }
};

} // namespace fieldplan::domain
