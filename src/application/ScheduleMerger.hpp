/**
 * @file ScheduleMerger.hpp
 * @brief Combines routine instances, ad-hoc tasks and route stops into one day schedule.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/PlannerSettings.hpp"
#include "domain/PlanIssue.hpp"
#include "domain/Routine.hpp"
#include "domain/ScheduleEntry.hpp"
#include "domain/Task.hpp"

namespace fieldplan::application {

/**
 * @struct MergeResult
 * @brief Merged entries of one day plus the soft issues found on the way.
 */
struct MergeResult {
    std::vector<domain::ScheduleEntry> entries;
    std::vector<domain::PlanIssue> issues;
    double totalHours = 0.0;
};

/**
 * @class ScheduleMerger
 * @brief Deterministic merge, deduplication and ordering of schedule entries.
 *
 * Entries collide when they share (scope, lowercase title, start minute), where
 * scope is the buildingId, or "<circuitId>#<buildingId>" for injected entries.
 * A collapsed group keeps the id and title of its smallest-id member, the
 * latest endTime and the summed taskCount.
 */
class ScheduleMerger {
public:
    explicit ScheduleMerger(MergerSettings settings = {});

    /**
     * @brief Merged, deduplicated and sorted entries for one day.
     * @param fallbackBuildingId Building used for unattributed tasks no route matches.
     */
    std::vector<domain::ScheduleEntry> mergeDay(const domain::CivilDate& date,
                                                const std::vector<domain::RoutineInstance>& routineInstances,
                                                const std::vector<domain::Task>& adHocTasks,
                                                const std::vector<domain::RouteSequence>& routeSequences,
                                                const std::optional<std::string>& fallbackBuildingId = std::nullopt) const;

    /** @brief As mergeDay, also reporting issues and the day total. */
    MergeResult mergeDayDetailed(const domain::CivilDate& date,
                                 const std::vector<domain::RoutineInstance>& routineInstances,
                                 const std::vector<domain::Task>& adHocTasks,
                                 const std::vector<domain::RouteSequence>& routeSequences,
                                 const std::optional<std::string>& fallbackBuildingId = std::nullopt) const;

    static std::string DedupKey(const domain::ScheduleEntry& entry);
    static std::vector<domain::ScheduleEntry> Deduplicate(const std::vector<domain::ScheduleEntry>& entries);

    /** @brief (startTime, title, buildingId, id) ascending. */
    static void SortEntries(std::vector<domain::ScheduleEntry>& entries);

    static double TotalHours(const std::vector<domain::ScheduleEntry>& entries);

    /** @brief Deduplicates, sorts and totals entries into a DaySchedule. */
    static domain::DaySchedule BuildDaySchedule(const domain::CivilDate& date,
                                                const std::vector<domain::ScheduleEntry>& entries);

    /**
     * @brief Raises endTime to startTime when the window is inverted.
     * @return true when the entry was clamped.
     */
    static bool ClampTimeWindow(domain::ScheduleEntry& entry);

private:
    MergerSettings m_settings;

    domain::ScheduleEntry fromRoutine(const domain::RoutineInstance& instance) const;
    domain::ScheduleEntry fromTask(const domain::CivilDate& date, const domain::Task& task) const;
    domain::ScheduleEntry fromRoute(const domain::CivilDate& date, const domain::RouteSequence& route) const;
    bool isOnDate(const domain::CivilDate& date, const domain::Task& task) const;

    std::optional<std::string> matchRouteBuilding(const domain::CivilDate& date,
                                                  domain::TimePoint start,
                                                  const std::vector<domain::RouteSequence>& routes) const;
};

} // namespace fieldplan::application
