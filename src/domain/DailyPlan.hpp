/**
 * @file DailyPlan.hpp
 * @brief Immutable planner input snapshot and the resulting plan.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Building.hpp"
#include "CalendarTime.hpp"
#include "PlanIssue.hpp"
#include "PlanRules.hpp"
#include "Routine.hpp"
#include "ScheduleEntry.hpp"
#include "Task.hpp"
#include "WeatherSnapshot.hpp"
#include "WeatherSuggestion.hpp"
#include "WorkerState.hpp"

namespace fieldplan::domain {

/**
 * @struct PlanInputs
 * @brief Already-resolved source data for one plan computation.
 *
 * Routine instances and ad-hoc tasks may cover the whole week; the planner
 * picks what belongs to each day.
 */
struct PlanInputs {
    TimePoint now;
    std::optional<CheckIn> checkIn;
    std::vector<RoutineInstance> routineInstances;
    std::vector<Task> adHocTasks;
    std::vector<RouteSequence> routeSequences;
    std::optional<WeatherSnapshot> weather;
    std::optional<Coordinate> livePosition;
    std::vector<BuildingSummary> assignedBuildings;
    std::vector<BuildingSummary> portfolioBuildings; ///< Optional wider set for the status view.
    std::vector<CollectionRule> collectionRules;
    std::vector<PhotoPolicyRule> photoPolicy;
    std::vector<PlanIssue> knownIssues; ///< Reported by the caller while collecting the inputs.
};

/**
 * @struct DailyPlan
 * @brief The read-only result handed to presentation layers.
 */
struct DailyPlan {
    std::string workerId;
    CivilDate date;
    TimePoint generatedAt;
    WeeklyPlan weeklyPlan;
    std::optional<BuildingSummary> currentBuilding;
    ResolutionSource resolutionSource = ResolutionSource::None;
    std::vector<BuildingSummary> buildings;
    std::vector<ScoredTask> orderedUpcoming;
    std::vector<ScoredTask> deferredOutdoor;
    std::vector<WeatherSuggestion> suggestions;
    std::vector<PlanIssue> issues;

    const DaySchedule* today() const { return weeklyPlan.find(date); }
};

} // namespace fieldplan::domain
