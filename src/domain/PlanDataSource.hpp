/**
 * @file PlanDataSource.hpp
 * @brief Interface of the external collaborators feeding the planner.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Building.hpp"
#include "CalendarTime.hpp"
#include "PlanRules.hpp"
#include "Routine.hpp"
#include "Task.hpp"
#include "WeatherSnapshot.hpp"
#include "WorkerState.hpp"

namespace fieldplan::domain {

/**
 * @class PlanDataSource
 * @brief Abstract access to routine schedules, tasks, routes, weather and position.
 *
 * Implementations perform whatever I/O they need; the planner only ever sees
 * the returned values. An implementation may throw; callers treat a throwing
 * operation as missing data.
 */
class PlanDataSource {
public:
    virtual ~PlanDataSource() = default;

    /**
     * @brief Routine occurrences for a worker in [from, to] (inclusive days).
     */
    virtual std::vector<RoutineInstance> getRoutineInstances(const std::string& workerId,
                                                             const CivilDate& from,
                                                             const CivilDate& to) = 0;

    /** @brief Ad-hoc tasks assigned to the worker for a date. */
    virtual std::vector<Task> getTasks(const std::string& workerId, const CivilDate& date) = 0;

    /** @brief Route stops planned for the worker on a weekday. */
    virtual std::vector<RouteSequence> getRouteSequences(const std::string& workerId, Weekday weekday) = 0;

    /** @brief Latest forecast, if any. */
    virtual std::optional<WeatherSnapshot> getForecast() = 0;

    /** @brief Live device position, if known. */
    virtual std::optional<Coordinate> getCurrentPosition() = 0;

    /** @brief Buildings the worker is assigned to, in assignment order. */
    virtual std::vector<BuildingSummary> getAssignedBuildings(const std::string& workerId) = 0;

    /** @brief Explicit clock-in state of the worker. */
    virtual std::optional<CheckIn> getCheckIn(const std::string& workerId) {
        (void)workerId;
        return std::nullopt;
    }

    /** @brief Wider building set for the status view (coverage, available). */
    virtual std::vector<BuildingSummary> getPortfolioBuildings() {
        return {};
    }

    /** @brief Conditional recurring obligations (collection set-out/retrieval). */
    virtual std::vector<CollectionRule> getCollectionRules() {
        return {};
    }
};

} // namespace fieldplan::domain
