/**
 * @file BuildingResolver.hpp
 * @brief Resolves the single building a worker is currently attributed to.
 */

#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "application/PlannerSettings.hpp"
#include "domain/Building.hpp"
#include "domain/ScheduleEntry.hpp"
#include "domain/WorkerState.hpp"

namespace fieldplan::application {

/**
 * @class BuildingResolver
 * @brief Ordered strategy chain over a WorkerState snapshot.
 *
 * Strategies are tried in fixed order (check-in, active window, upcoming
 * window, GPS proximity, assignment order); the first one returning a building
 * wins. Resolution never fails: it yields nullopt only when no building
 * information exists at all.
 */
class BuildingResolver {
public:
    using Strategy = std::function<std::optional<domain::BuildingSummary>(const domain::WorkerState&)>;

    struct NamedStrategy {
        domain::ResolutionSource source;
        Strategy resolve;
    };

    struct Resolution {
        std::optional<domain::BuildingSummary> building;
        domain::ResolutionSource source = domain::ResolutionSource::None;
    };

    explicit BuildingResolver(ResolverSettings settings = {});

    /**
     * @brief Classic four-signal entry point.
     * @param now Instant the schedule windows are evaluated against.
     */
    std::optional<domain::BuildingSummary> resolveCurrentBuilding(
        const std::optional<domain::CheckIn>& explicitCheckIn,
        const std::vector<domain::ScheduleEntry>& todaySchedule,
        const std::optional<domain::Coordinate>& livePosition,
        const std::vector<domain::BuildingSummary>& assignedBuildings,
        domain::TimePoint now) const;

    std::optional<domain::BuildingSummary> resolveCurrentBuilding(const domain::WorkerState& state) const;

    /** @brief Same cascade, also reporting which strategy matched. */
    Resolution resolveWithSource(const domain::WorkerState& state) const;

    /**
     * @brief Computes the building status view.
     *
     * Order of the result: assigned buildings, then the rest of the portfolio,
     * then the current building if it appears in neither list.
     */
    static std::vector<domain::BuildingSummary> classifyBuildings(
        const std::vector<domain::BuildingSummary>& portfolio,
        const std::vector<domain::BuildingSummary>& assigned,
        const std::optional<domain::BuildingSummary>& current,
        const std::vector<domain::ScheduleEntry>& todaySchedule);

    const std::vector<NamedStrategy>& strategies() const { return m_strategies; }

    // Individual strategies, exposed for isolated testing.
    static std::optional<domain::BuildingSummary> FromCheckIn(const domain::WorkerState& state);
    static std::optional<domain::BuildingSummary> FromActiveWindow(const domain::WorkerState& state);
    static std::optional<domain::BuildingSummary> FromUpcomingWindow(const domain::WorkerState& state,
                                                                      domain::Minutes lookahead);
    static std::optional<domain::BuildingSummary> FromProximity(const domain::WorkerState& state,
                                                                 double radiusMeters);
    static std::optional<domain::BuildingSummary> FromAssignmentOrder(const domain::WorkerState& state);

private:
    ResolverSettings m_settings;
    std::vector<NamedStrategy> m_strategies;

    static domain::BuildingSummary LookupBuilding(const domain::WorkerState& state, const std::string& buildingId);
};

} // namespace fieldplan::application
