/**
 * @file BuildingResolver.cpp
 * @brief Implementation of BuildingResolver.
 */

#include "application/BuildingResolver.hpp"

#include <algorithm>
#include <set>

namespace fieldplan::application {

using namespace domain;

BuildingResolver::BuildingResolver(ResolverSettings settings)
    : m_settings(settings) {
    const Minutes lookahead(m_settings.upcomingWindowMinutes);
    const double radius = m_settings.proximityRadiusMeters;

    m_strategies = {
        {ResolutionSource::CheckIn, &BuildingResolver::FromCheckIn},
        {ResolutionSource::ActiveWindow, &BuildingResolver::FromActiveWindow},
        {ResolutionSource::UpcomingWindow,
         [lookahead](const WorkerState& state) { return FromUpcomingWindow(state, lookahead); }},
        {ResolutionSource::Proximity,
         [radius](const WorkerState& state) { return FromProximity(state, radius); }},
        {ResolutionSource::AssignmentOrder, &BuildingResolver::FromAssignmentOrder},
    };
}

std::optional<BuildingSummary> BuildingResolver::resolveCurrentBuilding(
    const std::optional<CheckIn>& explicitCheckIn,
    const std::vector<ScheduleEntry>& todaySchedule,
    const std::optional<Coordinate>& livePosition,
    const std::vector<BuildingSummary>& assignedBuildings,
    TimePoint now) const {
    WorkerState state;
    state.now = now;
    state.checkIn = explicitCheckIn;
    state.todaySchedule = todaySchedule;
    state.livePosition = livePosition;
    state.assignedBuildings = assignedBuildings;
    return resolveCurrentBuilding(state);
}

std::optional<BuildingSummary> BuildingResolver::resolveCurrentBuilding(const WorkerState& state) const {
    return resolveWithSource(state).building;
}

BuildingResolver::Resolution BuildingResolver::resolveWithSource(const WorkerState& state) const {
    for (const auto& strategy : m_strategies) {
        auto building = strategy.resolve(state);
        if (building) {
            return {building, strategy.source};
        }
    }
    return {};
}

std::optional<BuildingSummary> BuildingResolver::FromCheckIn(const WorkerState& state) {
    if (state.checkIn && state.checkIn->isValidAt(state.now)) {
        return state.checkIn->building;
    }
    return std::nullopt;
}

std::optional<BuildingSummary> BuildingResolver::FromActiveWindow(const WorkerState& state) {
    for (const auto& entry : state.todaySchedule) {
        if (entry.buildingId.empty()) continue;
        if (entry.isActiveAt(state.now)) {
            return LookupBuilding(state, entry.buildingId);
        }
    }
    return std::nullopt;
}

std::optional<BuildingSummary> BuildingResolver::FromUpcomingWindow(const WorkerState& state, Minutes lookahead) {
    const ScheduleEntry* earliest = nullptr;
    for (const auto& entry : state.todaySchedule) {
        if (entry.buildingId.empty()) continue;
        if (entry.startTime <= state.now || entry.startTime > state.now + lookahead) continue;
        if (!earliest || entry.startTime < earliest->startTime) {
            earliest = &entry;
        }
    }
    if (!earliest) return std::nullopt;
    return LookupBuilding(state, earliest->buildingId);
}

std::optional<BuildingSummary> BuildingResolver::FromProximity(const WorkerState& state, double radiusMeters) {
    if (!state.livePosition) return std::nullopt;

    const BuildingSummary* best = nullptr;
    double bestDistance = 0.0;
    for (const auto& building : state.assignedBuildings) {
        double distance = DistanceMeters(*state.livePosition, building.coordinate);
        if (distance > radiusMeters) continue;
        if (!best || distance < bestDistance || (distance == bestDistance && building.id < best->id)) {
            best = &building;
            bestDistance = distance;
        }
    }
    if (!best) return std::nullopt;
    return *best;
}

std::optional<BuildingSummary> BuildingResolver::FromAssignmentOrder(const WorkerState& state) {
    if (state.assignedBuildings.empty()) return std::nullopt;
    return state.assignedBuildings.front();
}

BuildingSummary BuildingResolver::LookupBuilding(const WorkerState& state, const std::string& buildingId) {
    for (const auto& building : state.knownBuildings) {
        if (building.id == buildingId) return building;
    }
    for (const auto& building : state.assignedBuildings) {
        if (building.id == buildingId) return building;
    }
    BuildingSummary unknown;
    unknown.id = buildingId;
    return unknown;
}

std::vector<BuildingSummary> BuildingResolver::classifyBuildings(
    const std::vector<BuildingSummary>& portfolio,
    const std::vector<BuildingSummary>& assigned,
    const std::optional<BuildingSummary>& current,
    const std::vector<ScheduleEntry>& todaySchedule) {
    std::set<std::string> assignedIds;
    for (const auto& b : assigned) assignedIds.insert(b.id);

    std::set<std::string> scheduledIds;
    for (const auto& entry : todaySchedule) {
        if (!entry.buildingId.empty()) scheduledIds.insert(entry.buildingId);
    }

    std::vector<BuildingSummary> view;
    std::set<std::string> seen;
    auto append = [&](const BuildingSummary& building) {
        if (!seen.insert(building.id).second) return;
        BuildingSummary b = building;
        if (current && b.id == current->id) {
            b.status = BuildingStatus::Current;
        } else if (!b.isAccessible) {
            b.status = BuildingStatus::Unavailable;
        } else if (assignedIds.count(b.id)) {
            b.status = BuildingStatus::Assigned;
        } else if (scheduledIds.count(b.id)) {
            b.status = BuildingStatus::Coverage;
        } else {
            b.status = BuildingStatus::Available;
        }
        view.push_back(b);
    };

    for (const auto& b : assigned) append(b);
    for (const auto& b : portfolio) append(b);
    if (current) append(*current);

    return view;
}

} // namespace fieldplan::application
