/**
 * @file WorkerState.hpp
 * @brief Snapshot of everything known about a worker's whereabouts.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Building.hpp"
#include "CalendarTime.hpp"
#include "ScheduleEntry.hpp"

namespace fieldplan::domain {

/**
 * @enum ResolutionSource
 * @brief Which step of the resolution cascade picked the current building.
 */
enum class ResolutionSource {
    CheckIn,
    ActiveWindow,
    UpcomingWindow,
    Proximity,
    AssignmentOrder,
    None
};

inline std::string ResolutionSourceToString(ResolutionSource source) {
    switch (source) {
        case ResolutionSource::CheckIn: return "check_in";
        case ResolutionSource::ActiveWindow: return "active_window";
        case ResolutionSource::UpcomingWindow: return "upcoming_window";
        case ResolutionSource::Proximity: return "proximity";
        case ResolutionSource::AssignmentOrder: return "assignment_order";
        case ResolutionSource::None: return "none";
        default: return "none";
    }
}

/**
 * @struct CheckIn
 * @brief An explicit clock-in at a building.
 *
 * A check-in without expiresAt stays valid until the worker clocks out.
 */
struct CheckIn {
    BuildingSummary building;
    TimePoint checkedInAt;
    std::optional<TimePoint> expiresAt;

    bool isValidAt(TimePoint now) const {
        return !expiresAt || now < *expiresAt;
    }
};

/**
 * @struct WorkerState
 * @brief Immutable input of the current-building resolution.
 */
struct WorkerState {
    TimePoint now;
    std::optional<CheckIn> checkIn;
    std::vector<ScheduleEntry> todaySchedule;
    std::optional<Coordinate> livePosition;
    std::vector<BuildingSummary> assignedBuildings;
    std::vector<BuildingSummary> knownBuildings; ///< Lookup table for schedule buildingIds.
};

} // namespace fieldplan::domain
