/**
 * @file Building.hpp
 * @brief Building summary entity and geographic helpers.
 */

#pragma once

#include <cmath>
#include <string>

namespace fieldplan::domain {

/**
 * @struct Coordinate
 * @brief WGS84 latitude/longitude in degrees.
 */
struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief Great-circle distance in meters (haversine, mean Earth radius).
 */
inline double DistanceMeters(const Coordinate& a, const Coordinate& b) {
    constexpr double kEarthRadiusMeters = 6371000.0;
    constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
    const double dLat = (b.latitude - a.latitude) * kDegToRad;
    const double dLon = (b.longitude - a.longitude) * kDegToRad;
    const double h = std::sin(dLat / 2) * std::sin(dLat / 2) +
                     std::cos(a.latitude * kDegToRad) * std::cos(b.latitude * kDegToRad) *
                     std::sin(dLon / 2) * std::sin(dLon / 2);
    return 2.0 * kEarthRadiusMeters * std::asin(std::sqrt(h));
}

/**
 * @enum BuildingStatus
 * @brief Relationship of a building to the worker at resolution time.
 */
enum class BuildingStatus {
    Current,
    Assigned,
    Available,
    Coverage,
    Unavailable
};

inline std::string BuildingStatusToString(BuildingStatus status) {
    switch (status) {
        case BuildingStatus::Current: return "current";
        case BuildingStatus::Assigned: return "assigned";
        case BuildingStatus::Available: return "available";
        case BuildingStatus::Coverage: return "coverage";
        case BuildingStatus::Unavailable: return "unavailable";
        default: return "available";
    }
}

/**
 * @struct BuildingSummary
 * @brief A building as seen by the planner.
 *
 * status is a view computed at resolution time; it is never stored upstream.
 */
struct BuildingSummary {
    std::string id;
    std::string name;
    std::string address;
    Coordinate coordinate;
    BuildingStatus status = BuildingStatus::Assigned;
    bool isAccessible = true;
};

} // namespace fieldplan::domain
