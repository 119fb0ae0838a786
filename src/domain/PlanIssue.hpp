/**
 * @file PlanIssue.hpp
 * @brief Soft conditions detected while building a plan.
 */

#pragma once

#include <string>

namespace fieldplan::domain {

/**
 * @enum IssueKind
 * @brief None of these abort a plan; they are reported alongside it.
 */
enum class IssueKind {
    MissingData,       ///< A source returned nothing; the planner degraded.
    AmbiguousBuilding, ///< Work could not be attributed to a building.
    InvalidTimeWindow  ///< endTime < startTime; clamped to startTime.
};

inline std::string IssueKindToString(IssueKind kind) {
    switch (kind) {
        case IssueKind::MissingData: return "missing_data";
        case IssueKind::AmbiguousBuilding: return "ambiguous_building";
        case IssueKind::InvalidTimeWindow: return "invalid_time_window";
        default: return "missing_data";
    }
}

struct PlanIssue {
    IssueKind kind = IssueKind::MissingData;
    std::string subjectId;
    std::string message;
};

} // namespace fieldplan::domain
