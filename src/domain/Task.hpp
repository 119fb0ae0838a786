/**
 * @file Task.hpp
 * @brief Domain entity representing an assigned unit of work.
 */

#pragma once

#include <optional>
#include <string>

#include "CalendarTime.hpp"

namespace fieldplan::domain {

/**
 * @enum TaskUrgency
 * @brief Totally ordered urgency scale (Low < ... < Emergency).
 */
enum class TaskUrgency {
    Low = 0,
    Normal,
    High,
    Urgent,
    Critical,
    Emergency
};

inline int UrgencyRank(TaskUrgency urgency) {
    return static_cast<int>(urgency);
}

inline std::string UrgencyToString(TaskUrgency urgency) {
    switch (urgency) {
        case TaskUrgency::Low: return "low";
        case TaskUrgency::Normal: return "normal";
        case TaskUrgency::High: return "high";
        case TaskUrgency::Urgent: return "urgent";
        case TaskUrgency::Critical: return "critical";
        case TaskUrgency::Emergency: return "emergency";
        default: return "normal";
    }
}

inline TaskUrgency UrgencyFromString(const std::string& value) {
    if (value == "low") return TaskUrgency::Low;
    if (value == "high") return TaskUrgency::High;
    if (value == "urgent") return TaskUrgency::Urgent;
    if (value == "critical") return TaskUrgency::Critical;
    if (value == "emergency") return TaskUrgency::Emergency;
    return TaskUrgency::Normal;
}

/**
 * @enum TaskCategory
 * @brief Work category; drives the weather sensitivity profile.
 */
enum class TaskCategory {
    Cleaning,
    Sanitation,
    Operations,
    Maintenance,
    Inspection,
    Repair,
    Unknown
};

inline std::string CategoryToString(TaskCategory category) {
    switch (category) {
        case TaskCategory::Cleaning: return "cleaning";
        case TaskCategory::Sanitation: return "sanitation";
        case TaskCategory::Operations: return "operations";
        case TaskCategory::Maintenance: return "maintenance";
        case TaskCategory::Inspection: return "inspection";
        case TaskCategory::Repair: return "repair";
        default: return "unknown";
    }
}

inline TaskCategory CategoryFromString(const std::string& value) {
    std::string v;
    for (char c : value) v.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
    if (v == "cleaning") return TaskCategory::Cleaning;
    if (v == "sanitation") return TaskCategory::Sanitation;
    if (v == "operations") return TaskCategory::Operations;
    if (v == "maintenance") return TaskCategory::Maintenance;
    if (v == "inspection") return TaskCategory::Inspection;
    if (v == "repair") return TaskCategory::Repair;
    return TaskCategory::Unknown;
}

/**
 * @struct Task
 * @brief A one-off (ad-hoc) or derived work item.
 *
 * buildingId is absent for tasks not yet resolved to a location.
 */
struct Task {
    std::string id;
    std::string title;
    std::optional<std::string> buildingId;
    std::optional<TimePoint> dueTime;
    TaskUrgency urgency = TaskUrgency::Normal;
    bool isCompleted = false;
    TaskCategory category = TaskCategory::Unknown;
    bool requiresPhoto = false;
    std::optional<int> estimatedDurationMinutes;
};

} // namespace fieldplan::domain
