/**
 * @file PlanRules.hpp
 * @brief Declarative rule tables evaluated uniformly by the planner.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "CalendarTime.hpp"
#include "Task.hpp"

namespace fieldplan::domain {

/** @brief True when a rule's worker selector matches (empty or "*" matches anyone). */
inline bool WorkerSelectorMatches(const std::string& selector, const std::string& workerId) {
    return selector.empty() || selector == "*" || selector == workerId;
}

/**
 * @enum CollectionRuleKind
 * @brief SetOut fires on collection days; Retrieval fires the following day.
 */
enum class CollectionRuleKind {
    SetOut,
    Retrieval
};

/**
 * @struct CollectionRule
 * @brief "On days D, inject task T at window W for buildings G."
 */
struct CollectionRule {
    std::string id;
    std::string title = "Collection set-out";
    CollectionRuleKind kind = CollectionRuleKind::SetOut;
    std::string appliesToWorker;
    std::set<Weekday> collectionDays;
    int windowStartMinute = 20 * 60; ///< Minutes after midnight.
    int windowEndMinute = 21 * 60;
    std::vector<std::string> buildingGroup;
    TaskCategory category = TaskCategory::Sanitation;
    TaskUrgency urgency = TaskUrgency::Urgent;

    /** @brief Synthetic identifier shared by every entry this rule injects. */
    std::string circuitId() const { return "circuit:" + id; }

    /** @brief True when the rule fires on the given weekday. */
    bool firesOn(Weekday day) const {
        if (kind == CollectionRuleKind::Retrieval) {
            return collectionDays.count(PreviousWeekday(day)) > 0;
        }
        return collectionDays.count(day) > 0;
    }

    bool coversBuilding(const std::string& buildingId) const {
        for (const auto& id : buildingGroup) {
            if (id == buildingId) return true;
        }
        return false;
    }
};

/**
 * @struct PhotoPolicyRule
 * @brief Overrides the photo-evidence requirement for matching tasks.
 *
 * An absent buildingId matches every building.
 */
struct PhotoPolicyRule {
    std::string appliesToWorker;
    std::optional<std::string> buildingId;
    bool requiresPhoto = true;

    bool matches(const std::string& workerId, const std::optional<std::string>& taskBuilding) const {
        if (!WorkerSelectorMatches(appliesToWorker, workerId)) return false;
        if (!buildingId) return true;
        return taskBuilding && *taskBuilding == *buildingId;
    }
};

} // namespace fieldplan::domain
