/**
 * @file PlanJsonExporter.cpp
 * @brief Implementation of PlanJsonExporter.
 */

#include "infrastructure/PlanJsonExporter.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace fieldplan::infrastructure {

using json = nlohmann::json;
using namespace domain;

json PlanJsonExporter::ToJson(const DailyPlan& plan) {
    json j;
    j["worker_id"] = plan.workerId;
    j["date"] = plan.date.toString();
    j["generated_at"] = FormatTimePoint(plan.generatedAt);
    j["resolution_source"] = ResolutionSourceToString(plan.resolutionSource);
    j["current_building"] = plan.currentBuilding ? BuildingToJson(*plan.currentBuilding) : json(nullptr);

    json days = json::array();
    for (const auto& day : plan.weeklyPlan.days) {
        json items = json::array();
        for (const auto& entry : day.items) items.push_back(EntryToJson(entry));
        days.push_back({
            {"date", day.date.toString()},
            {"weekday", WeekdayToString(day.date.weekday())},
            {"total_hours", day.totalHours},
            {"items", items}
        });
    }
    j["weekly_plan"] = days;

    json buildings = json::array();
    for (const auto& b : plan.buildings) buildings.push_back(BuildingToJson(b));
    j["buildings"] = buildings;

    json upcoming = json::array();
    for (const auto& t : plan.orderedUpcoming) upcoming.push_back(ScoredTaskToJson(t));
    j["ordered_upcoming"] = upcoming;

    json deferred = json::array();
    for (const auto& t : plan.deferredOutdoor) deferred.push_back(ScoredTaskToJson(t));
    j["deferred_outdoor"] = deferred;

    json suggestions = json::array();
    for (const auto& s : plan.suggestions) suggestions.push_back(SuggestionToJson(s));
    j["suggestions"] = suggestions;

    json issues = json::array();
    for (const auto& issue : plan.issues) issues.push_back(IssueToJson(issue));
    j["issues"] = issues;

    return j;
}

std::string PlanJsonExporter::Dump(const DailyPlan& plan) {
    return ToJson(plan).dump(4);
}

} // namespace fieldplan::infrastructure
