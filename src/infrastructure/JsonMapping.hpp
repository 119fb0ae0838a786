/**
 * @file JsonMapping.hpp
 * @brief Manual JSON mapping of planner domain types.
 *
 * Timestamps are local wall-clock strings "YYYY-MM-DDTHH:MM", times of day
 * are "HH:MM". Readers throw (nlohmann::json::exception or
 * std::invalid_argument) on malformed values; callers decide how to degrade.
 */

#pragma once

#include <nlohmann/json.hpp>

#include "domain/Building.hpp"
#include "domain/PlanIssue.hpp"
#include "domain/PlanRules.hpp"
#include "domain/Routine.hpp"
#include "domain/ScheduleEntry.hpp"
#include "domain/Task.hpp"
#include "domain/WeatherSnapshot.hpp"
#include "domain/WeatherSuggestion.hpp"

namespace fieldplan::infrastructure {

domain::BuildingSummary BuildingFromJson(const nlohmann::json& j);
domain::Task TaskFromJson(const nlohmann::json& j);
domain::RoutineSchedule RoutineScheduleFromJson(const nlohmann::json& j);
domain::RoutineInstance RoutineInstanceFromJson(const nlohmann::json& j);
domain::RouteSequence RouteSequenceFromJson(const nlohmann::json& j);
domain::WeatherSample WeatherSampleFromJson(const nlohmann::json& j);
domain::WeatherSnapshot WeatherSnapshotFromJson(const nlohmann::json& j);
domain::CollectionRule CollectionRuleFromJson(const nlohmann::json& j);
domain::PhotoPolicyRule PhotoPolicyRuleFromJson(const nlohmann::json& j);

nlohmann::json BuildingToJson(const domain::BuildingSummary& building);
nlohmann::json EntryToJson(const domain::ScheduleEntry& entry);
nlohmann::json ScoredTaskToJson(const domain::ScoredTask& scored);
nlohmann::json SuggestionToJson(const domain::WeatherSuggestion& suggestion);
nlohmann::json IssueToJson(const domain::PlanIssue& issue);

} // namespace fieldplan::infrastructure
