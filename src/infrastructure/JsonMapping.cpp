/**
 * @file JsonMapping.cpp
 * @brief Implementation of the planner JSON mapping.
 */

#include "infrastructure/JsonMapping.hpp"

namespace fieldplan::infrastructure {

using json = nlohmann::json;
using namespace domain;

namespace {

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

std::optional<TimePoint> OptionalTime(const json& j, const char* key) {
    auto text = OptionalString(j, key);
    if (!text || text->empty()) return std::nullopt;
    return ParseTimePoint(*text);
}

} // namespace

BuildingSummary BuildingFromJson(const json& j) {
    BuildingSummary b;
    b.id = j.at("id").get<std::string>();
    b.name = j.value("name", "");
    b.address = j.value("address", "");
    b.coordinate.latitude = j.value("lat", 0.0);
    b.coordinate.longitude = j.value("lon", 0.0);
    b.isAccessible = j.value("accessible", true);
    return b;
}

Task TaskFromJson(const json& j) {
    Task t;
    t.id = j.at("id").get<std::string>();
    t.title = j.value("title", "");
    t.buildingId = OptionalString(j, "building_id");
    if (t.buildingId && t.buildingId->empty()) t.buildingId.reset();
    t.dueTime = OptionalTime(j, "due");
    t.urgency = UrgencyFromString(j.value("urgency", "normal"));
    t.isCompleted = j.value("completed", false);
    t.category = CategoryFromString(j.value("category", "unknown"));
    t.requiresPhoto = j.value("requires_photo", false);
    if (j.contains("duration_minutes")) {
        t.estimatedDurationMinutes = j["duration_minutes"].get<int>();
    }
    return t;
}

RoutineSchedule RoutineScheduleFromJson(const json& j) {
    RoutineSchedule r;
    r.id = j.at("id").get<std::string>();
    r.workerId = j.value("worker_id", "");
    r.buildingId = j.value("building_id", "");
    r.buildingName = j.value("building_name", "");
    r.name = j.value("name", "");
    r.rrule = j.value("rrule", "");
    r.category = CategoryFromString(j.value("category", "unknown"));
    if (j.contains("duration_minutes")) {
        r.estimatedDurationMinutes = j["duration_minutes"].get<int>();
    }
    r.isWeatherDependent = j.value("weather_dependent", false);
    return r;
}

RoutineInstance RoutineInstanceFromJson(const json& j) {
    RoutineInstance r;
    r.id = j.at("id").get<std::string>();
    r.routineId = j.value("routine_id", "");
    r.buildingId = j.value("building_id", "");
    r.title = j.value("title", "");
    r.startTime = ParseTimePoint(j.at("start").get<std::string>());
    auto end = OptionalTime(j, "end");
    r.endTime = end ? *end : r.startTime + Minutes(60);
    r.category = CategoryFromString(j.value("category", "unknown"));
    r.isWeatherDependent = j.value("weather_dependent", false);
    return r;
}

RouteSequence RouteSequenceFromJson(const json& j) {
    RouteSequence r;
    r.id = j.at("id").get<std::string>();
    r.weekday = WeekdayFromString(j.at("weekday").get<std::string>());
    r.buildingId = j.value("building_id", "");
    r.buildingName = j.value("building_name", "");
    r.arrivalMinuteOfDay = ParseMinuteOfDay(j.at("arrival").get<std::string>());
    r.estimatedDuration = Minutes(j.value("duration_minutes", 60));
    if (j.contains("operations")) {
        for (const auto& op : j["operations"]) {
            OperationTask task;
            task.id = op.value("id", "");
            task.name = op.value("name", "");
            task.category = CategoryFromString(op.value("category", "unknown"));
            task.isWeatherSensitive = op.value("weather_sensitive", false);
            task.requiresPhoto = op.value("requires_photo", false);
            r.operations.push_back(task);
        }
    }
    return r;
}

WeatherSample WeatherSampleFromJson(const json& j) {
    WeatherSample s;
    s.tempF = j.value("temp_f", 60.0);
    s.condition = j.value("condition", "");
    s.precipProb = j.value("precip_prob", 0.0);
    s.windMph = j.value("wind_mph", 0.0);
    s.timestamp = ParseTimePoint(j.at("time").get<std::string>());
    return s;
}

WeatherSnapshot WeatherSnapshotFromJson(const json& j) {
    WeatherSnapshot w;
    w.current = WeatherSampleFromJson(j.at("current"));
    if (j.contains("hourly")) {
        for (const auto& block : j["hourly"]) {
            w.hourly.push_back(WeatherSampleFromJson(block));
        }
    }
    return w;
}

CollectionRule CollectionRuleFromJson(const json& j) {
    CollectionRule rule;
    rule.id = j.at("id").get<std::string>();
    rule.kind = j.value("kind", "set_out") == "retrieval" ? CollectionRuleKind::Retrieval : CollectionRuleKind::SetOut;
    rule.title = j.value("title", rule.kind == CollectionRuleKind::Retrieval ? "Bring in bins" : "Collection set-out");
    rule.appliesToWorker = j.value("worker", "*");
    for (const auto& day : j.at("days")) {
        rule.collectionDays.insert(WeekdayFromString(day.get<std::string>()));
    }
    rule.windowStartMinute = ParseMinuteOfDay(j.value("window_start", "20:00"));
    rule.windowEndMinute = ParseMinuteOfDay(j.value("window_end", "21:00"));
    rule.buildingGroup = j.value("buildings", std::vector<std::string>{});
    rule.category = CategoryFromString(j.value("category", "sanitation"));
    rule.urgency = UrgencyFromString(j.value("urgency", "urgent"));
    return rule;
}

PhotoPolicyRule PhotoPolicyRuleFromJson(const json& j) {
    PhotoPolicyRule rule;
    rule.appliesToWorker = j.value("worker", "*");
    rule.buildingId = OptionalString(j, "building_id");
    rule.requiresPhoto = j.value("requires_photo", true);
    return rule;
}

json BuildingToJson(const BuildingSummary& building) {
    return {
        {"id", building.id},
        {"name", building.name},
        {"address", building.address},
        {"lat", building.coordinate.latitude},
        {"lon", building.coordinate.longitude},
        {"status", BuildingStatusToString(building.status)}
    };
}

json EntryToJson(const ScheduleEntry& entry) {
    json j = {
        {"id", entry.id},
        {"building_id", entry.buildingId},
        {"title", entry.title},
        {"start", FormatTimePoint(entry.startTime)},
        {"end", FormatTimePoint(entry.endTime)},
        {"task_count", entry.taskCount},
        {"source", EntrySourceToString(entry.source)},
        {"category", CategoryToString(entry.category)},
        {"urgency", UrgencyToString(entry.urgency)},
        {"completed", entry.isCompleted},
        {"requires_photo", entry.requiresPhoto}
    };
    if (!entry.circuitId.empty()) j["circuit_id"] = entry.circuitId;
    if (entry.timeWindowClamped) j["time_window_clamped"] = true;
    return j;
}

json ScoredTaskToJson(const ScoredTask& scored) {
    json j = {
        {"id", scored.task.id},
        {"title", scored.task.title},
        {"building_id", scored.task.buildingId.value_or("")},
        {"score", scored.score},
        {"urgency", UrgencyToString(scored.task.urgency)},
        {"category", CategoryToString(scored.task.category)},
        {"requires_photo", scored.task.requiresPhoto},
        {"outdoor", scored.isOutdoor}
    };
    if (scored.task.dueTime) j["due"] = FormatTimePoint(*scored.task.dueTime);
    if (scored.chip) j["chip"] = WeatherChipToString(*scored.chip);
    if (!scored.advice.empty()) j["advice"] = scored.advice;
    return j;
}

json SuggestionToJson(const WeatherSuggestion& suggestion) {
    json j = {
        {"id", suggestion.id},
        {"kind", SuggestionKindToString(suggestion.kind)},
        {"title", suggestion.title},
        {"subtitle", suggestion.subtitle},
        {"rationale", suggestion.rationale},
        {"template", suggestion.templateId},
        {"checklist", suggestion.checklist},
        {"building_id", suggestion.buildingId}
    };
    if (suggestion.dueBy) j["due_by"] = FormatTimePoint(*suggestion.dueBy);
    return j;
}

json IssueToJson(const PlanIssue& issue) {
    return {
        {"kind", IssueKindToString(issue.kind)},
        {"subject", issue.subjectId},
        {"message", issue.message}
    };
}

} // namespace fieldplan::infrastructure
