/**
 * @file JsonPlanSource.cpp
 * @brief Implementation of JsonPlanSource.
 */

#include "infrastructure/JsonPlanSource.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <fstream>
#include <iostream>
#include <utility>

namespace fieldplan::infrastructure {

using json = nlohmann::json;
using namespace domain;

bool JsonPlanSource::load(const std::filesystem::path& snapshotPath) {
    std::ifstream f(snapshotPath);
    if (!f.is_open()) {
        std::cerr << "[JsonPlanSource] Cannot open snapshot " << snapshotPath.string() << std::endl;
        return false;
    }

    try {
        json j;
        f >> j;
        loadFromJson(j);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[JsonPlanSource] Error reading snapshot " << snapshotPath.string() << ": " << e.what() << std::endl;
    }
    return false;
}

void JsonPlanSource::loadFromJson(const json& j) {
    JsonPlanSource next;

    if (j.contains("buildings")) {
        for (const auto& b : j["buildings"]) next.m_buildings.push_back(BuildingFromJson(b));
    }
    if (j.contains("assignments")) {
        for (auto it = j["assignments"].begin(); it != j["assignments"].end(); ++it) {
            next.m_assignments[it.key()] = it.value().get<std::vector<std::string>>();
        }
    }
    if (j.contains("routines")) {
        for (const auto& r : j["routines"]) next.m_routines.push_back(RoutineScheduleFromJson(r));
    }
    if (j.contains("routine_instances")) {
        for (const auto& r : j["routine_instances"]) {
            next.m_instances.push_back({r.value("worker_id", ""), RoutineInstanceFromJson(r)});
        }
    }
    if (j.contains("tasks")) {
        for (const auto& t : j["tasks"]) {
            next.m_tasks.push_back({t.value("worker_id", ""), TaskFromJson(t)});
        }
    }
    if (j.contains("routes")) {
        for (const auto& r : j["routes"]) {
            next.m_routes.push_back({r.value("worker_id", ""), RouteSequenceFromJson(r)});
        }
    }
    if (j.contains("weather") && !j["weather"].is_null()) {
        next.m_weather = WeatherSnapshotFromJson(j["weather"]);
    }
    if (j.contains("position") && !j["position"].is_null()) {
        next.m_position = Coordinate{j["position"].at("lat").get<double>(), j["position"].at("lon").get<double>()};
    }
    if (j.contains("collection_rules")) {
        for (const auto& rule : j["collection_rules"]) next.m_collectionRules.push_back(CollectionRuleFromJson(rule));
    }
    // Check-ins reference buildings, so they are read last.
    if (j.contains("check_ins")) {
        for (auto it = j["check_ins"].begin(); it != j["check_ins"].end(); ++it) {
            const auto& c = it.value();
            CheckIn checkIn;
            checkIn.building = next.findBuilding(c.at("building_id").get<std::string>());
            checkIn.checkedInAt = ParseTimePoint(c.at("checked_in_at").get<std::string>());
            if (c.contains("expires_at") && !c["expires_at"].is_null()) {
                checkIn.expiresAt = ParseTimePoint(c["expires_at"].get<std::string>());
            }
            next.m_checkIns[it.key()] = checkIn;
        }
    }

    *this = std::move(next);
}

std::optional<std::string> JsonPlanSource::firstWorkerId() const {
    if (m_assignments.empty()) return std::nullopt;
    return m_assignments.begin()->first;
}

std::vector<RoutineInstance> JsonPlanSource::getRoutineInstances(const std::string& workerId,
                                                                 const CivilDate& from,
                                                                 const CivilDate& to) {
    std::vector<RoutineInstance> out;
    for (const auto& item : m_instances) {
        if (item.workerId != workerId) continue;
        const CivilDate day = CivilDate::fromTimePoint(item.instance.startTime);
        if (day < from || to < day) continue;
        out.push_back(item.instance);
    }

    std::vector<RoutineSchedule> routines;
    for (const auto& routine : m_routines) {
        if (routine.workerId == workerId) routines.push_back(routine);
    }
    auto expanded = m_expander.expandAll(routines, from, to);
    out.insert(out.end(), expanded.begin(), expanded.end());
    return out;
}

std::vector<Task> JsonPlanSource::getTasks(const std::string& workerId, const CivilDate& date) {
    std::vector<Task> out;
    for (const auto& item : m_tasks) {
        if (item.workerId != workerId) continue;
        // Undated tasks are open every day; the planner assigns them to today.
        if (item.task.dueTime && !date.contains(*item.task.dueTime)) continue;
        out.push_back(item.task);
    }
    return out;
}

std::vector<RouteSequence> JsonPlanSource::getRouteSequences(const std::string& workerId, Weekday weekday) {
    std::vector<RouteSequence> out;
    for (const auto& item : m_routes) {
        if (item.workerId == workerId && item.route.weekday == weekday) out.push_back(item.route);
    }
    return out;
}

std::optional<WeatherSnapshot> JsonPlanSource::getForecast() {
    return m_weather;
}

std::optional<Coordinate> JsonPlanSource::getCurrentPosition() {
    return m_position;
}

std::vector<BuildingSummary> JsonPlanSource::getAssignedBuildings(const std::string& workerId) {
    std::vector<BuildingSummary> out;
    auto it = m_assignments.find(workerId);
    if (it == m_assignments.end()) return out;
    for (const auto& id : it->second) {
        out.push_back(findBuilding(id));
    }
    return out;
}

std::vector<BuildingSummary> JsonPlanSource::getPortfolioBuildings() {
    return m_buildings;
}

std::optional<CheckIn> JsonPlanSource::getCheckIn(const std::string& workerId) {
    auto it = m_checkIns.find(workerId);
    if (it == m_checkIns.end()) return std::nullopt;
    return it->second;
}

std::vector<CollectionRule> JsonPlanSource::getCollectionRules() {
    return m_collectionRules;
}

BuildingSummary JsonPlanSource::findBuilding(const std::string& id) const {
    for (const auto& b : m_buildings) {
        if (b.id == id) return b;
    }
    BuildingSummary unknown;
    unknown.id = id;
    unknown.name = id;
    return unknown;
}

} // namespace fieldplan::infrastructure
