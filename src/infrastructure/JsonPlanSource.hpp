/**
 * @file JsonPlanSource.hpp
 * @brief PlanDataSource backed by a JSON snapshot file.
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/RoutineExpander.hpp"
#include "domain/PlanDataSource.hpp"

namespace fieldplan::infrastructure {

/**
 * @class JsonPlanSource
 * @brief Serves planner inputs from an in-memory snapshot.
 *
 * Snapshot keys: buildings, assignments, check_ins, routines (RRULE
 * definitions), routine_instances, tasks, routes, weather, position,
 * collection_rules. Every key is optional.
 */
class JsonPlanSource : public domain::PlanDataSource {
public:
    JsonPlanSource() = default;

    /** @brief Loads a snapshot file. Returns false (and logs) on I/O or parse errors. */
    bool load(const std::filesystem::path& snapshotPath);

    /**
     * @brief Replaces the snapshot with a parsed document.
     * @throws nlohmann::json::exception or std::invalid_argument on malformed content.
     */
    void loadFromJson(const nlohmann::json& j);

    /** @brief First worker of the assignments table, used when none is requested. */
    std::optional<std::string> firstWorkerId() const;

    std::vector<domain::RoutineInstance> getRoutineInstances(const std::string& workerId,
                                                             const domain::CivilDate& from,
                                                             const domain::CivilDate& to) override;
    std::vector<domain::Task> getTasks(const std::string& workerId, const domain::CivilDate& date) override;
    std::vector<domain::RouteSequence> getRouteSequences(const std::string& workerId, domain::Weekday weekday) override;
    std::optional<domain::WeatherSnapshot> getForecast() override;
    std::optional<domain::Coordinate> getCurrentPosition() override;
    std::vector<domain::BuildingSummary> getAssignedBuildings(const std::string& workerId) override;
    std::vector<domain::BuildingSummary> getPortfolioBuildings() override;
    std::optional<domain::CheckIn> getCheckIn(const std::string& workerId) override;
    std::vector<domain::CollectionRule> getCollectionRules() override;

private:
    struct WorkerTask {
        std::string workerId;
        domain::Task task;
    };
    struct WorkerInstance {
        std::string workerId;
        domain::RoutineInstance instance;
    };
    struct WorkerRoute {
        std::string workerId;
        domain::RouteSequence route;
    };

    std::vector<domain::BuildingSummary> m_buildings;
    std::map<std::string, std::vector<std::string>> m_assignments;
    std::map<std::string, domain::CheckIn> m_checkIns;
    std::vector<domain::RoutineSchedule> m_routines;
    std::vector<WorkerInstance> m_instances;
    std::vector<WorkerTask> m_tasks;
    std::vector<WorkerRoute> m_routes;
    std::optional<domain::WeatherSnapshot> m_weather;
    std::optional<domain::Coordinate> m_position;
    std::vector<domain::CollectionRule> m_collectionRules;

    application::RoutineExpander m_expander;

    domain::BuildingSummary findBuilding(const std::string& id) const;
};

} // namespace fieldplan::infrastructure
