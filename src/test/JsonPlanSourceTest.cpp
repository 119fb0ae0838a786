#include <cassert>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "application/PlanRefreshService.hpp"
#include "infrastructure/JsonPlanSource.hpp"
#include "infrastructure/LocalClock.hpp"
#include "infrastructure/PlanJsonExporter.hpp"

using namespace fieldplan::domain;
using fieldplan::application::PlannerSettings;
using fieldplan::application::PlanRefreshService;
using fieldplan::infrastructure::JsonPlanSource;
using fieldplan::infrastructure::LocalClock;
using fieldplan::infrastructure::PlanJsonExporter;

namespace {

const std::filesystem::path kTestRoot = "test_snapshot_root";
const CivilDate kTuesday(2025, 3, 4);

nlohmann::json Snapshot() {
    return nlohmann::json::parse(R"({
        "buildings": [
            {"id": "B1", "name": "12 West St", "address": "12 West St, New York", "lat": 40.0, "lon": -73.0},
            {"id": "B2", "name": "7 Elm St", "lat": 40.01, "lon": -73.0},
            {"id": "B3", "name": "Closed Annex", "accessible": false}
        ],
        "assignments": {"w1": ["B2", "B1"], "w2": ["B3"]},
        "check_ins": {
            "w1": {"building_id": "B2", "checked_in_at": "2025-03-04T07:30", "expires_at": "2025-03-04T17:00"}
        },
        "routines": [
            {"id": "lobby", "worker_id": "w1", "building_id": "B1", "name": "Lobby sweep",
             "rrule": "FREQ=DAILY;BYHOUR=7", "category": "cleaning"},
            {"id": "broken", "worker_id": "w1", "building_id": "B1", "name": "Broken", "rrule": "FREQ=HOURLY"},
            {"id": "other", "worker_id": "w2", "building_id": "B3", "name": "Other", "rrule": "FREQ=DAILY"}
        ],
        "routine_instances": [
            {"id": "inst-boiler", "worker_id": "w1", "building_id": "B2", "title": "Boiler check",
             "start": "2025-03-04T13:00", "category": "maintenance"}
        ],
        "tasks": [
            {"id": "t-hose", "worker_id": "w1", "title": "Hose sidewalks", "building_id": "B1",
             "due": "2025-03-04T10:00", "category": "cleaning", "urgency": "high"},
            {"id": "t-restock", "worker_id": "w1", "title": "Restock supplies", "requires_photo": true},
            {"id": "t-other", "worker_id": "w2", "title": "Other worker task"}
        ],
        "routes": [
            {"id": "rt1", "worker_id": "w1", "weekday": "tuesday", "building_id": "B1",
             "arrival": "09:00", "duration_minutes": 90,
             "operations": [{"id": "op1", "name": "Trash", "category": "sanitation"}]}
        ],
        "weather": {
            "current": {"temp_f": 55, "condition": "Light rain", "precip_prob": 0.5, "wind_mph": 5,
                        "time": "2025-03-04T08:00"},
            "hourly": [
                {"temp_f": 55, "condition": "Light rain", "precip_prob": 0.5, "wind_mph": 5, "time": "2025-03-04T08:00"},
                {"temp_f": 54, "condition": "Rain", "precip_prob": 0.7, "wind_mph": 8, "time": "2025-03-04T09:00"}
            ]
        },
        "position": {"lat": 40.0, "lon": -73.0},
        "collection_rules": [
            {"id": "dsny", "title": "Set out bins", "days": ["tuesday"], "buildings": ["B1"]}
        ]
    })");
}

void TestSnapshotQueries() {
    std::cout << "[Test] Snapshot queries are scoped to the worker..." << std::endl;
    JsonPlanSource source;
    source.loadFromJson(Snapshot());

    assert(source.firstWorkerId() && *source.firstWorkerId() == "w1");

    auto assigned = source.getAssignedBuildings("w1");
    assert(assigned.size() == 2);
    assert(assigned[0].id == "B2" && assigned[0].name == "7 Elm St");
    assert(assigned[1].id == "B1" && assigned[1].address == "12 West St, New York");
    assert(source.getAssignedBuildings("nobody").empty());
    assert(source.getPortfolioBuildings().size() == 3);
    assert(!source.getPortfolioBuildings()[2].isAccessible);

    // Explicit instance plus the expanded daily routine; the broken rule is skipped.
    auto instances = source.getRoutineInstances("w1", kTuesday, kTuesday);
    assert(instances.size() == 2);
    assert(instances[0].id == "inst-boiler");
    assert(instances[0].endTime == kTuesday.at(14));
    assert(instances[1].id == "lobby@2025-03-04T07:00");
    assert(source.getRoutineInstances("w1", kTuesday, kTuesday.addDays(6)).size() == 8);

    auto tuesdayTasks = source.getTasks("w1", kTuesday);
    assert(tuesdayTasks.size() == 2);
    assert(tuesdayTasks[0].urgency == TaskUrgency::High);
    assert(tuesdayTasks[1].requiresPhoto && !tuesdayTasks[1].buildingId);
    auto wednesdayTasks = source.getTasks("w1", kTuesday.addDays(1));
    assert(wednesdayTasks.size() == 1 && wednesdayTasks[0].id == "t-restock");

    auto routes = source.getRouteSequences("w1", Weekday::Tuesday);
    assert(routes.size() == 1);
    assert(routes[0].arrivalMinuteOfDay == 9 * 60);
    assert(routes[0].estimatedDuration == Minutes(90));
    assert(routes[0].operations.size() == 1 && routes[0].operations[0].category == TaskCategory::Sanitation);
    assert(source.getRouteSequences("w1", Weekday::Monday).empty());

    auto weather = source.getForecast();
    assert(weather && weather->current.precipProb == 0.5 && weather->hourly.size() == 2);
    assert(source.getCurrentPosition() && source.getCurrentPosition()->latitude == 40.0);

    auto checkIn = source.getCheckIn("w1");
    assert(checkIn && checkIn->building.name == "7 Elm St");
    assert(checkIn->isValidAt(kTuesday.at(8)));
    assert(!checkIn->isValidAt(kTuesday.at(17)));
    assert(!source.getCheckIn("w2"));

    auto rules = source.getCollectionRules();
    assert(rules.size() == 1 && rules[0].title == "Set out bins");
}

void TestLoadingFiles() {
    std::cout << "[Test] Loading snapshot files..." << std::endl;
    std::filesystem::create_directories(kTestRoot);

    JsonPlanSource source;
    assert(!source.load(kTestRoot / "missing.json"));

    {
        std::ofstream f(kTestRoot / "snapshot.json");
        f << Snapshot().dump(2);
    }
    assert(source.load(kTestRoot / "snapshot.json"));
    assert(source.getAssignedBuildings("w1").size() == 2);

    {
        std::ofstream f(kTestRoot / "broken.json");
        f << R"({"buildings": [{"id": "B9"}], "routes": [{"id": "r", "weekday": "noday", "arrival": "09:00"}]})";
    }
    // A rejected snapshot leaves the previous one in place.
    assert(!source.load(kTestRoot / "broken.json"));
    assert(source.getPortfolioBuildings().size() == 3);

    std::filesystem::remove_all(kTestRoot);
}

void TestSnapshotToPlanJson() {
    std::cout << "[Test] Snapshot through the refresh service to plan JSON..." << std::endl;
    auto source = std::make_shared<JsonPlanSource>();
    source->loadFromJson(Snapshot());

    PlanRefreshService service(source, PlannerSettings{}, "w1");
    assert(service.refresh(kTuesday, kTuesday.at(8), PlanRefreshService::SteadyClock::time_point{}));
    auto plan = service.latestPlan();

    auto j = PlanJsonExporter::ToJson(*plan);
    assert(j["worker_id"] == "w1");
    assert(j["date"] == "2025-03-04");
    assert(j["generated_at"] == "2025-03-04T08:00");
    assert(j["resolution_source"] == "check_in");
    assert(j["current_building"]["id"] == "B2");
    assert(j["current_building"]["status"] == "current");
    assert(j["weekly_plan"].size() == 7);
    assert(j["weekly_plan"][0]["weekday"] == "tuesday");

    const auto& today = j["weekly_plan"][0]["items"];
    assert(today.size() == 5);
    assert(today[0]["title"] == "Lobby sweep");
    // The undated restock falls inside the 09:00 route stop at B1.
    assert(today[1]["title"] == "Restock supplies" && today[1]["building_id"] == "B1");
    assert(today[4]["circuit_id"] == "circuit:dsny");

    assert(j["deferred_outdoor"].size() == 1);
    assert(j["deferred_outdoor"][0]["id"] == "t-hose");
    // Scored against the 09:00 block, the nearest one to its 10:00 due time.
    assert(j["deferred_outdoor"][0]["chip"] == "heavy_rain");
    assert(!j["ordered_upcoming"].empty());
    assert(j["suggestions"][0]["kind"] == "indoor");
    assert(j["buildings"].size() == 3);
    assert(j["buildings"][2]["status"] == "unavailable");

    auto reparsed = nlohmann::json::parse(PlanJsonExporter::Dump(*plan));
    assert(reparsed == j);
}

void TestLocalClock() {
    std::cout << "[Test] Local clock conversion..." << std::endl;
    setenv("TZ", "UTC", 1);
    tzset();
    auto epoch = LocalClock::ToLocal(std::chrono::system_clock::time_point{});
    assert(epoch == CivilDate(1970, 1, 1).startOfDay());

    auto later = LocalClock::ToLocal(std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365) +
                                     std::chrono::minutes(90) + std::chrono::seconds(7));
    assert(FormatTimePoint(later) == "1971-01-01T01:30");
}

} // namespace

int main() {
    std::cout << "[Test] Starting JsonPlanSource Test..." << std::endl;

    TestSnapshotQueries();
    TestLoadingFiles();
    TestSnapshotToPlanJson();
    TestLocalClock();

    std::cout << "[PASS] JsonPlanSource Test." << std::endl;
    return 0;
}
