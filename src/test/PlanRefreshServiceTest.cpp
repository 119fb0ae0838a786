#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "application/PlanRefreshService.hpp"

using namespace fieldplan::domain;
using fieldplan::application::PlannerSettings;
using fieldplan::application::PlanRefreshService;

namespace {

const CivilDate kTuesday(2025, 3, 4);

// In-memory source; can be told to fail individual operations.
class FakePlanSource : public PlanDataSource {
public:
    bool failForecast = false;
    bool failRoutes = false;
    std::atomic<int> taskCalls{0};
    std::vector<Task> extraTasks;

    std::vector<RoutineInstance> getRoutineInstances(const std::string& workerId, const CivilDate& from,
                                                     const CivilDate& to) override {
        assert(workerId == "w1");
        assert(to == from.addDays(6));
        RoutineInstance sweep;
        sweep.id = "r-sweep@2025-03-04T09:00";
        sweep.buildingId = "B1";
        sweep.title = "Sweep";
        sweep.startTime = kTuesday.at(9);
        sweep.endTime = kTuesday.at(9, 30);
        return {sweep};
    }

    std::vector<Task> getTasks(const std::string&, const CivilDate&) override {
        ++taskCalls;
        // Undated work is reported for every requested day.
        Task restock;
        restock.id = "t-restock";
        restock.title = "Restock supplies";
        restock.buildingId = "B1";
        std::vector<Task> tasks = {restock};
        tasks.insert(tasks.end(), extraTasks.begin(), extraTasks.end());
        return tasks;
    }

    std::vector<RouteSequence> getRouteSequences(const std::string&, Weekday weekday) override {
        if (failRoutes) throw std::runtime_error("route service offline");
        if (weekday != Weekday::Tuesday) return {};
        RouteSequence stop;
        stop.id = "rt1";
        stop.weekday = weekday;
        stop.buildingId = "B1";
        stop.arrivalMinuteOfDay = 9 * 60;
        return {stop};
    }

    std::optional<WeatherSnapshot> getForecast() override {
        if (failForecast) throw std::runtime_error("forecast timeout");
        WeatherSnapshot w;
        w.current = {62.0, "Clear", 0.0, 4.0, kTuesday.at(8)};
        return w;
    }

    std::optional<Coordinate> getCurrentPosition() override { return std::nullopt; }

    std::vector<BuildingSummary> getAssignedBuildings(const std::string&) override {
        BuildingSummary b1;
        b1.id = "B1";
        b1.name = "12 West St";
        return {b1};
    }
};

bool HasIssueMentioning(const DailyPlan& plan, const std::string& text) {
    for (const auto& issue : plan.issues) {
        if (issue.kind == IssueKind::MissingData && issue.message.find(text) != std::string::npos) return true;
    }
    return false;
}

void TestRefreshCommitsPlan() {
    std::cout << "[Test] A refresh collects inputs and commits generation 1..." << std::endl;
    auto source = std::make_shared<FakePlanSource>();
    PlanRefreshService service(source, PlannerSettings{}, "w1");
    assert(!service.latestPlan());
    assert(!service.weeklyPlan());
    assert(service.orderedUpcoming().empty());

    auto trigger = PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(100);
    auto generation = service.refresh(kTuesday, kTuesday.at(8), trigger);
    assert(generation && *generation == 1);
    assert(service.committedGeneration() == 1);
    assert(source->taskCalls == 7);

    auto plan = service.latestPlan();
    assert(plan);
    assert(plan->weeklyPlan.days.size() == 7);
    // The undated task is de-duplicated across the seven fetches and lands on today.
    const DaySchedule* today = plan->today();
    assert(today && today->items.size() == 2);
    assert(service.currentBuilding() && service.currentBuilding()->id == "B1");
    assert(service.orderedUpcoming().size() == 2);
    assert(plan->issues.empty());
}

void TestDebounceCoalescesTriggers() {
    std::cout << "[Test] Triggers inside the debounce window are coalesced..." << std::endl;
    PlanRefreshService service(std::make_shared<FakePlanSource>(), PlannerSettings{}, "w1");
    const auto t0 = PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(100);

    auto first = service.beginRefresh(t0);
    assert(!first.coalesced && first.generation == 1);
    auto burst = service.beginRefresh(t0 + std::chrono::milliseconds(300));
    assert(burst.coalesced);
    // Measured from the last accepted trigger, not the coalesced one.
    auto stillBurst = service.beginRefresh(t0 + std::chrono::milliseconds(700));
    assert(stillBurst.coalesced);
    assert(service.pendingDeadline() && *service.pendingDeadline() == t0 + std::chrono::milliseconds(750));
    auto next = service.beginRefresh(t0 + std::chrono::milliseconds(800));
    assert(!next.coalesced && next.generation == 2);
    // The accepted trigger covers the work the burst left pending.
    assert(!service.pendingDeadline());

    assert(!service.refresh(kTuesday, kTuesday.at(8), t0 + std::chrono::milliseconds(900)));
    assert(service.committedGeneration() == 0);
}

void TestBurstEndsWithTrailingRefresh() {
    std::cout << "[Test] A change arriving inside the debounce window reaches the plan..." << std::endl;
    auto source = std::make_shared<FakePlanSource>();
    PlanRefreshService service(source, PlannerSettings{}, "w1");
    const auto t0 = PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(100);

    assert(service.refresh(kTuesday, kTuesday.at(8), t0) == 1u);
    assert(service.orderedUpcoming().size() == 2);
    assert(!service.pendingDeadline());
    assert(!service.flushPending(kTuesday, kTuesday.at(8), t0 + std::chrono::seconds(5)));

    Task mop;
    mop.id = "t-mop";
    mop.title = "Mop stairwell";
    mop.buildingId = "B1";
    source->extraTasks.push_back(mop);

    assert(!service.refresh(kTuesday, kTuesday.at(8), t0 + std::chrono::milliseconds(200)));
    assert(service.pendingDeadline() == t0 + std::chrono::milliseconds(750));

    // Still inside the window: nothing runs yet.
    assert(!service.flushPending(kTuesday, kTuesday.at(8), t0 + std::chrono::milliseconds(500)));
    assert(service.orderedUpcoming().size() == 2);

    auto trailing = service.flushPending(kTuesday, kTuesday.at(8), t0 + std::chrono::milliseconds(750));
    assert(trailing && *trailing == 2);
    assert(service.orderedUpcoming().size() == 3);
    assert(!service.pendingDeadline());
    assert(!service.flushPending(kTuesday, kTuesday.at(8), t0 + std::chrono::seconds(10)));

    // The trailing run opens a fresh window of its own.
    assert(service.beginRefresh(t0 + std::chrono::milliseconds(1000)).coalesced);
}

void TestStaleResultsAreDiscarded() {
    std::cout << "[Test] An older generation finishing last does not replace the newer plan..." << std::endl;
    PlanRefreshService service(std::make_shared<FakePlanSource>(), PlannerSettings{}, "w1");
    const auto t0 = PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(100);

    auto older = service.beginRefresh(t0);
    auto newer = service.beginRefresh(t0 + std::chrono::seconds(2));
    assert(newer.generation > older.generation);

    assert(service.compute(newer.generation, kTuesday, kTuesday.at(10)));
    assert(!service.compute(older.generation, kTuesday, kTuesday.at(8)));
    assert(service.committedGeneration() == newer.generation);
    assert(service.latestPlan()->generatedAt == kTuesday.at(10));

    DailyPlan replay;
    assert(!service.commit(newer.generation, replay));
}

void TestConcurrentComputations() {
    std::cout << "[Test] Concurrent computations leave the newest generation committed..." << std::endl;
    PlanRefreshService service(std::make_shared<FakePlanSource>(), PlannerSettings{}, "w1");
    const auto t0 = PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(100);

    std::vector<uint64_t> generations;
    for (int i = 0; i < 8; ++i) {
        generations.push_back(service.beginRefresh(t0 + std::chrono::seconds(i)).generation);
    }

    std::vector<std::thread> workers;
    for (uint64_t generation : generations) {
        workers.emplace_back([&service, generation]() {
            service.compute(generation, kTuesday, kTuesday.at(8) + Minutes(static_cast<int>(generation)));
        });
    }
    for (auto& t : workers) t.join();

    assert(service.committedGeneration() == generations.back());
    assert(service.latestPlan()->generatedAt == kTuesday.at(8) + Minutes(static_cast<int>(generations.back())));
}

void TestFailingSourceDegrades() {
    std::cout << "[Test] A throwing source operation is reported as missing data..." << std::endl;
    auto source = std::make_shared<FakePlanSource>();
    source->failForecast = true;
    source->failRoutes = true;
    PlanRefreshService service(source, PlannerSettings{}, "w1");

    auto generation = service.refresh(kTuesday, kTuesday.at(8),
                                      PlanRefreshService::SteadyClock::time_point{} + std::chrono::seconds(5));
    assert(generation);
    auto plan = service.latestPlan();
    assert(HasIssueMentioning(*plan, "Forecast unavailable"));
    assert(HasIssueMentioning(*plan, "Route for tuesday unavailable"));
    assert(plan->today()->items.size() == 2);
    assert(plan->suggestions.empty());
}

void TestMissingSource() {
    std::cout << "[Test] Without a data source the plan is empty but committed..." << std::endl;
    PlanRefreshService service(nullptr, PlannerSettings{}, "w1");
    assert(service.refresh(kTuesday, kTuesday.at(8), PlanRefreshService::SteadyClock::time_point{}));
    auto plan = service.latestPlan();
    assert(HasIssueMentioning(*plan, "No data source"));
    assert(!plan->currentBuilding);
}

void TestSettingsRulesAreApplied() {
    std::cout << "[Test] Collection and photo rules from settings reach the plan..." << std::endl;
    PlannerSettings settings;
    CollectionRule setOut;
    setOut.id = "dsny";
    setOut.title = "Set out bins";
    setOut.appliesToWorker = "w1";
    setOut.collectionDays = {Weekday::Tuesday};
    setOut.buildingGroup = {"B1"};
    settings.collectionRules = {setOut};
    PhotoPolicyRule everything;
    everything.requiresPhoto = true;
    settings.photoPolicy = {everything};

    PlanRefreshService service(std::make_shared<FakePlanSource>(), settings, "w1");
    auto inputs = service.collectInputs(kTuesday, kTuesday.at(8));
    assert(inputs.collectionRules.size() == 1);
    assert(inputs.photoPolicy.size() == 1);
    assert(inputs.adHocTasks.size() == 1);
    assert(inputs.routeSequences.size() == 1);

    assert(service.refresh(kTuesday, kTuesday.at(8), PlanRefreshService::SteadyClock::time_point{}));
    auto plan = service.latestPlan();
    assert(plan->today()->items.size() == 3);
    for (const auto& scored : plan->orderedUpcoming) {
        assert(scored.task.requiresPhoto);
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting PlanRefreshService Test..." << std::endl;

    TestRefreshCommitsPlan();
    TestDebounceCoalescesTriggers();
    TestBurstEndsWithTrailingRefresh();
    TestStaleResultsAreDiscarded();
    TestConcurrentComputations();
    TestFailingSourceDegrades();
    TestMissingSource();
    TestSettingsRulesAreApplied();

    std::cout << "[PASS] PlanRefreshService Test." << std::endl;
    return 0;
}
