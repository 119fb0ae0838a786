/**
 * @file PlanRefreshService.cpp
 * @brief Implementation of PlanRefreshService.
 */

#include "application/PlanRefreshService.hpp"

#include <iostream>
#include <set>
#include <utility>

namespace fieldplan::application {

using namespace domain;

namespace {

/// Runs one source operation; a throwing source degrades to the fallback value.
template <typename T, typename F>
T Fetch(const std::string& what, const std::string& workerId, std::vector<PlanIssue>& issues, F&& fetch) {
    try {
        return fetch();
    } catch (const std::exception& e) {
        std::cerr << "[PlanRefreshService] " << what << " failed: " << e.what() << std::endl;
        issues.push_back({IssueKind::MissingData, workerId, what + " unavailable: " + e.what()});
        return T{};
    }
}

} // namespace

PlanRefreshService::PlanRefreshService(std::shared_ptr<PlanDataSource> source,
                                       PlannerSettings settings,
                                       std::string workerId)
    : m_source(std::move(source)),
      m_settings(settings),
      m_orchestrator(settings),
      m_workerId(std::move(workerId)),
      m_debounce(settings.refresh.debounceMs) {}

PlanRefreshService::RefreshTicket PlanRefreshService::beginRefresh(SteadyClock::time_point trigger) {
    std::lock_guard<std::mutex> lock(m_triggerMutex);
    if (m_lastAcceptedTrigger && trigger >= *m_lastAcceptedTrigger && trigger - *m_lastAcceptedTrigger < m_debounce) {
        m_trailingPending = true;
        return {0, true};
    }
    m_lastAcceptedTrigger = trigger;
    m_trailingPending = false;
    return {++m_nextGeneration, false};
}

std::optional<PlanRefreshService::SteadyClock::time_point> PlanRefreshService::pendingDeadline() const {
    std::lock_guard<std::mutex> lock(m_triggerMutex);
    if (!m_trailingPending || !m_lastAcceptedTrigger) return std::nullopt;
    return *m_lastAcceptedTrigger + m_debounce;
}

std::optional<PlanRefreshService::RefreshTicket> PlanRefreshService::takePendingRefresh(SteadyClock::time_point at) {
    std::lock_guard<std::mutex> lock(m_triggerMutex);
    if (!m_trailingPending || !m_lastAcceptedTrigger) return std::nullopt;
    if (at < *m_lastAcceptedTrigger + m_debounce) return std::nullopt;

    // The trailing run counts as an accepted trigger and opens a new window.
    m_lastAcceptedTrigger = at;
    m_trailingPending = false;
    return RefreshTicket{++m_nextGeneration, false};
}

bool PlanRefreshService::commit(uint64_t generation, DailyPlan plan) {
    std::lock_guard<std::mutex> lock(m_planMutex);
    if (generation <= m_committedGeneration) {
        std::cout << "[PlanRefreshService] Discarding stale generation " << generation
                  << " (committed " << m_committedGeneration << ")" << std::endl;
        return false;
    }
    m_plan = std::make_shared<const DailyPlan>(std::move(plan));
    m_committedGeneration = generation;
    return true;
}

PlanInputs PlanRefreshService::collectInputs(const CivilDate& date, TimePoint now) const {
    PlanInputs inputs;
    inputs.now = now;
    auto& issues = inputs.knownIssues;
    const CivilDate last = date.addDays(DailyPlanOrchestrator::kPlanDays - 1);

    if (!m_source) {
        issues.push_back({IssueKind::MissingData, m_workerId, "No data source configured"});
    } else {
        inputs.routineInstances = Fetch<std::vector<RoutineInstance>>("Routine instances", m_workerId, issues,
            [&] { return m_source->getRoutineInstances(m_workerId, date, last); });

        std::set<std::string> seenTasks;
        std::set<std::string> seenRoutes;
        for (int offset = 0; offset < DailyPlanOrchestrator::kPlanDays; ++offset) {
            const CivilDate day = date.addDays(offset);
            auto tasks = Fetch<std::vector<Task>>("Tasks for " + day.toString(), m_workerId, issues,
                [&] { return m_source->getTasks(m_workerId, day); });
            for (auto& task : tasks) {
                if (seenTasks.insert(task.id).second) inputs.adHocTasks.push_back(std::move(task));
            }

            auto routes = Fetch<std::vector<RouteSequence>>("Route for " + WeekdayToString(day.weekday()), m_workerId,
                issues, [&] { return m_source->getRouteSequences(m_workerId, day.weekday()); });
            for (auto& route : routes) {
                route.weekday = day.weekday();
                if (seenRoutes.insert(route.id + "@" + WeekdayToString(route.weekday)).second) {
                    inputs.routeSequences.push_back(std::move(route));
                }
            }
        }

        inputs.weather = Fetch<std::optional<WeatherSnapshot>>("Forecast", m_workerId, issues,
            [&] { return m_source->getForecast(); });
        inputs.livePosition = Fetch<std::optional<Coordinate>>("Position", m_workerId, issues,
            [&] { return m_source->getCurrentPosition(); });
        inputs.assignedBuildings = Fetch<std::vector<BuildingSummary>>("Assigned buildings", m_workerId, issues,
            [&] { return m_source->getAssignedBuildings(m_workerId); });
        inputs.portfolioBuildings = Fetch<std::vector<BuildingSummary>>("Portfolio", m_workerId, issues,
            [&] { return m_source->getPortfolioBuildings(); });
        inputs.checkIn = Fetch<std::optional<CheckIn>>("Check-in", m_workerId, issues,
            [&] { return m_source->getCheckIn(m_workerId); });
        inputs.collectionRules = Fetch<std::vector<CollectionRule>>("Collection rules", m_workerId, issues,
            [&] { return m_source->getCollectionRules(); });
    }

    inputs.collectionRules.insert(inputs.collectionRules.end(),
                                  m_settings.collectionRules.begin(), m_settings.collectionRules.end());
    inputs.photoPolicy = m_settings.photoPolicy;
    return inputs;
}

bool PlanRefreshService::compute(uint64_t generation, const CivilDate& date, TimePoint now) {
    try {
        PlanInputs inputs = collectInputs(date, now);
        DailyPlan plan = m_orchestrator.buildPlan(m_workerId, date, inputs);
        return commit(generation, std::move(plan));
    } catch (const std::exception& e) {
        std::cerr << "[PlanRefreshService] Generation " << generation << " failed, keeping previous plan: "
                  << e.what() << std::endl;
        return false;
    }
}

std::optional<uint64_t> PlanRefreshService::refresh(const CivilDate& date, TimePoint now,
                                                    SteadyClock::time_point trigger) {
    RefreshTicket ticket = beginRefresh(trigger);
    if (ticket.coalesced) return std::nullopt;
    if (!compute(ticket.generation, date, now)) return std::nullopt;
    return ticket.generation;
}

std::optional<uint64_t> PlanRefreshService::flushPending(const CivilDate& date, TimePoint now,
                                                         SteadyClock::time_point at) {
    auto ticket = takePendingRefresh(at);
    if (!ticket) return std::nullopt;
    if (!compute(ticket->generation, date, now)) return std::nullopt;
    return ticket->generation;
}

std::shared_ptr<const DailyPlan> PlanRefreshService::latestPlan() const {
    std::lock_guard<std::mutex> lock(m_planMutex);
    return m_plan;
}

std::optional<WeeklyPlan> PlanRefreshService::weeklyPlan() const {
    auto plan = latestPlan();
    if (!plan) return std::nullopt;
    return plan->weeklyPlan;
}

std::optional<BuildingSummary> PlanRefreshService::currentBuilding() const {
    auto plan = latestPlan();
    if (!plan) return std::nullopt;
    return plan->currentBuilding;
}

std::vector<ScoredTask> PlanRefreshService::orderedUpcoming() const {
    auto plan = latestPlan();
    if (!plan) return {};
    return plan->orderedUpcoming;
}

uint64_t PlanRefreshService::committedGeneration() const {
    std::lock_guard<std::mutex> lock(m_planMutex);
    return m_committedGeneration;
}

} // namespace fieldplan::application
