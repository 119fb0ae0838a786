/**
 * @file DailyPlanOrchestrator.cpp
 * @brief Implementation of DailyPlanOrchestrator.
 */

#include "application/DailyPlanOrchestrator.hpp"

#include <utility>

namespace fieldplan::application {

using namespace domain;

DailyPlanOrchestrator::DailyPlanOrchestrator(PlannerSettings settings)
    : m_settings(std::move(settings)),
      m_resolver(m_settings.resolver),
      m_merger(m_settings.merger),
      m_weather(m_settings.weather) {}

DailyPlan DailyPlanOrchestrator::buildPlan(const std::string& workerId,
                                           const CivilDate& date,
                                           const PlanInputs& inputs) const {
    date.validate();

    DailyPlan plan;
    plan.workerId = workerId;
    plan.date = date;
    plan.generatedAt = inputs.now;
    plan.issues = inputs.knownIssues;

    if (inputs.routineInstances.empty() && inputs.adHocTasks.empty() && inputs.routeSequences.empty()) {
        plan.issues.push_back({IssueKind::MissingData, workerId, "No routine, task or route data"});
    }
    if (inputs.assignedBuildings.empty()) {
        plan.issues.push_back({IssueKind::MissingData, workerId, "No assigned buildings"});
    }

    std::vector<CollectionRule> rules;
    for (const auto& rule : inputs.collectionRules) {
        if (WorkerSelectorMatches(rule.appliesToWorker, workerId)) rules.push_back(rule);
    }

    std::optional<std::string> fallbackBuilding;
    if (inputs.checkIn && inputs.checkIn->isValidAt(inputs.now)) {
        fallbackBuilding = inputs.checkIn->building.id;
    }

    for (int offset = 0; offset < kPlanDays; ++offset) {
        plan.weeklyPlan.days.push_back(
            buildDay(workerId, date.addDays(offset), offset == 0, inputs, rules, fallbackBuilding, plan.issues));
    }
    const DaySchedule& today = plan.weeklyPlan.days.front();

    WorkerState state;
    state.now = inputs.now;
    state.checkIn = inputs.checkIn;
    state.todaySchedule = today.items;
    state.livePosition = inputs.livePosition;
    state.assignedBuildings = inputs.assignedBuildings;
    state.knownBuildings = inputs.portfolioBuildings;

    auto resolution = m_resolver.resolveWithSource(state);
    plan.currentBuilding = resolution.building;
    plan.resolutionSource = resolution.source;
    if (plan.currentBuilding) {
        plan.currentBuilding->status = BuildingStatus::Current;
    }
    plan.buildings = BuildingResolver::classifyBuildings(inputs.portfolioBuildings, inputs.assignedBuildings,
                                                         plan.currentBuilding, today.items);

    const auto candidates = candidateTasks(workerId, today, inputs);
    OrderingResult ordering;
    if (inputs.weather) {
        ordering = m_weather.order(candidates, *inputs.weather);
    } else {
        plan.issues.push_back({IssueKind::MissingData, workerId, "No weather forecast; ordering without weather"});
        ordering = m_weather.orderWithoutWeather(candidates, inputs.now);
    }
    plan.orderedUpcoming = std::move(ordering.ordered);
    plan.deferredOutdoor = std::move(ordering.deferred);
    plan.suggestions = std::move(ordering.substitutes);

    if (inputs.weather && plan.currentBuilding) {
        std::vector<std::string> upcomingTitles;
        for (const auto& scored : plan.orderedUpcoming) {
            upcomingTitles.push_back(scored.task.title);
        }
        auto forBuilding = m_weather.suggestionsFor(*plan.currentBuilding, *inputs.weather, rules, upcomingTitles);
        plan.suggestions.insert(plan.suggestions.end(), forBuilding.begin(), forBuilding.end());
    }

    return plan;
}

DaySchedule DailyPlanOrchestrator::buildDay(const std::string& workerId,
                                            const CivilDate& day,
                                            bool isToday,
                                            const PlanInputs& inputs,
                                            const std::vector<CollectionRule>& rules,
                                            const std::optional<std::string>& fallbackBuildingId,
                                            std::vector<PlanIssue>& issues) const {
    std::vector<RouteSequence> routes;
    for (const auto& route : inputs.routeSequences) {
        if (route.weekday == day.weekday()) routes.push_back(route);
    }

    // Undated tasks are due today.
    std::vector<Task> tasks;
    for (const auto& task : inputs.adHocTasks) {
        if (task.dueTime ? day.contains(*task.dueTime) : isToday) tasks.push_back(task);
    }

    MergeResult merged = m_merger.mergeDayDetailed(day, inputs.routineInstances, tasks, routes,
                                                   isToday ? fallbackBuildingId : std::optional<std::string>());
    InjectionResult injected = m_injector.injectDetailed(day, workerId, rules, merged.entries);

    issues.insert(issues.end(), merged.issues.begin(), merged.issues.end());
    issues.insert(issues.end(), injected.issues.begin(), injected.issues.end());

    std::vector<ScheduleEntry> entries = std::move(merged.entries);
    entries.insert(entries.end(), injected.entries.begin(), injected.entries.end());
    return ScheduleMerger::BuildDaySchedule(day, entries);
}

std::vector<Task> DailyPlanOrchestrator::candidateTasks(const std::string& workerId,
                                                        const DaySchedule& today,
                                                        const PlanInputs& inputs) const {
    std::vector<Task> candidates;
    for (const auto& entry : today.items) {
        if (entry.isCompleted || entry.endTime < inputs.now) continue;

        Task task;
        task.id = entry.id;
        task.title = entry.title;
        if (!entry.buildingId.empty()) task.buildingId = entry.buildingId;
        task.dueTime = entry.startTime;
        task.urgency = entry.urgency;
        task.category = entry.category;
        task.estimatedDurationMinutes =
            static_cast<int>(std::chrono::duration_cast<Minutes>(entry.endTime - entry.startTime).count());
        task.requiresPhoto = entry.requiresPhoto;
        for (const auto& rule : inputs.photoPolicy) {
            if (rule.matches(workerId, task.buildingId)) task.requiresPhoto = rule.requiresPhoto;
        }
        candidates.push_back(std::move(task));
    }
    return candidates;
}

} // namespace fieldplan::application
