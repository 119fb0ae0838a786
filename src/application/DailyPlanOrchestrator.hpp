/**
 * @file DailyPlanOrchestrator.hpp
 * @brief Composes merge, injection, resolution and weather ordering into one plan.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/BuildingResolver.hpp"
#include "application/CalendarTaskInjector.hpp"
#include "application/PlannerSettings.hpp"
#include "application/ScheduleMerger.hpp"
#include "application/WeatherSuggestionEngine.hpp"
#include "domain/DailyPlan.hpp"

namespace fieldplan::application {

/**
 * @class DailyPlanOrchestrator
 * @brief Stateless pipeline: merge, inject, dedupe, resolve building, score and order.
 *
 * buildPlan either returns a complete plan or throws std::invalid_argument for
 * structurally invalid input (an impossible date); it never returns a partial plan.
 */
class DailyPlanOrchestrator {
public:
    static constexpr int kPlanDays = 7;

    explicit DailyPlanOrchestrator(PlannerSettings settings = {});

    domain::DailyPlan buildPlan(const std::string& workerId,
                                const domain::CivilDate& date,
                                const domain::PlanInputs& inputs) const;

    const PlannerSettings& settings() const { return m_settings; }

private:
    PlannerSettings m_settings;
    BuildingResolver m_resolver;
    ScheduleMerger m_merger;
    CalendarTaskInjector m_injector;
    WeatherSuggestionEngine m_weather;

    domain::DaySchedule buildDay(const std::string& workerId,
                                 const domain::CivilDate& day,
                                 bool isToday,
                                 const domain::PlanInputs& inputs,
                                 const std::vector<domain::CollectionRule>& rules,
                                 const std::optional<std::string>& fallbackBuildingId,
                                 std::vector<domain::PlanIssue>& issues) const;

    std::vector<domain::Task> candidateTasks(const std::string& workerId,
                                             const domain::DaySchedule& today,
                                             const domain::PlanInputs& inputs) const;
};

} // namespace fieldplan::application
