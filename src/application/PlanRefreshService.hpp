/**
 * @file PlanRefreshService.hpp
 * @brief Caller-side coordinator: pulls sources, rebuilds the plan and keeps the latest one.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "application/DailyPlanOrchestrator.hpp"
#include "application/PlannerSettings.hpp"
#include "domain/DailyPlan.hpp"
#include "domain/PlanDataSource.hpp"

namespace fieldplan::application {

/**
 * @class PlanRefreshService
 * @brief Owns the observable plan state that the pure core deliberately lacks.
 *
 * Each computation is tagged with a monotonically increasing generation.
 * Triggers arriving within the debounce window of the last accepted trigger
 * are coalesced into it and leave a trailing refresh pending; the caller runs
 * it with flushPending() once pendingDeadline() has passed. A result is committed only if its generation is newer
 * than the committed one; a failed computation keeps the previous plan.
 * All accessors are safe to call from any thread.
 */
class PlanRefreshService {
public:
    using SteadyClock = std::chrono::steady_clock;

    struct RefreshTicket {
        uint64_t generation = 0;
        bool coalesced = false;
    };

    PlanRefreshService(std::shared_ptr<domain::PlanDataSource> source,
                       PlannerSettings settings,
                       std::string workerId);

    /** @brief Hands out the next generation, or reports the trigger as coalesced. */
    RefreshTicket beginRefresh(SteadyClock::time_point trigger);

    /** @brief When the trailing refresh owed to coalesced triggers becomes due, if one is owed. */
    std::optional<SteadyClock::time_point> pendingDeadline() const;

    /**
     * @brief Issues the trailing generation once the debounce window has closed.
     * @return nullopt when nothing is pending or the window is still open.
     */
    std::optional<RefreshTicket> takePendingRefresh(SteadyClock::time_point at);

    /** @brief Stores a plan if it is newer than the committed one. Returns false for stale results. */
    bool commit(uint64_t generation, domain::DailyPlan plan);

    /**
     * @brief Pulls a snapshot from the data source for [date, date + 6].
     *
     * An operation that throws is logged and recorded as MissingData.
     */
    domain::PlanInputs collectInputs(const domain::CivilDate& date, domain::TimePoint now) const;

    /** @brief Collects, builds and commits under an already issued generation. */
    bool compute(uint64_t generation, const domain::CivilDate& date, domain::TimePoint now);

    /**
     * @brief beginRefresh + compute.
     * @return The committed generation, or nullopt when coalesced, failed or stale.
     */
    std::optional<uint64_t> refresh(const domain::CivilDate& date,
                                    domain::TimePoint now,
                                    SteadyClock::time_point trigger = SteadyClock::now());

    /**
     * @brief takePendingRefresh + compute.
     * @return The committed generation, or nullopt when nothing was due, failed or stale.
     */
    std::optional<uint64_t> flushPending(const domain::CivilDate& date,
                                         domain::TimePoint now,
                                         SteadyClock::time_point at = SteadyClock::now());

    std::shared_ptr<const domain::DailyPlan> latestPlan() const;
    std::optional<domain::WeeklyPlan> weeklyPlan() const;
    std::optional<domain::BuildingSummary> currentBuilding() const;
    std::vector<domain::ScoredTask> orderedUpcoming() const;
    uint64_t committedGeneration() const;

private:
    std::shared_ptr<domain::PlanDataSource> m_source;
    PlannerSettings m_settings;
    DailyPlanOrchestrator m_orchestrator;
    std::string m_workerId;
    std::chrono::milliseconds m_debounce;

    std::atomic<uint64_t> m_nextGeneration{0};

    mutable std::mutex m_triggerMutex;
    std::optional<SteadyClock::time_point> m_lastAcceptedTrigger;
    bool m_trailingPending = false;

    mutable std::mutex m_planMutex;
    std::shared_ptr<const domain::DailyPlan> m_plan;
    uint64_t m_committedGeneration = 0;
};

} // namespace fieldplan::application
