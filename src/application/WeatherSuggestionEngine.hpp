/**
 * @file WeatherSuggestionEngine.hpp
 * @brief Weather-aware scoring, ordering and deferral of tasks, plus per-building suggestions.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/PlannerSettings.hpp"
#include "domain/Building.hpp"
#include "domain/PlanRules.hpp"
#include "domain/Task.hpp"
#include "domain/WeatherSnapshot.hpp"
#include "domain/WeatherSuggestion.hpp"

namespace fieldplan::application {

/**
 * @struct WeatherProfile
 * @brief How sensitive a task category is to weather.
 */
struct WeatherProfile {
    bool isOutdoor = false;
    bool sensitiveToPrecip = false;
    bool sensitiveToWind = false;
    double maxWindMph = 100.0;
    double maxPrecipProb = 1.0;
};

/**
 * @struct OrderingResult
 * @brief "Do now" ordering, deferred outdoor work and indoor substitutes.
 */
struct OrderingResult {
    std::vector<domain::ScoredTask> ordered;
    std::vector<domain::ScoredTask> deferred;
    std::vector<domain::WeatherSuggestion> substitutes;
    bool deferralActive = false;
};

/**
 * @class WeatherSuggestionEngine
 * @brief Pure functions of (task, weather snapshot).
 *
 * "Now" is the snapshot's current.timestamp. Lower scores are more urgent.
 * Ordering is by score, then dueTime (undated last), then input order.
 */
class WeatherSuggestionEngine {
public:
    explicit WeatherSuggestionEngine(WeatherSettings settings = {});

    /** @brief True if any block of the deferral look-ahead is wet, cold or windy enough. */
    bool shouldDeferOutdoorWork(const domain::WeatherSnapshot& weather) const;

    /** @brief Lexical match of a title against the outdoor vocabulary. */
    bool isOutdoorTitle(const std::string& title) const;

    /** @brief Outdoor by category profile or by title. */
    bool isOutdoorTask(const domain::Task& task) const;

    domain::ScoredTask score(const domain::Task& task, const domain::WeatherSnapshot& weather) const;

    /** @brief Tasks in "do now" order; deferred outdoor tasks are left out. */
    std::vector<domain::Task> scoreAndOrder(const std::vector<domain::Task>& tasks,
                                            const domain::WeatherSnapshot& weather) const;

    OrderingResult order(const std::vector<domain::Task>& tasks, const domain::WeatherSnapshot& weather) const;

    /** @brief Ordering by base priority only, used when no forecast is available. */
    OrderingResult orderWithoutWeather(const std::vector<domain::Task>& tasks, domain::TimePoint now) const;

    /**
     * @brief Up to 3 ranked suggestions for a building.
     * @param collectionRules Rules already filtered for the worker.
     * @param upcomingTitles Titles of the ordered upcoming list; the first two suppress duplicates.
     */
    std::vector<domain::WeatherSuggestion> suggestionsFor(const domain::BuildingSummary& building,
                                                          const domain::WeatherSnapshot& weather,
                                                          const std::vector<domain::CollectionRule>& collectionRules,
                                                          const std::vector<std::string>& upcomingTitles) const;

    static WeatherProfile ProfileFor(domain::TaskCategory category);
    static std::vector<std::string> ChecklistFor(const std::string& templateId);

private:
    WeatherSettings m_settings;

    static int BasePriority(const domain::Task& task, domain::TimePoint now);
    static const domain::WeatherSample& NearestBlock(const domain::WeatherSnapshot& weather, domain::TimePoint target);
    OrderingResult orderScored(std::vector<domain::ScoredTask> scored, bool deferralActive,
                               const std::string& rationale) const;
};

} // namespace fieldplan::application
