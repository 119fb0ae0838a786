/**
 * @file WeatherSuggestion.hpp
 * @brief Weather-driven suggestions and scored tasks.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CalendarTime.hpp"
#include "Task.hpp"

namespace fieldplan::domain {

/**
 * @enum SuggestionKind
 * @brief Why a suggestion was made; also drives its rank.
 */
enum class SuggestionKind {
    Collection, ///< Collection-day set-out preparation.
    Rain,
    Wind,
    Snow,
    Heat,
    Cold,
    Indoor,     ///< Substitute for deferred outdoor work.
    Generic
};

inline std::string SuggestionKindToString(SuggestionKind kind) {
    switch (kind) {
        case SuggestionKind::Collection: return "collection";
        case SuggestionKind::Rain: return "rain";
        case SuggestionKind::Wind: return "wind";
        case SuggestionKind::Snow: return "snow";
        case SuggestionKind::Heat: return "heat";
        case SuggestionKind::Cold: return "cold";
        case SuggestionKind::Indoor: return "indoor";
        case SuggestionKind::Generic: return "generic";
        default: return "generic";
    }
}

/**
 * @struct WeatherSuggestion
 * @brief A ranked, actionable suggestion for one building.
 */
struct WeatherSuggestion {
    std::string id;
    SuggestionKind kind = SuggestionKind::Generic;
    std::string title;
    std::string subtitle;
    std::string rationale;              ///< Current weather condition string.
    std::string templateId;             ///< Checklist key, e.g. "drainageCheck".
    std::vector<std::string> checklist; ///< Fixed sub-tasks for templateId.
    std::string buildingId;
    std::optional<TimePoint> dueBy;
};

/**
 * @enum WeatherChip
 * @brief Short weather badge attached to a scored task.
 */
enum class WeatherChip {
    GoodWindow,
    Wet,
    HeavyRain,
    Windy,
    Hot,
    Cold
};

inline std::string WeatherChipToString(WeatherChip chip) {
    switch (chip) {
        case WeatherChip::GoodWindow: return "good_window";
        case WeatherChip::Wet: return "wet";
        case WeatherChip::HeavyRain: return "heavy_rain";
        case WeatherChip::Windy: return "windy";
        case WeatherChip::Hot: return "hot";
        case WeatherChip::Cold: return "cold";
        default: return "good_window";
    }
}

/**
 * @struct ScoredTask
 * @brief A task with its weather-adjusted score (lower = do sooner).
 */
struct ScoredTask {
    Task task;
    int score = 0;
    std::optional<WeatherChip> chip;
    std::string advice;
    bool isOutdoor = false;
};

} // namespace fieldplan::domain
