/**
 * @file WeatherSnapshot.hpp
 * @brief Forecast data shape consumed by the weather-aware ordering.
 */

#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "CalendarTime.hpp"

namespace fieldplan::domain {

/**
 * @struct WeatherSample
 * @brief Conditions at one instant (current reading or an hourly block).
 */
struct WeatherSample {
    double tempF = 60.0;
    std::string condition;     ///< e.g. "Light rain", "Cloudy".
    double precipProb = 0.0;   ///< 0.0 to 1.0
    double windMph = 0.0;
    TimePoint timestamp;       ///< Top of the hour for hourly blocks.
};

/**
 * @struct WeatherSnapshot
 * @brief Current reading plus an hourly forecast ordered by hour offset from now.
 */
struct WeatherSnapshot {
    WeatherSample current;
    std::vector<WeatherSample> hourly;

    /** @brief The first n hourly blocks, or the current reading when there is no forecast. */
    std::vector<WeatherSample> lookahead(size_t n) const {
        if (hourly.empty()) return {current};
        return std::vector<WeatherSample>(hourly.begin(), hourly.begin() + static_cast<long>(std::min(n, hourly.size())));
    }
};

} // namespace fieldplan::domain
