/**
 * @file PlannerSettings.hpp
 * @brief Tunable thresholds and rule tables of the planning services.
 *
 * Defaults reproduce the built-in behavior; ConfigLoader overrides them from
 * settings.json.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/PlanRules.hpp"

namespace fieldplan::application {

struct ResolverSettings {
    int upcomingWindowMinutes = 60;
    double proximityRadiusMeters = 500.0;
};

struct MergerSettings {
    int defaultStartHour = 9;
    int defaultDurationMinutes = 60;
    int routeMatchWindowMinutes = 120; ///< Max distance to the nearest route window.
};

inline std::vector<std::string> DefaultOutdoorKeywords() {
    return {"hose", "sidewalk", "exterior", "outdoor", "outside", "curb",
            "roof", "gutter", "courtyard", "power wash", "storefront", "street"};
}

struct WeatherSettings {
    double precipDeferThreshold = 0.4;
    double coldDeferThresholdF = 45.0;
    double windDeferThresholdMph = 25.0;
    size_t deferralLookaheadHours = 2;
    size_t suggestionLookaheadHours = 12;
    std::vector<std::string> outdoorKeywords = DefaultOutdoorKeywords(); ///< Lowercase substrings.
};

struct RefreshSettings {
    int debounceMs = 750;
};

/**
 * @struct PlannerSettings
 * @brief Everything settings.json can configure.
 */
struct PlannerSettings {
    ResolverSettings resolver;
    MergerSettings merger;
    WeatherSettings weather;
    RefreshSettings refresh;
    std::vector<domain::CollectionRule> collectionRules;
    std::vector<domain::PhotoPolicyRule> photoPolicy;
};

} // namespace fieldplan::application
