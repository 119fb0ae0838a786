/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/PathUtils.hpp"
#include <fstream>
#include <iostream>

namespace fieldplan::infrastructure {

using json = nlohmann::json;

namespace {

/// Reads a numeric key; values outside [minValue, maxValue] are logged and the current value is kept.
template <typename T>
T BoundedValue(const json& section, const std::string& key, T current, T minValue, T maxValue) {
    T value = section.value(key, current);
    if (value < minValue || value > maxValue) {
        std::cerr << "[ConfigLoader] Ignoring " << key << "=" << value << " (expected " << minValue << ".."
                  << maxValue << "); keeping " << current << std::endl;
        return current;
    }
    return value;
}

constexpr int kMinutesPerDay = 24 * 60;

} // namespace

application::PlannerSettings ConfigLoader::Load(const std::filesystem::path& settingsPath) {
    if (!std::filesystem::exists(settingsPath)) {
        return {};
    }

    try {
        std::ifstream f(settingsPath);
        json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath.string() << ": " << e.what()
                  << "; using defaults" << std::endl;
    }

    return {};
}

application::PlannerSettings ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetSettingsPath());
}

application::PlannerSettings ConfigLoader::FromJson(const json& j) {
    application::PlannerSettings settings;

    if (j.contains("resolver")) {
        const auto& r = j["resolver"];
        auto& rs = settings.resolver;
        rs.upcomingWindowMinutes = BoundedValue(r, "upcoming_window_minutes", rs.upcomingWindowMinutes, 0, kMinutesPerDay);
        rs.proximityRadiusMeters = BoundedValue(r, "proximity_radius_meters", rs.proximityRadiusMeters, 0.0, 50000.0);
    }

    if (j.contains("merger")) {
        const auto& m = j["merger"];
        auto& ms = settings.merger;
        ms.defaultStartHour = BoundedValue(m, "default_start_hour", ms.defaultStartHour, 0, 23);
        ms.defaultDurationMinutes = BoundedValue(m, "default_duration_minutes", ms.defaultDurationMinutes, 1, kMinutesPerDay);
        ms.routeMatchWindowMinutes = BoundedValue(m, "route_match_window_minutes", ms.routeMatchWindowMinutes, 0, kMinutesPerDay);
    }

    if (j.contains("weather")) {
        const auto& w = j["weather"];
        auto& ws = settings.weather;
        ws.precipDeferThreshold = BoundedValue(w, "precip_defer_threshold", ws.precipDeferThreshold, 0.0, 1.0);
        ws.coldDeferThresholdF = BoundedValue(w, "cold_defer_threshold_f", ws.coldDeferThresholdF, -60.0, 120.0);
        ws.windDeferThresholdMph = BoundedValue(w, "wind_defer_threshold_mph", ws.windDeferThresholdMph, 0.0, 200.0);
        ws.deferralLookaheadHours = BoundedValue(w, "deferral_lookahead_hours", ws.deferralLookaheadHours, size_t{1}, size_t{48});
        ws.suggestionLookaheadHours = BoundedValue(w, "suggestion_lookahead_hours", ws.suggestionLookaheadHours, size_t{1}, size_t{48});
        ws.outdoorKeywords = w.value("outdoor_keywords", ws.outdoorKeywords);
    }

    if (j.contains("collection_rules")) {
        for (const auto& rule : j["collection_rules"]) {
            settings.collectionRules.push_back(CollectionRuleFromJson(rule));
        }
    }

    if (j.contains("photo_policy")) {
        for (const auto& rule : j["photo_policy"]) {
            settings.photoPolicy.push_back(PhotoPolicyRuleFromJson(rule));
        }
    }

    if (j.contains("refresh")) {
        settings.refresh.debounceMs = BoundedValue(j["refresh"], "debounce_ms", settings.refresh.debounceMs, 0, 60000);
    }

    return settings;
}

} // namespace fieldplan::infrastructure
