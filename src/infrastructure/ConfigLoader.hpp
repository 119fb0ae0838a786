/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading planner configuration (settings.json).
 *
 * Every key is optional; anything missing keeps the built-in default so a
 * partial or absent file is always usable.
 */

#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "application/PlannerSettings.hpp"

namespace fieldplan::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a file.
     * @param settingsPath Path to settings.json.
     * @return Defaults when the file is missing or malformed (the latter is logged).
     */
    static application::PlannerSettings Load(const std::filesystem::path& settingsPath);

    /** @brief Reads settings from $XDG_CONFIG_HOME/fieldplan/settings.json. */
    static application::PlannerSettings LoadDefault();

    /**
     * @brief Applies the keys present in a parsed document on top of the defaults.
     * @throws nlohmann::json::exception or std::invalid_argument on malformed values.
     */
    static application::PlannerSettings FromJson(const nlohmann::json& j);
};

} // namespace fieldplan::infrastructure
