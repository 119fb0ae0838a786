/**
 * @file PlanJsonExporter.hpp
 * @brief Serializes a DailyPlan for presentation layers and the command line.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/DailyPlan.hpp"

namespace fieldplan::infrastructure {

class PlanJsonExporter {
public:
    static nlohmann::json ToJson(const domain::DailyPlan& plan);

    /** @brief Pretty-printed document (4-space indent). */
    static std::string Dump(const domain::DailyPlan& plan);
};

} // namespace fieldplan::infrastructure
