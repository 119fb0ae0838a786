/**
 * @file LocalClock.hpp
 * @brief Converts the system clock to the planner's local wall-clock instants.
 */

#pragma once

#include <chrono>

#include "domain/CalendarTime.hpp"

namespace fieldplan::infrastructure {

class LocalClock {
public:
    /** @brief Current local wall-clock time, truncated to seconds. */
    static domain::TimePoint Now();

    /** @brief Local wall-clock time of a system instant (uses the process time zone). */
    static domain::TimePoint ToLocal(std::chrono::system_clock::time_point instant);
};

} // namespace fieldplan::infrastructure
