/**
 * @file LocalClock.cpp
 * @brief Implementation of LocalClock.
 */

#include "infrastructure/LocalClock.hpp"

#include <ctime>

namespace fieldplan::infrastructure {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

domain::TimePoint LocalClock::Now() {
    return ToLocal(std::chrono::system_clock::now());
}

domain::TimePoint LocalClock::ToLocal(std::chrono::system_clock::time_point instant) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(instant);
    const std::tm tm = ToLocalTime(tt);
    const domain::CivilDate date(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
    return date.at(tm.tm_hour, tm.tm_min) + domain::Seconds(tm.tm_sec);
}

} // namespace fieldplan::infrastructure
