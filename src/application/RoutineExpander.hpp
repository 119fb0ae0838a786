/**
 * @file RoutineExpander.hpp
 * @brief Expands recurring routine definitions into concrete instances.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/CalendarTime.hpp"
#include "domain/Routine.hpp"

namespace fieldplan::application {

/**
 * @class RoutineExpander
 * @brief Small RRULE subset: FREQ=DAILY|WEEKLY|MONTHLY with BYDAY, BYHOUR, BYMINUTE.
 *
 * Defaults when a key is missing:
 * - DAILY: every day at 09:00 for 60 minutes.
 * - WEEKLY: BYDAY is required (no occurrence otherwise), 10:00 for 120 minutes.
 * - MONTHLY: first weekday (Mon-Fri) of the month, or the first occurrence of
 *   each BYDAY weekday, at 11:00 for 180 minutes.
 * A routine's own estimatedDurationMinutes overrides the frequency default.
 */
class RoutineExpander {
public:
    enum class Frequency { Daily, Weekly, Monthly };

    struct RecurrenceRule {
        Frequency frequency = Frequency::Daily;
        std::vector<domain::Weekday> byDay;
        std::vector<int> byHour;
        std::vector<int> byMinute;
    };

    /**
     * @brief Parses "FREQ=WEEKLY;BYDAY=MO,WE;BYHOUR=7".
     * @throws std::invalid_argument on a missing or unsupported FREQ, or malformed values.
     */
    static RecurrenceRule ParseRule(const std::string& rrule);

    /** @brief Instances of one routine for the days in [from, to]. */
    std::vector<domain::RoutineInstance> expand(const domain::RoutineSchedule& routine,
                                                const domain::CivilDate& from,
                                                const domain::CivilDate& to) const;

    /** @brief Expands several routines; routines with an unusable rule are skipped and logged. */
    std::vector<domain::RoutineInstance> expandAll(const std::vector<domain::RoutineSchedule>& routines,
                                                   const domain::CivilDate& from,
                                                   const domain::CivilDate& to) const;

private:
    static bool OccursOn(const RecurrenceRule& rule, const domain::CivilDate& date);
    static int DefaultHour(Frequency frequency);
    static int DefaultDurationMinutes(Frequency frequency);
};

} // namespace fieldplan::application
