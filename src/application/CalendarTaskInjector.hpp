/**
 * @file CalendarTaskInjector.hpp
 * @brief Adds calendar-conditioned obligations (collection set-out, retrieval) to a day.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/PlanIssue.hpp"
#include "domain/PlanRules.hpp"
#include "domain/ScheduleEntry.hpp"

namespace fieldplan::application {

struct InjectionResult {
    std::vector<domain::ScheduleEntry> entries;
    std::vector<domain::PlanIssue> issues;
};

/**
 * @class CalendarTaskInjector
 * @brief Evaluates a table of CollectionRules for one worker and date.
 *
 * Returns only the entries to append. Every injected entry keeps its real
 * buildingId and carries the rule's circuit id, so it dedups within its own
 * circuit scope and never collapses into organic work. Entries whose key is
 * already present in existingEntries are not emitted again.
 */
class CalendarTaskInjector {
public:
    std::vector<domain::ScheduleEntry> inject(const domain::CivilDate& date,
                                              const std::string& workerId,
                                              const std::vector<domain::CollectionRule>& rules,
                                              const std::vector<domain::ScheduleEntry>& existingEntries) const;

    InjectionResult injectDetailed(const domain::CivilDate& date,
                                   const std::string& workerId,
                                   const std::vector<domain::CollectionRule>& rules,
                                   const std::vector<domain::ScheduleEntry>& existingEntries) const;

private:
    static domain::ScheduleEntry MakeEntry(const domain::CivilDate& date,
                                           const domain::CollectionRule& rule,
                                           const std::string& buildingId);
};

} // namespace fieldplan::application
