/**
 * @file CalendarTaskInjector.cpp
 * @brief Implementation of CalendarTaskInjector.
 */

#include "application/CalendarTaskInjector.hpp"

#include <set>

#include "application/ScheduleMerger.hpp"

namespace fieldplan::application {

using namespace domain;

std::vector<ScheduleEntry> CalendarTaskInjector::inject(const CivilDate& date,
                                                        const std::string& workerId,
                                                        const std::vector<CollectionRule>& rules,
                                                        const std::vector<ScheduleEntry>& existingEntries) const {
    return injectDetailed(date, workerId, rules, existingEntries).entries;
}

InjectionResult CalendarTaskInjector::injectDetailed(const CivilDate& date,
                                                     const std::string& workerId,
                                                     const std::vector<CollectionRule>& rules,
                                                     const std::vector<ScheduleEntry>& existingEntries) const {
    date.validate();

    InjectionResult result;
    std::set<std::string> knownKeys;
    for (const auto& entry : existingEntries) {
        knownKeys.insert(ScheduleMerger::DedupKey(entry));
    }

    const Weekday weekday = date.weekday();
    for (const auto& rule : rules) {
        if (!WorkerSelectorMatches(rule.appliesToWorker, workerId)) continue;
        if (!rule.firesOn(weekday)) continue;

        bool reportedWindow = false;
        for (const auto& buildingId : rule.buildingGroup) {
            ScheduleEntry entry = MakeEntry(date, rule, buildingId);
            if (ScheduleMerger::ClampTimeWindow(entry) && !reportedWindow) {
                result.issues.push_back({IssueKind::InvalidTimeWindow, rule.id,
                                         "Rule '" + rule.id + "' window ends before it starts; clamped"});
                reportedWindow = true;
            }
            if (!knownKeys.insert(ScheduleMerger::DedupKey(entry)).second) continue;
            result.entries.push_back(entry);
        }
    }
    return result;
}

ScheduleEntry CalendarTaskInjector::MakeEntry(const CivilDate& date,
                                              const CollectionRule& rule,
                                              const std::string& buildingId) {
    ScheduleEntry entry;
    entry.circuitId = rule.circuitId();
    entry.id = entry.circuitId + "#" + buildingId + "@" + date.toString();
    entry.buildingId = buildingId;
    entry.title = rule.title;
    entry.startTime = date.atMinuteOfDay(rule.windowStartMinute);
    entry.endTime = date.atMinuteOfDay(rule.windowEndMinute);
    entry.taskCount = 1;
    entry.source = EntrySource::Calendar;
    entry.category = rule.category;
    entry.urgency = rule.urgency;
    return entry;
}

} // namespace fieldplan::application
