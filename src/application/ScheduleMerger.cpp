/**
 * @file ScheduleMerger.cpp
 * @brief Implementation of ScheduleMerger.
 */

#include "application/ScheduleMerger.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <tuple>

namespace fieldplan::application {

using namespace domain;

namespace {

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

long long AbsSeconds(Seconds s) {
    return s.count() < 0 ? -s.count() : s.count();
}

} // namespace

ScheduleMerger::ScheduleMerger(MergerSettings settings)
    : m_settings(settings) {}

std::vector<ScheduleEntry> ScheduleMerger::mergeDay(const CivilDate& date,
                                                    const std::vector<RoutineInstance>& routineInstances,
                                                    const std::vector<Task>& adHocTasks,
                                                    const std::vector<RouteSequence>& routeSequences,
                                                    const std::optional<std::string>& fallbackBuildingId) const {
    return mergeDayDetailed(date, routineInstances, adHocTasks, routeSequences, fallbackBuildingId).entries;
}

MergeResult ScheduleMerger::mergeDayDetailed(const CivilDate& date,
                                             const std::vector<RoutineInstance>& routineInstances,
                                             const std::vector<Task>& adHocTasks,
                                             const std::vector<RouteSequence>& routeSequences,
                                             const std::optional<std::string>& fallbackBuildingId) const {
    date.validate();

    MergeResult result;
    std::vector<ScheduleEntry> raw;

    for (const auto& instance : routineInstances) {
        if (!date.contains(instance.startTime)) continue;
        raw.push_back(fromRoutine(instance));
    }

    for (const auto& task : adHocTasks) {
        if (!isOnDate(date, task)) continue;

        ScheduleEntry entry = fromTask(date, task);
        if (entry.buildingId.empty()) {
            if (auto routeBuilding = matchRouteBuilding(date, entry.startTime, routeSequences)) {
                entry.buildingId = *routeBuilding;
            } else if (fallbackBuildingId && !fallbackBuildingId->empty()) {
                entry.buildingId = *fallbackBuildingId;
            } else {
                result.issues.push_back({IssueKind::AmbiguousBuilding, task.id,
                                         "Task '" + task.title + "' could not be attributed to a building"});
            }
        }
        raw.push_back(entry);
    }

    // Route stops only stand in when no other source produced work for the day.
    if (raw.empty()) {
        for (const auto& route : routeSequences) {
            raw.push_back(fromRoute(date, route));
        }
    }

    for (auto& entry : raw) {
        if (ClampTimeWindow(entry)) {
            result.issues.push_back({IssueKind::InvalidTimeWindow, entry.id,
                                     "End time precedes start time of '" + entry.title + "'; clamped"});
        }
    }

    result.entries = Deduplicate(raw);
    SortEntries(result.entries);
    result.totalHours = TotalHours(result.entries);
    return result;
}

ScheduleEntry ScheduleMerger::fromRoutine(const RoutineInstance& instance) const {
    ScheduleEntry entry;
    entry.id = instance.id;
    entry.buildingId = instance.buildingId;
    entry.title = instance.title;
    entry.startTime = instance.startTime;
    entry.endTime = instance.endTime;
    entry.taskCount = 1;
    entry.source = EntrySource::Routine;
    entry.category = instance.category;
    return entry;
}

ScheduleEntry ScheduleMerger::fromTask(const CivilDate& date, const Task& task) const {
    ScheduleEntry entry;
    entry.id = task.id;
    entry.buildingId = task.buildingId.value_or("");
    entry.title = task.title;
    entry.startTime = task.dueTime ? *task.dueTime : date.at(m_settings.defaultStartHour);
    entry.endTime = entry.startTime + Minutes(task.estimatedDurationMinutes.value_or(m_settings.defaultDurationMinutes));
    entry.taskCount = 1;
    entry.source = EntrySource::AdHoc;
    entry.category = task.category;
    entry.urgency = task.urgency;
    entry.isCompleted = task.isCompleted;
    entry.requiresPhoto = task.requiresPhoto;
    return entry;
}

ScheduleEntry ScheduleMerger::fromRoute(const CivilDate& date, const RouteSequence& route) const {
    ScheduleEntry entry;
    entry.id = "route:" + route.id;
    entry.buildingId = route.buildingId;
    entry.title = route.buildingName.empty() ? route.buildingId : route.buildingName;
    entry.startTime = route.windowStart(date);
    entry.endTime = route.windowEnd(date);
    entry.taskCount = std::max<int>(1, static_cast<int>(route.operations.size()));
    entry.source = EntrySource::Route;
    if (!route.operations.empty()) {
        entry.category = route.operations.front().category;
    }
    for (const auto& op : route.operations) {
        if (op.requiresPhoto) entry.requiresPhoto = true;
    }
    return entry;
}

bool ScheduleMerger::isOnDate(const CivilDate& date, const Task& task) const {
    // Undated tasks belong to whichever day they are handed in for.
    if (!task.dueTime) return true;
    return date.contains(*task.dueTime);
}

std::optional<std::string> ScheduleMerger::matchRouteBuilding(const CivilDate& date,
                                                              TimePoint start,
                                                              const std::vector<RouteSequence>& routes) const {
    const RouteSequence* nearest = nullptr;
    long long nearestGap = 0;
    const long long maxGap = static_cast<long long>(m_settings.routeMatchWindowMinutes) * 60;

    for (const auto& route : routes) {
        if (route.buildingId.empty()) continue;
        const TimePoint windowStart = route.windowStart(date);
        const TimePoint windowEnd = route.windowEnd(date);

        long long gap = 0;
        if (start < windowStart) {
            gap = AbsSeconds(windowStart - start);
        } else if (start > windowEnd) {
            gap = AbsSeconds(start - windowEnd);
        }
        if (gap > maxGap) continue;

        if (!nearest || gap < nearestGap || (gap == nearestGap && route.buildingId < nearest->buildingId)) {
            nearest = &route;
            nearestGap = gap;
        }
    }
    if (!nearest) return std::nullopt;
    return nearest->buildingId;
}

std::string ScheduleMerger::DedupKey(const ScheduleEntry& entry) {
    std::string scope = entry.circuitId.empty() ? entry.buildingId : entry.circuitId + "#" + entry.buildingId;
    const auto minute = std::chrono::duration_cast<Minutes>(TruncateToMinute(entry.startTime).time_since_epoch());
    return scope + '\x1f' + ToLower(entry.title) + '\x1f' + std::to_string(minute.count());
}

std::vector<ScheduleEntry> ScheduleMerger::Deduplicate(const std::vector<ScheduleEntry>& entries) {
    std::map<std::string, ScheduleEntry> groups;

    for (const auto& entry : entries) {
        auto key = DedupKey(entry);
        auto it = groups.find(key);
        if (it == groups.end()) {
            groups.emplace(key, entry);
            continue;
        }

        ScheduleEntry& merged = it->second;
        const ScheduleEntry before = merged;
        if (std::tie(entry.id, entry.title, entry.source) < std::tie(merged.id, merged.title, merged.source)) {
            merged = entry;
        }
        merged.endTime = std::max(before.endTime, entry.endTime);
        merged.taskCount = before.taskCount + entry.taskCount;
        merged.urgency = std::max(before.urgency, entry.urgency);
        merged.isCompleted = before.isCompleted && entry.isCompleted;
        merged.requiresPhoto = before.requiresPhoto || entry.requiresPhoto;
        merged.timeWindowClamped = before.timeWindowClamped || entry.timeWindowClamped;
    }

    std::vector<ScheduleEntry> out;
    out.reserve(groups.size());
    for (auto& [key, entry] : groups) {
        out.push_back(std::move(entry));
    }
    return out;
}

void ScheduleMerger::SortEntries(std::vector<ScheduleEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
        return std::tie(a.startTime, a.title, a.buildingId, a.id) <
               std::tie(b.startTime, b.title, b.buildingId, b.id);
    });
}

double ScheduleMerger::TotalHours(const std::vector<ScheduleEntry>& entries) {
    double total = 0.0;
    for (const auto& entry : entries) {
        total += entry.durationHours();
    }
    return total;
}

DaySchedule ScheduleMerger::BuildDaySchedule(const CivilDate& date, const std::vector<ScheduleEntry>& entries) {
    DaySchedule day;
    day.date = date;
    day.items = Deduplicate(entries);
    SortEntries(day.items);
    day.totalHours = TotalHours(day.items);
    return day;
}

bool ScheduleMerger::ClampTimeWindow(ScheduleEntry& entry) {
    if (entry.endTime >= entry.startTime) return false;
    entry.endTime = entry.startTime;
    entry.timeWindowClamped = true;
    return true;
}

} // namespace fieldplan::application
