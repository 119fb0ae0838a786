/**
 * @file RoutineExpander.cpp
 * @brief Implementation of RoutineExpander.
 */

#include "application/RoutineExpander.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fieldplan::application {

using namespace domain;

namespace {

std::vector<std::string> Split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::vector<int> ParseIntList(const std::string& key, const std::string& value, int min, int max) {
    std::vector<int> out;
    for (const auto& item : Split(value, ',')) {
        int n = 0;
        try {
            size_t used = 0;
            n = std::stoi(item, &used);
            if (used != item.size()) throw std::invalid_argument(item);
        } catch (const std::exception&) {
            throw std::invalid_argument("RRULE " + key + " has a non-numeric value '" + item + "'");
        }
        if (n < min || n > max) {
            throw std::invalid_argument("RRULE " + key + " value out of range: " + item);
        }
        out.push_back(n);
    }
    return out;
}

} // namespace

RoutineExpander::RecurrenceRule RoutineExpander::ParseRule(const std::string& rrule) {
    RecurrenceRule rule;
    bool hasFrequency = false;

    for (const auto& component : Split(rrule, ';')) {
        auto eq = component.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = component.substr(0, eq);
        const std::string value = component.substr(eq + 1);

        if (key == "FREQ") {
            if (value == "DAILY") rule.frequency = Frequency::Daily;
            else if (value == "WEEKLY") rule.frequency = Frequency::Weekly;
            else if (value == "MONTHLY") rule.frequency = Frequency::Monthly;
            else throw std::invalid_argument("Unsupported RRULE frequency: " + value);
            hasFrequency = true;
        } else if (key == "BYDAY") {
            for (const auto& day : Split(value, ',')) {
                rule.byDay.push_back(WeekdayFromString(day));
            }
        } else if (key == "BYHOUR") {
            rule.byHour = ParseIntList(key, value, 0, 23);
        } else if (key == "BYMINUTE") {
            rule.byMinute = ParseIntList(key, value, 0, 59);
        }
        // Other RRULE parts are ignored.
    }

    if (!hasFrequency) {
        throw std::invalid_argument("RRULE without FREQ: '" + rrule + "'");
    }
    return rule;
}

bool RoutineExpander::OccursOn(const RecurrenceRule& rule, const CivilDate& date) {
    const Weekday weekday = date.weekday();
    const bool dayListed = std::find(rule.byDay.begin(), rule.byDay.end(), weekday) != rule.byDay.end();

    switch (rule.frequency) {
        case Frequency::Daily:
            return rule.byDay.empty() || dayListed;
        case Frequency::Weekly:
            return dayListed;
        case Frequency::Monthly:
            if (date.day > 7) return false;
            if (!rule.byDay.empty()) return dayListed;
            if (weekday == Weekday::Saturday || weekday == Weekday::Sunday) return false;
            // First Mon-Fri of the month: no earlier day of the month is a weekday.
            for (unsigned d = 1; d < date.day; ++d) {
                Weekday earlier = CivilDate(date.year, date.month, d).weekday();
                if (earlier != Weekday::Saturday && earlier != Weekday::Sunday) return false;
            }
            return true;
        default:
            return false;
    }
}

int RoutineExpander::DefaultHour(Frequency frequency) {
    switch (frequency) {
        case Frequency::Daily: return 9;
        case Frequency::Weekly: return 10;
        case Frequency::Monthly: return 11;
        default: return 9;
    }
}

int RoutineExpander::DefaultDurationMinutes(Frequency frequency) {
    switch (frequency) {
        case Frequency::Daily: return 60;
        case Frequency::Weekly: return 120;
        case Frequency::Monthly: return 180;
        default: return 60;
    }
}

std::vector<RoutineInstance> RoutineExpander::expand(const RoutineSchedule& routine,
                                                     const CivilDate& from,
                                                     const CivilDate& to) const {
    from.validate();
    to.validate();
    const RecurrenceRule rule = ParseRule(routine.rrule);

    std::vector<int> hours = rule.byHour.empty() ? std::vector<int>{DefaultHour(rule.frequency)} : rule.byHour;
    std::vector<int> minutes = rule.byMinute.empty() ? std::vector<int>{0} : rule.byMinute;
    std::sort(hours.begin(), hours.end());
    std::sort(minutes.begin(), minutes.end());
    const int duration = routine.estimatedDurationMinutes.value_or(DefaultDurationMinutes(rule.frequency));

    std::vector<RoutineInstance> instances;
    for (long long d = from.toDays(); d <= to.toDays(); ++d) {
        const CivilDate date = CivilDate::fromDays(d);
        if (!OccursOn(rule, date)) continue;

        for (int hour : hours) {
            for (int minute : minutes) {
                RoutineInstance instance;
                instance.startTime = date.at(hour, minute);
                instance.endTime = instance.startTime + Minutes(duration);
                instance.id = routine.id + "@" + FormatTimePoint(instance.startTime);
                instance.routineId = routine.id;
                instance.buildingId = routine.buildingId;
                instance.title = routine.name;
                instance.category = routine.category;
                instance.isWeatherDependent = routine.isWeatherDependent;
                instances.push_back(instance);
            }
        }
    }
    return instances;
}

std::vector<RoutineInstance> RoutineExpander::expandAll(const std::vector<RoutineSchedule>& routines,
                                                        const CivilDate& from,
                                                        const CivilDate& to) const {
    from.validate();
    to.validate();

    std::vector<RoutineInstance> all;
    for (const auto& routine : routines) {
        try {
            auto instances = expand(routine, from, to);
            all.insert(all.end(), instances.begin(), instances.end());
        } catch (const std::invalid_argument& e) {
            std::cerr << "[RoutineExpander] Skipping routine " << routine.id << ": " << e.what() << std::endl;
        }
    }
    return all;
}

} // namespace fieldplan::application
