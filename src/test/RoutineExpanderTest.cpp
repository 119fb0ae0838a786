#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "application/RoutineExpander.hpp"

using namespace fieldplan::domain;
using fieldplan::application::RoutineExpander;

namespace {

// Monday 2025-03-03 to Sunday 2025-03-09.
const CivilDate kMonday(2025, 3, 3);
const CivilDate kSunday(2025, 3, 9);

RoutineSchedule MakeRoutine(const std::string& id, const std::string& rrule) {
    RoutineSchedule r;
    r.id = id;
    r.workerId = "w1";
    r.buildingId = "B1";
    r.name = "Routine " + id;
    r.rrule = rrule;
    r.category = TaskCategory::Cleaning;
    return r;
}

bool Throws(const std::string& rrule) {
    try {
        RoutineExpander::ParseRule(rrule);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestDaily() {
    std::cout << "[Test] DAILY with BYHOUR/BYMINUTE..." << std::endl;
    RoutineExpander expander;
    auto instances = expander.expand(MakeRoutine("lobby", "FREQ=DAILY;BYHOUR=7;BYMINUTE=30"), kMonday, kSunday);
    assert(instances.size() == 7);
    for (size_t i = 0; i < instances.size(); ++i) {
        assert(instances[i].startTime == kMonday.addDays(static_cast<long long>(i)).at(7, 30));
        assert(instances[i].endTime == instances[i].startTime + Minutes(60));
        assert(instances[i].buildingId == "B1");
        assert(instances[i].title == "Routine lobby");
        assert(instances[i].category == TaskCategory::Cleaning);
    }
    assert(instances[0].id == "lobby@2025-03-03T07:30");

    auto twice = expander.expand(MakeRoutine("trash", "FREQ=DAILY;BYHOUR=18,6"), kMonday, kMonday);
    assert(twice.size() == 2);
    assert(twice[0].startTime == kMonday.at(6));
    assert(twice[1].startTime == kMonday.at(18));

    auto weekdays = expander.expand(MakeRoutine("mail", "FREQ=DAILY;BYDAY=MO,TU,WE,TH,FR"), kMonday, kSunday);
    assert(weekdays.size() == 5);
}

void TestWeekly() {
    std::cout << "[Test] WEEKLY requires BYDAY..." << std::endl;
    RoutineExpander expander;
    auto instances = expander.expand(MakeRoutine("glass", "FREQ=WEEKLY;BYDAY=TU,TH"), kMonday, kSunday);
    assert(instances.size() == 2);
    assert(instances[0].id == "glass@2025-03-04T10:00");
    assert(instances[0].endTime == instances[0].startTime + Minutes(120));
    assert(CivilDate::fromTimePoint(instances[1].startTime) == CivilDate(2025, 3, 6));

    assert(expander.expand(MakeRoutine("none", "FREQ=WEEKLY"), kMonday, kSunday).empty());
}

void TestMonthly() {
    std::cout << "[Test] MONTHLY fires on the first weekday of the month..." << std::endl;
    RoutineExpander expander;
    const CivilDate first(2025, 3, 1);
    const CivilDate last(2025, 3, 31);

    // 2025-03-01 is a Saturday, so the first weekday is Monday the 3rd.
    auto instances = expander.expand(MakeRoutine("boiler", "FREQ=MONTHLY"), first, last);
    assert(instances.size() == 1);
    assert(instances[0].startTime == CivilDate(2025, 3, 3).at(11));
    assert(instances[0].endTime == instances[0].startTime + Minutes(180));

    auto fridays = expander.expand(MakeRoutine("roof", "FREQ=MONTHLY;BYDAY=FR"), first, last);
    assert(fridays.size() == 1);
    assert(CivilDate::fromTimePoint(fridays[0].startTime) == CivilDate(2025, 3, 7));

    auto quarter = expander.expand(MakeRoutine("boiler", "FREQ=MONTHLY"), first, CivilDate(2025, 5, 31));
    assert(quarter.size() == 3);
    assert(CivilDate::fromTimePoint(quarter[1].startTime) == CivilDate(2025, 4, 1));
    assert(CivilDate::fromTimePoint(quarter[2].startTime) == CivilDate(2025, 5, 1));
}

void TestExplicitDuration() {
    std::cout << "[Test] An explicit duration overrides the frequency default..." << std::endl;
    RoutineExpander expander;
    auto routine = MakeRoutine("stairs", "FREQ=WEEKLY;BYDAY=MO");
    routine.estimatedDurationMinutes = 45;
    auto instances = expander.expand(routine, kMonday, kSunday);
    assert(instances.size() == 1);
    assert(instances[0].endTime == kMonday.at(10, 45));
}

void TestMalformedRules() {
    std::cout << "[Test] Malformed rules are rejected, and skipped in bulk expansion..." << std::endl;
    assert(Throws("BYDAY=MO"));
    assert(Throws("FREQ=YEARLY"));
    assert(Throws("FREQ=DAILY;BYHOUR=25"));
    assert(Throws("FREQ=DAILY;BYMINUTE=x"));
    assert(Throws("FREQ=WEEKLY;BYDAY=XX"));
    assert(!Throws("FREQ=DAILY;INTERVAL=1"));

    RoutineExpander expander;
    auto all = expander.expandAll({MakeRoutine("bad", "FREQ=HOURLY"), MakeRoutine("good", "FREQ=WEEKLY;BYDAY=WE")},
                                  kMonday, kSunday);
    assert(all.size() == 1);
    assert(all[0].routineId == "good");
}

} // namespace

int main() {
    std::cout << "[Test] Starting RoutineExpander Test..." << std::endl;

    TestDaily();
    TestWeekly();
    TestMonthly();
    TestExplicitDuration();
    TestMalformedRules();

    std::cout << "[PASS] RoutineExpander Test." << std::endl;
    return 0;
}
