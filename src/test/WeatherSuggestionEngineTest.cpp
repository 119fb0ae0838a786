#include <cassert>
#include <iostream>
#include <vector>

#include "application/WeatherSuggestionEngine.hpp"

using namespace fieldplan::domain;
using fieldplan::application::OrderingResult;
using fieldplan::application::WeatherSuggestionEngine;

namespace {

const CivilDate kTuesday(2025, 3, 4);

WeatherSnapshot UniformWeather(TimePoint now, double precip, double tempF, double windMph,
                               const std::string& condition = "Cloudy") {
    WeatherSnapshot w;
    w.current = {tempF, condition, precip, windMph, now};
    for (int h = 0; h < 12; ++h) {
        w.hourly.push_back({tempF, condition, precip, windMph, now + Hours(h)});
    }
    return w;
}

Task MakeTask(const std::string& id, const std::string& title, TaskCategory category, TimePoint due) {
    Task t;
    t.id = id;
    t.title = title;
    t.buildingId = "B1";
    t.category = category;
    t.dueTime = due;
    return t;
}

BuildingSummary Building() {
    BuildingSummary b;
    b.id = "B1";
    b.name = "12 West St";
    return b;
}

void TestDeferralThreshold() {
    std::cout << "[Test] Outdoor deferral switches on at 40% precipitation..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);

    assert(!engine.shouldDeferOutdoorWork(UniformWeather(now, 0.39, 60, 5)));
    assert(engine.shouldDeferOutdoorWork(UniformWeather(now, 0.40, 60, 5)));

    bool deferred = false;
    for (int pct = 0; pct <= 100; pct += 5) {
        bool deferredHere = engine.shouldDeferOutdoorWork(UniformWeather(now, pct / 100.0, 60, 5));
        // Once deferral starts it never switches off at higher precipitation.
        assert(!deferred || deferredHere);
        deferred = deferredHere;
    }
    assert(deferred);

    assert(engine.shouldDeferOutdoorWork(UniformWeather(now, 0.0, 40, 5)));
    assert(engine.shouldDeferOutdoorWork(UniformWeather(now, 0.0, 60, 30)));
}

void TestDeferralLooksAheadTwoHours() {
    std::cout << "[Test] Deferral only considers the next two hourly blocks..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);
    auto weather = UniformWeather(now, 0.1, 60, 5);
    weather.hourly[2].precipProb = 0.9;
    assert(!engine.shouldDeferOutdoorWork(weather));
    weather.hourly[1].precipProb = 0.9;
    assert(engine.shouldDeferOutdoorWork(weather));
}

void TestRainOrdering() {
    std::cout << "[Test] In 50% rain 'Lobby check' comes first and hosing is deferred..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);
    auto weather = UniformWeather(now, 0.5, 55, 5, "Light rain");

    std::vector<Task> tasks = {
        MakeTask("t-hose", "Hose sidewalks", TaskCategory::Cleaning, now),
        MakeTask("t-lobby", "Lobby check", TaskCategory::Inspection, now + Hours(1)),
    };

    OrderingResult result = engine.order(tasks, weather);
    assert(result.deferralActive);
    assert(!result.ordered.empty());
    assert(result.ordered.front().task.title == "Lobby check");
    assert(result.deferred.size() == 1);
    assert(result.deferred[0].task.id == "t-hose");
    assert(result.deferred[0].chip && *result.deferred[0].chip == WeatherChip::Wet);

    assert(result.substitutes.size() == 1);
    assert(result.substitutes[0].kind == SuggestionKind::Indoor);
    assert(result.substitutes[0].buildingId == "B1");
    assert(result.substitutes[0].templateId == "indoorDetail");
    assert(result.substitutes[0].checklist.size() == 3);

    auto titles = engine.scoreAndOrder(tasks, weather);
    assert(titles.size() == 1 && titles[0].title == "Lobby check");
}

void TestScoreChips() {
    std::cout << "[Test] Weather chips for outdoor work..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);
    auto sweep = MakeTask("t1", "Sweep sidewalk", TaskCategory::Cleaning, now + Hours(2));

    auto good = engine.score(sweep, UniformWeather(now, 0.05, 60, 5));
    assert(good.isOutdoor);
    assert(good.chip && *good.chip == WeatherChip::GoodWindow);
    // 120 min / 30 = 4, minus the good-window bonus, minus Normal urgency.
    assert(good.score == 4 - 1 - 1);

    auto heavy = engine.score(sweep, UniformWeather(now, 0.7, 60, 5));
    assert(heavy.chip && *heavy.chip == WeatherChip::HeavyRain);
    assert(heavy.score == 4 + 3 - 1);

    auto trash = MakeTask("t2", "Take out trash", TaskCategory::Sanitation, now);
    auto windy = engine.score(trash, UniformWeather(now, 0.0, 60, 32));
    assert(windy.chip && *windy.chip == WeatherChip::Windy);

    auto inspection = MakeTask("t3", "Elevator inspection", TaskCategory::Inspection, now);
    auto indoor = engine.score(inspection, UniformWeather(now, 0.9, 20, 40));
    assert(!indoor.isOutdoor);
    assert(!indoor.chip);
}

void TestOutdoorByTitle() {
    std::cout << "[Test] Keyword match marks a task outdoor regardless of category..." << std::endl;
    WeatherSuggestionEngine engine;
    assert(engine.isOutdoorTitle("Power wash storefront"));
    assert(engine.isOutdoorTitle("Clear ROOF drains"));
    assert(!engine.isOutdoorTitle("Lobby check"));

    Task t;
    t.title = "Check exterior lights";
    t.category = TaskCategory::Inspection;
    assert(engine.isOutdoorTask(t));
}

void TestOrderingWithoutWeather() {
    std::cout << "[Test] Without weather the order follows due time and urgency..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);

    auto later = MakeTask("t-later", "Mop lobby", TaskCategory::Cleaning, now + Hours(3));
    auto soon = MakeTask("t-soon", "Hose sidewalks", TaskCategory::Cleaning, now + Hours(1));
    Task undated;
    undated.id = "t-undated";
    undated.title = "Restock";

    auto result = engine.orderWithoutWeather({undated, later, soon}, now);
    assert(!result.deferralActive);
    assert(result.deferred.empty());
    assert(result.ordered.size() == 3);
    assert(result.ordered[0].task.id == "t-soon");
    assert(result.ordered[1].task.id == "t-later");
    assert(result.ordered[2].task.id == "t-undated");
}

void TestRainSuggestionsWithCollection() {
    std::cout << "[Test] Collection suggestion ranks first and the list is capped at three..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);
    auto weather = UniformWeather(now, 0.5, 55, 5, "Light rain");

    CollectionRule rule;
    rule.id = "dsny";
    rule.title = "Set out bins";
    rule.collectionDays = {Weekday::Tuesday};
    rule.windowStartMinute = 20 * 60;
    rule.windowEndMinute = 21 * 60;
    rule.buildingGroup = {"B1"};

    auto suggestions = engine.suggestionsFor(Building(), weather, {rule}, {});
    assert(suggestions.size() == 3);
    assert(suggestions[0].kind == SuggestionKind::Collection);
    assert(suggestions[0].title == "Set out bins");
    assert(suggestions[0].dueBy && *suggestions[0].dueBy == kTuesday.at(19, 50));
    assert(suggestions[1].title == "Clear roof & curb drains");
    assert(suggestions[2].title == "Deploy / clean rain mats");

    // Titles already at the top of the task list are not repeated.
    suggestions = engine.suggestionsFor(Building(), weather, {rule}, {"clear roof & curb drains", "Lobby check"});
    assert(suggestions.size() == 3);
    assert(suggestions[1].title == "Deploy / clean rain mats");
    assert(suggestions[2].title == "Skip sidewalk hosing");

    // The rule does not cover other buildings.
    BuildingSummary other;
    other.id = "B2";
    suggestions = engine.suggestionsFor(other, weather, {rule}, {});
    for (const auto& s : suggestions) assert(s.kind != SuggestionKind::Collection);
}

void TestFairWeatherSuggestions() {
    std::cout << "[Test] Warm and calm weather suggests hosing, mild weather a sweep..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);

    auto warm = engine.suggestionsFor(Building(), UniformWeather(now, 0.1, 85, 5, "Sunny"), {}, {});
    assert(warm.size() == 1);
    assert(warm[0].kind == SuggestionKind::Heat);
    assert(warm[0].title == "Hose sidewalks");

    auto mild = engine.suggestionsFor(Building(), UniformWeather(now, 0.0, 65, 5, "Clear"), {}, {});
    assert(mild.size() == 1);
    assert(mild[0].kind == SuggestionKind::Generic);
    assert(mild[0].templateId == "exteriorMaintenance");

    auto windy = engine.suggestionsFor(Building(), UniformWeather(now, 0.0, 65, 20, "Breezy"), {}, {});
    assert(windy.size() == 1);
    assert(windy[0].title == "Secure trash");
}

void TestSnowSuggestion() {
    std::cout << "[Test] Snow with high precipitation suggests salting..." << std::endl;
    WeatherSuggestionEngine engine;
    const TimePoint now = kTuesday.at(8);
    auto snow = engine.suggestionsFor(Building(), UniformWeather(now, 0.6, 28, 5, "Heavy snow"), {}, {});
    bool salted = false;
    for (const auto& s : snow) salted = salted || s.templateId == "saltEntrances";
    // Three rain suggestions outrank it, so it falls off the capped list.
    assert(!salted);
    assert(snow.size() == 3);

    auto light = engine.suggestionsFor(Building(), UniformWeather(now, 0.6, 28, 5, "Heavy snow"), {},
                                       {"Clear roof & curb drains", "Deploy / clean rain mats"});
    salted = false;
    for (const auto& s : light) salted = salted || s.templateId == "saltEntrances";
    assert(salted);
}

} // namespace

int main() {
    std::cout << "[Test] Starting WeatherSuggestionEngine Test..." << std::endl;

    TestDeferralThreshold();
    TestDeferralLooksAheadTwoHours();
    TestRainOrdering();
    TestScoreChips();
    TestOutdoorByTitle();
    TestOrderingWithoutWeather();
    TestRainSuggestionsWithCollection();
    TestFairWeatherSuggestions();
    TestSnowSuggestion();

    std::cout << "[PASS] WeatherSuggestionEngine Test." << std::endl;
    return 0;
}
