/**
 * @file WeatherSuggestionEngine.cpp
 * @brief Implementation of WeatherSuggestionEngine.
 */

#include "application/WeatherSuggestionEngine.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>

namespace fieldplan::application {

using namespace domain;

namespace {

constexpr int kNoDueMinutes = 9999;

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Rationale(const WeatherSnapshot& weather) {
    const auto& now = weather.current;
    std::string text = now.condition.empty() ? "Conditions" : now.condition;
    text += ", " + std::to_string(static_cast<int>(now.tempF)) + "°F";
    text += ", " + std::to_string(static_cast<int>(now.precipProb * 100)) + "% precip";
    text += ", " + std::to_string(static_cast<int>(now.windMph)) + " mph wind";
    return text;
}

int SuggestionRank(SuggestionKind kind) {
    switch (kind) {
        case SuggestionKind::Collection: return 0;
        case SuggestionKind::Rain:
        case SuggestionKind::Wind: return 1;
        default: return 2;
    }
}

std::string ShortName(const BuildingSummary& building) {
    return building.name.empty() ? building.id : building.name;
}

} // namespace

WeatherSuggestionEngine::WeatherSuggestionEngine(WeatherSettings settings)
    : m_settings(std::move(settings)) {
    for (auto& keyword : m_settings.outdoorKeywords) {
        keyword = ToLower(keyword);
    }
}

bool WeatherSuggestionEngine::shouldDeferOutdoorWork(const WeatherSnapshot& weather) const {
    for (const auto& block : weather.lookahead(m_settings.deferralLookaheadHours)) {
        if (block.precipProb >= m_settings.precipDeferThreshold) return true;
        if (block.tempF <= m_settings.coldDeferThresholdF) return true;
        if (block.windMph >= m_settings.windDeferThresholdMph) return true;
    }
    return false;
}

bool WeatherSuggestionEngine::isOutdoorTitle(const std::string& title) const {
    const std::string lower = ToLower(title);
    for (const auto& keyword : m_settings.outdoorKeywords) {
        if (!keyword.empty() && lower.find(keyword) != std::string::npos) return true;
    }
    return false;
}

bool WeatherSuggestionEngine::isOutdoorTask(const Task& task) const {
    return ProfileFor(task.category).isOutdoor || isOutdoorTitle(task.title);
}

WeatherProfile WeatherSuggestionEngine::ProfileFor(TaskCategory category) {
    switch (category) {
        case TaskCategory::Cleaning: return {true, true, false, 25.0, 0.3};
        case TaskCategory::Sanitation: return {true, true, true, 30.0, 0.4};
        case TaskCategory::Operations: return {true, false, true, 35.0, 0.6};
        case TaskCategory::Maintenance:
        case TaskCategory::Repair: return {true, true, false, 20.0, 0.2};
        default: return {};
    }
}

int WeatherSuggestionEngine::BasePriority(const Task& task, TimePoint now) {
    int minutesUntilDue = kNoDueMinutes;
    if (task.dueTime) {
        minutesUntilDue = static_cast<int>(std::chrono::duration_cast<Minutes>(*task.dueTime - now).count());
    }
    int categoryBonus = 0;
    switch (task.category) {
        case TaskCategory::Sanitation: categoryBonus = -2; break;
        case TaskCategory::Maintenance: categoryBonus = -1; break;
        case TaskCategory::Inspection: categoryBonus = 1; break;
        default: break;
    }
    return std::max(0, minutesUntilDue / 30) + categoryBonus - UrgencyRank(task.urgency);
}

const WeatherSample& WeatherSuggestionEngine::NearestBlock(const WeatherSnapshot& weather, TimePoint target) {
    if (weather.hourly.empty()) return weather.current;
    const WeatherSample* best = &weather.hourly.front();
    for (const auto& block : weather.hourly) {
        auto gap = block.timestamp > target ? block.timestamp - target : target - block.timestamp;
        auto bestGap = best->timestamp > target ? best->timestamp - target : target - best->timestamp;
        if (gap < bestGap) best = &block;
    }
    return *best;
}

ScoredTask WeatherSuggestionEngine::score(const Task& task, const WeatherSnapshot& weather) const {
    const TimePoint now = weather.current.timestamp;

    ScoredTask scored;
    scored.task = task;
    scored.isOutdoor = isOutdoorTask(task);

    int penalty = 0;
    if (scored.isOutdoor) {
        WeatherProfile profile = ProfileFor(task.category);
        if (!profile.isOutdoor) {
            // Outdoor by title only: treat like exterior cleaning.
            profile = ProfileFor(TaskCategory::Cleaning);
        }
        const WeatherSample& block = NearestBlock(weather, task.dueTime.value_or(now));

        if (profile.sensitiveToPrecip) {
            if (block.precipProb >= 0.6) {
                penalty += 3;
                scored.chip = WeatherChip::HeavyRain;
                scored.advice = "Do indoor tasks; rain likely.";
            } else if (block.precipProb >= profile.maxPrecipProb) {
                penalty += 1;
                scored.chip = WeatherChip::Wet;
                scored.advice = "Wet window likely; consider reslotting.";
            }
        }
        if (profile.sensitiveToWind && block.windMph > profile.maxWindMph) {
            penalty += 1;
            if (!scored.chip) {
                scored.chip = WeatherChip::Windy;
                scored.advice = "High wind; bag and tie securely.";
            }
        }
        if (block.tempF <= 25.0) {
            penalty += 1;
            if (!scored.chip) {
                scored.chip = WeatherChip::Cold;
                scored.advice = "Very cold; reduce outdoor exposure.";
            }
        } else if (block.tempF >= 95.0) {
            penalty += 1;
            if (!scored.chip) {
                scored.chip = WeatherChip::Hot;
                scored.advice = "Heat; hydrate and pace work.";
            }
        }
        if (!scored.chip && block.precipProb < 0.2 && block.windMph < 20.0) {
            penalty -= 1;
            scored.chip = WeatherChip::GoodWindow;
            scored.advice = "Good window for outdoor work.";
        }
    }

    scored.score = BasePriority(task, now) + penalty;
    return scored;
}

std::vector<Task> WeatherSuggestionEngine::scoreAndOrder(const std::vector<Task>& tasks,
                                                         const WeatherSnapshot& weather) const {
    std::vector<Task> out;
    for (auto& scored : order(tasks, weather).ordered) {
        out.push_back(std::move(scored.task));
    }
    return out;
}

OrderingResult WeatherSuggestionEngine::order(const std::vector<Task>& tasks, const WeatherSnapshot& weather) const {
    std::vector<ScoredTask> scored;
    scored.reserve(tasks.size());
    for (const auto& task : tasks) {
        scored.push_back(score(task, weather));
    }
    return orderScored(std::move(scored), shouldDeferOutdoorWork(weather), Rationale(weather));
}

OrderingResult WeatherSuggestionEngine::orderWithoutWeather(const std::vector<Task>& tasks, TimePoint now) const {
    std::vector<ScoredTask> scored;
    scored.reserve(tasks.size());
    for (const auto& task : tasks) {
        ScoredTask s;
        s.task = task;
        s.isOutdoor = isOutdoorTask(task);
        s.score = BasePriority(task, now);
        scored.push_back(std::move(s));
    }
    return orderScored(std::move(scored), false, "");
}

OrderingResult WeatherSuggestionEngine::orderScored(std::vector<ScoredTask> scored, bool deferralActive,
                                                    const std::string& rationale) const {
    std::stable_sort(scored.begin(), scored.end(), [](const ScoredTask& a, const ScoredTask& b) {
        if (a.score != b.score) return a.score < b.score;
        if (a.task.dueTime && b.task.dueTime) return *a.task.dueTime < *b.task.dueTime;
        return a.task.dueTime.has_value() && !b.task.dueTime.has_value();
    });

    OrderingResult result;
    result.deferralActive = deferralActive;
    std::set<std::string> substitutedBuildings;

    for (auto& item : scored) {
        if (!deferralActive || !isOutdoorTitle(item.task.title)) {
            result.ordered.push_back(std::move(item));
            continue;
        }

        const std::string buildingId = item.task.buildingId.value_or("");
        if (substitutedBuildings.insert(buildingId).second) {
            WeatherSuggestion substitute;
            substitute.id = "indoor-" + (buildingId.empty() ? item.task.id : buildingId);
            substitute.kind = SuggestionKind::Indoor;
            substitute.title = "Indoor work instead";
            substitute.subtitle = "Weather unsafe for '" + item.task.title + "'; detail lobby and stairwells";
            substitute.rationale = rationale;
            substitute.templateId = "indoorDetail";
            substitute.checklist = ChecklistFor(substitute.templateId);
            substitute.buildingId = buildingId;
            result.substitutes.push_back(std::move(substitute));
        }
        result.deferred.push_back(std::move(item));
    }
    return result;
}

std::vector<WeatherSuggestion> WeatherSuggestionEngine::suggestionsFor(
    const BuildingSummary& building,
    const WeatherSnapshot& weather,
    const std::vector<CollectionRule>& collectionRules,
    const std::vector<std::string>& upcomingTitles) const {
    const auto blocks = weather.lookahead(m_settings.suggestionLookaheadHours);
    double maxPrecip = 0.0;
    double maxTemp = weather.current.tempF;
    double maxWind = 0.0;
    if (!blocks.empty()) maxTemp = blocks.front().tempF;
    for (const auto& block : blocks) {
        maxPrecip = std::max(maxPrecip, block.precipProb);
        maxTemp = std::max(maxTemp, block.tempF);
        maxWind = std::max(maxWind, block.windMph);
    }

    const std::string rationale = Rationale(weather);
    const std::string name = ShortName(building);
    std::vector<WeatherSuggestion> out;

    auto add = [&](SuggestionKind kind, const std::string& templateId, const std::string& title,
                   const std::string& subtitle) -> WeatherSuggestion& {
        WeatherSuggestion s;
        s.id = templateId + "-" + building.id;
        s.kind = kind;
        s.title = title;
        s.subtitle = subtitle;
        s.rationale = rationale;
        s.templateId = templateId;
        s.checklist = ChecklistFor(templateId);
        s.buildingId = building.id;
        out.push_back(std::move(s));
        return out.back();
    };

    if (maxPrecip >= 0.25) {
        add(SuggestionKind::Rain, "skipHosing", "Skip sidewalk hosing",
            "Rain expected; spot clean and prevent pooling on walkways");
    }
    if (maxPrecip >= 0.4) {
        add(SuggestionKind::Rain, "roofDrainCheck", "Clear roof & curb drains",
            "Check scuppers and drains before precipitation at " + name);
    }
    if (maxPrecip >= 0.3) {
        add(SuggestionKind::Rain, "rainMats", "Deploy / clean rain mats", "Reduce slip risk at lobby entrance");
    }
    if (maxTemp >= 78.0 && maxPrecip < 0.3) {
        add(SuggestionKind::Heat, "hoseSidewalks", "Hose sidewalks",
            "Warm today (" + std::to_string(static_cast<int>(maxTemp)) + "°F); hose and squeegee at " + name);
    }
    if (maxWind >= 15.0) {
        add(SuggestionKind::Wind, "secureTrash", "Secure trash",
            "Windy (" + std::to_string(static_cast<int>(maxWind)) + " mph); secure lids and tie bags");
    }

    const CivilDate today = CivilDate::fromTimePoint(weather.current.timestamp);
    const CollectionRule* setOut = nullptr;
    for (const auto& rule : collectionRules) {
        if (rule.kind != CollectionRuleKind::SetOut) continue;
        if (!rule.firesOn(today.weekday()) || !rule.coversBuilding(building.id)) continue;
        if (!setOut || rule.windowStartMinute < setOut->windowStartMinute) setOut = &rule;
    }
    if (setOut) {
        auto& s = add(SuggestionKind::Collection, "collectionSetout", setOut->title,
                      "Set out bins by the " + FormatTimePoint(today.atMinuteOfDay(setOut->windowStartMinute)).substr(11) +
                          " window at " + name);
        s.dueBy = today.atMinuteOfDay(setOut->windowStartMinute) - Minutes(10);
    }

    if (ToLower(weather.current.condition).find("snow") != std::string::npos) {
        for (const auto& block : blocks) {
            if (block.precipProb >= 0.5) {
                add(SuggestionKind::Snow, "saltEntrances", "Salt entrances", "Snow expected; salt within 4h after snowfall");
                break;
            }
        }
    }

    if (out.empty()) {
        add(SuggestionKind::Generic, "exteriorMaintenance", "Routine exterior sweep",
            "Good conditions for exterior maintenance at " + name);
    }

    std::stable_sort(out.begin(), out.end(), [](const WeatherSuggestion& a, const WeatherSuggestion& b) {
        int ra = SuggestionRank(a.kind);
        int rb = SuggestionRank(b.kind);
        if (ra != rb) return ra < rb;
        return a.title < b.title;
    });

    std::set<std::string> alreadyShown;
    for (size_t i = 0; i < upcomingTitles.size() && i < 2; ++i) {
        alreadyShown.insert(ToLower(upcomingTitles[i]));
    }

    std::vector<WeatherSuggestion> ranked;
    for (auto& s : out) {
        if (alreadyShown.count(ToLower(s.title))) continue;
        ranked.push_back(std::move(s));
        if (ranked.size() == 3) break;
    }
    return ranked;
}

std::vector<std::string> WeatherSuggestionEngine::ChecklistFor(const std::string& templateId) {
    static const std::map<std::string, std::vector<std::string>> kChecklists = {
        {"skipHosing", {"Spot-clean sidewalk instead of hosing", "Check walkways for pooling", "Place wet-floor sign at entrance"}},
        {"roofDrainCheck", {"Inspect roof drains and scuppers", "Clear debris from curb drains", "Photograph drains after clearing"}},
        {"rainMats", {"Lay rain mats at lobby entrance", "Replace saturated mats", "Place wet-floor sign"}},
        {"hoseSidewalks", {"Hose sidewalk and curb", "Squeegee standing water", "Coil hose and close spigot"}},
        {"secureTrash", {"Secure trash can lids", "Tie bags closed", "Move loose items indoors"}},
        {"collectionSetout", {"Stage bins at the curb", "Separate recycling and refuse", "Check lids are closed"}},
        {"saltEntrances", {"Salt entrances and walkways", "Clear snow from ramps", "Restock salt supply"}},
        {"exteriorMaintenance", {"Sweep sidewalk and entrance", "Empty exterior receptacles", "Check exterior lighting"}},
        {"indoorDetail", {"Clean lobby glass and fixtures", "Sweep and mop stairwells", "Wipe down elevator interior"}},
    };
    auto it = kChecklists.find(templateId);
    if (it == kChecklists.end()) return {};
    return it->second;
}

} // namespace fieldplan::application
