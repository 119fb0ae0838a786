/**
 * @file FieldPlanApp.cpp
 * @brief Implementation of FieldPlanApp.
 */

#include "app/FieldPlanApp.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include "application/PlanRefreshService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonPlanSource.hpp"
#include "infrastructure/LocalClock.hpp"
#include "infrastructure/PlanJsonExporter.hpp"

namespace fieldplan::app {

void FieldPlanApp::PrintUsage() {
    std::cerr << "Usage: fieldplan <snapshot.json> [--settings <file>] [--worker <id>]"
              << " [--date YYYY-MM-DD] [--now HH:MM]" << std::endl;
}

std::optional<CommandLineOptions> FieldPlanApp::ParseArguments(int argc, char** argv) {
    CommandLineOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "[fieldplan] Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--settings") {
            options.settingsPath = next("--settings");
            if (!options.settingsPath) return std::nullopt;
        } else if (arg == "--worker") {
            options.workerId = next("--worker");
            if (!options.workerId) return std::nullopt;
        } else if (arg == "--date") {
            options.date = next("--date");
            if (!options.date) return std::nullopt;
        } else if (arg == "--now") {
            options.now = next("--now");
            if (!options.now) return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[fieldplan] Unknown option " << arg << std::endl;
            return std::nullopt;
        } else if (options.snapshotPath.empty()) {
            options.snapshotPath = arg;
        } else {
            std::cerr << "[fieldplan] Unexpected argument " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (!options.showHelp && options.snapshotPath.empty()) {
        std::cerr << "[fieldplan] No snapshot given" << std::endl;
        return std::nullopt;
    }
    return options;
}

int FieldPlanApp::Run(int argc, char** argv) {
    auto options = ParseArguments(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }
    if (options->showHelp) {
        PrintUsage();
        return 0;
    }

    // Dependency Injection / Composition Root
    auto settings = options->settingsPath ? infrastructure::ConfigLoader::Load(*options->settingsPath)
                                          : infrastructure::ConfigLoader::LoadDefault();

    auto source = std::make_shared<infrastructure::JsonPlanSource>();
    if (!source->load(options->snapshotPath)) {
        return 1;
    }

    std::string workerId;
    if (options->workerId) {
        workerId = *options->workerId;
    } else if (auto first = source->firstWorkerId()) {
        workerId = *first;
    } else {
        std::cerr << "[fieldplan] No --worker given and the snapshot has no assignments" << std::endl;
        return 1;
    }

    domain::CivilDate date;
    domain::TimePoint now;
    try {
        const domain::TimePoint clock = infrastructure::LocalClock::Now();
        date = options->date ? domain::CivilDate::parse(*options->date) : domain::CivilDate::fromTimePoint(clock);
        if (options->now) {
            now = date.atMinuteOfDay(domain::ParseMinuteOfDay(*options->now));
        } else if (options->date) {
            now = date.startOfDay();
        } else {
            now = clock;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[fieldplan] " << e.what() << std::endl;
        PrintUsage();
        return 1;
    }

    application::PlanRefreshService service(source, settings, workerId);
    if (!service.refresh(date, now)) {
        std::cerr << "[fieldplan] No plan could be built for " << workerId << " on " << date.toString() << std::endl;
        return 2;
    }

    auto plan = service.latestPlan();
    for (const auto& issue : plan->issues) {
        std::cerr << "[fieldplan] " << domain::IssueKindToString(issue.kind) << " (" << issue.subjectId << "): "
                  << issue.message << std::endl;
    }
    std::cout << infrastructure::PlanJsonExporter::Dump(*plan) << std::endl;
    return 0;
}

} // namespace fieldplan::app
