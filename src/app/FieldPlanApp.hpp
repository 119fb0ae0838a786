/**
 * @file FieldPlanApp.hpp
 * @brief Command-line application: builds one plan from a snapshot and prints it.
 */

#pragma once

#include <optional>
#include <string>

namespace fieldplan::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed arguments of the fieldplan tool.
 */
struct CommandLineOptions {
    std::string snapshotPath;
    std::optional<std::string> settingsPath; ///< Default: $XDG_CONFIG_HOME/fieldplan/settings.json
    std::optional<std::string> workerId;     ///< Default: first worker of the snapshot.
    std::optional<std::string> date;         ///< YYYY-MM-DD, default: today.
    std::optional<std::string> now;          ///< HH:MM on the plan date.
    bool showHelp = false;
};

/**
 * @class FieldPlanApp
 * @brief Composition root of the command-line tool.
 */
class FieldPlanApp {
public:
    /**
     * @brief Parses arguments, runs one refresh and prints the plan JSON on stdout.
     * @return 0 on success, 1 on unusable arguments or a missing snapshot, 2 if no plan could be built.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses argv.
     * @return nullopt when the arguments are unusable (already reported on stderr).
     */
    static std::optional<CommandLineOptions> ParseArguments(int argc, char** argv);

private:
    static void PrintUsage();
};

} // namespace fieldplan::app
