// =================================================================
// include/Switchboard/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Switchboard {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string config_path = "config/switchboard.yml";
    std::string log_level;      // Overrides logging.console_level when set
    bool no_log_file = false;
    bool verbose = false;

    // Options for 'classify', 'route', 'plan' and 'run'
    std::string prompt;

    // Options for 'route' and 'run'
    double budget_factor = 1.0;
    std::string task_type;      // 'route' only: skip classification of the domain
    bool probe = false;         // Probe backends once before acting

    // Options for 'plan' and 'run'
    std::string template_name;  // Empty: suggested from the prompt
    std::vector<std::string> context_pairs; // key=value

    // Options for 'analytics'
    int json_indent = 2;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupClassifyCommand(CLI::App& app);
    void setupRouteCommand(CLI::App& app);
    void setupPlanCommand(CLI::App& app);
    void setupRunCommand(CLI::App& app);
    void setupBackendsCommand(CLI::App& app);
    void setupTemplatesCommand(CLI::App& app);
    void setupAnalyticsCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Switchboard
