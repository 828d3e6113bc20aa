// =================================================================
// src/Switchboard/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Switchboard/CliParser.hpp"

namespace Switchboard {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Switchboard: routes prompts and multi-step workflows across AI backends.");
    m_app->require_subcommand(1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.")
        ->capture_default_str();
    m_app->add_option("--log-level", m_commands.log_level, "Console log level (debug, info, warning, error, critical).")
        ->check(CLI::IsMember({"debug", "info", "warning", "error", "critical"}, CLI::ignore_case));
    m_app->add_flag("--no-log-file", m_commands.no_log_file, "Disable writing log files.");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Shorthand for --log-level debug.");

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupClassifyCommand(*m_app);
    setupRouteCommand(*m_app);
    setupPlanCommand(*m_app);
    setupRunCommand(*m_app);
    setupBackendsCommand(*m_app);
    setupTemplatesCommand(*m_app);
    setupAnalyticsCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupClassifyCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("classify", "Shows the complexity and task type inferred for a prompt.");
    sub->add_option("prompt", m_commands.prompt, "The prompt to classify.")->required();
}

void CliParser::setupRouteCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("route", "Selects a backend for a single prompt without invoking it.");
    sub->add_option("prompt", m_commands.prompt, "The prompt to route.")->required();
    sub->add_option("-b,--budget", m_commands.budget_factor, "Budget factor; higher values care less about cost (default: 1.0)")
        ->check(CLI::PositiveNumber);
    sub->add_option("-t,--type", m_commands.task_type, "Force the task type instead of classifying it.");
    sub->add_flag("--probe", m_commands.probe, "Probe backend health once before routing.");
}

void CliParser::setupPlanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("plan", "Expands a prompt into a workflow task graph without running it.");
    sub->add_option("prompt", m_commands.prompt, "The high-level request.")->required();
    sub->add_option("-w,--template", m_commands.template_name, "Workflow template (default: suggested from the prompt)");
    sub->add_option("--context", m_commands.context_pairs, "Context entries as key=value, copied into every task.");
}

void CliParser::setupRunCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("run", "Builds and executes a workflow against the configured backends.");
    sub->add_option("prompt", m_commands.prompt, "The high-level request.")->required();
    sub->add_option("-w,--template", m_commands.template_name, "Workflow template (default: suggested from the prompt)");
    sub->add_option("--context", m_commands.context_pairs, "Context entries as key=value, copied into every task.");
    sub->add_option("-b,--budget", m_commands.budget_factor, "Budget factor passed to the router (default: 1.0)")
        ->check(CLI::PositiveNumber);
    sub->add_flag("--probe", m_commands.probe, "Probe backend health once before running.");
}

void CliParser::setupBackendsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("backends", "Lists configured backends and their health.");
    sub->add_flag("--probe", m_commands.probe, "Probe every backend once before listing.");
}

void CliParser::setupTemplatesCommand(CLI::App& app) {
    app.add_subcommand("templates", "Lists the available workflow templates.");
}

void CliParser::setupAnalyticsCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analytics", "Prints persisted routing metrics as JSON.");
    sub->add_option("--indent", m_commands.json_indent, "JSON indentation (default: 2)");
}

} // namespace Switchboard
