// =================================================================
// include/Switchboard/ConfigParser.hpp
// =================================================================
// Loads the switchboard.yml configuration file.

#pragma once

#include "Switchboard/BackendCapabilities.hpp"
#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/HealthMonitor.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include "Switchboard/TaskGraphExecutor.hpp"
#include "Switchboard/WorkflowTemplate.hpp"
#include <string>
#include <vector>
#include <map>

namespace Switchboard {

/**
 * @brief Logger settings from the logging section
 */
struct LoggingConfig {
    std::string directory = ".switchboard/logs";
    std::string console_level = "info";
    std::string file_level = "debug";
    bool console = true;
    bool file = true;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/**
 * @brief Complete parsed configuration
 */
struct SwitchboardConfig {
    std::vector<BackendDescriptor> backends;
    std::vector<WorkflowTemplate> workflows;        ///< Added to (or replacing) the built-ins
    ClassificationRules classifier_rules = ClassificationRules::defaults();
    RouterConfig router;
    HealthMonitorConfig health_monitor;
    ExecutorConfig executor;
    LoggingConfig logging;
    std::string metrics_file = ".switchboard/metrics.json";
};

/**
 * @brief YAML configuration loader
 *
 * Sections: backends, workflows, classifier, router, health_monitor,
 * executor and logging. Missing sections keep their defaults.
 */
class ConfigParser {
public:
    /**
     * @brief Constructs the parser and loads the configuration file.
     * @param config_path The path to switchboard.yml.
     * @throws ConfigurationError if the file is missing or malformed.
     */
    explicit ConfigParser(const std::string& config_path);

    const SwitchboardConfig& getConfig() const { return m_config; }

    /**
     * @brief Retrieves a scalar by dotted key, e.g. "router.metrics_window".
     * @return The value as written, or an empty string if not found.
     */
    std::string getStringValue(const std::string& key) const;

    /**
     * @brief Parse only the backends section of a file
     * @throws ConfigurationError on I/O, syntax or value errors
     */
    static std::vector<BackendDescriptor> loadBackends(const std::string& config_path);

    /**
     * @brief Parse only the workflows section of a file
     * @throws ConfigurationError on I/O, syntax or value errors
     */
    static std::vector<WorkflowTemplate> loadWorkflows(const std::string& config_path);

private:
    std::string m_config_path;
    SwitchboardConfig m_config;
    std::map<std::string, std::string> m_config_values;
};

} // namespace Switchboard
