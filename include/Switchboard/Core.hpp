// =================================================================
// include/Switchboard/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Switchboard/CliParser.hpp"
#include "Switchboard/ConfigParser.hpp"
#include <map>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Switchboard {
    class BackendRegistry;
    class BackendRouter;
    class TaskClassifier;
    class TemplateCatalog;
}

namespace Switchboard {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     *
     * Loads the configuration, configures logging and builds the registry,
     * template catalog and router. A missing configuration file leaves
     * every component at its defaults with no backends.
     * @param commands The parsed command-line arguments.
     * @throws ConfigurationError if the configuration is invalid.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleClassify();
    int handleRoute();
    int handlePlan();
    int handleRun();
    int handleBackends();
    int handleTemplates();
    int handleAnalytics();

    void setupLogging();
    void probeOnce();
    void saveMetrics();
    std::map<std::string, std::string> parseContext() const;
    std::string resolveTemplate() const;

    const Commands& m_commands;
    std::unique_ptr<ConfigParser> m_config;
    SwitchboardConfig m_settings;
    std::unique_ptr<BackendRegistry> m_registry;
    std::unique_ptr<TemplateCatalog> m_catalog;
    std::shared_ptr<const TaskClassifier> m_classifier;
    std::unique_ptr<BackendRouter> m_router;
};

} // namespace Switchboard
