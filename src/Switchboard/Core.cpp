// =================================================================
// src/Switchboard/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Switchboard/Core.hpp"
#include "Switchboard/BackendRegistry.hpp"
#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/HealthMonitor.hpp"
#include "Switchboard/Logger.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include "Switchboard/TaskGraphExecutor.hpp"
#include "Switchboard/WorkflowBuilder.hpp"
#include "Switchboard/WorkflowTemplate.hpp"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <chrono>
#include <stdexcept>

namespace Switchboard {

namespace {

std::string joinTypes(const std::vector<TaskType>& types) {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += ", ";
        out += taskTypeToString(types[i]);
    }
    return out;
}

std::string firstLine(const std::string& text) {
    auto pos = text.find('\n');
    return pos == std::string::npos ? text : text.substr(0, pos) + " ...";
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands)
{
    // Hold file output until the configured directory is known
    Logger::getInstance().setFileLogging(false);

    if (std::filesystem::exists(m_commands.config_path)) {
        m_config = std::make_unique<ConfigParser>(m_commands.config_path);
        m_settings = m_config->getConfig();
    } else {
        std::cerr << "[WARN] Configuration file not found: " << m_commands.config_path
                  << " (using defaults, no backends)" << std::endl;
    }

    setupLogging();

    m_registry = std::make_unique<BackendRegistry>();
    for (const auto& backend : m_settings.backends) {
        m_registry->registerBackend(backend);
    }
    m_registry->validate();

    m_catalog = std::make_unique<TemplateCatalog>(TemplateCatalog::withBuiltins());
    for (const auto& workflow : m_settings.workflows) {
        m_catalog->registerTemplate(workflow);
    }

    m_classifier = std::make_shared<const TaskClassifier>(m_settings.classifier_rules);
    m_router = std::make_unique<BackendRouter>(*m_registry, m_settings.router, m_classifier);

    if (!m_settings.metrics_file.empty()) {
        m_router->loadMetrics(m_settings.metrics_file);
    }
}

Core::~Core() = default;

void Core::setupLogging() {
    auto& logger = Logger::getInstance();
    const LoggingConfig& logging = m_settings.logging;

    std::string console_level = logging.console_level;
    if (m_commands.verbose) {
        console_level = "debug";
    } else if (!m_commands.log_level.empty()) {
        console_level = m_commands.log_level;
    }

    logger.setConsoleLogging(logging.console);
    logger.setConsoleLogLevel(Logger::parseLevel(console_level));
    logger.setFileLogLevel(Logger::parseLevel(logging.file_level));
    logger.setFileLogging(logging.file && !m_commands.no_log_file);
    logger.initialize(logging.directory, logging.max_file_size, logging.max_files);
}

int Core::run() {
    auto& logger = Logger::getInstance();
    auto start_time = std::chrono::steady_clock::now();
    logger.logSessionStart(m_commands.active_command, m_commands.prompt);

    int exit_code = 1;
    if (m_commands.active_command == "classify") {
        exit_code = handleClassify();
    } else if (m_commands.active_command == "route") {
        exit_code = handleRoute();
    } else if (m_commands.active_command == "plan") {
        exit_code = handlePlan();
    } else if (m_commands.active_command == "run") {
        exit_code = handleRun();
    } else if (m_commands.active_command == "backends") {
        exit_code = handleBackends();
    } else if (m_commands.active_command == "templates") {
        exit_code = handleTemplates();
    } else if (m_commands.active_command == "analytics") {
        exit_code = handleAnalytics();
    } else {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logSessionEnd(m_commands.active_command, exit_code, duration.count());
    logger.flush();
    return exit_code;
}

int Core::handleClassify() {
    auto result = m_classifier->classify(m_commands.prompt);

    std::cout << "Complexity: " << BackendCapabilityUtils::complexityToString(result.complexity) << std::endl;
    std::cout << "Task type:  " << taskTypeToString(result.task_type) << std::endl;
    std::cout << "Decided by: " << result.matched_tier << std::endl;
    if (result.is_default) {
        std::cout << "(empty prompt, default classification)" << std::endl;
        return 0;
    }

    std::cout << "Category hits:" << std::endl;
    for (const auto& hit : result.category_hits) {
        std::cout << "  " << std::left << std::setw(10) << taskTypeToString(hit.first)
                  << hit.second << std::endl;
    }
    return 0;
}

int Core::handleRoute() {
    if (m_commands.probe) {
        probeOnce();
    }

    auto classification = m_classifier->classify(m_commands.prompt);
    TaskType type = classification.task_type;
    if (!m_commands.task_type.empty()) {
        type = stringToTaskType(m_commands.task_type);
    }

    auto decision = m_router->route(type, classification.complexity, m_commands.budget_factor);
    saveMetrics();

    std::cout << "Task: " << taskTypeToString(type) << " / "
              << BackendCapabilityUtils::complexityToString(classification.complexity) << std::endl;

    if (!decision.available) {
        std::cout << decision.reason << std::endl;
        return 1;
    }

    std::cout << "Backend:   " << decision.backend << " (" << decision.endpoint << ")" << std::endl;
    std::cout << "Format:    " << BackendCapabilityUtils::wireFormatToString(decision.wire_format) << std::endl;
    std::cout << "Score:     " << std::fixed << std::setprecision(3) << decision.score << std::endl;
    std::cout << "Reason:    " << decision.reason << std::endl;
    std::cout << "Est. cost: " << std::setprecision(4) << decision.estimated_cost
              << "  Est. latency: " << std::setprecision(0) << decision.estimated_latency_ms << " ms" << std::endl;
    if (!decision.complexity_compliant) {
        std::cout << "Warning:   backend ceiling is below the required complexity" << std::endl;
    }
    if (!decision.fallbacks.empty()) {
        std::cout << "Fallbacks:";
        for (const auto& name : decision.fallbacks) {
            std::cout << " " << name;
        }
        std::cout << std::endl;
    }
    return 0;
}

int Core::handlePlan() {
    WorkflowBuilder builder(*m_catalog);
    std::string template_name = resolveTemplate();
    auto tasks = builder.build(template_name, m_commands.prompt, parseContext());

    const auto& workflow = m_catalog->getTemplate(template_name);
    std::cout << "Workflow: " << workflow.name << " - " << workflow.description << std::endl;
    std::cout << "Tasks: " << tasks.size() << ", estimated " << workflow.estimated_duration_s << "s\n" << std::endl;

    for (const auto& task : tasks) {
        std::cout << task.id << " [" << taskTypeToString(task.type) << "]" << std::endl;
        if (!task.dependencies.empty()) {
            std::cout << "  after:";
            for (const auto& dep : task.dependencies) {
                std::cout << " " << dep;
            }
            std::cout << std::endl;
        }
        if (task.parallel_group) {
            std::cout << "  group: " << *task.parallel_group << std::endl;
        }
        std::cout << "  prompt: " << firstLine(task.prompt) << std::endl;
    }
    return 0;
}

int Core::handleRun() {
    if (m_registry->size() == 0) {
        std::cerr << "No backends configured in " << m_commands.config_path << "." << std::endl;
        return 1;
    }
    if (m_commands.probe) {
        probeOnce();
    }

    WorkflowBuilder builder(*m_catalog);
    std::string template_name = resolveTemplate();
    auto tasks = builder.build(template_name, m_commands.prompt, parseContext());

    ExecutorConfig executor_config = m_settings.executor;
    executor_config.budget_factor = m_commands.budget_factor;
    TaskGraphExecutor executor(*m_router, nullptr, executor_config);

    executor.setResultCallback([](const Task& task) {
        if (task.state == TaskState::DONE) {
            std::cout << "[DONE]   " << task.id << " via " << task.assigned_backend << std::endl;
        } else {
            std::cout << "[FAILED] " << task.id << ": " << task.error << std::endl;
        }
    });

    std::cout << "Running workflow " << template_name << " (" << tasks.size() << " tasks)..." << std::endl;
    auto result = executor.execute(tasks);
    saveMetrics();

    for (const auto& task : tasks) {
        if (task.state == TaskState::DONE) {
            std::cout << "\n=== " << task.id << " (" << task.assigned_backend << ") ===\n"
                      << task.result << std::endl;
        }
    }

    std::cout << "\nCompleted " << result.completed.size() << "/" << tasks.size()
              << " tasks in " << result.duration.count() << " ms" << std::endl;
    return result.success ? 0 : 1;
}

int Core::handleBackends() {
    if (m_commands.probe) {
        probeOnce();
    }
    std::cout << m_registry->getAllBackendsInfo() << std::endl;
    return 0;
}

int Core::handleTemplates() {
    for (const auto& workflow : m_catalog->listTemplates()) {
        std::cout << std::left << std::setw(24) << workflow.name << workflow.description << std::endl;
        std::cout << "  steps: " << joinTypes(workflow.task_types) << std::endl;
    }
    return 0;
}

int Core::handleAnalytics() {
    std::cout << m_router->getAnalytics().toJson(m_commands.json_indent) << std::endl;
    return 0;
}

void Core::probeOnce() {
    HealthMonitor monitor(*m_registry, nullptr, m_settings.health_monitor);
    size_t online = monitor.runOnce();
    std::cout << "Probed " << m_registry->size() << " backends, " << online << " online." << std::endl;
}

void Core::saveMetrics() {
    if (m_settings.metrics_file.empty()) {
        return;
    }
    try {
        std::filesystem::path parent = std::filesystem::path(m_settings.metrics_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        m_router->saveMetrics(m_settings.metrics_file);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Core", "Could not persist routing metrics", e.what());
    }
}

std::map<std::string, std::string> Core::parseContext() const {
    std::map<std::string, std::string> context;
    for (const auto& pair : m_commands.context_pairs) {
        auto pos = pair.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw std::invalid_argument("Context entry must be key=value: " + pair);
        }
        context[pair.substr(0, pos)] = pair.substr(pos + 1);
    }
    return context;
}

std::string Core::resolveTemplate() const {
    if (!m_commands.template_name.empty()) {
        return m_commands.template_name;
    }
    WorkflowBuilder builder(*m_catalog);
    std::string suggested = builder.suggestTemplate(m_commands.prompt);
    Logger::getInstance().info("Core", "Suggested workflow template", suggested);
    return suggested;
}

} // namespace Switchboard
