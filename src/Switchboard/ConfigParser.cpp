// =================================================================
// src/Switchboard/ConfigParser.cpp
// =================================================================
// Implementation of the YAML configuration loader.

#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace Switchboard {

namespace {

YAML::Node loadRoot(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw ConfigurationError("Configuration file not found: " + config_path);
    }
    try {
        return YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to parse " + config_path + ": " + e.what());
    }
}

template<typename T>
T valueOr(const YAML::Node& node, const char* key, const T& fallback) {
    if (node[key]) {
        return node[key].as<T>();
    }
    return fallback;
}

std::vector<std::string> stringList(const YAML::Node& node, const char* key) {
    std::vector<std::string> values;
    if (!node[key]) {
        return values;
    }
    if (!node[key].IsSequence()) {
        throw ConfigurationError(std::string("'") + key + "' must be a list");
    }
    for (const auto& item : node[key]) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

std::chrono::milliseconds secondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

BackendDescriptor parseBackend(const YAML::Node& node) {
    BackendDescriptor backend;
    backend.name = valueOr<std::string>(node, "name", "");
    if (backend.name.empty()) {
        throw ConfigurationError("Backend entry is missing 'name'");
    }

    try {
        backend.endpoint = valueOr<std::string>(node, "endpoint", "");
        backend.wire_format = BackendCapabilityUtils::stringToWireFormat(
            valueOr<std::string>(node, "wire_format", "openai-compatible"));
        backend.specialties = stringList(node, "specialties");
        backend.cost_per_token = valueOr<double>(node, "cost_per_token", 0.0);
        backend.performance_score = valueOr<double>(node, "performance_score", 0.5);
        backend.avg_latency_ms = valueOr<double>(node, "avg_latency_ms", 0.0);
        backend.max_complexity = BackendCapabilityUtils::stringToComplexity(
            valueOr<std::string>(node, "max_complexity", "moderate"));
        backend.fallback_chain = stringList(node, "fallback_chain");
        if (node["health_endpoints"]) {
            backend.health_endpoints = stringList(node, "health_endpoints");
        }
        backend.description = valueOr<std::string>(node, "description", "");
        backend.service_type = valueOr<std::string>(node, "service_type", "llm");
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Backend '" + backend.name + "': " + e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Backend '" + backend.name + "': " + e.what());
    }

    if (backend.performance_score < 0.0 || backend.performance_score > 1.0) {
        throw ConfigurationError("Backend '" + backend.name + "': performance_score must be within [0, 1]");
    }
    if (backend.cost_per_token < 0.0 || backend.avg_latency_ms < 0.0) {
        throw ConfigurationError("Backend '" + backend.name + "': cost and latency must be non-negative");
    }

    return backend;
}

std::vector<TaskType> taskTypeList(const YAML::Node& node) {
    std::vector<TaskType> types;
    for (const auto& item : node) {
        types.push_back(stringToTaskType(item.as<std::string>()));
    }
    return types;
}

WorkflowTemplate parseWorkflow(const YAML::Node& node) {
    WorkflowTemplate workflow;
    workflow.name = valueOr<std::string>(node, "name", "");
    if (workflow.name.empty()) {
        throw ConfigurationError("Workflow entry is missing 'name'");
    }

    try {
        workflow.description = valueOr<std::string>(node, "description", "");
        if (node["task_types"]) {
            workflow.task_types = taskTypeList(node["task_types"]);
        }
        if (node["dependencies"]) {
            for (auto it = node["dependencies"].begin(); it != node["dependencies"].end(); ++it) {
                workflow.dependencies[stringToTaskType(it->first.as<std::string>())] = taskTypeList(it->second);
            }
        }
        if (node["parallel_sections"]) {
            for (const auto& section : node["parallel_sections"]) {
                workflow.parallel_sections.push_back(taskTypeList(section));
            }
        }
        workflow.required_capabilities = stringList(node, "required_capabilities");
        workflow.keywords = stringList(node, "keywords");
        workflow.estimated_duration_s = valueOr<int>(node, "estimated_duration_s", 0);
    } catch (const std::invalid_argument& e) {
        // Unknown task type names make the template itself invalid
        throw InvalidTemplateError(workflow.name, e.what());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Workflow '" + workflow.name + "': " + e.what());
    }

    return workflow;
}

void parseClassifier(const YAML::Node& node, ClassificationRules& rules) {
    if (node["tiers"]) {
        for (auto it = node["tiers"].begin(); it != node["tiers"].end(); ++it) {
            ComplexityLevel level = BackendCapabilityUtils::stringToComplexity(it->first.as<std::string>());
            ComplexityTier tier{level, stringList(it->second, "patterns"),
                                valueOr<size_t>(it->second, "min_hits", 1)};

            auto existing = std::find_if(rules.tiers.begin(), rules.tiers.end(),
                                         [level](const ComplexityTier& t) { return t.level == level; });
            if (existing != rules.tiers.end()) {
                *existing = tier;
            } else {
                rules.tiers.push_back(tier);
            }
        }
    }

    if (node["categories"]) {
        for (auto it = node["categories"].begin(); it != node["categories"].end(); ++it) {
            TaskType type = stringToTaskType(it->first.as<std::string>());
            std::vector<std::string> keywords;
            for (const auto& keyword : it->second) {
                keywords.push_back(keyword.as<std::string>());
            }

            auto existing = std::find_if(rules.categories.begin(), rules.categories.end(),
                                         [type](const auto& entry) { return entry.first == type; });
            if (existing != rules.categories.end()) {
                existing->second = keywords;
            } else {
                rules.categories.emplace_back(type, keywords);
            }
        }
    }

    rules.max_simple_lines = valueOr<size_t>(node, "max_simple_lines", rules.max_simple_lines);
    rules.question_threshold = valueOr<size_t>(node, "question_threshold", rules.question_threshold);
    rules.long_prompt_chars = valueOr<size_t>(node, "long_prompt_chars", rules.long_prompt_chars);
}

void parseRouter(const YAML::Node& node, RouterConfig& router) {
    router.performance_weight = valueOr(node, "performance_weight", router.performance_weight);
    router.exact_specialty_bonus = valueOr(node, "exact_specialty_bonus", router.exact_specialty_bonus);
    router.partial_specialty_bonus = valueOr(node, "partial_specialty_bonus", router.partial_specialty_bonus);
    router.under_ceiling_penalty = valueOr(node, "under_ceiling_penalty", router.under_ceiling_penalty);
    router.expert_fit_bonus = valueOr(node, "expert_fit_bonus", router.expert_fit_bonus);
    router.complex_fit_bonus = valueOr(node, "complex_fit_bonus", router.complex_fit_bonus);
    router.base_fit_bonus = valueOr(node, "base_fit_bonus", router.base_fit_bonus);
    router.cost_bonus = valueOr(node, "cost_bonus", router.cost_bonus);
    router.cheap_cost_threshold = valueOr(node, "cheap_cost_threshold", router.cheap_cost_threshold);
    router.min_budget_factor = valueOr(node, "min_budget_factor", router.min_budget_factor);
    router.max_latency_bonus = valueOr(node, "max_latency_bonus", router.max_latency_bonus);
    router.latency_reference_s = valueOr(node, "latency_reference_s", router.latency_reference_s);
    router.latency_slope = valueOr(node, "latency_slope", router.latency_slope);
    router.estimated_tokens = valueOr(node, "estimated_tokens", router.estimated_tokens);
    router.treat_unknown_as_healthy = valueOr(node, "treat_unknown_as_healthy", router.treat_unknown_as_healthy);
    router.metrics_window = valueOr(node, "metrics_window", router.metrics_window);
    router.log_decisions = valueOr(node, "log_decisions", router.log_decisions);
}

void parseHealthMonitor(const YAML::Node& node, HealthMonitorConfig& monitor) {
    if (node["interval_s"]) {
        monitor.interval = secondsToMillis(node["interval_s"].as<double>());
    }
    if (node["probe_timeout_s"]) {
        monitor.probe_timeout = secondsToMillis(node["probe_timeout_s"].as<double>());
    }
    monitor.failure_threshold = valueOr(node, "failure_threshold", monitor.failure_threshold);
    monitor.max_concurrent_probes = valueOr(node, "max_concurrent_probes", monitor.max_concurrent_probes);
}

void parseExecutor(const YAML::Node& node, ExecutorConfig& executor) {
    executor.max_parallel_tasks = valueOr(node, "max_parallel_tasks", executor.max_parallel_tasks);
    executor.max_attempts = valueOr(node, "max_attempts", executor.max_attempts);
    executor.timeout_multiplier = valueOr(node, "timeout_multiplier", executor.timeout_multiplier);
    if (node["min_timeout_s"]) {
        executor.min_timeout = secondsToMillis(node["min_timeout_s"].as<double>());
    }
    executor.budget_factor = valueOr(node, "budget_factor", executor.budget_factor);
}

void parseLogging(const YAML::Node& node, LoggingConfig& logging) {
    logging.directory = valueOr(node, "directory", logging.directory);
    logging.console_level = valueOr(node, "console_level", logging.console_level);
    logging.file_level = valueOr(node, "file_level", logging.file_level);
    logging.console = valueOr(node, "console", logging.console);
    logging.file = valueOr(node, "file", logging.file);
    if (node["max_file_size_mb"]) {
        logging.max_file_size = node["max_file_size_mb"].as<size_t>() * 1024 * 1024;
    }
    logging.max_files = valueOr(node, "max_files", logging.max_files);

    // Reject unknown level names at load time rather than on first log call
    Logger::parseLevel(logging.console_level);
    Logger::parseLevel(logging.file_level);
}

void flattenScalars(const YAML::Node& node, const std::string& prefix,
                    std::map<std::string, std::string>& values) {
    if (node.IsScalar()) {
        values[prefix] = node.Scalar();
        return;
    }
    if (!node.IsMap()) {
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        flattenScalars(it->second, prefix.empty() ? key : prefix + "." + key, values);
    }
}

} // namespace

ConfigParser::ConfigParser(const std::string& config_path)
    : m_config_path(config_path) {
    YAML::Node root = loadRoot(config_path);
    if (!root.IsMap()) {
        if (root.IsNull()) {
            return;
        }
        throw ConfigurationError("Configuration root of " + config_path + " must be a mapping");
    }

    try {
        if (root["backends"]) {
            for (const auto& node : root["backends"]) {
                m_config.backends.push_back(parseBackend(node));
            }
        }
        if (root["workflows"]) {
            for (const auto& node : root["workflows"]) {
                m_config.workflows.push_back(parseWorkflow(node));
            }
        }
        if (root["classifier"]) {
            parseClassifier(root["classifier"], m_config.classifier_rules);
        }
        if (root["router"]) {
            parseRouter(root["router"], m_config.router);
            m_config.metrics_file = valueOr(root["router"], "metrics_file", m_config.metrics_file);
        }
        if (root["health_monitor"]) {
            parseHealthMonitor(root["health_monitor"], m_config.health_monitor);
        }
        if (root["executor"]) {
            parseExecutor(root["executor"], m_config.executor);
        }
        if (root["logging"]) {
            parseLogging(root["logging"], m_config.logging);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value in " + config_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Invalid value in " + config_path + ": " + e.what());
    }

    flattenScalars(root, "", m_config_values);

    Logger::getInstance().debug("ConfigParser", "Loaded configuration: " + config_path,
        "Backends: " + std::to_string(m_config.backends.size()) +
        ", Workflows: " + std::to_string(m_config.workflows.size()));
}

std::string ConfigParser::getStringValue(const std::string& key) const {
    auto it = m_config_values.find(key);
    if (it != m_config_values.end()) {
        return it->second;
    }
    return "";
}

std::vector<BackendDescriptor> ConfigParser::loadBackends(const std::string& config_path) {
    YAML::Node root = loadRoot(config_path);
    std::vector<BackendDescriptor> backends;
    if (!root.IsMap() || !root["backends"]) {
        Logger::getInstance().warning("ConfigParser", "No 'backends' section in configuration file", config_path);
        return backends;
    }
    if (!root["backends"].IsSequence()) {
        throw ConfigurationError("'backends' in " + config_path + " must be a list");
    }
    for (const auto& node : root["backends"]) {
        backends.push_back(parseBackend(node));
    }
    return backends;
}

std::vector<WorkflowTemplate> ConfigParser::loadWorkflows(const std::string& config_path) {
    YAML::Node root = loadRoot(config_path);
    std::vector<WorkflowTemplate> workflows;
    if (!root.IsMap() || !root["workflows"]) {
        return workflows;
    }
    if (!root["workflows"].IsSequence()) {
        throw ConfigurationError("'workflows' in " + config_path + " must be a list");
    }
    for (const auto& node : root["workflows"]) {
        workflows.push_back(parseWorkflow(node));
    }
    return workflows;
}

} // namespace Switchboard
