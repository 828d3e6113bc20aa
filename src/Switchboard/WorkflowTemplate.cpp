// =================================================================
// src/Switchboard/WorkflowTemplate.cpp
// =================================================================
// Built-in workflow templates and catalog validation.

#include "Switchboard/WorkflowTemplate.hpp"
#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <set>

namespace Switchboard {

namespace {

bool dependsOn(const WorkflowTemplate& workflow, TaskType from, TaskType target, std::set<TaskType>& seen) {
    auto it = workflow.dependencies.find(from);
    if (it == workflow.dependencies.end()) {
        return false;
    }
    for (TaskType prerequisite : it->second) {
        if (prerequisite == target) {
            return true;
        }
        if (seen.insert(prerequisite).second && dependsOn(workflow, prerequisite, target, seen)) {
            return true;
        }
    }
    return false;
}

bool dependsOn(const WorkflowTemplate& workflow, TaskType from, TaskType target) {
    std::set<TaskType> seen;
    return dependsOn(workflow, from, target, seen);
}

} // namespace

TemplateCatalog TemplateCatalog::withBuiltins() {
    using T = TaskType;
    TemplateCatalog catalog;

    catalog.registerTemplate({
        "research_analysis",
        "Research a topic and provide comprehensive analysis",
        {T::RESEARCH, T::REASONING, T::GENERAL},
        {{T::REASONING, {T::RESEARCH}}, {T::GENERAL, {T::RESEARCH, T::REASONING}}},
        {},
        {"search", "reasoning", "analysis"},
        {"research", "analyze", "study", "investigate", "examine"},
        120
    });

    catalog.registerTemplate({
        "code_development",
        "Research, design, implement, and document code",
        {T::RESEARCH, T::CODING, T::REASONING, T::GENERAL},
        {{T::CODING, {T::RESEARCH}}, {T::REASONING, {T::CODING}}, {T::GENERAL, {T::REASONING}}},
        {},
        {"search", "coding", "reasoning", "documentation"},
        {"code", "program", "develop", "implement", "function", "algorithm"},
        180
    });

    catalog.registerTemplate({
        "creative_project",
        "Research, brainstorm, create, and refine creative content",
        {T::RESEARCH, T::CREATIVE, T::REASONING, T::GENERAL},
        {{T::CREATIVE, {T::RESEARCH}}, {T::REASONING, {T::CREATIVE}}, {T::GENERAL, {T::REASONING}}},
        {},
        {"search", "creative", "reasoning", "general"},
        {"write", "create", "story", "poem", "creative", "generate"},
        150
    });

    // Code walkthrough and reasoning both build on research and run side by side
    catalog.registerTemplate({
        "technical_docs",
        "Research, analyze code, and create comprehensive documentation",
        {T::RESEARCH, T::CODING, T::REASONING, T::GENERAL},
        {{T::CODING, {T::RESEARCH}}, {T::REASONING, {T::RESEARCH}}, {T::GENERAL, {T::CODING, T::REASONING}}},
        {{T::CODING, T::REASONING}},
        {"search", "coding", "analysis", "documentation"},
        {"document", "documentation", "explain", "guide", "manual"},
        100
    });

    catalog.registerTemplate({
        "multi_domain",
        "Parallel analysis across multiple domains with synthesis",
        {T::RESEARCH, T::REASONING, T::CODING, T::CREATIVE, T::GENERAL},
        {{T::GENERAL, {T::RESEARCH, T::REASONING, T::CODING, T::CREATIVE}}},
        {{T::RESEARCH, T::REASONING, T::CODING, T::CREATIVE}},
        {"search", "reasoning", "coding", "creative", "synthesis"},
        {"compare", "contrast", "multiple", "different", "various"},
        200
    });

    catalog.registerTemplate({
        "problem_solving",
        "Systematic approach to complex problem solving",
        {T::RESEARCH, T::REASONING, T::CODING, T::GENERAL},
        {{T::REASONING, {T::RESEARCH}}, {T::CODING, {T::REASONING}}, {T::GENERAL, {T::CODING}}},
        {},
        {"search", "reasoning", "coding", "problem-solving"},
        {"solve", "solution", "problem", "fix", "resolve"},
        160
    });

    catalog.registerTemplate({
        "network_security",
        "Comprehensive security analysis for networks",
        {T::RESEARCH, T::REASONING, T::GENERAL},
        {{T::REASONING, {T::RESEARCH}}, {T::GENERAL, {T::REASONING}}},
        {{T::RESEARCH}, {T::REASONING}},
        {"security_analysis", "policy_management", "threat_detection"},
        {"security", "firewall", "policy", "threat", "vulnerability"},
        120
    });

    catalog.registerTemplate({
        "devops_infrastructure",
        "Container and infrastructure management with deployment",
        {T::RESEARCH, T::CODING, T::REASONING, T::GENERAL},
        {{T::CODING, {T::RESEARCH}}, {T::REASONING, {T::CODING}}, {T::GENERAL, {T::REASONING}}},
        {},
        {"container_management", "code_management", "infrastructure"},
        {"docker", "container", "deploy", "infrastructure", "devops", "ci/cd"},
        180
    });

    return catalog;
}

void TemplateCatalog::validate(const WorkflowTemplate& workflow) {
    if (workflow.name.empty()) {
        throw InvalidTemplateError("<unnamed>", "template name is empty");
    }

    auto first_index = [&](TaskType type) -> long {
        auto it = std::find(workflow.task_types.begin(), workflow.task_types.end(), type);
        return it == workflow.task_types.end() ? -1 : static_cast<long>(it - workflow.task_types.begin());
    };

    for (const auto& [dependent, prerequisites] : workflow.dependencies) {
        long dependent_index = first_index(dependent);
        if (dependent_index < 0) {
            throw InvalidTemplateError(workflow.name,
                "dependency key '" + taskTypeToString(dependent) + "' is not a declared task type");
        }
        for (TaskType prerequisite : prerequisites) {
            long prerequisite_index = first_index(prerequisite);
            if (prerequisite_index < 0) {
                throw InvalidTemplateError(workflow.name,
                    "prerequisite '" + taskTypeToString(prerequisite) + "' of '" +
                    taskTypeToString(dependent) + "' is not a declared task type");
            }
            if (prerequisite_index >= dependent_index) {
                throw InvalidTemplateError(workflow.name,
                    "prerequisite '" + taskTypeToString(prerequisite) + "' must come before '" +
                    taskTypeToString(dependent) + "'");
            }
        }
    }

    std::set<TaskType> sectioned;
    for (const auto& section : workflow.parallel_sections) {
        for (TaskType type : section) {
            if (first_index(type) < 0) {
                throw InvalidTemplateError(workflow.name,
                    "parallel section names undeclared task type '" + taskTypeToString(type) + "'");
            }
            if (!sectioned.insert(type).second) {
                throw InvalidTemplateError(workflow.name,
                    "task type '" + taskTypeToString(type) + "' appears in more than one parallel section");
            }
        }
        for (TaskType a : section) {
            for (TaskType b : section) {
                if (a != b && dependsOn(workflow, a, b)) {
                    throw InvalidTemplateError(workflow.name,
                        "parallel section members '" + taskTypeToString(a) + "' and '" +
                        taskTypeToString(b) + "' depend on each other");
                }
            }
        }
    }
}

void TemplateCatalog::registerTemplate(const WorkflowTemplate& workflow) {
    validate(workflow);

    auto it = m_index.find(workflow.name);
    if (it != m_index.end()) {
        m_templates[it->second] = workflow;
        Logger::getInstance().debug("TemplateCatalog", "Replaced template: " + workflow.name);
        return;
    }

    m_index[workflow.name] = m_templates.size();
    m_templates.push_back(workflow);
}

size_t TemplateCatalog::loadFromConfig(const std::string& config_path) {
    auto workflows = ConfigParser::loadWorkflows(config_path);
    for (const auto& workflow : workflows) {
        registerTemplate(workflow);
    }

    Logger::getInstance().info("TemplateCatalog",
        "Loaded " + std::to_string(workflows.size()) + " workflow templates", config_path);
    return workflows.size();
}

const WorkflowTemplate& TemplateCatalog::getTemplate(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        throw UnknownTemplateError(name);
    }
    return m_templates[it->second];
}

bool TemplateCatalog::hasTemplate(const std::string& name) const {
    return m_index.count(name) > 0;
}

std::string taskStateToString(TaskState state) {
    switch (state) {
        case TaskState::PENDING: return "pending";
        case TaskState::READY: return "ready";
        case TaskState::RUNNING: return "running";
        case TaskState::DONE: return "done";
        case TaskState::FAILED: return "failed";
        default: return "unknown";
    }
}

} // namespace Switchboard
