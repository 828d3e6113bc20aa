// =================================================================
// include/Switchboard/WorkflowTemplate.hpp
// =================================================================
// Workflow templates, task records and the validated template catalog.

#pragma once

#include "Switchboard/TaskClassifier.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <unordered_map>

namespace Switchboard {

/**
 * @brief Execution state of a task
 */
enum class TaskState {
    PENDING,    ///< Waiting for dependencies
    READY,      ///< Dependencies done, not yet dispatched
    RUNNING,    ///< Dispatched to a backend
    DONE,       ///< Result available
    FAILED      ///< Gave up; see Task::error
};

/**
 * @brief One node of a workflow graph
 */
struct Task {
    std::string id;                                 ///< <workflow>-<type>-<index>
    TaskType type = TaskType::GENERAL;
    std::string prompt;                             ///< Sub-prompt for this step
    std::map<std::string, std::string> context;     ///< Caller context plus dependency results
    std::vector<std::string> dependencies;          ///< Ids of earlier tasks
    std::optional<std::string> parallel_group;      ///< Shared id for tasks that run together
    TaskState state = TaskState::PENDING;

    std::string result;                             ///< Backend output when DONE
    std::string error;                              ///< Failure reason when FAILED
    std::string assigned_backend;                   ///< Backend of the last attempt
    size_t attempts = 0;                            ///< Dispatch attempts made
};

/**
 * @brief Declarative multi-step workflow
 */
struct WorkflowTemplate {
    std::string name;                                           ///< Catalog key, e.g. research_analysis
    std::string description;
    std::vector<TaskType> task_types;                           ///< Steps in build order
    std::map<TaskType, std::vector<TaskType>> dependencies;     ///< Step -> prerequisite steps
    std::vector<std::vector<TaskType>> parallel_sections;       ///< Steps that may run together
    std::vector<std::string> required_capabilities;
    std::vector<std::string> keywords;                          ///< Prompt keywords used by suggestion
    int estimated_duration_s = 0;
};

/**
 * @brief Ordered, validated collection of workflow templates
 */
class TemplateCatalog {
public:
    TemplateCatalog() = default;

    /**
     * @brief Catalog preloaded with the built-in templates
     */
    static TemplateCatalog withBuiltins();

    /**
     * @brief Validate and add (or replace) a template
     * @throws InvalidTemplateError if the template is inconsistent
     */
    void registerTemplate(const WorkflowTemplate& workflow);

    /**
     * @brief Load the workflows section of a YAML configuration file
     * @return Number of templates registered
     * @throws ConfigurationError on parse errors, InvalidTemplateError on bad templates
     */
    size_t loadFromConfig(const std::string& config_path);

    /**
     * @brief Look up a template
     * @throws UnknownTemplateError if absent
     */
    const WorkflowTemplate& getTemplate(const std::string& name) const;

    bool hasTemplate(const std::string& name) const;

    /**
     * @brief Templates in registration order
     */
    const std::vector<WorkflowTemplate>& listTemplates() const { return m_templates; }

    size_t size() const { return m_templates.size(); }

    /**
     * @brief Check a template's internal consistency
     *
     * Every dependency key and prerequisite must be a declared step and
     * each prerequisite must appear before its dependent. Parallel
     * sections may only name declared steps, a step may sit in at most
     * one section, and steps in one section may not depend on each other.
     * @throws InvalidTemplateError describing the first violation
     */
    static void validate(const WorkflowTemplate& workflow);

private:
    std::vector<WorkflowTemplate> m_templates;
    std::unordered_map<std::string, size_t> m_index;
};

std::string taskStateToString(TaskState state);

} // namespace Switchboard
