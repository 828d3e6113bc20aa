// =================================================================
// include/Switchboard/WorkflowBuilder.hpp
// =================================================================
// Expands a prompt and a workflow template into an acyclic task list.

#pragma once

#include "Switchboard/WorkflowTemplate.hpp"
#include <string>
#include <vector>
#include <map>

namespace Switchboard {

/**
 * @brief Builds task graphs from workflow templates
 *
 * Dependencies only ever point at tasks created earlier in the same
 * build, so every result is a DAG.
 */
class WorkflowBuilder {
public:
    /**
     * @brief Constructor
     * @param catalog Template catalog (must outlive the builder)
     */
    explicit WorkflowBuilder(const TemplateCatalog& catalog);

    /**
     * @brief Build the tasks of a named template
     * @param template_name Catalog key
     * @param prompt User request
     * @param context Key/value context copied into every task
     * @return Tasks in template order
     * @throws UnknownTemplateError if the template does not exist
     */
    std::vector<Task> build(const std::string& template_name, const std::string& prompt,
                            const std::map<std::string, std::string>& context = {}) const;

    /**
     * @brief Build with the template suggested for the prompt
     */
    std::vector<Task> buildFromPrompt(const std::string& prompt,
                                      const std::map<std::string, std::string>& context = {}) const;

    /**
     * @brief Pick the template whose keywords best match the prompt
     * @return Template name; research_analysis when nothing matches
     */
    std::string suggestTemplate(const std::string& prompt) const;

    /**
     * @brief Sub-prompt given to a task of the given type
     */
    static std::string subPrompt(TaskType type, const std::string& prompt);

    /**
     * @brief Random 8-digit lowercase hex workflow identifier
     */
    static std::string generateWorkflowId();

private:
    const TemplateCatalog& m_catalog;
};

} // namespace Switchboard
