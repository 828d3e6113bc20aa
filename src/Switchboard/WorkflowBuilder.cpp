// =================================================================
// src/Switchboard/WorkflowBuilder.cpp
// =================================================================
// Implementation of the workflow graph builder.

#include "Switchboard/WorkflowBuilder.hpp"
#include "Switchboard/Logger.hpp"
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace Switchboard {

namespace {
const char* const DEFAULT_TEMPLATE = "research_analysis";
}

WorkflowBuilder::WorkflowBuilder(const TemplateCatalog& catalog)
    : m_catalog(catalog) {
}

std::vector<Task> WorkflowBuilder::build(const std::string& template_name, const std::string& prompt,
                                         const std::map<std::string, std::string>& context) const {
    const WorkflowTemplate& workflow = m_catalog.getTemplate(template_name);

    std::vector<Task> tasks;
    if (workflow.task_types.empty()) {
        return tasks;
    }

    std::string workflow_id = generateWorkflowId();

    // Section index per task type, only for sections that actually run something together
    std::map<TaskType, size_t> group_of;
    for (size_t i = 0; i < workflow.parallel_sections.size(); ++i) {
        if (workflow.parallel_sections[i].size() >= 2) {
            for (TaskType type : workflow.parallel_sections[i]) {
                group_of[type] = i;
            }
        }
    }

    tasks.reserve(workflow.task_types.size());
    for (size_t i = 0; i < workflow.task_types.size(); ++i) {
        TaskType type = workflow.task_types[i];

        Task task;
        task.type = type;
        task.id = workflow_id + "-" + taskTypeToString(type) + "-" + std::to_string(i);
        task.prompt = subPrompt(type, prompt);
        task.context = context;

        auto deps = workflow.dependencies.find(type);
        if (deps != workflow.dependencies.end()) {
            for (TaskType prerequisite : deps->second) {
                for (const auto& earlier : tasks) {
                    if (earlier.type == prerequisite) {
                        task.dependencies.push_back(earlier.id);
                        break;
                    }
                }
            }
        }

        auto group = group_of.find(type);
        if (group != group_of.end()) {
            task.parallel_group = workflow_id + "-pg" + std::to_string(group->second);
        }

        tasks.push_back(std::move(task));
    }

    Logger::getInstance().debug("WorkflowBuilder", "Built workflow " + workflow_id,
        "Template: " + template_name + ", Tasks: " + std::to_string(tasks.size()));
    return tasks;
}

std::vector<Task> WorkflowBuilder::buildFromPrompt(const std::string& prompt,
                                                   const std::map<std::string, std::string>& context) const {
    return build(suggestTemplate(prompt), prompt, context);
}

std::string WorkflowBuilder::suggestTemplate(const std::string& prompt) const {
    std::string lowered = toLower(prompt);

    std::string best;
    size_t best_hits = 0;
    for (const auto& workflow : m_catalog.listTemplates()) {
        size_t hits = 0;
        for (const auto& keyword : workflow.keywords) {
            if (!keyword.empty() && lowered.find(toLower(keyword)) != std::string::npos) {
                hits++;
            }
        }
        if (hits > best_hits) {
            best_hits = hits;
            best = workflow.name;
        }
    }

    if (!best.empty()) {
        return best;
    }
    if (m_catalog.hasTemplate(DEFAULT_TEMPLATE) || m_catalog.size() == 0) {
        return DEFAULT_TEMPLATE;
    }
    return m_catalog.listTemplates().front().name;
}

std::string WorkflowBuilder::subPrompt(TaskType type, const std::string& prompt) {
    switch (type) {
        case TaskType::RESEARCH:
            return "Research and gather information about: " + prompt;
        case TaskType::REASONING:
            return "Analyze and reason about: " + prompt +
                   ". Consider the research findings and provide logical conclusions.";
        case TaskType::CODING:
            return "Develop code or a technical solution for: " + prompt +
                   ". Use research insights to inform the implementation.";
        case TaskType::CREATIVE:
            return "Create creative content related to: " + prompt +
                   ". Draw inspiration from research and analysis.";
        case TaskType::GENERAL:
            return "Provide a comprehensive summary and final response for: " + prompt +
                   ". Integrate insights from all previous analyses.";
        case TaskType::ANALYSIS:
            return "Perform detailed analysis of: " + prompt;
        case TaskType::MULTIMODAL:
            return "Process and analyze multimodal content for: " + prompt;
        default:
            return "Process the following request: " + prompt;
    }
}

std::string WorkflowBuilder::generateWorkflowId() {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution;

    std::ostringstream id;
    id << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return id.str();
}

} // namespace Switchboard
