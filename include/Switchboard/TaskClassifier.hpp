// =================================================================
// include/Switchboard/TaskClassifier.hpp
// =================================================================
// Header for prompt complexity and domain classification.

#pragma once

#include "Switchboard/BackendCapabilities.hpp"
#include <string>
#include <vector>
#include <utility>
#include <regex>

namespace Switchboard {

/**
 * @brief Task domains used for routing and workflow expansion
 */
enum class TaskType {
    REASONING,      ///< Logic, mathematics, problem solving
    CODING,         ///< Programming and debugging
    CREATIVE,       ///< Stories, poems and other writing
    RESEARCH,       ///< Academic research, reviews, synthesis
    GENERAL,        ///< Everything else
    ANALYSIS,       ///< Data and situation analysis (workflow-only)
    MULTIMODAL      ///< Mixed-media work (workflow-only)
};

/**
 * @brief One complexity tier: a set of regex markers and a hit threshold
 */
struct ComplexityTier {
    ComplexityLevel level = ComplexityLevel::SIMPLE;
    std::vector<std::string> patterns;  ///< ECMAScript regexes, matched case-insensitively
    size_t min_hits = 1;                ///< Distinct patterns that must match
};

/**
 * @brief Data-driven rules for the classifier
 *
 * Tiers are evaluated from the highest level down; the first tier whose
 * threshold is met decides the complexity. Categories are listed in
 * tie-break order.
 */
struct ClassificationRules {
    std::vector<ComplexityTier> tiers;
    std::vector<std::pair<TaskType, std::vector<std::string>>> categories;

    // Structural signals that alone make a prompt at least MODERATE
    size_t max_simple_lines = 10;       ///< More newlines than this is structured
    size_t question_threshold = 2;      ///< Question marks that indicate a multi-part ask
    size_t long_prompt_chars = 240;     ///< Length that indicates a non-trivial ask

    /**
     * @brief Built-in rule set
     */
    static ClassificationRules defaults();
};

/**
 * @brief Outcome of classifying one prompt
 */
struct ClassificationResult {
    ComplexityLevel complexity = ComplexityLevel::SIMPLE;
    TaskType task_type = TaskType::GENERAL;
    std::string matched_tier;                               ///< Tier or signal that decided complexity
    std::vector<std::pair<TaskType, size_t>> category_hits; ///< Keyword hits per category, tie-break order
    bool is_default = false;                                ///< True for the empty-prompt fallback
};

/**
 * @brief Pure keyword/pattern classifier for prompts
 *
 * Maps a prompt to a complexity level and a task type. Holds compiled
 * rules only; classify() keeps no state between calls.
 */
class TaskClassifier {
public:
    /**
     * @brief Construct a classifier from a rule set
     * @param rules Classification rules (defaults when omitted)
     * @throws ConfigurationError if a pattern is not a valid regex
     */
    explicit TaskClassifier(const ClassificationRules& rules = ClassificationRules::defaults());

    /**
     * @brief Classify a prompt
     * @param prompt Natural-language request
     * @return Complexity, task type and the evidence behind them
     */
    ClassificationResult classify(const std::string& prompt) const;

    const ClassificationRules& getRules() const { return m_rules; }

private:
    struct CompiledTier {
        ComplexityLevel level;
        std::vector<std::regex> patterns;
        size_t min_hits;
    };

    ClassificationRules m_rules;
    std::vector<CompiledTier> m_tiers;

    size_t countTierHits(const CompiledTier& tier, const std::string& prompt) const;
    bool hasStructuralSignal(const std::string& prompt) const;
};

/**
 * @brief Convert TaskType to its lowercase name
 */
std::string taskTypeToString(TaskType task_type);

/**
 * @brief Parse a task type name; "advanced" is accepted as RESEARCH
 * @throws std::invalid_argument for unknown names
 */
TaskType stringToTaskType(const std::string& str);

/**
 * @brief All task types in declaration order
 */
std::vector<TaskType> getAllTaskTypes();

} // namespace Switchboard
