// =================================================================
// src/Switchboard/TaskClassifier.cpp
// =================================================================
// Implementation for prompt complexity and domain classification.

#include "Switchboard/TaskClassifier.hpp"
#include "Switchboard/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace Switchboard {

ClassificationRules ClassificationRules::defaults() {
    ClassificationRules rules;

    rules.tiers = {
        {ComplexityLevel::EXPERT, {
            R"(\b(prove|proof|theorem|lemma|corollary)\b)",
            R"(\b(irrational|transcendental|axiom|conjecture)\b)",
            R"(\b(differential equations?|linear algebra|complexity theory|asymptotic|big o)\b)",
            "(∑|∫|∂|∆|∇)"
        }, 1},
        {ComplexityLevel::COMPLEX, {
            R"(\b(implement|architecture|design pattern|optimization|optimi[sz]e)\b)",
            R"(\b(analysis|synthesis|evaluate|compare)\b)",
            R"(\b(machine learning|neural network|data structures?)\b)",
            R"(\b(database design|system architecture|distributed|concurrency)\b)",
            R"(\b(research|investigate|explore)\b)"
        }, 2},
        {ComplexityLevel::MODERATE, {
            R"(\b(function|class|method|variable)\b)",
            R"(\b(calculate|solve|determine)\b)",
            R"(\b(algorithm|programming|debug|code)\b)",
            R"(\b(implement|architecture|analysis|evaluate|compare)\b)"
        }, 1}
    };

    rules.categories = {
        {TaskType::REASONING, {"solve", "calculate", "prove", "proof", "analyze", "logic", "theorem",
                               "equation", "mathematical", "reasoning", "deduce", "infer"}},
        {TaskType::CODING, {"code", "function", "class", "python", "javascript", "programming",
                            "debug", "algorithm", "implementation", "syntax", "compile"}},
        {TaskType::CREATIVE, {"story", "poem", "creative", "write", "narrative", "character",
                              "plot", "fiction", "imagine", "describe"}},
        {TaskType::RESEARCH, {"research", "academic", "paper", "study", "analysis", "review",
                              "synthesis", "comparison", "evaluation", "methodology"}},
        {TaskType::GENERAL, {"summarize", "summary", "overview", "explain", "tell me"}}
    };

    return rules;
}

TaskClassifier::TaskClassifier(const ClassificationRules& rules)
    : m_rules(rules) {
    for (const auto& tier : m_rules.tiers) {
        CompiledTier compiled{tier.level, {}, std::max<size_t>(tier.min_hits, 1)};
        for (const auto& pattern : tier.patterns) {
            try {
                compiled.patterns.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& e) {
                throw ConfigurationError("Invalid classifier pattern '" + pattern + "': " + e.what());
            }
        }
        m_tiers.push_back(std::move(compiled));
    }

    // Highest level first; stable so equal levels keep configuration order
    std::stable_sort(m_tiers.begin(), m_tiers.end(),
                     [](const CompiledTier& a, const CompiledTier& b) {
                         return static_cast<int>(a.level) > static_cast<int>(b.level);
                     });
}

ClassificationResult TaskClassifier::classify(const std::string& prompt) const {
    ClassificationResult result;

    bool blank = std::all_of(prompt.begin(), prompt.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        result.matched_tier = "default";
        result.is_default = true;
        return result;
    }

    std::string lowered = toLower(prompt);

    // Complexity: first tier (from the top) whose threshold is met
    bool tier_matched = false;
    for (const auto& tier : m_tiers) {
        if (countTierHits(tier, prompt) >= tier.min_hits) {
            result.complexity = tier.level;
            result.matched_tier = BackendCapabilityUtils::complexityToString(tier.level);
            tier_matched = true;
            break;
        }
    }
    if (!tier_matched) {
        if (hasStructuralSignal(prompt)) {
            result.complexity = ComplexityLevel::MODERATE;
            result.matched_tier = "structure";
        } else {
            result.complexity = ComplexityLevel::SIMPLE;
            result.matched_tier = "none";
        }
    }

    // Task type: argmax of keyword hits, earlier category wins ties
    size_t best_hits = 0;
    for (const auto& [type, keywords] : m_rules.categories) {
        size_t hits = 0;
        for (const auto& keyword : keywords) {
            if (!keyword.empty() && lowered.find(toLower(keyword)) != std::string::npos) {
                hits++;
            }
        }
        result.category_hits.emplace_back(type, hits);
        if (hits > best_hits) {
            best_hits = hits;
            result.task_type = type;
        }
    }

    return result;
}

size_t TaskClassifier::countTierHits(const CompiledTier& tier, const std::string& prompt) const {
    size_t hits = 0;
    for (const auto& pattern : tier.patterns) {
        if (std::regex_search(prompt, pattern)) {
            hits++;
        }
    }
    return hits;
}

bool TaskClassifier::hasStructuralSignal(const std::string& prompt) const {
    if (prompt.find("```") != std::string::npos) {
        return true;
    }
    auto lines = static_cast<size_t>(std::count(prompt.begin(), prompt.end(), '\n'));
    if (lines > m_rules.max_simple_lines) {
        return true;
    }
    auto questions = static_cast<size_t>(std::count(prompt.begin(), prompt.end(), '?'));
    if (m_rules.question_threshold > 0 && questions >= m_rules.question_threshold) {
        return true;
    }
    return m_rules.long_prompt_chars > 0 && prompt.size() > m_rules.long_prompt_chars;
}

std::string taskTypeToString(TaskType task_type) {
    switch (task_type) {
        case TaskType::REASONING: return "reasoning";
        case TaskType::CODING: return "coding";
        case TaskType::CREATIVE: return "creative";
        case TaskType::RESEARCH: return "research";
        case TaskType::GENERAL: return "general";
        case TaskType::ANALYSIS: return "analysis";
        case TaskType::MULTIMODAL: return "multimodal";
        default: return "general";
    }
}

TaskType stringToTaskType(const std::string& str) {
    static const std::unordered_map<std::string, TaskType> type_map = {
        {"reasoning", TaskType::REASONING},
        {"coding", TaskType::CODING},
        {"creative", TaskType::CREATIVE},
        {"research", TaskType::RESEARCH},
        {"advanced", TaskType::RESEARCH},
        {"general", TaskType::GENERAL},
        {"analysis", TaskType::ANALYSIS},
        {"multimodal", TaskType::MULTIMODAL}
    };

    auto it = type_map.find(toLower(str));
    if (it != type_map.end()) {
        return it->second;
    }
    throw std::invalid_argument("Unknown task type: " + str);
}

std::vector<TaskType> getAllTaskTypes() {
    return {
        TaskType::REASONING,
        TaskType::CODING,
        TaskType::CREATIVE,
        TaskType::RESEARCH,
        TaskType::GENERAL,
        TaskType::ANALYSIS,
        TaskType::MULTIMODAL
    };
}

} // namespace Switchboard
