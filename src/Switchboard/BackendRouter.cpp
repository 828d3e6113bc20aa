// =================================================================
// src/Switchboard/BackendRouter.cpp
// =================================================================
// Implementation of score-based backend routing.

#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace Switchboard {

std::string ScoreBreakdown::dominantTerm() const {
    const std::pair<const char*, double> terms[] = {
        {"performance", performance},
        {"specialty", specialty},
        {"complexity_fit", complexity_fit},
        {"cost", cost},
        {"latency", latency}
    };

    const auto* best = &terms[0];
    for (const auto& term : terms) {
        if (term.second > best->second) {
            best = &term;
        }
    }
    return best->first;
}

std::string RoutingAnalytics::toJson(int indent) const {
    nlohmann::json doc;
    doc["registry_size"] = registry_size;
    doc["total_decisions"] = total_decisions;
    doc["unavailable_decisions"] = unavailable_decisions;
    doc["backends"] = nlohmann::json::array();

    for (const auto& [name, metrics] : backends) {
        doc["backends"].push_back({
            {"name", name},
            {"requests_routed", metrics.requests_routed},
            {"total_outcomes", metrics.total_outcomes},
            {"window_samples", metrics.window_samples},
            {"success_rate", metrics.success_rate},
            {"avg_latency_ms", metrics.avg_latency_ms}
        });
    }

    return doc.dump(indent);
}

BackendRouter::BackendRouter(BackendRegistry& registry,
                             const RouterConfig& config,
                             std::shared_ptr<const TaskClassifier> classifier)
    : m_registry(registry), m_config(config), m_classifier(std::move(classifier)) {
    if (!m_classifier) {
        m_classifier = std::make_shared<const TaskClassifier>();
    }
    if (m_config.metrics_window == 0) {
        m_config.metrics_window = 1;
    }
}

ScoreBreakdown BackendRouter::scoreBackend(const BackendDescriptor& backend, TaskType task_type,
                                           ComplexityLevel complexity, double budget_factor) const {
    ScoreBreakdown score;

    score.performance = backend.performance_score * m_config.performance_weight;

    std::string type_name = taskTypeToString(task_type);
    if (BackendCapabilityUtils::hasSpecialty(backend, type_name)) {
        score.specialty = m_config.exact_specialty_bonus;
    } else {
        for (const auto& specialty : backend.specialties) {
            std::string lowered = toLower(specialty);
            if (!lowered.empty() &&
                (lowered.find(type_name) != std::string::npos || type_name.find(lowered) != std::string::npos)) {
                score.specialty = m_config.partial_specialty_bonus;
                break;
            }
        }
    }

    if (!BackendCapabilityUtils::meetsComplexity(backend.max_complexity, complexity)) {
        score.complexity_fit = -m_config.under_ceiling_penalty;
    } else if (complexity == ComplexityLevel::EXPERT && backend.max_complexity == ComplexityLevel::EXPERT) {
        score.complexity_fit = m_config.expert_fit_bonus;
    } else if (complexity == ComplexityLevel::COMPLEX) {
        score.complexity_fit = m_config.complex_fit_bonus;
    } else {
        score.complexity_fit = m_config.base_fit_bonus;
    }

    if ((complexity == ComplexityLevel::SIMPLE || complexity == ComplexityLevel::MODERATE) &&
        backend.cost_per_token < m_config.cheap_cost_threshold) {
        score.cost = m_config.cost_bonus / std::max(budget_factor, m_config.min_budget_factor);
    }

    double latency_s = backend.avg_latency_ms / 1000.0;
    score.latency = std::min(m_config.max_latency_bonus,
                             std::max(0.0, (m_config.latency_reference_s - latency_s) * m_config.latency_slope));

    double sum = score.performance + score.specialty + score.complexity_fit + score.cost + score.latency;
    score.total = std::max(0.0, sum);
    return score;
}

std::vector<std::pair<std::shared_ptr<const BackendDescriptor>, ScoreBreakdown>>
BackendRouter::rankBackends(TaskType task_type, ComplexityLevel complexity, double budget_factor) const {
    std::vector<std::pair<std::shared_ptr<const BackendDescriptor>, ScoreBreakdown>> ranked;
    for (const auto& backend : m_registry.listBackends()) {
        ranked.emplace_back(backend, scoreBackend(*backend, task_type, complexity, budget_factor));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second.total > b.second.total; });
    return ranked;
}

bool BackendRouter::isRoutable(const BackendDescriptor& backend) const {
    switch (backend.health) {
        case HealthStatus::ONLINE:
        case HealthStatus::DEGRADED:
            return true;
        case HealthStatus::UNKNOWN:
            return m_config.treat_unknown_as_healthy;
        default:
            return false;
    }
}

RoutingDecision BackendRouter::route(TaskType task_type, ComplexityLevel complexity, double budget_factor) {
    auto ranked = rankBackends(task_type, complexity, budget_factor);

    bool any_compliant_routable = std::any_of(ranked.begin(), ranked.end(), [&](const auto& entry) {
        return isRoutable(*entry.first) &&
               BackendCapabilityUtils::meetsComplexity(entry.first->max_complexity, complexity);
    });

    // Non-compliant backends are acceptable only when no compliant one is routable
    auto acceptable = [&](const BackendDescriptor& backend) {
        if (!isRoutable(backend)) {
            return false;
        }
        return BackendCapabilityUtils::meetsComplexity(backend.max_complexity, complexity) ||
               !any_compliant_routable;
    };

    RoutingDecision decision;
    decision.reason = "No healthy backend available";

    if (!ranked.empty()) {
        const auto& top = ranked.front();

        if (acceptable(*top.first)) {
            decision = buildDecision(*top.first, top.second, complexity);
            decision.reason = "Selected " + top.first->name + " (dominant term: " + decision.dominant_term + ")";
        } else {
            std::string skipped = top.first->name + " is " +
                (isRoutable(*top.first) ? "below the required complexity"
                                        : BackendCapabilityUtils::healthStatusToString(top.first->health));

            bool chosen = false;
            for (const auto& name : top.first->fallback_chain) {
                auto fallback = m_registry.getBackend(name);
                if (fallback && acceptable(*fallback)) {
                    auto score = scoreBackend(*fallback, task_type, complexity, budget_factor);
                    decision = buildDecision(*fallback, score, complexity);
                    decision.reason = "Fallback to " + fallback->name + ": " + skipped +
                                      " (dominant term: " + decision.dominant_term + ")";
                    chosen = true;
                    break;
                }
            }

            if (!chosen) {
                for (const auto& [backend, score] : ranked) {
                    if (acceptable(*backend)) {
                        decision = buildDecision(*backend, score, complexity);
                        decision.reason = "Best available " + backend->name + ": " + skipped +
                                          " and its fallback chain is exhausted (dominant term: " +
                                          decision.dominant_term + ")";
                        break;
                    }
                }
            }

            if (decision.available) {
                decision.used_fallback = true;
            }
        }
    }

    recordDecision(decision);

    if (m_config.log_decisions) {
        Logger::getInstance().logRoutingDecision(taskTypeToString(task_type),
            BackendCapabilityUtils::complexityToString(complexity), decision);
    }

    return decision;
}

RoutingDecision BackendRouter::routePrompt(const std::string& prompt, double budget_factor) {
    auto classification = m_classifier->classify(prompt);
    return route(classification.task_type, classification.complexity, budget_factor);
}

RoutingDecision BackendRouter::buildDecision(const BackendDescriptor& backend, const ScoreBreakdown& score,
                                             ComplexityLevel complexity) const {
    RoutingDecision decision;
    decision.backend = backend.name;
    decision.endpoint = backend.endpoint;
    decision.wire_format = backend.wire_format;
    decision.score = score.total;
    decision.dominant_term = score.dominantTerm();
    decision.fallbacks = backend.fallback_chain;
    decision.estimated_cost = backend.cost_per_token * static_cast<double>(m_config.estimated_tokens);
    decision.estimated_latency_ms = backend.avg_latency_ms;
    decision.available = true;
    decision.complexity_compliant = BackendCapabilityUtils::meetsComplexity(backend.max_complexity, complexity);
    return decision;
}

void BackendRouter::recordDecision(const RoutingDecision& decision) {
    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    m_total_decisions++;
    if (decision.available) {
        m_metrics[decision.backend].requests_routed++;
    } else {
        m_unavailable_decisions++;
    }
}

double BackendRouter::windowAverage(const MetricsWindow& window) {
    if (window.latencies.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(window.latencies.begin(), window.latencies.end(), 0.0);
    return sum / static_cast<double>(window.latencies.size());
}

void BackendRouter::reportOutcome(const std::string& backend, double latency_ms, bool success) {
    if (!m_registry.contains(backend)) {
        Logger::getInstance().warning("Router", "Outcome reported for unknown backend: " + backend);
        return;
    }

    double average = 0.0;
    {
        std::lock_guard<std::mutex> lock(m_metrics_mutex);
        auto& window = m_metrics[backend];
        window.latencies.push_back(std::max(0.0, latency_ms));
        window.outcomes.push_back(success);
        window.total_outcomes++;

        while (window.latencies.size() > m_config.metrics_window) {
            window.latencies.pop_front();
        }
        while (window.outcomes.size() > m_config.metrics_window) {
            window.outcomes.pop_front();
        }
        average = windowAverage(window);
    }

    m_registry.recordObservedLatency(backend, average);
}

RoutingAnalytics BackendRouter::getAnalytics() const {
    RoutingAnalytics analytics;
    auto backends = m_registry.listBackends();
    analytics.registry_size = backends.size();

    std::lock_guard<std::mutex> lock(m_metrics_mutex);
    analytics.total_decisions = m_total_decisions;
    analytics.unavailable_decisions = m_unavailable_decisions;

    for (const auto& backend : backends) {
        BackendMetrics metrics;
        auto it = m_metrics.find(backend->name);
        if (it != m_metrics.end()) {
            const auto& window = it->second;
            metrics.requests_routed = window.requests_routed;
            metrics.total_outcomes = window.total_outcomes;
            metrics.window_samples = window.outcomes.size();
            if (!window.outcomes.empty()) {
                auto successes = std::count(window.outcomes.begin(), window.outcomes.end(), true);
                metrics.success_rate = static_cast<double>(successes) / static_cast<double>(window.outcomes.size());
            }
            metrics.avg_latency_ms = windowAverage(window);
        }
        analytics.backends.emplace_back(backend->name, metrics);
    }

    return analytics;
}

void BackendRouter::saveMetrics(const std::string& path) const {
    nlohmann::json doc;
    doc["version"] = 1;
    doc["metrics_window"] = m_config.metrics_window;
    doc["backends"] = nlohmann::json::object();

    {
        std::lock_guard<std::mutex> lock(m_metrics_mutex);
        for (const auto& [name, window] : m_metrics) {
            doc["backends"][name] = {
                {"latencies", std::vector<double>(window.latencies.begin(), window.latencies.end())},
                {"outcomes", std::vector<bool>(window.outcomes.begin(), window.outcomes.end())},
                {"total_outcomes", window.total_outcomes},
                {"requests_routed", window.requests_routed}
            };
        }
    }

    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    std::ofstream out(path);
    if (!out) {
        throw ConfigurationError("Cannot write metrics file: " + path);
    }
    out << doc.dump(2) << std::endl;

    Logger::getInstance().debug("Router", "Saved routing metrics", path);
}

bool BackendRouter::loadMetrics(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::getInstance().debug("Router", "No routing metrics to restore", path);
        return false;
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot read metrics file: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed metrics file " + path + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("backends") || !doc["backends"].is_object()) {
        throw ConfigurationError("Metrics file " + path + " has no 'backends' object");
    }

    std::vector<std::pair<std::string, double>> restored;
    try {
        std::lock_guard<std::mutex> lock(m_metrics_mutex);
        for (const auto& [name, entry] : doc["backends"].items()) {
            if (!m_registry.contains(name)) {
                Logger::getInstance().debug("Router", "Skipping metrics for unregistered backend: " + name);
                continue;
            }

            MetricsWindow window;
            for (const auto& latency : entry.value("latencies", nlohmann::json::array())) {
                window.latencies.push_back(latency.get<double>());
            }
            for (const auto& outcome : entry.value("outcomes", nlohmann::json::array())) {
                window.outcomes.push_back(outcome.get<bool>());
            }
            while (window.latencies.size() > m_config.metrics_window) {
                window.latencies.pop_front();
            }
            while (window.outcomes.size() > m_config.metrics_window) {
                window.outcomes.pop_front();
            }
            window.total_outcomes = entry.value("total_outcomes", window.outcomes.size());
            window.requests_routed = entry.value("requests_routed", static_cast<size_t>(0));

            restored.emplace_back(name, windowAverage(window));
            m_metrics[name] = std::move(window);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed metrics entry in " + path + ": " + e.what());
    }

    for (const auto& [name, average] : restored) {
        if (average > 0.0) {
            m_registry.recordObservedLatency(name, average);
        }
    }

    Logger::getInstance().info("Router", "Restored routing metrics",
        std::to_string(restored.size()) + " backends from " + path);
    return true;
}

} // namespace Switchboard
