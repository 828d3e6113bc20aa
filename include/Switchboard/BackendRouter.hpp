// =================================================================
// include/Switchboard/BackendRouter.hpp
// =================================================================
// Score-based backend selection with fallback and rolling metrics.

#pragma once

#include "Switchboard/BackendRegistry.hpp"
#include "Switchboard/TaskClassifier.hpp"
#include <string>
#include <memory>
#include <vector>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <utility>

namespace Switchboard {

/**
 * @brief Router scoring constants and behavior switches
 */
struct RouterConfig {
    double performance_weight = 0.5;        ///< Multiplier on performance_score
    double exact_specialty_bonus = 0.4;     ///< Task type named in specialties
    double partial_specialty_bonus = 0.2;   ///< Substring overlap either way
    double under_ceiling_penalty = 0.5;     ///< Subtracted when the ceiling is too low
    double expert_fit_bonus = 0.30;         ///< Expert task on an expert backend
    double complex_fit_bonus = 0.25;        ///< Complex task on a complex-or-better backend
    double base_fit_bonus = 0.15;           ///< Any other compliant pairing
    double cost_bonus = 0.1;                ///< Cheap backend bonus for simple/moderate work
    double cheap_cost_threshold = 0.0003;   ///< Cost per token below which a backend is cheap
    double min_budget_factor = 0.1;         ///< Floor for the budget divisor
    double max_latency_bonus = 0.05;        ///< Cap on the latency term
    double latency_reference_s = 2.0;       ///< Latency at which the bonus reaches zero
    double latency_slope = 0.02;            ///< Bonus per second under the reference
    size_t estimated_tokens = 1000;         ///< Token count used for cost estimates
    bool treat_unknown_as_healthy = true;   ///< Route to never-probed backends
    size_t metrics_window = 100;            ///< Rolling samples kept per backend
    bool log_decisions = true;              ///< Emit a log line per decision
};

/**
 * @brief Individual score terms for one backend
 */
struct ScoreBreakdown {
    double performance = 0.0;
    double specialty = 0.0;
    double complexity_fit = 0.0;
    double cost = 0.0;
    double latency = 0.0;
    double total = 0.0;             ///< Sum of terms, clamped at zero

    /**
     * @brief Name of the largest term
     */
    std::string dominantTerm() const;
};

/**
 * @brief Outcome of one routing request
 */
struct RoutingDecision {
    std::string backend;                    ///< Selected backend (empty when unavailable)
    std::string endpoint;                   ///< Selected backend's base URL
    WireFormat wire_format = WireFormat::OPENAI_COMPATIBLE;
    double score = 0.0;                     ///< Selected backend's clamped score
    std::string reason;                     ///< Human-readable explanation
    std::string dominant_term;              ///< Largest score term of the selection
    std::vector<std::string> fallbacks;     ///< Selected backend's fallback chain
    double estimated_cost = 0.0;            ///< cost_per_token x estimated tokens
    double estimated_latency_ms = 0.0;      ///< Current rolling latency
    bool available = false;                 ///< False when nothing is routable
    bool used_fallback = false;             ///< True when the top-ranked backend was passed over
    bool complexity_compliant = false;      ///< Selected ceiling meets the requirement
};

/**
 * @brief Rolling statistics for one backend
 */
struct BackendMetrics {
    size_t requests_routed = 0;     ///< Decisions that selected this backend
    size_t total_outcomes = 0;      ///< Outcomes ever reported
    size_t window_samples = 0;      ///< Samples currently in the window
    double success_rate = 0.0;      ///< Successes / window samples
    double avg_latency_ms = 0.0;    ///< Mean latency over the window
};

/**
 * @brief Snapshot of routing activity
 */
struct RoutingAnalytics {
    size_t registry_size = 0;
    size_t total_decisions = 0;
    size_t unavailable_decisions = 0;
    std::vector<std::pair<std::string, BackendMetrics>> backends; ///< Registration order

    /**
     * @brief Serialize as a JSON document
     */
    std::string toJson(int indent = 2) const;
};

/**
 * @brief Synchronous router over cached registry state
 *
 * route() performs no I/O. Outcomes reported by the executor feed a
 * bounded rolling window per backend whose mean latency is written back
 * into the registry.
 */
class BackendRouter {
public:
    /**
     * @brief Constructor
     * @param registry Backend registry
     * @param config Router configuration
     * @param classifier Classifier for routePrompt (default rules when null)
     */
    BackendRouter(BackendRegistry& registry,
                  const RouterConfig& config = RouterConfig(),
                  std::shared_ptr<const TaskClassifier> classifier = nullptr);

    virtual ~BackendRouter() = default;

    /**
     * @brief Select a backend for a task
     * @param task_type Task domain
     * @param complexity Required capability level
     * @param budget_factor Scales the cheap-backend bonus (higher is less cost-sensitive)
     * @return Decision; available is false when no backend is routable
     */
    virtual RoutingDecision route(TaskType task_type, ComplexityLevel complexity,
                                  double budget_factor = 1.0);

    /**
     * @brief Classify a prompt, then route it
     */
    virtual RoutingDecision routePrompt(const std::string& prompt, double budget_factor = 1.0);

    /**
     * @brief Score one backend without selecting
     */
    ScoreBreakdown scoreBackend(const BackendDescriptor& backend, TaskType task_type,
                                ComplexityLevel complexity, double budget_factor = 1.0) const;

    /**
     * @brief All backends ordered by score; ties keep registration order
     */
    std::vector<std::pair<std::shared_ptr<const BackendDescriptor>, ScoreBreakdown>>
    rankBackends(TaskType task_type, ComplexityLevel complexity, double budget_factor = 1.0) const;

    /**
     * @brief True for ONLINE and DEGRADED, and UNKNOWN when configured
     */
    bool isRoutable(const BackendDescriptor& backend) const;

    /**
     * @brief Record the outcome of one dispatch attempt
     * @param backend Backend that handled the attempt
     * @param latency_ms Observed latency
     * @param success Whether the attempt produced a result
     */
    virtual void reportOutcome(const std::string& backend, double latency_ms, bool success);

    RoutingAnalytics getAnalytics() const;

    /**
     * @brief Persist rolling windows as JSON
     * @throws ConfigurationError if the file cannot be written
     */
    void saveMetrics(const std::string& path) const;

    /**
     * @brief Restore rolling windows saved by saveMetrics
     *
     * Entries for unregistered backends are skipped. Restored averages
     * are written into the registry.
     * @return False if the file does not exist
     * @throws ConfigurationError if the file is malformed
     */
    bool loadMetrics(const std::string& path);

    const RouterConfig& getConfig() const { return m_config; }
    const TaskClassifier& getClassifier() const { return *m_classifier; }
    const BackendRegistry& getRegistry() const { return m_registry; }

private:
    struct MetricsWindow {
        std::deque<double> latencies;
        std::deque<bool> outcomes;
        size_t total_outcomes = 0;
        size_t requests_routed = 0;
    };

    BackendRegistry& m_registry;
    RouterConfig m_config;
    std::shared_ptr<const TaskClassifier> m_classifier;

    std::unordered_map<std::string, MetricsWindow> m_metrics;
    size_t m_total_decisions = 0;
    size_t m_unavailable_decisions = 0;
    mutable std::mutex m_metrics_mutex;

    RoutingDecision buildDecision(const BackendDescriptor& backend, const ScoreBreakdown& score,
                                  ComplexityLevel complexity) const;
    void recordDecision(const RoutingDecision& decision);
    static double windowAverage(const MetricsWindow& window);
};

} // namespace Switchboard
