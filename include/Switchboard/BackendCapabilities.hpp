// =================================================================
// include/Switchboard/BackendCapabilities.hpp
// =================================================================
// Defines backend descriptors and the closed enumerations they use.

#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace Switchboard {

/**
 * @brief Ordinal difficulty of a task, and capability ceiling of a backend
 */
enum class ComplexityLevel {
    SIMPLE = 0,     ///< Short factual or conversational requests
    MODERATE = 1,   ///< Technical but routine work
    COMPLEX = 2,    ///< Engineering, design or analysis work
    EXPERT = 3      ///< Formal proofs and advanced mathematics
};

/**
 * @brief Request/response format spoken by a backend
 */
enum class WireFormat {
    OPENAI_COMPATIBLE,  ///< /v1/chat/completions style API
    REST,               ///< Plain REST generate endpoint
    CUSTOM              ///< Service-specific completion endpoint
};

/**
 * @brief Cached liveness of a backend
 */
enum class HealthStatus {
    ONLINE,     ///< Last probe succeeded
    OFFLINE,    ///< Failure threshold reached
    DEGRADED,   ///< Recent failures below the threshold
    UNKNOWN     ///< Never probed successfully
};

/**
 * @brief Static description and cached health of a model-serving backend
 */
struct BackendDescriptor {
    std::string name;                           ///< Unique backend identifier
    std::string endpoint;                       ///< Base URL, e.g. http://localhost:8000
    WireFormat wire_format = WireFormat::OPENAI_COMPATIBLE;
    std::vector<std::string> specialties;       ///< Specialty tags used for scoring
    double cost_per_token = 0.0;                ///< Relative cost per token
    double performance_score = 0.0;             ///< Quality score in [0,1]
    double avg_latency_ms = 0.0;                ///< Rolling average latency
    ComplexityLevel max_complexity = ComplexityLevel::SIMPLE; ///< Capability ceiling
    std::vector<std::string> fallback_chain;    ///< Ordered alternates, acyclic
    std::vector<std::string> health_endpoints{"/health", "/v1/models", "/"};
    std::string description;                    ///< Human-readable description
    std::string service_type = "llm";           ///< llm, agent, search, ...

    // Written only by HealthMonitor
    HealthStatus health = HealthStatus::UNKNOWN;
    std::chrono::system_clock::time_point last_checked{};
    size_t consecutive_failures = 0;
};

/**
 * @brief Conversions and helpers for the backend enumerations
 */
class BackendCapabilityUtils {
public:
    static std::string complexityToString(ComplexityLevel level);

    /**
     * @brief Parse a complexity name (case-insensitive)
     * @throws std::invalid_argument for unknown names
     */
    static ComplexityLevel stringToComplexity(const std::string& str);

    static std::string wireFormatToString(WireFormat format);

    /**
     * @brief Parse a wire format tag
     *
     * Accepts "openai-compatible" (also "openai"), "rest" and "custom".
     * @throws std::invalid_argument for unknown tags
     */
    static WireFormat stringToWireFormat(const std::string& str);

    static std::string healthStatusToString(HealthStatus status);

    static std::vector<ComplexityLevel> getAllComplexityLevels();

    /**
     * @brief True when the ceiling is at or above the required level
     */
    static bool meetsComplexity(ComplexityLevel ceiling, ComplexityLevel required);

    /**
     * @brief Case-insensitive specialty membership
     */
    static bool hasSpecialty(const BackendDescriptor& backend, const std::string& specialty);
};

std::string toLower(const std::string& text);

} // namespace Switchboard
