// =================================================================
// include/Switchboard/HealthProbe.hpp
// =================================================================
// Liveness probing interface and its HTTP implementation.

#pragma once

#include "Switchboard/BackendCapabilities.hpp"
#include <string>
#include <chrono>

namespace Switchboard {

/**
 * @brief Result of probing one backend
 */
struct ProbeResult {
    bool healthy = false;                   ///< True if any endpoint answered 200
    std::string endpoint;                   ///< Path that answered, or last path tried
    int status_code = 0;                    ///< Last HTTP status (0 on connection failure)
    std::string error;                      ///< Failure description
    std::chrono::milliseconds latency{0};   ///< Time spent probing
};

/**
 * @brief Abstract liveness probe
 *
 * Implementations must not throw; every failure is reported in the
 * returned ProbeResult.
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    /**
     * @brief Probe a backend's health endpoints in order
     * @param backend Backend to probe
     * @param timeout Per-request timeout
     * @return Probe outcome
     */
    virtual ProbeResult probe(const BackendDescriptor& backend, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief HTTP GET probe; success is the first 200 response
 */
class HttpHealthProbe : public HealthProbe {
public:
    ProbeResult probe(const BackendDescriptor& backend, std::chrono::milliseconds timeout) override;
};

} // namespace Switchboard
