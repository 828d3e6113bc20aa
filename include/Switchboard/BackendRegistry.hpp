// =================================================================
// include/Switchboard/BackendRegistry.hpp
// =================================================================
// Catalog of model-serving backends with snapshot-per-update state.

#pragma once

#include "Switchboard/BackendCapabilities.hpp"
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <mutex>

namespace Switchboard {

/**
 * @brief Health summary across all registered backends
 */
struct RegistryStatus {
    size_t total = 0;              ///< Registered backends
    size_t online = 0;             ///< Backends currently ONLINE
    size_t degraded = 0;           ///< Backends currently DEGRADED
    size_t offline = 0;            ///< Backends currently OFFLINE
    size_t unknown = 0;            ///< Backends never probed successfully
    std::chrono::system_clock::time_point last_update; ///< Most recent health check
};

/**
 * @brief Registry of backend descriptors
 *
 * Every update replaces the stored descriptor with a fresh immutable
 * snapshot under the registry mutex, so readers never observe a
 * half-written descriptor. Health fields are written only by
 * HealthMonitor and observed latency only by BackendRouter.
 */
class BackendRegistry {
public:
    BackendRegistry() = default;
    virtual ~BackendRegistry() = default;

    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    /**
     * @brief Register a backend descriptor
     * @param descriptor Descriptor to add
     * @throws ConfigurationError on empty name/endpoint or duplicate name
     */
    virtual void registerBackend(const BackendDescriptor& descriptor);

    /**
     * @brief Load the backends section of a YAML configuration file
     *
     * Registers every backend, then validates fallback chains.
     * @param config_path Path to YAML configuration
     * @return Number of backends registered
     * @throws ConfigurationError on parse or validation failure
     */
    virtual size_t loadFromConfig(const std::string& config_path);

    /**
     * @brief Get a snapshot of a backend
     * @param name Backend identifier
     * @return Snapshot, or nullptr if not registered
     */
    virtual std::shared_ptr<const BackendDescriptor> getBackend(const std::string& name) const;

    /**
     * @brief Snapshots of all backends in registration order
     */
    virtual std::vector<std::shared_ptr<const BackendDescriptor>> listBackends() const;

    /**
     * @brief Names of backends carrying a specialty (case-insensitive)
     */
    virtual std::vector<std::string> findBySpecialty(const std::string& specialty) const;

    /**
     * @brief Check fallback chains
     *
     * Every fallback must name a registered backend, no backend may list
     * itself, and the chains must not form a cycle.
     * @throws ConfigurationError describing the first violation
     */
    virtual void validate() const;

    virtual RegistryStatus getStatus() const;

    size_t size() const;
    bool contains(const std::string& name) const;

    /**
     * @brief Human-readable description of one backend (for CLI)
     */
    std::string getBackendInfo(const std::string& name) const;

    /**
     * @brief Human-readable description of the whole registry (for CLI)
     */
    std::string getAllBackendsInfo() const;

private:
    friend class HealthMonitor;
    friend class BackendRouter;

    /**
     * @brief Replace health fields of a backend (HealthMonitor only)
     * @return Previous status, or UNKNOWN if the backend is not registered
     */
    HealthStatus updateHealth(const std::string& name, HealthStatus status,
                              size_t consecutive_failures,
                              std::chrono::system_clock::time_point checked_at);

    /**
     * @brief Replace the rolling latency of a backend (BackendRouter only)
     */
    void recordObservedLatency(const std::string& name, double avg_latency_ms);

    std::vector<std::string> m_order;
    std::unordered_map<std::string, std::shared_ptr<const BackendDescriptor>> m_backends;
    mutable std::mutex m_mutex;
};

} // namespace Switchboard
