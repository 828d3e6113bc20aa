// =================================================================
// include/Switchboard/HealthMonitor.hpp
// =================================================================
// Background prober that maintains cached backend health.

#pragma once

#include "Switchboard/BackendRegistry.hpp"
#include "Switchboard/HealthProbe.hpp"
#include "Switchboard/ThreadPool.hpp"
#include <string>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <chrono>

namespace Switchboard {

/**
 * @brief Health monitor configuration
 */
struct HealthMonitorConfig {
    std::chrono::milliseconds interval{30000};      ///< Delay between ticks
    std::chrono::milliseconds probe_timeout{5000};  ///< Per-request probe timeout
    size_t failure_threshold = 3;                   ///< Consecutive failures before OFFLINE
    size_t max_concurrent_probes = 4;               ///< Probe worker count
};

/**
 * @brief One observed status change
 */
struct HealthTransition {
    std::string backend;
    HealthStatus from = HealthStatus::UNKNOWN;
    HealthStatus to = HealthStatus::UNKNOWN;
    size_t consecutive_failures = 0;
};

/**
 * @brief Called after each status change, outside any registry lock
 */
using TransitionListener = std::function<void(const HealthTransition&)>;

/**
 * @brief Periodic health prober and sole writer of backend health
 *
 * Each tick probes every registered backend on a bounded worker pool and
 * applies the status state machine:
 *   success                         -> ONLINE, failures reset
 *   failure below the threshold     -> ONLINE/DEGRADED become DEGRADED,
 *                                      UNKNOWN stays UNKNOWN
 *   failure reaching the threshold  -> OFFLINE
 * Probe failures never surface to callers.
 */
class HealthMonitor {
public:
    /**
     * @brief Construct a monitor
     * @param registry Registry whose backends are probed
     * @param probe Probe implementation (HttpHealthProbe when null)
     * @param config Monitor configuration
     */
    HealthMonitor(BackendRegistry& registry,
                  std::shared_ptr<HealthProbe> probe = nullptr,
                  const HealthMonitorConfig& config = HealthMonitorConfig());

    virtual ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Start the background thread (no-op if running)
     */
    void start();

    /**
     * @brief Stop the background thread and wait for it to exit
     */
    void stop();

    bool isRunning() const { return m_running; }

    /**
     * @brief Probe every backend once, synchronously
     * @return Number of backends ONLINE after the tick
     */
    size_t runOnce();

    void setTransitionListener(TransitionListener listener);

    const HealthMonitorConfig& getConfig() const { return m_config; }

    /**
     * @brief Number of completed ticks
     */
    size_t getTickCount() const { return m_tick_count; }

private:
    BackendRegistry& m_registry;
    std::shared_ptr<HealthProbe> m_probe;
    HealthMonitorConfig m_config;
    std::unique_ptr<ThreadPool> m_probe_pool;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_tick_count{0};
    bool m_stop_requested = false;
    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;

    std::mutex m_tick_mutex;        // serializes ticks
    std::mutex m_listener_mutex;
    TransitionListener m_listener;

    void monitorLoop();

    /**
     * @brief Fold one probe result into the registry
     * @return True if the status changed
     */
    bool applyProbeResult(const std::string& backend, const ProbeResult& result,
                          HealthTransition& transition);

    HealthStatus nextStatus(HealthStatus current, bool healthy, size_t failures) const;
};

} // namespace Switchboard
