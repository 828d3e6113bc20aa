// =================================================================
// src/Switchboard/HealthMonitor.cpp
// =================================================================
// Implementation of the background health monitor.

#include "Switchboard/HealthMonitor.hpp"
#include "Switchboard/Logger.hpp"
#include <future>
#include <vector>

namespace Switchboard {

HealthMonitor::HealthMonitor(BackendRegistry& registry,
                             std::shared_ptr<HealthProbe> probe,
                             const HealthMonitorConfig& config)
    : m_registry(registry), m_probe(std::move(probe)), m_config(config) {
    if (!m_probe) {
        m_probe = std::make_shared<HttpHealthProbe>();
    }
    if (m_config.failure_threshold == 0) {
        m_config.failure_threshold = 1;
    }
    m_probe_pool = std::make_unique<ThreadPool>(m_config.max_concurrent_probes);
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (m_running.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wait_mutex);
        m_stop_requested = false;
    }
    m_thread = std::make_unique<std::thread>(&HealthMonitor::monitorLoop, this);

    Logger::getInstance().info("HealthMonitor", "Health monitoring started",
        "Interval: " + std::to_string(m_config.interval.count()) + "ms, Backends: " +
        std::to_string(m_registry.size()));
}

void HealthMonitor::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wait_mutex);
        m_stop_requested = true;
    }
    m_wait_cv.notify_all();

    if (m_thread && m_thread->joinable()) {
        m_thread->join();
    }
    m_thread.reset();

    Logger::getInstance().info("HealthMonitor", "Health monitoring stopped",
        "Ticks: " + std::to_string(m_tick_count.load()));
}

void HealthMonitor::setTransitionListener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_listener = std::move(listener);
}

void HealthMonitor::monitorLoop() {
    while (true) {
        runOnce();

        std::unique_lock<std::mutex> lock(m_wait_mutex);
        if (m_wait_cv.wait_for(lock, m_config.interval, [this] { return m_stop_requested; })) {
            return;
        }
    }
}

size_t HealthMonitor::runOnce() {
    std::lock_guard<std::mutex> tick_lock(m_tick_mutex);

    auto backends = m_registry.listBackends();
    std::vector<std::future<ProbeResult>> probes;
    probes.reserve(backends.size());

    for (const auto& backend : backends) {
        probes.push_back(m_probe_pool->enqueue([this, backend]() {
            return m_probe->probe(*backend, m_config.probe_timeout);
        }));
    }

    std::vector<HealthTransition> transitions;
    for (size_t i = 0; i < backends.size(); ++i) {
        ProbeResult result;
        try {
            result = probes[i].get();
        } catch (const std::exception& e) {
            result.healthy = false;
            result.error = std::string("Probe raised: ") + e.what();
        }

        HealthTransition transition;
        if (applyProbeResult(backends[i]->name, result, transition)) {
            transitions.push_back(transition);
        }
    }

    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        listener = m_listener;
    }
    if (listener) {
        for (const auto& transition : transitions) {
            listener(transition);
        }
    }

    m_tick_count++;
    auto status = m_registry.getStatus();
    Logger::getInstance().debug("HealthMonitor", "Health check tick complete",
        "Online: " + std::to_string(status.online) + "/" + std::to_string(status.total) +
        ", Transitions: " + std::to_string(transitions.size()));
    if (!transitions.empty() && status.total > 0 && status.online + status.degraded == 0) {
        Logger::getInstance().critical("HealthMonitor", "No backend is answering health probes",
            "Offline: " + std::to_string(status.offline) + ", Unknown: " + std::to_string(status.unknown));
    }
    return status.online;
}

bool HealthMonitor::applyProbeResult(const std::string& backend, const ProbeResult& result,
                                     HealthTransition& transition) {
    auto current = m_registry.getBackend(backend);
    if (!current) {
        return false;
    }

    size_t failures = result.healthy ? 0 : current->consecutive_failures + 1;
    HealthStatus next = nextStatus(current->health, result.healthy, failures);

    HealthStatus previous = m_registry.updateHealth(backend, next, failures,
                                                    std::chrono::system_clock::now());

    if (!result.healthy) {
        Logger::getInstance().debug("HealthMonitor", "Probe failed: " + backend, result.error);
    }

    if (previous == next) {
        return false;
    }

    transition.backend = backend;
    transition.from = previous;
    transition.to = next;
    transition.consecutive_failures = failures;
    Logger::getInstance().logHealthTransition(backend, previous, next, failures);
    return true;
}

HealthStatus HealthMonitor::nextStatus(HealthStatus current, bool healthy, size_t failures) const {
    if (healthy) {
        return HealthStatus::ONLINE;
    }
    if (failures >= m_config.failure_threshold) {
        return HealthStatus::OFFLINE;
    }
    switch (current) {
        case HealthStatus::ONLINE:
        case HealthStatus::DEGRADED:
            return HealthStatus::DEGRADED;
        case HealthStatus::UNKNOWN:
            return HealthStatus::UNKNOWN;
        default:
            return current;
    }
}

} // namespace Switchboard
