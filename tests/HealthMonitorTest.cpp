// =================================================================
// tests/HealthMonitorTest.cpp
// =================================================================
// Unit tests for HealthMonitor component.

#include "Switchboard/HealthMonitor.hpp"
#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/Logger.hpp"
#include <iostream>
#include <atomic>
#include <cassert>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace Switchboard;

namespace {

// Probe whose answers are scripted per backend
class ScriptedProbe : public HealthProbe {
public:
    void setHealthy(const std::string& name, bool healthy) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_healthy[name] = healthy;
    }

    void setThrows(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_throws[name] = true;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    ProbeResult probe(const BackendDescriptor& backend, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls++;
        if (m_throws[backend.name]) {
            throw std::runtime_error("probe exploded");
        }
        ProbeResult result;
        result.healthy = m_healthy[backend.name];
        result.endpoint = "/health";
        result.status_code = result.healthy ? 200 : 0;
        if (!result.healthy) {
            result.error = "connection refused";
        }
        return result;
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, bool> m_healthy;
    std::map<std::string, bool> m_throws;
    size_t m_calls = 0;
};

// Healthy probe that holds each call briefly and tracks how many overlap
class ConcurrencyProbe : public HealthProbe {
public:
    size_t peak() const { return m_peak; }

    ProbeResult probe(const BackendDescriptor&, std::chrono::milliseconds) override {
        size_t now = ++m_in_flight;
        size_t seen = m_peak;
        while (now > seen && !m_peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        --m_in_flight;

        ProbeResult result;
        result.healthy = true;
        result.endpoint = "/health";
        result.status_code = 200;
        return result;
    }

private:
    std::atomic<size_t> m_in_flight{0};
    std::atomic<size_t> m_peak{0};
};

BackendDescriptor makeBackend(const std::string& name, const std::string& specialty,
                              double performance, std::vector<std::string> fallbacks = {}) {
    BackendDescriptor backend;
    backend.name = name;
    backend.endpoint = "http://localhost/" + name;
    backend.specialties = {specialty};
    backend.performance_score = performance;
    backend.cost_per_token = 0.001;
    backend.max_complexity = ComplexityLevel::COMPLEX;
    backend.fallback_chain = std::move(fallbacks);
    return backend;
}

HealthStatus statusOf(const BackendRegistry& registry, const std::string& name) {
    return registry.getBackend(name)->health;
}

} // namespace

class HealthMonitorTest {
public:
    void testUnknownToOffline() {
        std::cout << "Testing UNKNOWN -> OFFLINE after threshold..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("flaky", "general", 0.8));
        auto probe = std::make_shared<ScriptedProbe>();
        probe->setHealthy("flaky", false);
        HealthMonitor monitor(registry, probe);

        monitor.runOnce();
        assert(statusOf(registry, "flaky") == HealthStatus::UNKNOWN);
        assert(registry.getBackend("flaky")->consecutive_failures == 1);
        monitor.runOnce();
        assert(statusOf(registry, "flaky") == HealthStatus::UNKNOWN);
        monitor.runOnce();
        assert(statusOf(registry, "flaky") == HealthStatus::OFFLINE && "Third failure reaches the threshold");
        assert(monitor.getTickCount() == 3);

        std::cout << "✓ UNKNOWN -> OFFLINE test passed" << std::endl;
    }

    void testOnlineDegradedRecovery() {
        std::cout << "Testing ONLINE -> DEGRADED -> OFFLINE -> ONLINE..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("gpu", "general", 0.8));
        auto probe = std::make_shared<ScriptedProbe>();
        HealthMonitor monitor(registry, probe);

        probe->setHealthy("gpu", true);
        assert(monitor.runOnce() == 1);
        assert(statusOf(registry, "gpu") == HealthStatus::ONLINE);

        probe->setHealthy("gpu", false);
        assert(monitor.runOnce() == 0);
        assert(statusOf(registry, "gpu") == HealthStatus::DEGRADED);
        monitor.runOnce();
        assert(statusOf(registry, "gpu") == HealthStatus::DEGRADED);
        monitor.runOnce();
        assert(statusOf(registry, "gpu") == HealthStatus::OFFLINE);

        probe->setHealthy("gpu", true);
        monitor.runOnce();
        assert(statusOf(registry, "gpu") == HealthStatus::ONLINE);
        assert(registry.getBackend("gpu")->consecutive_failures == 0 && "Success resets the counter");

        std::cout << "✓ Recovery test passed" << std::endl;
    }

    void testTransitionListener() {
        std::cout << "Testing transition listener..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("a", "general", 0.8));
        auto probe = std::make_shared<ScriptedProbe>();
        HealthMonitorConfig config;
        config.failure_threshold = 1;
        HealthMonitor monitor(registry, probe, config);

        std::vector<HealthTransition> seen;
        monitor.setTransitionListener([&seen](const HealthTransition& t) { seen.push_back(t); });

        probe->setHealthy("a", true);
        monitor.runOnce();
        monitor.runOnce(); // No change, no event
        probe->setHealthy("a", false);
        monitor.runOnce();

        assert(seen.size() == 2);
        assert(seen[0].from == HealthStatus::UNKNOWN && seen[0].to == HealthStatus::ONLINE);
        assert(seen[1].from == HealthStatus::ONLINE && seen[1].to == HealthStatus::OFFLINE);
        assert(seen[1].consecutive_failures == 1);

        std::cout << "✓ Transition listener test passed" << std::endl;
    }

    void testThrowingProbeCountsAsFailure() {
        std::cout << "Testing probe exceptions..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("boom", "general", 0.8));
        registry.registerBackend(makeBackend("fine", "general", 0.8));
        auto probe = std::make_shared<ScriptedProbe>();
        probe->setThrows("boom");
        probe->setHealthy("fine", true);
        HealthMonitorConfig config;
        config.failure_threshold = 1;
        HealthMonitor monitor(registry, probe, config);

        assert(monitor.runOnce() == 1);
        assert(statusOf(registry, "boom") == HealthStatus::OFFLINE);
        assert(statusOf(registry, "fine") == HealthStatus::ONLINE);

        std::cout << "✓ Probe exception test passed" << std::endl;
    }

    void testBackgroundLoop() {
        std::cout << "Testing background start/stop..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("a", "general", 0.8));
        auto probe = std::make_shared<ScriptedProbe>();
        probe->setHealthy("a", true);
        HealthMonitorConfig config;
        config.interval = std::chrono::milliseconds(10);
        HealthMonitor monitor(registry, probe, config);

        monitor.start();
        assert(monitor.isRunning());
        monitor.start(); // Second start is a no-op
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        monitor.stop();
        assert(!monitor.isRunning());

        size_t ticks = monitor.getTickCount();
        assert(ticks >= 1);
        assert(probe->calls() == ticks);
        assert(statusOf(registry, "a") == HealthStatus::ONLINE);

        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        assert(monitor.getTickCount() == ticks && "No ticks after stop");

        std::cout << "✓ Background loop test passed" << std::endl;
    }

    void testOfflineBackendFallsBackInRouting() {
        std::cout << "Testing offline backend is replaced by its fallback..." << std::endl;

        BackendRegistry registry;
        registry.registerBackend(makeBackend("coding", "coding", 0.9, {"reasoning", "general"}));
        registry.registerBackend(makeBackend("reasoning", "reasoning", 0.95, {"general"}));
        registry.registerBackend(makeBackend("general", "general", 0.85));

        auto probe = std::make_shared<ScriptedProbe>();
        probe->setHealthy("coding", false);
        probe->setHealthy("reasoning", true);
        probe->setHealthy("general", true);
        HealthMonitor monitor(registry, probe);
        BackendRouter router(registry);

        auto before = router.route(TaskType::CODING, ComplexityLevel::MODERATE);
        assert(before.backend == "coding" && "Unprobed specialist is still preferred");

        for (int i = 0; i < 3; ++i) {
            monitor.runOnce();
        }
        assert(statusOf(registry, "coding") == HealthStatus::OFFLINE);

        auto after = router.route(TaskType::CODING, ComplexityLevel::MODERATE);
        assert(after.available);
        assert(after.backend == "reasoning" && "First healthy entry of the fallback chain");
        assert(after.used_fallback);
        assert(after.reason.find("offline") != std::string::npos);

        std::cout << "✓ Offline fallback test passed" << std::endl;
    }

    void testProbeFanOutIsBounded() {
        std::cout << "Testing probe fan-out limit..." << std::endl;

        BackendRegistry registry;
        for (int i = 0; i < 7; ++i) {
            registry.registerBackend(makeBackend("backend" + std::to_string(i), "general", 0.5));
        }

        auto probe = std::make_shared<ConcurrencyProbe>();
        HealthMonitorConfig config;
        config.max_concurrent_probes = 2;
        HealthMonitor monitor(registry, probe, config);

        size_t online = monitor.runOnce();
        assert(online == 7 && "Every backend is probed in one tick");
        assert(probe->peak() >= 1);
        assert(probe->peak() <= config.max_concurrent_probes && "Never more probes in flight than workers");

        std::cout << "✓ Probe fan-out test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== HealthMonitor Component Tests ===" << std::endl;

        testUnknownToOffline();
        testOnlineDegradedRecovery();
        testTransitionListener();
        testThrowingProbeCountsAsFailure();
        testBackgroundLoop();
        testProbeFanOutIsBounded();
        testOfflineBackendFallsBackInRouting();

        std::cout << "All HealthMonitor tests passed!" << std::endl;
    }
};

int main() {
    try {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);

        HealthMonitorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All HealthMonitor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
