// =================================================================
// tests/IntegrationTest.cpp
// =================================================================
// End-to-end tests: configuration, health probing, routing and workflow
// execution against local HTTP backends.

#include "Switchboard/BackendRegistry.hpp"
#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/HealthMonitor.hpp"
#include "Switchboard/TaskGraphExecutor.hpp"
#include "Switchboard/WorkflowBuilder.hpp"
#include "Switchboard/Logger.hpp"
#include "httplib.h"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;
using namespace Switchboard;

namespace {

/**
 * @brief Request bodies received by every fake backend
 */
class RequestLog {
public:
    void record(const std::string& backend, const std::string& body) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.emplace_back(backend, body);
    }

    bool anyBodyContains(const std::string& text) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_entries) {
            if (entry.second.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t countFor(const std::string& backend) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& entry : m_entries) {
            if (entry.first == backend) {
                count++;
            }
        }
        return count;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, std::string>> m_entries;
};

/**
 * @brief Model server speaking one wire format on a loopback port
 */
class FakeBackend {
public:
    enum class Mode { OK, FAIL, SLOW };

    std::atomic<bool> healthy{true};
    std::atomic<Mode> mode{Mode::OK};

    FakeBackend(const std::string& name, WireFormat format, RequestLog& log)
        : m_name(name), m_format(format), m_log(log) {
        m_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.status = healthy ? 200 : 503;
            res.set_content(healthy ? "ok" : "down", "text/plain");
        });

        auto generate = [this](const httplib::Request& req, httplib::Response& res) {
            m_log.record(m_name, req.body);
            if (mode == Mode::FAIL) {
                res.status = 500;
                res.set_content("model crashed", "text/plain");
                return;
            }
            if (mode == Mode::SLOW) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            }
            res.set_content(responseFor(m_name + " answer #" + std::to_string(++m_counter) + "."),
                            "application/json");
        };
        m_server.Post("/v1/chat/completions", generate);
        m_server.Post("/api/v1/generate", generate);
        m_server.Post("/api/completion", generate);

        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        while (!m_server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~FakeBackend() {
        m_server.stop();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    std::string endpoint() const {
        return "http://127.0.0.1:" + std::to_string(m_port);
    }

private:
    std::string m_name;
    WireFormat m_format;
    RequestLog& m_log;
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::atomic<int> m_counter{0};

    std::string responseFor(const std::string& text) const {
        switch (m_format) {
            case WireFormat::OPENAI_COMPATIBLE:
                return R"({"choices":[{"message":{"role":"assistant","content":")" + text + R"("}}]})";
            case WireFormat::REST:
                return R"({"results":[{"text":")" + text + R"("}]})";
            case WireFormat::CUSTOM:
            default:
                return R"({"response":")" + text + R"("})";
        }
    }
};

} // namespace

class IntegrationTest {
private:
    std::string test_config_path = "test_integration_switchboard.yml";
    RequestLog log;
    std::map<std::string, std::unique_ptr<FakeBackend>> servers;

    void writeConfig() {
        std::ofstream config(test_config_path);
        config << "backends:\n"
               << "  - name: reasoning\n"
               << "    endpoint: " << servers["reasoning"]->endpoint() << "\n"
               << "    specialties: [reasoning, math]\n"
               << "    performance_score: 0.95\n"
               << "    max_complexity: expert\n"
               << "    fallback_chain: [general]\n"
               << "  - name: general\n"
               << "    endpoint: " << servers["general"]->endpoint() << "\n"
               << "    wire_format: rest\n"
               << "    specialties: [general]\n"
               << "    performance_score: 0.8\n"
               << "    cost_per_token: 0.0001\n"
               << "    max_complexity: moderate\n"
               << "  - name: coding\n"
               << "    endpoint: " << servers["coding"]->endpoint() << "\n"
               << "    wire_format: custom\n"
               << "    specialties: [coding]\n"
               << "    performance_score: 0.9\n"
               << "    max_complexity: complex\n"
               << "    fallback_chain: [reasoning, general]\n"
               << "  - name: ghost\n"
               << "    endpoint: http://127.0.0.1:1\n"
               << "    specialties: [coding, research, analysis]\n"
               << "    performance_score: 1.0\n"
               << "    max_complexity: expert\n"
               << "workflows:\n"
               << "  - name: incident_review\n"
               << "    task_types: [research, analysis, reasoning, general]\n"
               << "    dependencies:\n"
               << "      analysis: [research]\n"
               << "      reasoning: [research]\n"
               << "      general: [analysis, reasoning]\n"
               << "    parallel_sections:\n"
               << "      - [analysis, reasoning]\n"
               << "    keywords: [outage, incident]\n"
               << "health_monitor:\n"
               << "  probe_timeout_s: 0.5\n"
               << "  failure_threshold: 1\n";
    }

    struct Stack {
        BackendRegistry registry;
        TemplateCatalog catalog = TemplateCatalog::withBuiltins();
        std::unique_ptr<BackendRouter> router;
        std::unique_ptr<HealthMonitor> monitor;
    };

    std::unique_ptr<Stack> bootstrap() {
        ConfigParser parser(test_config_path);
        auto stack = std::make_unique<Stack>();
        stack->registry.loadFromConfig(test_config_path);
        stack->catalog.loadFromConfig(test_config_path);
        stack->router = std::make_unique<BackendRouter>(stack->registry, parser.getConfig().router);
        stack->monitor = std::make_unique<HealthMonitor>(
            stack->registry, std::make_shared<HttpHealthProbe>(), parser.getConfig().health_monitor);
        return stack;
    }

    HealthStatus statusOf(const Stack& stack, const std::string& name) {
        return stack.registry.getBackend(name)->health;
    }

public:
    IntegrationTest() {
        servers["reasoning"] = std::make_unique<FakeBackend>("reasoning", WireFormat::OPENAI_COMPATIBLE, log);
        servers["general"] = std::make_unique<FakeBackend>("general", WireFormat::REST, log);
        servers["coding"] = std::make_unique<FakeBackend>("coding", WireFormat::CUSTOM, log);
        writeConfig();
    }

    ~IntegrationTest() {
        if (fs::exists(test_config_path)) {
            fs::remove(test_config_path);
        }
    }

    void testHealthProbing() {
        std::cout << "Testing health probing over HTTP..." << std::endl;

        auto stack = bootstrap();
        std::vector<HealthTransition> transitions;
        stack->monitor->setTransitionListener([&](const HealthTransition& t) { transitions.push_back(t); });

        size_t online = stack->monitor->runOnce();
        assert(online == 3);
        assert(statusOf(*stack, "reasoning") == HealthStatus::ONLINE);
        assert(statusOf(*stack, "coding") == HealthStatus::ONLINE);
        assert(statusOf(*stack, "ghost") == HealthStatus::OFFLINE && "Unreachable backend goes offline");
        assert(transitions.size() == 4);

        servers["general"]->healthy = false;
        stack->monitor->runOnce();
        assert(statusOf(*stack, "general") == HealthStatus::OFFLINE);

        servers["general"]->healthy = true;
        stack->monitor->runOnce();
        assert(statusOf(*stack, "general") == HealthStatus::ONLINE && "Recovered backend comes back");

        std::cout << "✓ Health probing test passed" << std::endl;
    }

    void testProbeWalksEndpointsInOrder() {
        std::cout << "Testing ordered health endpoints..." << std::endl;

        std::mutex paths_mutex;
        std::vector<std::string> requested;
        auto record = [&](const httplib::Request& req) {
            std::lock_guard<std::mutex> lock(paths_mutex);
            requested.push_back(req.path);
        };

        httplib::Server server;
        server.Get("/health", [&](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.status = 404;
        });
        server.Get("/v1/models", [&](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content(R"({"data":[]})", "application/json");
        });
        server.Get("/", [&](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content("root", "text/plain");
        });

        int port = server.bind_to_any_port("127.0.0.1");
        std::thread server_thread([&server]() { server.listen_after_bind(); });
        while (!server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        BackendDescriptor backend;
        backend.name = "vllm";
        backend.endpoint = "http://127.0.0.1:" + std::to_string(port);

        HttpHealthProbe probe;
        ProbeResult result = probe.probe(backend, std::chrono::milliseconds(500));

        server.stop();
        server_thread.join();

        assert(result.healthy);
        assert(result.endpoint == "/v1/models");
        assert(result.status_code == 200);
        assert(requested.size() == 2);
        assert(requested[0] == "/health" && requested[1] == "/v1/models");
        assert(std::find(requested.begin(), requested.end(), "/") == requested.end() &&
               "Probing stops at the first 200");

        std::cout << "✓ Ordered health endpoint test passed" << std::endl;
    }

    void testRoutingAvoidsOfflineBackends() {
        std::cout << "Testing routing after probing..." << std::endl;

        auto stack = bootstrap();
        stack->monitor->runOnce();

        auto decision = stack->router->route(TaskType::CODING, ComplexityLevel::COMPLEX);
        assert(decision.available);
        assert(decision.backend == "coding" && "ghost scores higher but is offline");
        assert(decision.endpoint == servers["coding"]->endpoint());

        auto prompted = stack->router->routePrompt("Prove that the square root of 2 is irrational");
        assert(prompted.backend == "reasoning");

        std::cout << "✓ Routing test passed" << std::endl;
    }

    void testWorkflowEndToEnd() {
        std::cout << "Testing code_development workflow over HTTP..." << std::endl;

        auto stack = bootstrap();
        stack->monitor->runOnce();

        WorkflowBuilder builder(stack->catalog);
        auto tasks = builder.build("code_development", "Build a rate limiter", {{"ticket", "OPS-42"}});

        TaskGraphExecutor executor(*stack->router);
        size_t callbacks = 0;
        executor.setResultCallback([&](const Task&) { callbacks++; });
        auto result = executor.execute(tasks);

        assert(result.success);
        assert(callbacks == tasks.size());
        for (size_t i = 0; i < tasks.size(); ++i) {
            assert(tasks[i].state == TaskState::DONE);
            assert(tasks[i].result.find(tasks[i].assigned_backend + " answer #") == 0);
            assert(tasks[i].assigned_backend != "ghost");
            if (i > 0) {
                assert(log.anyBodyContains(tasks[i - 1].result) && "Dependency output reaches the next step");
            }
        }
        assert(log.anyBodyContains("OPS-42"));

        auto analytics = stack->router->getAnalytics();
        assert(analytics.total_decisions >= tasks.size());

        std::cout << "✓ Workflow end-to-end test passed" << std::endl;
    }

    void testConfiguredWorkflowWithParallelSection() {
        std::cout << "Testing configured workflow with a parallel section..." << std::endl;

        auto stack = bootstrap();
        stack->monitor->runOnce();

        WorkflowBuilder builder(stack->catalog);
        assert(builder.suggestTemplate("Review the incident behind the outage last night") == "incident_review");

        auto tasks = builder.buildFromPrompt("Review the incident behind the outage last night");
        assert(tasks.size() == 4);
        assert(tasks[1].parallel_group && tasks[1].parallel_group == tasks[2].parallel_group);

        TaskGraphExecutor executor(*stack->router);
        auto result = executor.execute(tasks);
        assert(result.success);
        assert(tasks[3].context.count("dependency_" + tasks[1].id) == 1);
        assert(tasks[3].context.count("dependency_" + tasks[2].id) == 1);

        std::cout << "✓ Configured workflow test passed" << std::endl;
    }

    void testFailoverOnBackendError() {
        std::cout << "Testing failover on backend error..." << std::endl;

        auto stack = bootstrap();
        stack->monitor->runOnce();
        servers["coding"]->mode = FakeBackend::Mode::FAIL;

        Task task;
        task.id = "failover-coding-0";
        task.type = TaskType::CODING;
        task.prompt = "Implement a distributed cache and optimize its architecture";
        std::vector<Task> tasks = {task};

        size_t coding_before = log.countFor("coding");
        TaskGraphExecutor executor(*stack->router);
        auto result = executor.execute(tasks);
        servers["coding"]->mode = FakeBackend::Mode::OK;

        assert(result.success);
        assert(tasks[0].attempts == 2);
        assert(tasks[0].assigned_backend == "reasoning");
        assert(log.countFor("coding") == coding_before + 1 && "Failed backend is not retried");

        std::cout << "✓ Backend error failover test passed" << std::endl;
    }

    void testFailoverOnTimeout() {
        std::cout << "Testing failover on timeout..." << std::endl;

        auto stack = bootstrap();
        stack->monitor->runOnce();
        servers["coding"]->mode = FakeBackend::Mode::SLOW;

        Task task;
        task.id = "timeout-coding-0";
        task.type = TaskType::CODING;
        task.prompt = "Implement a distributed cache and optimize its architecture";
        std::vector<Task> tasks = {task};

        ExecutorConfig config;
        config.min_timeout = std::chrono::milliseconds(300);
        TaskGraphExecutor executor(*stack->router, nullptr, config);
        auto result = executor.execute(tasks);
        servers["coding"]->mode = FakeBackend::Mode::OK;

        assert(result.success);
        assert(tasks[0].assigned_backend == "reasoning");

        auto analytics = stack->router->getAnalytics();
        for (const auto& [name, metrics] : analytics.backends) {
            if (name == "coding") {
                assert(metrics.total_outcomes == 1);
                assert(metrics.success_rate == 0.0);
            }
        }

        std::cout << "✓ Timeout failover test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "=== Switchboard Integration Tests ===" << std::endl;

        testHealthProbing();
        testProbeWalksEndpointsInOrder();
        testRoutingAvoidsOfflineBackends();
        testWorkflowEndToEnd();
        testConfiguredWorkflowWithParallelSection();
        testFailoverOnBackendError();
        testFailoverOnTimeout();

        std::cout << "All integration tests passed!" << std::endl;
    }
};

int main() {
    try {
        Logger::getInstance().setConsoleLogging(false);
        Logger::getInstance().setFileLogging(false);

        IntegrationTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Switchboard integration tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
