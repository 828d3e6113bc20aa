// =================================================================
// src/Switchboard/TaskGraphExecutor.cpp
// =================================================================
// Implementation of the task graph executor.

#include "Switchboard/TaskGraphExecutor.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <set>
#include <unordered_map>

namespace Switchboard {

namespace {

bool isTerminal(TaskState state) {
    return state == TaskState::DONE || state == TaskState::FAILED;
}

} // namespace

TaskGraphExecutor::TaskGraphExecutor(BackendRouter& router,
                                     std::shared_ptr<BackendDispatcher> dispatcher,
                                     const ExecutorConfig& config)
    : m_router(router), m_dispatcher(std::move(dispatcher)), m_config(config) {
    if (!m_dispatcher) {
        m_dispatcher = std::make_shared<HttpBackendDispatcher>();
    }
    if (m_config.max_attempts == 0) {
        m_config.max_attempts = 1;
    }
    m_pool = std::make_unique<ThreadPool>(m_config.max_parallel_tasks);
}

void TaskGraphExecutor::setResultCallback(ResultCallback callback) {
    m_callback = std::move(callback);
}

std::chrono::milliseconds TaskGraphExecutor::computeTimeout(const BackendDescriptor& backend) const {
    auto scaled = std::chrono::milliseconds(
        static_cast<long long>(backend.avg_latency_ms * m_config.timeout_multiplier));
    return std::max(m_config.min_timeout, scaled);
}

WorkflowResult TaskGraphExecutor::execute(std::vector<Task>& tasks, CancellationToken token) {
    auto start_time = std::chrono::steady_clock::now();

    std::unordered_map<std::string, size_t> index_of;
    for (size_t i = 0; i < tasks.size(); ++i) {
        index_of[tasks[i].id] = i;
        if (tasks[i].state != TaskState::DONE) {
            tasks[i].state = TaskState::PENDING;
            tasks[i].error.clear();
        }
    }

    std::mutex state_mutex;
    std::condition_variable state_cv;
    size_t running = 0;
    std::vector<bool> notified(tasks.size(), false);
    for (size_t i = 0; i < tasks.size(); ++i) {
        notified[i] = tasks[i].state == TaskState::DONE;
    }

    auto fail = [&](Task& task, const std::string& reason) {
        task.state = TaskState::FAILED;
        task.error = reason;
    };

    Logger::getInstance().info("Executor", "Executing workflow",
        "Tasks: " + std::to_string(tasks.size()) + ", Workers: " + std::to_string(m_pool->size()));

    while (true) {
        std::vector<size_t> to_notify;
        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(state_mutex);

            if (token.isCancelled()) {
                for (auto& task : tasks) {
                    if (task.state == TaskState::PENDING || task.state == TaskState::READY) {
                        fail(task, "cancelled");
                    }
                }
            }

            // Fail dependents of failed tasks until nothing changes
            bool changed = true;
            while (changed) {
                changed = false;
                for (auto& task : tasks) {
                    if (task.state != TaskState::PENDING) {
                        continue;
                    }
                    for (const auto& dep : task.dependencies) {
                        auto it = index_of.find(dep);
                        if (it == index_of.end()) {
                            fail(task, "unknown dependency " + dep);
                            changed = true;
                            break;
                        }
                        if (tasks[it->second].state == TaskState::FAILED) {
                            fail(task, "dependency " + dep + " failed");
                            changed = true;
                            break;
                        }
                    }
                }
            }

            for (auto& task : tasks) {
                if (task.state != TaskState::PENDING) {
                    continue;
                }
                bool ready = std::all_of(task.dependencies.begin(), task.dependencies.end(),
                    [&](const std::string& dep) { return tasks[index_of.at(dep)].state == TaskState::DONE; });
                if (ready) {
                    task.state = TaskState::READY;
                }
            }

            // A group is released once none of its live members is still pending
            std::set<std::string> held_groups;
            for (const auto& task : tasks) {
                if (task.parallel_group && task.state == TaskState::PENDING) {
                    held_groups.insert(*task.parallel_group);
                }
            }

            std::vector<size_t> to_dispatch;
            for (size_t i = 0; i < tasks.size(); ++i) {
                if (tasks[i].state != TaskState::READY) {
                    continue;
                }
                if (tasks[i].parallel_group && held_groups.count(*tasks[i].parallel_group) > 0) {
                    continue;
                }
                to_dispatch.push_back(i);
            }

            for (size_t i : to_dispatch) {
                Task& task = tasks[i];
                for (const auto& dep : task.dependencies) {
                    const Task& done = tasks[index_of.at(dep)];
                    task.context["dependency_" + dep] = done.result;
                }
                task.state = TaskState::RUNNING;
                running++;

                Task snapshot = task;
                m_pool->enqueue([this, i, snapshot, token, &tasks, &state_mutex, &state_cv, &running]() {
                    TaskOutcome outcome;
                    try {
                        outcome = runTask(snapshot, token);
                    } catch (const std::exception& e) {
                        outcome.success = false;
                        outcome.error = e.what();
                    }

                    std::lock_guard<std::mutex> guard(state_mutex);
                    Task& target = tasks[i];
                    target.attempts += outcome.attempts;
                    target.assigned_backend = outcome.backend;
                    if (outcome.success) {
                        target.state = TaskState::DONE;
                        target.result = std::move(outcome.result);
                    } else {
                        target.state = TaskState::FAILED;
                        target.error = outcome.error;
                    }
                    running--;
                    state_cv.notify_all();
                });
            }

            if (running == 0 && to_dispatch.empty()) {
                // Nothing in flight and nothing releasable: anything left can never run
                for (auto& task : tasks) {
                    if (!isTerminal(task.state)) {
                        fail(task, token.isCancelled() ? "cancelled" : "unresolvable dependencies");
                    }
                }
                finished = true;
            }

            for (size_t i = 0; i < tasks.size(); ++i) {
                if (!notified[i] && isTerminal(tasks[i].state)) {
                    notified[i] = true;
                    to_notify.push_back(i);
                }
            }

            if (!finished && to_dispatch.empty()) {
                state_cv.wait_for(lock, std::chrono::milliseconds(50));
            }
        }

        for (size_t i : to_notify) {
            Logger::getInstance().debug("Executor",
                "Task " + tasks[i].id + " " + taskStateToString(tasks[i].state), tasks[i].error);
            if (m_callback) {
                m_callback(tasks[i]);
            }
        }

        if (finished) {
            break;
        }
    }

    WorkflowResult result;
    for (const auto& task : tasks) {
        if (task.state == TaskState::DONE) {
            result.completed.push_back(task.id);
        } else {
            result.failed.emplace_back(task.id, task.error);
        }
    }
    result.success = result.failed.empty();
    result.partial_success = !result.completed.empty() && !result.failed.empty();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    Logger::getInstance().logWorkflowSummary(result);
    return result;
}

TaskGraphExecutor::TaskOutcome TaskGraphExecutor::runTask(const Task& task, const CancellationToken& token) {
    TaskOutcome outcome;
    const BackendRegistry& registry = m_router.getRegistry();

    auto complexity = m_router.getClassifier().classify(task.prompt).complexity;
    auto decision = m_router.route(task.type, complexity, m_config.budget_factor);

    if (!decision.available) {
        throw NoHealthyBackendError("No healthy backend available for task " + task.id);
    }

    std::set<std::string> tried;
    std::vector<std::string> chain = decision.fallbacks;
    size_t chain_pos = 0;
    std::string current = decision.backend;

    while (!current.empty() && outcome.attempts < m_config.max_attempts) {
        if (token.isCancelled()) {
            outcome.error = "cancelled";
            return outcome;
        }

        auto backend = registry.getBackend(current);
        tried.insert(current);
        if (!backend) {
            outcome.error = "Backend disappeared from registry: " + current;
            break;
        }

        outcome.attempts++;
        outcome.backend = current;
        auto timeout = computeTimeout(*backend);
        auto attempt_start = std::chrono::steady_clock::now();
        auto elapsed_ms = [&attempt_start]() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - attempt_start).count();
        };

        try {
            std::string text = m_dispatcher->dispatch(*backend, task, timeout, token);
            long duration = static_cast<long>(elapsed_ms());
            m_router.reportOutcome(current, static_cast<double>(duration), true);
            Logger::getInstance().logDispatch(task.id, current, duration, true);
            outcome.success = true;
            outcome.result = std::move(text);
            outcome.error.clear();
            return outcome;
        } catch (const CancelledError&) {
            outcome.error = "cancelled";
            return outcome;
        } catch (const BackendTimeoutError& e) {
            long duration = static_cast<long>(elapsed_ms());
            m_router.reportOutcome(current, static_cast<double>(duration), false);
            Logger::getInstance().logDispatch(task.id, current, duration, false, e.what());
            outcome.error = e.what();
        } catch (const BackendError& e) {
            long duration = static_cast<long>(elapsed_ms());
            m_router.reportOutcome(current, static_cast<double>(duration), false);
            Logger::getInstance().logDispatch(task.id, current, duration, false, e.what());
            outcome.error = e.what();
        } catch (const std::exception& e) {
            long duration = static_cast<long>(elapsed_ms());
            m_router.reportOutcome(current, static_cast<double>(duration), false);
            Logger::getInstance().logDispatch(task.id, current, duration, false, e.what());
            outcome.error = std::string("Dispatch to ") + current + " failed: " + e.what();
        }

        // Below-ceiling entries are skipped while an untried compliant backend is routable
        bool compliant_available = false;
        for (const auto& backend : registry.listBackends()) {
            if (tried.count(backend->name) == 0 && m_router.isRoutable(*backend) &&
                BackendCapabilityUtils::meetsComplexity(backend->max_complexity, complexity)) {
                compliant_available = true;
                break;
            }
        }

        // Next acceptable, untried backend from the selected backend's chain
        current.clear();
        while (chain_pos < chain.size()) {
            const std::string& candidate = chain[chain_pos++];
            if (tried.count(candidate) > 0) {
                continue;
            }
            auto snapshot = registry.getBackend(candidate);
            if (!snapshot || !m_router.isRoutable(*snapshot)) {
                continue;
            }
            if (compliant_available &&
                !BackendCapabilityUtils::meetsComplexity(snapshot->max_complexity, complexity)) {
                continue;
            }
            current = candidate;
            break;
        }
    }

    if (!outcome.success && outcome.attempts >= m_config.max_attempts) {
        outcome.error = "gave up after " + std::to_string(outcome.attempts) + " attempts: " + outcome.error;
    }
    return outcome;
}

} // namespace Switchboard
