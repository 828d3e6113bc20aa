// =================================================================
// include/Switchboard/TaskGraphExecutor.hpp
// =================================================================
// Dependency-ordered execution of workflow tasks across backends.

#pragma once

#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/BackendDispatcher.hpp"
#include "Switchboard/ThreadPool.hpp"
#include "Switchboard/WorkflowTemplate.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include <utility>

namespace Switchboard {

/**
 * @brief Executor configuration
 */
struct ExecutorConfig {
    size_t max_parallel_tasks = 4;                  ///< Worker threads
    size_t max_attempts = 3;                        ///< Dispatch attempts per task
    double timeout_multiplier = 3.0;                ///< Timeout = avg latency x multiplier
    std::chrono::milliseconds min_timeout{5000};    ///< Lower bound on the timeout
    double budget_factor = 1.0;                     ///< Passed to the router
};

/**
 * @brief Outcome of one workflow execution
 */
struct WorkflowResult {
    bool success = false;                                       ///< Every task DONE
    bool partial_success = false;                               ///< Some DONE, some FAILED
    std::vector<std::string> completed;                         ///< DONE task ids, input order
    std::vector<std::pair<std::string, std::string>> failed;    ///< (task id, reason), input order
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Invoked once per task when it reaches DONE or FAILED
 */
using ResultCallback = std::function<void(const Task&)>;

/**
 * @brief Walks a task DAG, routing and dispatching each task
 *
 * A task runs only after all of its dependencies are DONE. Members of a
 * parallel group are held until every live member is ready and then
 * submitted together. Timeouts and backend errors move the task to the
 * next routable backend in the selected backend's fallback chain; a
 * backend that failed is not retried. A failed task fails its transitive
 * dependents without running them.
 */
class TaskGraphExecutor {
public:
    /**
     * @brief Constructor
     * @param router Router used for placement and outcome reporting
     * @param dispatcher Backend invocation (HttpBackendDispatcher when null)
     * @param config Executor configuration
     */
    TaskGraphExecutor(BackendRouter& router,
                      std::shared_ptr<BackendDispatcher> dispatcher = nullptr,
                      const ExecutorConfig& config = ExecutorConfig());

    virtual ~TaskGraphExecutor() = default;

    /**
     * @brief Execute tasks in dependency order
     *
     * Tasks already DONE are kept; every other task is reset to PENDING.
     * Returns after every task is DONE or FAILED.
     * @param tasks Tasks to run; states, results and errors are written back
     * @param token Cooperative cancellation
     * @return Summary of the run
     */
    WorkflowResult execute(std::vector<Task>& tasks, CancellationToken token = CancellationToken());

    void setResultCallback(ResultCallback callback);

    /**
     * @brief Dispatch timeout for a backend
     */
    std::chrono::milliseconds computeTimeout(const BackendDescriptor& backend) const;

    const ExecutorConfig& getConfig() const { return m_config; }

private:
    struct TaskOutcome {
        bool success = false;
        std::string result;
        std::string error;
        std::string backend;
        size_t attempts = 0;
    };

    BackendRouter& m_router;
    std::shared_ptr<BackendDispatcher> m_dispatcher;
    ExecutorConfig m_config;
    std::unique_ptr<ThreadPool> m_pool;
    ResultCallback m_callback;

    /**
     * @brief Route, dispatch and walk the fallback chain for one task
     */
    TaskOutcome runTask(const Task& task, const CancellationToken& token);
};

} // namespace Switchboard
