// =================================================================
// include/Switchboard/BackendDispatcher.hpp
// =================================================================
// Backend invocation interface, cooperative cancellation and the HTTP dispatcher.

#pragma once

#include "Switchboard/BackendCapabilities.hpp"
#include "Switchboard/WorkflowTemplate.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <chrono>

namespace Switchboard {

/**
 * @brief Shared cancellation flag
 *
 * Copies share the same flag, so cancelling any copy is seen by all.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * @brief Sends one task to one backend
 *
 * Implementations throw BackendTimeoutError when the backend does not
 * answer in time, BackendError for any other backend failure and
 * CancelledError when the token is cancelled at a checkpoint.
 */
class BackendDispatcher {
public:
    virtual ~BackendDispatcher() = default;

    /**
     * @brief Dispatch a task and return the backend's text output
     * @param backend Target backend
     * @param task Task to run (prompt and context)
     * @param timeout Upper bound for the whole request
     * @param token Cancellation token checked before and after I/O
     */
    virtual std::string dispatch(const BackendDescriptor& backend, const Task& task,
                                 std::chrono::milliseconds timeout,
                                 const CancellationToken& token) = 0;
};

/**
 * @brief HTTP dispatcher configuration
 */
struct HttpDispatcherConfig {
    size_t max_tokens = 2048;               ///< Generation limit sent to the backend
    bool inline_context = true;             ///< Append task context to prompt-only formats
};

/**
 * @brief Dispatcher speaking the three wire formats over cpp-httplib
 *
 *   openai-compatible  POST /v1/chat/completions  -> choices[0].message.content
 *   rest               POST /api/v1/generate      -> results[0].text | response
 *   custom             POST /api/completion       -> response | result | raw body
 */
class HttpBackendDispatcher : public BackendDispatcher {
public:
    explicit HttpBackendDispatcher(const HttpDispatcherConfig& config = HttpDispatcherConfig());

    std::string dispatch(const BackendDescriptor& backend, const Task& task,
                         std::chrono::milliseconds timeout,
                         const CancellationToken& token) override;

    /**
     * @brief Request path for a wire format
     */
    static std::string requestPath(WireFormat format);

    /**
     * @brief JSON request body for a backend and task
     */
    std::string buildRequestBody(const BackendDescriptor& backend, const Task& task) const;

    /**
     * @brief Extract the generated text from a response body
     * @throws BackendError if the body has no recognizable result
     */
    static std::string parseResponseBody(const BackendDescriptor& backend, const std::string& body);

private:
    HttpDispatcherConfig m_config;

    std::string composePrompt(const Task& task) const;
};

} // namespace Switchboard
