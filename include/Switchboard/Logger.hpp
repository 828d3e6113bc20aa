// =================================================================
// include/Switchboard/Logger.hpp
// =================================================================
// Header for structured logging and routing audit trails.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Switchboard {

struct RoutingDecision;
struct WorkflowResult;
enum class HealthStatus;

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with console and rotating file output
 *
 * Safe to call from the health monitor thread and executor workers.
 * Initializes itself with defaults on first use.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".switchboard/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     * @param enabled True to write log files
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a routing decision with its score breakdown
     * @param task_type Requested task type name
     * @param complexity Requested complexity name
     * @param decision Decision returned by the router
     */
    void logRoutingDecision(const std::string& task_type, const std::string& complexity,
                            const RoutingDecision& decision);

    /**
     * @brief Log a backend health status transition
     * @param backend Backend name
     * @param from Previous status
     * @param to New status
     * @param consecutive_failures Failure counter after the probe
     */
    void logHealthTransition(const std::string& backend, HealthStatus from, HealthStatus to,
                             size_t consecutive_failures);

    /**
     * @brief Log a single dispatch attempt
     * @param task_id Task identifier
     * @param backend Backend that handled the attempt
     * @param duration_ms Attempt duration in milliseconds
     * @param success Whether the attempt succeeded
     * @param detail Error text when it failed
     */
    void logDispatch(const std::string& task_id, const std::string& backend,
                     long duration_ms, bool success, const std::string& detail = "");

    /**
     * @brief Log the outcome of a workflow execution
     * @param result Workflow result
     */
    void logWorkflowSummary(const WorkflowResult& result);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param user_prompt User prompt/request
     */
    void logSessionStart(const std::string& command, const std::string& user_prompt);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @throws std::invalid_argument for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir = ".switchboard/logs";
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::mutex m_mutex;

    // Callers hold m_mutex
    void configure(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void openLogFile();
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

} // namespace Switchboard
