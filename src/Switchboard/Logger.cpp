// =================================================================
// src/Switchboard/Logger.cpp
// =================================================================
// Implementation for structured logging and routing audit trails.

#include "Switchboard/Logger.hpp"
#include "Switchboard/BackendCapabilities.hpp"
#include "Switchboard/BackendRouter.hpp"
#include "Switchboard/TaskGraphExecutor.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <stdexcept>

namespace Switchboard {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        configure(log_dir, max_log_size, max_log_files);
        target = m_file_enabled ? m_log_dir : "file output disabled";
    }
    debug("Logger", "Logging system initialized", target);
}

void Logger::configure(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_current_log_file.reset();
    m_initialized = true;

    if (m_file_enabled) {
        openLogFile();
    }
}

void Logger::openLogFile() {
    ensureLogDirectory();
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        if (m_current_log_file) {
            m_current_log_file->flush();
        }
        m_current_log_file.reset();
    } else if (m_initialized && !m_current_log_file) {
        openLogFile();
    }
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logRoutingDecision(const std::string& task_type, const std::string& complexity,
                                const RoutingDecision& decision) {
    if (!decision.available) {
        warning("Router", "No routable backend",
                "Task: " + task_type + ", Complexity: " + complexity);
        return;
    }

    std::ostringstream context;
    context << "Task: " << task_type << ", ";
    context << "Complexity: " << complexity << ", ";
    context << "Score: " << std::fixed << std::setprecision(3) << decision.score << ", ";
    context << "Dominant: " << decision.dominant_term;
    if (decision.used_fallback) {
        context << ", via fallback";
    }

    info("Router", "Routed to " + decision.backend, context.str());

    if (!decision.complexity_compliant) {
        warning("Router", "Selected backend is below the required complexity", decision.backend);
    }
    if (!decision.fallbacks.empty()) {
        std::ostringstream chain;
        for (size_t i = 0; i < decision.fallbacks.size(); i++) {
            if (i > 0) chain << " -> ";
            chain << decision.fallbacks[i];
        }
        debug("Router", "Fallbacks: " + chain.str());
    }
}

void Logger::logHealthTransition(const std::string& backend, HealthStatus from, HealthStatus to,
                                 size_t consecutive_failures) {
    std::ostringstream context;
    context << BackendCapabilityUtils::healthStatusToString(from) << " -> ";
    context << BackendCapabilityUtils::healthStatusToString(to) << ", ";
    context << "Failures: " << consecutive_failures;

    if (to == HealthStatus::OFFLINE) {
        error("HealthMonitor", "Backend went offline: " + backend, context.str());
    } else if (to == HealthStatus::DEGRADED) {
        warning("HealthMonitor", "Backend degraded: " + backend, context.str());
    } else {
        info("HealthMonitor", "Backend status changed: " + backend, context.str());
    }
}

void Logger::logDispatch(const std::string& task_id, const std::string& backend,
                         long duration_ms, bool success, const std::string& detail) {
    std::ostringstream context;
    context << "Backend: " << backend << ", ";
    context << "Duration: " << duration_ms << "ms";
    if (!detail.empty()) {
        context << ", " << detail;
    }

    if (success) {
        info("Dispatcher", "Task " + task_id + " completed", context.str());
    } else {
        warning("Dispatcher", "Task " + task_id + " attempt failed", context.str());
    }

    if (duration_ms > 30000) {
        warning("Dispatcher", "Slow backend response", backend + ": " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logWorkflowSummary(const WorkflowResult& result) {
    std::ostringstream context;
    context << "Completed: " << result.completed.size() << ", ";
    context << "Failed: " << result.failed.size() << ", ";
    context << "Duration: " << result.duration.count() << "ms";

    if (result.success) {
        info("Executor", "Workflow completed successfully", context.str());
    } else if (result.partial_success) {
        warning("Executor", "Workflow partially completed", context.str());
    } else {
        error("Executor", "Workflow failed", context.str());
    }

    for (const auto& [task_id, reason] : result.failed) {
        debug("Executor", "Failed task: " + task_id, reason);
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& user_prompt) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Prompt length: " << user_prompt.length() << " chars";

    info("Session", "Session started", context.str());
    if (!user_prompt.empty()) {
        debug("Session", "User prompt: " + user_prompt);
    }
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
    std::cout.flush();
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = toLower(name);
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;
    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        configure(m_log_dir, m_max_log_size, m_max_log_files);
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // Warnings and above go to stderr so command output stays clean
    std::ostream& out = entry.level >= LogLevel::WARNING ? std::cerr : std::cout;
    out << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1;

    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();
    m_current_log_size = 0;
    openLogFile();

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/switchboard_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace Switchboard
