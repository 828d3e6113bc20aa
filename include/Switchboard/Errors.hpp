// =================================================================
// include/Switchboard/Errors.hpp
// =================================================================
// Exception types for configuration, template and dispatch failures.

#pragma once

#include <stdexcept>
#include <string>

namespace Switchboard {

/**
 * @brief Base class for all Switchboard errors
 */
class SwitchboardError : public std::runtime_error {
public:
    explicit SwitchboardError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed configuration file or inconsistent backend registry
 */
class ConfigurationError : public SwitchboardError {
public:
    explicit ConfigurationError(const std::string& message) : SwitchboardError(message) {}
};

/**
 * @brief Workflow template name not present in the catalog
 */
class UnknownTemplateError : public SwitchboardError {
public:
    explicit UnknownTemplateError(const std::string& template_name)
        : SwitchboardError("Unknown workflow template: " + template_name),
          m_template_name(template_name) {}

    const std::string& templateName() const { return m_template_name; }

private:
    std::string m_template_name;
};

/**
 * @brief Template references an undeclared task type or has inconsistent groups
 */
class InvalidTemplateError : public SwitchboardError {
public:
    InvalidTemplateError(const std::string& template_name, const std::string& detail)
        : SwitchboardError("Invalid workflow template '" + template_name + "': " + detail) {}
};

/**
 * @brief No routable backend could take a task
 */
class NoHealthyBackendError : public SwitchboardError {
public:
    explicit NoHealthyBackendError(const std::string& message) : SwitchboardError(message) {}
};

/**
 * @brief Backend did not answer within the allotted time (retryable)
 */
class BackendTimeoutError : public SwitchboardError {
public:
    BackendTimeoutError(const std::string& backend, const std::string& message)
        : SwitchboardError(message), m_backend(backend) {}

    const std::string& backend() const { return m_backend; }

private:
    std::string m_backend;
};

/**
 * @brief Backend reported an explicit error (terminal for that backend)
 */
class BackendError : public SwitchboardError {
public:
    BackendError(const std::string& backend, const std::string& message)
        : SwitchboardError(message), m_backend(backend) {}

    const std::string& backend() const { return m_backend; }

private:
    std::string m_backend;
};

/**
 * @brief Dispatch abandoned because the workflow was cancelled
 */
class CancelledError : public SwitchboardError {
public:
    CancelledError() : SwitchboardError("cancelled") {}
};

} // namespace Switchboard
