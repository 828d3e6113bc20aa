// =================================================================
// src/Switchboard/BackendDispatcher.cpp
// =================================================================
// HTTP dispatch of tasks to model-serving backends.

#include "Switchboard/BackendDispatcher.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <sstream>

namespace Switchboard {

HttpBackendDispatcher::HttpBackendDispatcher(const HttpDispatcherConfig& config)
    : m_config(config) {
}

std::string HttpBackendDispatcher::requestPath(WireFormat format) {
    switch (format) {
        case WireFormat::OPENAI_COMPATIBLE: return "/v1/chat/completions";
        case WireFormat::REST: return "/api/v1/generate";
        case WireFormat::CUSTOM: return "/api/completion";
        default: return "/api/completion";
    }
}

std::string HttpBackendDispatcher::composePrompt(const Task& task) const {
    if (!m_config.inline_context || task.context.empty()) {
        return task.prompt;
    }

    std::ostringstream prompt;
    prompt << task.prompt << "\n\nContext:\n";
    for (const auto& [key, value] : task.context) {
        prompt << "[" << key << "]\n" << value << "\n";
    }
    return prompt.str();
}

std::string HttpBackendDispatcher::buildRequestBody(const BackendDescriptor& backend, const Task& task) const {
    nlohmann::json body;

    switch (backend.wire_format) {
        case WireFormat::OPENAI_COMPATIBLE:
            body = {
                {"model", backend.name},
                {"messages", nlohmann::json::array({
                    {{"role", "user"}, {"content", composePrompt(task)}}
                })},
                {"max_tokens", m_config.max_tokens}
            };
            break;
        case WireFormat::REST:
            body = {
                {"prompt", composePrompt(task)},
                {"max_length", m_config.max_tokens}
            };
            break;
        case WireFormat::CUSTOM:
        default:
            body = {
                {"prompt", task.prompt},
                {"context", task.context}
            };
            break;
    }

    return body.dump();
}

std::string HttpBackendDispatcher::parseResponseBody(const BackendDescriptor& backend, const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        if (backend.wire_format == WireFormat::CUSTOM && !body.empty()) {
            return body;
        }
        throw BackendError(backend.name, "Unparseable response from " + backend.name + ": " + e.what());
    }

    auto as_text = [](const nlohmann::json& value) {
        return value.is_string() ? value.get<std::string>() : value.dump();
    };

    switch (backend.wire_format) {
        case WireFormat::OPENAI_COMPATIBLE: {
            if (doc.contains("choices") && doc["choices"].is_array() && !doc["choices"].empty()) {
                const auto& choice = doc["choices"][0];
                if (choice.contains("message") && choice["message"].contains("content")) {
                    return as_text(choice["message"]["content"]);
                }
            }
            break;
        }
        case WireFormat::REST: {
            if (doc.contains("results") && doc["results"].is_array() && !doc["results"].empty() &&
                doc["results"][0].contains("text")) {
                return as_text(doc["results"][0]["text"]);
            }
            if (doc.contains("response")) {
                return as_text(doc["response"]);
            }
            break;
        }
        case WireFormat::CUSTOM:
        default: {
            if (doc.is_object() && doc.contains("response")) {
                return as_text(doc["response"]);
            }
            if (doc.is_object() && doc.contains("result")) {
                return as_text(doc["result"]);
            }
            return body;
        }
    }

    if (doc.is_object() && doc.contains("error")) {
        throw BackendError(backend.name, backend.name + " reported an error: " + as_text(doc["error"]));
    }
    throw BackendError(backend.name, "Response from " + backend.name + " has no result field");
}

std::string HttpBackendDispatcher::dispatch(const BackendDescriptor& backend, const Task& task,
                                            std::chrono::milliseconds timeout,
                                            const CancellationToken& token) {
    if (token.isCancelled()) {
        throw CancelledError();
    }

    auto seconds = static_cast<time_t>(timeout.count() / 1000);
    auto micros = static_cast<time_t>((timeout.count() % 1000) * 1000);

    std::string path = requestPath(backend.wire_format);
    std::string payload = buildRequestBody(backend, task);

    Logger::getInstance().debug("Dispatcher", "POST " + backend.endpoint + path,
        "Task: " + task.id + ", Payload: " + std::to_string(payload.size()) + " bytes");

    auto start_time = std::chrono::steady_clock::now();

    httplib::Client client(backend.endpoint);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    client.set_write_timeout(seconds, micros);

    httplib::Headers headers = {{"Accept", "application/json"}};
    auto res = client.Post(path.c_str(), headers, payload, "application/json");

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (token.isCancelled()) {
        throw CancelledError();
    }

    if (!res) {
        auto error = res.error();
        std::string detail = httplib::to_string(error);
        if (error == httplib::Error::Read || elapsed >= timeout) {
            throw BackendTimeoutError(backend.name,
                backend.name + " timed out after " + std::to_string(elapsed.count()) + "ms (" + detail + ")");
        }
        throw BackendError(backend.name, "Request to " + backend.name + " failed: " + detail);
    }

    if (res->status != 200) {
        std::string snippet = res->body.substr(0, 200);
        if (res->status == 408 || res->status == 504) {
            throw BackendTimeoutError(backend.name,
                backend.name + " returned HTTP " + std::to_string(res->status) + ": " + snippet);
        }
        throw BackendError(backend.name,
            backend.name + " returned HTTP " + std::to_string(res->status) + ": " + snippet);
    }

    return parseResponseBody(backend, res->body);
}

} // namespace Switchboard
