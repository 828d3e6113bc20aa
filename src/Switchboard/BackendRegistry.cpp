// =================================================================
// src/Switchboard/BackendRegistry.cpp
// =================================================================
// Implementation of the backend registry.

#include "Switchboard/BackendRegistry.hpp"
#include "Switchboard/ConfigParser.hpp"
#include "Switchboard/Errors.hpp"
#include "Switchboard/Logger.hpp"
#include <sstream>
#include <iomanip>
#include <unordered_set>
#include <functional>

namespace Switchboard {

void BackendRegistry::registerBackend(const BackendDescriptor& descriptor) {
    if (descriptor.name.empty()) {
        throw ConfigurationError("Backend descriptor is missing a name");
    }
    if (descriptor.endpoint.empty()) {
        throw ConfigurationError("Backend '" + descriptor.name + "' is missing an endpoint");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_backends.count(descriptor.name) > 0) {
            throw ConfigurationError("Duplicate backend name: " + descriptor.name);
        }
        m_backends[descriptor.name] = std::make_shared<const BackendDescriptor>(descriptor);
        m_order.push_back(descriptor.name);
    }

    Logger::getInstance().debug("BackendRegistry", "Registered backend: " + descriptor.name,
        descriptor.endpoint + ", " + BackendCapabilityUtils::wireFormatToString(descriptor.wire_format));
}

size_t BackendRegistry::loadFromConfig(const std::string& config_path) {
    Logger::getInstance().info("BackendRegistry", "Loading backends from configuration: " + config_path);

    auto descriptors = ConfigParser::loadBackends(config_path);
    for (const auto& descriptor : descriptors) {
        registerBackend(descriptor);
    }
    validate();

    Logger::getInstance().info("BackendRegistry",
        "Backend loading complete. Registered: " + std::to_string(descriptors.size()));
    return descriptors.size();
}

std::shared_ptr<const BackendDescriptor> BackendRegistry::getBackend(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_backends.find(name);
    if (it == m_backends.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<const BackendDescriptor>> BackendRegistry::listBackends() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<const BackendDescriptor>> backends;
    backends.reserve(m_order.size());
    for (const auto& name : m_order) {
        backends.push_back(m_backends.at(name));
    }
    return backends;
}

std::vector<std::string> BackendRegistry::findBySpecialty(const std::string& specialty) const {
    std::vector<std::string> names;
    for (const auto& backend : listBackends()) {
        if (BackendCapabilityUtils::hasSpecialty(*backend, specialty)) {
            names.push_back(backend->name);
        }
    }
    return names;
}

void BackendRegistry::validate() const {
    auto backends = listBackends();

    std::unordered_map<std::string, const BackendDescriptor*> by_name;
    for (const auto& backend : backends) {
        by_name[backend->name] = backend.get();
    }

    for (const auto& backend : backends) {
        for (const auto& fallback : backend->fallback_chain) {
            if (fallback == backend->name) {
                throw ConfigurationError("Backend '" + backend->name + "' lists itself as a fallback");
            }
            if (by_name.count(fallback) == 0) {
                throw ConfigurationError("Backend '" + backend->name +
                                         "' has unknown fallback '" + fallback + "'");
            }
        }
    }

    // Depth-first search over fallback edges; a grey node reached again closes a cycle
    enum class Mark { WHITE, GREY, BLACK };
    std::unordered_map<std::string, Mark> marks;
    std::function<void(const std::string&, std::vector<std::string>&)> visit =
        [&](const std::string& name, std::vector<std::string>& path) {
            marks[name] = Mark::GREY;
            path.push_back(name);
            for (const auto& next : by_name.at(name)->fallback_chain) {
                if (marks[next] == Mark::GREY) {
                    std::ostringstream cycle;
                    for (const auto& step : path) {
                        cycle << step << " -> ";
                    }
                    cycle << next;
                    throw ConfigurationError("Fallback chains form a cycle: " + cycle.str());
                }
                if (marks[next] == Mark::WHITE) {
                    visit(next, path);
                }
            }
            path.pop_back();
            marks[name] = Mark::BLACK;
        };

    for (const auto& backend : backends) {
        if (marks[backend->name] == Mark::WHITE) {
            std::vector<std::string> path;
            visit(backend->name, path);
        }
    }
}

RegistryStatus BackendRegistry::getStatus() const {
    RegistryStatus status;
    for (const auto& backend : listBackends()) {
        status.total++;
        switch (backend->health) {
            case HealthStatus::ONLINE: status.online++; break;
            case HealthStatus::DEGRADED: status.degraded++; break;
            case HealthStatus::OFFLINE: status.offline++; break;
            case HealthStatus::UNKNOWN: status.unknown++; break;
        }
        if (backend->last_checked > status.last_update) {
            status.last_update = backend->last_checked;
        }
    }
    return status;
}

size_t BackendRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order.size();
}

bool BackendRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backends.count(name) > 0;
}

HealthStatus BackendRegistry::updateHealth(const std::string& name, HealthStatus status,
                                           size_t consecutive_failures,
                                           std::chrono::system_clock::time_point checked_at) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_backends.find(name);
    if (it == m_backends.end()) {
        return HealthStatus::UNKNOWN;
    }

    HealthStatus previous = it->second->health;
    auto updated = std::make_shared<BackendDescriptor>(*it->second);
    updated->health = status;
    updated->consecutive_failures = consecutive_failures;
    updated->last_checked = checked_at;
    it->second = std::move(updated);
    return previous;
}

void BackendRegistry::recordObservedLatency(const std::string& name, double avg_latency_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_backends.find(name);
    if (it == m_backends.end()) {
        return;
    }

    auto updated = std::make_shared<BackendDescriptor>(*it->second);
    updated->avg_latency_ms = avg_latency_ms;
    it->second = std::move(updated);
}

std::string BackendRegistry::getBackendInfo(const std::string& name) const {
    auto backend = getBackend(name);
    if (!backend) {
        return "Backend not found: " + name;
    }

    std::stringstream ss;
    ss << "Backend: " << backend->name << "\n";
    if (!backend->description.empty()) {
        ss << "  Description: " << backend->description << "\n";
    }
    ss << "  Endpoint: " << backend->endpoint << "\n";
    ss << "  Wire format: " << BackendCapabilityUtils::wireFormatToString(backend->wire_format) << "\n";
    ss << "  Service type: " << backend->service_type << "\n";
    ss << "  Health: " << BackendCapabilityUtils::healthStatusToString(backend->health);
    if (backend->consecutive_failures > 0) {
        ss << " (" << backend->consecutive_failures << " consecutive failures)";
    }
    ss << "\n";
    ss << "  Max complexity: " << BackendCapabilityUtils::complexityToString(backend->max_complexity) << "\n";
    ss << "  Specialties: ";
    for (size_t i = 0; i < backend->specialties.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << backend->specialties[i];
    }
    ss << "\n";
    ss << std::fixed << std::setprecision(4);
    ss << "  Cost per token: " << backend->cost_per_token << "\n";
    ss << std::setprecision(2);
    ss << "  Performance: " << backend->performance_score << "\n";
    ss << "  Avg latency: " << backend->avg_latency_ms << "ms\n";
    if (!backend->fallback_chain.empty()) {
        ss << "  Fallbacks: ";
        for (size_t i = 0; i < backend->fallback_chain.size(); ++i) {
            if (i > 0) ss << " -> ";
            ss << backend->fallback_chain[i];
        }
        ss << "\n";
    }

    return ss.str();
}

std::string BackendRegistry::getAllBackendsInfo() const {
    std::stringstream ss;

    auto status = getStatus();
    ss << "Backend Registry Status\n";
    ss << "=======================\n";
    ss << "Total: " << status.total << "\n";
    ss << "Online: " << status.online << "\n";
    ss << "Degraded: " << status.degraded << "\n";
    ss << "Offline: " << status.offline << "\n";
    ss << "Unknown: " << status.unknown << "\n";

    auto backends = listBackends();
    if (backends.empty()) {
        ss << "\nNo backends registered.\n";
    } else {
        for (const auto& backend : backends) {
            ss << "\n" << getBackendInfo(backend->name);
        }
    }

    return ss.str();
}

} // namespace Switchboard
