// =================================================================
// src/Switchboard/BackendCapabilities.cpp
// =================================================================
// Implementation of backend enumeration utilities.

#include "Switchboard/BackendCapabilities.hpp"
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace Switchboard {

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string BackendCapabilityUtils::complexityToString(ComplexityLevel level) {
    switch (level) {
        case ComplexityLevel::SIMPLE:
            return "simple";
        case ComplexityLevel::MODERATE:
            return "moderate";
        case ComplexityLevel::COMPLEX:
            return "complex";
        case ComplexityLevel::EXPERT:
            return "expert";
        default:
            throw std::invalid_argument("Unknown ComplexityLevel value");
    }
}

ComplexityLevel BackendCapabilityUtils::stringToComplexity(const std::string& str) {
    static const std::unordered_map<std::string, ComplexityLevel> complexity_map = {
        {"simple", ComplexityLevel::SIMPLE},
        {"moderate", ComplexityLevel::MODERATE},
        {"complex", ComplexityLevel::COMPLEX},
        {"expert", ComplexityLevel::EXPERT}
    };

    auto it = complexity_map.find(toLower(str));
    if (it != complexity_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown complexity level: " + str);
}

std::string BackendCapabilityUtils::wireFormatToString(WireFormat format) {
    switch (format) {
        case WireFormat::OPENAI_COMPATIBLE:
            return "openai-compatible";
        case WireFormat::REST:
            return "rest";
        case WireFormat::CUSTOM:
            return "custom";
        default:
            throw std::invalid_argument("Unknown WireFormat value");
    }
}

WireFormat BackendCapabilityUtils::stringToWireFormat(const std::string& str) {
    static const std::unordered_map<std::string, WireFormat> format_map = {
        {"openai-compatible", WireFormat::OPENAI_COMPATIBLE},
        {"openai_compatible", WireFormat::OPENAI_COMPATIBLE},
        {"openai", WireFormat::OPENAI_COMPATIBLE},
        {"rest", WireFormat::REST},
        {"custom", WireFormat::CUSTOM}
    };

    auto it = format_map.find(toLower(str));
    if (it != format_map.end()) {
        return it->second;
    }

    throw std::invalid_argument("Unknown wire format: " + str);
}

std::string BackendCapabilityUtils::healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::ONLINE: return "online";
        case HealthStatus::OFFLINE: return "offline";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

std::vector<ComplexityLevel> BackendCapabilityUtils::getAllComplexityLevels() {
    return {
        ComplexityLevel::SIMPLE,
        ComplexityLevel::MODERATE,
        ComplexityLevel::COMPLEX,
        ComplexityLevel::EXPERT
    };
}

bool BackendCapabilityUtils::meetsComplexity(ComplexityLevel ceiling, ComplexityLevel required) {
    return static_cast<int>(ceiling) >= static_cast<int>(required);
}

bool BackendCapabilityUtils::hasSpecialty(const BackendDescriptor& backend, const std::string& specialty) {
    std::string wanted = toLower(specialty);
    return std::any_of(backend.specialties.begin(), backend.specialties.end(),
                       [&wanted](const std::string& s) { return toLower(s) == wanted; });
}

} // namespace Switchboard
