// =================================================================
// src/Switchboard/HealthProbe.cpp
// =================================================================
// HTTP liveness probe built on cpp-httplib.

#include "Switchboard/HealthProbe.hpp"
#include "httplib.h"

namespace Switchboard {

ProbeResult HttpHealthProbe::probe(const BackendDescriptor& backend, std::chrono::milliseconds timeout) {
    ProbeResult result;
    auto start_time = std::chrono::steady_clock::now();

    auto seconds = static_cast<time_t>(timeout.count() / 1000);
    auto micros = static_cast<time_t>((timeout.count() % 1000) * 1000);

    try {
        httplib::Client client(backend.endpoint);
        client.set_connection_timeout(seconds, micros);
        client.set_read_timeout(seconds, micros);

        for (const auto& path : backend.health_endpoints) {
            result.endpoint = path;
            auto res = client.Get(path.c_str());

            if (!res) {
                result.status_code = 0;
                result.error = "GET " + path + " failed: " + httplib::to_string(res.error());
                continue;
            }

            result.status_code = res->status;
            if (res->status == 200) {
                result.healthy = true;
                result.error.clear();
                break;
            }
            result.error = "GET " + path + " returned HTTP " + std::to_string(res->status);
        }
    } catch (const std::exception& e) {
        result.healthy = false;
        result.error = std::string("Probe error: ") + e.what();
    }

    if (backend.health_endpoints.empty()) {
        result.error = "No health endpoints configured";
    }

    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return result;
}

} // namespace Switchboard
