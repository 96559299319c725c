#include "api/health_endpoints.h"

#include <nlohmann/json.hpp>
#include "api/gateway_endpoints.h"
#include "runtime/state.h"

namespace planproxy {

HealthEndpoints::HealthEndpoints(std::chrono::milliseconds request_timeout)
    : start_time_(std::chrono::steady_clock::now()), request_timeout_(request_timeout) {}

void HealthEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        nlohmann::json body = {
            {"status", "ok"},
            {"uptime_seconds", uptime},
            {"active_requests", active_request_count()},
            {"total_requests", total_request_count()},
            {"timeout_ms", request_timeout_.count()}
        };
        set_json(res, body);
    });
}

}  // namespace planproxy
