#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace planproxy {

// Upper bound for request_timeout; larger settings are ignored with a warning.
inline constexpr long long kMaxRequestTimeoutMs = 24LL * 60 * 60 * 1000;

struct GatewayConfig {
    int port{3000};
    std::string bind_address{"0.0.0.0"};
    std::string upstream_base_url{"https://api.openai.com/v1"};
    std::string api_key;                       // OPENAI_API_KEY, never logged
    std::string default_model{"gpt-3.5-turbo"};
    std::chrono::milliseconds request_timeout{120000};
    size_t log_excerpt_limit{1000};            // cap for upstream text in logs and error details
    bool cors_enabled{true};
    std::string cors_allow_origin{"*"};
    std::string cors_allow_methods{"GET, POST, OPTIONS"};
    std::string cors_allow_headers{"Content-Type, Authorization, X-Request-Id"};
};

GatewayConfig loadGatewayConfig();
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog();

}  // namespace planproxy
