#pragma once

#include <string>

#include "core/gateway_error.h"

namespace planproxy {

struct UpstreamRequest {
    std::string path;        // e.g. "chat/completions", appended to the upstream base URL
    std::string body;        // serialized JSON
    std::string request_id;  // forwarded as X-Request-Id
};

struct UpstreamResponse {
    int status{0};
    std::string body;
};

// Terminal result of one upstream exchange as delivered by the TimeoutCoordinator.
struct UpstreamOutcome {
    bool success{false};
    UpstreamResponse response;
    ErrorKind error_kind{ErrorKind::kInternal};
    std::string error_message;
    std::string error_details;
};

}  // namespace planproxy
