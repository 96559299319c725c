#pragma once

#include <httplib.h>
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

#include "core/endpoint_registry.h"
#include "core/endpoint_translator.h"
#include "core/gateway_error.h"
#include "core/response_sanitizer.h"
#include "core/response_validator.h"
#include "core/timeout_coordinator.h"
#include "core/upstream_client.h"
#include "utils/config.h"

namespace planproxy {

struct RequestContext {
    std::string request_id;
    std::chrono::steady_clock::time_point start_time;
    std::string logical_path;  // route below kRoutePrefix, e.g. "workout-plan"
    std::string raw_body;
    std::string content_type;
};

struct GatewayReply {
    int status{200};
    nlohmann::json body;
};

enum class RequestStage {
    kReceived,
    kTranslating,
    kCallingUpstream,
    kSanitizing,
    kValidating,
    kTranslatingBack,
    kResponded,
    kError,
};

const char* to_string(RequestStage stage);

// {"error":{"message","type","code","details","requestId"}}
nlohmann::json make_error_body(ErrorKind kind, const std::string& message,
                               const std::string& details, const std::string& request_id);

// Serializes `body` as the JSON reply. Invalid UTF-8 (e.g. from a decoded path) is replaced, never thrown.
void set_json(httplib::Response& res, const nlohmann::json& body);

// Orchestrates one request through translation, the deadline-bounded upstream
// call, sanitizing, validation and back-translation. `upstream` must outlive
// `coordinator`, which may still run aborted calls after a reply was written.
class GatewayEndpoints {
public:
    GatewayEndpoints(const EndpointRegistry& registry,
                     UpstreamClient& upstream,
                     TimeoutCoordinator& coordinator,
                     const GatewayConfig& config);

    void registerRoutes(httplib::Server& server);

    // Runs the whole pipeline; always returns exactly one reply, never throws.
    GatewayReply handle(const RequestContext& ctx);

private:
    nlohmann::json parseInbound(const RequestContext& ctx, const EndpointSpec& spec) const;
    UpstreamResponse callUpstream(const RequestContext& ctx, const EndpointSpec& spec,
                                  const CanonicalRequest& canonical);
    GatewayReply upstreamFailure(const RequestContext& ctx, const EndpointSpec& spec,
                                 const UpstreamResponse& upstream) const;
    GatewayReply fail(const RequestContext& ctx, RequestStage stage, const GatewayError& error) const;

    const EndpointRegistry& registry_;
    UpstreamClient& upstream_;
    TimeoutCoordinator& coordinator_;
    size_t excerpt_limit_;
    ResponseSanitizer sanitizer_;
    ResponseValidator validator_;
    EndpointTranslator translator_;
};

}  // namespace planproxy
