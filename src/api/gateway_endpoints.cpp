#include "api/gateway_endpoints.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

#include "runtime/state.h"
#include "utils/json_utils.h"
#include "utils/logger.h"
#include "utils/request_id.h"

namespace planproxy {

using json = nlohmann::json;

namespace {

bool isJsonContentType(const std::string& content_type) {
    std::string lower = content_type;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.rfind("application/json", 0) == 0;
}

long long millisSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

const char* eventType(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kTimeout:
            return "TIMEOUT";
        case ErrorKind::kParse:
            return "JSON_PARSE_ERROR";
        case ErrorKind::kValidation:
            return "VALIDATION_ERROR";
        case ErrorKind::kTranslation:
            return "TRANSLATION_ERROR";
        case ErrorKind::kProxy:
            return "PROXY_ERROR";
        case ErrorKind::kInternal:
            return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

}  // namespace

const char* to_string(RequestStage stage) {
    switch (stage) {
        case RequestStage::kReceived:
            return "received";
        case RequestStage::kTranslating:
            return "translating";
        case RequestStage::kCallingUpstream:
            return "calling-upstream";
        case RequestStage::kSanitizing:
            return "sanitizing";
        case RequestStage::kValidating:
            return "validating";
        case RequestStage::kTranslatingBack:
            return "translating-back";
        case RequestStage::kResponded:
            return "responded";
        case RequestStage::kError:
            return "error";
    }
    return "error";
}

json make_error_body(ErrorKind kind, const std::string& message,
                     const std::string& details, const std::string& request_id) {
    return {{"error", {
        {"message", message},
        {"type", to_string(kind)},
        {"code", to_string(kind)},
        {"details", details},
        {"requestId", request_id},
    }}};
}

void set_json(httplib::Response& res, const json& body) {
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

GatewayEndpoints::GatewayEndpoints(const EndpointRegistry& registry,
                                   UpstreamClient& upstream,
                                   TimeoutCoordinator& coordinator,
                                   const GatewayConfig& config)
    : registry_(registry)
    , upstream_(upstream)
    , coordinator_(coordinator)
    , excerpt_limit_(config.log_excerpt_limit)
    , sanitizer_(config.log_excerpt_limit)
    , validator_(registry, sanitizer_)
    , translator_(registry, sanitizer_, config.default_model) {}

void GatewayEndpoints::registerRoutes(httplib::Server& server) {
    for (const auto& spec : registry_.endpoints()) {
        const std::string route = spec.route;
        server.Post(std::string(kRoutePrefix) + route,
                    [this, route](const httplib::Request& req, httplib::Response& res) {
            ActiveRequestGuard guard;
            RequestContext ctx;
            ctx.start_time = std::chrono::steady_clock::now();
            // Assigned by HttpServer's pre-routing handler.
            ctx.request_id = res.get_header_value("X-Request-Id");
            if (ctx.request_id.empty()) {
                ctx.request_id = generate_request_id();
                res.set_header("X-Request-Id", ctx.request_id);
            }
            ctx.logical_path = route;
            ctx.raw_body = req.body;
            ctx.content_type = req.get_header_value("Content-Type");

            auto reply = handle(ctx);
            res.status = reply.status;
            set_json(res, reply.body);
        });
    }
}

GatewayReply GatewayEndpoints::handle(const RequestContext& ctx) {
    RequestStage stage = RequestStage::kReceived;
    auto advance = [&](RequestStage next) {
        stage = next;
        spdlog::debug("[{}] stage={}", ctx.request_id, to_string(stage));
    };

    logger::event(spdlog::level::info, ctx.request_id, "REQUEST_START",
                  "Incoming request to " + std::string(kRoutePrefix) + ctx.logical_path,
                  {{"method", "POST"}, {"bodySize", ctx.raw_body.size()}});

    try {
        const EndpointSpec* spec = registry_.findByRoute(ctx.logical_path);
        if (!spec) {
            throw GatewayError(ErrorKind::kInternal, "Route not found", ctx.logical_path, 404);
        }
        json body = parseInbound(ctx, *spec);

        advance(RequestStage::kTranslating);
        CanonicalRequest canonical = translator_.forward(ctx.logical_path, body);

        advance(RequestStage::kCallingUpstream);
        UpstreamResponse upstream = callUpstream(ctx, *spec, canonical);
        if (upstream.status < 200 || upstream.status >= 300) {
            return upstreamFailure(ctx, *spec, upstream);
        }

        advance(RequestStage::kSanitizing);
        json envelope = sanitizer_.sanitize(upstream.body, SanitizeMode::kStrict);

        advance(RequestStage::kValidating);
        ValidationResult validation = validator_.validate(envelope, spec->key);
        if (!validation.ok) {
            throw GatewayError(ErrorKind::kValidation,
                               "Invalid response structure: " + validation.error,
                               excerpt(upstream.body, excerpt_limit_));
        }
        if (!validation.absent_optional.empty()) {
            spdlog::debug("[{}] optional fields absent: {}", ctx.request_id,
                          json(validation.absent_optional).dump());
        }

        advance(RequestStage::kTranslatingBack);
        json domain = translator_.backward(ctx.logical_path, envelope);

        const int status = spec->specialized ? 200 : upstream.status;
        advance(RequestStage::kResponded);
        logger::event(spdlog::level::info, ctx.request_id, "REQUEST_COMPLETE",
                      "Request completed",
                      {{"status", status}, {"duration", std::to_string(millisSince(ctx.start_time)) + "ms"}});
        return {status, std::move(domain)};
    } catch (const GatewayError& e) {
        return fail(ctx, stage, e);
    } catch (const std::exception& e) {
        return fail(ctx, stage,
                    GatewayError(ErrorKind::kInternal, "An unexpected error occurred", e.what()));
    }
}

json GatewayEndpoints::parseInbound(const RequestContext& ctx, const EndpointSpec& spec) const {
    if (!isJsonContentType(ctx.content_type)) {
        throw GatewayError(ErrorKind::kParse, "Content-Type must be application/json",
                           ctx.content_type.empty() ? "no Content-Type header" : "received " + ctx.content_type);
    }

    // Plan endpoints take only optional fields, so an empty body means "use defaults".
    const std::string raw = (spec.specialized && ctx.raw_body.empty()) ? std::string("{}") : ctx.raw_body;
    std::string parse_error;
    auto body = parse_json(raw, &parse_error);
    if (!body) {
        throw GatewayError(ErrorKind::kParse, "Invalid JSON in request body", parse_error);
    }
    if (!body->is_object()) {
        throw GatewayError(ErrorKind::kValidation, "Request body must be a JSON object", "", 400);
    }

    if (!spec.specialized) {
        if (!body->contains("messages") || !(*body)["messages"].is_array()) {
            throw GatewayError(ErrorKind::kValidation, "missing field 'messages'",
                               "'messages' must be an array of chat messages", 400);
        }
        return *body;
    }

    if (body->contains("prompt") && !(*body)["prompt"].is_null() && !(*body)["prompt"].is_string()) {
        throw GatewayError(ErrorKind::kValidation, "'prompt' must be a string", "", 400);
    }
    if (body->contains("max_tokens") && !(*body)["max_tokens"].is_null()) {
        const auto& max_tokens = (*body)["max_tokens"];
        if (!max_tokens.is_number_integer() || max_tokens.get<long long>() <= 0) {
            throw GatewayError(ErrorKind::kValidation, "'max_tokens' must be a positive integer", "", 400);
        }
    }
    return *body;
}

UpstreamResponse GatewayEndpoints::callUpstream(const RequestContext& ctx, const EndpointSpec& spec,
                                                const CanonicalRequest& canonical) {
    auto state = coordinator_.begin(ctx.request_id, ctx.start_time);

    UpstreamRequest request;
    request.path = canonical.path;
    request.body = spec.specialized ? canonical.body.dump() : ctx.raw_body;
    request.request_id = ctx.request_id;

    logger::event(spdlog::level::debug, ctx.request_id, "UPSTREAM_CALL", "Forwarding to upstream",
                  {{"path", canonical.path}, {"timeoutMs", state->remaining().count()}});

    // The task may outlive this request after a timeout; it only touches the client.
    UpstreamClient& client = upstream_;
    coordinator_.runUpstream(state, [&client, request](TimeoutState& s) {
        return client.send(request, s);
    });

    UpstreamOutcome outcome = coordinator_.await(state);
    if (!outcome.success) {
        throw GatewayError(outcome.error_kind, outcome.error_message, outcome.error_details);
    }
    return outcome.response;
}

GatewayReply GatewayEndpoints::upstreamFailure(const RequestContext& ctx, const EndpointSpec& spec,
                                               const UpstreamResponse& upstream) const {
    auto parsed = parse_json(upstream.body);
    logger::event(spdlog::level::warn, ctx.request_id, "UPSTREAM_ERROR", "Upstream returned an error status",
                  {{"status", upstream.status}, {"body", excerpt(upstream.body, excerpt_limit_)}});

    if (!spec.specialized && parsed && parsed->is_object()) {
        return {upstream.status, std::move(*parsed)};
    }

    std::string details = excerpt(upstream.body, excerpt_limit_);
    if (parsed && parsed->is_object() && parsed->contains("error") && (*parsed)["error"].is_object()) {
        details = excerpt(get_or<std::string>((*parsed)["error"], "message", details), excerpt_limit_);
    }
    return fail(ctx, RequestStage::kCallingUpstream,
                GatewayError(ErrorKind::kProxy,
                             "Upstream request failed with status " + std::to_string(upstream.status),
                             details, upstream.status));
}

GatewayReply GatewayEndpoints::fail(const RequestContext& ctx, RequestStage stage,
                                    const GatewayError& error) const {
    int status = error.status();
    // A parse failure after the upstream answered is the upstream's fault, not the caller's.
    if (error.kind() == ErrorKind::kParse && !error.hasStatus() && stage >= RequestStage::kSanitizing) {
        status = 500;
    }

    const auto level = error.kind() == ErrorKind::kTimeout ? spdlog::level::warn : spdlog::level::err;
    logger::event(level, ctx.request_id, eventType(error.kind()), error.what(),
                  {{"stage", to_string(stage)},
                   {"status", status},
                   {"path", std::string(kRoutePrefix) + ctx.logical_path},
                   {"details", excerpt(error.details(), excerpt_limit_)},
                   {"duration", std::to_string(millisSince(ctx.start_time)) + "ms"}});
    spdlog::debug("[{}] stage={}", ctx.request_id, to_string(RequestStage::kError));

    return {status, make_error_body(error.kind(), error.what(), error.details(), ctx.request_id)};
}

}  // namespace planproxy
