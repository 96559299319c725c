#include "api/http_server.h"

#include <chrono>
#include <spdlog/spdlog.h>

#include "api/gateway_endpoints.h"
#include "api/health_endpoints.h"
#include "utils/request_id.h"

namespace planproxy {

HttpServer::HttpServer(const GatewayConfig& config, GatewayEndpoints& gateway, HealthEndpoints& health)
    : config_(config), gateway_(gateway), health_(health) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::applyCors(httplib::Response& res) const {
    if (!config_.cors_enabled) return;
    res.set_header("Access-Control-Allow-Origin", config_.cors_allow_origin);
    res.set_header("Access-Control-Allow-Methods", config_.cors_allow_methods);
    res.set_header("Access-Control-Allow-Headers", config_.cors_allow_headers);
}

void HttpServer::installHandlers() {
    // Runs before routing, so headers set here survive into 404 and exception replies.
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        res.set_header("X-Request-Id", generate_request_id());
        applyCors(res);
        if (config_.cors_enabled && req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Bare error statuses; replies that already carry a body are left alone.
    // req.path is percent-decoded and may hold any bytes.
    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        const auto message = res.status == 404 ? "Route not found" : "Request failed";
        set_json(res, make_error_body(ErrorKind::kInternal, message, req.method + " " + req.path,
                                      res.get_header_value("X-Request-Id")));
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        const auto request_id = res.get_header_value("X-Request-Id");
        spdlog::error("[{}] unhandled exception on {}: {}", request_id, req.path, what);
        res.status = 500;
        set_json(res, make_error_body(ErrorKind::kInternal, "An unexpected error occurred", what, request_id));
    });

    if (access_log_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            access_log_(req, res);
        });
    }

    gateway_.registerRoutes(server_);
    health_.registerRoutes(server_);
}

bool HttpServer::start() {
    if (running_) return true;

    installHandlers();
    if (!server_.bind_to_port(config_.bind_address, config_.port)) {
        spdlog::error("Failed to bind {}:{}", config_.bind_address, config_.port);
        return false;
    }

    listener_done_ = false;
    listener_ = std::thread([this]() {
        server_.listen_after_bind();
        listener_done_ = true;
    });
    // stop() is only effective once the accept loop is up.
    while (!server_.is_running() && !listener_done_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    running_ = true;
    return true;
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (listener_.joinable()) listener_.join();
    running_ = false;
}

}  // namespace planproxy
