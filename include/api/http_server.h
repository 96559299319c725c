#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

#include "utils/config.h"

namespace planproxy {

class GatewayEndpoints;
class HealthEndpoints;

// One line per finished exchange; called on the worker thread that served it.
using AccessLog = std::function<void(const httplib::Request&, const httplib::Response&)>;

// Listener for the gateway routes and /health. Every response leaves with a
// gateway-assigned X-Request-Id, CORS headers when enabled, and a JSON body
// for errors that never reached a route (unknown paths, escaped exceptions).
// JSON replies are gzip-compressed by cpp-httplib when the client accepts it.
class HttpServer {
public:
    HttpServer(const GatewayConfig& config, GatewayEndpoints& gateway, HealthEndpoints& health);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds synchronously; false when the address is unavailable.
    bool start();
    void stop();

    void setAccessLog(AccessLog log) { access_log_ = std::move(log); }

    bool isRunning() const { return running_; }

private:
    void installHandlers();
    void applyCors(httplib::Response& res) const;

    GatewayConfig config_;
    GatewayEndpoints& gateway_;
    HealthEndpoints& health_;
    AccessLog access_log_;
    httplib::Server server_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listener_done_{false};
};

}  // namespace planproxy
