#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>

#include "api/gateway_endpoints.h"
#include "api/health_endpoints.h"
#include "api/http_server.h"
#include "core/endpoint_registry.h"
#include "core/timeout_coordinator.h"
#include "core/upstream_client.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/request_id.h"
#include "utils/version.h"

int run_gateway(const planproxy::GatewayConfig& cfg, const std::string& config_sources, bool single_iteration) {
    planproxy::g_running_flag.store(true);

    try {
        planproxy::logger::init_from_env();
        spdlog::info("Config loaded: {}", config_sources);

        if (cfg.api_key.empty()) {
            spdlog::warn("OPENAI_API_KEY is not set; upstream calls will be unauthenticated");
        }

        const auto registry = planproxy::EndpointRegistry::builtin();

        // Declaration order matters: the coordinator joins aborted upstream
        // calls on destruction, so the client must be destroyed after it.
        planproxy::HttpUpstreamClient upstream(cfg.upstream_base_url, cfg.api_key);
        planproxy::TimeoutCoordinator coordinator(cfg.request_timeout);
        planproxy::GatewayEndpoints gateway(registry, upstream, coordinator, cfg);
        planproxy::HealthEndpoints health(coordinator.timeout());

        planproxy::HttpServer server(cfg, gateway, health);
        server.setAccessLog([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::info("[{}] {} {} -> {}", res.get_header_value("X-Request-Id"), req.method, req.path,
                         res.status);
        });

        std::cout << "Starting HTTP server on " << cfg.bind_address << ":" << cfg.port << "..." << std::endl;
        if (!server.start()) {
            std::cerr << "Error: failed to listen on " << cfg.bind_address << ":" << cfg.port << std::endl;
            return 1;
        }

        nlohmann::json endpoints = nlohmann::json::array();
        for (const auto& spec : registry.endpoints()) {
            endpoints.push_back(std::string(planproxy::kRoutePrefix) + spec.route);
        }
        planproxy::logger::event(spdlog::level::info, planproxy::generate_request_id(), "STARTUP",
                                 "Server started",
                                 {{"port", cfg.port},
                                  {"upstream", cfg.upstream_base_url},
                                  {"model", cfg.default_model},
                                  {"timeoutMs", coordinator.timeout().count()},
                                  {"endpoints", endpoints}});

        if (single_iteration) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            planproxy::request_shutdown();
        }
        while (planproxy::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Gateway shutdown complete" << std::endl;
    return 0;
}

void signalHandler(int) {
    planproxy::request_shutdown();
}

void applyServeOptions(const planproxy::ServeOptions& options, planproxy::GatewayConfig& cfg) {
    if (options.port) cfg.port = *options.port;
    if (options.host) cfg.bind_address = *options.host;
    if (options.upstream_url) cfg.upstream_base_url = *options.upstream_url;
    if (options.timeout_ms) cfg.request_timeout = std::chrono::milliseconds(*options.timeout_ms);
    if (options.model) cfg.default_model = *options.model;
}

#ifndef PLANPROXY_TESTING
int main(int argc, char* argv[]) {
    auto cli_result = planproxy::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::cout << "planproxy v" << PLANPROXY_VERSION << " starting..." << std::endl;
    auto [cfg, sources] = planproxy::loadGatewayConfigWithLog();
    applyServeOptions(cli_result.serve_options, cfg);
    if (cli_result.serve_options.port || cli_result.serve_options.host ||
        cli_result.serve_options.upstream_url || cli_result.serve_options.timeout_ms ||
        cli_result.serve_options.model) {
        sources += ",cli";
    }
    return run_gateway(cfg, sources, /*single_iteration=*/false);
}
#endif

#ifdef PLANPROXY_TESTING
extern "C" int planproxy_run_for_test() {
    auto [cfg, sources] = planproxy::loadGatewayConfigWithLog();
    return run_gateway(cfg, sources, /*single_iteration=*/true);
}
#endif
