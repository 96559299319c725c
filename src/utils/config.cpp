#include "utils/config.h"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace planproxy {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable with fallback to deprecated name
/// Logs a warning if the deprecated name is used
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* old_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(old_name)) {
        spdlog::warn("Environment variable '{}' is deprecated, use '{}' instead", old_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::optional<long long> parsePositiveInteger(const std::string& value) {
    if (value.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || (end && *end != '\0') || parsed <= 0) {
        return std::nullopt;
    }
    return parsed;
}

// Timeouts above the limit are logged and ignored.
bool withinTimeoutLimit(long long value, long long limit, const char* source) {
    if (value > 0 && value <= limit) return true;
    spdlog::warn("Ignoring {}={}: timeout must not exceed {}", source, value, limit);
    return false;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (!home.empty()) return home / ".planproxy/config.json";
    return std::filesystem::path();
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Ignoring config file {}: not a JSON object", path.string());
        return false;
    }
    return true;
}

}  // namespace

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog() {
    GatewayConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    auto apply_json = [&](const nlohmann::json& j) {
        if (j.contains("port") && j["port"].is_number_integer()) {
            cfg.port = j["port"].get<int>();
        }
        if (j.contains("bind_address") && j["bind_address"].is_string()) {
            cfg.bind_address = j["bind_address"].get<std::string>();
        }
        if (j.contains("upstream_base_url") && j["upstream_base_url"].is_string()) {
            cfg.upstream_base_url = j["upstream_base_url"].get<std::string>();
        }
        if (j.contains("default_model") && j["default_model"].is_string()) {
            cfg.default_model = j["default_model"].get<std::string>();
        }
        if (j.contains("timeout_ms") && j["timeout_ms"].is_number_integer()) {
            auto ms = j["timeout_ms"].get<long long>();
            if (withinTimeoutLimit(ms, kMaxRequestTimeoutMs, "timeout_ms")) {
                cfg.request_timeout = std::chrono::milliseconds(ms);
            }
        }
        if (j.contains("log_excerpt_limit") && j["log_excerpt_limit"].is_number_unsigned()) {
            cfg.log_excerpt_limit = j["log_excerpt_limit"].get<size_t>();
        }
        if (j.contains("cors_enabled") && j["cors_enabled"].is_boolean()) {
            cfg.cors_enabled = j["cors_enabled"].get<bool>();
        }
        if (j.contains("cors_allow_origin") && j["cors_allow_origin"].is_string()) {
            cfg.cors_allow_origin = j["cors_allow_origin"].get<std::string>();
        }
    };

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("PLANPROXY_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            apply_json(j);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    // env overrides; PORT is the legacy name
    if (auto v = getEnvWithFallback("PLANPROXY_PORT", "PORT")) {
        if (auto port = parsePositiveInteger(*v); port && *port <= 65535) {
            cfg.port = static_cast<int>(*port);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("PLANPROXY_BIND_ADDRESS")) {
        cfg.bind_address = *v;
        log << "env:BIND_ADDRESS=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("PLANPROXY_UPSTREAM_URL")) {
        cfg.upstream_base_url = *v;
        log << "env:UPSTREAM_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("PLANPROXY_MODEL")) {
        cfg.default_model = *v;
        log << "env:MODEL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("PLANPROXY_TIMEOUT_MS")) {
        auto ms = parsePositiveInteger(*v);
        if (ms && withinTimeoutLimit(*ms, kMaxRequestTimeoutMs, "PLANPROXY_TIMEOUT_MS")) {
            cfg.request_timeout = std::chrono::milliseconds(*ms);
            log << "env:TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        }
    } else if (auto secs_env = getEnvValue("PLANPROXY_TIMEOUT_SECS")) {
        auto secs = parsePositiveInteger(*secs_env);
        if (secs && withinTimeoutLimit(*secs, kMaxRequestTimeoutMs / 1000, "PLANPROXY_TIMEOUT_SECS")) {
            cfg.request_timeout = std::chrono::seconds(*secs);
            log << "env:TIMEOUT_SECS=" << *secs << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("OPENAI_API_KEY")) {
        cfg.api_key = *v;
        log << "env:OPENAI_API_KEY=<set> ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

GatewayConfig loadGatewayConfig() {
    auto info = loadGatewayConfigWithLog();
    return info.first;
}

}  // namespace planproxy
