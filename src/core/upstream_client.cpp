#include "core/upstream_client.h"

#include <algorithm>
#include <cctype>
#include <httplib.h>
#include <memory>
#include <regex>
#include <spdlog/spdlog.h>

namespace planproxy {

namespace {

std::shared_ptr<httplib::Client> makeClient(const UpstreamEndpoint& url, std::chrono::milliseconds timeout) {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    // Build scheme://host:port format for Client's universal interface
    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_shared<httplib::Client>(scheme_host_port);
    if (!client->is_valid()) {
        return nullptr;
    }
    if (timeout.count() < 1) {
        timeout = std::chrono::milliseconds(1);
    }
    const auto sec = static_cast<time_t>(timeout.count() / 1000);
    const auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_keep_alive(false);
    return client;
}

}  // namespace

UpstreamEndpoint parseUpstreamUrl(const std::string& url) {
    static const std::regex re(R"(^(https?)://([^/:]+)(?::(\d{1,5}))?(/.*)?$)", std::regex::icase);
    std::smatch match;
    UpstreamEndpoint parsed;
    if (!std::regex_match(url, match, re)) {
        return parsed;
    }
    parsed.scheme = match[1].str();
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parsed.host = match[2].str();
    parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
    parsed.base_path = match[4].matched ? match[4].str() : "";
    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    parsed.valid = parsed.port > 0 && parsed.port <= 65535;
    return parsed;
}

HttpUpstreamClient::HttpUpstreamClient(std::string base_url, std::string api_key)
    : base_url_(std::move(base_url))
    , api_key_(std::move(api_key))
    , endpoint_(parseUpstreamUrl(base_url_)) {
    if (!endpoint_.valid) {
        spdlog::warn("Upstream base URL is invalid: {}", base_url_);
    }
}

UpstreamResponse HttpUpstreamClient::send(const UpstreamRequest& request, TimeoutState& state) {
    if (!endpoint_.valid) {
        throw GatewayError(ErrorKind::kProxy, "Upstream base URL is invalid", base_url_);
    }
    auto client = makeClient(endpoint_, state.remaining());
    if (!client) {
        throw GatewayError(ErrorKind::kProxy, "Failed to create upstream client",
                           "scheme " + endpoint_.scheme + " is not supported by this build");
    }

    // The deadline timer aborts the blocking call by shutting the socket down.
    state.onCancel([client]() { client->stop(); });
    if (state.cancelled()) {
        throw GatewayError(ErrorKind::kTimeout, "Upstream call cancelled before it started");
    }

    httplib::Headers headers = {{"X-Request-Id", request.request_id}};
    if (!api_key_.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key_);
    }

    std::string path = request.path;
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    auto res = client->Post(endpoint_.base_path + path, headers, request.body, "application/json");

    if (state.cancelled()) {
        throw GatewayError(ErrorKind::kTimeout, "Upstream call cancelled by deadline");
    }
    if (!res) {
        const auto error = res.error();
        const auto kind = error == httplib::Error::Read || error == httplib::Error::Write
                              ? (state.remaining().count() == 0 ? ErrorKind::kTimeout : ErrorKind::kProxy)
                              : ErrorKind::kProxy;
        throw GatewayError(kind, "Failed to reach upstream", httplib::to_string(error));
    }
    return {res->status, res->body};
}

}  // namespace planproxy
