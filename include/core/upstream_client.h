#pragma once

#include <chrono>
#include <string>

#include "core/timeout_coordinator.h"
#include "core/upstream_types.h"

namespace planproxy {

class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // Performs one call bounded by `state`'s deadline. Implementations must
    // return promptly once the state is cancelled. Throws GatewayError on failure.
    virtual UpstreamResponse send(const UpstreamRequest& request, TimeoutState& state) = 0;
};

struct UpstreamEndpoint {
    std::string scheme;
    std::string host;
    int port{0};
    std::string base_path;  // no trailing slash, e.g. "/v1"
    bool valid{false};
};

// Splits "https://api.openai.com/v1" into its parts; valid=false on malformed URLs.
UpstreamEndpoint parseUpstreamUrl(const std::string& url);

// Chat-completion upstream reached over HTTP(S) with bearer authorization.
class HttpUpstreamClient : public UpstreamClient {
public:
    HttpUpstreamClient(std::string base_url, std::string api_key);

    UpstreamResponse send(const UpstreamRequest& request, TimeoutState& state) override;

    const UpstreamEndpoint& endpoint() const { return endpoint_; }

private:
    std::string base_url_;
    std::string api_key_;
    UpstreamEndpoint endpoint_;
};

}  // namespace planproxy
