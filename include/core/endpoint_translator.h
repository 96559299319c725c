#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "core/endpoint_registry.h"
#include "core/response_sanitizer.h"

namespace planproxy {

inline constexpr double kPlanTemperature = 0.7;
inline constexpr int kDefaultPlanMaxTokens = 2000;

struct CanonicalRequest {
    std::string path;  // route below kRoutePrefix, e.g. "chat/completions"
    nlohmann::json body;
};

// Maps specialized plan endpoints onto one canonical chat-completion call and back.
// Endpoints without a TranslationRule pass through unchanged in both directions.
class EndpointTranslator {
public:
    EndpointTranslator(const EndpointRegistry& registry,
                       const ResponseSanitizer& sanitizer,
                       std::string model);

    CanonicalRequest forward(const std::string& logical_path, const nlohmann::json& body) const;

    // Throws GatewayError(kTranslation) when no choice is present or the
    // content is not an object, GatewayError(kParse) when content text is unparseable.
    nlohmann::json backward(const std::string& logical_path, const nlohmann::json& response) const;

private:
    const EndpointRegistry& registry_;
    const ResponseSanitizer& sanitizer_;
    std::string model_;
};

}  // namespace planproxy
