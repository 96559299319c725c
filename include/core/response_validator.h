#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/endpoint_registry.h"
#include "core/response_sanitizer.h"

namespace planproxy {

struct ValidationResult {
    bool ok{true};
    std::string error;
    std::vector<std::string> absent_optional;
};

// Checks parsed upstream replies against the shape registered for an endpoint.
// Specialized endpoints are checked as chat completions first, then the first
// choice's content is checked against the endpoint's own field set.
class ResponseValidator {
public:
    ResponseValidator(const EndpointRegistry& registry, const ResponseSanitizer& sanitizer);

    // Throws GatewayError(kParse) when specialized content is unparseable text.
    ValidationResult validate(const nlohmann::json& value, const std::string& endpoint_key) const;

private:
    ValidationResult validateChatCompletion(const nlohmann::json& value) const;
    ValidationResult validateFields(const nlohmann::json& value, const EndpointSpec& spec) const;

    const EndpointRegistry& registry_;
    const ResponseSanitizer& sanitizer_;
};

}  // namespace planproxy
