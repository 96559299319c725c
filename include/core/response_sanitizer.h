#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace planproxy {

enum class SanitizeMode {
    kStrict,    // direct parse only (chat-completion envelopes)
    kTolerant,  // also strips code fences and surrounding whitespace (message content)
};

// Recovers a JSON value from upstream text that may be wrapped in markdown code
// fences or padded with whitespace. Failures raise GatewayError(kParse) whose
// details carry at most `excerpt_limit` characters of the original text.
class ResponseSanitizer {
public:
    explicit ResponseSanitizer(size_t excerpt_limit = 1000) : excerpt_limit_(excerpt_limit) {}

    nlohmann::json sanitize(const std::string& raw_text,
                            SanitizeMode mode = SanitizeMode::kTolerant) const;

    // Text after fence stripping and brace-whitespace normalization; exposed for diagnostics.
    static std::string clean(const std::string& raw_text);

    size_t excerptLimit() const { return excerpt_limit_; }

private:
    size_t excerpt_limit_;
};

}  // namespace planproxy
