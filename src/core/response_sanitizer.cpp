#include "core/response_sanitizer.h"

#include <cctype>

#include "core/gateway_error.h"
#include "utils/json_utils.h"

namespace planproxy {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && isSpace(s[start])) ++start;
    while (end > start && isSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

// Drops "```" plus an optional language tag ("json", "JSON", ...) and the whitespace after it.
std::string stripLeadingFence(const std::string& text) {
    if (text.rfind("```", 0) != 0) return text;
    size_t pos = 3;
    while (pos < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_' || text[pos] == '-')) {
        ++pos;
    }
    while (pos < text.size() && isSpace(text[pos])) ++pos;
    return text.substr(pos);
}

std::string stripTrailingFence(const std::string& text) {
    if (text.size() < 3 || text.compare(text.size() - 3, 3, "```") != 0) return text;
    size_t end = text.size() - 3;
    while (end > 0 && isSpace(text[end - 1])) --end;
    return text.substr(0, end);
}

// "{  \n  \"a\": 1 \n }" -> "{\"a\": 1}", one layer only.
std::string normalizeBraceWhitespace(const std::string& text) {
    if (text.size() < 2 || text.front() != '{' || text.back() != '}') return text;
    size_t start = 1;
    size_t end = text.size() - 1;
    while (start < end && isSpace(text[start])) ++start;
    while (end > start && isSpace(text[end - 1])) --end;
    return "{" + text.substr(start, end - start) + "}";
}

}  // namespace

std::string ResponseSanitizer::clean(const std::string& raw_text) {
    std::string text = trimAscii(raw_text);
    text = stripLeadingFence(text);
    text = stripTrailingFence(text);
    text = trimAscii(text);
    return normalizeBraceWhitespace(text);
}

nlohmann::json ResponseSanitizer::sanitize(const std::string& raw_text, SanitizeMode mode) const {
    if (trimAscii(raw_text).empty()) {
        throw GatewayError(ErrorKind::kParse, "Empty response received from upstream");
    }

    std::string parse_error;
    if (auto parsed = parse_json(raw_text, &parse_error)) {
        return *parsed;
    }

    if (mode == SanitizeMode::kTolerant) {
        if (auto parsed = parse_json(clean(raw_text), &parse_error)) {
            return *parsed;
        }
    }

    throw GatewayError(ErrorKind::kParse,
                       "Failed to clean and parse upstream response: " + parse_error,
                       excerpt(raw_text, excerpt_limit_));
}

}  // namespace planproxy
