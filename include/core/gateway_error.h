#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace planproxy {

enum class ErrorKind : int {
    kParse = 1,
    kTimeout = 2,
    kProxy = 3,
    kTranslation = 4,
    kValidation = 5,
    kInternal = 6,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kParse:
            return "parse_error";
        case ErrorKind::kTimeout:
            return "timeout_error";
        case ErrorKind::kProxy:
            return "proxy_error";
        case ErrorKind::kTranslation:
            return "translation_error";
        case ErrorKind::kValidation:
            return "validation_error";
        case ErrorKind::kInternal:
            return "internal_error";
    }
    return "internal_error";
}

// Status used when the failure originates locally and no explicit status was set.
inline int default_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kParse:
            return 400;
        case ErrorKind::kTimeout:
            return 504;
        default:
            return 500;
    }
}

// Failure raised by any pipeline stage; converted to the JSON error body by the gateway.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message, std::string details = {},
                 std::optional<int> status = std::nullopt)
        : std::runtime_error(message)
        , kind_(kind)
        , details_(std::move(details))
        , status_(status) {}

    ErrorKind kind() const { return kind_; }
    const std::string& details() const { return details_; }
    int status() const { return status_.value_or(default_status(kind_)); }
    bool hasStatus() const { return status_.has_value(); }

private:
    ErrorKind kind_;
    std::string details_;
    std::optional<int> status_;
};

}  // namespace planproxy
