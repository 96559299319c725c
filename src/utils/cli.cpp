#include "utils/cli.h"
#include "utils/config.h"
#include "utils/version.h"
#include <cstdint>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace planproxy {

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "planproxy " << PLANPROXY_VERSION << " - plan generation gateway for chat-completion APIs\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    planproxy [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>           Server port (default: 3000, or PLANPROXY_PORT)\n";
    oss << "    --host <HOST>           Bind address (default: 0.0.0.0)\n";
    oss << "    --upstream-url <URL>    Chat-completion API base URL (default: https://api.openai.com/v1)\n";
    oss << "    --timeout-ms <MS>       Per-request deadline in milliseconds (default: 120000)\n";
    oss << "    --model <NAME>          Model used for plan endpoints (default: gpt-3.5-turbo)\n";
    oss << "    -h, --help              Print help information\n";
    oss << "    -V, --version           Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    OPENAI_API_KEY                 Bearer token sent upstream\n";
    oss << "    PLANPROXY_CONFIG               Config file path (default: ~/.planproxy/config.json)\n";
    oss << "    PLANPROXY_PORT                 HTTP server port\n";
    oss << "    PLANPROXY_BIND_ADDRESS         Bind address\n";
    oss << "    PLANPROXY_UPSTREAM_URL         Upstream base URL\n";
    oss << "    PLANPROXY_MODEL                Model for plan endpoints\n";
    oss << "    PLANPROXY_TIMEOUT_MS           Per-request deadline in milliseconds\n";
    oss << "    PLANPROXY_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    PLANPROXY_LOG_DIR              Log directory (default: ~/.planproxy/logs)\n";
    oss << "    PLANPROXY_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "planproxy " << PLANPROXY_VERSION << "\n";
    return oss.str();
}

namespace {

CliResult fail(const std::string& message) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + getHelpMessage();
    return result;
}

long long parseNumber(const char* flag, const char* text, long long min, long long max) {
    size_t pos = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + text);
    }
    if (pos != std::strlen(text) || value < min || value > max) {
        throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + text);
    }
    return value;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getHelpMessage();
            return result;
        }
        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVersionMessage();
            return result;
        }

        const bool takes_value = std::strcmp(arg, "--port") == 0 || std::strcmp(arg, "--host") == 0 ||
                                 std::strcmp(arg, "--upstream-url") == 0 ||
                                 std::strcmp(arg, "--timeout-ms") == 0 || std::strcmp(arg, "--model") == 0;
        if (!takes_value) {
            result.should_exit = true;
            result.exit_code = 1;
            result.output = "Unknown option: " + std::string(arg) + "\n\n" + getHelpMessage();
            return result;
        }
        if (i + 1 >= argc) {
            return fail(std::string(arg) + " requires a value");
        }
        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--port") == 0) {
                result.serve_options.port = static_cast<uint16_t>(parseNumber(arg, value, 1, 65535));
            } else if (std::strcmp(arg, "--host") == 0) {
                result.serve_options.host = value;
            } else if (std::strcmp(arg, "--upstream-url") == 0) {
                result.serve_options.upstream_url = value;
            } else if (std::strcmp(arg, "--timeout-ms") == 0) {
                result.serve_options.timeout_ms =
                    parseNumber(arg, value, 1, kMaxRequestTimeoutMs);
            } else {
                result.serve_options.model = value;
            }
        } catch (const std::invalid_argument& e) {
            return fail(e.what());
        }
    }
    return result;
}

}  // namespace planproxy
