#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace planproxy {

/// Command line overrides. Unset fields fall back to configuration.
struct ServeOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> host;
    std::optional<std::string> upstream_url;
    std::optional<long long> timeout_ms;
    std::optional<std::string> model;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    ServeOptions serve_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Get the help message for the CLI
std::string getHelpMessage();

/// Get the version message for the CLI
std::string getVersionMessage();

}  // namespace planproxy
