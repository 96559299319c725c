// logger.h - lightweight logging wrapper around spdlog
#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace planproxy::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Get the log directory path (~/.planproxy/logs by default).
std::string get_log_dir();

// Get today's log file path (planproxy.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// Get retention days from environment (default: 7).
int get_retention_days();

// Cleanup old log files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// PLANPROXY_LOG_DIR (log directory, default: ~/.planproxy/logs)
// PLANPROXY_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// PLANPROXY_LOG_RETENTION_DAYS (retention days, default: 7)
void init_from_env();

// Structured entry keyed by request id, e.g.
//   [3f2b...] REQUEST_START Incoming request to /openai/v1/meal-plan {"bodySize":42}
// `data` is appended as compact JSON when it is not null.
void event(spdlog::level::level_enum level,
           const std::string& request_id,
           const std::string& type,
           const std::string& message,
           const nlohmann::json& data = nullptr);

}  // namespace planproxy::logger
