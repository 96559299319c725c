#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace planproxy::logger {

namespace {
    constexpr const char* LOG_FILE_BASE = "planproxy.jsonl";
    constexpr const char* DEFAULT_DATA_DIR = ".planproxy";
    constexpr const char* LOG_SUBDIR = "logs";
    constexpr int DEFAULT_RETENTION_DAYS = 7;

    constexpr const char* LOG_DIR_ENV = "PLANPROXY_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "PLANPROXY_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "PLANPROXY_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto time_t_value = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_value{};
        localtime_r(&time_t_value, &tm_value);
        std::ostringstream oss;
        oss << std::put_time(&tm_value, "%Y-%m-%d");
        return oss.str();
    }

    // %* : message payload escaped for embedding in a JSON string literal.
    class JsonEscapedPayload : public spdlog::custom_flag_formatter {
    public:
        void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
            const std::string raw(msg.payload.data(), msg.payload.size());
            const std::string quoted =
                nlohmann::json(raw).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            dest.append(quoted.data() + 1, quoted.data() + quoted.size() - 1);
        }

        std::unique_ptr<custom_flag_formatter> clone() const override {
            return spdlog::details::make_unique<JsonEscapedPayload>();
        }
    };

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        return "/tmp";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path() {
    std::string filename = std::string(LOG_FILE_BASE) + "." +
                           format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::exception&) {
            // fall through to the default
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    if (!fs::exists(log_dir)) {
        return;
    }

    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    std::string cutoff_str = format_date(cutoff);
    std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (const auto& entry : fs::directory_iterator(log_dir)) {
        if (!entry.is_regular_file()) continue;

        std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        std::string date_part = filename.substr(prefix.length());
        if (date_part < cutoff_str) {
            std::error_code ec;
            fs::remove(entry.path(), ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);

    if (!file_path.empty() && sinks.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("planproxy", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env() {
    std::string level = "info";
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        level = env;
    }

    std::string log_dir = get_log_dir();
    fs::create_directories(log_dir);
    cleanup_old_logs(log_dir, get_retention_days());

    std::string log_path = get_log_file_path();

    std::vector<spdlog::sink_ptr> sinks;

    // Stdout sink (human-readable format)
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(stdout_sink);

    // File sink (JSON lines)
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
    auto json_formatter = std::make_unique<spdlog::pattern_formatter>();
    json_formatter->add_flag<JsonEscapedPayload>('*').set_pattern(
        R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%*"})");
    file_sink->set_formatter(std::move(json_formatter));
    sinks.push_back(file_sink);

    // Preserve per-sink patterns (stdout human-readable, file JSON).
    init(level, "", "", sinks);

    spdlog::info("Gateway logs initialized: {}", log_path);
}

void event(spdlog::level::level_enum level,
           const std::string& request_id,
           const std::string& type,
           const std::string& message,
           const nlohmann::json& data) {
    if (!spdlog::should_log(level)) return;
    if (data.is_null()) {
        spdlog::log(level, "[{}] {} {}", request_id, type, message);
        return;
    }
    spdlog::log(level, "[{}] {} {} {}", request_id, type, message,
                data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}  // namespace planproxy::logger
