#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <unordered_map>
#include <vector>

#include "utils/config.h"

using namespace planproxy;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kConfigEnv = {
    "HOME", "PLANPROXY_CONFIG", "PLANPROXY_PORT", "PORT", "PLANPROXY_BIND_ADDRESS",
    "PLANPROXY_UPSTREAM_URL", "PLANPROXY_MODEL", "PLANPROXY_TIMEOUT_MS",
    "PLANPROXY_TIMEOUT_SECS", "OPENAI_API_KEY"};

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

// Clears every variable the loader reads and points HOME at an empty directory.
void clearConfigEnv(const fs::path& home) {
    for (const auto& k : kConfigEnv) unsetenv(k.c_str());
    setenv("HOME", home.string().c_str(), 1);
}

fs::path freshDir(const std::string& name) {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}  // namespace

TEST(UtilsConfigTest, DefaultsWhenNothingIsSet) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-defaults");
    clearConfigEnv(home);

    auto info = loadGatewayConfigWithLog();
    const auto& cfg = info.first;
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.upstream_base_url, "https://api.openai.com/v1");
    EXPECT_EQ(cfg.default_model, "gpt-3.5-turbo");
    EXPECT_EQ(cfg.request_timeout.count(), 120000);
    EXPECT_TRUE(cfg.api_key.empty());
    EXPECT_NE(info.second.find("sources=default"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, LoadsFromConfigFile) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-file");
    clearConfigEnv(home);

    fs::path tmp = home / "gateway.json";
    std::ofstream(tmp) << R"({
        "port": 18080,
        "upstream_base_url": "http://127.0.0.1:9999/v1",
        "default_model": "gpt-4o-mini",
        "timeout_ms": 5000,
        "cors_enabled": false
    })";
    setenv("PLANPROXY_CONFIG", tmp.string().c_str(), 1);

    auto info = loadGatewayConfigWithLog();
    const auto& cfg = info.first;
    EXPECT_EQ(cfg.port, 18080);
    EXPECT_EQ(cfg.upstream_base_url, "http://127.0.0.1:9999/v1");
    EXPECT_EQ(cfg.default_model, "gpt-4o-mini");
    EXPECT_EQ(cfg.request_timeout.count(), 5000);
    EXPECT_FALSE(cfg.cors_enabled);
    EXPECT_NE(info.second.find("file="), std::string::npos);
    EXPECT_NE(info.second.find("sources=file"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-env");
    clearConfigEnv(home);
    fs::create_directories(home / ".planproxy");
    std::ofstream(home / ".planproxy/config.json") << R"({"port": 18080, "timeout_ms": 5000})";

    setenv("PLANPROXY_PORT", "19000", 1);
    setenv("PLANPROXY_TIMEOUT_MS", "250", 1);
    setenv("PLANPROXY_MODEL", "gpt-4", 1);
    setenv("OPENAI_API_KEY", "sk-secret", 1);

    auto info = loadGatewayConfigWithLog();
    const auto& cfg = info.first;
    EXPECT_EQ(cfg.port, 19000);
    EXPECT_EQ(cfg.request_timeout.count(), 250);
    EXPECT_EQ(cfg.default_model, "gpt-4");
    EXPECT_EQ(cfg.api_key, "sk-secret");
    EXPECT_EQ(info.second.find("sk-secret"), std::string::npos);
    EXPECT_NE(info.second.find("sources=env,file"), std::string::npos);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, LegacyPortAndTimeoutSeconds) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-legacy");
    clearConfigEnv(home);

    setenv("PORT", "4000", 1);
    setenv("PLANPROXY_TIMEOUT_SECS", "30", 1);
    auto cfg = loadGatewayConfig();
    EXPECT_EQ(cfg.port, 4000);
    EXPECT_EQ(cfg.request_timeout.count(), 30000);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, InvalidNumbersAreIgnored) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-invalid");
    clearConfigEnv(home);

    setenv("PLANPROXY_PORT", "70000", 1);
    setenv("PLANPROXY_TIMEOUT_MS", "-5", 1);
    auto cfg = loadGatewayConfig();
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.request_timeout.count(), 120000);

    setenv("PLANPROXY_TIMEOUT_MS", "12abc", 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), 120000);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, TimeoutsAboveOneDayAreIgnored) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-huge-timeout");
    clearConfigEnv(home);

    fs::path file = home / "gateway.json";
    std::ofstream(file) << R"({"timeout_ms": 10000000000000})";
    setenv("PLANPROXY_CONFIG", file.string().c_str(), 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), 120000);

    setenv("PLANPROXY_TIMEOUT_MS", "86400001", 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), 120000);
    setenv("PLANPROXY_TIMEOUT_MS", "86400000", 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), kMaxRequestTimeoutMs);

    unsetenv("PLANPROXY_TIMEOUT_MS");
    setenv("PLANPROXY_TIMEOUT_SECS", "10000000000", 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), 120000);
    setenv("PLANPROXY_TIMEOUT_SECS", "86400", 1);
    EXPECT_EQ(loadGatewayConfig().request_timeout.count(), kMaxRequestTimeoutMs);

    fs::remove_all(home);
}

TEST(UtilsConfigTest, MalformedConfigFileIsIgnored) {
    EnvGuard guard(kConfigEnv);
    auto home = freshDir("planproxy-cfg-malformed");
    clearConfigEnv(home);

    fs::path tmp = home / "broken.json";
    std::ofstream(tmp) << "{ not json";
    setenv("PLANPROXY_CONFIG", tmp.string().c_str(), 1);

    auto info = loadGatewayConfigWithLog();
    EXPECT_EQ(info.first.port, 3000);
    EXPECT_NE(info.second.find("sources=default"), std::string::npos);

    fs::remove_all(home);
}
