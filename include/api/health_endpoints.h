#pragma once

#include <httplib.h>
#include <chrono>

namespace planproxy {

class HealthEndpoints {
public:
    explicit HealthEndpoints(std::chrono::milliseconds request_timeout);
    void registerRoutes(httplib::Server& server);

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::milliseconds request_timeout_;
};

}  // namespace planproxy
