#pragma once

#include <atomic>
#include <cstdint>

namespace planproxy {

extern std::atomic<bool> g_running_flag;
extern std::atomic<unsigned int> g_active_requests;
extern std::atomic<uint64_t> g_total_requests;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

inline unsigned int active_request_count() { return g_active_requests.load(); }
inline uint64_t total_request_count() { return g_total_requests.load(); }

// Counts a request as active for its lifetime. There is no admission limit.
class ActiveRequestGuard {
public:
    ActiveRequestGuard() {
        g_active_requests.fetch_add(1);
        g_total_requests.fetch_add(1);
    }
    ~ActiveRequestGuard() { g_active_requests.fetch_sub(1); }

    ActiveRequestGuard(const ActiveRequestGuard&) = delete;
    ActiveRequestGuard& operator=(const ActiveRequestGuard&) = delete;
};

}  // namespace planproxy
