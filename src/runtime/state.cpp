#include "runtime/state.h"

namespace planproxy {

std::atomic<bool> g_running_flag{true};
std::atomic<unsigned int> g_active_requests{0};
std::atomic<uint64_t> g_total_requests{0};

}  // namespace planproxy
