#include "utils/request_id.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace planproxy {

std::string generate_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    // version 4, variant 10xx
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xffff) << '-'
        << std::setw(4) << (hi & 0xffff) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xffffffffffffULL);
    return oss.str();
}

}  // namespace planproxy
