// request_id.h - request-id generator (UUID v4 text)
#pragma once

#include <string>

namespace planproxy {

// Generate a random RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9a4d-4e7b-8c2a-1d5e6f7a8b9c".
std::string generate_request_id();

}  // namespace planproxy
