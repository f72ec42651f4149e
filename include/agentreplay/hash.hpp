#pragma once

#include <string>
#include <string_view>

namespace agentreplay {

// BLAKE3-256, hex-encoded to 64 lowercase characters.
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing. The prefix keeps digests of different kinds of
// content ("tape:", "trace:") from colliding.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Version string reported by the linked BLAKE3 library.
std::string hash_backend_version();

}  // namespace agentreplay
