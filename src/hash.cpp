#include "agentreplay/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "tape:" and "trace:" prefixes are part of the digest
//      contract. Changing them changes every fingerprint a user may have
//      recorded; bump version::FINGERPRINT_VERSION if that ever happens.
//
// to_hex() uses a lookup table (kHexChars) instead of snprintf("%02x").

#include <array>

extern "C" {
#include <blake3.h>
}

namespace agentreplay {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_backend_version() {
  const char* ver = blake3_version();
  return ver ? std::string(ver) : std::string("unknown");
}

}  // namespace agentreplay
