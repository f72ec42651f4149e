#pragma once

// agentreplay/version.hpp: Version manifest for every persisted surface.
//
// INVARIANT:
//   The trace file layout (header line + one line per span) is a durable
//   contract shared with traces written by other tools. Loading is tolerant
//   (unknown fields and record types are ignored), so additive changes do not
//   bump TRACE_FORMAT_VERSION. Renaming or re-nesting a field does.

#include <cstdint>
#include <string>

namespace agentreplay {
namespace version {

// ---------------------------------------------------------------------------
// TRACE_FORMAT_VERSION
// Version 1 = NDJSON: {"type":"trace_header",...} then {"type":"span",...}.
// ---------------------------------------------------------------------------
constexpr uint32_t TRACE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// DIFF_REPORT_VERSION
// Tracks the JSON shape produced by DiffResult::to_json().
// ---------------------------------------------------------------------------
constexpr uint32_t DIFF_REPORT_VERSION = 1;

// ---------------------------------------------------------------------------
// FINGERPRINT_VERSION
// Tracks the byte layout hashed by Replayer::fingerprint() and trace_digest().
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_VERSION = 1;

constexpr const char* SEMVER = "0.1.0";

struct VersionManifest {
  uint32_t trace_format{TRACE_FORMAT_VERSION};
  uint32_t diff_report{DIFF_REPORT_VERSION};
  uint32_t fingerprint{FINGERPRINT_VERSION};
  std::string semver;
  std::string hash_primitive;   // "blake3"
  std::string hash_backend;     // BLAKE3 library version
  bool zstd_enabled{false};
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace agentreplay
