#include "agentreplay/version.hpp"

#include <sstream>

#include "agentreplay/hash.hpp"

namespace agentreplay {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver         = SEMVER;
  m.hash_primitive = "blake3";
  m.hash_backend   = hash_backend_version();
#if defined(AGENTREPLAY_WITH_ZSTD)
  m.zstd_enabled   = true;
#endif
  // Build timestamp from preprocessor macros; stable within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"trace_format\":" << m.trace_format
    << ",\"diff_report\":" << m.diff_report
    << ",\"fingerprint\":" << m.fingerprint
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"hash_backend\":\"" << m.hash_backend << "\""
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace agentreplay
