#pragma once

// agentreplay/config.hpp: Process configuration.
//
// Sources, lowest precedence first:
//   1. Built-in defaults below.
//   2. Environment (AGENTREPLAY_EVENT_LOG, AGENTREPLAY_ZSTD_LEVEL,
//      AGENTREPLAY_PREVIEW_CHARS).
//   3. Explicit set_global_config() calls (CLI flags, tests).

#include <cstddef>
#include <string>

namespace agentreplay {

struct Config {
  std::string event_log_path;      // NDJSON operation log; empty = disabled
  int zstd_level{3};               // 1..19, used for *.zst saves
  std::size_t preview_chars{120};  // viewer payload preview width
};

// Reads the environment on every call.
Config load_config();

// Cached process-wide config. First use calls load_config().
const Config& global_config();
void set_global_config(const Config& config);

std::string config_to_json(const Config& config);

}  // namespace agentreplay
