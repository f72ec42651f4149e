#include "agentreplay/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "agentreplay/jsonlite.hpp"

namespace agentreplay {

namespace {

Config   g_config;
std::mutex g_config_mu;
bool     g_config_loaded{false};

long env_long(const char* name, long def) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return def;
  char* end = nullptr;
  const long v = std::strtol(e, &end, 10);
  return (end && *end == '\0') ? v : def;
}

}  // namespace

Config load_config() {
  Config c;
  if (const char* e = std::getenv("AGENTREPLAY_EVENT_LOG"); e && e[0]) {
    c.event_log_path = e;
  }
  c.zstd_level = static_cast<int>(std::clamp(env_long("AGENTREPLAY_ZSTD_LEVEL", c.zstd_level), 1L, 19L));
  const long preview = env_long("AGENTREPLAY_PREVIEW_CHARS", static_cast<long>(c.preview_chars));
  if (preview > 0) c.preview_chars = static_cast<std::size_t>(preview);
  return c;
}

const Config& global_config() {
  std::lock_guard<std::mutex> lk(g_config_mu);
  if (!g_config_loaded) {
    g_config = load_config();
    g_config_loaded = true;
  }
  return g_config;
}

void set_global_config(const Config& config) {
  std::lock_guard<std::mutex> lk(g_config_mu);
  g_config = config;
  g_config_loaded = true;
}

std::string config_to_json(const Config& config) {
  std::ostringstream o;
  o << "{"
    << "\"event_log_path\":\"" << jsonlite::escape(config.event_log_path) << "\""
    << ",\"zstd_level\":" << config.zstd_level
    << ",\"preview_chars\":" << config.preview_chars
    << "}";
  return o.str();
}

}  // namespace agentreplay
