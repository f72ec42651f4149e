#include "agentreplay/export.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

#include "agentreplay/viewer.hpp"

namespace agentreplay {

namespace {

const char* event_color(EventType type) {
  switch (type) {
    case EventType::llm_request: return "#06b6d4";
    case EventType::llm_response: return "#22c55e";
    case EventType::tool_call: return "#eab308";
    case EventType::tool_result: return "#3b82f6";
    case EventType::decision: return "#a855f7";
    case EventType::state_change: return "#6b7280";
    case EventType::error: return "#ef4444";
    case EventType::log: return "#9ca3af";
  }
  return "#6b7280";
}

// Local wall-clock "HH:MM:SS.mmm".
std::string clock_time(double ts) {
  const std::time_t secs = static_cast<std::time_t>(ts);
  int millis = static_cast<int>((ts - static_cast<double>(secs)) * 1000.0);
  if (millis < 0) millis = 0;
  if (millis > 999) millis = 999;
  std::tm tm{};
  localtime_r(&secs, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
  return buf;
}

bool write_text(const std::string& path, const std::string& text, TraceError* error) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return fail(error, ErrorCode::io_error, "cannot open " + path);
  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!ofs) return fail(error, ErrorCode::io_error, "short write to " + path);
  return true;
}

constexpr const char* kHtmlStyle = R"(<style>
  * { margin: 0; padding: 0; box-sizing: border-box; }
  body { font-family: 'SF Mono', 'Fira Code', monospace; background: #0d1117; color: #c9d1d9; padding: 2rem; }
  h1 { color: #58a6ff; margin-bottom: 0.5rem; }
  .meta { color: #8b949e; margin-bottom: 2rem; font-size: 0.9rem; }
  .event { background: #161b22; border-radius: 6px; padding: 1rem; margin-bottom: 0.75rem; }
  .event-header { display: flex; gap: 1rem; align-items: center; margin-bottom: 0.5rem; }
  .event-type { font-weight: bold; font-size: 0.85rem; }
  .event-span { color: #e3b341; font-size: 0.8rem; }
  .event-time { color: #8b949e; font-size: 0.8rem; margin-left: auto; }
  .event-data { color: #8b949e; font-size: 0.8rem; white-space: pre-wrap; max-height: 200px; overflow-y: auto; }
</style>
)";

}  // namespace

std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
  return out;
}

bool export_json(const Trace& trace, const std::string& path, TraceError* error) {
  return write_text(path, jsonlite::to_json_pretty(trace.to_json(), 2) + "\n", error);
}

std::string render_html(const Trace& trace) {
  char duration[48];
  if (trace.duration()) {
    std::snprintf(duration, sizeof(duration), "%.3fs", *trace.duration());
  } else {
    std::snprintf(duration, sizeof(duration), "running");
  }

  std::ostringstream os;
  os << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
     << "<title>Agent Trace: " << html_escape(trace.name()) << "</title>\n"
     << kHtmlStyle << "</head>\n<body>\n"
     << "  <h1>" << html_escape(trace.name()) << "</h1>\n"
     << "  <div class=\"meta\">ID: " << html_escape(trace.trace_id())
     << " | Spans: " << trace.spans().size() << " | Events: " << trace.event_count()
     << " | Duration: " << duration << "</div>\n";

  for (const auto& span : trace.spans()) {
    for (const auto& e : span.events()) {
      const char* color = event_color(e.event_type);
      os << "  <div class=\"event\" style=\"border-left: 4px solid " << color << ";\">\n"
         << "    <div class=\"event-header\">\n"
         << "      <span class=\"event-type\" style=\"color: " << color << ";\">"
         << event_label(e.event_type) << "</span>\n"
         << "      <span class=\"event-span\">" << html_escape(span.name()) << "</span>\n"
         << "      <span class=\"event-time\">" << clock_time(e.timestamp) << "</span>\n"
         << "    </div>\n"
         << "    <pre class=\"event-data\">" << html_escape(jsonlite::to_json_pretty(e.data, 2))
         << "</pre>\n"
         << "  </div>\n";
    }
  }
  os << "</body>\n</html>\n";
  return os.str();
}

bool export_html(const Trace& trace, const std::string& path, TraceError* error) {
  return write_text(path, render_html(trace), error);
}

}  // namespace agentreplay
