#include "agentreplay/viewer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

#include "agentreplay/config.hpp"

namespace agentreplay {

namespace {

// Cuts at a byte budget, backing up so a multi-byte UTF-8 sequence is never
// split.
std::string truncate(const std::string& s, std::size_t max_chars) {
  if (s.size() <= max_chars) return s;
  std::size_t cut = max_chars;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return s.substr(0, cut) + "...";
}

std::string fixed3(double v) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.3f", v);
  return buf;
}

// String fields print bare; anything else as compact JSON.
std::string field_text(const jsonlite::Object& data, const std::string& key) {
  const jsonlite::Value* v = jsonlite::find(data, key);
  if (!v) return "";
  if (v->is_string()) return std::get<std::string>(v->v);
  return jsonlite::to_json(*v);
}

std::string duration_suffix(const std::optional<double>& duration) {
  if (!duration) return "";
  return " (" + fixed3(*duration) + "s)";
}

void render_span_subtree(std::ostringstream& os, const SpanIndex& index, const Span& span,
                         std::size_t depth, std::size_t budget) {
  // budget bounds recursion when a hand-edited file contains a parent cycle.
  if (budget == 0) return;
  const std::string indent(depth * 2, ' ');
  os << indent << "+ " << span.name() << duration_suffix(span.duration()) << "\n";
  for (const auto& e : span.events()) {
    os << indent << "    " << to_string(e.event_type) << "\n";
  }
  for (const Span* child : index.children(span.span_id())) {
    render_span_subtree(os, index, *child, depth + 1, budget - 1);
  }
}

}  // namespace

std::string event_label(EventType type) {
  std::string s = to_string(type);
  std::replace(s.begin(), s.end(), '_', ' ');
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string event_preview(const Event& event, std::size_t max_chars) {
  const auto& d = event.data;
  switch (event.event_type) {
    case EventType::llm_request: {
      std::size_t n_msgs = 0;
      if (const auto* m = jsonlite::find(d, "messages"); m && m->is_array()) {
        n_msgs = std::get<jsonlite::Array>(m->v).size();
      }
      return "model=" + field_text(d, "model") + " messages=" + std::to_string(n_msgs);
    }
    case EventType::llm_response: {
      std::string out = "\"" + truncate(field_text(d, "content"), max_chars) + "\"";
      const auto* tokens = jsonlite::find(d, "tokens");
      if (tokens && tokens->is_number()) out += " (" + jsonlite::to_json(*tokens) + " tokens)";
      return out;
    }
    case EventType::tool_call: {
      const auto* args = jsonlite::find(d, "args");
      const std::string args_text = args ? jsonlite::to_json(*args) : "{}";
      return field_text(d, "tool") + "(" + truncate(args_text, max_chars) + ")";
    }
    case EventType::tool_result:
      return field_text(d, "tool") + " -> " + truncate(field_text(d, "result"), max_chars);
    case EventType::decision:
      return field_text(d, "description") + " -> " + field_text(d, "choice");
    case EventType::error:
      return truncate(field_text(d, "message"), max_chars);
    case EventType::state_change:
      return field_text(d, "key") + ": " + truncate(field_text(d, "old"), max_chars / 2) +
             " -> " + truncate(field_text(d, "new"), max_chars / 2);
    case EventType::log:
      break;
  }
  if (jsonlite::find(d, "message")) return truncate(field_text(d, "message"), max_chars);
  return truncate(jsonlite::to_json(d), max_chars);
}

std::string render_trace(const Trace& trace) {
  const std::size_t width = global_config().preview_chars;
  std::ostringstream os;
  os << "Agent Trace: " << trace.name() << "\n"
     << "ID: " << trace.trace_id() << "\n"
     << "Spans: " << trace.spans().size() << " | Events: " << trace.event_count() << "\n"
     << "Duration: " << (trace.duration() ? fixed3(*trace.duration()) + "s" : "running") << "\n";

  for (const auto& span : trace.spans()) {
    os << "\n>>> " << span.name() << duration_suffix(span.duration()) << "\n";
    for (const auto& e : span.events()) {
      os << "  +" << fixed3(e.timestamp - trace.start_time()) << "s  " << event_label(e.event_type)
         << "  " << event_preview(e, width) << "\n";
    }
  }
  return os.str();
}

std::string render_tree(const Trace& trace) {
  const SpanIndex index(trace);
  std::ostringstream os;
  os << trace.name() << " (" << trace.trace_id() << ")\n";
  for (const Span* root : index.roots()) {
    render_span_subtree(os, index, *root, 1, trace.spans().size());
  }
  return os.str();
}

std::string render_step(const Replayer& replayer) {
  const auto step = replayer.peek();
  if (!step) return "End of trace\n";
  std::ostringstream os;
  os << "[" << (step->index + 1) << "/" << replayer.total_steps() << "] " << step->span->name()
     << "  " << to_string(step->event->event_type) << "  "
     << event_preview(*step->event, global_config().preview_chars) << "\n";
  return os.str();
}

std::string render_diff(const DiffResult& result) {
  std::ostringstream os;
  os << "Trace A: " << result.trace_a_id << "\n"
     << "Trace B: " << result.trace_b_id << "\n"
     << result.summary << "\n";
  std::size_t n = 0;
  for (const auto& d : result.divergences) {
    std::string severity = to_string(d.severity);
    std::transform(severity.begin(), severity.end(), severity.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    os << "  " << ++n << ". [" << severity << "] @" << d.position << "  " << d.description;
    if (!d.trace_a_span.empty() || !d.trace_b_span.empty()) {
      os << "  (" << (d.trace_a_span.empty() ? "-" : d.trace_a_span) << " | "
         << (d.trace_b_span.empty() ? "-" : d.trace_b_span) << ")";
    }
    os << "\n";
  }
  return os.str();
}

}  // namespace agentreplay
