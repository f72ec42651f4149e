#pragma once

#include <string>

#include "agentreplay/trace.hpp"
#include "agentreplay/types.hpp"

namespace agentreplay {

// Whole trace as one indented JSON document (Trace::to_json form). Readable
// back with Trace::from_json.
bool export_json(const Trace& trace, const std::string& path, TraceError* error = nullptr);

// Self-contained HTML timeline: one card per event, spans in storage order.
std::string render_html(const Trace& trace);
bool export_html(const Trace& trace, const std::string& path, TraceError* error = nullptr);

// Minimal HTML text escaping (& < > " ').
std::string html_escape(const std::string& s);

}  // namespace agentreplay
