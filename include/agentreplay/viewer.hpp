#pragma once

// agentreplay/viewer.hpp: Plain-text renderings for the terminal.
//
// Every function returns the text instead of printing it. Payload previews
// are cut at Config::preview_chars.

#include <cstddef>
#include <string>

#include "agentreplay/diff.hpp"
#include "agentreplay/replay.hpp"
#include "agentreplay/trace.hpp"

namespace agentreplay {

// "TOOL CALL" style label for an event kind.
std::string event_label(EventType type);

// One-line summary of an event's payload, shaped per event kind.
std::string event_preview(const Event& event, std::size_t max_chars);

// Header block plus every span with its events, in storage order. Event lines
// carry their offset from the trace start.
std::string render_trace(const Trace& trace);

// Span hierarchy rebuilt through SpanIndex. Orphaned spans print at top level.
std::string render_tree(const Trace& trace);

// "[pos/total] span event_type preview" for the entry under the cursor, or
// "End of trace".
std::string render_step(const Replayer& replayer);

// Summary block followed by one line per divergence.
std::string render_diff(const DiffResult& result);

}  // namespace agentreplay
