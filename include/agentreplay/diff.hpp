#pragma once

// agentreplay/diff.hpp: Positional comparison of two traces.
//
// ALIGNMENT:
//   Both traces are put in canonical order and compared index by index. There
//   is no resynchronization: one inserted event shifts every later pair, so a
//   single extra step near the start reports as many type divergences.
//
// SEVERITY:
//   critical: event type, tool_call "tool" or decision "choice" differs.
//   warning : one trace has more events than the other (one per extra event).
//   info    : llm_response "content" differs.
//
// A DiffResult owns copies of the events it reports, so it outlives both
// input traces.

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "agentreplay/jsonlite.hpp"
#include "agentreplay/trace.hpp"

namespace agentreplay {

enum class Severity {
  info,
  warning,
  critical,
};

std::string to_string(Severity severity);

struct Divergence {
  std::size_t position{0};
  std::string description;
  Severity severity{Severity::info};
  std::string trace_a_span;
  std::string trace_b_span;
  std::optional<Event> trace_a_event;  // absent when A is exhausted
  std::optional<Event> trace_b_event;  // absent when B is exhausted

  jsonlite::Object to_json() const;
};

struct DiffResult {
  std::string trace_a_id;
  std::string trace_b_id;
  std::vector<Divergence> divergences;
  std::string summary;

  bool identical() const { return divergences.empty(); }
  std::size_t critical_count() const;

  // {"trace_a_id","trace_b_id","identical","divergence_count",
  //  "critical_count","summary","divergences":[...]}
  jsonlite::Object to_json() const;
};

DiffResult diff_traces(const Trace& a, const Trace& b);

}  // namespace agentreplay
