#include "agentreplay/diff.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "agentreplay/observability.hpp"

namespace agentreplay {

namespace {

// event_id -> name of the first span (storage order) holding it.
class SpanNameLookup {
 public:
  explicit SpanNameLookup(const Trace& trace) {
    for (const auto& span : trace.spans()) {
      for (const auto& e : span.events()) names_.emplace(e.event_id, span.name());
    }
  }

  std::string operator()(const Event& e) const {
    auto it = names_.find(e.event_id);
    return it == names_.end() ? "unknown" : it->second;
  }

 private:
  std::unordered_map<std::string, std::string> names_;
};

// Missing key compares as def.
jsonlite::Value field_or(const Event& e, const std::string& key, jsonlite::Value def) {
  if (const jsonlite::Value* v = jsonlite::find(e.data, key)) return *v;
  return def;
}

// Strings render bare, everything else as compact JSON.
std::string describe(const jsonlite::Value& v) {
  if (v.is_string()) return std::get<std::string>(v.v);
  return jsonlite::to_json(v);
}

}  // namespace

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::info: return "info";
    case Severity::warning: return "warning";
    case Severity::critical: return "critical";
  }
  return "info";
}

jsonlite::Object Divergence::to_json() const {
  jsonlite::Object o;
  o["position"] = position;
  o["description"] = description;
  o["severity"] = to_string(severity);
  o["trace_a_span"] = trace_a_span;
  o["trace_b_span"] = trace_b_span;
  o["trace_a_event"] = trace_a_event ? jsonlite::Value(trace_a_event->to_json()) : jsonlite::Value();
  o["trace_b_event"] = trace_b_event ? jsonlite::Value(trace_b_event->to_json()) : jsonlite::Value();
  return o;
}

std::size_t DiffResult::critical_count() const {
  return static_cast<std::size_t>(
      std::count_if(divergences.begin(), divergences.end(),
                    [](const Divergence& d) { return d.severity == Severity::critical; }));
}

jsonlite::Object DiffResult::to_json() const {
  jsonlite::Array items;
  items.reserve(divergences.size());
  for (const auto& d : divergences) items.emplace_back(d.to_json());

  jsonlite::Object o;
  o["trace_a_id"] = trace_a_id;
  o["trace_b_id"] = trace_b_id;
  o["identical"] = identical();
  o["divergence_count"] = divergences.size();
  o["critical_count"] = critical_count();
  o["summary"] = summary;
  o["divergences"] = std::move(items);
  return o;
}

DiffResult diff_traces(const Trace& a, const Trace& b) {
  ScopeTimer timer;
  DiffResult result;
  result.trace_a_id = a.trace_id();
  result.trace_b_id = b.trace_id();

  const auto events_a = a.all_events();
  const auto events_b = b.all_events();
  const SpanNameLookup span_a(a);
  const SpanNameLookup span_b(b);

  const std::size_t n = std::max(events_a.size(), events_b.size());
  for (std::size_t i = 0; i < n; ++i) {
    const Event* ea = i < events_a.size() ? events_a[i] : nullptr;
    const Event* eb = i < events_b.size() ? events_b[i] : nullptr;

    Divergence d;
    d.position = i;

    if (!ea) {
      d.description = "Trace B has extra event: " + to_string(eb->event_type);
      d.severity = Severity::warning;
      d.trace_b_event = *eb;
      d.trace_b_span = span_b(*eb);
      result.divergences.push_back(std::move(d));
      continue;
    }
    if (!eb) {
      d.description = "Trace A has extra event: " + to_string(ea->event_type);
      d.severity = Severity::warning;
      d.trace_a_event = *ea;
      d.trace_a_span = span_a(*ea);
      result.divergences.push_back(std::move(d));
      continue;
    }

    if (ea->event_type != eb->event_type) {
      d.description = "Event type divergence: " + to_string(ea->event_type) + " vs " +
                      to_string(eb->event_type);
      d.severity = Severity::critical;
    } else if (ea->event_type == EventType::tool_call) {
      const auto tool_a = field_or(*ea, "tool", nullptr);
      const auto tool_b = field_or(*eb, "tool", nullptr);
      if (tool_a == tool_b) continue;
      d.description = "Different tool called: " + describe(tool_a) + " vs " + describe(tool_b);
      d.severity = Severity::critical;
    } else if (ea->event_type == EventType::llm_response) {
      if (field_or(*ea, "content", "") == field_or(*eb, "content", "")) continue;
      d.description = "LLM response content differs";
      d.severity = Severity::info;
    } else if (ea->event_type == EventType::decision) {
      const auto choice_a = field_or(*ea, "choice", nullptr);
      const auto choice_b = field_or(*eb, "choice", nullptr);
      if (choice_a == choice_b) continue;
      d.description = "Decision divergence: '" + describe(choice_a) + "' vs '" +
                      describe(choice_b) + "'";
      d.severity = Severity::critical;
    } else {
      continue;
    }

    d.trace_a_event = *ea;
    d.trace_b_event = *eb;
    d.trace_a_span = span_a(*ea);
    d.trace_b_span = span_b(*eb);
    result.divergences.push_back(std::move(d));
  }

  const std::size_t total = result.divergences.size();
  const std::size_t critical = result.critical_count();
  if (total == 0) {
    result.summary = "Traces are identical in structure and content.";
  } else {
    result.summary = "Found " + std::to_string(total) + " divergence(s): " +
                     std::to_string(critical) + " critical, " +
                     std::to_string(total - critical) + " informational.";
  }

  OperationEvent ev;
  ev.operation = "diff";
  ev.trace_id = result.trace_a_id + ".." + result.trace_b_id;
  ev.ok = true;
  ev.duration_ns = timer.elapsed_ns();
  ev.event_count = n;
  ev.divergence_count = total;
  ev.critical_count = critical;
  emit_operation_event(ev);
  return result;
}

}  // namespace agentreplay
