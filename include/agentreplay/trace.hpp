#pragma once

// agentreplay/trace.hpp: Trace / Span / Event data model.
//
// OWNERSHIP:
//   Trace owns its Spans and Span owns its Events, both in std::deque, so
//   references returned by add_span() and add_event() stay valid as more are
//   appended.
//   Parent/child is a span_id reference, never a pointer; SpanIndex rebuilds
//   the hierarchy on demand.
//
// ORDERING:
//   spans() is insertion order. canonical_order() / all_events() is the replay
//   order: every event, stable-sorted by timestamp, so equal timestamps keep
//   (span storage order, in-span order). Both Replayer and diff_traces() use it.
//
// CONCURRENCY:
//   None. A Trace is mutated by one recording session at a time; callers must
//   not share an instance across concurrent writers.

#include <array>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "agentreplay/jsonlite.hpp"
#include "agentreplay/types.hpp"

namespace agentreplay {

// Closed set of event kinds. The string forms are part of the file format.
enum class EventType {
  llm_request,
  llm_response,
  tool_call,
  tool_result,
  decision,
  state_change,
  error,
  log,
};

constexpr std::array<EventType, 8> kAllEventTypes{
    EventType::llm_request, EventType::llm_response, EventType::tool_call,
    EventType::tool_result, EventType::decision,     EventType::state_change,
    EventType::error,       EventType::log,
};

std::string to_string(EventType type);
std::optional<EventType> event_type_from_string(const std::string& s);

// Wall-clock seconds since the epoch.
double now_seconds();

// Random lowercase hex identifier (12 for spans/events, 16 for traces).
std::string generate_id(std::size_t hex_chars);

struct Event {
  EventType event_type{EventType::log};
  double timestamp{0.0};
  jsonlite::Object data;
  std::string event_id;

  // Stamps the current time and a fresh 12-char id.
  static Event make(EventType type, jsonlite::Object data = {});

  jsonlite::Object to_json() const;
  static std::optional<Event> from_json(const jsonlite::Object& obj, TraceError* error = nullptr);
};

class Span {
 public:
  explicit Span(std::string name,
                std::optional<std::string> parent_id = std::nullopt,
                jsonlite::Object metadata = {});

  const std::string& name() const { return name_; }
  const std::string& span_id() const { return span_id_; }
  const std::optional<std::string>& parent_id() const { return parent_id_; }
  double start_time() const { return start_time_; }
  const std::optional<double>& end_time() const { return end_time_; }
  bool is_open() const { return !end_time_.has_value(); }

  // Defined only once the span is closed.
  std::optional<double> duration() const;

  const std::deque<Event>& events() const { return events_; }
  const jsonlite::Object& metadata() const { return metadata_; }
  jsonlite::Object& metadata() { return metadata_; }

  // Appends a new event stamped with the current time. The returned reference
  // stays valid for the life of the span.
  const Event& add_event(EventType type, jsonlite::Object data = {});

  // Appends an already-built event verbatim (importers, synthetic traces).
  const Event& append(Event event);

  // Sets end_time to now. Calling it again overwrites end_time.
  void close();

  jsonlite::Object to_json() const;
  static std::optional<Span> from_json(const jsonlite::Object& obj, TraceError* error = nullptr);

 private:
  Span() = default;

  std::string name_;
  std::string span_id_;
  std::optional<std::string> parent_id_;
  double start_time_{0.0};
  std::optional<double> end_time_;
  std::deque<Event> events_;
  jsonlite::Object metadata_;
};

// Position of one event inside a trace's span storage.
struct EventRef {
  std::size_t span_index{0};
  std::size_t event_index{0};
};

class Trace {
 public:
  explicit Trace(std::string name = "unnamed", jsonlite::Object metadata = {});

  const std::string& trace_id() const { return trace_id_; }
  const std::string& name() const { return name_; }
  double start_time() const { return start_time_; }
  const std::optional<double>& end_time() const { return end_time_; }
  std::optional<double> duration() const;

  const std::deque<Span>& spans() const { return spans_; }
  const jsonlite::Object& metadata() const { return metadata_; }
  jsonlite::Object& metadata() { return metadata_; }

  std::size_t event_count() const;

  // Appends a new open span. No uniqueness check on name.
  Span& add_span(std::string name,
                 std::optional<std::string> parent_id = std::nullopt,
                 jsonlite::Object metadata = {});

  // Linear lookup by span_id; first match in storage order.
  const Span* get_span(const std::string& span_id, TraceError* error = nullptr) const;
  Span* get_span(const std::string& span_id, TraceError* error = nullptr);

  // Stamps end_time on the trace and on every span that is still open.
  // Calling it again overwrites the trace's end_time.
  void close();

  // Every event, in canonical (replay) order.
  std::vector<const Event*> all_events() const;

  // Dictionary form: {"trace_id","name","start_time","end_time","spans","metadata"}.
  jsonlite::Object to_json() const;
  static std::optional<Trace> from_json(const jsonlite::Object& obj, TraceError* error = nullptr);

  // Persisted NDJSON form: a trace_header line, then one line per span.
  std::string to_ndjson() const;
  static std::optional<Trace> from_ndjson(const std::string& text, TraceError* error = nullptr);

  // File I/O (trace_store.cpp). Paths ending in ".zst" are zstd-compressed
  // when built with AGENTREPLAY_WITH_ZSTD; load() detects compression by the
  // frame magic, not the extension.
  bool save(const std::string& path, TraceError* error = nullptr) const;
  static std::optional<Trace> load(const std::string& path, TraceError* error = nullptr);

 private:
  struct Restored {};
  explicit Trace(Restored) {}

  std::string trace_id_;
  std::string name_;
  double start_time_{0.0};
  std::optional<double> end_time_;
  std::deque<Span> spans_;
  jsonlite::Object metadata_;
};

// Stable sort of every (span, event) position by event timestamp.
std::vector<EventRef> canonical_order(const Trace& trace);

// BLAKE3 digest of the trace's persisted NDJSON form.
std::string trace_digest(const Trace& trace);

// On-demand span_id -> span lookup and parent/child reconstruction. Holds a
// pointer to the trace; the trace must outlive the index and not gain spans
// while the index is in use.
class SpanIndex {
 public:
  explicit SpanIndex(const Trace& trace);

  // First span with this id in storage order, or nullptr (not_found).
  const Span* find(const std::string& span_id, TraceError* error = nullptr) const;

  // Direct children of span_id, in storage order.
  std::vector<const Span*> children(const std::string& span_id) const;

  // Spans with no parent, or whose parent is not in the trace.
  std::vector<const Span*> roots() const;

  // Number of ancestors reachable from span. Stops at a missing parent or a
  // cycle.
  std::size_t depth(const Span& span) const;

 private:
  const Trace* trace_;
  std::unordered_map<std::string, std::size_t> by_id_;
  std::unordered_map<std::string, std::vector<std::size_t>> children_;
  std::vector<std::size_t> roots_;
};

}  // namespace agentreplay
