#include "agentreplay/trace.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>
#include <utility>

#include "agentreplay/hash.hpp"

namespace agentreplay {

namespace {

constexpr std::size_t kSpanIdChars = 12;
constexpr std::size_t kEventIdChars = 12;
constexpr std::size_t kTraceIdChars = 16;

// Reads an optional string-or-null field. Any other kind is a format error.
bool read_optional_string(const jsonlite::Object& obj, const std::string& key,
                          std::optional<std::string>* out, TraceError* error) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) {
    out->reset();
    return true;
  }
  if (!v->is_string()) return fail(error, ErrorCode::format_error, key + " must be a string");
  *out = std::get<std::string>(v->v);
  return true;
}

bool read_optional_number(const jsonlite::Object& obj, const std::string& key,
                          std::optional<double>* out, TraceError* error) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) {
    out->reset();
    return true;
  }
  if (!v->is_number()) return fail(error, ErrorCode::format_error, key + " must be a number");
  *out = jsonlite::get_optional_double(obj, key);
  return true;
}

bool read_optional_object(const jsonlite::Object& obj, const std::string& key,
                          jsonlite::Object* out, TraceError* error) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) {
    out->clear();
    return true;
  }
  if (!v->is_object()) return fail(error, ErrorCode::format_error, key + " must be an object");
  *out = std::get<jsonlite::Object>(v->v);
  return true;
}

jsonlite::Value optional_to_value(const std::optional<std::string>& s) {
  if (!s) return nullptr;
  return *s;
}

jsonlite::Value optional_to_value(const std::optional<double>& d) {
  if (!d) return nullptr;
  return *d;
}

// Hand-ordered record writers. The persisted line layout keeps a fixed key
// order so files diff cleanly line by line.
void write_event(std::ostringstream& os, const Event& e) {
  os << "{\"event_type\":\"" << to_string(e.event_type) << "\""
     << ",\"timestamp\":" << jsonlite::format_double(e.timestamp)
     << ",\"data\":" << jsonlite::to_json(e.data)
     << ",\"event_id\":\"" << jsonlite::escape(e.event_id) << "\"}";
}

void write_span_line(std::ostringstream& os, const Span& s) {
  os << "{\"type\":\"span\""
     << ",\"name\":\"" << jsonlite::escape(s.name()) << "\""
     << ",\"span_id\":\"" << jsonlite::escape(s.span_id()) << "\""
     << ",\"parent_id\":" << jsonlite::to_json(optional_to_value(s.parent_id()))
     << ",\"start_time\":" << jsonlite::format_double(s.start_time())
     << ",\"end_time\":" << jsonlite::to_json(optional_to_value(s.end_time()))
     << ",\"events\":[";
  bool first = true;
  for (const auto& e : s.events()) {
    if (!first) os << ",";
    first = false;
    write_event(os, e);
  }
  os << "],\"metadata\":" << jsonlite::to_json(s.metadata()) << "}\n";
}

}  // namespace

// ---------------------------------------------------------------------------
// EventType
// ---------------------------------------------------------------------------

std::string to_string(EventType type) {
  switch (type) {
    case EventType::llm_request: return "llm_request";
    case EventType::llm_response: return "llm_response";
    case EventType::tool_call: return "tool_call";
    case EventType::tool_result: return "tool_result";
    case EventType::decision: return "decision";
    case EventType::state_change: return "state_change";
    case EventType::error: return "error";
    case EventType::log: return "log";
  }
  return "log";
}

std::optional<EventType> event_type_from_string(const std::string& s) {
  for (EventType t : kAllEventTypes) {
    if (to_string(t) == s) return t;
  }
  return std::nullopt;
}

double now_seconds() {
  using Seconds = std::chrono::duration<double>;
  return std::chrono::duration_cast<Seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string generate_id(std::size_t hex_chars) {
  static constexpr char kHex[] = "0123456789abcdef";
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 15);
  std::string out;
  out.reserve(hex_chars);
  for (std::size_t i = 0; i < hex_chars; ++i) out += kHex[dist(rng)];
  return out;
}

// ---------------------------------------------------------------------------
// Event
// ---------------------------------------------------------------------------

Event Event::make(EventType type, jsonlite::Object data) {
  Event e;
  e.event_type = type;
  e.timestamp = now_seconds();
  e.data = std::move(data);
  e.event_id = generate_id(kEventIdChars);
  return e;
}

jsonlite::Object Event::to_json() const {
  jsonlite::Object o;
  o["event_type"] = to_string(event_type);
  o["timestamp"] = timestamp;
  o["data"] = data;
  o["event_id"] = event_id;
  return o;
}

std::optional<Event> Event::from_json(const jsonlite::Object& obj, TraceError* error) {
  const jsonlite::Value* type_v = jsonlite::find(obj, "event_type");
  if (!type_v || !type_v->is_string()) {
    fail(error, ErrorCode::format_error, "event missing event_type");
    return std::nullopt;
  }
  const auto type = event_type_from_string(std::get<std::string>(type_v->v));
  if (!type) {
    fail(error, ErrorCode::format_error,
         "unknown event_type: " + std::get<std::string>(type_v->v));
    return std::nullopt;
  }
  const jsonlite::Value* ts = jsonlite::find(obj, "timestamp");
  if (!ts || !ts->is_number()) {
    fail(error, ErrorCode::format_error, "event missing timestamp");
    return std::nullopt;
  }

  Event e;
  e.event_type = *type;
  e.timestamp = jsonlite::get_double(obj, "timestamp");
  if (!read_optional_object(obj, "data", &e.data, error)) return std::nullopt;

  std::optional<std::string> id;
  if (!read_optional_string(obj, "event_id", &id, error)) return std::nullopt;
  e.event_id = id ? *id : generate_id(kEventIdChars);
  return e;
}

// ---------------------------------------------------------------------------
// Span
// ---------------------------------------------------------------------------

Span::Span(std::string name, std::optional<std::string> parent_id, jsonlite::Object metadata)
    : name_(std::move(name)),
      span_id_(generate_id(kSpanIdChars)),
      parent_id_(std::move(parent_id)),
      start_time_(now_seconds()),
      metadata_(std::move(metadata)) {}

std::optional<double> Span::duration() const {
  if (!end_time_) return std::nullopt;
  return *end_time_ - start_time_;
}

const Event& Span::add_event(EventType type, jsonlite::Object data) {
  return append(Event::make(type, std::move(data)));
}

const Event& Span::append(Event event) {
  events_.push_back(std::move(event));
  return events_.back();
}

void Span::close() { end_time_ = now_seconds(); }

jsonlite::Object Span::to_json() const {
  jsonlite::Array events;
  events.reserve(events_.size());
  for (const auto& e : events_) events.emplace_back(e.to_json());

  jsonlite::Object o;
  o["name"] = name_;
  o["span_id"] = span_id_;
  o["parent_id"] = optional_to_value(parent_id_);
  o["start_time"] = start_time_;
  o["end_time"] = optional_to_value(end_time_);
  o["events"] = std::move(events);
  o["metadata"] = metadata_;
  return o;
}

std::optional<Span> Span::from_json(const jsonlite::Object& obj, TraceError* error) {
  const jsonlite::Value* name = jsonlite::find(obj, "name");
  if (!name || !name->is_string()) {
    fail(error, ErrorCode::format_error, "span missing name");
    return std::nullopt;
  }
  const jsonlite::Value* id = jsonlite::find(obj, "span_id");
  if (!id || !id->is_string()) {
    fail(error, ErrorCode::format_error, "span missing span_id");
    return std::nullopt;
  }
  const jsonlite::Value* start = jsonlite::find(obj, "start_time");
  if (!start || !start->is_number()) {
    fail(error, ErrorCode::format_error, "span missing start_time");
    return std::nullopt;
  }

  Span s;
  s.name_ = std::get<std::string>(name->v);
  s.span_id_ = std::get<std::string>(id->v);
  s.start_time_ = jsonlite::get_double(obj, "start_time");
  if (!read_optional_string(obj, "parent_id", &s.parent_id_, error)) return std::nullopt;
  if (!read_optional_number(obj, "end_time", &s.end_time_, error)) return std::nullopt;
  if (!read_optional_object(obj, "metadata", &s.metadata_, error)) return std::nullopt;

  if (const jsonlite::Value* events = jsonlite::find(obj, "events");
      events && !events->is_null()) {
    if (!events->is_array()) {
      fail(error, ErrorCode::format_error, "span events must be an array");
      return std::nullopt;
    }
    const auto& arr = std::get<jsonlite::Array>(events->v);
    for (const auto& item : arr) {
      if (!item.is_object()) {
        fail(error, ErrorCode::format_error, "event must be an object");
        return std::nullopt;
      }
      auto e = Event::from_json(std::get<jsonlite::Object>(item.v), error);
      if (!e) return std::nullopt;
      s.events_.push_back(std::move(*e));
    }
  }
  return s;
}

// ---------------------------------------------------------------------------
// Trace
// ---------------------------------------------------------------------------

Trace::Trace(std::string name, jsonlite::Object metadata)
    : trace_id_(generate_id(kTraceIdChars)),
      name_(std::move(name)),
      start_time_(now_seconds()),
      metadata_(std::move(metadata)) {}

std::optional<double> Trace::duration() const {
  if (!end_time_) return std::nullopt;
  return *end_time_ - start_time_;
}

std::size_t Trace::event_count() const {
  std::size_t n = 0;
  for (const auto& s : spans_) n += s.events().size();
  return n;
}

Span& Trace::add_span(std::string name, std::optional<std::string> parent_id,
                      jsonlite::Object metadata) {
  spans_.emplace_back(std::move(name), std::move(parent_id), std::move(metadata));
  return spans_.back();
}

const Span* Trace::get_span(const std::string& span_id, TraceError* error) const {
  for (const auto& s : spans_) {
    if (s.span_id() == span_id) return &s;
  }
  fail(error, ErrorCode::not_found, "span not found: " + span_id);
  return nullptr;
}

Span* Trace::get_span(const std::string& span_id, TraceError* error) {
  return const_cast<Span*>(std::as_const(*this).get_span(span_id, error));
}

void Trace::close() {
  end_time_ = now_seconds();
  for (auto& s : spans_) {
    if (s.is_open()) s.close();
  }
}

std::vector<const Event*> Trace::all_events() const {
  std::vector<const Event*> out;
  for (const auto& ref : canonical_order(*this)) {
    out.push_back(&spans_[ref.span_index].events()[ref.event_index]);
  }
  return out;
}

jsonlite::Object Trace::to_json() const {
  jsonlite::Array spans;
  spans.reserve(spans_.size());
  for (const auto& s : spans_) spans.emplace_back(s.to_json());

  jsonlite::Object o;
  o["trace_id"] = trace_id_;
  o["name"] = name_;
  o["start_time"] = start_time_;
  o["end_time"] = optional_to_value(end_time_);
  o["spans"] = std::move(spans);
  o["metadata"] = metadata_;
  return o;
}

std::optional<Trace> Trace::from_json(const jsonlite::Object& obj, TraceError* error) {
  const jsonlite::Value* id = jsonlite::find(obj, "trace_id");
  if (!id || !id->is_string()) {
    fail(error, ErrorCode::format_error, "trace missing trace_id");
    return std::nullopt;
  }
  const jsonlite::Value* name = jsonlite::find(obj, "name");
  if (!name || !name->is_string()) {
    fail(error, ErrorCode::format_error, "trace missing name");
    return std::nullopt;
  }

  Trace t{Restored{}};
  t.trace_id_ = std::get<std::string>(id->v);
  t.name_ = std::get<std::string>(name->v);

  std::optional<double> start;
  if (!read_optional_number(obj, "start_time", &start, error)) return std::nullopt;
  t.start_time_ = start.value_or(0.0);
  if (!read_optional_number(obj, "end_time", &t.end_time_, error)) return std::nullopt;
  if (!read_optional_object(obj, "metadata", &t.metadata_, error)) return std::nullopt;

  if (const jsonlite::Value* spans = jsonlite::find(obj, "spans");
      spans && !spans->is_null()) {
    if (!spans->is_array()) {
      fail(error, ErrorCode::format_error, "trace spans must be an array");
      return std::nullopt;
    }
    for (const auto& item : std::get<jsonlite::Array>(spans->v)) {
      if (!item.is_object()) {
        fail(error, ErrorCode::format_error, "span must be an object");
        return std::nullopt;
      }
      auto s = Span::from_json(std::get<jsonlite::Object>(item.v), error);
      if (!s) return std::nullopt;
      t.spans_.push_back(std::move(*s));
    }
  }
  return t;
}

std::string Trace::to_ndjson() const {
  std::ostringstream os;
  os << "{\"type\":\"trace_header\""
     << ",\"trace_id\":\"" << jsonlite::escape(trace_id_) << "\""
     << ",\"name\":\"" << jsonlite::escape(name_) << "\""
     << ",\"start_time\":" << jsonlite::format_double(start_time_)
     << ",\"end_time\":" << jsonlite::to_json(optional_to_value(end_time_))
     << ",\"metadata\":" << jsonlite::to_json(metadata_) << "}\n";
  for (const auto& s : spans_) write_span_line(os, s);
  return os.str();
}

std::optional<Trace> Trace::from_ndjson(const std::string& text, TraceError* error) {
  // Header fields are tolerant: anything missing falls back to a fresh id,
  // "unnamed" and start_time 0. Span records are strict.
  Trace t{Restored{}};
  t.trace_id_ = generate_id(kTraceIdChars);
  t.name_ = "unnamed";

  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    std::size_t nl = text.find('\n', pos);
    if (nl == std::string::npos) nl = text.size();
    std::string line = text.substr(pos, nl - pos);
    pos = nl + 1;
    ++line_no;

    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    std::optional<jsonlite::JsonError> jerr;
    jsonlite::Value v = jsonlite::parse_value(line, &jerr, jsonlite::DuplicateKeys::last_wins);
    if (jerr) {
      fail(error, ErrorCode::format_error,
           "line " + std::to_string(line_no) + ": " + jerr->code + ": " + jerr->message);
      return std::nullopt;
    }
    if (!v.is_object()) {
      fail(error, ErrorCode::format_error,
           "line " + std::to_string(line_no) + ": record is not an object");
      return std::nullopt;
    }
    const auto& record = std::get<jsonlite::Object>(v.v);
    const std::string type = jsonlite::get_string(record, "type");

    if (type == "trace_header") {
      if (const auto* id = jsonlite::find(record, "trace_id"); id && id->is_string()) {
        t.trace_id_ = std::get<std::string>(id->v);
      }
      if (const auto* name = jsonlite::find(record, "name"); name && name->is_string()) {
        t.name_ = std::get<std::string>(name->v);
      }
      t.start_time_ = jsonlite::get_double(record, "start_time", 0.0);
      t.end_time_ = jsonlite::get_optional_double(record, "end_time");
      t.metadata_ = jsonlite::get_object(record, "metadata");
    } else if (type == "span") {
      TraceError span_err;
      auto s = Span::from_json(record, &span_err);
      if (!s) {
        fail(error, ErrorCode::format_error,
             "line " + std::to_string(line_no) + ": " + span_err.message);
        return std::nullopt;
      }
      t.spans_.push_back(std::move(*s));
    }
    // Unknown record types are skipped.
  }
  return t;
}

// ---------------------------------------------------------------------------
// Ordering / digest
// ---------------------------------------------------------------------------

std::vector<EventRef> canonical_order(const Trace& trace) {
  std::vector<EventRef> refs;
  refs.reserve(trace.event_count());
  const auto& spans = trace.spans();
  for (std::size_t si = 0; si < spans.size(); ++si) {
    for (std::size_t ei = 0; ei < spans[si].events().size(); ++ei) {
      refs.push_back(EventRef{si, ei});
    }
  }
  std::stable_sort(refs.begin(), refs.end(), [&spans](const EventRef& a, const EventRef& b) {
    return spans[a.span_index].events()[a.event_index].timestamp <
           spans[b.span_index].events()[b.event_index].timestamp;
  });
  return refs;
}

std::string trace_digest(const Trace& trace) {
  return hash_domain("trace:", trace.to_ndjson());
}

// ---------------------------------------------------------------------------
// SpanIndex
// ---------------------------------------------------------------------------

SpanIndex::SpanIndex(const Trace& trace) : trace_(&trace) {
  const auto& spans = trace.spans();
  for (std::size_t i = 0; i < spans.size(); ++i) {
    by_id_.emplace(spans[i].span_id(), i);  // first occurrence wins
  }
  for (std::size_t i = 0; i < spans.size(); ++i) {
    const auto& parent = spans[i].parent_id();
    if (parent && by_id_.count(*parent)) {
      children_[*parent].push_back(i);
    } else {
      roots_.push_back(i);
    }
  }
}

const Span* SpanIndex::find(const std::string& span_id, TraceError* error) const {
  auto it = by_id_.find(span_id);
  if (it == by_id_.end()) {
    fail(error, ErrorCode::not_found, "span not found: " + span_id);
    return nullptr;
  }
  return &trace_->spans()[it->second];
}

std::vector<const Span*> SpanIndex::children(const std::string& span_id) const {
  std::vector<const Span*> out;
  auto it = children_.find(span_id);
  if (it == children_.end()) return out;
  for (std::size_t i : it->second) out.push_back(&trace_->spans()[i]);
  return out;
}

std::vector<const Span*> SpanIndex::roots() const {
  std::vector<const Span*> out;
  out.reserve(roots_.size());
  for (std::size_t i : roots_) out.push_back(&trace_->spans()[i]);
  return out;
}

std::size_t SpanIndex::depth(const Span& span) const {
  std::size_t d = 0;
  const Span* cur = &span;
  const std::size_t limit = trace_->spans().size();
  while (cur->parent_id() && d < limit) {
    const Span* parent = find(*cur->parent_id());
    if (!parent) break;
    ++d;
    cur = parent;
  }
  return d;
}

}  // namespace agentreplay
