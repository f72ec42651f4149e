#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "agentreplay/config.hpp"
#include "agentreplay/diff.hpp"
#include "agentreplay/export.hpp"
#include "agentreplay/hash.hpp"
#include "agentreplay/jsonlite.hpp"
#include "agentreplay/observability.hpp"
#include "agentreplay/recorder.hpp"
#include "agentreplay/replay.hpp"
#include "agentreplay/trace.hpp"
#include "agentreplay/version.hpp"
#include "agentreplay/viewer.hpp"

namespace fs = std::filesystem;

using agentreplay::ErrorCode;
using agentreplay::Event;
using agentreplay::EventType;
using agentreplay::Severity;
using agentreplay::Span;
using agentreplay::Trace;
using agentreplay::TraceError;
namespace jsonlite = agentreplay::jsonlite;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("agentreplay_test_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_text(const fs::path& path, const std::string& text) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << text;
}

std::string read_text(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

Event at(EventType type, double ts, jsonlite::Object data = {}) {
  Event e = Event::make(type, std::move(data));
  e.timestamp = ts;
  return e;
}

// Single span "s" holding one event per (type, data) pair, timestamps 1, 2, ...
Trace linear_trace(const std::vector<std::pair<EventType, jsonlite::Object>>& events) {
  Trace t("linear");
  Span& s = t.add_span("s");
  double ts = 1.0;
  for (const auto& [type, data] : events) s.append(at(type, ts++, data));
  t.close();
  return t;
}

Trace sample_trace() {
  Trace t("sample", jsonlite::Object{{"env", "test"}});
  Span& outer = t.add_span("plan", std::nullopt, jsonlite::Object{{"step", 1}});
  outer.add_event(EventType::llm_request,
                  jsonlite::Object{{"model", "gpt-4"},
                                   {"messages", jsonlite::Array{jsonlite::Object{{"role", "user"}}}}});
  outer.add_event(EventType::llm_response, jsonlite::Object{{"content", "hi"}, {"tokens", 12}});
  Span& inner = t.add_span("act", outer.span_id());
  inner.add_event(EventType::tool_call,
                  jsonlite::Object{{"tool", "search"}, {"args", jsonlite::Object{{"q", "x"}}}});
  inner.add_event(EventType::tool_result, jsonlite::Object{{"tool", "search"}, {"result", 3.25}});
  inner.add_event(EventType::decision, jsonlite::Object{{"description", "go"}, {"choice", "a"}});
  t.close();
  return t;
}

// ============================================================================
// JSON layer
// ============================================================================

void test_json_unicode_escapes() {
  std::optional<jsonlite::JsonError> err;
  auto v = jsonlite::parse_value("\"caf\\u00e9 \\ud83d\\ude00\"", &err);
  expect(!err, "escape parse should succeed");
  expect(v.is_string(), "escaped value is a string");
  expect(std::get<std::string>(v.v) == "caf\xC3\xA9 \xF0\x9F\x98\x80",
         "\\u escapes decode to UTF-8 including surrogate pairs");
}

void test_json_duplicate_key_rejected() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate key must fail");
  expect(err->code == "json_duplicate_key", "duplicate key error code");
}

void test_json_duplicate_key_last_wins() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse("{\"a\":1,\"b\":{\"c\":1,\"c\":3},\"a\":2}", &err,
                             jsonlite::DuplicateKeys::last_wins);
  expect(!err, "last_wins accepts duplicates");
  expect(jsonlite::get_u64(obj, "a") == 2, "later top-level value wins");
  expect(jsonlite::get_u64(jsonlite::get_object(obj, "b"), "c") == 3, "later nested value wins");
}

void test_json_nesting_limit() {
  const std::size_t limit = static_cast<std::size_t>(jsonlite::kMaxNestingDepth);
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse_value(std::string(limit, '[') + std::string(limit, ']'), &err);
  expect(!err, "nesting at the limit parses");

  jsonlite::parse_value(std::string(limit + 1, '[') + std::string(limit + 1, ']'), &err);
  expect(err && err->message == "nesting too deep", "one level past the limit fails");

  jsonlite::parse_value(std::string(200000, '['), &err);
  expect(err && err->code == "json_parse_error", "deep unterminated input fails cleanly");
}

void test_json_double_roundtrip() {
  const double ts = 1712345678.1234567;
  std::optional<jsonlite::JsonError> err;
  auto v = jsonlite::parse_value(jsonlite::format_double(ts), &err);
  expect(!err, "formatted double parses");
  expect(std::get<double>(v.v) == ts, "double round-trips bit-exact");
  expect(jsonlite::format_double(2.0) == "2.0", "integral doubles keep a fraction marker");
}

void test_json_numeric_equality() {
  expect(jsonlite::Value(1) == jsonlite::Value(1.0), "1 == 1.0");
  expect(jsonlite::Value(-3) == jsonlite::Value(-3.0), "-3 == -3.0");
  expect(jsonlite::Value(1) != jsonlite::Value("1"), "number != string");
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(agentreplay::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(agentreplay::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "abc";
  expect(agentreplay::hash_domain("tape:", payload) != agentreplay::hash_domain("trace:", payload),
         "different domains give different digests");
  expect(agentreplay::hash_domain("tape:", payload) != agentreplay::blake3_hex(payload),
         "domain digest differs from plain digest");
}

// ============================================================================
// Data model
// ============================================================================

void test_event_type_strings() {
  for (EventType t : agentreplay::kAllEventTypes) {
    auto back = agentreplay::event_type_from_string(agentreplay::to_string(t));
    expect(back && *back == t, "event type string round-trip: " + agentreplay::to_string(t));
  }
  expect(agentreplay::to_string(EventType::state_change) == "state_change", "wire spelling");
  expect(!agentreplay::event_type_from_string("LLM_REQUEST"), "wire strings are case-sensitive");
}

void test_id_shapes() {
  Trace t;
  Span& s = t.add_span("x");
  const Event& e = s.add_event(EventType::log);
  auto is_hex = [](const std::string& id) {
    return id.find_first_not_of("0123456789abcdef") == std::string::npos;
  };
  expect(t.trace_id().size() == 16 && is_hex(t.trace_id()), "trace_id is 16 hex");
  expect(s.span_id().size() == 12 && is_hex(s.span_id()), "span_id is 12 hex");
  expect(e.event_id.size() == 12 && is_hex(e.event_id), "event_id is 12 hex");
  expect(t.name() == "unnamed", "default trace name");
}

void test_span_reference_stability() {
  Trace t("stable");
  Span& first = t.add_span("first");
  const std::string id = first.span_id();
  for (int i = 0; i < 200; ++i) t.add_span("filler");
  expect(first.span_id() == id, "add_span reference survives later appends");
  first.add_event(EventType::log);
  expect(t.spans().front().events().size() == 1, "mutation through old reference lands in trace");
}

void test_event_reference_stability() {
  agentreplay::Recorder rec;
  const Event& first = rec.llm_response("first", 7);
  const std::string id = first.event_id;
  for (int i = 0; i < 500; ++i) rec.tool_call("filler", {{"i", i}});
  rec.error("late");
  expect(first.event_id == id, "returned event survives later appends");
  expect(jsonlite::get_string(first.data, "content") == "first", "payload still readable");
  expect(jsonlite::get_u64(first.data, "tokens") == 7, "tokens still readable");
  expect(&rec.trace().spans()[0].events().front() == &first, "reference points into the span");
}

void test_close_overwrites_end_time() {
  Trace t("closing");
  Span& s = t.add_span("s");
  expect(s.is_open() && !s.duration(), "span starts open with no duration");
  s.close();
  const double first = *s.end_time();
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  s.close();
  expect(*s.end_time() > first, "second close overwrites end_time");
  expect(s.duration() && *s.duration() >= 0.0, "closed span has a duration");
}

void test_trace_close_only_closes_open_spans() {
  Trace t("close-all");
  Span& done = t.add_span("done");
  done.close();
  const double done_end = *done.end_time();
  Span& open = t.add_span("open");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  t.close();
  expect(*done.end_time() == done_end, "already-closed span keeps its end_time");
  expect(!open.is_open(), "open span closed by trace close");
  expect(t.end_time().has_value() && t.duration().has_value(), "trace closed");
}

void test_all_events_stable_order() {
  Trace t("order");
  Span& s1 = t.add_span("s1");
  Span& s2 = t.add_span("s2");
  const std::string a = s1.append(at(EventType::log, 3.0)).event_id;
  const std::string b = s1.append(at(EventType::log, 1.0)).event_id;
  const std::string c = s2.append(at(EventType::log, 1.0)).event_id;
  const std::string d = s2.append(at(EventType::log, 2.0)).event_id;

  const auto events = t.all_events();
  expect(events.size() == 4 && t.event_count() == 4, "four events");
  expect(events[0]->event_id == b, "ts 1.0 from s1 first (span order tie-break)");
  expect(events[1]->event_id == c, "ts 1.0 from s2 second");
  expect(events[2]->event_id == d, "ts 2.0 third");
  expect(events[3]->event_id == a, "ts 3.0 last");
  for (std::size_t i = 1; i < events.size(); ++i) {
    expect(events[i - 1]->timestamp <= events[i]->timestamp, "non-decreasing timestamps");
  }
}

void test_get_span_and_index() {
  Trace t("index");
  Span& root = t.add_span("root");
  Span& child = t.add_span("child", root.span_id());
  Span& grandchild = t.add_span("grandchild", child.span_id());
  Span& orphan = t.add_span("orphan", std::string("missing000000"));

  TraceError err;
  expect(t.get_span(child.span_id()) == &child, "get_span finds span");
  expect(t.get_span("nope", &err) == nullptr && err.code == ErrorCode::not_found,
         "get_span miss is not_found");

  const agentreplay::SpanIndex index(t);
  expect(index.find(grandchild.span_id()) == &grandchild, "index find");
  TraceError ierr;
  expect(!index.find("nope", &ierr) && ierr.code == ErrorCode::not_found, "index miss");
  auto roots = index.roots();
  expect(roots.size() == 2 && roots[0] == &root && roots[1] == &orphan,
         "roots are parentless and orphaned spans in storage order");
  auto kids = index.children(root.span_id());
  expect(kids.size() == 1 && kids[0] == &child, "children of root");
  expect(index.depth(root) == 0 && index.depth(grandchild) == 2, "depth");
  expect(index.depth(orphan) == 0, "orphan depth stops at missing parent");
}

// ============================================================================
// Persistence
// ============================================================================

void test_save_load_roundtrip() {
  const fs::path dir = scratch_dir("roundtrip");
  const Trace t = sample_trace();
  const std::string path = (dir / "trace.jsonl").string();

  TraceError err;
  expect(t.save(path, &err), "save ok: " + err.message);
  auto back = Trace::load(path, &err);
  expect(back.has_value(), "load ok: " + err.message);

  expect(back->trace_id() == t.trace_id(), "trace_id preserved");
  expect(back->name() == t.name(), "name preserved");
  expect(back->start_time() == t.start_time(), "start_time exact");
  expect(back->end_time() == t.end_time(), "end_time exact");
  expect(back->metadata() == t.metadata(), "metadata preserved");
  expect(back->spans().size() == t.spans().size(), "span count preserved");
  for (std::size_t i = 0; i < t.spans().size(); ++i) {
    const Span& a = t.spans()[i];
    const Span& b = back->spans()[i];
    expect(a.span_id() == b.span_id() && a.name() == b.name(), "span identity");
    expect(a.parent_id() == b.parent_id(), "parent_id preserved");
    expect(a.metadata() == b.metadata(), "span metadata preserved");
    expect(a.events().size() == b.events().size(), "per-span event count");
    for (std::size_t j = 0; j < a.events().size(); ++j) {
      expect(a.events()[j].event_type == b.events()[j].event_type, "event type preserved");
      expect(a.events()[j].data == b.events()[j].data, "event data preserved");
      expect(a.events()[j].timestamp == b.events()[j].timestamp, "timestamp exact");
      expect(a.events()[j].event_id == b.events()[j].event_id, "event_id preserved");
    }
  }
  expect(agentreplay::trace_digest(*back) == agentreplay::trace_digest(t), "digest stable");
}

void test_dictionary_form_roundtrip() {
  const Trace t = sample_trace();
  TraceError err;
  auto back = Trace::from_json(t.to_json(), &err);
  expect(back.has_value(), "from_json ok: " + err.message);
  expect(back->to_json() == t.to_json(), "dictionary form is loss-less");

  jsonlite::Object missing_id = t.to_json();
  missing_id.erase("trace_id");
  TraceError ferr;
  expect(!Trace::from_json(missing_id, &ferr) && ferr.code == ErrorCode::format_error,
         "missing trace_id is format_error");

  jsonlite::Object bad_name = t.to_json();
  bad_name["name"] = 5;
  TraceError nerr;
  expect(!Trace::from_json(bad_name, &nerr) && nerr.code == ErrorCode::format_error,
         "non-string name is format_error");
}

void test_load_missing_file() {
  TraceError err;
  auto t = Trace::load((fs::temp_directory_path() / "agentreplay_no_such_file.jsonl").string(), &err);
  expect(!t && err.code == ErrorCode::not_found, "missing file is not_found");
}

void test_load_bad_line_is_format_error() {
  const fs::path dir = scratch_dir("bad_line");
  const fs::path p = dir / "bad.jsonl";
  write_text(p, "{\"type\":\"trace_header\",\"trace_id\":\"abc\",\"name\":\"n\",\"start_time\":1}\n"
                "{not json\n");
  TraceError err;
  expect(!Trace::load(p.string(), &err), "bad JSON line fails the whole load");
  expect(err.code == ErrorCode::format_error, "bad JSON is format_error");
  expect(err.message.find("line 2") != std::string::npos, "message names the line");
}

void test_load_deep_nesting_is_format_error() {
  const fs::path dir = scratch_dir("deep_nesting");
  const fs::path p = dir / "deep.jsonl";
  write_text(p, "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":1,"
                "\"metadata\":{\"m\":" + std::string(200000, '[') + std::string(200000, ']') + "}}\n");
  TraceError err;
  expect(!Trace::load(p.string(), &err), "deeply nested line fails the load");
  expect(err.code == ErrorCode::format_error, "deep nesting is format_error");
  expect(err.message.find("nesting too deep") != std::string::npos, "message names the cause");
}

void test_load_duplicate_keys_last_wins() {
  const fs::path dir = scratch_dir("dup_keys");
  const fs::path p = dir / "dup.jsonl";
  write_text(p, "{\"type\":\"trace_header\",\"trace_id\":\"abc\",\"name\":\"n\",\"name\":\"n2\","
                "\"start_time\":0}\n"
                "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":1,"
                "\"events\":[{\"event_type\":\"log\",\"timestamp\":1,\"data\":{\"message\":\"a\","
                "\"message\":\"b\"},\"event_id\":\"e1\"}]}\n");
  TraceError err;
  auto t = Trace::load(p.string(), &err);
  expect(t.has_value(), "duplicate keys load: " + err.message);
  expect(t->trace_id() == "abc" && t->name() == "n2", "later header value wins");
  expect(jsonlite::get_string(t->spans()[0].events()[0].data, "message") == "b",
         "later payload value wins");
}

void test_load_malformed_span_is_format_error() {
  const fs::path dir = scratch_dir("bad_span");

  const fs::path no_name = dir / "no_name.jsonl";
  write_text(no_name, "{\"type\":\"span\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":1}\n");
  TraceError err;
  expect(!Trace::load(no_name.string(), &err) && err.code == ErrorCode::format_error,
         "span without name is format_error");

  const fs::path bad_type = dir / "bad_type.jsonl";
  write_text(bad_type,
             "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":1,"
             "\"events\":[{\"event_type\":\"telepathy\",\"timestamp\":1}]}\n");
  TraceError terr;
  expect(!Trace::load(bad_type.string(), &terr) && terr.code == ErrorCode::format_error,
         "unknown event_type is format_error");

  const fs::path no_ts = dir / "no_ts.jsonl";
  write_text(no_ts,
             "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":1,"
             "\"events\":[{\"event_type\":\"log\"}]}\n");
  TraceError serr;
  expect(!Trace::load(no_ts.string(), &serr) && serr.code == ErrorCode::format_error,
         "event without timestamp is format_error");
}

void test_load_tolerant_defaults() {
  const fs::path dir = scratch_dir("tolerant");
  const fs::path p = dir / "headerless.jsonl";
  write_text(p,
             "\n"
             "{\"type\":\"comment\",\"text\":\"ignored\"}\n"
             "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"start_time\":5,"
             "\"events\":[{\"event_type\":\"log\",\"timestamp\":6}]}\n"
             "   \n");
  TraceError err;
  auto t = Trace::load(p.string(), &err);
  expect(t.has_value(), "header-less file loads: " + err.message);
  expect(t->name() == "unnamed", "default name");
  expect(t->start_time() == 0.0, "default start_time");
  expect(t->trace_id().size() == 16, "fresh trace_id");
  expect(t->metadata().empty(), "empty metadata");
  expect(t->spans().size() == 1, "unknown record type skipped");
  const Span& s = t->spans()[0];
  expect(!s.parent_id() && s.is_open(), "missing parent_id and end_time default");
  expect(s.metadata().empty(), "missing span metadata is empty");
  expect(s.events()[0].data.empty(), "missing data is empty");
  expect(s.events()[0].event_id.size() == 12, "missing event_id is generated");
}

void test_load_decodes_ascii_escapes() {
  const fs::path dir = scratch_dir("escapes");
  const fs::path p = dir / "escaped.jsonl";
  write_text(p,
             "{\"type\":\"trace_header\",\"trace_id\":\"0123456789abcdef\",\"name\":\"r\\u00e9sum\\u00e9\","
             "\"start_time\":1,\"end_time\":null,\"metadata\":{}}\n"
             "{\"type\":\"span\",\"name\":\"s\",\"span_id\":\"aaaaaaaaaaaa\",\"parent_id\":null,"
             "\"start_time\":1,\"end_time\":null,\"events\":[{\"event_type\":\"llm_response\","
             "\"timestamp\":2,\"data\":{\"content\":\"\\u4f60\\u597d\"},\"event_id\":\"bbbbbbbbbbbb\"}],"
             "\"metadata\":{}}\n");
  TraceError err;
  auto t = Trace::load(p.string(), &err);
  expect(t.has_value(), "escaped file loads: " + err.message);
  expect(t->name() == "r\xC3\xA9sum\xC3\xA9", "header name decoded");
  expect(jsonlite::get_string(t->spans()[0].events()[0].data, "content") == "\xE4\xBD\xA0\xE5\xA5\xBD",
         "payload decoded");
}

void test_zstd_persistence() {
  const fs::path dir = scratch_dir("zstd");
  const Trace t = sample_trace();
  const std::string path = (dir / "trace.jsonl.zst").string();
  TraceError err;
#if defined(AGENTREPLAY_WITH_ZSTD)
  expect(t.save(path, &err), "compressed save ok: " + err.message);
  const std::string raw = read_text(path);
  expect(raw.size() >= 4 && static_cast<unsigned char>(raw[0]) == 0x28, "zstd magic written");
  auto back = Trace::load(path, &err);
  expect(back && back->trace_id() == t.trace_id() && back->event_count() == t.event_count(),
         "compressed round-trip");
#else
  expect(!t.save(path, &err) && err.code == ErrorCode::io_error,
         "compressed save without zstd is io_error");
  const fs::path fake = dir / "fake.jsonl";
  write_text(fake, std::string("\x28\xB5\x2F\xFD\x00\x00", 6));
  TraceError lerr;
  expect(!Trace::load(fake.string(), &lerr) && lerr.code == ErrorCode::format_error,
         "compressed load without zstd is format_error");
#endif
}

// ============================================================================
// Replay engine
// ============================================================================

void test_replay_step_through() {
  const Trace t = sample_trace();
  agentreplay::Replayer r(t);
  const auto events = t.all_events();
  expect(r.total_steps() == events.size(), "tape length equals event count");

  for (std::size_t i = 0; i < r.total_steps(); ++i) {
    auto s = r.step();
    expect(s.has_value(), "step within tape");
    expect(s->event->event_id == events[i]->event_id, "tape order equals all_events");
    expect(s->index == i, "step index");
    bool owned = false;
    for (const auto& e : s->span->events()) owned = owned || e.event_id == s->event->event_id;
    expect(owned, "tape entry paired with owning span");
  }
  expect(r.position() == r.total_steps() && r.at_end(), "cursor at end");
  expect(!r.step() && r.position() == r.total_steps(), "step at end is a no-op");
  expect(!r.peek(), "peek at end is empty");
}

void test_replay_step_back() {
  agentreplay::Replayer r(sample_trace());
  expect(!r.step_back() && r.position() == 0, "step_back at 0 is a no-op");
  auto first = r.step();
  auto back = r.step_back();
  expect(back && back->event == first->event && r.position() == 0,
         "step_back returns the entry just stepped over");
}

void test_replay_jump() {
  agentreplay::Replayer r(sample_trace());
  for (std::size_t k = 0; k < r.total_steps(); ++k) {
    auto j = r.jump(k);
    auto p = r.peek();
    expect(j && p && p->index == k && p->event == j->event, "jump then peek returns entry k");
  }
  r.jump(2);
  TraceError err;
  expect(!r.jump(r.total_steps(), &err), "jump past end fails");
  expect(err.code == ErrorCode::range_error, "range_error reported");
  expect(r.last_error().code == ErrorCode::range_error, "last_error records range_error");
  expect(r.position() == 2, "position unchanged after failed jump");
  r.reset();
  expect(r.position() == 0, "reset");
}

void test_replay_current_span_events() {
  const Trace t = sample_trace();
  agentreplay::Replayer r(t);
  r.jump(0);
  auto first_span = r.current_span_events();
  expect(first_span.size() == 2, "plan span has two events");
  while (r.step()) {
  }
  auto last_span = r.current_span_events();
  expect(last_span.size() == 3 && last_span[0].span->name() == "act",
         "at end the last tape entry's span is used");

  agentreplay::Replayer empty(Trace("empty"));
  expect(empty.current_span_events().empty(), "empty tape gives no span events");
  TraceError err;
  expect(!empty.jump(0, &err) && err.code == ErrorCode::range_error, "jump on empty tape fails");
}

void test_replay_search() {
  agentreplay::Replayer r(sample_trace());
  auto by_payload = r.search("SEARCH");
  expect(by_payload.size() == 2, "payload match is case-insensitive");
  auto by_span = r.search("Plan");
  expect(by_span.size() == 2, "span name match");
  auto by_type = r.search("decision");
  expect(by_type.size() == 1, "event type label match");
  expect(r.search("zzz-nothing").empty(), "no match");
  expect(r.search("\"tool\":\"search\"").size() == 2, "payload matched in compact JSON spelling");
  expect(r.search("'tool': 'search'").empty(), "repr spelling does not match");
}

void test_replay_fingerprint_stable() {
  const fs::path dir = scratch_dir("fingerprint");
  const Trace t = sample_trace();
  const std::string path = (dir / "t.jsonl").string();
  expect(t.save(path), "save");
  TraceError err;
  auto r = agentreplay::Replayer::from_file(path, &err);
  expect(r.has_value(), "from_file ok: " + err.message);
  const std::string fp = agentreplay::Replayer(t).fingerprint();
  expect(fp.size() == 64, "fingerprint is 64 hex");
  expect(r->fingerprint() == fp, "fingerprint survives save/load");

  TraceError missing;
  expect(!agentreplay::Replayer::from_file((dir / "missing.jsonl").string(), &missing) &&
             missing.code == ErrorCode::not_found,
         "from_file on missing path is not_found");
}

// ============================================================================
// Diff engine
// ============================================================================

void test_diff_identity() {
  const Trace t = sample_trace();
  auto r = agentreplay::diff_traces(t, t);
  expect(r.identical(), "trace compared with itself is identical");
  expect(r.summary == "Traces are identical in structure and content.", "identity summary");
  expect(r.critical_count() == 0, "no criticals");
}

void test_diff_extra_event_warning() {
  const Trace a = linear_trace({{EventType::llm_request, {}}});
  const Trace b = linear_trace({{EventType::llm_request, {}}, {EventType::llm_response, {}}});
  auto r = agentreplay::diff_traces(a, b);
  expect(r.divergences.size() == 1, "exactly one divergence");
  const auto& d = r.divergences[0];
  expect(d.severity == Severity::warning, "extra event is a warning");
  expect(d.description == "Trace B has extra event: llm_response", "extra event description");
  expect(!d.trace_a_event && d.trace_b_event, "only B side set");
  expect(d.trace_b_span == "s", "B span name");
  expect(r.summary == "Found 1 divergence(s): 0 critical, 1 informational.", "summary");

  auto rev = agentreplay::diff_traces(b, a);
  expect(rev.divergences.size() == 1 &&
             rev.divergences[0].description == "Trace A has extra event: llm_response",
         "A-side extra event");
}

void test_diff_tool_change_critical() {
  const Trace a = linear_trace({{EventType::tool_call, {{"tool", "search"}, {"args", jsonlite::Object{}}}}});
  const Trace b = linear_trace({{EventType::tool_call, {{"tool", "browse"}, {"args", jsonlite::Object{}}}}});
  auto r = agentreplay::diff_traces(a, b);
  expect(!r.identical(), "not identical");
  expect(r.divergences.size() == 1 && r.critical_count() == 1, "one critical");
  expect(r.divergences[0].description == "Different tool called: search vs browse",
         "tool description");
  expect(r.divergences[0].trace_a_span == "s" && r.divergences[0].trace_b_span == "s",
         "span names on both sides");
}

void test_diff_type_and_decision() {
  const Trace a = linear_trace({{EventType::log, {}}, {EventType::decision, {{"choice", "left"}}}});
  const Trace b = linear_trace({{EventType::error, {}}, {EventType::decision, {{"choice", "right"}}}});
  auto r = agentreplay::diff_traces(a, b);
  expect(r.divergences.size() == 2 && r.critical_count() == 2, "two criticals");
  expect(r.divergences[0].description == "Event type divergence: log vs error", "type divergence");
  expect(r.divergences[1].description == "Decision divergence: 'left' vs 'right'",
         "decision divergence");
  expect(r.summary == "Found 2 divergence(s): 2 critical, 0 informational.", "summary");

  const Trace c = linear_trace({{EventType::decision, {}}});
  const Trace d = linear_trace({{EventType::decision, {{"choice", nullptr}}}});
  expect(agentreplay::diff_traces(c, d).identical(), "missing choice compares as null");
}

void test_diff_content_info_and_defaults() {
  const Trace a = linear_trace({{EventType::llm_response, {{"content", "hello"}}}});
  const Trace b = linear_trace({{EventType::llm_response, {{"content", "goodbye"}}}});
  auto r = agentreplay::diff_traces(a, b);
  expect(r.divergences.size() == 1 && r.divergences[0].severity == Severity::info,
         "content change is info");
  expect(r.divergences[0].description == "LLM response content differs", "content description");

  const Trace missing = linear_trace({{EventType::llm_response, {}}});
  const Trace empty = linear_trace({{EventType::llm_response, {{"content", ""}}}});
  expect(agentreplay::diff_traces(missing, empty).identical(), "missing content compares as \"\"");

  const Trace one = linear_trace({{EventType::tool_call, {{"tool", 1}}}});
  const Trace one_f = linear_trace({{EventType::tool_call, {{"tool", 1.0}}}});
  expect(agentreplay::diff_traces(one, one_f).identical(), "numbers compare by value");

  const Trace x = linear_trace({{EventType::tool_result, {{"result", 1}}}});
  const Trace y = linear_trace({{EventType::tool_result, {{"result", 2}}}});
  expect(agentreplay::diff_traces(x, y).identical(), "other kinds compare by type only");
}

void test_diff_json_shape() {
  const Trace a = linear_trace({{EventType::llm_request, {}}});
  const Trace b = linear_trace({{EventType::llm_request, {}}, {EventType::log, {}}});
  const auto obj = agentreplay::diff_traces(a, b).to_json();
  expect(jsonlite::get_string(obj, "trace_a_id") == a.trace_id(), "trace_a_id");
  expect(jsonlite::get_bool(obj, "identical", true) == false, "identical flag");
  expect(jsonlite::get_u64(obj, "divergence_count") == 1, "divergence_count");
  expect(jsonlite::get_u64(obj, "critical_count", 9) == 0, "critical_count");
  const auto* divs = jsonlite::find(obj, "divergences");
  expect(divs && divs->is_array(), "divergences array");
  const auto& first = std::get<jsonlite::Object>(std::get<jsonlite::Array>(divs->v)[0].v);
  expect(jsonlite::find(first, "trace_a_event")->is_null(), "absent side is null");
  expect(jsonlite::find(first, "trace_b_event")->is_object(), "present side is an object");
  expect(jsonlite::get_string(first, "severity") == "warning", "severity string");
}

// ============================================================================
// Scenarios
// ============================================================================

void test_scenario_tool_swap() {
  Trace a("a");
  a.add_span("s").add_event(EventType::tool_call, {{"tool", "search"}, {"args", jsonlite::Object{}}});
  Trace b("b");
  b.add_span("s").add_event(EventType::tool_call, {{"tool", "browse"}, {"args", jsonlite::Object{}}});
  auto r = agentreplay::diff_traces(a, b);
  expect(!r.identical() && r.critical_count() >= 1, "tool swap is critical");
}

void test_scenario_response_appended() {
  Trace a("a");
  a.add_span("s").add_event(EventType::llm_request);
  Trace b("b");
  Span& s = b.add_span("s");
  s.add_event(EventType::llm_request);
  s.add_event(EventType::llm_response);
  auto r = agentreplay::diff_traces(a, b);
  expect(r.divergences.size() == 1 && r.divergences[0].severity == Severity::warning,
         "appended response is one warning");
}

void test_scenario_nested_spans() {
  Trace t("nested");
  Span& outer = t.add_span("outer");
  outer.add_event(EventType::log, {{"message", "start"}});
  Span& inner = t.add_span("inner", outer.span_id());
  inner.add_event(EventType::decision, {{"description", "route"}, {"choice", "b"}});
  expect(t.spans().size() == 2, "exactly two spans");
  expect(t.spans()[1].parent_id() == t.spans()[0].span_id(), "second span's parent is the first");
}

// ============================================================================
// Recorder
// ============================================================================

void test_recorder_nested_scopes() {
  agentreplay::Recorder rec("agent");
  {
    auto outer = rec.span("outer");
    rec.log("starting");
    {
      auto inner = rec.span("inner", {{"k", "v"}});
      rec.decision("route", "b");
      expect(rec.current_span() == &inner.span(), "inner is current");
    }
    expect(rec.current_span() == &outer.span(), "outer restored");
  }
  expect(rec.current_span() == nullptr, "no current span after scopes end");
  const Trace& t = rec.trace();
  expect(t.spans().size() == 2, "two spans recorded");
  expect(t.spans()[1].parent_id() == t.spans()[0].span_id(), "inner parented to outer");
  expect(!t.spans()[0].is_open() && !t.spans()[1].is_open(), "scopes closed their spans");
  expect(jsonlite::get_string(t.spans()[1].metadata(), "k") == "v", "span metadata");
}

void test_recorder_default_span_and_payloads() {
  agentreplay::Recorder rec;
  rec.llm_request("gpt-4", jsonlite::Array{jsonlite::Object{{"role", "user"}}});
  const Event& resp = rec.llm_response("ok");
  rec.tool_call("search", {{"q", "x"}}, {{"tool", "override"}});
  rec.state_change("mode", "a", "b");
  const Event& err = rec.error("boom");

  const Trace& t = rec.trace();
  expect(t.spans().size() == 1 && t.spans()[0].name() == "default", "default span created once");
  expect(jsonlite::find(resp.data, "tokens")->is_null(), "absent tokens is null");
  expect(jsonlite::find(err.data, "exception")->is_null(), "absent exception is null");
  const auto& events = t.spans()[0].events();
  expect(jsonlite::get_string(events[0].data, "model") == "gpt-4", "llm_request model key");
  expect(jsonlite::get_string(events[2].data, "tool") == "override", "extra keys win");
  expect(jsonlite::get_string(events[3].data, "new") == "b", "state_change keys");
}

void test_recorder_scope_closes_on_exception() {
  agentreplay::Recorder rec;
  try {
    auto scope = rec.span("risky");
    rec.tool_call("explode");
    throw std::runtime_error("tool failed");
  } catch (const std::runtime_error&) {
  }
  expect(rec.current_span() == nullptr, "current span restored after throw");
  expect(!rec.trace().spans()[0].is_open(), "span closed on the exception path");
}

void test_recorder_finish_saves() {
  const fs::path dir = scratch_dir("recorder");
  const std::string path = (dir / "out" / "run.jsonl").string();
  TraceError err;
  const int answer = agentreplay::record_trace(
      "decorated", path,
      [](agentreplay::Recorder& rec) {
        rec.log("hello");
        return 42;
      },
      &err);
  expect(answer == 42, "record_trace returns fn's result");
  auto t = Trace::load(path, &err);
  expect(t.has_value(), "recorder output saved: " + err.message);
  expect(t->name() == "decorated" && t->event_count() == 1, "saved trace content");
  expect(t->end_time().has_value(), "saved trace is closed");

  {
    agentreplay::Recorder scoped("scoped", {}, (dir / "scoped.jsonl").string());
    scoped.log("x");
  }
  expect(fs::exists(dir / "scoped.jsonl"), "destructor finishes and saves");
}

// ============================================================================
// Observability, config, version
// ============================================================================

std::vector<agentreplay::OperationEvent>* g_captured = nullptr;

void capture_hook(const agentreplay::OperationEvent& ev) {
  if (g_captured) g_captured->push_back(ev);
}

void test_operation_events_and_stats() {
  const fs::path dir = scratch_dir("observability");
  auto& stats = agentreplay::global_engine_stats();
  const uint64_t saved0 = stats.traces_saved.load();
  const uint64_t loaded0 = stats.traces_loaded.load();
  const uint64_t failed0 = stats.load_failures.load();
  const uint64_t diffs0 = stats.diffs_run.load();
  const uint64_t crit0 = stats.critical_divergences.load();

  std::vector<agentreplay::OperationEvent> captured;
  g_captured = &captured;
  agentreplay::set_operation_event_hook(capture_hook);

  const Trace t = sample_trace();
  const std::string path = (dir / "t.jsonl").string();
  expect(t.save(path), "save");
  expect(Trace::load(path).has_value(), "load");
  expect(!Trace::load((dir / "missing.jsonl").string()), "missing load");
  const Trace a = linear_trace({{EventType::tool_call, {{"tool", "a"}}}});
  const Trace b = linear_trace({{EventType::tool_call, {{"tool", "b"}}}});
  agentreplay::diff_traces(a, b);

  agentreplay::set_operation_event_hook(nullptr);
  g_captured = nullptr;

  expect(captured.size() == 4, "one event per operation");
  expect(captured[0].operation == "save" && captured[0].ok, "save event");
  expect(captured[1].operation == "load" && captured[1].trace_id == t.trace_id(), "load event");
  expect(captured[2].ok == false && captured[2].error_code == "not_found", "failed load event");
  expect(captured[3].operation == "diff" && captured[3].critical_count == 1, "diff event");

  expect(stats.traces_saved.load() == saved0 + 1, "traces_saved counter");
  expect(stats.traces_loaded.load() == loaded0 + 1, "traces_loaded counter");
  expect(stats.load_failures.load() == failed0 + 1, "load_failures counter");
  expect(stats.diffs_run.load() == diffs0 + 1, "diffs_run counter");
  expect(stats.critical_divergences.load() == crit0 + 1, "critical_divergences counter");

  std::optional<jsonlite::JsonError> jerr;
  jsonlite::parse(stats.to_json(), &jerr);
  expect(!jerr, "stats JSON parses");
}

void test_event_log_sink() {
  const fs::path dir = scratch_dir("event_log");
  const agentreplay::Config saved = agentreplay::global_config();
  agentreplay::Config c = saved;
  c.event_log_path = (dir / "events.jsonl").string();
  agentreplay::set_global_config(c);

  const Trace t = sample_trace();
  expect(t.save((dir / "t.jsonl").string()), "save");
  agentreplay::set_global_config(saved);

  const std::string log = read_text(dir / "events.jsonl");
  expect(log.find("\"operation\":\"save\"") != std::string::npos, "save line logged");
  expect(log.find(t.trace_id()) != std::string::npos, "trace id logged");
  expect(log.find("gpt-4") == std::string::npos, "payload contents never logged");
}

void test_latency_histogram() {
  agentreplay::LatencyHistogram h;
  expect(h.percentile(0.5) == 0.0, "empty histogram");
  for (int i = 0; i < 100; ++i) h.record(5000);  // 5us
  expect(h.count() == 100, "count");
  expect(h.mean_us() == 5.0, "mean");
  const double p50 = h.percentile(0.5);
  expect(p50 >= 4.0 && p50 <= 8.0, "p50 within 5us bucket");
  expect(p50 == 5.0, "percentile capped at the largest sample");

  agentreplay::LatencyHistogram mixed;
  for (int i = 0; i < 99; ++i) mixed.record(5000);
  mixed.record(1000000);  // 1000us
  expect(mixed.max_us() == 1000, "max tracked");
  expect(mixed.percentile(0.99) == 8.0, "p99 is the 5us bucket bound");
  expect(mixed.percentile(1.0) == 1000.0, "p100 is the outlier");
  expect(agentreplay::LatencyHistogram::bucket_index(0) == 0, "sub-us bucket");
  expect(agentreplay::LatencyHistogram::bucket_index(5) == 3, "5us bucket");
  expect(agentreplay::LatencyHistogram::bucket_index(~uint64_t{0}) ==
             agentreplay::LatencyHistogram::kBuckets - 1,
         "overflow bucket");
}

void test_config_from_env() {
  setenv("AGENTREPLAY_ZSTD_LEVEL", "99", 1);
  setenv("AGENTREPLAY_PREVIEW_CHARS", "abc", 1);
  setenv("AGENTREPLAY_EVENT_LOG", "/tmp/agentreplay-events.jsonl", 1);
  agentreplay::Config c = agentreplay::load_config();
  expect(c.zstd_level == 19, "zstd level clamped");
  expect(c.preview_chars == 120, "invalid preview falls back to default");
  expect(c.event_log_path == "/tmp/agentreplay-events.jsonl", "event log path");
  unsetenv("AGENTREPLAY_ZSTD_LEVEL");
  unsetenv("AGENTREPLAY_PREVIEW_CHARS");
  unsetenv("AGENTREPLAY_EVENT_LOG");
  c = agentreplay::load_config();
  expect(c.zstd_level == 3 && c.event_log_path.empty(), "defaults");
}

void test_version_manifest() {
  const std::string json =
      agentreplay::version::manifest_to_json(agentreplay::version::current_manifest());
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  expect(!err, "manifest JSON parses");
  expect(jsonlite::get_u64(obj, "trace_format") == agentreplay::version::TRACE_FORMAT_VERSION,
         "trace_format version");
  expect(jsonlite::get_string(obj, "semver") == "0.1.0", "semver");
}

// ============================================================================
// Presentation / export
// ============================================================================

void test_viewer_renderings() {
  const Trace t = sample_trace();
  const std::string full = agentreplay::render_trace(t);
  expect(full.find("Agent Trace: sample") != std::string::npos, "trace header");
  expect(full.find("TOOL CALL") != std::string::npos, "event label");
  expect(full.find("search(") != std::string::npos, "tool_call preview");

  const std::string tree = agentreplay::render_tree(t);
  expect(tree.find("  + plan") != std::string::npos, "root at depth 1");
  expect(tree.find("    + act") != std::string::npos, "child nested one level deeper");

  agentreplay::Replayer r(t);
  expect(agentreplay::render_step(r).rfind("[1/5] plan", 0) == 0, "step line");
  r.jump(4);
  r.step();
  expect(agentreplay::render_step(r) == "End of trace\n", "end of trace");

  const Trace a = linear_trace({{EventType::tool_call, {{"tool", "a"}}}});
  const Trace b = linear_trace({{EventType::tool_call, {{"tool", "b"}}}});
  const std::string diff = agentreplay::render_diff(agentreplay::diff_traces(a, b));
  expect(diff.find("[CRITICAL]") != std::string::npos, "severity rendered");
  expect(diff.find("Found 1 divergence(s)") != std::string::npos, "summary rendered");
}

void test_preview_keeps_utf8_whole() {
  // "ab" then U+00E9 (2 bytes) then U+4F60 (3 bytes).
  const Event e = Event::make(EventType::log, {{"message", "ab\xC3\xA9\xE4\xBD\xA0z"}});
  expect(agentreplay::event_preview(e, 3) == "ab...", "cut inside 2-byte sequence backs up");
  expect(agentreplay::event_preview(e, 4) == "ab\xC3\xA9...", "cut on a boundary keeps the char");
  expect(agentreplay::event_preview(e, 6) == "ab\xC3\xA9...", "cut inside 3-byte sequence backs up");
  expect(agentreplay::event_preview(e, 64) == "ab\xC3\xA9\xE4\xBD\xA0z", "short message untouched");
}

void test_export_json_and_html() {
  const fs::path dir = scratch_dir("export");
  Trace t("<script>");
  t.add_span("s").add_event(EventType::log, {{"message", "a & b"}});
  t.close();

  TraceError err;
  const fs::path json_path = dir / "t.json";
  expect(agentreplay::export_json(t, json_path.string(), &err), "export_json ok");
  std::optional<jsonlite::JsonError> jerr;
  auto obj = jsonlite::parse(read_text(json_path), &jerr);
  expect(!jerr, "exported JSON parses");
  expect(read_text(json_path).find("\n  \"") != std::string::npos, "two-space indentation");
  auto back = Trace::from_json(obj, &err);
  expect(back && back->trace_id() == t.trace_id() && back->event_count() == 1,
         "export reads back through from_json");

  const fs::path html_path = dir / "t.html";
  expect(agentreplay::export_html(t, html_path.string(), &err), "export_html ok");
  const std::string html = read_text(html_path);
  expect(html.find("&lt;script&gt;") != std::string::npos, "trace name escaped");
  expect(html.find("<script>") == std::string::npos, "no raw markup from trace");
  expect(html.find("a &amp; b") != std::string::npos, "payload escaped");

  TraceError werr;
  expect(!agentreplay::export_json(t, (dir / "no_dir" / "x" / "t.json").string(), &werr) &&
             werr.code == ErrorCode::io_error,
         "unwritable export path is io_error");
}

}  // namespace

int main() {
  std::cout << "=== agentreplay Test Suite ===\n";

  std::cout << "\n[JSON]\n";
  run_test("unicode escapes", test_json_unicode_escapes);
  run_test("duplicate key rejected", test_json_duplicate_key_rejected);
  run_test("duplicate key last wins", test_json_duplicate_key_last_wins);
  run_test("nesting limit", test_json_nesting_limit);
  run_test("double round-trip", test_json_double_roundtrip);
  run_test("numeric equality", test_json_numeric_equality);

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[Data model]\n";
  run_test("event type wire strings", test_event_type_strings);
  run_test("id shapes", test_id_shapes);
  run_test("span reference stability", test_span_reference_stability);
  run_test("event reference stability", test_event_reference_stability);
  run_test("close overwrites end_time", test_close_overwrites_end_time);
  run_test("trace close closes open spans", test_trace_close_only_closes_open_spans);
  run_test("all_events stable order", test_all_events_stable_order);
  run_test("get_span and SpanIndex", test_get_span_and_index);

  std::cout << "\n[Persistence]\n";
  run_test("save/load round-trip", test_save_load_roundtrip);
  run_test("dictionary form round-trip", test_dictionary_form_roundtrip);
  run_test("missing file", test_load_missing_file);
  run_test("bad line is format_error", test_load_bad_line_is_format_error);
  run_test("deep nesting is format_error", test_load_deep_nesting_is_format_error);
  run_test("duplicate keys last wins", test_load_duplicate_keys_last_wins);
  run_test("malformed span is format_error", test_load_malformed_span_is_format_error);
  run_test("tolerant defaults", test_load_tolerant_defaults);
  run_test("ASCII escapes decode", test_load_decodes_ascii_escapes);
  run_test("zstd persistence", test_zstd_persistence);

  std::cout << "\n[Replay]\n";
  run_test("step through", test_replay_step_through);
  run_test("step back", test_replay_step_back);
  run_test("jump", test_replay_jump);
  run_test("current span events", test_replay_current_span_events);
  run_test("search", test_replay_search);
  run_test("fingerprint stable across reload", test_replay_fingerprint_stable);

  std::cout << "\n[Diff]\n";
  run_test("identity", test_diff_identity);
  run_test("extra event warning", test_diff_extra_event_warning);
  run_test("tool change critical", test_diff_tool_change_critical);
  run_test("type and decision divergence", test_diff_type_and_decision);
  run_test("content info and defaults", test_diff_content_info_and_defaults);
  run_test("JSON shape", test_diff_json_shape);

  std::cout << "\n[Scenarios]\n";
  run_test("tool swap", test_scenario_tool_swap);
  run_test("response appended", test_scenario_response_appended);
  run_test("nested spans", test_scenario_nested_spans);

  std::cout << "\n[Recorder]\n";
  run_test("nested scopes", test_recorder_nested_scopes);
  run_test("default span and payloads", test_recorder_default_span_and_payloads);
  run_test("scope closes on exception", test_recorder_scope_closes_on_exception);
  run_test("finish saves", test_recorder_finish_saves);

  std::cout << "\n[Observability / config / version]\n";
  run_test("operation events and stats", test_operation_events_and_stats);
  run_test("event log sink", test_event_log_sink);
  run_test("latency histogram", test_latency_histogram);
  run_test("config from environment", test_config_from_env);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Presentation / export]\n";
  run_test("viewer renderings", test_viewer_renderings);
  run_test("preview keeps UTF-8 whole", test_preview_keeps_utf8_whole);
  run_test("export JSON and HTML", test_export_json_and_html);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
