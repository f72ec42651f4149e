#include "agentreplay/recorder.hpp"

#include <iostream>

namespace agentreplay {

namespace {

jsonlite::Object merged(jsonlite::Object base, jsonlite::Object extra) {
  for (auto& [k, v] : extra) base[k] = std::move(v);
  return base;
}

}  // namespace

Recorder::Recorder(std::string name, jsonlite::Object metadata, std::string output_path)
    : trace_(std::move(name), std::move(metadata)), output_path_(std::move(output_path)) {}

Recorder::~Recorder() {
  if (finished_) return;
  TraceError err;
  if (!finish(&err)) {
    std::cerr << "agentreplay: failed to save trace " << trace_.trace_id() << " to "
              << output_path_ << ": " << to_string(err.code) << ": " << err.message << "\n";
  }
}

// ---------------------------------------------------------------------------
// SpanScope
// ---------------------------------------------------------------------------

Recorder::SpanScope::SpanScope(SpanScope&& other) noexcept
    : recorder_(other.recorder_), span_(other.span_), previous_(other.previous_) {
  other.recorder_ = nullptr;
}

Recorder::SpanScope::~SpanScope() {
  if (!recorder_) return;
  span_->close();
  recorder_->current_ = previous_;
}

Recorder::SpanScope Recorder::span(std::string name, jsonlite::Object metadata) {
  std::optional<std::string> parent;
  if (current_) parent = current_->span_id();
  Span& s = trace_.add_span(std::move(name), std::move(parent), std::move(metadata));
  Span* previous = current_;
  current_ = &s;
  return SpanScope(this, &s, previous);
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

Span& Recorder::ensure_span() {
  if (!current_) current_ = &trace_.add_span("default");
  return *current_;
}

const Event& Recorder::event(EventType type, jsonlite::Object data) {
  return ensure_span().add_event(type, std::move(data));
}

const Event& Recorder::llm_request(const std::string& model, jsonlite::Array messages,
                                   jsonlite::Object extra) {
  jsonlite::Object d{{"model", model}, {"messages", std::move(messages)}};
  return event(EventType::llm_request, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::llm_response(const std::string& content, std::optional<long long> tokens,
                                    jsonlite::Object extra) {
  jsonlite::Object d{{"content", content},
                     {"tokens", tokens ? jsonlite::Value(*tokens) : jsonlite::Value()}};
  return event(EventType::llm_response, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::tool_call(const std::string& tool, jsonlite::Object args,
                                 jsonlite::Object extra) {
  jsonlite::Object d{{"tool", tool}, {"args", std::move(args)}};
  return event(EventType::tool_call, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::tool_result(const std::string& tool, jsonlite::Value result,
                                   jsonlite::Object extra) {
  jsonlite::Object d{{"tool", tool}, {"result", std::move(result)}};
  return event(EventType::tool_result, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::decision(const std::string& description, const std::string& choice,
                                jsonlite::Object extra) {
  jsonlite::Object d{{"description", description}, {"choice", choice}};
  return event(EventType::decision, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::state_change(const std::string& key, jsonlite::Value old_value,
                                    jsonlite::Value new_value, jsonlite::Object extra) {
  jsonlite::Object d{{"key", key}, {"old", std::move(old_value)}, {"new", std::move(new_value)}};
  return event(EventType::state_change, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::log(const std::string& message, const std::string& level,
                           jsonlite::Object extra) {
  jsonlite::Object d{{"message", message}, {"level", level}};
  return event(EventType::log, merged(std::move(d), std::move(extra)));
}

const Event& Recorder::error(const std::string& message, std::optional<std::string> exception,
                             jsonlite::Object extra) {
  jsonlite::Object d{{"message", message},
                     {"exception", exception ? jsonlite::Value(*exception) : jsonlite::Value()}};
  return event(EventType::error, merged(std::move(d), std::move(extra)));
}

// ---------------------------------------------------------------------------
// finish
// ---------------------------------------------------------------------------

bool Recorder::finish(TraceError* error) {
  finished_ = true;
  trace_.close();
  if (output_path_.empty()) return true;
  return trace_.save(output_path_, error);
}

}  // namespace agentreplay
