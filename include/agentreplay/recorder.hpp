#pragma once

// agentreplay/recorder.hpp: Capture an agent run into a Trace.
//
// USAGE:
//   Recorder rec("my-agent", {}, "run.jsonl");
//   {
//     auto plan = rec.span("plan");
//     rec.llm_request("gpt-4", messages);
//     rec.llm_response("Hello!", 42);
//   }                      // span closed here, even on exception
//   rec.finish(&err);      // closes the trace, saves atomically
//
// Spans opened through span() nest: the new span's parent is whichever span
// is current, and the SpanScope guard restores the previous current span when
// it goes out of scope. Events recorded with no span open land in a span
// named "default", created on first use.

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "agentreplay/jsonlite.hpp"
#include "agentreplay/trace.hpp"
#include "agentreplay/types.hpp"

namespace agentreplay {

class Recorder {
 public:
  explicit Recorder(std::string name = "agent-run", jsonlite::Object metadata = {},
                    std::string output_path = "");
  // Calls finish() unless it already ran. A failed save is reported on stderr.
  ~Recorder();

  Recorder(const Recorder&) = delete;
  Recorder& operator=(const Recorder&) = delete;

  // Move-only guard for one open span.
  class SpanScope {
   public:
    SpanScope(SpanScope&& other) noexcept;
    SpanScope& operator=(SpanScope&&) = delete;
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    ~SpanScope();

    Span& span() { return *span_; }
    const Span& span() const { return *span_; }

   private:
    friend class Recorder;
    SpanScope(Recorder* recorder, Span* span, Span* previous)
        : recorder_(recorder), span_(span), previous_(previous) {}

    Recorder* recorder_;
    Span* span_;
    Span* previous_;
  };

  [[nodiscard]] SpanScope span(std::string name, jsonlite::Object metadata = {});

  // Returned events stay valid for the life of the recorder.
  const Event& event(EventType type, jsonlite::Object data = {});

  // Payload helpers. Keys in extra are merged last and win over the fixed
  // keys.
  const Event& llm_request(const std::string& model, jsonlite::Array messages = {},
                           jsonlite::Object extra = {});
  const Event& llm_response(const std::string& content,
                            std::optional<long long> tokens = std::nullopt,
                            jsonlite::Object extra = {});
  const Event& tool_call(const std::string& tool, jsonlite::Object args = {},
                         jsonlite::Object extra = {});
  const Event& tool_result(const std::string& tool, jsonlite::Value result = nullptr,
                           jsonlite::Object extra = {});
  const Event& decision(const std::string& description, const std::string& choice = "",
                        jsonlite::Object extra = {});
  const Event& state_change(const std::string& key, jsonlite::Value old_value = nullptr,
                            jsonlite::Value new_value = nullptr, jsonlite::Object extra = {});
  const Event& log(const std::string& message, const std::string& level = "info",
                   jsonlite::Object extra = {});
  const Event& error(const std::string& message,
                     std::optional<std::string> exception = std::nullopt,
                     jsonlite::Object extra = {});

  // Closes the trace and, when an output path was given, saves it. May be
  // called again; each call re-closes and re-saves.
  bool finish(TraceError* error = nullptr);
  bool finished() const { return finished_; }

  Trace& trace() { return trace_; }
  const Trace& trace() const { return trace_; }
  const std::string& output_path() const { return output_path_; }
  const Span* current_span() const { return current_; }

 private:
  Span& ensure_span();

  Trace trace_;
  std::string output_path_;
  Span* current_{nullptr};
  bool finished_{false};
};

/**
 * @brief Runs fn(Recorder&) inside a fresh recorder and finishes it.
 *
 * The recorder is finished after fn returns, or by its destructor when fn
 * throws. fn's result is returned unchanged; a failed save is reported through
 * error.
 */
template <typename Fn>
auto record_trace(const std::string& name, const std::string& output_path, Fn&& fn,
                  TraceError* error = nullptr) {
  using Result = std::invoke_result_t<Fn, Recorder&>;
  Recorder rec(name, {}, output_path);
  if constexpr (std::is_void_v<Result>) {
    std::forward<Fn>(fn)(rec);
    rec.finish(error);
  } else {
    Result result = std::forward<Fn>(fn)(rec);
    rec.finish(error);
    return result;
  }
}

}  // namespace agentreplay
