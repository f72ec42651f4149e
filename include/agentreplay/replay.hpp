#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "agentreplay/trace.hpp"
#include "agentreplay/types.hpp"

namespace agentreplay {

/**
 * @brief One tape entry: the event under the cursor and the span owning it.
 *
 * Pointers refer into the Replayer's own copy of the trace and stay valid for
 * the Replayer's lifetime.
 */
struct ReplayStep {
  const Span* span{nullptr};
  const Event* event{nullptr};
  std::size_t index{0};  // 0-based tape index of this entry
};

/**
 * @brief Step-through cursor over a trace's canonical event order.
 *
 * The tape is built once at construction: every (span, event) pair, spans in
 * storage order and events in span order, stable-sorted by timestamp. The
 * cursor position always lies in [0, total_steps()].
 */
class Replayer {
 public:
  explicit Replayer(Trace trace);

  /**
   * @brief Loads a trace file and builds a replayer over it.
   * @return nullopt with error filled (not_found / format_error) on failure.
   */
  static std::optional<Replayer> from_file(const std::string& path, TraceError* error = nullptr);

  const Trace& trace() const { return trace_; }
  std::size_t total_steps() const { return tape_.size(); }
  std::size_t position() const { return position_; }
  bool at_end() const { return position_ >= tape_.size(); }

  // Returns the entry at position, then advances. Empty at the end.
  std::optional<ReplayStep> step();

  // Decrements, then returns the entry. Empty at position 0.
  std::optional<ReplayStep> step_back();

  // Entry at position without moving. Empty at the end.
  std::optional<ReplayStep> peek() const;

  /**
   * @brief Moves the cursor to target and returns the entry there.
   *
   * Valid targets are [0, total_steps()). Anything else sets range_error in
   * last_error() (and *error) and leaves position() unchanged.
   */
  std::optional<ReplayStep> jump(std::size_t target, TraceError* error = nullptr);

  void reset() { position_ = 0; }

  // Every entry of the span owning min(position, total_steps - 1).
  std::vector<ReplayStep> current_span_events() const;

  // Tape indices whose span name, event-type label or serialized payload
  // contains query, ASCII case-insensitive.
  std::vector<std::size_t> search(const std::string& query) const;

  // Entry at an arbitrary tape index, without moving.
  std::optional<ReplayStep> at(std::size_t index) const;

  // BLAKE3 over the ordered "span_id:event_id" lines of the tape.
  std::string fingerprint() const;

  const TraceError& last_error() const { return last_error_; }

 private:
  ReplayStep make_step(std::size_t index) const;

  Trace trace_;
  std::vector<EventRef> tape_;
  std::size_t position_{0};
  TraceError last_error_;
};

}  // namespace agentreplay
