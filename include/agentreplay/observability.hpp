#pragma once

// agentreplay/observability.hpp: Structured operation observability.
//
// DESIGN:
//   OperationEvent is the observable unit. Every Trace::load(), Trace::save(),
//   diff_traces() and Replayer::from_file() call emits one, which is:
//     - always folded into the process-wide EngineStats;
//     - forwarded to the installed hook, if any;
//     - otherwise appended as one compact JSON line to the configured event
//       log (Config::event_log_path / AGENTREPLAY_EVENT_LOG).
//
//   Events carry identifiers, sizes and outcomes only. Payload contents never
//   reach the log.
//
// Invariant: emission never fails the operation that emitted it. A sink that
// cannot be opened drops the line.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace agentreplay {

struct OperationEvent {
  std::string operation;  // "load" | "save" | "diff" | "replay_open"
  std::string trace_id;   // for diff: "<a>..<b>"
  std::string path;
  bool ok{false};
  std::string error_code;  // to_string(ErrorCode) on failure
  uint64_t duration_ns{0};
  std::size_t event_count{0};
  std::size_t divergence_count{0};
  std::size_t critical_count{0};
};

std::string operation_event_to_json(const OperationEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i holds samples whose microsecond value has bit width i, so bucket 0
// is [0, 1us) and bucket i (i >= 1) is [2^(i-1) us, 2^i us). The last bucket
// absorbs everything beyond.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Upper bound in microseconds of the bucket holding the p-th sample,
  // p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  uint64_t max_us() const { return max_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

  static std::size_t bucket_index(uint64_t duration_us);
  static double bucket_upper_us(std::size_t index);

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
  std::atomic<uint64_t> max_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats: process-wide aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe; all counters are relaxed atomics. Printed by `agentreplay
// --stats`.
class EngineStats {
 public:
  void record(const OperationEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> traces_loaded{0};
  std::atomic<uint64_t> load_failures{0};
  std::atomic<uint64_t> traces_saved{0};
  std::atomic<uint64_t> save_failures{0};
  std::atomic<uint64_t> replays_opened{0};
  std::atomic<uint64_t> diffs_run{0};
  std::atomic<uint64_t> divergences_found{0};
  std::atomic<uint64_t> critical_divergences{0};

  LatencyHistogram load_latency;
  LatencyHistogram diff_latency;
};

EngineStats& global_engine_stats();

// Emit an operation event (fire-and-forget).
void emit_operation_event(const OperationEvent& ev);

// Replaces the file sink while installed. Pass nullptr to restore it.
using OperationEventHook = void (*)(const OperationEvent&);
void set_operation_event_hook(OperationEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};

  uint64_t elapsed_ns() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace agentreplay
