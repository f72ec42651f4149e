#include "agentreplay/observability.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdio>
#include <string>

#include "agentreplay/config.hpp"
#include "agentreplay/jsonlite.hpp"

namespace agentreplay {

namespace {

std::atomic<OperationEventHook> g_event_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

std::size_t LatencyHistogram::bucket_index(uint64_t duration_us) {
  // bit_width(0) == 0, so sub-microsecond samples land in bucket 0.
  return std::min(static_cast<std::size_t>(std::bit_width(duration_us)), kBuckets - 1);
}

double LatencyHistogram::bucket_upper_us(std::size_t index) {
  return static_cast<double>(uint64_t{1} << index);
}

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_index(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);

  uint64_t seen = max_us_.load(std::memory_order_relaxed);
  while (us > seen && !max_us_.compare_exchange_weak(seen, us, std::memory_order_relaxed)) {
  }
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count();
  return n == 0 ? 0.0 : static_cast<double>(sum_us()) / static_cast<double>(n);
}

// Nearest-rank over the bucket counts, reported as the bucket's upper bound
// and capped at the largest sample seen.
double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count();
  if (n == 0) return 0.0;
  p = std::clamp(p, 0.0, 1.0);
  const uint64_t rank = std::max<uint64_t>(1, static_cast<uint64_t>(std::ceil(p * static_cast<double>(n))));

  const double ceiling = static_cast<double>(max_us());
  uint64_t seen = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    seen += buckets_[i].load(std::memory_order_relaxed);
    if (seen >= rank) return std::min(bucket_upper_us(i), std::max(ceiling, 1.0));
  }
  return ceiling;
}

std::string LatencyHistogram::to_json() const {
  jsonlite::Object o;
  o["count"] = count();
  o["max_us"] = max_us();
  o["mean_us"] = mean_us();
  o["p50_us"] = percentile(0.50);
  o["p95_us"] = percentile(0.95);
  o["p99_us"] = percentile(0.99);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record(const OperationEvent& ev) {
  if (ev.operation == "load") {
    (ev.ok ? traces_loaded : load_failures).fetch_add(1, std::memory_order_relaxed);
    load_latency.record(ev.duration_ns);
  } else if (ev.operation == "save") {
    (ev.ok ? traces_saved : save_failures).fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "replay_open") {
    if (ev.ok) replays_opened.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "diff") {
    diffs_run.fetch_add(1, std::memory_order_relaxed);
    divergences_found.fetch_add(ev.divergence_count, std::memory_order_relaxed);
    critical_divergences.fetch_add(ev.critical_count, std::memory_order_relaxed);
    diff_latency.record(ev.duration_ns);
  }
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"traces_loaded\":";
  out += std::to_string(traces_loaded.load(std::memory_order_relaxed));
  out += ",\"load_failures\":";
  out += std::to_string(load_failures.load(std::memory_order_relaxed));
  out += ",\"traces_saved\":";
  out += std::to_string(traces_saved.load(std::memory_order_relaxed));
  out += ",\"save_failures\":";
  out += std::to_string(save_failures.load(std::memory_order_relaxed));
  out += ",\"replays_opened\":";
  out += std::to_string(replays_opened.load(std::memory_order_relaxed));
  out += ",\"diff\":{\"runs\":";
  out += std::to_string(diffs_run.load(std::memory_order_relaxed));
  out += ",\"divergences\":";
  out += std::to_string(divergences_found.load(std::memory_order_relaxed));
  out += ",\"critical\":";
  out += std::to_string(critical_divergences.load(std::memory_order_relaxed));
  out += "}";
  out += ",\"latency\":{\"load\":";
  out += load_latency.to_json();
  out += ",\"diff\":";
  out += diff_latency.to_json();
  out += "}}";
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

std::string operation_event_to_json(const OperationEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"operation\":\"";
  line += jsonlite::escape(ev.operation);
  line += "\",\"trace_id\":\"";
  line += jsonlite::escape(ev.trace_id);
  line += "\",\"path\":\"";
  line += jsonlite::escape(ev.path);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"event_count\":";
  line += std::to_string(ev.event_count);
  line += ",\"divergence_count\":";
  line += std::to_string(ev.divergence_count);
  line += ",\"critical_count\":";
  line += std::to_string(ev.critical_count);
  line += "}";
  return line;
}

void set_operation_event_hook(OperationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_operation_event(const OperationEvent& ev) {
  global_engine_stats().record(ev);

  if (OperationEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const std::string& log_path = global_config().event_log_path;
  if (log_path.empty()) return;

  const std::string line = operation_event_to_json(ev) + "\n";
  // O_APPEND keeps short lines from concurrent writers intact on POSIX.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace agentreplay
