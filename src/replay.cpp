#include "agentreplay/replay.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "agentreplay/hash.hpp"
#include "agentreplay/observability.hpp"

namespace agentreplay {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool contains_ci(const std::string& haystack, const std::string& needle_lower) {
  return lower(haystack).find(needle_lower) != std::string::npos;
}

}  // namespace

Replayer::Replayer(Trace trace) : trace_(std::move(trace)), tape_(canonical_order(trace_)) {}

std::optional<Replayer> Replayer::from_file(const std::string& path, TraceError* error) {
  ScopeTimer timer;
  TraceError local;
  auto trace = Trace::load(path, &local);
  if (!trace) {
    if (error) *error = local;
    return std::nullopt;
  }
  Replayer r(std::move(*trace));

  OperationEvent ev;
  ev.operation = "replay_open";
  ev.trace_id = r.trace().trace_id();
  ev.path = path;
  ev.ok = true;
  ev.duration_ns = timer.elapsed_ns();
  ev.event_count = r.total_steps();
  emit_operation_event(ev);
  return r;
}

ReplayStep Replayer::make_step(std::size_t index) const {
  const EventRef& ref = tape_[index];
  const Span& span = trace_.spans()[ref.span_index];
  return ReplayStep{&span, &span.events()[ref.event_index], index};
}

std::optional<ReplayStep> Replayer::step() {
  if (at_end()) return std::nullopt;
  ReplayStep s = make_step(position_);
  ++position_;
  return s;
}

std::optional<ReplayStep> Replayer::step_back() {
  if (position_ == 0) return std::nullopt;
  --position_;
  return make_step(position_);
}

std::optional<ReplayStep> Replayer::peek() const {
  if (at_end()) return std::nullopt;
  return make_step(position_);
}

std::optional<ReplayStep> Replayer::at(std::size_t index) const {
  if (index >= tape_.size()) return std::nullopt;
  return make_step(index);
}

std::optional<ReplayStep> Replayer::jump(std::size_t target, TraceError* error) {
  if (target >= tape_.size()) {
    fail(&last_error_, ErrorCode::range_error,
         "step " + std::to_string(target) + " out of range [0, " +
             std::to_string(tape_.size()) + ")");
    if (error) *error = last_error_;
    return std::nullopt;
  }
  last_error_ = TraceError{};
  position_ = target;
  return make_step(position_);
}

std::vector<ReplayStep> Replayer::current_span_events() const {
  std::vector<ReplayStep> out;
  if (tape_.empty()) return out;
  const std::size_t anchor = std::min(position_, tape_.size() - 1);
  // Compare by id, not storage slot: duplicated span ids in a hand-edited
  // file still group together.
  const std::string& span_id = trace_.spans()[tape_[anchor].span_index].span_id();
  for (std::size_t i = 0; i < tape_.size(); ++i) {
    if (trace_.spans()[tape_[i].span_index].span_id() == span_id) {
      out.push_back(make_step(i));
    }
  }
  return out;
}

std::vector<std::size_t> Replayer::search(const std::string& query) const {
  std::vector<std::size_t> hits;
  const std::string needle = lower(query);
  for (std::size_t i = 0; i < tape_.size(); ++i) {
    const ReplayStep s = make_step(i);
    if (contains_ci(s.span->name(), needle) ||
        contains_ci(to_string(s.event->event_type), needle) ||
        contains_ci(jsonlite::to_json(s.event->data), needle)) {
      hits.push_back(i);
    }
  }
  return hits;
}

std::string Replayer::fingerprint() const {
  std::string lines;
  lines.reserve(tape_.size() * 26);
  for (std::size_t i = 0; i < tape_.size(); ++i) {
    const ReplayStep s = make_step(i);
    lines += s.span->span_id();
    lines += ':';
    lines += s.event->event_id;
    lines += '\n';
  }
  return hash_domain("tape:", lines);
}

}  // namespace agentreplay
