#pragma once

// agentreplay/types.hpp: Error taxonomy shared by every core component.
//
// ERROR MODEL:
//   Data errors never throw. Fallible operations return std::optional / bool
//   and fill an optional TraceError* out-parameter. Callers that pass nullptr
//   still get the failure signalled through the return value.
//
//   format_error: malformed or unreadable persisted trace; load fails whole.
//   range_error : invalid replay cursor target; cursor left unchanged.
//   not_found   : missing trace path or span_id.
//   io_error    : a write did not reach the filesystem.

#include <string>

namespace agentreplay {

enum class ErrorCode {
  none,
  format_error,
  range_error,
  not_found,
  io_error,
};

std::string to_string(ErrorCode code);

struct TraceError {
  ErrorCode code{ErrorCode::none};
  std::string message;
};

// Fills *error when non-null. Always returns false so call sites can write
// `return fail(error, ...);`.
bool fail(TraceError* error, ErrorCode code, std::string message);

}  // namespace agentreplay
