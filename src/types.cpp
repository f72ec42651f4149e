#include "agentreplay/types.hpp"

#include <utility>

namespace agentreplay {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::format_error: return "format_error";
    case ErrorCode::range_error: return "range_error";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::io_error: return "io_error";
  }
  return "";
}

bool fail(TraceError* error, ErrorCode code, std::string message) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace agentreplay
