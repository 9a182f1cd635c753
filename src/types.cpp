#include "floodgate/types.hpp"

namespace floodgate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::write_failed: return "write_failed";
    case ErrorCode::event_not_found: return "event_not_found";
    case ErrorCode::collation_conflict: return "collation_conflict";
    case ErrorCode::corrupt_journal: return "corrupt_journal";
    case ErrorCode::missing_object: return "missing_object";
    case ErrorCode::unsupported_format: return "unsupported_format";
    case ErrorCode::json_parse_error: return "json_parse_error";
  }
  return "";
}

Timestamp system_now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

FloodError::FloodError(ErrorCode code, const std::string& message)
    : std::runtime_error(to_string(code) + ": " + message), code_(code) {}

std::string to_string(OverlayKind kind) {
  switch (kind) {
    case OverlayKind::update: return "UPDATE";
    case OverlayKind::remove: return "DELETE";
  }
  return "";
}

std::optional<OverlayKind> overlay_kind_from_string(const std::string& s) {
  if (s == "UPDATE") return OverlayKind::update;
  if (s == "DELETE") return OverlayKind::remove;
  return std::nullopt;
}

std::string to_string(LookupStatus status) {
  switch (status) {
    case LookupStatus::found: return "found";
    case LookupStatus::not_found: return "not_found";
    case LookupStatus::deleted: return "deleted";
  }
  return "";
}

}  // namespace floodgate
