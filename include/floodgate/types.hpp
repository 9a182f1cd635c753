#pragma once

// floodgate/types.hpp - Core data structures for the floodgate event log.
//
// MEMORY OWNERSHIP:
//   - All public types are value types. Strings and maps are value-owned.
//   - Operations return results by value. Callers own them.
//   - Store handles are shared via std::shared_ptr<IObjectStore>.
//
// ERROR MODEL:
//   - Object store backends report failure by return value (bool / optional).
//   - The core converts logical failures into FloodError, which carries an
//     ErrorCode. Status-like outcomes (event not found, event deleted) are
//     reported in result structs instead of exceptions.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace floodgate {

enum class ErrorCode {
  none,
  invalid_argument,
  write_failed,
  event_not_found,
  collation_conflict,
  corrupt_journal,
  missing_object,
  unsupported_format,
  json_parse_error,
};

std::string to_string(ErrorCode code);

// Thrown by the core for every condition it can detect. Never thrown by
// store backends.
class FloodError : public std::runtime_error {
 public:
  FloodError(ErrorCode code, const std::string& message);

  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

// Event timestamps have microsecond resolution and are always UTC.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

// Injectable time source; tests pin it, production uses system_now.
using Clock = std::function<Timestamp()>;
Timestamp system_now();

using Metadata = std::map<std::string, std::string>;

struct Event {
  std::string event_id;
  Timestamp timestamp{};
  std::string payload;
  Metadata metadata;
};

// Inclusive time window. Unset bounds mean distant past / far future.
struct TimeWindow {
  std::optional<Timestamp> from;
  std::optional<Timestamp> to;
};

// ---------------------------------------------------------------------------
// Journal index records
// ---------------------------------------------------------------------------
struct JournalEntry {
  std::string event_id;
  Timestamp timestamp{};
  uint64_t offset{0};
  uint64_t size{0};
  std::string digest;  // payload digest, "evt:" domain
  Metadata metadata;
};

struct JournalIndex {
  uint32_t format_version{0};
  std::string journal_id;
  Timestamp from{};
  Timestamp to{};
  uint64_t size{0};
  std::vector<JournalEntry> events;
};

struct KeyIndexEntry {
  std::string journal_id;
  Timestamp min_ts{};
  Timestamp max_ts{};
  uint64_t event_count{0};
  uint64_t size{0};
};

// ---------------------------------------------------------------------------
// Overlays
// ---------------------------------------------------------------------------
enum class OverlayKind { update, remove };

std::string to_string(OverlayKind kind);
std::optional<OverlayKind> overlay_kind_from_string(const std::string& s);

struct OverlayRecord {
  std::string overlay_id;
  std::string event_id;
  OverlayKind kind{OverlayKind::update};
};

// Result of resolving overlays for one event id.
struct OverlayDecision {
  enum class Kind { none, update, remove };
  Kind kind{Kind::none};
  std::string overlay_id;  // empty when kind == none
  std::string payload;     // replacement payload when kind == update
};

// ---------------------------------------------------------------------------
// Collation
// ---------------------------------------------------------------------------
struct CollationMarker {
  std::string last_key;    // last loose key folded into a journal
  std::string journal_id;  // journal that folded it
  uint64_t revision{0};
};

struct CollationResult {
  uint64_t events_folded{0};
  std::optional<std::string> journal_id;  // unset = nothing to do
  uint64_t bytes_written{0};
  uint64_t events_pending{0};  // loose events seen but not folded
  std::optional<std::string> recovered_journal_id;
};

// ---------------------------------------------------------------------------
// Read side
// ---------------------------------------------------------------------------
enum class EventSource { journal, loose };

struct MergedEvent {
  std::string event_id;
  Timestamp timestamp{};
  std::string payload;
  Metadata metadata;
  EventSource source{EventSource::loose};
  std::string source_ref;  // journal id or loose key
  bool updated{false};
};

struct ByteRange {
  uint64_t offset{0};
  uint64_t length{0};
};

// One fetchable unit of a replay manifest.
struct ManifestEntry {
  std::string event_id;
  Timestamp timestamp{};
  std::string locator;  // presigned locator of `key`
  std::string key;      // store key the locator refers to
  std::optional<ByteRange> range;
  EventSource source{EventSource::loose};  // where the base event lives
  std::string source_ref;                  // journal id or loose key
  OverlayDecision::Kind decision{OverlayDecision::Kind::none};
  std::string overlay_id;
  std::string digest;  // expected payload digest, empty if unknown
  Metadata metadata;
};

enum class LookupStatus { found, not_found, deleted };

struct GetEventResult {
  LookupStatus status{LookupStatus::not_found};
  Event event;  // populated when status == found
};

std::string to_string(LookupStatus status);

}  // namespace floodgate
