#pragma once

// floodgate/keys.hpp - Key codec and persisted namespace layout.
//
// ORDERING INVARIANT:
//   For every encoder below, byte-lexicographic order of the produced strings
//   equals the logical order of the encoded tuples. Timestamps are rendered
//   in a fixed-width text form so that string comparison and time comparison
//   agree:
//
//     YYYY-MM-DDTHHMMSS.ffffffZ      (UTC, microseconds, 25 chars)
//
//   A loose key is <ts>--<event id>; since <ts> has a fixed width the first
//   25 bytes decide the timestamp order and the event id breaks ties.
//
// LAYOUT (below <root>/):
//   loose/<ts>--<event id>                         payload, content metadata
//   journal/<journal id>                           concatenated payloads
//   journal-index/<journal id>                     JSON index document
//   key-index/<max ts>--<journal id>               JSON key index entry
//   overlay/<overlay id>                           overlay payload
//   overlay-index/<event id>/<overlay id>--<KIND>  empty marker object
//   event-index/<event id>/<revision:10>           locator (metadata only)
//   collation-marker/<revision:10>                 JSON marker
//
// Decoders never throw; malformed input yields nullopt.

#include <cstdint>
#include <optional>
#include <string>

#include "floodgate/types.hpp"

namespace floodgate {

constexpr const char* kKeyDelimiter = "--";
constexpr std::size_t kTimestampWidth = 25;
constexpr std::size_t kMaxEventIdBytes = 512;

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------
Timestamp distant_past();  // 0001-01-01T000000.000000Z
Timestamp far_future();    // 5000-01-01T000000.000000Z

// Throws FloodError(invalid_argument) for years outside 0001..9999.
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(const std::string& text);

// Non-empty, at most kMaxEventIdBytes, no '/', no NUL, not "." or "..".
bool valid_event_id(const std::string& event_id);

// Zero-padded 10 digit decimal, e.g. 0000000042.
std::string format_revision(uint64_t revision);
std::optional<uint64_t> parse_revision(const std::string& text);

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------
struct LooseKeyParts {
  Timestamp timestamp{};
  std::string event_id;
};

struct JournalIdParts {
  Timestamp min_ts{};
  uint64_t sequence{0};
};

struct OverlayIdParts {
  Timestamp written_at{};
  uint64_t sequence{0};
  std::string node_tag;
};

struct KeyIndexKeyParts {
  Timestamp max_ts{};
  std::string journal_id;
};

// <min ts>--<sequence:10>
std::string make_journal_id(Timestamp min_ts, uint64_t sequence);
std::optional<JournalIdParts> decode_journal_id(const std::string& journal_id);

// <written at>--<sequence:10>-<node tag>
std::string make_overlay_id(Timestamp written_at, uint64_t sequence, const std::string& node_tag);
std::optional<OverlayIdParts> decode_overlay_id(const std::string& overlay_id);

// ---------------------------------------------------------------------------
// KeyLayout - every namespace below one root prefix
// ---------------------------------------------------------------------------
class KeyLayout {
 public:
  explicit KeyLayout(std::string root_prefix = "floodgate");

  const std::string& root() const { return root_; }

  // Loose events.
  std::string loose_prefix() const;
  std::string encode(Timestamp ts, const std::string& event_id) const;
  std::string loose_bound(Timestamp ts) const;  // sorts before every loose key at ts
  std::optional<LooseKeyParts> decode_loose(const std::string& key) const;

  // Journals.
  std::string encode_journal(const std::string& journal_id) const;
  std::string encode_journal_index(const std::string& journal_id) const;

  // Key index.
  std::string key_index_prefix() const;
  std::string encode_key_index(Timestamp max_ts, const std::string& journal_id) const;
  std::optional<KeyIndexKeyParts> decode_key_index(const std::string& key) const;

  // Overlays.
  std::string encode_overlay(const std::string& overlay_id) const;
  std::string overlay_index_prefix(const std::string& event_id) const;
  std::string encode_overlay_index(const std::string& event_id, const std::string& overlay_id,
                                   OverlayKind kind) const;
  std::optional<OverlayRecord> decode_overlay_index(const std::string& key) const;

  // Event locators.
  std::string event_index_prefix(const std::string& event_id) const;
  std::string encode_event_index(const std::string& event_id, uint64_t revision) const;
  std::optional<uint64_t> decode_event_index(const std::string& key) const;

  // Collation marker.
  std::string marker_prefix() const;
  std::string encode_marker(uint64_t revision) const;
  std::optional<uint64_t> decode_marker(const std::string& key) const;

 private:
  std::string ns(const char* name) const;

  std::string root_;
};

}  // namespace floodgate
