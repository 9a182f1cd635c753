#include "floodgate/keys.hpp"

#include <cstdio>

namespace floodgate {

namespace {

bool all_digits(const std::string& s, std::size_t pos, std::size_t n) {
  if (pos + n > s.size()) return false;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

int read_int(const std::string& s, std::size_t pos, std::size_t n) {
  int out = 0;
  for (std::size_t i = pos; i < pos + n; ++i) out = out * 10 + (s[i] - '0');
  return out;
}

bool is_hex_lower(char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }

// Splits "<ts>--<rest>" into its two halves.
std::optional<std::pair<Timestamp, std::string>> split_ts_pair(const std::string& s) {
  if (s.size() < kTimestampWidth + 2) return std::nullopt;
  if (s.compare(kTimestampWidth, 2, kKeyDelimiter) != 0) return std::nullopt;
  auto ts = parse_timestamp(s.substr(0, kTimestampWidth));
  if (!ts) return std::nullopt;
  return std::make_pair(*ts, s.substr(kTimestampWidth + 2));
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------

Timestamp distant_past() {
  using namespace std::chrono;
  return Timestamp{sys_days{year{1} / January / 1}};
}

Timestamp far_future() {
  using namespace std::chrono;
  return Timestamp{sys_days{year{5000} / January / 1}};
}

std::string format_timestamp(Timestamp ts) {
  using namespace std::chrono;
  const auto day = floor<days>(ts);
  const year_month_day ymd{day};
  const int y = static_cast<int>(ymd.year());
  if (y < 1 || y > 9999) {
    throw FloodError(ErrorCode::invalid_argument, "timestamp out of range: year " + std::to_string(y));
  }
  const hh_mm_ss<microseconds> hms{ts - day};
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d%02d%02d.%06lldZ", y,
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()),
                static_cast<long long>(hms.subseconds().count()));
  return buf;
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
  using namespace std::chrono;
  // 0123456789012345678901234
  // YYYY-MM-DDTHHMMSS.ffffffZ
  if (text.size() != kTimestampWidth) return std::nullopt;
  if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[17] != '.' || text[24] != 'Z') {
    return std::nullopt;
  }
  if (!all_digits(text, 0, 4) || !all_digits(text, 5, 2) || !all_digits(text, 8, 2) ||
      !all_digits(text, 11, 6) || !all_digits(text, 18, 6)) {
    return std::nullopt;
  }
  const year_month_day ymd{year{read_int(text, 0, 4)},
                           month{static_cast<unsigned>(read_int(text, 5, 2))},
                           day{static_cast<unsigned>(read_int(text, 8, 2))}};
  if (!ymd.ok() || static_cast<int>(ymd.year()) < 1) return std::nullopt;
  const int hh = read_int(text, 11, 2);
  const int mm = read_int(text, 13, 2);
  const int ss = read_int(text, 15, 2);
  if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;
  const int us = read_int(text, 18, 6);
  return Timestamp{sys_days{ymd}} + hours{hh} + minutes{mm} + seconds{ss} + microseconds{us};
}

bool valid_event_id(const std::string& event_id) {
  if (event_id.empty() || event_id.size() > kMaxEventIdBytes) return false;
  if (event_id == "." || event_id == "..") return false;
  return event_id.find('/') == std::string::npos && event_id.find('\0') == std::string::npos;
}

std::string format_revision(uint64_t revision) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%010llu", static_cast<unsigned long long>(revision));
  return buf;
}

std::optional<uint64_t> parse_revision(const std::string& text) {
  if (text.size() < 10 || text.size() > 19 || !all_digits(text, 0, text.size())) return std::nullopt;
  uint64_t out = 0;
  for (char c : text) out = out * 10 + static_cast<uint64_t>(c - '0');
  return out;
}

// ---------------------------------------------------------------------------
// Identifiers
// ---------------------------------------------------------------------------

std::string make_journal_id(Timestamp min_ts, uint64_t sequence) {
  return format_timestamp(min_ts) + kKeyDelimiter + format_revision(sequence);
}

std::optional<JournalIdParts> decode_journal_id(const std::string& journal_id) {
  auto parts = split_ts_pair(journal_id);
  if (!parts || parts->second.size() != 10) return std::nullopt;
  auto seq = parse_revision(parts->second);
  if (!seq) return std::nullopt;
  return JournalIdParts{parts->first, *seq};
}

std::string make_overlay_id(Timestamp written_at, uint64_t sequence, const std::string& node_tag) {
  return format_timestamp(written_at) + kKeyDelimiter + format_revision(sequence) + "-" + node_tag;
}

std::optional<OverlayIdParts> decode_overlay_id(const std::string& overlay_id) {
  auto parts = split_ts_pair(overlay_id);
  if (!parts) return std::nullopt;
  const std::string& rest = parts->second;
  if (rest.size() < 12 || rest[10] != '-') return std::nullopt;
  auto seq = parse_revision(rest.substr(0, 10));
  if (!seq) return std::nullopt;
  std::string tag = rest.substr(11);
  for (char c : tag) {
    if (!is_hex_lower(c)) return std::nullopt;
  }
  return OverlayIdParts{parts->first, *seq, std::move(tag)};
}

// ---------------------------------------------------------------------------
// KeyLayout
// ---------------------------------------------------------------------------

KeyLayout::KeyLayout(std::string root_prefix) : root_(std::move(root_prefix)) {}

std::string KeyLayout::ns(const char* name) const { return root_ + "/" + name + "/"; }

std::string KeyLayout::loose_prefix() const { return ns("loose"); }

std::string KeyLayout::encode(Timestamp ts, const std::string& event_id) const {
  if (!valid_event_id(event_id)) {
    throw FloodError(ErrorCode::invalid_argument, "invalid event id");
  }
  return loose_prefix() + format_timestamp(ts) + kKeyDelimiter + event_id;
}

std::string KeyLayout::loose_bound(Timestamp ts) const {
  return loose_prefix() + format_timestamp(ts);
}

std::optional<LooseKeyParts> KeyLayout::decode_loose(const std::string& key) const {
  const std::string prefix = loose_prefix();
  if (!starts_with(key, prefix)) return std::nullopt;
  auto parts = split_ts_pair(key.substr(prefix.size()));
  if (!parts || !valid_event_id(parts->second)) return std::nullopt;
  return LooseKeyParts{parts->first, std::move(parts->second)};
}

std::string KeyLayout::encode_journal(const std::string& journal_id) const {
  return ns("journal") + journal_id;
}

std::string KeyLayout::encode_journal_index(const std::string& journal_id) const {
  return ns("journal-index") + journal_id;
}

std::string KeyLayout::key_index_prefix() const { return ns("key-index"); }

std::string KeyLayout::encode_key_index(Timestamp max_ts, const std::string& journal_id) const {
  return key_index_prefix() + format_timestamp(max_ts) + kKeyDelimiter + journal_id;
}

std::optional<KeyIndexKeyParts> KeyLayout::decode_key_index(const std::string& key) const {
  const std::string prefix = key_index_prefix();
  if (!starts_with(key, prefix)) return std::nullopt;
  auto parts = split_ts_pair(key.substr(prefix.size()));
  if (!parts || !decode_journal_id(parts->second)) return std::nullopt;
  return KeyIndexKeyParts{parts->first, std::move(parts->second)};
}

std::string KeyLayout::encode_overlay(const std::string& overlay_id) const {
  return ns("overlay") + overlay_id;
}

std::string KeyLayout::overlay_index_prefix(const std::string& event_id) const {
  return ns("overlay-index") + event_id + "/";
}

std::string KeyLayout::encode_overlay_index(const std::string& event_id,
                                            const std::string& overlay_id,
                                            OverlayKind kind) const {
  return overlay_index_prefix(event_id) + overlay_id + kKeyDelimiter + to_string(kind);
}

std::optional<OverlayRecord> KeyLayout::decode_overlay_index(const std::string& key) const {
  const std::string base = ns("overlay-index");
  if (!starts_with(key, base)) return std::nullopt;
  const std::string rest = key.substr(base.size());
  const auto slash = rest.find('/');
  if (slash == std::string::npos) return std::nullopt;
  const std::string event_id = rest.substr(0, slash);
  const std::string leaf = rest.substr(slash + 1);
  // Overlay ids contain the delimiter themselves; the kind follows the last one.
  const auto delim = leaf.rfind(kKeyDelimiter);
  if (delim == std::string::npos) return std::nullopt;
  const std::string overlay_id = leaf.substr(0, delim);
  auto kind = overlay_kind_from_string(leaf.substr(delim + 2));
  if (!kind || !valid_event_id(event_id) || !decode_overlay_id(overlay_id)) return std::nullopt;
  return OverlayRecord{overlay_id, event_id, *kind};
}

std::string KeyLayout::event_index_prefix(const std::string& event_id) const {
  return ns("event-index") + event_id + "/";
}

std::string KeyLayout::encode_event_index(const std::string& event_id, uint64_t revision) const {
  return event_index_prefix(event_id) + format_revision(revision);
}

std::optional<uint64_t> KeyLayout::decode_event_index(const std::string& key) const {
  const auto slash = key.rfind('/');
  if (slash == std::string::npos || !starts_with(key, ns("event-index"))) return std::nullopt;
  return parse_revision(key.substr(slash + 1));
}

std::string KeyLayout::marker_prefix() const { return ns("collation-marker"); }

std::string KeyLayout::encode_marker(uint64_t revision) const {
  return marker_prefix() + format_revision(revision);
}

std::optional<uint64_t> KeyLayout::decode_marker(const std::string& key) const {
  const std::string prefix = marker_prefix();
  if (!starts_with(key, prefix)) return std::nullopt;
  return parse_revision(key.substr(prefix.size()));
}

}  // namespace floodgate
