#include "floodgate/key_index.hpp"

#include "floodgate/jsonlite.hpp"

namespace floodgate {

std::string serialize_key_index_entry(const KeyIndexEntry& entry) {
  jsonlite::Object o;
  o["journal_id"] = jsonlite::Value{entry.journal_id};
  o["min"] = jsonlite::Value{format_timestamp(entry.min_ts)};
  o["max"] = jsonlite::Value{format_timestamp(entry.max_ts)};
  o["event_count"] = jsonlite::Value{static_cast<std::uint64_t>(entry.event_count)};
  o["size"] = jsonlite::Value{static_cast<std::uint64_t>(entry.size)};
  return jsonlite::to_json(o);
}

std::optional<KeyIndexEntry> parse_key_index_entry(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  KeyIndexEntry entry;
  entry.journal_id = jsonlite::get_string(obj, "journal_id");
  auto min_ts = parse_timestamp(jsonlite::get_string(obj, "min"));
  auto max_ts = parse_timestamp(jsonlite::get_string(obj, "max"));
  if (entry.journal_id.empty() || !min_ts || !max_ts) return std::nullopt;
  entry.min_ts = *min_ts;
  entry.max_ts = *max_ts;
  entry.event_count = jsonlite::get_u64(obj, "event_count", 0);
  entry.size = jsonlite::get_u64(obj, "size", 0);
  return entry;
}

KeyIndex::KeyIndex(std::shared_ptr<IObjectStore> store, KeyLayout layout, std::size_t page_size)
    : store_(std::move(store)), layout_(std::move(layout)), page_size_(page_size) {}

template <typename Fn>
void KeyIndex::scan_from(Timestamp from, Fn&& fn) const {
  // "<prefix><from>" sorts before every key whose max ts equals `from`.
  ListCursor cursor(*store_, layout_.key_index_prefix(),
                    layout_.key_index_prefix() + format_timestamp(from), page_size_);
  while (auto key = cursor.next()) {
    auto parts = layout_.decode_key_index(*key);
    if (!parts) continue;
    if (!fn(*key, *parts)) return;
  }
}

KeyIndexEntry KeyIndex::load(const std::string& key, const KeyIndexKeyParts& parts) const {
  auto body = store_->get(key);
  if (!body) {
    throw FloodError(ErrorCode::missing_object, "key index entry vanished: " + key);
  }
  auto entry = parse_key_index_entry(*body);
  if (!entry || entry->journal_id != parts.journal_id || entry->max_ts != parts.max_ts) {
    throw FloodError(ErrorCode::corrupt_journal,
                     "journal " + parts.journal_id + ": key index entry is malformed");
  }
  return *entry;
}

void KeyIndex::register_journal(const KeyIndexEntry& entry) {
  const auto id_parts = decode_journal_id(entry.journal_id);
  if (!id_parts || id_parts->min_ts != entry.min_ts || entry.max_ts < entry.min_ts) {
    throw FloodError(ErrorCode::invalid_argument, "malformed key index entry " + entry.journal_id);
  }

  // Any registered journal that ends after our start, or that ends exactly at
  // it but does not sort before us, means two collators raced.
  scan_from(entry.min_ts, [&](const std::string&, const KeyIndexKeyParts& parts) {
    if (parts.journal_id == entry.journal_id) {
      throw FloodError(ErrorCode::collation_conflict,
                       "journal " + entry.journal_id + " is already registered");
    }
    if (parts.max_ts > entry.min_ts || parts.journal_id > entry.journal_id) {
      throw FloodError(ErrorCode::collation_conflict,
                       "journal " + entry.journal_id + " overlaps registered journal " +
                           parts.journal_id);
    }
    return true;
  });

  if (!store_->put(layout_.encode_key_index(entry.max_ts, entry.journal_id),
                   serialize_key_index_entry(entry))) {
    throw FloodError(ErrorCode::write_failed,
                     "store rejected key index entry for journal " + entry.journal_id);
  }
}

std::vector<KeyIndexEntry> KeyIndex::query(Timestamp from, Timestamp to) const {
  std::vector<KeyIndexEntry> out;
  if (to < from) return out;
  scan_from(from, [&](const std::string& key, const KeyIndexKeyParts& parts) {
    auto id = decode_journal_id(parts.journal_id);
    if (id->min_ts > to) return false;
    out.push_back(load(key, parts));
    return true;
  });
  return out;
}

std::vector<KeyIndexEntry> KeyIndex::entries_after(const std::string& journal_id) const {
  // Journals registered after `journal_id` end no earlier than it starts.
  Timestamp from = distant_past();
  if (!journal_id.empty()) {
    auto parts = decode_journal_id(journal_id);
    if (!parts) {
      throw FloodError(ErrorCode::invalid_argument, "malformed journal id " + journal_id);
    }
    from = parts->min_ts;
  }
  std::vector<KeyIndexEntry> out;
  scan_from(from, [&](const std::string& key, const KeyIndexKeyParts& parts) {
    if (parts.journal_id > journal_id) out.push_back(load(key, parts));
    return true;
  });
  return out;
}

std::optional<KeyIndexEntry> KeyIndex::last_entry(const std::string& hint_journal_id) const {
  auto later = entries_after(hint_journal_id);
  if (!later.empty()) return later.back();
  if (hint_journal_id.empty()) return std::nullopt;

  // The hint itself may be the newest entry.
  auto parts = decode_journal_id(hint_journal_id);
  std::optional<KeyIndexEntry> found;
  scan_from(parts->min_ts, [&](const std::string& key, const KeyIndexKeyParts& p) {
    if (p.journal_id == hint_journal_id) {
      found = load(key, p);
      return false;
    }
    return true;
  });
  return found;
}

}  // namespace floodgate
