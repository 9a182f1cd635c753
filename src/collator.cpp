#include "floodgate/collator.hpp"

#include <vector>

#include "floodgate/jsonlite.hpp"

namespace floodgate {

std::string serialize_marker(const CollationMarker& marker) {
  jsonlite::Object o;
  o["last_key"] = jsonlite::Value{marker.last_key};
  o["journal_id"] = jsonlite::Value{marker.journal_id};
  return jsonlite::to_json(o);
}

std::optional<CollationMarker> parse_marker(const std::string& text, uint64_t revision) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  CollationMarker m;
  m.last_key = jsonlite::get_string(obj, "last_key");
  m.journal_id = jsonlite::get_string(obj, "journal_id");
  m.revision = revision;
  if (m.last_key.empty() || !decode_journal_id(m.journal_id)) return std::nullopt;
  return m;
}

Collator::Collator(std::shared_ptr<IObjectStore> store, FloodConfig config)
    : store_(store),
      config_(std::move(config)),
      layout_(config_.root_prefix),
      key_index_(store, layout_, config_.list_page_size),
      locator_(store, layout_, config_.list_page_size) {}

std::optional<CollationMarker> Collator::read_marker() const {
  ListCursor cursor(*store_, layout_.marker_prefix(), "", config_.list_page_size);
  std::optional<std::string> newest;
  uint64_t revision = 0;
  while (auto key = cursor.next()) {
    if (auto rev = layout_.decode_marker(*key)) {
      newest = *key;
      revision = *rev;
    }
  }
  if (!newest) return std::nullopt;

  auto body = store_->get(*newest);
  if (!body) throw FloodError(ErrorCode::missing_object, "collation marker vanished: " + *newest);
  auto marker = parse_marker(*body, revision);
  if (!marker) throw FloodError(ErrorCode::json_parse_error, "malformed collation marker " + *newest);
  return marker;
}

CollationMarker Collator::write_marker(const std::string& last_key, const std::string& journal_id,
                                       const std::optional<CollationMarker>& previous) {
  CollationMarker next{last_key, journal_id, previous ? previous->revision + 1 : 1};
  const std::string key = layout_.encode_marker(next.revision);
  if (!store_->put(key, serialize_marker(next))) {
    throw FloodError(ErrorCode::write_failed, "store rejected collation marker " + key);
  }

  // Older revisions are garbage once the new one is visible.
  ListCursor cursor(*store_, layout_.marker_prefix(), "", config_.list_page_size);
  while (auto old = cursor.next()) {
    if (*old == key) break;
    if (!store_->remove(*old)) {
      throw FloodError(ErrorCode::write_failed, "failed to delete stale marker " + *old);
    }
  }
  return next;
}

CollationMarker Collator::finish_journal(const JournalIndex& index,
                                         const std::optional<CollationMarker>& previous) {
  for (const auto& e : index.events) locator_.record_journal(e.event_id, index.journal_id);

  for (const auto& e : index.events) {
    const std::string loose_key = layout_.encode(e.timestamp, e.event_id);
    if (!store_->remove(loose_key)) {
      throw FloodError(ErrorCode::write_failed, "failed to delete collated object " + loose_key);
    }
    locator_.prune(e.event_id);
  }

  const auto& last = index.events.back();
  return write_marker(layout_.encode(last.timestamp, last.event_id), index.journal_id, previous);
}

CollationResult Collator::collate(std::size_t min_batch_size) {
  CollationResult result;
  if (min_batch_size == 0) min_batch_size = 1;
  // A full journal always satisfies the batch requirement.
  const std::size_t cap = config_.max_journal_events == 0 ? 1 : config_.max_journal_events;
  if (min_batch_size > cap) min_batch_size = cap;

  // 1. Marker and recovery.
  std::optional<CollationMarker> marker = read_marker();
  auto unfinished = key_index_.entries_after(marker ? marker->journal_id : "");
  if (unfinished.size() > 1) {
    throw FloodError(ErrorCode::collation_conflict,
                     std::to_string(unfinished.size()) + " journals registered after marker, first " +
                         unfinished.front().journal_id);
  }
  if (unfinished.size() == 1) {
    const JournalIndex index = load_journal_index(*store_, layout_, unfinished.front().journal_id);
    marker = finish_journal(index, marker);
    result.recovered_journal_id = index.journal_id;
  }

  // 2. Candidates strictly after the marker.
  std::vector<std::pair<std::string, LooseKeyParts>> batch;
  ListCursor cursor(*store_, layout_.loose_prefix(), marker ? marker->last_key : "",
                    config_.list_page_size);
  while (batch.size() < cap) {
    auto key = cursor.next();
    if (!key) break;
    if (auto parts = layout_.decode_loose(*key)) batch.emplace_back(*key, std::move(*parts));
  }
  if (batch.size() < min_batch_size) {
    result.events_pending = batch.size();
    return result;
  }

  std::vector<Event> events;
  events.reserve(batch.size());
  for (auto& [key, parts] : batch) {
    auto payload = store_->get(key);
    auto info = store_->head(key);
    if (!payload || !info) {
      throw FloodError(ErrorCode::missing_object, "loose object vanished during collation: " + key);
    }
    events.push_back(Event{std::move(parts.event_id), parts.timestamp, std::move(*payload),
                           std::move(info->metadata)});
  }

  // 3. Journal, index, registration.
  uint64_t sequence = 1;
  if (marker) sequence = decode_journal_id(marker->journal_id)->sequence + 1;
  const std::string journal_id = make_journal_id(events.front().timestamp, sequence);

  JournalWriteResult written =
      write_journal(*store_, layout_, journal_id, events, config_.journal_index_compression);

  KeyIndexEntry entry;
  entry.journal_id = journal_id;
  entry.min_ts = written.index.from;
  entry.max_ts = written.index.to;
  entry.event_count = written.index.events.size();
  entry.size = written.index.size;
  key_index_.register_journal(entry);

  // 4-6.
  finish_journal(written.index, marker);

  result.events_folded = entry.event_count;
  result.journal_id = journal_id;
  result.bytes_written = written.bytes_written;
  return result;
}

}  // namespace floodgate
