#include "floodgate/locator.hpp"

#include <vector>

namespace floodgate {

namespace {

constexpr const char* kLocationLoose = "loose";
constexpr const char* kLocationJournal = "journal";

}  // namespace

EventLocator::EventLocator(std::shared_ptr<IObjectStore> store, KeyLayout layout,
                           std::size_t page_size)
    : store_(std::move(store)), layout_(std::move(layout)), page_size_(page_size) {}

void EventLocator::write_revision(const std::string& event_id, uint64_t revision,
                                  EventSource kind, const std::string& ref) {
  Metadata md;
  md["location"] = kind == EventSource::journal ? kLocationJournal : kLocationLoose;
  md["ref"] = ref;
  if (!store_->put(layout_.encode_event_index(event_id, revision), "", md)) {
    throw FloodError(ErrorCode::write_failed, "locator write rejected for event " + event_id);
  }
}

uint64_t EventLocator::record_loose(const std::string& event_id, const std::string& loose_key) {
  const auto current = lookup(event_id);
  const uint64_t revision = current ? current->revision + 1 : 1;
  write_revision(event_id, revision, EventSource::loose, loose_key);
  return revision;
}

bool EventLocator::discard(const std::string& event_id, uint64_t revision) {
  return store_->remove(layout_.encode_event_index(event_id, revision));
}

void EventLocator::record_journal(const std::string& event_id, const std::string& journal_id) {
  const auto current = lookup(event_id);
  if (current && current->kind == EventSource::journal && current->ref == journal_id) return;
  write_revision(event_id, current ? current->revision + 1 : 1, EventSource::journal, journal_id);
}

std::optional<EventLocation> EventLocator::lookup(const std::string& event_id) const {
  ListCursor cursor(*store_, layout_.event_index_prefix(event_id), "", page_size_);
  std::optional<std::string> newest;
  while (auto key = cursor.next()) {
    if (layout_.decode_event_index(*key)) newest = *key;
  }
  if (!newest) return std::nullopt;

  auto info = store_->head(*newest);
  if (!info) return std::nullopt;  // pruned between list and head
  auto loc = info->metadata.find("location");
  auto ref = info->metadata.find("ref");
  if (loc == info->metadata.end() || ref == info->metadata.end()) return std::nullopt;

  EventLocation out;
  out.kind = loc->second == kLocationJournal ? EventSource::journal : EventSource::loose;
  out.ref = ref->second;
  out.revision = layout_.decode_event_index(*newest).value_or(0);
  return out;
}

void EventLocator::prune(const std::string& event_id) {
  ListCursor cursor(*store_, layout_.event_index_prefix(event_id), "", page_size_);
  std::vector<std::string> keys;
  while (auto key = cursor.next()) {
    if (layout_.decode_event_index(*key)) keys.push_back(*key);
  }
  if (keys.size() < 2) return;
  keys.pop_back();
  for (const auto& key : keys) {
    if (!store_->remove(key)) {
      throw FloodError(ErrorCode::write_failed, "failed to prune locator " + key);
    }
  }
}

}  // namespace floodgate
