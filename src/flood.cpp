#include "floodgate/flood.hpp"

#include "floodgate/journal.hpp"

namespace floodgate {

namespace {

// Times `fn`, records the outcome, rethrows FloodError after recording it.
template <typename Fn>
auto instrumented(const char* operation, Fn&& fn) {
  FloodEvent ev;
  ev.operation = operation;
  try {
    auto result = [&] {
      ScopeTimer timer(ev.duration_ns);
      return fn(ev);
    }();
    ev.ok = true;
    emit_flood_event(ev);
    return result;
  } catch (const FloodError& e) {
    ev.ok = false;
    ev.error_code = to_string(e.code());
    emit_flood_event(ev);
    throw;
  }
}

void require_valid_id(const std::string& event_id) {
  if (!valid_event_id(event_id)) {
    throw FloodError(ErrorCode::invalid_argument, "invalid event id");
  }
}

}  // namespace

FloodLog::FloodLog(std::shared_ptr<IObjectStore> store, FloodConfig config, Clock clock)
    : store_(std::move(store)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      layout_(config_.root_prefix),
      writer_(store_, layout_),
      collator_(store_, config_),
      locator_(store_, layout_, config_.list_page_size),
      overlays_(store_, layout_, clock_, process_node_tag(), config_.list_page_size),
      replay_(store_, config_, clock_) {}

std::string FloodLog::put(const std::string& event_id, const std::string& payload,
                          std::optional<Timestamp> timestamp, const Metadata& metadata) {
  return instrumented("put", [&](FloodEvent& ev) {
    Event event{event_id, timestamp.value_or(clock_()), payload, metadata};
    std::string key = writer_.put(event);
    ev.events = 1;
    ev.bytes = payload.size();
    return key;
  });
}

CollationResult FloodLog::collate(std::size_t min_batch_size) {
  return instrumented("collate", [&](FloodEvent& ev) {
    CollationResult result = collator_.collate(min_batch_size);
    ev.events = result.events_folded;
    ev.journal_id = result.journal_id.value_or("");
    ev.bytes = result.bytes_written;
    return result;
  });
}

OverlayRecord FloodLog::update(const std::string& event_id, const std::string& payload) {
  return instrumented("update", [&](FloodEvent& ev) {
    require_valid_id(event_id);
    if (!locator_.lookup(event_id)) {
      throw FloodError(ErrorCode::event_not_found, "cannot update unknown event " + event_id);
    }
    ev.events = 1;
    ev.bytes = payload.size();
    return overlays_.write(event_id, OverlayKind::update, payload);
  });
}

OverlayRecord FloodLog::remove(const std::string& event_id) {
  return instrumented("remove", [&](FloodEvent& ev) {
    require_valid_id(event_id);
    if (!locator_.lookup(event_id)) {
      throw FloodError(ErrorCode::event_not_found, "cannot delete unknown event " + event_id);
    }
    ev.events = 1;
    return overlays_.write(event_id, OverlayKind::remove, "");
  });
}

OverlayDecision FloodLog::resolve(const std::string& event_id) const {
  require_valid_id(event_id);
  return overlays_.resolve(event_id, overlays_.now());
}

ReplayCursor FloodLog::replay(const TimeWindow& window) const {
  return instrumented("replay", [&](FloodEvent&) { return replay_.replay(window); });
}

std::vector<ManifestEntry> FloodLog::replay_manifest(const TimeWindow& window) const {
  return instrumented("replay_manifest", [&](FloodEvent& ev) {
    auto manifest = replay_.replay_manifest(window);
    ev.events = manifest.size();
    return manifest;
  });
}

std::vector<MergedEvent> FloodLog::materialize(const std::vector<ManifestEntry>& manifest) const {
  return materialize_manifest(manifest, store_fetcher(store_));
}

std::optional<Event> FloodLog::fetch_base(const std::string& event_id,
                                          const EventLocation& loc) const {
  if (loc.kind == EventSource::loose) {
    auto parts = layout_.decode_loose(loc.ref);
    if (!parts || parts->event_id != event_id) return std::nullopt;
    auto info = store_->head(loc.ref);
    auto payload = store_->get(loc.ref);
    if (!info || !payload) return std::nullopt;
    return Event{event_id, parts->timestamp, std::move(*payload), std::move(info->metadata)};
  }

  const JournalIndex index = load_journal_index(*store_, layout_, loc.ref);
  for (std::size_t i = 0; i < index.events.size(); ++i) {
    const JournalEntry& e = index.events[i];
    if (e.event_id != event_id) continue;
    auto payloads =
        read_journal_payloads(*store_, layout_, index, i, i, config_.verify_payload_digests);
    return Event{event_id, e.timestamp, std::move(payloads.front()), e.metadata};
  }
  throw FloodError(ErrorCode::corrupt_journal,
                   "journal " + loc.ref + ": locator points here but event " + event_id +
                       " is not listed");
}

GetEventResult FloodLog::get_event(const std::string& event_id) const {
  return instrumented("get_event", [&](FloodEvent& ev) {
    require_valid_id(event_id);
    GetEventResult result;
    auto loc = locator_.lookup(event_id);
    if (!loc) return result;

    const OverlayDecision decision = overlays_.resolve(event_id, overlays_.now());
    if (decision.kind == OverlayDecision::Kind::remove) {
      result.status = LookupStatus::deleted;
      return result;
    }

    auto base = fetch_base(event_id, *loc);
    if (!base && loc->kind == EventSource::loose) {
      // Collation may have folded the object between lookup and fetch.
      auto moved = locator_.lookup(event_id);
      if (moved && moved->kind == EventSource::journal) base = fetch_base(event_id, *moved);
    }
    if (!base) return result;

    if (decision.kind == OverlayDecision::Kind::update) base->payload = decision.payload;
    result.status = LookupStatus::found;
    result.event = std::move(*base);
    ev.events = 1;
    ev.bytes = result.event.payload.size();
    return result;
  });
}

bool FloodLog::event_exists(const std::string& event_id) const {
  return get_event(event_id).status == LookupStatus::found;
}

}  // namespace floodgate
