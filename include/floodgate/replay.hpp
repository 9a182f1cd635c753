#pragma once

// floodgate/replay.hpp - Read-side merge of journals, loose events and overlays.
//
// ORDERING INVARIANT:
//   Output is strictly ascending by (timestamp, event id). Journals are
//   visited in key index order and must not overlap their predecessor
//   (collation_conflict otherwise); the loose listing is already in key
//   order; the two streams are merged, and a (timestamp, id) present in
//   both is emitted once, from the journal.
//
// SNAPSHOT:
//   A cursor captures OverlayManager::now() when it is created. Overlays
//   written after that instant are ignored for the cursor's lifetime, so a
//   replay never flips an event between versions half-way through.
//
// FAILURE:
//   Replay fails closed. A journal whose index does not match its blob, or
//   a payload slice whose digest does not match, throws corrupt_journal
//   naming the journal id; the cursor never silently skips data.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "floodgate/config.hpp"
#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

class ReplayCursor {
 public:
  // Next event in the window, or nullopt once exhausted.
  std::optional<MergedEvent> next();

  // Drains the remaining events.
  std::vector<MergedEvent> collect();

  Timestamp as_of() const;
  uint64_t events_emitted() const;

  struct State;

 private:
  friend class ReplayEngine;
  explicit ReplayCursor(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

class ReplayEngine {
 public:
  ReplayEngine(std::shared_ptr<IObjectStore> store, FloodConfig config, Clock clock = system_now);

  // Lazy; nothing is read until the first next().
  ReplayCursor replay(const TimeWindow& window = {}) const;

  // Same selection as replay() without fetching payloads. Updated events
  // point at their overlay object; deleted events are included with
  // decision == remove so a remote consumer can skip them.
  std::vector<ManifestEntry> replay_manifest(const TimeWindow& window = {}) const;

 private:
  std::shared_ptr<IObjectStore> store_;
  FloodConfig config_;
  Clock clock_;
};

// Returns the bytes named by a manifest entry, nullopt if unavailable.
using ManifestFetcher = std::function<std::optional<std::string>(const ManifestEntry&)>;

// Ranged get on `store` for each entry's key.
ManifestFetcher store_fetcher(std::shared_ptr<const IObjectStore> store);

// Rebuilds the merged stream from a manifest. Deleted entries are skipped;
// base payloads with a digest are verified (corrupt_journal on mismatch); an
// unavailable object throws missing_object.
std::vector<MergedEvent> materialize_manifest(const std::vector<ManifestEntry>& manifest,
                                              const ManifestFetcher& fetch);

// {"manifest_version":1,"entries":[...]} for remote consumers.
std::string manifest_to_json(const std::vector<ManifestEntry>& manifest);

}  // namespace floodgate
