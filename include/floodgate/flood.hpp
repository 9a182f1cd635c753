#pragma once

// floodgate/flood.hpp - FloodLog: the public entry point.
//
// A FloodLog binds one object store, one configuration and one clock. It is
// cheap to construct; every operation is stateless apart from the store.
//
//   auto store = std::make_shared<floodgate::LocalFSObjectStore>("/var/lib/flood");
//   floodgate::FloodLog log(store, floodgate::config_from_env());
//   log.put("order-17", payload);
//   log.collate();                      // maintenance process only
//   auto cursor = log.replay({from, to});
//   while (auto ev = cursor.next()) consume(*ev);
//
// Every operation emits one FloodEvent (see observability.hpp). Failures
// are thrown as FloodError after being recorded.

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "floodgate/collator.hpp"
#include "floodgate/config.hpp"
#include "floodgate/event_writer.hpp"
#include "floodgate/keys.hpp"
#include "floodgate/locator.hpp"
#include "floodgate/object_store.hpp"
#include "floodgate/observability.hpp"
#include "floodgate/overlay.hpp"
#include "floodgate/replay.hpp"

namespace floodgate {

class FloodLog {
 public:
  explicit FloodLog(std::shared_ptr<IObjectStore> store, FloodConfig config = {},
                    Clock clock = system_now);

  // Event ingress. Timestamp defaults to clock(). Returns the loose key.
  std::string put(const std::string& event_id, const std::string& payload,
                  std::optional<Timestamp> timestamp = std::nullopt, const Metadata& metadata = {});

  // Maintenance. Single collator per root prefix.
  CollationResult collate(std::size_t min_batch_size = 1);

  // Mutation ingress. Throws event_not_found for ids that were never written.
  OverlayRecord update(const std::string& event_id, const std::string& payload);
  OverlayRecord remove(const std::string& event_id);
  OverlayDecision resolve(const std::string& event_id) const;

  // Read ingress.
  ReplayCursor replay(const TimeWindow& window = {}) const;
  std::vector<ManifestEntry> replay_manifest(const TimeWindow& window = {}) const;
  std::vector<MergedEvent> materialize(const std::vector<ManifestEntry>& manifest) const;
  GetEventResult get_event(const std::string& event_id) const;
  bool event_exists(const std::string& event_id) const;

  FloodStats& stats() const { return global_flood_stats(); }
  const FloodConfig& config() const { return config_; }
  const KeyLayout& layout() const { return layout_; }

 private:
  // Base payload of an event at `loc`; nullopt if it is gone.
  std::optional<Event> fetch_base(const std::string& event_id, const EventLocation& loc) const;

  std::shared_ptr<IObjectStore> store_;
  FloodConfig config_;
  Clock clock_;
  KeyLayout layout_;
  EventWriter writer_;
  Collator collator_;
  EventLocator locator_;
  OverlayManager overlays_;
  ReplayEngine replay_;
};

}  // namespace floodgate
