#pragma once

// floodgate/overlay.hpp - Update/delete overlays applied lazily on read.
//
// An overlay is two objects, written in this order:
//   overlay/<overlay id>                               payload (empty for DELETE)
//   overlay-index/<event id>/<overlay id>--<KIND>      empty
//
// The index entry is the commit point: an overlay whose index entry was
// never written is invisible. An index entry whose primary object is
// missing is reported as missing_object.
//
// Overlay ids are <write ts>--<seq:10>-<node tag>. Within one process they
// strictly increase even if the clock stalls or steps back; across
// processes they order by write time, ties broken by sequence and node tag.
// The greatest overlay id for an event wins.

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

// 8 hex chars identifying this process (host-independent, random per run).
std::string process_node_tag();

class OverlayManager {
 public:
  OverlayManager(std::shared_ptr<IObjectStore> store, KeyLayout layout, Clock clock,
                 std::string node_tag = process_node_tag(), std::size_t page_size = 1000);

  // Throws write_failed. The caller checks that the event exists.
  OverlayRecord write(const std::string& event_id, OverlayKind kind, const std::string& payload);

  // Greatest overlay not newer than `as_of` (no bound if unset).
  OverlayDecision resolve(const std::string& event_id,
                          std::optional<Timestamp> as_of = std::nullopt) const;

  // Winning overlay record without fetching its payload.
  std::optional<OverlayRecord> peek(const std::string& event_id,
                                    std::optional<Timestamp> as_of = std::nullopt) const;

  // Every committed overlay for the event, oldest first.
  std::vector<OverlayRecord> history(const std::string& event_id) const;

  // Snapshot time for readers: the clock, but never earlier than the newest
  // overlay id this process issued, so a local write stays visible locally
  // after the clock steps back.
  Timestamp now() const;

 private:
  std::string next_overlay_id();

  std::shared_ptr<IObjectStore> store_;
  KeyLayout layout_;
  Clock clock_;
  std::string node_tag_;
  std::size_t page_size_;
};

}  // namespace floodgate
