#pragma once

// floodgate/locator.hpp - Per-event pointer to the event's base location.
//
// Each event id owns a small set of revisioned, body-less objects
//
//   event-index/<event id>/<revision:10>   metadata {location, ref}
//
// A move to a new location writes revision N+1 and then prunes older
// revisions; nothing is ever overwritten in place, so a reader that lists
// the prefix always finds at least one complete revision.
//
// The writer records the loose location before it stores the loose object.
// A collation that folds the object afterwards therefore always finds that
// revision and supersedes it with the journal location.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

struct EventLocation {
  EventSource kind{EventSource::loose};
  std::string ref;  // loose key or journal id
  uint64_t revision{0};
};

class EventLocator {
 public:
  EventLocator(std::shared_ptr<IObjectStore> store, KeyLayout layout, std::size_t page_size = 1000);

  // Next revision pointing at a loose key (1 for a new id). Returns the
  // revision written.
  uint64_t record_loose(const std::string& event_id, const std::string& loose_key);

  // Removes one revision written by record_loose whose object never
  // committed. Returns false if the store refused.
  bool discard(const std::string& event_id, uint64_t revision);

  // Next revision pointing at a journal. No-op if the newest revision
  // already points there.
  void record_journal(const std::string& event_id, const std::string& journal_id);

  // Newest revision, or nullopt if the id was never written.
  std::optional<EventLocation> lookup(const std::string& event_id) const;

  // Delete every revision except the newest. Throws write_failed.
  void prune(const std::string& event_id);

 private:
  void write_revision(const std::string& event_id, uint64_t revision, EventSource kind,
                      const std::string& ref);

  std::shared_ptr<IObjectStore> store_;
  KeyLayout layout_;
  std::size_t page_size_;
};

}  // namespace floodgate
