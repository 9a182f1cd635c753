#pragma once

// floodgate/collator.hpp - Folds loose events into journals.
//
// PRECONDITION: at most one collate() runs against a root prefix at a time.
// This is an operational contract; it is not enforced, but two racing
// collators are detected (key index registration or recovery fails with
// collation_conflict) instead of silently duplicating events.
//
// One collation:
//   1. read the marker, finish any journal registered after it (recovery)
//   2. list loose keys strictly after marker.last_key, up to
//      max_journal_events
//   3. write journal blob, then journal index, then key index entry
//   4. point every folded event's locator at the journal
//   5. delete the loose objects and stale locator revisions
//   6. advance the marker
// A crash anywhere leaves the log readable: before step 3 completes the
// events are still loose; after it they are journaled and replay drops any
// loose leftovers with the same key.
//
// Loose events whose key sorts at or before the marker (explicit past
// timestamps written after their slot was collated) are never folded. They
// stay loose and remain visible to readers.

#include <cstddef>
#include <memory>
#include <optional>

#include "floodgate/config.hpp"
#include "floodgate/journal.hpp"
#include "floodgate/key_index.hpp"
#include "floodgate/keys.hpp"
#include "floodgate/locator.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

std::string serialize_marker(const CollationMarker& marker);
std::optional<CollationMarker> parse_marker(const std::string& text, uint64_t revision);

class Collator {
 public:
  Collator(std::shared_ptr<IObjectStore> store, FloodConfig config);

  // Folds up to max_journal_events loose events into one journal, or does
  // nothing when fewer than `min_batch_size` are available. A
  // `min_batch_size` above max_journal_events is lowered to it.
  CollationResult collate(std::size_t min_batch_size = 1);

  std::optional<CollationMarker> read_marker() const;

 private:
  // Steps 4-6 for an already registered journal.
  CollationMarker finish_journal(const JournalIndex& index,
                                 const std::optional<CollationMarker>& previous);
  CollationMarker write_marker(const std::string& last_key, const std::string& journal_id,
                               const std::optional<CollationMarker>& previous);

  std::shared_ptr<IObjectStore> store_;
  FloodConfig config_;
  KeyLayout layout_;
  KeyIndex key_index_;
  EventLocator locator_;
};

}  // namespace floodgate
