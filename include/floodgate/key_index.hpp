#pragma once

// floodgate/key_index.hpp - Registry of journals and the time ranges they cover.
//
// One object per journal, keyed
//
//   key-index/<max ts>--<journal id>
//
// with journal id = <min ts>--<seq>. Registration is monotonic (each new
// journal starts at or after the previous one's max ts and has a greater
// id), so the listing is ordered by max ts, by min ts and by journal id at
// the same time. A range query [from, to] starts listing at <from> (the
// store skips every journal that ended earlier) and stops at the first
// entry whose min ts lies past <to>. Cost is proportional to the journals
// that overlap the window, not to the size of the index.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

std::string serialize_key_index_entry(const KeyIndexEntry& entry);
std::optional<KeyIndexEntry> parse_key_index_entry(const std::string& text);

class KeyIndex {
 public:
  KeyIndex(std::shared_ptr<IObjectStore> store, KeyLayout layout, std::size_t page_size = 1000);

  // Throws collation_conflict if the entry would break monotonic order,
  // write_failed if the store rejects it.
  void register_journal(const KeyIndexEntry& entry);

  // Journals overlapping [from, to], ascending by journal id.
  std::vector<KeyIndexEntry> query(Timestamp from, Timestamp to) const;

  // Journals whose id sorts after `journal_id` (all journals if empty),
  // ascending.
  std::vector<KeyIndexEntry> entries_after(const std::string& journal_id) const;

  // Newest registered journal at or after `hint_journal_id`.
  std::optional<KeyIndexEntry> last_entry(const std::string& hint_journal_id = "") const;

 private:
  // Lists entries whose max ts is at or after `from`, in key order.
  template <typename Fn>
  void scan_from(Timestamp from, Fn&& fn) const;

  KeyIndexEntry load(const std::string& key, const KeyIndexKeyParts& parts) const;

  std::shared_ptr<IObjectStore> store_;
  KeyLayout layout_;
  std::size_t page_size_;
};

}  // namespace floodgate
