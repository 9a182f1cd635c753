#pragma once

// floodgate/journal.hpp - Journal blobs and their index documents.
//
// A journal is two objects:
//   journal/<id>        payloads concatenated in (timestamp, event id) order
//   journal-index/<id>  JSON document:
//     {"events":[{"digest":..,"event_id":..,"metadata":{..},"offset":N,
//                 "size":N,"timestamp":".."}, ...],
//      "format_version":1,"from":"..","journal_id":"..","size":N,"to":".."}
//
// The index object carries store metadata {"encoding": "identity"|"zstd",
// "original_size": N}. Compression is only applied when the build has zstd
// (FLOODGATE_WITH_ZSTD); a zstd-encoded index read by a build without it is
// rejected with unsupported_format.
//
// Every reader validates the index against the blob before trusting an
// offset, and verifies each payload slice against its recorded digest.
// Failures throw FloodError(corrupt_journal) naming the journal id.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

std::string serialize_journal_index(const JournalIndex& index);

// Throws corrupt_journal on malformed documents, unsupported_format when
// format_version is newer than JOURNAL_FORMAT_VERSION.
JournalIndex parse_journal_index(const std::string& text, const std::string& journal_id);

// Structural checks: non-empty, strictly ascending (timestamp, event id),
// from/to match the first/last entry, entries are non-overlapping and inside
// a blob of `blob_size` bytes.
void validate_journal_index(const JournalIndex& index, uint64_t blob_size);

bool zstd_available();

struct JournalWriteResult {
  JournalIndex index;
  uint64_t bytes_written{0};
};

// Writes blob then index. `events` must be sorted by (timestamp, event id).
// Throws write_failed if the store rejects either object.
JournalWriteResult write_journal(IObjectStore& store, const KeyLayout& layout,
                                 const std::string& journal_id, const std::vector<Event>& events,
                                 const std::string& compression);

// Loads, decodes, parses and validates the index of a registered journal.
JournalIndex load_journal_index(const IObjectStore& store, const KeyLayout& layout,
                                const std::string& journal_id);

// Fetches entries [first, last] of `index` with a single ranged read and
// returns their payloads, verified against size and (optionally) digest.
std::vector<std::string> read_journal_payloads(const IObjectStore& store, const KeyLayout& layout,
                                               const JournalIndex& index, std::size_t first,
                                               std::size_t last, bool verify_digests);

}  // namespace floodgate
