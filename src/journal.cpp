#include "floodgate/journal.hpp"

#include <tuple>

#if defined(FLOODGATE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "floodgate/hash.hpp"
#include "floodgate/jsonlite.hpp"
#include "floodgate/version.hpp"

namespace floodgate {

namespace {

#if defined(FLOODGATE_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}
#endif

[[noreturn]] void corrupt(const std::string& journal_id, const std::string& what) {
  throw FloodError(ErrorCode::corrupt_journal, "journal " + journal_id + ": " + what);
}

jsonlite::Object entry_to_object(const JournalEntry& e) {
  jsonlite::Object o;
  o["event_id"] = jsonlite::Value{e.event_id};
  o["timestamp"] = jsonlite::Value{format_timestamp(e.timestamp)};
  o["offset"] = jsonlite::Value{static_cast<std::uint64_t>(e.offset)};
  o["size"] = jsonlite::Value{static_cast<std::uint64_t>(e.size)};
  o["digest"] = jsonlite::Value{e.digest};
  o["metadata"] = jsonlite::make_string_map(e.metadata);
  return o;
}

}  // namespace

std::string serialize_journal_index(const JournalIndex& index) {
  jsonlite::Array events;
  events.reserve(index.events.size());
  for (const auto& e : index.events) events.push_back(jsonlite::Value{entry_to_object(e)});

  jsonlite::Object o;
  o["format_version"] = jsonlite::Value{static_cast<std::uint64_t>(index.format_version)};
  o["journal_id"] = jsonlite::Value{index.journal_id};
  o["from"] = jsonlite::Value{format_timestamp(index.from)};
  o["to"] = jsonlite::Value{format_timestamp(index.to)};
  o["size"] = jsonlite::Value{static_cast<std::uint64_t>(index.size)};
  o["events"] = jsonlite::Value{std::move(events)};
  return jsonlite::to_json(o);
}

JournalIndex parse_journal_index(const std::string& text, const std::string& journal_id) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) corrupt(journal_id, "index is not valid JSON (" + err->code + ")");

  JournalIndex index;
  index.format_version = static_cast<uint32_t>(jsonlite::get_u64(obj, "format_version", 0));
  if (index.format_version == 0) corrupt(journal_id, "index has no format_version");
  if (index.format_version > version::JOURNAL_FORMAT_VERSION) {
    throw FloodError(ErrorCode::unsupported_format,
                     "journal " + journal_id + " has format version " +
                         std::to_string(index.format_version));
  }
  index.journal_id = jsonlite::get_string(obj, "journal_id");
  if (index.journal_id != journal_id) corrupt(journal_id, "index names " + index.journal_id);

  auto from = parse_timestamp(jsonlite::get_string(obj, "from"));
  auto to = parse_timestamp(jsonlite::get_string(obj, "to"));
  if (!from || !to) corrupt(journal_id, "index time range is malformed");
  index.from = *from;
  index.to = *to;
  index.size = jsonlite::get_u64(obj, "size", 0);

  const jsonlite::Array* events = jsonlite::get_array(obj, "events");
  if (!events) corrupt(journal_id, "index has no events array");
  index.events.reserve(events->size());
  for (const auto& v : *events) {
    const auto* e = std::get_if<jsonlite::Object>(&v.v);
    if (!e) corrupt(journal_id, "index entry is not an object");
    JournalEntry entry;
    entry.event_id = jsonlite::get_string(*e, "event_id");
    auto ts = parse_timestamp(jsonlite::get_string(*e, "timestamp"));
    if (!ts || !valid_event_id(entry.event_id)) corrupt(journal_id, "index entry is malformed");
    entry.timestamp = *ts;
    entry.offset = jsonlite::get_u64(*e, "offset", 0);
    entry.size = jsonlite::get_u64(*e, "size", 0);
    entry.digest = jsonlite::get_string(*e, "digest");
    entry.metadata = jsonlite::get_string_map(*e, "metadata");
    index.events.push_back(std::move(entry));
  }
  return index;
}

void validate_journal_index(const JournalIndex& index, uint64_t blob_size) {
  const std::string& id = index.journal_id;
  if (index.events.empty()) corrupt(id, "index lists no events");
  if (index.size != blob_size) {
    corrupt(id, "blob is " + std::to_string(blob_size) + " bytes, index expects " +
                    std::to_string(index.size));
  }
  if (index.from != index.events.front().timestamp || index.to != index.events.back().timestamp) {
    corrupt(id, "index time range does not match its entries");
  }
  uint64_t next_free = 0;
  for (std::size_t i = 0; i < index.events.size(); ++i) {
    const auto& e = index.events[i];
    if (e.offset < next_free || e.size > blob_size || e.offset > blob_size - e.size) {
      corrupt(id, "entry " + e.event_id + " lies outside the blob");
    }
    next_free = e.offset + e.size;
    if (i > 0) {
      const auto& prev = index.events[i - 1];
      if (std::tie(prev.timestamp, prev.event_id) >= std::tie(e.timestamp, e.event_id)) {
        corrupt(id, "entries are not in ascending order at " + e.event_id);
      }
    }
  }
}

bool zstd_available() {
#if defined(FLOODGATE_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

JournalWriteResult write_journal(IObjectStore& store, const KeyLayout& layout,
                                 const std::string& journal_id, const std::vector<Event>& events,
                                 const std::string& compression) {
  JournalWriteResult result;
  JournalIndex& index = result.index;
  index.format_version = version::JOURNAL_FORMAT_VERSION;
  index.journal_id = journal_id;
  if (events.empty()) {
    throw FloodError(ErrorCode::invalid_argument, "journal " + journal_id + " has no events");
  }
  index.from = events.front().timestamp;
  index.to = events.back().timestamp;

  std::string blob;
  for (const auto& ev : events) {
    JournalEntry entry;
    entry.event_id = ev.event_id;
    entry.timestamp = ev.timestamp;
    entry.offset = blob.size();
    entry.size = ev.payload.size();
    entry.digest = payload_digest(ev.payload);
    entry.metadata = ev.metadata;
    blob += ev.payload;
    index.events.push_back(std::move(entry));
  }
  index.size = blob.size();

  if (!store.put(layout.encode_journal(journal_id), blob)) {
    throw FloodError(ErrorCode::write_failed, "store rejected journal " + journal_id);
  }

  const std::string doc = serialize_journal_index(index);
  std::string stored = doc;
  std::string encoding = "identity";
#if defined(FLOODGATE_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(doc);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  Metadata md;
  md["encoding"] = encoding;
  md["original_size"] = std::to_string(doc.size());
  if (!store.put(layout.encode_journal_index(journal_id), stored, md)) {
    throw FloodError(ErrorCode::write_failed, "store rejected index of journal " + journal_id);
  }
  result.bytes_written = blob.size() + stored.size();
  return result;
}

JournalIndex load_journal_index(const IObjectStore& store, const KeyLayout& layout,
                                const std::string& journal_id) {
  auto blob_info = store.head(layout.encode_journal(journal_id));
  if (!blob_info) corrupt(journal_id, "blob is missing");

  const std::string index_key = layout.encode_journal_index(journal_id);
  auto info = store.head(index_key);
  auto raw = store.get(index_key);
  if (!info || !raw) corrupt(journal_id, "index is missing");

  std::string doc;
  auto enc = info->metadata.find("encoding");
  const std::string encoding = enc == info->metadata.end() ? "identity" : enc->second;
  if (encoding == "identity") {
    doc = std::move(*raw);
  } else if (encoding == "zstd") {
#if defined(FLOODGATE_WITH_ZSTD)
    auto sz = info->metadata.find("original_size");
    if (sz == info->metadata.end()) corrupt(journal_id, "compressed index without original_size");
    std::size_t original_size = 0;
    try {
      original_size = static_cast<std::size_t>(std::stoull(sz->second));
    } catch (const std::exception&) {
      corrupt(journal_id, "original_size is not a number");
    }
    doc = decompress_zstd(*raw, original_size);
    if (doc.size() != original_size) corrupt(journal_id, "index does not decompress");
#else
    throw FloodError(ErrorCode::unsupported_format,
                     "journal " + journal_id + " index is zstd-encoded; built without zstd");
#endif
  } else {
    throw FloodError(ErrorCode::unsupported_format,
                     "journal " + journal_id + " index has encoding " + encoding);
  }

  JournalIndex index = parse_journal_index(doc, journal_id);
  validate_journal_index(index, blob_info->size);
  return index;
}

std::vector<std::string> read_journal_payloads(const IObjectStore& store, const KeyLayout& layout,
                                               const JournalIndex& index, std::size_t first,
                                               std::size_t last, bool verify_digests) {
  if (first > last || last >= index.events.size()) {
    throw FloodError(ErrorCode::invalid_argument, "entry range out of bounds for journal " +
                                                      index.journal_id);
  }
  const JournalEntry& lo = index.events[first];
  const JournalEntry& hi = index.events[last];
  const ByteRange range{lo.offset, hi.offset + hi.size - lo.offset};

  auto bytes = store.get(layout.encode_journal(index.journal_id), range);
  if (!bytes) corrupt(index.journal_id, "blob is missing");
  if (bytes->size() != range.length) {
    corrupt(index.journal_id, "short read: got " + std::to_string(bytes->size()) + " of " +
                                  std::to_string(range.length) + " bytes");
  }

  std::vector<std::string> out;
  out.reserve(last - first + 1);
  for (std::size_t i = first; i <= last; ++i) {
    const JournalEntry& e = index.events[i];
    std::string slice = bytes->substr(static_cast<std::size_t>(e.offset - lo.offset),
                                      static_cast<std::size_t>(e.size));
    if (verify_digests && payload_digest(slice) != e.digest) {
      corrupt(index.journal_id, "digest mismatch for event " + e.event_id);
    }
    out.push_back(std::move(slice));
  }
  return out;
}

}  // namespace floodgate
