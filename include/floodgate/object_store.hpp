#pragma once

// floodgate/object_store.hpp - Object store capability consumed by the core,
// plus the two bundled backends.
//
// DESIGN INVARIANTS (every implementation must preserve them):
//   1. list() returns keys in strictly ascending byte-lexicographic order and
//      only keys that start with the requested prefix, strictly after
//      start_after.
//   2. A put() that returned true is visible to subsequent get/head/list calls
//      issued by the same caller.
//   3. Writes are whole-object: a reader never observes a partially written
//      object (LocalFSObjectStore: temp file + rename).
//   4. Failures are reported by return value. Backends never throw for
//      missing objects or rejected writes.
//
// Retries, backoff and credentials belong to the backend, not to the core.
// A cloud backend maps keys 1:1 onto bucket keys below a bucket prefix and
// issues real presigned URLs from presign().

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "floodgate/types.hpp"

namespace floodgate {

struct ObjectInfo {
  std::string key;
  std::size_t size{0};
  Metadata metadata;
  uint64_t created_at_unix_ts{0};
};

struct ListPage {
  std::vector<std::string> keys;
  bool truncated{false};  // more keys may follow the last returned key
};

// Keys are '/'-separated relative paths: non-empty components, none of which
// is "." or "..", no NUL bytes.
bool valid_object_key(const std::string& key);

// ---------------------------------------------------------------------------
// IObjectStore - abstract storage backend interface
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class IObjectStore {
 public:
  virtual ~IObjectStore() = default;

  // Store (or replace) an object. Returns false if the store rejected it.
  virtual bool put(const std::string& key, const std::string& data,
                   const Metadata& metadata = {}) = 0;

  // Whole object, or the bytes of `range` clamped to the object size.
  // nullopt if the object does not exist.
  virtual std::optional<std::string> get(const std::string& key,
                                         std::optional<ByteRange> range = std::nullopt) const = 0;

  virtual std::optional<ObjectInfo> head(const std::string& key) const = 0;

  // Returns true if deleted or not found, false on failure.
  virtual bool remove(const std::string& key) = 0;

  // One page of keys. limit == 0 means the backend's maximum page size.
  virtual ListPage list(const std::string& prefix, const std::string& start_after = "",
                        std::size_t limit = 0) const = 0;

  // Time-limited locator for reading `key` (optionally one byte range).
  virtual std::string presign(const std::string& key, std::optional<ByteRange> range,
                              std::chrono::seconds ttl) const = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// ListCursor - pulls list() pages lazily
// ---------------------------------------------------------------------------
class ListCursor {
 public:
  ListCursor(const IObjectStore& store, std::string prefix, std::string start_after = "",
             std::size_t page_size = 1000);

  // Next key in ascending order, or nullopt once the listing is exhausted.
  std::optional<std::string> next();

  std::size_t pages_fetched() const { return pages_fetched_; }

 private:
  void fetch();

  const IObjectStore& store_;
  std::string prefix_;
  std::string start_after_;
  std::size_t page_size_;
  std::vector<std::string> page_;
  std::size_t pos_{0};
  bool exhausted_{false};
  std::size_t pages_fetched_{0};
};

// ---------------------------------------------------------------------------
// MemoryObjectStore - ordered in-memory backend
// ---------------------------------------------------------------------------
// Locators have the form mem://<key>?expires=<unix>[&range=bytes=<a>-<b>].
class MemoryObjectStore : public IObjectStore {
 public:
  explicit MemoryObjectStore(std::size_t max_page_size = 1000);

  bool put(const std::string& key, const std::string& data,
           const Metadata& metadata = {}) override;
  std::optional<std::string> get(const std::string& key,
                                 std::optional<ByteRange> range = std::nullopt) const override;
  std::optional<ObjectInfo> head(const std::string& key) const override;
  bool remove(const std::string& key) override;
  ListPage list(const std::string& prefix, const std::string& start_after = "",
                std::size_t limit = 0) const override;
  std::string presign(const std::string& key, std::optional<ByteRange> range,
                      std::chrono::seconds ttl) const override;
  std::string backend_id() const override { return "memory"; }

  std::size_t size() const;
  uint64_t list_calls() const { return list_calls_.load(std::memory_order_relaxed); }

 private:
  struct Stored {
    std::string data;
    Metadata metadata;
    uint64_t created_at_unix_ts{0};
  };

  std::size_t max_page_size_;
  mutable std::mutex mu_;
  std::map<std::string, Stored> objects_;
  mutable std::atomic<uint64_t> list_calls_{0};
};

// ---------------------------------------------------------------------------
// LocalFSObjectStore - filesystem backend
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/<key>        object bytes
//   <root>/meta/<key>.json      {"created_at":..,"metadata":{..},"size":..}
//   <root>/tmp/                 staging area for atomic writes
//
// The metadata sidecar is written before the object; the object's rename is
// the commit point, so list() never returns a key without its metadata.
// Locators have the form file://<absolute path>?expires=<unix>[&range=bytes=<a>-<b>].
class LocalFSObjectStore : public IObjectStore {
 public:
  explicit LocalFSObjectStore(std::string root = ".floodgate/store", std::size_t max_page_size = 1000);

  bool put(const std::string& key, const std::string& data,
           const Metadata& metadata = {}) override;
  std::optional<std::string> get(const std::string& key,
                                 std::optional<ByteRange> range = std::nullopt) const override;
  std::optional<ObjectInfo> head(const std::string& key) const override;
  bool remove(const std::string& key) override;
  ListPage list(const std::string& prefix, const std::string& start_after = "",
                std::size_t limit = 0) const override;
  std::string presign(const std::string& key, std::optional<ByteRange> range,
                      std::chrono::seconds ttl) const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }

 private:
  std::string object_path(const std::string& key) const;
  std::string meta_path(const std::string& key) const;

  std::string root_;
  std::size_t max_page_size_;
};

}  // namespace floodgate
