#include "floodgate/object_store.hpp"

// Bundled object store backends.
//
// MemoryObjectStore: std::map under a mutex; ordered iteration gives the
// lexicographic listing contract for free.
//
// LocalFSObjectStore: one file per object, written atomically via a staging
// file and rename(). Listing walks the directory subtree below the longest
// directory-aligned part of the prefix and sorts the result, which makes it
// O(objects under that subtree) per page. That cost profile is the reason
// the core never lists the whole namespace on the read path.

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#include "floodgate/jsonlite.hpp"

namespace fs = std::filesystem;

namespace floodgate {

namespace {

uint64_t unix_now() { return static_cast<uint64_t>(std::time(nullptr)); }

std::string range_slice(const std::string& data, std::optional<ByteRange> range) {
  if (!range) return data;
  if (range->offset >= data.size()) return {};
  const uint64_t avail = data.size() - range->offset;
  return data.substr(static_cast<std::size_t>(range->offset),
                     static_cast<std::size_t>(std::min(range->length, avail)));
}

bool unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
}

std::string percent_encode(const std::string& s) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (unreserved(c)) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0f];
    }
  }
  return out;
}

std::string locator_query(std::optional<ByteRange> range, std::chrono::seconds ttl) {
  std::string q = "?expires=" + std::to_string(unix_now() + static_cast<uint64_t>(ttl.count()));
  if (range) {
    const uint64_t last = range->length == 0 ? range->offset : range->offset + range->length - 1;
    q += "&range=bytes=" + std::to_string(range->offset) + "-" + std::to_string(last);
  }
  return q;
}

// Staging file in <root>/tmp so that concurrent writers never collide and a
// crashed write never shows up under objects/.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const fs::path& staging_dir, const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(staging_dir);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

bool valid_object_key(const std::string& key) {
  if (key.empty() || key.front() == '/' || key.back() == '/') return false;
  if (key.find('\0') != std::string::npos) return false;
  std::size_t start = 0;
  while (start <= key.size()) {
    std::size_t end = key.find('/', start);
    if (end == std::string::npos) end = key.size();
    const std::string comp = key.substr(start, end - start);
    if (comp.empty() || comp == "." || comp == "..") return false;
    start = end + 1;
  }
  return true;
}

// ---------------------------------------------------------------------------
// ListCursor
// ---------------------------------------------------------------------------

ListCursor::ListCursor(const IObjectStore& store, std::string prefix, std::string start_after,
                       std::size_t page_size)
    : store_(store),
      prefix_(std::move(prefix)),
      start_after_(std::move(start_after)),
      page_size_(page_size) {}

void ListCursor::fetch() {
  page_.clear();
  pos_ = 0;
  ListPage page = store_.list(prefix_, start_after_, page_size_);
  ++pages_fetched_;
  page_ = std::move(page.keys);
  if (!page_.empty()) start_after_ = page_.back();
  if (!page.truncated || page_.empty()) exhausted_ = true;
}

std::optional<std::string> ListCursor::next() {
  if (pos_ >= page_.size()) {
    if (exhausted_) return std::nullopt;
    fetch();
    if (page_.empty()) return std::nullopt;
  }
  return page_[pos_++];
}

// ---------------------------------------------------------------------------
// MemoryObjectStore
// ---------------------------------------------------------------------------

MemoryObjectStore::MemoryObjectStore(std::size_t max_page_size)
    : max_page_size_(max_page_size == 0 ? 1000 : max_page_size) {}

bool MemoryObjectStore::put(const std::string& key, const std::string& data,
                            const Metadata& metadata) {
  if (!valid_object_key(key)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  objects_[key] = Stored{data, metadata, unix_now()};
  return true;
}

std::optional<std::string> MemoryObjectStore::get(const std::string& key,
                                                  std::optional<ByteRange> range) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;
  return range_slice(it->second.data, range);
}

std::optional<ObjectInfo> MemoryObjectStore::head(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(key);
  if (it == objects_.end()) return std::nullopt;
  return ObjectInfo{key, it->second.data.size(), it->second.metadata,
                    it->second.created_at_unix_ts};
}

bool MemoryObjectStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  objects_.erase(key);
  return true;
}

ListPage MemoryObjectStore::list(const std::string& prefix, const std::string& start_after,
                                 std::size_t limit) const {
  list_calls_.fetch_add(1, std::memory_order_relaxed);
  const std::size_t cap = (limit == 0 || limit > max_page_size_) ? max_page_size_ : limit;
  ListPage page;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = start_after < prefix ? objects_.lower_bound(prefix) : objects_.upper_bound(start_after);
  for (; it != objects_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    if (page.keys.size() >= cap) {
      page.truncated = true;
      break;
    }
    page.keys.push_back(it->first);
  }
  return page;
}

std::string MemoryObjectStore::presign(const std::string& key, std::optional<ByteRange> range,
                                       std::chrono::seconds ttl) const {
  return "mem://" + percent_encode(key) + locator_query(range, ttl);
}

std::size_t MemoryObjectStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return objects_.size();
}

// ---------------------------------------------------------------------------
// LocalFSObjectStore
// ---------------------------------------------------------------------------

LocalFSObjectStore::LocalFSObjectStore(std::string root, std::size_t max_page_size)
    : root_(std::move(root)), max_page_size_(max_page_size == 0 ? 1000 : max_page_size) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
  fs::create_directories(fs::path(root_) / "meta", ec);
  fs::create_directories(fs::path(root_) / "tmp", ec);
}

std::string LocalFSObjectStore::object_path(const std::string& key) const {
  return (fs::path(root_) / "objects" / fs::path(key)).string();
}

std::string LocalFSObjectStore::meta_path(const std::string& key) const {
  return (fs::path(root_) / "meta" / fs::path(key)).string() + ".json";
}

bool LocalFSObjectStore::put(const std::string& key, const std::string& data,
                             const Metadata& metadata) {
  if (!valid_object_key(key)) return false;
  jsonlite::Object meta;
  meta["created_at"] = jsonlite::Value{unix_now()};
  meta["metadata"] = jsonlite::make_string_map(metadata);
  meta["size"] = jsonlite::Value{static_cast<std::uint64_t>(data.size())};

  const fs::path staging = fs::path(root_) / "tmp";
  if (!atomic_write(staging, meta_path(key), jsonlite::to_json(meta))) return false;
  if (!atomic_write(staging, object_path(key), data)) {
    std::error_code ec;
    fs::remove(meta_path(key), ec);
    return false;
  }
  return true;
}

std::optional<std::string> LocalFSObjectStore::get(const std::string& key,
                                                   std::optional<ByteRange> range) const {
  if (!valid_object_key(key)) return std::nullopt;
  const fs::path p = object_path(key);
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return std::nullopt;
  if (!range) return read_file(p);

  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  const uint64_t file_size = static_cast<uint64_t>(fs::file_size(p, ec));
  if (ec) return std::nullopt;
  if (range->offset >= file_size) return std::string{};
  const uint64_t n = std::min(range->length, file_size - range->offset);
  std::string out(static_cast<std::size_t>(n), '\0');
  ifs.seekg(static_cast<std::streamoff>(range->offset));
  ifs.read(out.data(), static_cast<std::streamsize>(n));
  out.resize(static_cast<std::size_t>(ifs.gcount()));
  return out;
}

std::optional<ObjectInfo> LocalFSObjectStore::head(const std::string& key) const {
  if (!valid_object_key(key)) return std::nullopt;
  std::error_code ec;
  const fs::path p = object_path(key);
  if (!fs::is_regular_file(p, ec)) return std::nullopt;
  ObjectInfo info;
  info.key = key;
  info.size = static_cast<std::size_t>(fs::file_size(p, ec));
  if (auto raw = read_file(meta_path(key))) {
    auto obj = jsonlite::parse(*raw, nullptr);
    info.metadata = jsonlite::get_string_map(obj, "metadata");
    info.created_at_unix_ts = jsonlite::get_u64(obj, "created_at", 0);
  }
  return info;
}

bool LocalFSObjectStore::remove(const std::string& key) {
  if (!valid_object_key(key)) return false;
  std::error_code ec_obj;
  std::error_code ec_meta;
  fs::remove(object_path(key), ec_obj);
  fs::remove(meta_path(key), ec_meta);
  return !ec_obj && !ec_meta;
}

ListPage LocalFSObjectStore::list(const std::string& prefix, const std::string& start_after,
                                  std::size_t limit) const {
  ListPage page;
  const std::size_t cap = (limit == 0 || limit > max_page_size_) ? max_page_size_ : limit;

  // Walk only the subtree that can contain matching keys.
  const auto slash = prefix.rfind('/');
  const std::string dir_part = slash == std::string::npos ? "" : prefix.substr(0, slash);
  const fs::path objects_root = fs::path(root_) / "objects";
  const fs::path walk_root = dir_part.empty() ? objects_root : objects_root / fs::path(dir_part);

  std::error_code ec;
  if (!fs::is_directory(walk_root, ec)) return page;

  std::vector<std::string> keys;
  for (fs::recursive_directory_iterator it(walk_root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    std::string key = it->path().lexically_relative(objects_root).generic_string();
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    if (!start_after.empty() && key <= start_after) continue;
    keys.push_back(std::move(key));
  }
  std::sort(keys.begin(), keys.end());
  if (keys.size() > cap) {
    keys.resize(cap);
    page.truncated = true;
  }
  page.keys = std::move(keys);
  return page;
}

std::string LocalFSObjectStore::presign(const std::string& key, std::optional<ByteRange> range,
                                        std::chrono::seconds ttl) const {
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(object_path(key)), ec);
  if (ec) abs = fs::path(object_path(key));
  return "file://" + percent_encode(abs.generic_string()) + locator_query(range, ttl);
}

}  // namespace floodgate
