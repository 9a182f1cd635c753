#include "floodgate/config.hpp"

#include <cstdlib>

namespace floodgate {

namespace {

std::optional<std::string> env_value(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !v[0]) return std::nullopt;
  return std::string(v);
}

std::optional<uint64_t> parse_positive(const std::string& s) {
  if (s.empty() || s.size() > 18) return std::nullopt;
  uint64_t out = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    out = out * 10 + static_cast<uint64_t>(c - '0');
  }
  if (out == 0) return std::nullopt;
  return out;
}

bool valid_compression(const std::string& s) { return s == "off" || s == "zstd"; }

bool valid_root_prefix(const std::string& s) {
  return !s.empty() && s.front() != '/' && s.back() != '/' && s.find("//") == std::string::npos;
}

}  // namespace

FloodConfig config_from_env(FloodConfig base) {
  FloodConfig cfg = std::move(base);
  if (auto v = env_value("FLOODGATE_ROOT_PREFIX"); v && valid_root_prefix(*v)) cfg.root_prefix = *v;
  if (auto v = env_value("FLOODGATE_PAGE_SIZE")) {
    if (auto n = parse_positive(*v)) cfg.list_page_size = static_cast<std::size_t>(*n);
  }
  if (auto v = env_value("FLOODGATE_MAX_JOURNAL_EVENTS")) {
    if (auto n = parse_positive(*v)) cfg.max_journal_events = static_cast<std::size_t>(*n);
  }
  if (auto v = env_value("FLOODGATE_PRESIGN_TTL")) {
    if (auto n = parse_positive(*v)) cfg.presign_ttl = std::chrono::seconds(*n);
  }
  if (auto v = env_value("FLOODGATE_INDEX_COMPRESSION"); v && valid_compression(*v)) {
    cfg.journal_index_compression = *v;
  }
  if (auto v = env_value("FLOODGATE_VERIFY_DIGESTS")) {
    if (*v == "0" || *v == "false") cfg.verify_payload_digests = false;
    else if (*v == "1" || *v == "true") cfg.verify_payload_digests = true;
  }
  return cfg;
}

FloodConfig config_from_json(const std::string& text, FloodConfig base,
                             std::optional<jsonlite::JsonError>* error) {
  FloodConfig cfg = std::move(base);
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (error) *error = err;
  if (err) return cfg;

  const std::string prefix = jsonlite::get_string(obj, "root_prefix", cfg.root_prefix);
  if (valid_root_prefix(prefix)) cfg.root_prefix = prefix;
  if (auto n = jsonlite::get_u64(obj, "list_page_size", 0); n > 0) cfg.list_page_size = n;
  if (auto n = jsonlite::get_u64(obj, "max_journal_events", 0); n > 0) cfg.max_journal_events = n;
  if (auto n = jsonlite::get_u64(obj, "presign_ttl_s", 0); n > 0) cfg.presign_ttl = std::chrono::seconds(n);
  const std::string comp =
      jsonlite::get_string(obj, "journal_index_compression", cfg.journal_index_compression);
  if (valid_compression(comp)) cfg.journal_index_compression = comp;
  cfg.verify_payload_digests =
      jsonlite::get_bool(obj, "verify_payload_digests", cfg.verify_payload_digests);
  return cfg;
}

std::string config_to_json(const FloodConfig& cfg) {
  jsonlite::Object o;
  o["root_prefix"] = jsonlite::Value{cfg.root_prefix};
  o["list_page_size"] = jsonlite::Value{static_cast<std::uint64_t>(cfg.list_page_size)};
  o["max_journal_events"] = jsonlite::Value{static_cast<std::uint64_t>(cfg.max_journal_events)};
  o["presign_ttl_s"] = jsonlite::Value{static_cast<std::uint64_t>(cfg.presign_ttl.count())};
  o["journal_index_compression"] = jsonlite::Value{cfg.journal_index_compression};
  o["verify_payload_digests"] = jsonlite::Value{cfg.verify_payload_digests};
  return jsonlite::to_json(o);
}

}  // namespace floodgate
