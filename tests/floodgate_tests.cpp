#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "floodgate/collator.hpp"
#include "floodgate/config.hpp"
#include "floodgate/flood.hpp"
#include "floodgate/hash.hpp"
#include "floodgate/journal.hpp"
#include "floodgate/jsonlite.hpp"
#include "floodgate/key_index.hpp"
#include "floodgate/keys.hpp"
#include "floodgate/object_store.hpp"
#include "floodgate/observability.hpp"
#include "floodgate/overlay.hpp"
#include "floodgate/replay.hpp"
#include "floodgate/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

template <typename Fn>
std::string expect_flood_error(Fn&& fn, floodgate::ErrorCode code, const std::string& message) {
  try {
    fn();
  } catch (const floodgate::FloodError& e) {
    expect(e.code() == code, message + " (got " + floodgate::to_string(e.code()) + ")");
    return e.what();
  }
  expect(false, message + " (nothing thrown)");
  return {};
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

using floodgate::Timestamp;

// 2024-01-01T00:00:00Z plus an offset in seconds.
Timestamp ts(int seconds, int micros = 0) {
  using namespace std::chrono;
  return Timestamp{sys_days{year{2024} / January / 1}} + std::chrono::seconds(seconds) +
         microseconds(micros);
}

// Pinned clock shared by every log a test creates.
Timestamp g_now = ts(100000);
Timestamp fixed_now() { return g_now; }

// Wraps another store and rejects selected writes, to simulate a crash at
// a precise step of a multi-object operation.
class FaultInjectingStore : public floodgate::IObjectStore {
 public:
  explicit FaultInjectingStore(std::shared_ptr<floodgate::IObjectStore> inner)
      : inner_(std::move(inner)) {}

  std::string fail_put_containing;
  std::string fail_remove_containing;

  bool put(const std::string& key, const std::string& data,
           const floodgate::Metadata& metadata = {}) override {
    if (!fail_put_containing.empty() && key.find(fail_put_containing) != std::string::npos) {
      return false;
    }
    return inner_->put(key, data, metadata);
  }
  std::optional<std::string> get(const std::string& key,
                                 std::optional<floodgate::ByteRange> range) const override {
    return inner_->get(key, range);
  }
  std::optional<floodgate::ObjectInfo> head(const std::string& key) const override {
    return inner_->head(key);
  }
  bool remove(const std::string& key) override {
    if (!fail_remove_containing.empty() &&
        key.find(fail_remove_containing) != std::string::npos) {
      return false;
    }
    return inner_->remove(key);
  }
  floodgate::ListPage list(const std::string& prefix, const std::string& start_after,
                           std::size_t limit) const override {
    return inner_->list(prefix, start_after, limit);
  }
  std::string presign(const std::string& key, std::optional<floodgate::ByteRange> range,
                      std::chrono::seconds ttl) const override {
    return inner_->presign(key, range, ttl);
  }
  std::string backend_id() const override { return "fault:" + inner_->backend_id(); }

 private:
  std::shared_ptr<floodgate::IObjectStore> inner_;
};

// Runs `after_put` once, right after the first put whose key contains
// `after_put_containing` commits.
class HookStore : public FaultInjectingStore {
 public:
  using FaultInjectingStore::FaultInjectingStore;

  std::string after_put_containing;
  std::function<void()> after_put;

  bool put(const std::string& key, const std::string& data,
           const floodgate::Metadata& metadata = {}) override {
    const bool ok = FaultInjectingStore::put(key, data, metadata);
    if (ok && after_put && key.find(after_put_containing) != std::string::npos) {
      auto hook = std::move(after_put);
      after_put = nullptr;
      hook();
    }
    return ok;
  }
};

std::vector<std::string> all_keys(const floodgate::IObjectStore& store, const std::string& prefix) {
  std::vector<std::string> out;
  floodgate::ListCursor cursor(store, prefix);
  while (auto k = cursor.next()) out.push_back(*k);
  return out;
}

std::vector<std::string> ids_of(const std::vector<floodgate::MergedEvent>& events) {
  std::vector<std::string> out;
  for (const auto& e : events) out.push_back(e.event_id);
  return out;
}

std::vector<std::string> payloads_of(const std::vector<floodgate::MergedEvent>& events) {
  std::vector<std::string> out;
  for (const auto& e : events) out.push_back(e.payload);
  return out;
}

std::vector<floodgate::MergedEvent> replay_all(const floodgate::FloodLog& log,
                                               floodgate::TimeWindow window = {}) {
  return log.replay(window).collect();
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

// ============================================================================
// Phase 1: Hashing and key codec
// ============================================================================

void test_blake3_known_vectors() {
  expect(floodgate::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(floodgate::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_payload_digest_domain() {
  const std::string d = floodgate::payload_digest("payload");
  expect(d.size() == 64 && floodgate::is_hex_digest(d), "payload digest is 64 hex chars");
  expect(d == floodgate::payload_digest("payload"), "payload digest is deterministic");
  expect(d != floodgate::blake3_hex("payload"), "payload digest is domain separated");
  expect(floodgate::short_tag("seed").size() == 8, "short tag is 8 hex chars");
}

void test_timestamp_text_form() {
  expect(floodgate::format_timestamp(ts(0, 123456)) == "2024-01-01T000000.123456Z",
         "timestamp text form");
  expect(floodgate::format_timestamp(ts(3723, 7)) == "2024-01-01T010203.000007Z",
         "hours, minutes, seconds, micros");
  expect(floodgate::format_timestamp(floodgate::distant_past()) == "0001-01-01T000000.000000Z",
         "distant past");
  expect(floodgate::format_timestamp(floodgate::far_future()) == "5000-01-01T000000.000000Z",
         "far future");

  auto back = floodgate::parse_timestamp("2024-01-01T000000.123456Z");
  expect(back && *back == ts(0, 123456), "parse inverts format");
  expect(!floodgate::parse_timestamp("2024-13-01T000000.000000Z"), "month 13 rejected");
  expect(!floodgate::parse_timestamp("2024-02-30T000000.000000Z"), "Feb 30 rejected");
  expect(!floodgate::parse_timestamp("2024-01-01T240000.000000Z"), "hour 24 rejected");
  expect(!floodgate::parse_timestamp("2024-01-01T000000.00000Z"), "short text rejected");
  expect(!floodgate::parse_timestamp("2024-01-01 000000.000000Z"), "bad separator rejected");
}

void test_key_order_matches_logical_order() {
  const floodgate::KeyLayout layout("root");
  using Pair = std::pair<Timestamp, std::string>;
  std::vector<Pair> pairs = {
      {ts(5), "b"},        {ts(5), "a"},  {ts(5), "a-b"}, {ts(5), "a--b"},
      {ts(4, 999999), "z"}, {ts(5, 1), "0"}, {ts(-86400 * 366 * 30), "old"},
      {ts(86400 * 366 * 3), "new"}};

  std::vector<Pair> by_tuple = pairs;
  std::sort(by_tuple.begin(), by_tuple.end());

  std::vector<Pair> by_key = pairs;
  std::sort(by_key.begin(), by_key.end(), [&](const Pair& l, const Pair& r) {
    return layout.encode(l.first, l.second) < layout.encode(r.first, r.second);
  });
  expect(by_tuple == by_key, "key order equals (timestamp, id) order");

  for (const auto& [t, id] : pairs) {
    auto parts = layout.decode_loose(layout.encode(t, id));
    expect(parts && parts->timestamp == t && parts->event_id == id, "loose key decodes: " + id);
  }
  expect(!layout.decode_loose("root/loose/garbage"), "garbage loose key rejected");
}

void test_invalid_event_ids() {
  expect(!floodgate::valid_event_id(""), "empty id");
  expect(!floodgate::valid_event_id("a/b"), "slash");
  expect(!floodgate::valid_event_id("."), "dot");
  expect(!floodgate::valid_event_id(".."), "dotdot");
  expect(!floodgate::valid_event_id(std::string(513, 'x')), "too long");
  expect(!floodgate::valid_event_id(std::string("a\0b", 3)), "NUL byte");
  expect(floodgate::valid_event_id(std::string(512, 'x')), "512 bytes is fine");
  expect(floodgate::valid_event_id("order:17--v2"), "delimiter inside id is fine");

  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  expect_flood_error([&] { log.put("a/b", "x", ts(1)); }, floodgate::ErrorCode::invalid_argument,
                     "put with slash in id");
  expect(store->size() == 0, "nothing written for an invalid id");
}

void test_journal_and_overlay_ids() {
  const std::string a = floodgate::make_journal_id(ts(1), 1);
  const std::string b = floodgate::make_journal_id(ts(1), 2);
  const std::string c = floodgate::make_journal_id(ts(1, 1), 1);
  expect(a < b && b < c, "journal ids order by (min ts, sequence)");
  auto parts = floodgate::decode_journal_id(b);
  expect(parts && parts->min_ts == ts(1) && parts->sequence == 2, "journal id decodes");
  expect(!floodgate::decode_journal_id("2024-01-01T000001.000000Z--12"), "short sequence rejected");

  const std::string o = floodgate::make_overlay_id(ts(9), 42, "0a1b2c3d");
  auto op = floodgate::decode_overlay_id(o);
  expect(op && op->written_at == ts(9) && op->sequence == 42 && op->node_tag == "0a1b2c3d",
         "overlay id decodes");

  const floodgate::KeyLayout layout("fg");
  auto rec = layout.decode_overlay_index(
      layout.encode_overlay_index("ev--1", o, floodgate::OverlayKind::remove));
  expect(rec && rec->event_id == "ev--1" && rec->overlay_id == o &&
             rec->kind == floodgate::OverlayKind::remove,
         "overlay index key decodes");
}

// ============================================================================
// Phase 2: Object store backends
// ============================================================================

void test_memory_store_listing() {
  floodgate::MemoryObjectStore store(2);
  for (const char* k : {"p/c", "p/a", "p/b", "q/a", "p/d", "o/z"}) {
    expect(store.put(k, std::string("v-") + k), "put");
  }

  auto page = store.list("p/", "", 0);
  expect(page.keys == std::vector<std::string>({"p/a", "p/b"}) && page.truncated,
         "first page capped at max page size");
  page = store.list("p/", "p/b", 10);
  expect(page.keys == std::vector<std::string>({"p/c", "p/d"}), "start_after is exclusive");
  page = store.list("p/", "p/d", 10);
  expect(page.keys.empty() && !page.truncated, "listing past the end");

  floodgate::ListCursor cursor(store, "p/", "", 2);
  std::vector<std::string> keys;
  while (auto k = cursor.next()) keys.push_back(*k);
  expect(keys.size() == 4 && std::is_sorted(keys.begin(), keys.end()), "cursor drains all pages");
  expect(cursor.pages_fetched() == 2, "cursor stops on the first untruncated page");

  expect(*store.get("p/a", floodgate::ByteRange{2, 100}) == "p/a", "range clamped to object");
  expect(store.get("p/a", floodgate::ByteRange{50, 1})->empty(), "range past end is empty");
  expect(!store.get("p/zz"), "missing object");

  const std::string url = store.presign("p/a", floodgate::ByteRange{2, 3}, std::chrono::seconds(60));
  expect(url.rfind("mem://p/a?expires=", 0) == 0, "memory locator scheme");
  expect(url.find("range=bytes=2-4") != std::string::npos, "locator carries byte range");

  expect(store.remove("p/a") && !store.head("p/a"), "remove");
  expect(store.remove("p/a"), "removing a missing object succeeds");
  expect(!store.put("../x", "v"), "path traversal key rejected");
}

void test_localfs_store_semantics() {
  const fs::path root = fresh_dir("floodgate_localfs_store_test");
  floodgate::LocalFSObjectStore store(root.string(), 2);

  expect(store.put("p/a/2", "two", {{"k", "v"}}), "put nested");
  expect(store.put("p/a/1", "one"), "put nested");
  expect(store.put("p/a-x", "dash"), "put sibling");
  expect(store.put("p/b", "bee"), "put");
  expect(store.put("q", "other"), "put other namespace");

  auto info = store.head("p/a/2");
  expect(info && info->size == 3 && info->metadata.at("k") == "v", "metadata sidecar round trip");
  expect(*store.get("p/a/2") == "two", "get whole object");
  expect(*store.get("p/a/2", floodgate::ByteRange{1, 5}) == "wo", "ranged get clamps");

  expect(all_keys(store, "p/") ==
             std::vector<std::string>({"p/a-x", "p/a/1", "p/a/2", "p/b"}),
         "listing is byte-lexicographic across directories");
  expect(all_keys(store, "p/a") == std::vector<std::string>({"p/a-x", "p/a/1", "p/a/2"}),
         "prefix ending mid-component");
  auto page = store.list("p/", "", 0);
  expect(page.keys == std::vector<std::string>({"p/a-x", "p/a/1"}) && page.truncated,
         "page capped at max page size");
  page = store.list("p/", "p/a/1", 0);
  expect(page.keys == std::vector<std::string>({"p/a/2", "p/b"}) && !page.truncated,
         "start_after is exclusive");

  expect(store.put("p/b", "bee2") && *store.get("p/b") == "bee2", "overwrite");
  expect(store.remove("p/b") && !store.get("p/b"), "remove");
  expect(!fs::exists(root / "meta" / "p" / "b.json"), "sidecar removed");

  const std::string url = store.presign("p/a/1", std::nullopt, std::chrono::seconds(60));
  expect(url.rfind("file://", 0) == 0 && url.find("expires=") != std::string::npos,
         "file locator");
  fs::remove_all(root);
}

// ============================================================================
// Phase 3: Writer and collator
// ============================================================================

void test_put_write_failure() {
  auto inner = std::make_shared<floodgate::MemoryObjectStore>();
  auto faulty = std::make_shared<FaultInjectingStore>(inner);
  faulty->fail_put_containing = "/loose/";
  floodgate::FloodLog log(faulty, {}, fixed_now);

  const uint64_t before = floodgate::global_flood_stats().failure_count("write_failed");
  expect_flood_error([&] { log.put("e1", "x", ts(1)); }, floodgate::ErrorCode::write_failed,
                     "rejected put surfaces write_failed");
  expect(floodgate::global_flood_stats().failure_count("write_failed") == before + 1,
         "failure recorded in stats");
  expect(!log.event_exists("e1"), "failed put leaves no event");
  expect(all_keys(*inner, log.layout().event_index_prefix("e1")).empty(),
         "locator of the failed put withdrawn");
  expect_flood_error([&] { log.update("e1", "y"); }, floodgate::ErrorCode::event_not_found,
                     "failed put cannot be updated");
}

void test_put_interleaved_with_collation() {
  auto inner = std::make_shared<floodgate::MemoryObjectStore>();
  auto hooked = std::make_shared<HookStore>(inner);
  floodgate::FloodLog log(hooked, {}, fixed_now);
  floodgate::Collator collator(inner, log.config());

  uint64_t folded = 0;
  hooked->after_put_containing = "/loose/";
  hooked->after_put = [&] { folded = collator.collate(1).events_folded; };
  log.put("A", "a", ts(1));

  expect(folded == 1, "collation ran between the loose write and put() returning");
  expect(all_keys(*inner, log.layout().loose_prefix()).empty(), "loose object folded");
  auto got = log.get_event("A");
  expect(got.status == floodgate::LookupStatus::found && got.event.payload == "a",
         "event found in its journal");
  expect(log.event_exists("A"), "event exists");
  expect(ids_of(replay_all(log)) == std::vector<std::string>({"A"}), "replayed once");
  log.update("A", "a2");
  expect(log.get_event("A").event.payload == "a2", "update applies to the folded event");
}

void test_reput_moves_locator() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("e", "v1", ts(1));
  log.collate(1);
  log.put("e", "v2", ts(2));

  auto got = log.get_event("e");
  expect(got.status == floodgate::LookupStatus::found && got.event.payload == "v2" &&
             got.event.timestamp == ts(2),
         "lookup follows the latest put");
  expect(payloads_of(replay_all(log)) == std::vector<std::string>({"v1", "v2"}),
         "both copies stay in the log");

  log.collate(1);
  expect(log.get_event("e").event.payload == "v2", "latest copy after it is folded");
  expect(all_keys(*store, log.layout().event_index_prefix("e")).size() == 1,
         "one locator revision left");
}

void test_concrete_ab_scenario() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  const floodgate::TimeWindow t1{ts(1), ts(1)};

  log.put("A", "x", ts(1));
  log.put("B", "y", ts(1));
  expect(ids_of(replay_all(log, t1)) == std::vector<std::string>({"A", "B"}), "loose [A,B]");

  auto result = log.collate(1);
  expect(result.events_folded == 2 && result.journal_id, "both folded into one journal");
  auto events = replay_all(log, t1);
  expect(ids_of(events) == std::vector<std::string>({"A", "B"}), "journaled [A,B]");
  expect(payloads_of(events) == std::vector<std::string>({"x", "y"}), "journaled payloads");
  expect(events[0].source == floodgate::EventSource::journal, "served from the journal");

  log.update("A", "x2");
  auto a = log.get_event("A");
  expect(a.status == floodgate::LookupStatus::found && a.event.payload == "x2", "A updated");

  log.remove("B");
  events = replay_all(log, t1);
  expect(ids_of(events) == std::vector<std::string>({"A"}), "B deleted");
  expect(events[0].payload == "x2" && events[0].updated, "A keeps its update");
}

void test_partition_invariant() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  for (int i = 0; i < 10; ++i) log.put("e" + std::to_string(i), "p", ts(i));
  auto result = log.collate(1);
  for (int i = 10; i < 13; ++i) log.put("e" + std::to_string(i), "p", ts(i));

  const auto& layout = log.layout();
  const auto index = floodgate::load_journal_index(*store, layout, *result.journal_id);
  const auto loose = all_keys(*store, layout.loose_prefix());

  for (int i = 0; i < 13; ++i) {
    const std::string id = "e" + std::to_string(i);
    const bool in_loose =
        std::find(loose.begin(), loose.end(), layout.encode(ts(i), id)) != loose.end();
    const bool in_journal = std::any_of(index.events.begin(), index.events.end(),
                                        [&](const floodgate::JournalEntry& e) { return e.event_id == id; });
    expect(in_loose != in_journal, "exactly one home for " + id);
  }
  expect(replay_all(log).size() == 13, "every event replayed once");
}

void test_collate_idempotent_and_min_batch() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);

  auto nothing = log.collate(1);
  expect(!nothing.journal_id && nothing.events_folded == 0, "empty log: nothing to do");

  log.put("a", "1", ts(1));
  log.put("b", "2", ts(2));
  auto waiting = log.collate(5);
  expect(!waiting.journal_id && waiting.events_pending == 2, "below min batch size");
  expect(all_keys(*store, log.layout().loose_prefix()).size() == 2, "nothing folded");

  auto done = log.collate(2);
  expect(done.journal_id && done.events_folded == 2 && done.bytes_written > 0, "folded at 2");
  for (int i = 0; i < 3; ++i) {
    auto again = log.collate(1);
    expect(!again.journal_id && again.events_folded == 0, "repeat collation is a no-op");
  }
  expect(all_keys(*store, "floodgate/journal/").size() == 1, "no empty or duplicate journals");
  expect(all_keys(*store, log.layout().key_index_prefix()).size() == 1, "one key index entry");
  expect(all_keys(*store, log.layout().marker_prefix()).size() == 1, "stale markers pruned");
}

void test_min_batch_above_journal_cap() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodConfig cfg;
  cfg.max_journal_events = 3;
  floodgate::FloodLog log(store, cfg, fixed_now);
  for (int i = 0; i < 10; ++i) log.put("e" + std::to_string(i), "p", ts(i));

  for (int round = 0; round < 3; ++round) {
    auto r = log.collate(5);
    expect(r.journal_id && r.events_folded == 3, "full journal satisfies a larger min batch");
  }
  auto rest = log.collate(5);
  expect(!rest.journal_id && rest.events_pending == 1, "remainder below the batch size");
  expect(log.collate(1).events_folded == 1, "remainder folded on demand");
  expect(replay_all(log).size() == 10, "every event replayed once");
}

void test_max_journal_events() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodConfig cfg;
  cfg.max_journal_events = 3;
  floodgate::FloodLog log(store, cfg, fixed_now);
  for (int i = 0; i < 7; ++i) log.put("e" + std::to_string(i), std::to_string(i), ts(i));

  expect(log.collate(1).events_folded == 3, "first journal capped");
  expect(log.collate(1).events_folded == 3, "second journal capped");
  expect(log.collate(1).events_folded == 1, "remainder");
  expect(all_keys(*store, "floodgate/journal/").size() == 3, "three journals");

  auto events = replay_all(log);
  expect(payloads_of(events) == std::vector<std::string>({"0", "1", "2", "3", "4", "5", "6"}),
         "order preserved across journals");
}

void test_range_across_collation_boundary() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  for (int i = 1; i <= 3; ++i) log.put("e" + std::to_string(i), "j", ts(i * 10));
  log.collate(1);
  for (int i = 4; i <= 5; ++i) log.put("e" + std::to_string(i), "l", ts(i * 10));

  auto events = replay_all(log, {ts(20), ts(40)});
  expect(ids_of(events) == std::vector<std::string>({"e2", "e3", "e4"}), "inclusive window");
  expect(events[0].source == floodgate::EventSource::journal &&
             events[2].source == floodgate::EventSource::loose,
         "sources on both sides of the boundary");

  expect(ids_of(replay_all(log, {ts(41), std::nullopt})) == std::vector<std::string>({"e5"}),
         "open-ended window");
  expect(ids_of(replay_all(log, {std::nullopt, ts(10)})) == std::vector<std::string>({"e1"}),
         "window from distant past");
  expect(replay_all(log, {ts(40), ts(20)}).empty(), "inverted window is empty");
}

void test_order_determinism_with_ties() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  for (const char* id : {"c", "a", "b"}) log.put(id, id, ts(5));
  log.put("z", "z", ts(4));

  const auto first = replay_all(log);
  expect(ids_of(first) == std::vector<std::string>({"z", "a", "b", "c"}), "ties broken by id");
  const auto second = replay_all(log);
  expect(ids_of(first) == ids_of(second) && payloads_of(first) == payloads_of(second),
         "replay is deterministic");

  log.collate(1);
  expect(ids_of(replay_all(log)) == ids_of(first), "same order after collation");
}

void test_late_arrivals_stay_visible() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("on-time", "1", ts(10));
  log.collate(1);
  log.put("late", "0", ts(5));

  auto result = log.collate(1);
  expect(!result.journal_id && result.events_pending == 0, "late arrival is not folded");
  expect(ids_of(replay_all(log)) == std::vector<std::string>({"late", "on-time"}),
         "late arrival merged in order");
  expect(log.get_event("late").status == floodgate::LookupStatus::found, "late arrival readable");
}

void test_crash_before_registration() {
  auto inner = std::make_shared<floodgate::MemoryObjectStore>();
  auto faulty = std::make_shared<FaultInjectingStore>(inner);
  floodgate::FloodLog log(faulty, {}, fixed_now);
  for (int i = 1; i <= 3; ++i) log.put("e" + std::to_string(i), "p", ts(i));

  faulty->fail_put_containing = "/key-index/";
  expect_flood_error([&] { log.collate(1); }, floodgate::ErrorCode::write_failed,
                     "registration rejected");
  expect(ids_of(replay_all(log)).size() == 3, "unregistered journal is invisible");

  faulty->fail_put_containing.clear();
  auto result = log.collate(1);
  expect(result.events_folded == 3 && !result.recovered_journal_id, "collation redone");
  expect(all_keys(*inner, "floodgate/journal/").size() == 1, "journal id reused, not duplicated");
  expect(ids_of(replay_all(log)).size() == 3, "every event once");
}

void test_crash_after_registration_recovers() {
  auto inner = std::make_shared<floodgate::MemoryObjectStore>();
  auto faulty = std::make_shared<FaultInjectingStore>(inner);
  floodgate::FloodLog log(faulty, {}, fixed_now);
  for (int i = 1; i <= 3; ++i) log.put("e" + std::to_string(i), "p" + std::to_string(i), ts(i));

  faulty->fail_remove_containing = "/loose/";
  expect_flood_error([&] { log.collate(1); }, floodgate::ErrorCode::write_failed,
                     "loose deletion rejected");
  expect(all_keys(*inner, log.layout().loose_prefix()).size() == 3, "loose leftovers remain");

  auto events = replay_all(log);
  expect(ids_of(events) == std::vector<std::string>({"e1", "e2", "e3"}),
         "leftovers deduplicated against the journal");
  expect(events[1].source == floodgate::EventSource::journal, "journal copy wins");

  faulty->fail_remove_containing.clear();
  log.put("e4", "p4", ts(4));
  auto result = log.collate(1);
  expect(result.recovered_journal_id.has_value(), "recovery finished the journal");
  expect(result.events_folded == 1, "only the new event is journaled");
  expect(all_keys(*inner, log.layout().key_index_prefix()).size() == 2, "no duplicate journal");
  expect(all_keys(*inner, log.layout().loose_prefix()).empty(), "leftovers deleted");
  expect(payloads_of(replay_all(log)) == std::vector<std::string>({"p1", "p2", "p3", "p4"}),
         "stream intact after recovery");
}

void test_concurrent_collation_detected() {
  auto inner = std::make_shared<floodgate::MemoryObjectStore>();
  auto faulty = std::make_shared<FaultInjectingStore>(inner);
  floodgate::FloodLog log(faulty, {}, fixed_now);
  log.put("e1", "p", ts(1));
  log.collate(1);

  log.put("e2", "p", ts(2));
  faulty->fail_remove_containing = "/loose/";
  expect_flood_error([&] { log.collate(1); }, floodgate::ErrorCode::write_failed,
                     "second collation interrupted");
  faulty->fail_remove_containing.clear();

  // A second collator registered another journal in the meantime.
  floodgate::KeyIndex key_index(inner, log.layout());
  floodgate::KeyIndexEntry foreign;
  foreign.journal_id = floodgate::make_journal_id(ts(6), 99);
  foreign.min_ts = ts(6);
  foreign.max_ts = ts(6);
  foreign.event_count = 1;
  key_index.register_journal(foreign);

  expect_flood_error([&] { log.collate(1); }, floodgate::ErrorCode::collation_conflict,
                     "two unfinished journals");
}

void test_key_index_rejects_overlap() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::KeyIndex key_index(store, floodgate::KeyLayout("fg"));
  floodgate::KeyIndexEntry a{floodgate::make_journal_id(ts(1), 1), ts(1), ts(5), 2, 10};
  key_index.register_journal(a);

  floodgate::KeyIndexEntry overlap{floodgate::make_journal_id(ts(3), 2), ts(3), ts(9), 2, 10};
  expect_flood_error([&] { key_index.register_journal(overlap); },
                     floodgate::ErrorCode::collation_conflict, "overlapping range");
  expect_flood_error([&] { key_index.register_journal(a); },
                     floodgate::ErrorCode::collation_conflict, "duplicate registration");

  floodgate::KeyIndexEntry touching{floodgate::make_journal_id(ts(5), 2), ts(5), ts(7), 1, 5};
  key_index.register_journal(touching);
  auto hits = key_index.query(ts(5), ts(5));
  expect(hits.size() == 2, "shared boundary timestamp hits both journals");
  expect(key_index.last_entry(a.journal_id)->journal_id == touching.journal_id, "last entry");
  expect(key_index.entries_after(a.journal_id).size() == 1, "entries after");
}

void test_key_index_avoids_full_listing() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodConfig cfg;
  cfg.list_page_size = 2;
  floodgate::FloodLog log(store, cfg, fixed_now);
  for (int i = 0; i < 20; ++i) {
    log.put("e" + std::to_string(i), "p", ts(i * 10));
    log.collate(1);
  }

  floodgate::KeyIndex key_index(store, log.layout(), 2);
  const uint64_t before = store->list_calls();
  auto hits = key_index.query(ts(95), ts(105));
  const uint64_t calls = store->list_calls() - before;
  expect(hits.size() == 1 && hits[0].min_ts == ts(100), "exactly the overlapping journal");
  expect(calls <= 2, "range query lists " + std::to_string(calls) + " pages, not all 10");
}

// ============================================================================
// Phase 4: Journals and corruption
// ============================================================================

void test_journal_index_validation() {
  floodgate::JournalIndex index;
  index.format_version = floodgate::version::JOURNAL_FORMAT_VERSION;
  index.journal_id = floodgate::make_journal_id(ts(1), 1);
  index.from = ts(1);
  index.to = ts(2);
  index.size = 6;
  index.events = {{"a", ts(1), 0, 3, floodgate::payload_digest("abc"), {}},
                  {"b", ts(2), 3, 3, floodgate::payload_digest("def"), {{"k", "v"}}}};
  floodgate::validate_journal_index(index, 6);

  auto parsed = floodgate::parse_journal_index(floodgate::serialize_journal_index(index),
                                               index.journal_id);
  expect(parsed.events.size() == 2 && parsed.events[1].metadata.at("k") == "v",
         "index document parses");

  expect_flood_error([&] { floodgate::validate_journal_index(index, 5); },
                     floodgate::ErrorCode::corrupt_journal, "blob shorter than index");
  auto overlapping = index;
  overlapping.events[1].offset = 2;
  overlapping.events[1].size = 4;
  expect_flood_error([&] { floodgate::validate_journal_index(overlapping, 6); },
                     floodgate::ErrorCode::corrupt_journal, "overlapping entries");
  auto unsorted = index;
  std::swap(unsorted.events[0].event_id, unsorted.events[1].event_id);
  unsorted.events[1].timestamp = ts(1);
  unsorted.to = ts(1);
  expect_flood_error([&] { floodgate::validate_journal_index(unsorted, 6); },
                     floodgate::ErrorCode::corrupt_journal, "entries out of order");

  auto newer = index;
  newer.format_version = floodgate::version::JOURNAL_FORMAT_VERSION + 1;
  expect_flood_error(
      [&] {
        floodgate::parse_journal_index(floodgate::serialize_journal_index(newer), index.journal_id);
      },
      floodgate::ErrorCode::unsupported_format, "newer format rejected");
  expect_flood_error([&] { floodgate::parse_journal_index("{not json", index.journal_id); },
                     floodgate::ErrorCode::corrupt_journal, "malformed document");
}

void test_corrupt_journal_fails_closed() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("a", "alpha", ts(1));
  log.put("b", "bravo", ts(2));
  const std::string journal_id = *log.collate(1).journal_id;
  const std::string blob_key = log.layout().encode_journal(journal_id);

  std::string blob = *store->get(blob_key);
  blob[6] ^= 0x20;
  store->put(blob_key, blob);
  std::string what = expect_flood_error([&] { replay_all(log); },
                                        floodgate::ErrorCode::corrupt_journal, "flipped byte");
  expect(what.find(journal_id) != std::string::npos, "error names the journal");

  store->put(blob_key, blob.substr(0, 4));
  what = expect_flood_error([&] { replay_all(log); }, floodgate::ErrorCode::corrupt_journal,
                            "truncated blob");
  expect(what.find(journal_id) != std::string::npos, "error names the journal");

  store->remove(log.layout().encode_journal_index(journal_id));
  expect_flood_error([&] { log.get_event("a"); }, floodgate::ErrorCode::corrupt_journal,
                     "missing index");
}

void test_out_of_order_journal_is_conflict() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("a", "1", ts(10));
  log.put("b", "2", ts(20));
  log.collate(1);
  log.put("c", "3", ts(30));
  log.put("d", "4", ts(40));
  const std::string second = *log.collate(1).journal_id;

  // Rewrite the second journal's index so it starts before the first ends.
  auto index = floodgate::load_journal_index(*store, log.layout(), second);
  index.events[0].timestamp = ts(1);
  index.events[1].timestamp = ts(2);
  index.from = ts(1);
  index.to = ts(2);
  store->put(log.layout().encode_journal_index(second), floodgate::serialize_journal_index(index),
             {{"encoding", "identity"}});

  expect_flood_error([&] { replay_all(log); }, floodgate::ErrorCode::collation_conflict,
                     "journal overlapping its predecessor");
}

void test_index_compression() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodConfig cfg;
  cfg.journal_index_compression = "zstd";
  floodgate::FloodLog log(store, cfg, fixed_now);
  for (int i = 0; i < 50; ++i) log.put("evt-" + std::to_string(i), "payload", ts(i));
  const std::string journal_id = *log.collate(1).journal_id;

  auto info = store->head(log.layout().encode_journal_index(journal_id));
  const std::string expected = floodgate::zstd_available() ? "zstd" : "identity";
  expect(info && info->metadata.at("encoding") == expected, "encoding recorded: " + expected);
  expect(replay_all(log).size() == 50, "compressed index readable");
}

// ============================================================================
// Phase 5: Overlays and lookups
// ============================================================================

void test_overlay_precedence() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("e", "v0", ts(1));

  expect(log.resolve("e").kind == floodgate::OverlayDecision::Kind::none, "no overlay");
  log.update("e", "v1");
  log.update("e", "v2");
  auto d = log.resolve("e");
  expect(d.kind == floodgate::OverlayDecision::Kind::update && d.payload == "v2", "latest update");
  expect(log.get_event("e").event.payload == "v2", "get_event sees latest update");

  log.remove("e");
  expect(log.get_event("e").status == floodgate::LookupStatus::deleted, "delete after update");
  expect(!log.event_exists("e"), "deleted event does not exist");
  expect(replay_all(log).empty(), "deleted event suppressed");

  log.update("e", "v3");
  expect(log.get_event("e").event.payload == "v3", "update after delete resurrects");
  expect(log.resolve("e").overlay_id > d.overlay_id, "overlay ids increase");
}

void test_overlay_ids_monotonic_under_clock_skew() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  Timestamp now = g_now + std::chrono::seconds(10);
  floodgate::OverlayManager overlays(store, floodgate::KeyLayout("fg"), [&] { return now; });

  auto a = overlays.write("e", floodgate::OverlayKind::update, "1");
  auto b = overlays.write("e", floodgate::OverlayKind::update, "2");
  now -= std::chrono::seconds(5);
  auto c = overlays.write("e", floodgate::OverlayKind::update, "3");
  // Overlay ids are process-wide; keep later tests' clock ahead of them.
  g_now += std::chrono::seconds(10);
  expect(a.overlay_id < b.overlay_id && b.overlay_id < c.overlay_id,
         "ids increase with a stalled and a backwards clock");
  expect(overlays.resolve("e").payload == "3", "last write wins");
  expect(overlays.history("e").size() == 3, "history lists every overlay");
}

void test_local_overlay_visible_after_clock_step_back() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  Timestamp now = g_now + std::chrono::seconds(20);
  floodgate::FloodLog log(store, {}, [&] { return now; });
  log.put("e", "v0", ts(1));
  log.update("e", "v1");
  now -= std::chrono::seconds(15);

  expect(log.get_event("e").event.payload == "v1", "lookup sees the local update");
  expect(log.resolve("e").payload == "v1", "resolve sees the local update");
  expect(payloads_of(replay_all(log)) == std::vector<std::string>({"v1"}),
         "replay sees the local update");
  log.update("e", "v2");
  expect(log.get_event("e").event.payload == "v2", "later update still wins");
  g_now += std::chrono::seconds(20);
}

void test_overlay_snapshot_per_cursor() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("a", "orig-a", ts(1));
  log.put("b", "orig-b", ts(2));

  auto cursor = log.replay();
  g_now += std::chrono::seconds(1);
  log.update("a", "new-a");
  log.remove("b");

  auto events = cursor.collect();
  expect(payloads_of(events) == std::vector<std::string>({"orig-a", "orig-b"}),
         "overlays after the snapshot are ignored");
  expect(payloads_of(replay_all(log)) == std::vector<std::string>({"new-a"}),
         "a fresh cursor sees them");
}

void test_overlay_missing_object() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("e", "v0", ts(1));
  auto rec = log.update("e", "v1");
  store->remove(log.layout().encode_overlay(rec.overlay_id));
  expect_flood_error([&] { log.resolve("e"); }, floodgate::ErrorCode::missing_object,
                     "index entry without overlay object");
}

void test_update_unknown_event_rejected() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  expect_flood_error([&] { log.update("ghost", "x"); }, floodgate::ErrorCode::event_not_found,
                     "update of unknown id");
  expect_flood_error([&] { log.remove("ghost"); }, floodgate::ErrorCode::event_not_found,
                     "delete of unknown id");
  expect(all_keys(*store, "floodgate/overlay").empty(), "no overlay written");
}

void test_get_event_and_exists() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("e", "payload", ts(7), {{"content-type", "text/plain"}});

  auto loose = log.get_event("e");
  expect(loose.status == floodgate::LookupStatus::found && loose.event.payload == "payload" &&
             loose.event.timestamp == ts(7) &&
             loose.event.metadata.at("content-type") == "text/plain",
         "loose lookup");

  log.collate(1);
  auto journaled = log.get_event("e");
  expect(journaled.status == floodgate::LookupStatus::found &&
             journaled.event.payload == "payload" &&
             journaled.event.metadata.at("content-type") == "text/plain",
         "journaled lookup");
  expect(all_keys(*store, log.layout().event_index_prefix("e")).size() == 1,
         "stale locator revisions pruned");

  expect(log.get_event("nope").status == floodgate::LookupStatus::not_found, "unknown id");
  expect(log.event_exists("e") && !log.event_exists("nope"), "event_exists");
}

void test_replay_follows_events_folded_mid_stream() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  for (int i = 1; i <= 4; ++i) log.put("e" + std::to_string(i), "p" + std::to_string(i), ts(i));

  auto cursor = log.replay();
  auto first = cursor.next();
  expect(first && first->event_id == "e1", "first event from the loose listing");
  log.collate(1);

  std::vector<std::string> rest;
  while (auto ev = cursor.next()) rest.push_back(ev->payload);
  expect(rest == std::vector<std::string>({"p2", "p3", "p4"}),
         "events folded after listing are still seen exactly once");
}

void test_replay_sees_events_folded_before_listing() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodConfig cfg;
  cfg.list_page_size = 2;
  floodgate::FloodLog log(store, cfg, fixed_now);
  for (int i = 1; i <= 6; ++i) log.put("e" + std::to_string(i), "p" + std::to_string(i), ts(i));

  auto cursor = log.replay();
  auto first = cursor.next();
  expect(first && first->event_id == "e1", "first page listed");
  // Folds the rest of the log before the cursor lists its second page.
  log.collate(1);

  std::vector<std::string> rest;
  while (auto ev = cursor.next()) rest.push_back(ev->event_id);
  expect(rest == std::vector<std::string>({"e2", "e3", "e4", "e5", "e6"}),
         "journal registered after the cursor started is picked up");
}

// ============================================================================
// Phase 6: Manifests
// ============================================================================

void test_manifest_equivalence() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  for (int i = 0; i < 6; ++i) {
    log.put("j" + std::to_string(i), "journal-" + std::to_string(i), ts(i), {{"n", std::to_string(i)}});
  }
  log.collate(1);
  for (int i = 6; i < 9; ++i) log.put("l" + std::to_string(i), "loose-" + std::to_string(i), ts(i));
  log.update("j2", "patched");
  log.remove("j4");
  log.update("l7", "patched-loose");

  const floodgate::TimeWindow window{ts(1), ts(8)};
  auto manifest = log.replay_manifest(window);
  auto replayed = replay_all(log, window);
  auto rebuilt = log.materialize(manifest);

  expect(rebuilt.size() == replayed.size(), "same number of events");
  for (std::size_t i = 0; i < rebuilt.size(); ++i) {
    expect(rebuilt[i].event_id == replayed[i].event_id &&
               rebuilt[i].timestamp == replayed[i].timestamp &&
               rebuilt[i].payload == replayed[i].payload &&
               rebuilt[i].metadata == replayed[i].metadata &&
               rebuilt[i].updated == replayed[i].updated,
           "manifest reproduces replay at " + replayed[i].event_id);
  }

  auto find = [&](const std::string& id) {
    return *std::find_if(manifest.begin(), manifest.end(),
                         [&](const floodgate::ManifestEntry& m) { return m.event_id == id; });
  };
  expect(find("j4").decision == floodgate::OverlayDecision::Kind::remove, "deletes are listed");
  expect(find("j2").key == log.layout().encode_overlay(find("j2").overlay_id),
         "updates point at the overlay object");
  expect(find("j3").range && find("j3").source == floodgate::EventSource::journal,
         "journal entries carry a byte range");
  expect(!find("l6").range && find("l6").locator.rfind("mem://", 0) == 0, "loose entries");

  const std::string json = floodgate::manifest_to_json(manifest);
  std::optional<floodgate::jsonlite::JsonError> err;
  auto doc = floodgate::jsonlite::parse(json, &err);
  expect(!err && floodgate::jsonlite::get_u64(doc, "manifest_version", 0) == 1,
         "manifest JSON carries its version");
}

void test_manifest_detects_tampering() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  log.put("a", "alpha", ts(1));
  log.collate(1);
  auto manifest = log.replay_manifest();
  auto tampered = [](const floodgate::ManifestEntry&) { return std::optional<std::string>("ALPHA"); };
  expect_flood_error([&] { floodgate::materialize_manifest(manifest, tampered); },
                     floodgate::ErrorCode::corrupt_journal, "digest checked on fetch");
  auto missing = [](const floodgate::ManifestEntry&) { return std::optional<std::string>(); };
  expect_flood_error([&] { floodgate::materialize_manifest(manifest, missing); },
                     floodgate::ErrorCode::missing_object, "unavailable object");
}

// ============================================================================
// Phase 7: Concurrency and backends end to end
// ============================================================================

void test_concurrent_writers() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        try {
          log.put("w" + std::to_string(t) + "-" + std::to_string(i), "p", ts(i, t));
        } catch (const floodgate::FloodError&) {
          failures++;
        }
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "no writer failed");

  auto events = replay_all(log);
  expect(events.size() == kThreads * kPerThread, "every write visible");
  auto ordered = std::is_sorted(events.begin(), events.end(), [](const auto& l, const auto& r) {
    return std::tie(l.timestamp, l.event_id) < std::tie(r.timestamp, r.event_id);
  });
  expect(ordered, "merged stream ordered");

  log.collate(1);
  expect(replay_all(log).size() == kThreads * kPerThread, "every write visible after collation");
}

void test_localfs_end_to_end() {
  const fs::path root = fresh_dir("floodgate_localfs_e2e_test");
  auto store = std::make_shared<floodgate::LocalFSObjectStore>(root.string());
  floodgate::FloodLog log(store, {}, fixed_now);

  log.put("a", "1", ts(1));
  log.put("b", "2", ts(2));
  log.collate(1);
  log.put("c", "3", ts(3));
  log.update("b", "2b");

  auto events = replay_all(log);
  expect(payloads_of(events) == std::vector<std::string>({"1", "2b", "3"}), "local fs replay");
  auto manifest = log.replay_manifest();
  expect(manifest[0].locator.rfind("file://", 0) == 0, "file locators");
  expect(payloads_of(log.materialize(manifest)) == payloads_of(events), "local fs manifest");
  fs::remove_all(root);
}

// ============================================================================
// Phase 8: Ambient stack
// ============================================================================

void test_jsonlite_roundtrip() {
  using namespace floodgate::jsonlite;
  Object o;
  o["s"] = Value{std::string("line\nbreak \"quoted\"")};
  o["n"] = Value{static_cast<std::uint64_t>(42)};
  o["b"] = Value{true};
  o["m"] = make_string_map({{"k", "v"}});
  Array arr;
  arr.push_back(Value{std::string("x")});
  o["a"] = Value{std::move(arr)};

  std::optional<JsonError> err;
  const std::string text = to_json(o);
  auto back = parse(text, &err);
  expect(!err, "serialized JSON parses");
  expect(to_json(back) == text, "serialization is canonical");
  expect(get_string(back, "s") == "line\nbreak \"quoted\"", "escapes survive");
  expect(get_u64(back, "n") == 42 && get_bool(back, "b"), "scalars survive");
  expect(get_string_map(back, "m").at("k") == "v", "string map survives");

  parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  parse("[1,2]", &err);
  expect(err.has_value(), "non-object rejected");
}

void test_config_sources() {
  auto cfg = floodgate::config_from_json(
      "{\"root_prefix\":\"tenant-a/log\",\"list_page_size\":50,\"max_journal_events\":7,"
      "\"presign_ttl_s\":60,\"journal_index_compression\":\"zstd\","
      "\"verify_payload_digests\":false}");
  expect(cfg.root_prefix == "tenant-a/log" && cfg.list_page_size == 50 &&
             cfg.max_journal_events == 7 && cfg.presign_ttl == std::chrono::seconds(60) &&
             cfg.journal_index_compression == "zstd" && !cfg.verify_payload_digests,
         "JSON config applied");

  auto kept = floodgate::config_from_json(
      "{\"root_prefix\":\"/abs\",\"list_page_size\":0,\"journal_index_compression\":\"lz4\"}");
  expect(kept.root_prefix == "floodgate" && kept.list_page_size == 1000 &&
             kept.journal_index_compression == "off",
         "invalid values ignored");

  std::optional<floodgate::jsonlite::JsonError> err;
  floodgate::config_from_json("{oops", {}, &err);
  expect(err.has_value(), "malformed config reports an error");

  setenv("FLOODGATE_MAX_JOURNAL_EVENTS", "12", 1);
  setenv("FLOODGATE_PAGE_SIZE", "abc", 1);
  auto env = floodgate::config_from_env(cfg);
  unsetenv("FLOODGATE_MAX_JOURNAL_EVENTS");
  unsetenv("FLOODGATE_PAGE_SIZE");
  expect(env.max_journal_events == 12 && env.list_page_size == 50, "env overrides base");

  auto again = floodgate::config_from_json(floodgate::config_to_json(cfg));
  expect(floodgate::config_to_json(again) == floodgate::config_to_json(cfg), "config round trip");
}

std::vector<floodgate::FloodEvent> g_hooked;
void capture_hook(const floodgate::FloodEvent& ev) { g_hooked.push_back(ev); }

void test_observability_events() {
  auto store = std::make_shared<floodgate::MemoryObjectStore>();
  floodgate::FloodLog log(store, {}, fixed_now);
  auto& stats = log.stats();
  const uint64_t folded_before = stats.events_folded.load();

  g_hooked.clear();
  floodgate::set_flood_event_hook(capture_hook);
  log.put("a", "abc", ts(1));
  log.collate(1);
  floodgate::set_flood_event_hook(nullptr);

  expect(g_hooked.size() == 2, "one event per operation");
  expect(g_hooked[0].operation == "put" && g_hooked[0].ok && g_hooked[0].bytes == 3, "put event");
  expect(g_hooked[1].operation == "collate" && g_hooked[1].events == 1 &&
             !g_hooked[1].journal_id.empty(),
         "collate event");
  expect(stats.events_folded.load() == folded_before + 1, "stats aggregated");
  expect(stats.to_json().find("\"events_folded\":") != std::string::npos, "stats JSON");

  const fs::path log_path = fs::temp_directory_path() / "floodgate_events_test.jsonl";
  fs::remove(log_path);
  setenv("FLOODGATE_EVENT_LOG", log_path.string().c_str(), 1);
  log.put("b", "x", ts(2));
  unsetenv("FLOODGATE_EVENT_LOG");
  std::ifstream in(log_path);
  std::string line;
  std::getline(in, line);
  expect(line.find("\"operation\":\"put\"") != std::string::npos, "JSONL event log");
  fs::remove(log_path);
}

void test_version_manifest_contract() {
  const auto m = floodgate::version::current_manifest();
  expect(m.journal_format == floodgate::version::JOURNAL_FORMAT_VERSION, "journal format");
  expect(m.hash_primitive == "blake3", "hash primitive");
  const std::string json = floodgate::version::manifest_to_json(m);
  expect(json.find("\"journal_format\":1") != std::string::npos, "manifest JSON");
}

}  // namespace

int main() {
  std::cout << "=== Floodgate Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing and key codec\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("payload digest domain", test_payload_digest_domain);
  run_test("timestamp text form", test_timestamp_text_form);
  run_test("key order matches logical order", test_key_order_matches_logical_order);
  run_test("invalid event ids", test_invalid_event_ids);
  run_test("journal and overlay ids", test_journal_and_overlay_ids);

  std::cout << "\n[Phase 2] Object store backends\n";
  run_test("memory store listing", test_memory_store_listing);
  run_test("local fs store semantics", test_localfs_store_semantics);

  std::cout << "\n[Phase 3] Writer and collator\n";
  run_test("put write failure", test_put_write_failure);
  run_test("put interleaved with collation", test_put_interleaved_with_collation);
  run_test("re-put moves locator", test_reput_moves_locator);
  run_test("concrete A/B scenario", test_concrete_ab_scenario);
  run_test("partition invariant", test_partition_invariant);
  run_test("collate idempotent + min batch", test_collate_idempotent_and_min_batch);
  run_test("min batch above journal cap", test_min_batch_above_journal_cap);
  run_test("max journal events", test_max_journal_events);
  run_test("range across collation boundary", test_range_across_collation_boundary);
  run_test("order determinism with ties", test_order_determinism_with_ties);
  run_test("late arrivals stay visible", test_late_arrivals_stay_visible);
  run_test("crash before registration", test_crash_before_registration);
  run_test("crash after registration recovers", test_crash_after_registration_recovers);
  run_test("concurrent collation detected", test_concurrent_collation_detected);
  run_test("key index rejects overlap", test_key_index_rejects_overlap);
  run_test("key index avoids full listing", test_key_index_avoids_full_listing);

  std::cout << "\n[Phase 4] Journals and corruption\n";
  run_test("journal index validation", test_journal_index_validation);
  run_test("corrupt journal fails closed", test_corrupt_journal_fails_closed);
  run_test("out-of-order journal is a conflict", test_out_of_order_journal_is_conflict);
  run_test("index compression", test_index_compression);

  std::cout << "\n[Phase 5] Overlays and lookups\n";
  run_test("overlay precedence", test_overlay_precedence);
  run_test("overlay ids monotonic under clock skew", test_overlay_ids_monotonic_under_clock_skew);
  run_test("local overlay visible after clock step back",
           test_local_overlay_visible_after_clock_step_back);
  run_test("overlay snapshot per cursor", test_overlay_snapshot_per_cursor);
  run_test("overlay missing object", test_overlay_missing_object);
  run_test("update of unknown event rejected", test_update_unknown_event_rejected);
  run_test("get_event + event_exists", test_get_event_and_exists);
  run_test("replay follows events folded mid-stream", test_replay_follows_events_folded_mid_stream);
  run_test("replay sees events folded before listing",
           test_replay_sees_events_folded_before_listing);

  std::cout << "\n[Phase 6] Manifests\n";
  run_test("manifest equivalence", test_manifest_equivalence);
  run_test("manifest detects tampering", test_manifest_detects_tampering);

  std::cout << "\n[Phase 7] Concurrency and backends end to end\n";
  run_test("concurrent writers", test_concurrent_writers);
  run_test("local fs end to end", test_localfs_end_to_end);

  std::cout << "\n[Phase 8] Ambient stack\n";
  run_test("jsonlite round trip", test_jsonlite_roundtrip);
  run_test("config sources", test_config_sources);
  run_test("observability events", test_observability_events);
  run_test("version manifest contract", test_version_manifest_contract);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
