#include "floodgate/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "floodgate/jsonlite.hpp"

namespace floodgate {

namespace {

// std::bit_width gives floor(log2(x)) + 1 for x > 0.
inline std::size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<FloodEventHook> g_event_hook{nullptr};

}  // namespace

std::string to_json(const FloodEvent& ev) {
  jsonlite::Object o;
  o["operation"] = jsonlite::Value{ev.operation};
  o["ok"] = jsonlite::Value{ev.ok};
  o["error_code"] = jsonlite::Value{ev.error_code};
  o["duration_ns"] = jsonlite::Value{ev.duration_ns};
  o["events"] = jsonlite::Value{ev.events};
  o["journal_id"] = jsonlite::Value{ev.journal_id};
  o["bytes"] = jsonlite::Value{ev.bytes};
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// FloodStats
// ---------------------------------------------------------------------------

void FloodStats::record(const FloodEvent& ev) {
  operations.fetch_add(1, std::memory_order_relaxed);
  latency.record(ev.duration_ns);
  if (!ev.ok) {
    failures.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(failure_mu_);
    failures_by_code_[ev.error_code.empty() ? "unknown" : ev.error_code]++;
    return;
  }

  if (ev.operation == "put") {
    events_written.fetch_add(ev.events, std::memory_order_relaxed);
    bytes_written.fetch_add(ev.bytes, std::memory_order_relaxed);
  } else if (ev.operation == "collate") {
    collations.fetch_add(1, std::memory_order_relaxed);
    if (!ev.journal_id.empty()) journals_written.fetch_add(1, std::memory_order_relaxed);
    events_folded.fetch_add(ev.events, std::memory_order_relaxed);
    bytes_written.fetch_add(ev.bytes, std::memory_order_relaxed);
  } else if (ev.operation == "update" || ev.operation == "remove") {
    overlays_written.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "replay" || ev.operation == "replay_manifest") {
    replays.fetch_add(1, std::memory_order_relaxed);
    events_replayed.fetch_add(ev.events, std::memory_order_relaxed);
  } else if (ev.operation == "get_event") {
    lookups.fetch_add(1, std::memory_order_relaxed);
  }
}

uint64_t FloodStats::failure_count(const std::string& error_code) const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  auto it = failures_by_code_.find(error_code);
  return it == failures_by_code_.end() ? 0 : it->second;
}

std::string FloodStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ',';
    out += '"';
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };

  out += '{';
  field("operations", operations, true);
  field("failures", failures);
  field("events_written", events_written);
  field("bytes_written", bytes_written);
  field("collations", collations);
  field("journals_written", journals_written);
  field("events_folded", events_folded);
  field("overlays_written", overlays_written);
  field("replays", replays);
  field("events_replayed", events_replayed);
  field("lookups", lookups);
  out += ",\"latency\":";
  out += latency.to_json();
  out += ",\"failures_by_code\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [code, n] : failures_by_code_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + jsonlite::escape(code) + "\":" + std::to_string(n);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

FloodStats& global_flood_stats() {
  static FloodStats inst;
  return inst;
}

void set_flood_event_hook(FloodEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_flood_event(const FloodEvent& ev) {
  global_flood_stats().record(ev);

  FloodEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: FLOODGATE_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("FLOODGATE_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = to_json(ev) + "\n";
  // O_APPEND keeps short lines from concurrent writers intact.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace floodgate
