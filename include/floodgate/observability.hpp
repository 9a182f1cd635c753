#pragma once

// floodgate/observability.hpp - Structured operation observability.
//
// DESIGN:
//   FloodEvent is the observable unit. Every facade operation (put, collate,
//   update, remove, replay, replay_manifest, get_event) emits one FloodEvent,
//   which is:
//     - always folded into global_flood_stats();
//     - passed to the installed hook, if any;
//     - otherwise appended as one JSON line to the file named by
//       FLOODGATE_EVENT_LOG, if set.
//   Emission never throws and never blocks on anything but a file append.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "floodgate/types.hpp"

namespace floodgate {

struct FloodEvent {
  std::string operation;  // "put", "collate", "update", "remove", "replay", ...
  bool ok{false};
  std::string error_code;  // to_string(ErrorCode) when !ok
  uint64_t duration_ns{0};
  uint64_t events{0};  // events written, folded or yielded
  std::string journal_id;
  uint64_t bytes{0};
};

std::string to_json(const FloodEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// FloodStats - process-wide aggregated counters
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the per-code failure map uses a mutex.
class FloodStats {
 public:
  void record(const FloodEvent& ev);
  std::string to_json() const;

  std::atomic<uint64_t> operations{0};
  std::atomic<uint64_t> failures{0};

  std::atomic<uint64_t> events_written{0};
  std::atomic<uint64_t> bytes_written{0};

  std::atomic<uint64_t> collations{0};
  std::atomic<uint64_t> journals_written{0};
  std::atomic<uint64_t> events_folded{0};

  std::atomic<uint64_t> overlays_written{0};

  std::atomic<uint64_t> replays{0};
  std::atomic<uint64_t> events_replayed{0};
  std::atomic<uint64_t> lookups{0};

  LatencyHistogram latency;

  uint64_t failure_count(const std::string& error_code) const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_by_code_;
};

FloodStats& global_flood_stats();

void emit_flood_event(const FloodEvent& ev);

using FloodEventHook = void (*)(const FloodEvent&);
void set_flood_event_hook(FloodEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace floodgate
