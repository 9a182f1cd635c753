#include "floodgate/overlay.hpp"

#include <chrono>
#include <random>

#include "floodgate/hash.hpp"
#include "floodgate/version.hpp"

namespace floodgate {

namespace {

// Process-wide so that several managers in one process never hand out
// colliding or decreasing ids.
std::mutex g_id_mu;
Timestamp g_last_ts{};
uint64_t g_sequence{0};

}  // namespace

std::string process_node_tag() {
  static const std::string tag = [] {
    std::random_device rd;
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return short_tag(std::to_string(rd()) + ":" + std::to_string(rd()) + ":" +
                     std::to_string(ticks));
  }();
  return tag;
}

OverlayManager::OverlayManager(std::shared_ptr<IObjectStore> store, KeyLayout layout, Clock clock,
                               std::string node_tag, std::size_t page_size)
    : store_(std::move(store)),
      layout_(std::move(layout)),
      clock_(std::move(clock)),
      node_tag_(std::move(node_tag)),
      page_size_(page_size) {}

std::string OverlayManager::next_overlay_id() {
  const Timestamp now = clock_();
  std::lock_guard<std::mutex> lk(g_id_mu);
  if (now > g_last_ts) g_last_ts = now;
  return make_overlay_id(g_last_ts, ++g_sequence, node_tag_);
}

Timestamp OverlayManager::now() const {
  const Timestamp t = clock_();
  std::lock_guard<std::mutex> lk(g_id_mu);
  return t > g_last_ts ? t : g_last_ts;
}

OverlayRecord OverlayManager::write(const std::string& event_id, OverlayKind kind,
                                    const std::string& payload) {
  if (!valid_event_id(event_id)) {
    throw FloodError(ErrorCode::invalid_argument, "invalid event id");
  }
  OverlayRecord rec{next_overlay_id(), event_id, kind};

  Metadata md;
  md["target"] = event_id;
  md["kind"] = to_string(kind);
  md["format_version"] = std::to_string(version::OVERLAY_FORMAT_VERSION);
  const std::string body = kind == OverlayKind::update ? payload : std::string{};
  if (!store_->put(layout_.encode_overlay(rec.overlay_id), body, md)) {
    throw FloodError(ErrorCode::write_failed, "store rejected overlay " + rec.overlay_id);
  }
  if (!store_->put(layout_.encode_overlay_index(event_id, rec.overlay_id, kind), "")) {
    throw FloodError(ErrorCode::write_failed, "store rejected overlay index for " + event_id);
  }
  return rec;
}

std::vector<OverlayRecord> OverlayManager::history(const std::string& event_id) const {
  std::vector<OverlayRecord> out;
  if (!valid_event_id(event_id)) return out;
  ListCursor cursor(*store_, layout_.overlay_index_prefix(event_id), "", page_size_);
  while (auto key = cursor.next()) {
    if (auto rec = layout_.decode_overlay_index(*key)) out.push_back(std::move(*rec));
  }
  return out;
}

std::optional<OverlayRecord> OverlayManager::peek(const std::string& event_id,
                                                  std::optional<Timestamp> as_of) const {
  std::optional<OverlayRecord> winner;
  for (auto& rec : history(event_id)) {
    if (as_of) {
      auto parts = decode_overlay_id(rec.overlay_id);
      if (!parts || parts->written_at > *as_of) continue;
    }
    if (!winner || rec.overlay_id > winner->overlay_id) winner = std::move(rec);
  }
  return winner;
}

OverlayDecision OverlayManager::resolve(const std::string& event_id,
                                        std::optional<Timestamp> as_of) const {
  OverlayDecision decision;
  auto winner = peek(event_id, as_of);
  if (!winner) return decision;

  const std::string key = layout_.encode_overlay(winner->overlay_id);
  decision.overlay_id = winner->overlay_id;
  if (winner->kind == OverlayKind::remove) {
    if (!store_->head(key)) {
      throw FloodError(ErrorCode::missing_object, "overlay object missing: " + key);
    }
    decision.kind = OverlayDecision::Kind::remove;
    return decision;
  }
  auto payload = store_->get(key);
  if (!payload) {
    throw FloodError(ErrorCode::missing_object, "overlay object missing: " + key);
  }
  decision.kind = OverlayDecision::Kind::update;
  decision.payload = std::move(*payload);
  return decision;
}

}  // namespace floodgate
