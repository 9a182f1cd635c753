#include "floodgate/replay.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <tuple>

#include "floodgate/hash.hpp"
#include "floodgate/journal.hpp"
#include "floodgate/jsonlite.hpp"
#include "floodgate/key_index.hpp"
#include "floodgate/locator.hpp"
#include "floodgate/overlay.hpp"
#include "floodgate/version.hpp"

namespace floodgate {

namespace detail {

// One base event selected for the window, before overlays are applied.
struct Candidate {
  std::string event_id;
  Timestamp timestamp{};
  EventSource source{EventSource::loose};
  std::string source_ref;  // journal id or loose key
  std::string key;         // store key holding the payload
  std::optional<ByteRange> range;
  std::string digest;
  Metadata metadata;
  std::optional<std::string> payload;  // set when payloads are fetched
};

// Merges journal entries and loose objects for [from, to] in ascending
// (timestamp, event id) order.
class CandidateStream {
 public:
  CandidateStream(std::shared_ptr<IObjectStore> store, const FloodConfig& config, Timestamp from,
                  Timestamp to, bool fetch_payloads)
      : store_(std::move(store)),
        config_(config),
        layout_(config.root_prefix),
        from_(from),
        to_(to),
        fetch_payloads_(fetch_payloads) {}

  std::optional<Candidate> next() {
    if (!started_) start();
    if (to_ < from_) return std::nullopt;
    for (;;) {
      if (!loose_head_ && !loose_done_) advance_loose();
      while (queue_.empty() && journal_pos_ < journals_.size()) load_next_journal();
      if (queue_.empty() && !loose_head_) return std::nullopt;

      if (!queue_.empty()) {
        const Candidate& j = queue_.front();
        bool journal_first = true;
        bool same = false;
        if (loose_head_) {
          const LooseKeyParts& l = loose_head_->second;
          journal_first = std::tie(j.timestamp, j.event_id) <= std::tie(l.timestamp, l.event_id);
          same = j.timestamp == l.timestamp && j.event_id == l.event_id;
        }
        if (journal_first) {
          // A loose copy of a journaled event is a leftover of an
          // interrupted collation.
          if (same) loose_head_.reset();
          Candidate out = std::move(queue_.front());
          queue_.pop_front();
          return out;
        }
      }

      auto head = std::move(*loose_head_);
      loose_head_.reset();
      if (auto c = loose_candidate(head.first, head.second)) return c;
    }
  }

 private:
  void start() {
    started_ = true;
    if (to_ < from_) return;
    KeyIndex key_index(store_, layout_, config_.list_page_size);
    journals_ = key_index.query(from_, to_);
    for (const auto& j : journals_) journal_ids_.insert(j.journal_id);
    journal_floors_.assign(journals_.size(), std::string());
    loose_.emplace(*store_, layout_.loose_prefix(), layout_.loose_bound(from_),
                   config_.list_page_size);
  }

  // A collation that deleted loose objects before a page was listed had
  // registered its journal by then. Journals found this way only contribute
  // entries past `last_listed_`; earlier keys were listed and resolved.
  void refresh_journals() {
    KeyIndex key_index(store_, layout_, config_.list_page_size);
    const Timestamp since = journals_.empty() ? from_ : std::max(from_, journals_.back().max_ts);
    for (auto& e : key_index.query(since, to_)) {
      if (!journal_ids_.insert(e.journal_id).second) continue;
      journals_.push_back(std::move(e));
      journal_floors_.push_back(last_listed_);
    }
  }

  void load_next_journal() {
    const std::string floor = journal_floors_[journal_pos_];
    const KeyIndexEntry& entry = journals_[journal_pos_++];
    const JournalIndex index = load_journal_index(*store_, layout_, entry.journal_id);

    if (prev_journal_to_ &&
        (index.from < *prev_journal_to_ || index.journal_id <= prev_journal_id_)) {
      throw FloodError(ErrorCode::collation_conflict,
                       "journal " + index.journal_id + " overlaps predecessor " + prev_journal_id_);
    }
    prev_journal_to_ = index.to;
    prev_journal_id_ = index.journal_id;

    std::size_t first = 0;
    while (first < index.events.size() && index.events[first].timestamp < from_) ++first;
    std::size_t end = first;
    while (end < index.events.size() && index.events[end].timestamp <= to_) ++end;
    if (first == end) return;

    std::vector<std::string> payloads;
    if (fetch_payloads_) {
      payloads = read_journal_payloads(*store_, layout_, index, first, end - 1,
                                       config_.verify_payload_digests);
    }
    for (std::size_t i = first; i < end; ++i) {
      const JournalEntry& e = index.events[i];
      if (!floor.empty() && layout_.encode(e.timestamp, e.event_id) <= floor) continue;
      Candidate c = journal_candidate(index.journal_id, e);
      if (fetch_payloads_) c.payload = std::move(payloads[i - first]);
      queue_.push_back(std::move(c));
    }
  }

  Candidate journal_candidate(const std::string& journal_id, const JournalEntry& e) const {
    Candidate c;
    c.event_id = e.event_id;
    c.timestamp = e.timestamp;
    c.source = EventSource::journal;
    c.source_ref = journal_id;
    c.key = layout_.encode_journal(journal_id);
    c.range = ByteRange{e.offset, e.size};
    c.digest = e.digest;
    c.metadata = e.metadata;
    return c;
  }

  void advance_loose() {
    while (auto key = loose_->next()) {
      if (loose_->pages_fetched() != pages_seen_) {
        pages_seen_ = loose_->pages_fetched();
        refresh_journals();
      }
      last_listed_ = *key;
      auto parts = layout_.decode_loose(*key);
      if (!parts || parts->timestamp < from_) continue;
      if (parts->timestamp > to_) break;
      loose_head_.emplace(*key, std::move(*parts));
      return;
    }
    if (loose_->pages_fetched() != pages_seen_) {
      pages_seen_ = loose_->pages_fetched();
      refresh_journals();
    }
    loose_done_ = true;
  }

  std::optional<Candidate> loose_candidate(const std::string& key, const LooseKeyParts& parts) {
    auto info = store_->head(key);
    std::optional<std::string> payload;
    if (info && fetch_payloads_) payload = store_->get(key);
    if (!info || (fetch_payloads_ && !payload)) return relocated(parts);

    Candidate c;
    c.event_id = parts.event_id;
    c.timestamp = parts.timestamp;
    c.source = EventSource::loose;
    c.source_ref = key;
    c.key = key;
    c.metadata = std::move(info->metadata);
    c.payload = std::move(payload);
    return c;
  }

  // The loose object disappeared after it was listed: a collation folded it
  // meanwhile. Follow the locator so the event is seen exactly once.
  std::optional<Candidate> relocated(const LooseKeyParts& parts) {
    EventLocator locator(store_, layout_, config_.list_page_size);
    auto loc = locator.lookup(parts.event_id);
    if (!loc || loc->kind != EventSource::journal) return std::nullopt;
    if (journal_ids_.count(loc->ref)) return std::nullopt;  // emitted by the journal stream

    const JournalIndex index = load_journal_index(*store_, layout_, loc->ref);
    for (std::size_t i = 0; i < index.events.size(); ++i) {
      const JournalEntry& e = index.events[i];
      if (e.event_id != parts.event_id || e.timestamp != parts.timestamp) continue;
      Candidate c = journal_candidate(index.journal_id, e);
      if (fetch_payloads_) {
        c.payload = std::move(
            read_journal_payloads(*store_, layout_, index, i, i, config_.verify_payload_digests)
                .front());
      }
      return c;
    }
    return std::nullopt;
  }

  std::shared_ptr<IObjectStore> store_;
  FloodConfig config_;
  KeyLayout layout_;
  Timestamp from_;
  Timestamp to_;
  bool fetch_payloads_;
  bool started_{false};

  std::vector<KeyIndexEntry> journals_;
  std::vector<std::string> journal_floors_;  // loose key already covered per journal
  std::set<std::string> journal_ids_;
  std::size_t journal_pos_{0};
  std::optional<Timestamp> prev_journal_to_;
  std::string prev_journal_id_;
  std::deque<Candidate> queue_;

  std::optional<ListCursor> loose_;
  std::optional<std::pair<std::string, LooseKeyParts>> loose_head_;
  std::string last_listed_;
  std::size_t pages_seen_{0};
  bool loose_done_{false};
};

}  // namespace detail

namespace {

Timestamp window_from(const TimeWindow& w) { return w.from.value_or(distant_past()); }
Timestamp window_to(const TimeWindow& w) { return w.to.value_or(far_future()); }

const char* source_name(EventSource s) { return s == EventSource::journal ? "journal" : "loose"; }

const char* decision_name(OverlayDecision::Kind k) {
  switch (k) {
    case OverlayDecision::Kind::none: return "none";
    case OverlayDecision::Kind::update: return "update";
    case OverlayDecision::Kind::remove: return "remove";
  }
  return "none";
}

}  // namespace

// ---------------------------------------------------------------------------
// ReplayCursor
// ---------------------------------------------------------------------------

struct ReplayCursor::State {
  detail::CandidateStream stream;
  OverlayManager overlays;
  Timestamp as_of;
  uint64_t emitted{0};
};

ReplayCursor::ReplayCursor(std::shared_ptr<State> state) : state_(std::move(state)) {}

std::optional<MergedEvent> ReplayCursor::next() {
  while (auto c = state_->stream.next()) {
    const OverlayDecision d = state_->overlays.resolve(c->event_id, state_->as_of);
    if (d.kind == OverlayDecision::Kind::remove) continue;

    MergedEvent ev;
    ev.event_id = std::move(c->event_id);
    ev.timestamp = c->timestamp;
    ev.metadata = std::move(c->metadata);
    ev.source = c->source;
    ev.source_ref = std::move(c->source_ref);
    if (d.kind == OverlayDecision::Kind::update) {
      ev.payload = d.payload;
      ev.updated = true;
    } else {
      ev.payload = std::move(*c->payload);
    }
    ++state_->emitted;
    return ev;
  }
  return std::nullopt;
}

std::vector<MergedEvent> ReplayCursor::collect() {
  std::vector<MergedEvent> out;
  while (auto ev = next()) out.push_back(std::move(*ev));
  return out;
}

Timestamp ReplayCursor::as_of() const { return state_->as_of; }

uint64_t ReplayCursor::events_emitted() const { return state_->emitted; }

// ---------------------------------------------------------------------------
// ReplayEngine
// ---------------------------------------------------------------------------

ReplayEngine::ReplayEngine(std::shared_ptr<IObjectStore> store, FloodConfig config, Clock clock)
    : store_(std::move(store)), config_(std::move(config)), clock_(std::move(clock)) {}

ReplayCursor ReplayEngine::replay(const TimeWindow& window) const {
  const KeyLayout layout(config_.root_prefix);
  OverlayManager overlays(store_, layout, clock_, process_node_tag(), config_.list_page_size);
  const Timestamp as_of = overlays.now();
  auto state = std::make_shared<ReplayCursor::State>(ReplayCursor::State{
      detail::CandidateStream(store_, config_, window_from(window), window_to(window), true),
      std::move(overlays), as_of, 0});
  return ReplayCursor(std::move(state));
}

std::vector<ManifestEntry> ReplayEngine::replay_manifest(const TimeWindow& window) const {
  const KeyLayout layout(config_.root_prefix);
  detail::CandidateStream stream(store_, config_, window_from(window), window_to(window), false);
  const OverlayManager overlays(store_, layout, clock_, process_node_tag(), config_.list_page_size);
  const Timestamp as_of = overlays.now();

  std::vector<ManifestEntry> out;
  while (auto c = stream.next()) {
    ManifestEntry m;
    m.event_id = c->event_id;
    m.timestamp = c->timestamp;
    m.source = c->source;
    m.source_ref = c->source_ref;
    m.metadata = std::move(c->metadata);

    auto winner = overlays.peek(c->event_id, as_of);
    if (winner && winner->kind == OverlayKind::update) {
      m.decision = OverlayDecision::Kind::update;
      m.overlay_id = winner->overlay_id;
      m.key = layout.encode_overlay(winner->overlay_id);
      if (!store_->head(m.key)) {
        throw FloodError(ErrorCode::missing_object, "overlay object missing: " + m.key);
      }
    } else {
      if (winner) {
        m.decision = OverlayDecision::Kind::remove;
        m.overlay_id = winner->overlay_id;
      }
      m.key = c->key;
      m.range = c->range;
      m.digest = c->digest;
    }
    m.locator = store_->presign(m.key, m.range, config_.presign_ttl);
    out.push_back(std::move(m));
  }
  return out;
}

// ---------------------------------------------------------------------------
// Manifest consumers
// ---------------------------------------------------------------------------

ManifestFetcher store_fetcher(std::shared_ptr<const IObjectStore> store) {
  return [store](const ManifestEntry& m) { return store->get(m.key, m.range); };
}

std::vector<MergedEvent> materialize_manifest(const std::vector<ManifestEntry>& manifest,
                                              const ManifestFetcher& fetch) {
  std::vector<MergedEvent> out;
  for (const auto& m : manifest) {
    if (m.decision == OverlayDecision::Kind::remove) continue;
    auto bytes = fetch(m);
    if (!bytes) throw FloodError(ErrorCode::missing_object, "manifest object unavailable: " + m.key);
    if (m.decision == OverlayDecision::Kind::none && !m.digest.empty() &&
        payload_digest(*bytes) != m.digest) {
      throw FloodError(ErrorCode::corrupt_journal,
                       "journal " + m.source_ref + ": digest mismatch for event " + m.event_id);
    }
    MergedEvent ev;
    ev.event_id = m.event_id;
    ev.timestamp = m.timestamp;
    ev.payload = std::move(*bytes);
    ev.metadata = m.metadata;
    ev.source = m.source;
    ev.source_ref = m.source_ref;
    ev.updated = m.decision == OverlayDecision::Kind::update;
    out.push_back(std::move(ev));
  }
  return out;
}

std::string manifest_to_json(const std::vector<ManifestEntry>& manifest) {
  jsonlite::Array entries;
  entries.reserve(manifest.size());
  for (const auto& m : manifest) {
    jsonlite::Object o;
    o["event_id"] = jsonlite::Value{m.event_id};
    o["timestamp"] = jsonlite::Value{format_timestamp(m.timestamp)};
    o["locator"] = jsonlite::Value{m.locator};
    o["key"] = jsonlite::Value{m.key};
    if (m.range) {
      jsonlite::Object r;
      r["offset"] = jsonlite::Value{static_cast<std::uint64_t>(m.range->offset)};
      r["length"] = jsonlite::Value{static_cast<std::uint64_t>(m.range->length)};
      o["range"] = jsonlite::Value{std::move(r)};
    } else {
      o["range"] = jsonlite::Value{nullptr};
    }
    o["source"] = jsonlite::Value{std::string(source_name(m.source))};
    o["source_ref"] = jsonlite::Value{m.source_ref};
    o["decision"] = jsonlite::Value{std::string(decision_name(m.decision))};
    o["overlay_id"] = jsonlite::Value{m.overlay_id};
    o["digest"] = jsonlite::Value{m.digest};
    o["metadata"] = jsonlite::make_string_map(m.metadata);
    entries.push_back(jsonlite::Value{std::move(o)});
  }
  jsonlite::Object doc;
  doc["manifest_version"] = jsonlite::Value{static_cast<std::uint64_t>(version::MANIFEST_VERSION)};
  doc["entries"] = jsonlite::Value{std::move(entries)};
  return jsonlite::to_json(doc);
}

}  // namespace floodgate
