#include "floodgate/event_writer.hpp"

namespace floodgate {

EventWriter::EventWriter(std::shared_ptr<IObjectStore> store, KeyLayout layout)
    : store_(store), layout_(layout), locator_(std::move(store), std::move(layout)) {}

std::string EventWriter::put(const Event& event) {
  if (!valid_event_id(event.event_id)) {
    throw FloodError(ErrorCode::invalid_argument, "invalid event id");
  }
  const std::string key = layout_.encode(event.timestamp, event.event_id);
  const uint64_t revision = locator_.record_loose(event.event_id, key);
  if (!store_->put(key, event.payload, event.metadata)) {
    if (!locator_.discard(event.event_id, revision)) {
      throw FloodError(ErrorCode::write_failed,
                       "store rejected " + key + "; locator revision " +
                           format_revision(revision) + " left behind");
    }
    throw FloodError(ErrorCode::write_failed, "store rejected " + key);
  }
  return key;
}

}  // namespace floodgate
