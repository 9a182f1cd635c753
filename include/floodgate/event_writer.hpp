#pragma once

// floodgate/event_writer.hpp - Appends one event as one loose object.
//
// Safe under unbounded concurrency: every put() touches only keys derived
// from its own event id and (timestamp, event id). The locator revision is
// written first and the loose object second, so the object is never
// visible without a locator a collation can supersede.
// Store rejections surface as FloodError(write_failed); retries are the
// store's business.

#include <memory>
#include <string>

#include "floodgate/keys.hpp"
#include "floodgate/locator.hpp"
#include "floodgate/object_store.hpp"

namespace floodgate {

class EventWriter {
 public:
  EventWriter(std::shared_ptr<IObjectStore> store, KeyLayout layout);

  // Returns the loose key written. A re-put of an existing id moves the
  // locator to the new loose key; both copies stay in the log.
  std::string put(const Event& event);

 private:
  std::shared_ptr<IObjectStore> store_;
  KeyLayout layout_;
  EventLocator locator_;
};

}  // namespace floodgate
