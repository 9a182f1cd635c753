#pragma once

// floodgate/config.hpp - Runtime configuration.
//
// Sources, lowest to highest precedence:
//   1. Compiled defaults (FloodConfig member initializers).
//   2. A JSON document (config_from_json), e.g. read from a deployment file.
//   3. FLOODGATE_* environment variables (config_from_env).
// Invalid values are ignored and the previous value is kept.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "floodgate/jsonlite.hpp"

namespace floodgate {

struct FloodConfig {
  std::string root_prefix{"floodgate"};
  std::size_t list_page_size{1000};
  std::size_t max_journal_events{10000};
  std::chrono::seconds presign_ttl{3600};
  std::string journal_index_compression{"off"};  // "off" or "zstd"
  bool verify_payload_digests{true};
};

// Apply FLOODGATE_ROOT_PREFIX, FLOODGATE_PAGE_SIZE, FLOODGATE_MAX_JOURNAL_EVENTS,
// FLOODGATE_PRESIGN_TTL, FLOODGATE_INDEX_COMPRESSION, FLOODGATE_VERIFY_DIGESTS.
FloodConfig config_from_env(FloodConfig base = {});

// Keys match the JSON produced by config_to_json(). Unknown keys are ignored.
FloodConfig config_from_json(const std::string& text, FloodConfig base = {},
                             std::optional<jsonlite::JsonError>* error = nullptr);

std::string config_to_json(const FloodConfig& cfg);

}  // namespace floodgate
