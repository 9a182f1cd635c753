#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace floodgate {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest recorded for each journal entry and checked on every ranged read.
std::string payload_digest(std::string_view payload);

// Short hex tag derived from arbitrary seed bytes (node tags in overlay ids).
std::string short_tag(std::string_view seed, std::size_t hex_chars = 8);

bool is_hex_digest(std::string_view s);

}  // namespace floodgate
