#include "floodgate/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "evt:" (journal payloads) and "tag:" (node tags)
//      prefixes keep digests from different contexts apart. These prefixes
//      are part of the journal format contract (JOURNAL_FORMAT_VERSION).

#include <array>

extern "C" {
#include <blake3.h>
}

namespace floodgate {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string payload_digest(std::string_view payload) {
  return hash_domain("evt:", payload);
}

std::string short_tag(std::string_view seed, std::size_t hex_chars) {
  std::string h = hash_domain("tag:", seed);
  if (hex_chars < h.size()) h.resize(hex_chars);
  return h;
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace floodgate
