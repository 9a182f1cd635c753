#pragma once

// floodgate/version.hpp - Explicit version manifest for every persisted format.
//
// INVARIANT:
//   Every component that reads or writes a versioned format checks its
//   constant here before processing data. Readers never silently accept data
//   written by a newer format version.

#include <cstdint>
#include <string>

namespace floodgate {
namespace version {

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// Layout of journal blobs and journal-index documents.
// Version 1 = concatenated payloads + JSON index with offset/size/"evt:" digest.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// KEY_LAYOUT_VERSION
// Namespace prefixes and key encodings (timestamps, journal ids, overlay ids).
// Changing the timestamp text form or any delimiter requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t KEY_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// OVERLAY_FORMAT_VERSION
// Overlay objects and their per-event secondary index entries.
// ---------------------------------------------------------------------------
constexpr uint32_t OVERLAY_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// MANIFEST_VERSION
// Replay manifest JSON handed to remote consumers.
// ---------------------------------------------------------------------------
constexpr uint32_t MANIFEST_VERSION = 1;

struct VersionManifest {
  uint32_t journal_format{JOURNAL_FORMAT_VERSION};
  uint32_t key_layout{KEY_LAYOUT_VERSION};
  uint32_t overlay_format{OVERLAY_FORMAT_VERSION};
  uint32_t manifest{MANIFEST_VERSION};
  std::string semver;
  std::string hash_primitive;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace floodgate
