#include "floodgate/version.hpp"

#include <sstream>

#ifndef FLOODGATE_VERSION_STRING
#define FLOODGATE_VERSION_STRING "0.3.0"
#endif

namespace floodgate {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver = FLOODGATE_VERSION_STRING;
  m.hash_primitive = "blake3";
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"journal_format\":" << m.journal_format
    << ",\"key_layout\":" << m.key_layout
    << ",\"overlay_format\":" << m.overlay_format
    << ",\"manifest\":" << m.manifest
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace floodgate
