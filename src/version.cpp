#include "strata/version.hpp"

#include <sstream>

namespace strata {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  // Deterministic within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cache_format\":" << m.cache_format
    << ",\"protocol_framing\":" << m.protocol_framing
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t peer_protocol_framing) {
  CompatibilityResult r;
  if (peer_protocol_framing != PROTOCOL_FRAMING_VERSION) {
    r.ok          = false;
    r.error_code  = "protocol_version_mismatch";
    r.description = "Peer protocol framing " + std::to_string(peer_protocol_framing) +
                    " != client protocol framing " +
                    std::to_string(PROTOCOL_FRAMING_VERSION) + ".";
  }
  return r;
}

}  // namespace version
}  // namespace strata
