#pragma once

// strata/version.hpp — Version manifest for every persisted or wire format.
//
// INVARIANT:
//   Every component that reads or writes a versioned format checks its
//   constant here. FileRevisionCache refuses entries written with another
//   CACHE_FORMAT_VERSION (they read as misses); hello announces
//   PROTOCOL_FRAMING_VERSION to the remote.

#include <cstdint>
#include <string>

namespace strata {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex encoded, with "fact:", "job:", "schema:" and
// "addr:" domain prefixes. Changing a prefix invalidates every cause chain
// already stored remotely.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CACHE_FORMAT_VERSION
// Version 1 = revisions/AB/CD/<addr digest> blobs holding a revision archive,
// with JSON .meta sidecars (encoding, sizes, stored_blob_hash, key).
// ---------------------------------------------------------------------------
constexpr uint32_t CACHE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// Version 1 = NDJSON frames: {invocation, authorization} outbound,
// task/return and deliver inbound.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

constexpr const char* SEMVER = "0.3.0";

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cache_format{CACHE_FORMAT_VERSION};
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  std::string semver{SEMVER};
  std::string hash_primitive{"blake3"};
  std::string build_timestamp;
};

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

// Checks a peer-announced protocol framing version.
CompatibilityResult check_compatibility(uint32_t peer_protocol_framing);

}  // namespace version
}  // namespace strata
