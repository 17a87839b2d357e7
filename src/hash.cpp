#include "strata/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Domain separation: "fact:", "job:", "schema:", "addr:" prefixes keep
//      revision references, invocation correlation ids, schema variants and
//      cache shard keys in disjoint spaces. The prefixes are part of the wire
//      and on-disk contract (version::HASH_ALGORITHM_VERSION).
//   3. Every peer must derive the same reference for the same canonical JSON,
//      otherwise causal checks on the remote reject every write.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace strata {
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
  info.blake3_available = true;
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

std::string fact_hash(std::string_view canonical_json) {
  return hash_domain("fact:", canonical_json);
}

std::string invocation_hash(std::string_view canonical_json) {
  return hash_domain("job:", canonical_json);
}

std::string schema_hash(std::string_view canonical_json) {
  return hash_domain("schema:", canonical_json);
}

std::string address_hash(std::string_view address_key) {
  return hash_domain("addr:", address_key);
}

bool valid_digest(std::string_view d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace strata
