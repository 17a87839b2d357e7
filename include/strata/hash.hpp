#pragma once

#include <string>
#include <string_view>

namespace strata {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Each reference kind owns a prefix so a revision
// and an invocation with identical canonical JSON never share a digest.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string fact_hash(std::string_view canonical_json);        // "fact:"
std::string invocation_hash(std::string_view canonical_json);  // "job:"
std::string schema_hash(std::string_view canonical_json);      // "schema:"
std::string address_hash(std::string_view address_key);        // "addr:"

// True for a 64-char lowercase hex digest.
bool valid_digest(std::string_view d);

}  // namespace strata
