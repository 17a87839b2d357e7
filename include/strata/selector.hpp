#pragma once

// strata/selector.hpp — Load entries, schema variants and query selectors.
//
// A schema context asks the remote to follow links from an address and return
// the connected subgraph in the same round trip. Its identity is the BLAKE3
// reference of its canonical JSON. The tracker remembers which variants each
// address was fetched with, so a load with a new variant is not satisfied by
// a heap hit.
//
// Query shapes:
//   { "select":       { <of>: { <the>: {} } } }
//   { "selectSchema": { <of>: { <the>: { "_": { "path": [], "schemaContext": {...} } } } } }
// One schema-bearing entry turns the whole batch into selectSchema.

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "strata/jsonlite.hpp"
#include "strata/revision.hpp"

namespace strata {

struct SchemaContext {
  jsonlite::Value schema;
  jsonlite::Value root_schema;

  jsonlite::Object to_object() const;
  std::string reference() const;
};

struct LoadEntry {
  Address address;
  std::optional<SchemaContext> schema;

  // Address key plus schema reference; identical entries collapse.
  std::string dedup_key() const;
};

std::vector<LoadEntry> entries_for(const std::vector<Address>& addresses);

class SchemaTracker {
 public:
  void add(const std::string& key, const std::string& schema_ref) { refs_[key].insert(schema_ref); }
  bool has(const std::string& key, const std::string& schema_ref) const {
    auto it = refs_.find(key);
    return it != refs_.end() && it->second.contains(schema_ref);
  }
  void forget(const std::string& key) { refs_.erase(key); }
  std::size_t size() const { return refs_.size(); }

 private:
  std::map<std::string, std::set<std::string>> refs_;
};

jsonlite::Object build_query(const std::vector<LoadEntry>& entries);
bool is_schema_query(const jsonlite::Object& query);

// Addresses named by a select / selectSchema query.
std::vector<Address> query_addresses(const jsonlite::Object& query);

}  // namespace strata
