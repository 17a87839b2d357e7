#include "strata/selector.hpp"

#include "strata/hash.hpp"

namespace strata {

jsonlite::Object SchemaContext::to_object() const {
  jsonlite::Object o;
  o["schema"] = schema;
  o["rootSchema"] = root_schema;
  return o;
}

std::string SchemaContext::reference() const {
  return schema_hash(jsonlite::to_json(to_object()));
}

std::string LoadEntry::dedup_key() const {
  return schema ? address.key() + "#" + schema->reference() : address.key();
}

std::vector<LoadEntry> entries_for(const std::vector<Address>& addresses) {
  std::vector<LoadEntry> out;
  out.reserve(addresses.size());
  for (const auto& a : addresses) out.push_back(LoadEntry{a, std::nullopt});
  return out;
}

jsonlite::Object build_query(const std::vector<LoadEntry>& entries) {
  bool schema_aware = false;
  for (const auto& e : entries) {
    if (e.schema) {
      schema_aware = true;
      break;
    }
  }

  jsonlite::Object selector;
  for (const auto& e : entries) {
    auto& by_the = selector[e.address.of];
    if (!by_the.is_object()) by_the = jsonlite::Object{};
    auto& attrs = std::get<jsonlite::Object>(by_the.v);
    if (!schema_aware) {
      attrs[e.address.the] = jsonlite::Object{};
      continue;
    }
    jsonlite::Object leaf;
    leaf["path"] = jsonlite::Array{};
    if (e.schema) leaf["schemaContext"] = e.schema->to_object();
    jsonlite::Object slot;
    slot["_"] = std::move(leaf);
    attrs[e.address.the] = std::move(slot);
  }

  jsonlite::Object query;
  query[schema_aware ? "selectSchema" : "select"] = std::move(selector);
  return query;
}

bool is_schema_query(const jsonlite::Object& query) {
  return query.contains("selectSchema");
}

std::vector<Address> query_addresses(const jsonlite::Object& query) {
  std::vector<Address> out;
  const jsonlite::Object* selector = jsonlite::get_object(query, "select");
  if (!selector) selector = jsonlite::get_object(query, "selectSchema");
  if (!selector) return out;
  for (const auto& [of, by_the] : *selector) {
    const auto* attrs = jsonlite::as_object(by_the);
    if (!attrs) continue;
    for (const auto& [the, unused] : *attrs) {
      (void)unused;
      out.push_back(Address{the, of});
    }
  }
  return out;
}

}  // namespace strata
