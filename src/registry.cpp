#include "strata/registry.hpp"

#include <sstream>

#include "strata/hash.hpp"

namespace strata {

CacheFactory default_cache_factory(const Settings& settings) {
  const std::string root = settings.cache_root;
  const std::string compression = settings.cache_compression;
  return [root, compression](const std::string& space) -> std::unique_ptr<IRevisionCache> {
    if (root.empty()) return std::make_unique<NoCache>();
    // Space names are arbitrary strings; the digest keeps directory names safe.
    return std::make_unique<FileRevisionCache>(root + "/" + address_hash(space).substr(0, 16),
                                               compression);
  };
}

Registry::Registry(std::unique_ptr<ITransport> transport, Settings settings, CacheFactory caches,
                   Clock clock)
    : settings_(std::move(settings)),
      caches_(caches ? std::move(caches) : default_cache_factory(settings_)),
      session_(std::move(transport), settings_, std::move(clock)) {}

Registry::~Registry() {
  replicas_.clear();
}

Replica& Registry::mount(const std::string& space) {
  auto it = replicas_.find(space);
  if (it != replicas_.end()) return *it->second;
  auto replica = std::make_unique<Replica>(space, session_, caches_(space));
  log(LogLevel::debug, "registry",
      "mounted " + space + " (cache " + replica->cache().backend_id() + ")");
  auto& ref = *replica;
  replicas_.emplace(space, std::move(replica));
  return ref;
}

Replica* Registry::find(const std::string& space) {
  auto it = replicas_.find(space);
  return it == replicas_.end() ? nullptr : it->second.get();
}

SubscriptionId Registry::sink(const std::string& space, const std::string& of,
                              RevisionCallback callback) {
  Replica& replica = mount(space);
  const Address address{settings_.default_the, of};
  const SubscriptionId id = replica.subscribe(address, callback);
  if (id == 0) return 0;
  Replica* target = &replica;
  replica.load(std::vector<Address>{address},
               [target, address, callback](Result<std::vector<Revision>> r) {
                 if (!r) {
                   log(LogLevel::warn, "registry",
                       "sink load of " + address.key() + " failed: " + r.error().message);
                   return;
                 }
                 callback(target->get(address));
               });
  return id;
}

void Registry::send(const std::string& space,
                    const std::vector<std::pair<std::string, jsonlite::Value>>& batch,
                    Callback<Commit> done) {
  Replica& replica = mount(space);
  std::vector<Intent> intents;
  for (const auto& [of, value] : batch) {
    const Address address{settings_.default_the, of};
    const Revision* current = replica.get(address);
    if (current && current->is && jsonlite::equal(*current->is, value)) continue;
    intents.push_back(Assert{address, value});
  }
  replica.push(intents, std::move(done));
}

std::string Registry::stats_json() const {
  std::ostringstream o;
  o << "{\"session\":" << session_.stats().to_json() << ",\"spaces\":{";
  bool first = true;
  for (const auto& [space, replica] : replicas_) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(space) << "\":" << replica->stats().to_json();
  }
  o << "}}";
  return o.str();
}

}  // namespace strata
