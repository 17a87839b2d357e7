#pragma once

// strata/registry.hpp — One session, one replica per mounted space.
//
// DESIGN:
//   The registry is the explicit owner of everything a client process needs:
//   the session (and through it the transport) and a replica per space,
//   created on first mount(). There is no global instance; callers hold the
//   registry and drive it with poll().
//
// OWNERSHIP:
//   session_ is declared before replicas_, so replicas are destroyed first
//   and unmount themselves from a still-live session.
//
// CACHE:
//   The CacheFactory builds each replica's durable cache. The default
//   factory uses Settings::cache_root: empty means NoCache, otherwise a
//   FileRevisionCache under <cache_root>/<space digest>.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "strata/cache.hpp"
#include "strata/config.hpp"
#include "strata/jsonlite.hpp"
#include "strata/replica.hpp"
#include "strata/session.hpp"
#include "strata/transport.hpp"

namespace strata {

using CacheFactory = std::function<std::unique_ptr<IRevisionCache>(const std::string& space)>;

CacheFactory default_cache_factory(const Settings& settings);

class Registry {
 public:
  Registry(std::unique_ptr<ITransport> transport, Settings settings,
           CacheFactory caches = {}, Clock clock = steady_now_ms);
  ~Registry();

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  // Returns the replica for space, creating it on first use.
  Replica& mount(const std::string& space);
  Replica* find(const std::string& space);
  std::size_t size() const { return replicas_.size(); }

  void connect() { session_.connect(); }
  void close() { session_.close(); }
  std::size_t poll(int timeout_ms) { return session_.poll(timeout_ms); }
  Session& session() { return session_; }
  const Settings& settings() const { return settings_; }

  // Subscribes to {default_the, of}, loads it and reports the current value
  // once loaded. Returns the subscription id (0 when refused).
  SubscriptionId sink(const std::string& space, const std::string& of, RevisionCallback callback);

  // Writes {default_the, of} = value for each pair, skipping values equal to
  // what is already known, as one transaction.
  void send(const std::string& space,
            const std::vector<std::pair<std::string, jsonlite::Value>>& batch,
            Callback<Commit> done);

  // {"session":{...},"spaces":{<space>:{...}}}
  std::string stats_json() const;

 private:
  Settings settings_;
  CacheFactory caches_;
  Session session_;
  std::map<std::string, std::unique_ptr<Replica>> replicas_;
};

}  // namespace strata
