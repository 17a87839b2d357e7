#pragma once

// strata/replica.hpp — Client-side replica of one memory space.
//
// Three layers of state, read top-down by get():
//   nursery   staged writes not yet confirmed by the remote
//   heap      confirmed revisions (and recorded unclaimed addresses)
//   cache     durable copy used to warm the heap across restarts
//
// INVARIANTS:
//   - Only remote confirmations (query results, commits, deliveries) and the
//     durable cache enter the heap. A staged write never does until its
//     transaction commits.
//   - An address the remote had nothing for is recorded as unclaimed, so the
//     next load of it is answered locally.
//   - Every remote batch that introduces an unknown address also fetches the
//     space's commit head, so last_since() tracks what the replica has seen.
//   - A ConflictError or a per-write rejection marks the affected addresses
//     stale. A stale address bypasses the heap and the cache on the next load.
//   - Responses that arrive after the replica is destroyed are dropped. Other
//     replicas sharing a coalesced request still get theirs.
//
// CACHE POLICY:
//   store_error from the cache is logged and counted, never surfaced.
//   Schema-bearing entries always go to the remote: the cache stores single
//   revisions, not linked subgraphs.

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "strata/cache.hpp"
#include "strata/config.hpp"
#include "strata/heap.hpp"
#include "strata/nursery.hpp"
#include "strata/observability.hpp"
#include "strata/protocol.hpp"
#include "strata/pull_queue.hpp"
#include "strata/revision.hpp"
#include "strata/selector.hpp"
#include "strata/session.hpp"
#include "strata/types.hpp"

namespace strata {

class Replica {
 public:
  Replica(std::string space, Session& session, std::unique_ptr<IRevisionCache> cache);
  ~Replica();

  Replica(const Replica&) = delete;
  Replica& operator=(const Replica&) = delete;

  const std::string& space() const { return space_; }
  Address commit_address() const { return Address{protocol::kCommitThe, space_}; }

  // Makes the entries locally available: heap first, then the durable cache
  // (remaining refresh is queued for the next background sync), then the
  // remote. Completes with the revisions that were brought in.
  void load(const std::vector<LoadEntry>& entries, Callback<std::vector<Revision>> done);
  void load(const std::vector<Address>& addresses, Callback<std::vector<Revision>> done) {
    load(entries_for(addresses), std::move(done));
  }

  // Always asks the remote.
  void pull(const std::vector<LoadEntry>& entries, Callback<std::vector<Revision>> done);

  // Stages the intents over what is currently known, sends them as one
  // transaction and promotes them on commit. An empty effective batch
  // completes without contacting the remote.
  void push(const std::vector<Intent>& intents, Callback<Commit> done);

  // Nursery overlay first, then the heap. Null when nothing is known.
  const Revision* get(const Address& address) const;

  // Returns 0 when the per-space subscription cap is reached.
  SubscriptionId subscribe(const Address& address, RevisionCallback callback);
  bool unsubscribe(const Address& address, SubscriptionId id);

  // Merges pushed documents for addresses this replica already holds.
  void integrate(const std::vector<protocol::DeliverDoc>& docs);

  // Schedules a background pull of the queued addresses after the debounce
  // window. Calls inside the window share one pull.
  void sync();
  void tick(uint64_t now);

  int64_t last_since() const { return last_since_; }
  bool stale(const Address& address) const { return stale_.contains(address.key()); }

  const ReplicaStats& stats() const { return stats_; }
  const Heap& heap() const { return heap_; }
  const Nursery& nursery() const { return nursery_; }
  const PullQueue& queue() const { return queue_; }
  IRevisionCache& cache() { return *cache_; }

 private:
  void open_feed();
  void on_pulled(const std::vector<LoadEntry>& entries, const Result<jsonlite::Value>& result,
                 const Callback<std::vector<Revision>>& done);
  void on_committed(const std::vector<Revision>& staged, const Result<jsonlite::Value>& result,
                    const Callback<Commit>& done);
  void fail_push(const std::vector<Revision>& staged, const Error& error,
                 const Callback<Commit>& done);
  void merge_confirmed(const std::vector<Revision>& revisions);
  void persist(const std::vector<Revision>& revisions);
  void enforce_bound();
  void note_cache_error(const std::string& op, const Error& error);
  void emit(const std::string& kind, uint64_t count, const std::string& error_code = "",
            const std::string& detail = "");

  std::string space_;
  Session& session_;
  std::unique_ptr<IRevisionCache> cache_;
  std::string consumer_id_;
  uint32_t max_subscriptions_{0};
  uint64_t debounce_ms_{0};

  Heap heap_;
  Nursery nursery_;
  PullQueue queue_;
  SchemaTracker schemas_;
  std::set<std::string> stale_;

  int64_t last_since_{kUnclaimedSince};
  bool sync_scheduled_{false};
  uint64_t sync_at_{0};
  uint64_t tx_counter_{0};
  std::string commit_feed_;
  ReplicaStats stats_;
  // Session callbacks hold a weak reference and return once this expires.
  std::shared_ptr<const bool> lifetime_{std::make_shared<const bool>(true)};
};

}  // namespace strata
