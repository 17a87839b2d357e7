#pragma once

// strata/heap.hpp — In-session confirmed state.
//
// One current revision per address key. merge() applies reconcile() to a
// whole batch, then notifies each subscriber of each changed address exactly
// once. A tie or an older since changes nothing and notifies nobody, so
// re-delivery of the same server push is silent.
//
// Subscribers receive const Revision*: null means unresolved (nothing held),
// non-null with is absent means resolved but retracted or unclaimed.
//
// BOUND:
//   max_entries 0 = unbounded. Otherwise evict() drops least-recently-merged
//   keys the caller does not pin (live subscribers are always pinned).

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "strata/revision.hpp"

namespace strata {

using SubscriptionId = uint64_t;
using RevisionCallback = std::function<void(const Revision*)>;

class Heap {
 public:
  explicit Heap(std::size_t max_entries = 0) : max_entries_(max_entries) {}

  const Revision* get(const std::string& key) const;
  bool contains(const std::string& key) const { return entries_.contains(key); }
  std::size_t size() const { return entries_.size(); }

  // Returns the keys whose winner changed, after notifying their subscribers.
  std::vector<std::string> merge(const std::vector<Revision>& revisions);

  SubscriptionId subscribe(const std::string& key, RevisionCallback callback);
  bool unsubscribe(const std::string& key, SubscriptionId id);
  std::size_t subscriber_count(const std::string& key) const;
  std::size_t subscription_total() const { return subscription_total_; }

  // Marks a key as recently used without changing it.
  void touch(const std::string& key);

  // Drops unpinned keys, oldest first, until size() <= max_entries. Returns
  // the evicted keys. No-op when unbounded.
  std::vector<std::string> evict(const std::function<bool(const std::string&)>& pinned);

  uint64_t notifications() const { return notifications_; }

 private:
  struct Entry {
    Revision revision;
    uint64_t tick{0};
  };

  void stamp(const std::string& key, Entry& entry);

  std::map<std::string, Entry> entries_;
  std::map<uint64_t, std::string> recency_;  // tick -> key, oldest first
  std::map<std::string, std::map<SubscriptionId, RevisionCallback>> subscribers_;
  std::size_t max_entries_{0};
  std::size_t subscription_total_{0};
  uint64_t clock_{0};
  SubscriptionId next_id_{1};
  uint64_t notifications_{0};
};

}  // namespace strata
