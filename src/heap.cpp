#include "strata/heap.hpp"

#include <set>

namespace strata {

const Revision* Heap::get(const std::string& key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second.revision;
}

void Heap::stamp(const std::string& key, Entry& entry) {
  if (entry.tick != 0) recency_.erase(entry.tick);
  entry.tick = ++clock_;
  recency_.emplace(entry.tick, key);
}

void Heap::touch(const std::string& key) {
  auto it = entries_.find(key);
  if (it != entries_.end()) stamp(key, it->second);
}

std::vector<std::string> Heap::merge(const std::vector<Revision>& revisions) {
  std::set<std::string> changed;
  for (const auto& incoming : revisions) {
    const std::string key = incoming.key();
    auto it = entries_.find(key);
    const Revision* existing = it == entries_.end() ? nullptr : &it->second.revision;
    if (reconcile(existing, &incoming) != &incoming) {
      if (it != entries_.end()) stamp(key, it->second);
      continue;
    }
    auto& entry = entries_[key];
    entry.revision = incoming;
    stamp(key, entry);
    changed.insert(key);
  }

  // Notify after the whole batch is applied so callbacks observe final state.
  for (const auto& key : changed) {
    auto sit = subscribers_.find(key);
    if (sit == subscribers_.end()) continue;
    std::vector<RevisionCallback> callbacks;
    callbacks.reserve(sit->second.size());
    for (const auto& [id, cb] : sit->second) callbacks.push_back(cb);
    for (const auto& cb : callbacks) {
      ++notifications_;
      cb(get(key));
    }
  }
  return {changed.begin(), changed.end()};
}

SubscriptionId Heap::subscribe(const std::string& key, RevisionCallback callback) {
  const SubscriptionId id = next_id_++;
  subscribers_[key].emplace(id, std::move(callback));
  ++subscription_total_;
  return id;
}

bool Heap::unsubscribe(const std::string& key, SubscriptionId id) {
  auto it = subscribers_.find(key);
  if (it == subscribers_.end()) return false;
  if (it->second.erase(id) == 0) return false;
  --subscription_total_;
  if (it->second.empty()) subscribers_.erase(it);
  return true;
}

std::size_t Heap::subscriber_count(const std::string& key) const {
  auto it = subscribers_.find(key);
  return it == subscribers_.end() ? 0 : it->second.size();
}

std::vector<std::string> Heap::evict(const std::function<bool(const std::string&)>& pinned) {
  std::vector<std::string> evicted;
  if (max_entries_ == 0) return evicted;
  auto it = recency_.begin();
  while (entries_.size() > max_entries_ && it != recency_.end()) {
    const std::string key = it->second;
    if (subscribers_.contains(key) || (pinned && pinned(key))) {
      ++it;
      continue;
    }
    it = recency_.erase(it);
    entries_.erase(key);
    evicted.push_back(key);
  }
  return evicted;
}

}  // namespace strata
