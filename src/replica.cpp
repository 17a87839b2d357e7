#include "strata/replica.hpp"

#include <algorithm>
#include <map>

namespace strata {

Replica::Replica(std::string space, Session& session, std::unique_ptr<IRevisionCache> cache)
    : space_(std::move(space)),
      session_(session),
      cache_(cache ? std::move(cache) : std::make_unique<NoCache>()),
      consumer_id_(session.client_id() + ":" + space_),
      max_subscriptions_(session.settings().max_subscriptions_per_space),
      debounce_ms_(session.settings().sync_debounce_ms),
      heap_(static_cast<std::size_t>(session.settings().max_heap_entries)) {
  SessionMount hooks;
  hooks.since = [this]() { return last_since_; };
  hooks.on_deliver = [this](const protocol::Deliver& d) { integrate(d.docs); };
  hooks.on_tick = [this](uint64_t now) { tick(now); };
  hooks.on_open = [this]() { open_feed(); };
  session_.mount(space_, std::move(hooks));
  open_feed();
}

// Commit-log feed: the remote pushes every change in the space through it.
// A close() fails it, so the next open issues it again.
void Replica::open_feed() {
  if (!commit_feed_.empty() && session_.pending(commit_feed_)) return;
  const auto feed = build_query({LoadEntry{commit_address(), std::nullopt}});
  std::weak_ptr<const bool> alive = lifetime_;
  commit_feed_ = session_.invoke(
      space_, protocol::kSubscribe, protocol::query_args(consumer_id_, feed),
      [this, alive](Result<jsonlite::Value> r) {
        if (alive.expired()) return;
        if (!r) {
          log(LogLevel::warn, "replica", space_ + ": commit feed: " + r.error().message);
          return;
        }
        auto revisions = protocol::decode_query_result(r.value());
        if (!revisions) {
          log(LogLevel::warn, "replica", space_ + ": commit feed: " + revisions.error().message);
          return;
        }
        merge_confirmed(revisions.value());
        persist(revisions.value());
      },
      /*persistent=*/true);
}

Replica::~Replica() {
  session_.cancel(commit_feed_);
  session_.unmount(space_);
}

void Replica::emit(const std::string& kind, uint64_t count, const std::string& error_code,
                   const std::string& detail) {
  ReplicaEvent ev;
  ev.kind = kind;
  ev.space = space_;
  ev.count = count;
  ev.error_code = error_code;
  ev.detail = detail;
  emit_event(ev);
}

void Replica::note_cache_error(const std::string& op, const Error& error) {
  stats_.cache_errors.fetch_add(1, std::memory_order_relaxed);
  log(LogLevel::warn, "replica",
      space_ + ": cache " + op + " failed (" + cache_->backend_id() + "): " + error.message);
  emit("cache", error.addresses.size(), to_string(error.code), op);
}

const Revision* Replica::get(const Address& address) const {
  const std::string key = address.key();
  if (const auto* staged = nursery_.get(key)) return staged;
  return heap_.get(key);
}

// ---------------------------------------------------------------------------
// Load / pull
// ---------------------------------------------------------------------------

void Replica::load(const std::vector<LoadEntry>& entries, Callback<std::vector<Revision>> done) {
  stats_.loads.fetch_add(1, std::memory_order_relaxed);

  std::vector<LoadEntry> need;
  std::set<std::string> seen;
  for (const auto& e : entries) {
    if (!seen.insert(e.dedup_key()).second) continue;
    const std::string key = e.address.key();
    const bool held = heap_.contains(key) && !stale_.contains(key);
    const bool variant_known = !e.schema || schemas_.has(key, e.schema->reference());
    if (held && variant_known) {
      heap_.touch(key);
      continue;
    }
    need.push_back(e);
  }

  // The head rides along with any remote or cache batch. A load the heap fully
  // answers does not fetch it again; deliveries keep it current.
  const Address head = commit_address();
  if (!need.empty() || !heap_.contains(head.key())) {
    const bool has_head = std::any_of(need.begin(), need.end(), [&](const LoadEntry& e) {
      return e.address == head && !e.schema;
    });
    if (!has_head) need.insert(need.begin(), LoadEntry{head, std::nullopt});
  }

  if (need.empty()) {
    stats_.loads_from_heap.fetch_add(1, std::memory_order_relaxed);
    if (done) done(std::vector<Revision>{});
    return;
  }

  // Durable cache for plain entries. Stale ones must come from the remote.
  std::vector<Address> plain;
  bool remote_required = false;
  for (const auto& e : need) {
    if (e.schema || stale_.contains(e.address.key())) remote_required = true;
    else plain.push_back(e.address);
  }

  std::vector<Revision> hits;
  if (!plain.empty()) {
    auto pulled = cache_->pull(plain);
    if (!pulled) {
      note_cache_error("pull", pulled.error());
      remote_required = true;
    } else {
      for (auto& [key, r] : pulled.value()) hits.push_back(std::move(r));
      stats_.cache_hits.fetch_add(hits.size(), std::memory_order_relaxed);
      stats_.cache_misses.fetch_add(plain.size() - hits.size(), std::memory_order_relaxed);
      if (hits.size() < plain.size()) remote_required = true;
      if (!hits.empty()) merge_confirmed(hits);
    }
  }

  if (!remote_required) {
    queue_.add(need);
    sync();
    emit("load", need.size(), "", "cache");
    if (done) done(std::move(hits));
    return;
  }

  pull(need, std::move(done));
}

void Replica::pull(const std::vector<LoadEntry>& entries, Callback<std::vector<Revision>> done) {
  if (entries.empty()) {
    if (done) done(std::vector<Revision>{});
    return;
  }
  stats_.remote_fetches.fetch_add(1, std::memory_order_relaxed);
  const auto query = build_query(entries);
  std::weak_ptr<const bool> alive = lifetime_;
  session_.invoke(space_, protocol::kGet, protocol::query_args(consumer_id_, query),
                  [this, alive, entries, done = std::move(done)](Result<jsonlite::Value> r) {
                    if (alive.expired()) return;
                    on_pulled(entries, r, done);
                  });
}

void Replica::on_pulled(const std::vector<LoadEntry>& entries,
                        const Result<jsonlite::Value>& result,
                        const Callback<std::vector<Revision>>& done) {
  if (!result) {
    emit("pull", entries.size(), to_string(result.error().code), result.error().message);
    if (done) done(result.error());
    return;
  }
  auto decoded = protocol::decode_query_result(result.value());
  if (!decoded) {
    emit("pull", entries.size(), to_string(decoded.error().code), decoded.error().message);
    if (done) done(decoded.error());
    return;
  }

  std::vector<Revision> fetched = std::move(decoded.value());
  merge_confirmed(fetched);

  std::set<std::string> returned;
  for (const auto& r : fetched) returned.insert(r.key());

  std::vector<Revision> unclaimed;
  for (const auto& e : entries) {
    const std::string key = e.address.key();
    if (returned.contains(key) || heap_.contains(key)) continue;
    unclaimed.push_back(unclaimed_revision(e.address));
    returned.insert(key);
  }
  if (!unclaimed.empty()) {
    stats_.unclaimed_recorded.fetch_add(unclaimed.size(), std::memory_order_relaxed);
    merge_confirmed(unclaimed);
  }

  for (const auto& e : entries) {
    const std::string key = e.address.key();
    if (e.schema) schemas_.add(key, e.schema->reference());
    stale_.erase(key);
  }

  fetched.insert(fetched.end(), unclaimed.begin(), unclaimed.end());
  persist(fetched);
  enforce_bound();
  emit("pull", fetched.size());
  if (done) done(std::move(fetched));
}

// ---------------------------------------------------------------------------
// Push
// ---------------------------------------------------------------------------

void Replica::push(const std::vector<Intent>& intents, Callback<Commit> done) {
  stats_.pushes.fetch_add(1, std::memory_order_relaxed);
  if (intents.empty()) {
    Commit c;
    c.since = last_since_;
    if (done) done(std::move(c));
    return;
  }

  std::vector<Address> touched;
  std::set<std::string> seen;
  for (const auto& intent : intents) {
    const auto& address = intent_address(intent);
    if (seen.insert(address.key()).second) touched.push_back(address);
  }

  load(touched, [this, intents, done = std::move(done)](Result<std::vector<Revision>> loaded) {
    if (!loaded) {
      stats_.push_failures.fetch_add(1, std::memory_order_relaxed);
      emit("push", intents.size(), to_string(loaded.error().code), loaded.error().message);
      if (done) done(loaded.error());
      return;
    }

    // Stage one by one so later intents on the same address chain on earlier ones.
    std::vector<Revision> staged;
    for (const auto& intent : intents) {
      auto built = build_revision(get(intent_address(intent)), intent);
      if (!built) continue;
      nursery_.put(*built);
      staged.push_back(std::move(*built));
    }

    if (staged.empty()) {
      Commit c;
      c.since = last_since_;
      if (done) done(std::move(c));
      return;
    }

    const std::string tx_id = consumer_id_ + ":" + std::to_string(++tx_counter_);
    std::weak_ptr<const bool> alive = lifetime_;
    session_.invoke(space_, protocol::kTransact, protocol::transact_args(tx_id, staged),
                    [this, alive, staged, done](Result<jsonlite::Value> r) {
                      if (alive.expired()) return;
                      on_committed(staged, r, done);
                    },
                    /*persistent=*/false, /*unique=*/true);
  });
}

void Replica::on_committed(const std::vector<Revision>& staged,
                           const Result<jsonlite::Value>& result, const Callback<Commit>& done) {
  if (!result) {
    fail_push(staged, result.error(), done);
    return;
  }
  auto decoded = protocol::decode_commit(result.value());
  if (!decoded) {
    fail_push(staged, decoded.error(), done);
    return;
  }
  Commit commit = std::move(decoded.value());
  const std::set<std::string> rejected(commit.rejected.begin(), commit.rejected.end());

  // The last staged revision per address is the one the remote kept.
  std::map<std::string, Revision> latest;
  for (const auto& s : staged) {
    if (rejected.contains(s.key())) continue;
    Revision r = s;
    r.since = commit.since;
    latest[r.key()] = std::move(r);
  }

  std::vector<Revision> confirmed;
  confirmed.reserve(latest.size() + 1);
  for (auto& [key, r] : latest) confirmed.push_back(std::move(r));
  commit.revisions = confirmed;
  if (commit.head) confirmed.push_back(*commit.head);

  merge_confirmed(confirmed);
  for (const auto& s : staged) nursery_.remove(s);

  for (const auto& key : rejected) stale_.insert(key);
  if (!rejected.empty()) {
    stats_.rejected_writes.fetch_add(rejected.size(), std::memory_order_relaxed);
    log(LogLevel::info, "replica",
        space_ + ": " + std::to_string(rejected.size()) + " write(s) rejected at since " +
            std::to_string(commit.since));
  }

  persist(confirmed);
  enforce_bound();
  stats_.commits.fetch_add(1, std::memory_order_relaxed);
  emit("push", commit.revisions.size(), rejected.empty() ? "" : "partial",
       "since=" + std::to_string(commit.since));
  if (done) done(std::move(commit));
}

void Replica::fail_push(const std::vector<Revision>& staged, const Error& error,
                        const Callback<Commit>& done) {
  for (const auto& s : staged) nursery_.remove(s);
  stats_.push_failures.fetch_add(1, std::memory_order_relaxed);
  if (error.code == ErrorCode::conflict_error) {
    stats_.conflicts.fetch_add(1, std::memory_order_relaxed);
    for (const auto& s : staged) stale_.insert(s.key());
    for (const auto& key : error.addresses) stale_.insert(key);
  }
  log(LogLevel::info, "replica", space_ + ": push failed: " + to_string(error.code) + ": " +
                                     error.message);
  emit("push", staged.size(), to_string(error.code), error.message);
  if (done) done(error);
}

// ---------------------------------------------------------------------------
// Subscriptions and deliveries
// ---------------------------------------------------------------------------

SubscriptionId Replica::subscribe(const Address& address, RevisionCallback callback) {
  if (max_subscriptions_ != 0 && heap_.subscription_total() >= max_subscriptions_) {
    log(LogLevel::warn, "replica",
        space_ + ": subscription limit " + std::to_string(max_subscriptions_) + " reached");
    return 0;
  }
  return heap_.subscribe(address.key(), std::move(callback));
}

bool Replica::unsubscribe(const Address& address, SubscriptionId id) {
  return heap_.unsubscribe(address.key(), id);
}

void Replica::integrate(const std::vector<protocol::DeliverDoc>& docs) {
  const std::string head_key = commit_address().key();
  std::vector<Revision> held;
  for (const auto& doc : docs) {
    const std::string key = doc.revision.key();
    if (key == head_key || heap_.contains(key)) held.push_back(doc.revision);
  }
  stats_.deliveries.fetch_add(1, std::memory_order_relaxed);
  if (held.empty()) return;
  merge_confirmed(held);
  persist(held);
  enforce_bound();
  emit("integrate", held.size());
}

void Replica::merge_confirmed(const std::vector<Revision>& revisions) {
  if (revisions.empty()) return;
  for (const auto& r : revisions) last_since_ = std::max(last_since_, r.since);
  const uint64_t before = heap_.notifications();
  heap_.merge(revisions);
  stats_.notifications.fetch_add(heap_.notifications() - before, std::memory_order_relaxed);
}

void Replica::persist(const std::vector<Revision>& revisions) {
  if (revisions.empty()) return;
  auto r = cache_->merge(revisions, reconcile);
  if (!r) note_cache_error("merge", r.error());
}

void Replica::enforce_bound() {
  const std::string head_key = commit_address().key();
  const auto evicted = heap_.evict([&](const std::string& key) {
    return key == head_key || nursery_.contains(key);
  });
  for (const auto& key : evicted) {
    schemas_.forget(key);
    stale_.erase(key);
  }
  if (!evicted.empty()) {
    stats_.evictions.fetch_add(evicted.size(), std::memory_order_relaxed);
    log(LogLevel::debug, "replica",
        space_ + ": evicted " + std::to_string(evicted.size()) + " entr(ies)");
  }
}

// ---------------------------------------------------------------------------
// Background sync
// ---------------------------------------------------------------------------

void Replica::sync() {
  if (sync_scheduled_) return;
  sync_scheduled_ = true;
  sync_at_ = session_.now() + debounce_ms_;
}

void Replica::tick(uint64_t now) {
  if (!sync_scheduled_ || now < sync_at_) return;
  sync_scheduled_ = false;
  auto entries = queue_.consume();
  if (entries.empty()) return;
  stats_.background_syncs.fetch_add(1, std::memory_order_relaxed);
  pull(entries, [this](Result<std::vector<Revision>> r) {
    if (!r) {
      log(LogLevel::warn, "replica", space_ + ": background sync failed: " + r.error().message);
    }
  });
}

}  // namespace strata
