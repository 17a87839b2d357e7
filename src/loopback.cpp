#include "strata/loopback.hpp"

#include "strata/observability.hpp"
#include "strata/selector.hpp"
#include "strata/version.hpp"

namespace strata {

// ---------------------------------------------------------------------------
// MemoryRemote
// ---------------------------------------------------------------------------

MemoryRemote::ConnectionId MemoryRemote::open_connection() {
  const ConnectionId id = next_connection_++;
  connections_[id] = Connection{};
  ++connections_opened_;
  return id;
}

void MemoryRemote::close_connection(ConnectionId id) {
  connections_.erase(id);
}

bool MemoryRemote::alive(ConnectionId id) const {
  return connections_.contains(id);
}

void MemoryRemote::drop_connections() {
  connections_.clear();
}

void MemoryRemote::release_held() {
  for (auto& [id, conn] : connections_) {
    while (!conn.held.empty()) {
      conn.inbox.push_back(std::move(conn.held.front()));
      conn.held.pop_front();
    }
  }
}

std::vector<std::string> MemoryRemote::take(ConnectionId id) {
  std::vector<std::string> out;
  auto it = connections_.find(id);
  if (it == connections_.end()) return out;
  out.assign(it->second.inbox.begin(), it->second.inbox.end());
  it->second.inbox.clear();
  return out;
}

void MemoryRemote::respond(ConnectionId id, const std::string& frame) {
  auto it = connections_.find(id);
  if (it == connections_.end()) return;
  if (hold_responses_) it->second.held.push_back(frame);
  else it->second.inbox.push_back(frame);
}

const Revision* MemoryRemote::current(const std::string& space, const Address& address) const {
  auto sit = spaces_.find(space);
  if (sit == spaces_.end()) return nullptr;
  auto it = sit->second.find(address.key());
  return it == sit->second.end() ? nullptr : &it->second;
}

std::string MemoryRemote::expected_cause(const Revision* current, const Address& address) {
  return (current && current->cause) ? reference(*current) : genesis_reference(address);
}

void MemoryRemote::receive(ConnectionId id, const std::string& frame) {
  ++frames_received_;
  auto inv = protocol::decode_invocation(frame);
  if (!inv) {
    log(LogLevel::warn, "remote", "bad frame: " + inv.error().message);
    return;
  }
  const auto& invocation = inv.value();
  commands_.push_back(invocation.command);
  // Answer under the reference the client authorized, not a recomputed one.
  std::string job = protocol::invocation_ref(invocation);
  std::optional<jsonlite::JsonError> err;
  const auto envelope = jsonlite::parse(frame, &err);
  if (const auto* auth = jsonlite::get_object(envelope, "authorization")) {
    const auto access = jsonlite::get_string_array(*auth, "access");
    if (!access.empty()) job = access.front();
  }

  if (invocation.command == protocol::kHello) {
    ++hellos_;
    const auto peer = static_cast<uint32_t>(jsonlite::get_u64(invocation.args, "protocol", 0));
    const auto compat = version::check_compatibility(peer);
    if (!compat.ok) log(LogLevel::warn, "remote", "hello: " + compat.description);
    return;
  }

  if (invocation.command == protocol::kAck) {
    ++acks_;
    return;
  }

  if (invocation.command == protocol::kGet || invocation.command == protocol::kSubscribe) {
    const bool subscribe = invocation.command == protocol::kSubscribe;
    std::optional<Error> error;
    auto ok = answer_query(id, invocation, subscribe, error);
    respond(id, error ? protocol::encode_task_error(job, *error)
                      : protocol::encode_task_return(job, ok));
    return;
  }

  if (invocation.command == protocol::kTransact) {
    ++transactions_served_;
    if (deny_writes_) {
      respond(id, protocol::encode_task_error(
                      job, make_error(ErrorCode::authorization_error,
                                      "issuer " + invocation.issuer + " may not write to " +
                                          invocation.subject)));
      return;
    }
    std::vector<Revision> changed;
    auto commit = apply_transaction(invocation.subject, invocation.args, changed);
    if (!commit) {
      respond(id, protocol::encode_task_error(job, commit.error()));
      return;
    }
    respond(id, protocol::encode_task_return(job, protocol::encode_commit(commit.value())));
    publish(invocation.subject, changed);
    return;
  }

  respond(id, protocol::encode_task_error(
                  job, make_error(ErrorCode::transaction_error,
                                  "unknown command '" + invocation.command + "'")));
}

jsonlite::Value MemoryRemote::answer_query(ConnectionId id, const protocol::Invocation& inv,
                                           bool subscribe, std::optional<Error>& error) {
  const auto* query = jsonlite::get_object(inv.args, "query");
  if (!query) {
    error = make_error(ErrorCode::query_error, "invocation without query");
    return {};
  }
  if (subscribe) ++subscriptions_served_;
  else ++queries_served_;

  std::vector<Revision> found;
  for (const auto& address : query_addresses(*query)) {
    if (subscribe) connections_[id].subscriptions.insert(address.key());
    if (const auto* r = current(inv.subject, address)) found.push_back(*r);
  }
  return protocol::encode_query_result(found);
}

Result<Commit> MemoryRemote::apply_transaction(const std::string& space,
                                               const jsonlite::Object& args,
                                               std::vector<Revision>& changed) {
  const auto* writes = jsonlite::get_array(args, "writes");
  if (!writes) return make_error(ErrorCode::transaction_error, "transaction without writes");

  // Writes inside one transaction chain on each other.
  RevisionMap working;
  std::vector<Revision> accepted;
  std::vector<std::string> conflicts;
  for (const auto& w : *writes) {
    const auto* o = jsonlite::as_object(w);
    if (!o) return make_error(ErrorCode::transaction_error, "write is not an object");
    const std::string key = jsonlite::get_string(*o, "ref");
    auto address = parse_address_key(key);
    if (!address) return make_error(ErrorCode::transaction_error, "bad write ref", {key});
    const auto heads = jsonlite::get_string_array(*o, "baseHeads");
    const auto* changes = jsonlite::get_object(*o, "changes");
    if (heads.empty() || !changes) {
      return make_error(ErrorCode::transaction_error, "write without baseHeads or changes", {key});
    }

    auto wit = working.find(key);
    const Revision* cur = wit != working.end() ? &wit->second : current(space, *address);
    if (heads.front() != expected_cause(cur, *address)) {
      conflicts.push_back(key);
      continue;
    }

    Revision r;
    r.the = address->the;
    r.of = address->of;
    r.cause = heads.front();
    if (const auto* is = jsonlite::find(*changes, "is")) r.is = *is;
    else if (!jsonlite::get_bool(*changes, "retract")) {
      return make_error(ErrorCode::transaction_error, "write changes nothing", {key});
    }
    auto valid = validate_revision(r);
    if (!valid) return make_error(ErrorCode::transaction_error, valid.error().message, {key});
    working[key] = r;
    accepted.push_back(std::move(r));
  }

  if (!conflicts.empty() && !partial_commits_) {
    return make_error(ErrorCode::conflict_error,
                      "stale cause for " + std::to_string(conflicts.size()) + " write(s)",
                      conflicts);
  }

  Commit c = commit(space, std::move(accepted), changed);
  c.rejected = std::move(conflicts);
  return c;
}

Commit MemoryRemote::commit(const std::string& space, std::vector<Revision> writes,
                            std::vector<Revision>& changed) {
  const int64_t since = ++since_;
  auto& state = spaces_[space];
  for (auto& r : writes) {
    r.since = since;
    state[r.key()] = r;
    changed.push_back(r);
  }

  const Address head_address{protocol::kCommitThe, space};
  const Revision* previous = current(space, head_address);
  Revision head;
  head.the = head_address.the;
  head.of = head_address.of;
  jsonlite::Object is;
  is["since"] = jsonlite::Value{static_cast<std::int64_t>(since)};
  head.is = jsonlite::Value{std::move(is)};
  head.cause = expected_cause(previous, head_address);
  head.since = since;
  state[head.key()] = head;
  changed.push_back(head);

  Commit c;
  c.since = since;
  c.head = head;
  return c;
}

void MemoryRemote::publish(const std::string& space, const std::vector<Revision>& changed) {
  const std::string head_key = Address{protocol::kCommitThe, space}.key();
  for (auto& [id, conn] : connections_) {
    const bool feed = conn.subscriptions.contains(head_key);
    protocol::Deliver d;
    d.stream_id = space;
    for (const auto& r : changed) {
      if (!feed && !conn.subscriptions.contains(r.key())) continue;
      d.docs.push_back(protocol::DeliverDoc{r.key(), "snapshot", r, r.since});
    }
    if (d.docs.empty()) continue;
    d.epoch = ++conn.epoch;
    // Pushes are not responses; holding responses does not hold them.
    conn.inbox.push_back(protocol::encode_deliver(d));
  }
}

int64_t MemoryRemote::commit_external(const std::string& space, const Address& address,
                                      std::optional<jsonlite::Value> value, bool deliver) {
  const Revision* cur = current(space, address);
  Revision r;
  r.the = address.the;
  r.of = address.of;
  r.is = std::move(value);
  r.cause = expected_cause(cur, address);
  std::vector<Revision> changed;
  const Commit c = commit(space, {r}, changed);
  if (deliver) publish(space, changed);
  return c.since;
}

// ---------------------------------------------------------------------------
// LoopbackTransport
// ---------------------------------------------------------------------------

LoopbackTransport::~LoopbackTransport() {
  close();
}

bool LoopbackTransport::open() {
  if (connection_ != 0 || refused_) return true;
  // Refusal surfaces asynchronously, like a failed TCP handshake.
  if (remote_.refuse_connections()) {
    refused_ = true;
    return true;
  }
  connection_ = remote_.open_connection();
  open_ = false;
  return true;
}

bool LoopbackTransport::send(const std::string& frame) {
  if (!open_ || !remote_.alive(connection_)) return false;
  remote_.receive(connection_, frame);
  return true;
}

void LoopbackTransport::close() {
  if (connection_ != 0) remote_.close_connection(connection_);
  connection_ = 0;
  open_ = false;
  refused_ = false;
}

std::vector<TransportEvent> LoopbackTransport::poll(int /*timeout_ms*/) {
  std::vector<TransportEvent> events;
  if (refused_) {
    refused_ = false;
    events.push_back({TransportEventKind::error, "connection refused"});
    return events;
  }
  if (connection_ == 0) return events;

  if (!remote_.alive(connection_)) {
    const bool was_open = open_;
    connection_ = 0;
    open_ = false;
    events.push_back({was_open ? TransportEventKind::closed : TransportEventKind::error,
                      "connection dropped by remote"});
    return events;
  }

  if (!open_) {
    if (remote_.hang_handshake()) return events;
    open_ = true;
    events.push_back({TransportEventKind::opened, endpoint()});
    return events;
  }

  for (auto& frame : remote_.take(connection_)) {
    events.push_back({TransportEventKind::message, std::move(frame)});
  }
  return events;
}

}  // namespace strata
