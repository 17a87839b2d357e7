#pragma once

// strata/loopback.hpp — In-process remote and the transport that talks to it.
//
// MemoryRemote keeps per-space append-only state with one global since
// counter and answers the same frames a network remote would:
//   hello      protocol check, no response
//   get        current revisions for the queried addresses (missing ones
//              are simply absent)
//   subscribe  as get, and registers the addresses on the connection. A
//              subscription on a space's commit head address receives every
//              change committed in that space.
//   tx         causal check of every write against the current revision.
//              All-or-nothing ConflictError by default; with partial commits
//              enabled, mismatching writes are listed in "rejected" and the
//              rest commit.
//   ack        counted
//
// Responses are queued on the connection and surface on the next
// LoopbackTransport::poll(), never inside send(). Fault controls let tests
// drop connections, stall the handshake, refuse connects, hold responses and
// deny writes.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "strata/jsonlite.hpp"
#include "strata/protocol.hpp"
#include "strata/revision.hpp"
#include "strata/transport.hpp"
#include "strata/types.hpp"

namespace strata {

class MemoryRemote {
 public:
  using ConnectionId = uint64_t;

  // --- connection plumbing (LoopbackTransport) ---
  ConnectionId open_connection();
  void close_connection(ConnectionId id);
  bool alive(ConnectionId id) const;
  void receive(ConnectionId id, const std::string& frame);
  std::vector<std::string> take(ConnectionId id);

  // --- state ---
  const Revision* current(const std::string& space, const Address& address) const;
  int64_t since() const { return since_; }
  // Writes one revision chained on the current one, as another client would.
  // Returns the assigned since.
  int64_t commit_external(const std::string& space, const Address& address,
                          std::optional<jsonlite::Value> value, bool deliver = true);

  // --- fault controls ---
  void drop_connections();
  void set_hang_handshake(bool hang) { hang_handshake_ = hang; }
  bool hang_handshake() const { return hang_handshake_; }
  void set_refuse_connections(bool refuse) { refuse_connections_ = refuse; }
  bool refuse_connections() const { return refuse_connections_; }
  void hold_responses(bool hold) { hold_responses_ = hold; }
  void release_held();
  void set_deny_writes(bool deny) { deny_writes_ = deny; }
  void set_partial_commits(bool partial) { partial_commits_ = partial; }

  // --- counters ---
  std::size_t frames_received() const { return frames_received_; }
  std::size_t queries_served() const { return queries_served_; }
  std::size_t subscriptions_served() const { return subscriptions_served_; }
  std::size_t transactions_served() const { return transactions_served_; }
  std::size_t hellos() const { return hellos_; }
  std::size_t acks() const { return acks_; }
  std::size_t connections_opened() const { return connections_opened_; }
  std::size_t open_connections() const { return connections_.size(); }
  const std::vector<std::string>& commands() const { return commands_; }

 private:
  struct Connection {
    std::deque<std::string> inbox;
    std::deque<std::string> held;
    std::set<std::string> subscriptions;  // address keys
    uint64_t epoch{0};
  };

  void respond(ConnectionId id, const std::string& frame);
  jsonlite::Value answer_query(ConnectionId id, const protocol::Invocation& inv, bool subscribe,
                               std::optional<Error>& error);
  Result<Commit> apply_transaction(const std::string& space, const jsonlite::Object& args,
                                   std::vector<Revision>& changed);
  Commit commit(const std::string& space, std::vector<Revision> writes,
                std::vector<Revision>& changed);
  void publish(const std::string& space, const std::vector<Revision>& changed);
  static std::string expected_cause(const Revision* current, const Address& address);

  std::map<ConnectionId, Connection> connections_;
  std::map<std::string, RevisionMap> spaces_;
  int64_t since_{0};
  ConnectionId next_connection_{1};

  bool hang_handshake_{false};
  bool refuse_connections_{false};
  bool hold_responses_{false};
  bool deny_writes_{false};
  bool partial_commits_{false};

  std::size_t frames_received_{0};
  std::size_t queries_served_{0};
  std::size_t subscriptions_served_{0};
  std::size_t transactions_served_{0};
  std::size_t hellos_{0};
  std::size_t acks_{0};
  std::size_t connections_opened_{0};
  std::vector<std::string> commands_;
};

// ---------------------------------------------------------------------------
// LoopbackTransport — ITransport over a MemoryRemote
// ---------------------------------------------------------------------------
class LoopbackTransport final : public ITransport {
 public:
  explicit LoopbackTransport(MemoryRemote& remote) : remote_(remote) {}
  ~LoopbackTransport() override;

  bool open() override;
  bool send(const std::string& frame) override;
  void close() override;
  std::vector<TransportEvent> poll(int timeout_ms) override;
  std::string endpoint() const override { return "loopback"; }

 private:
  MemoryRemote& remote_;
  MemoryRemote::ConnectionId connection_{0};
  bool open_{false};
  bool refused_{false};
};

}  // namespace strata
