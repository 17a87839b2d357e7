#pragma once

// strata/session.hpp — Connection state machine and invocation correlation.
//
// STATES:
//   disconnected -> connecting -> open -> (closing | error) -> disconnected
//
// SINGLE SOURCE OF TRUTH:
//   pending_ maps every unresolved invocation reference to its frame, its
//   issue sequence number and its waiting callbacks. Reconnect, timeout,
//   close and response routing all work off this one map. outbox_ orders
//   frames that still have to be written by sequence number.
//
// ORDERING:
//   - Every outbound command takes the next sequence number when issued.
//   - While not open, frames wait in outbox_. On open, hello goes first for
//     each mounted space, then outbox_ drains in sequence order.
//   - On connection loss every sent-but-unresolved invocation returns to
//     outbox_ at its original sequence number and is re-issued after the next
//     hello. Nothing is deduplicated; the remote is expected to be idempotent.
//
// TIMING:
//   connect_timeout_ms bounds connecting -> open. After max_reconnect_attempts
//   consecutive failed attempts the session halts and fails every pending
//   one-shot invocation with connection_error. Persistent invocations
//   (subscriptions) stay registered for the next connect().
//
// THREADING:
//   One owner thread calls poll()/tick(). Callbacks run on that thread,
//   inside poll() or directly inside invoke() when the session is halted.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "strata/config.hpp"
#include "strata/jsonlite.hpp"
#include "strata/observability.hpp"
#include "strata/protocol.hpp"
#include "strata/transport.hpp"
#include "strata/types.hpp"

namespace strata {

enum class SessionState { disconnected, connecting, open, closing, error };

std::string to_string(SessionState state);

// Milliseconds from an arbitrary monotonic origin.
using Clock = std::function<uint64_t()>;
uint64_t steady_now_ms();

// Per-space hooks a replica registers with the session.
struct SessionMount {
  std::function<int64_t()> since;                               // for hello
  std::function<void(const protocol::Deliver&)> on_deliver;     // live pushes
  std::function<void(uint64_t)> on_tick;                        // timers
  std::function<void()> on_open;                                // after hello and flush
};

class Session {
 public:
  using ResponseCallback = std::function<void(Result<jsonlite::Value>)>;

  Session(std::unique_ptr<ITransport> transport, Settings settings,
          Clock clock = steady_now_ms);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  void connect();
  void close();

  SessionState state() const { return state_; }
  bool halted() const { return halted_; }

  // Issues an invocation and returns its reference. An identical one-shot
  // invocation already pending absorbs the callback instead of being sent
  // again. unique adds a nonce so the invocation never coalesces.
  std::string invoke(const std::string& subject, const std::string& command,
                     jsonlite::Object args, ResponseCallback callback,
                     bool persistent = false, bool unique = false);

  // Drops a pending invocation without calling its callbacks.
  void cancel(const std::string& ref);

  // Fire-and-forget command. When buffer is false the frame is dropped
  // unless the connection is open.
  void notify(const std::string& subject, const std::string& command,
              jsonlite::Object args, bool buffer = true);

  // Reads transport events, processes frames, runs timers. Returns the number
  // of transport events handled.
  std::size_t poll(int timeout_ms);
  void tick(uint64_t now);
  uint64_t now() const { return clock_(); }

  void mount(const std::string& space, SessionMount hooks);
  void unmount(const std::string& space);

  const std::string& client_id() const { return settings_.client_id; }
  const Settings& settings() const { return settings_; }
  std::size_t pending_count() const { return pending_.size(); }
  bool pending(const std::string& ref) const { return pending_.contains(ref); }
  std::size_t outbox_size() const { return outbox_.size(); }
  uint32_t consecutive_failures() const { return failures_; }
  const std::string& last_error() const { return last_error_; }
  const SessionStats& stats() const { return stats_; }
  ITransport& transport() { return *transport_; }

 private:
  struct Pending {
    uint64_t seq{0};
    std::string frame;
    std::vector<ResponseCallback> callbacks;
    bool persistent{false};
    bool sent{false};
  };

  struct Outbound {
    std::string frame;
    std::string ref;  // empty for fire-and-forget frames
  };

  void begin_attempt();
  void on_open();
  void on_frame(const std::string& line);
  void on_lost(const std::string& reason);
  void dispatch(uint64_t seq, const std::string& frame, const std::string& ref);
  bool transmit(const std::string& frame);
  void flush();
  void fail_pending(const Error& error, bool include_persistent);
  void emit(const std::string& kind, const std::string& detail,
            const std::string& error_code = "");

  std::unique_ptr<ITransport> transport_;
  Settings settings_;
  Clock clock_;
  SessionState state_{SessionState::disconnected};

  std::map<std::string, Pending> pending_;
  std::map<uint64_t, Outbound> outbox_;
  std::map<std::string, SessionMount> mounts_;

  uint64_t next_seq_{1};
  uint64_t next_nonce_{1};
  uint64_t deadline_{0};      // watchdog, 0 = disarmed
  uint64_t reconnect_at_{0};  // 0 = none scheduled
  uint32_t failures_{0};
  bool auto_reconnect_{false};
  bool halted_{false};
  std::string last_error_;
  SessionStats stats_;
};

}  // namespace strata
