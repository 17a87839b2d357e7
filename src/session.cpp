#include "strata/session.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace strata {

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::disconnected: return "disconnected";
    case SessionState::connecting: return "connecting";
    case SessionState::open: return "open";
    case SessionState::closing: return "closing";
    case SessionState::error: return "error";
  }
  return "disconnected";
}

uint64_t steady_now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

Session::Session(std::unique_ptr<ITransport> transport, Settings settings, Clock clock)
    : transport_(std::move(transport)),
      settings_(std::move(settings)),
      clock_(std::move(clock)),
      // Nonces only need to differ across restarts of the same client id.
      next_nonce_(now_unix_ms() << 16) {
  if (settings_.client_id.empty()) settings_.client_id = default_client_id();
}

Session::~Session() {
  // Callbacks are dropped, not failed: their owners may already be gone.
  if (transport_) transport_->close();
}

void Session::emit(const std::string& kind, const std::string& detail,
                   const std::string& error_code) {
  ReplicaEvent ev;
  ev.kind = kind;
  ev.space = transport_->endpoint();
  ev.count = pending_.size();
  ev.error_code = error_code;
  ev.detail = detail;
  emit_event(ev);
}

void Session::connect() {
  if (state_ == SessionState::connecting || state_ == SessionState::open) return;
  auto_reconnect_ = true;
  halted_ = false;
  failures_ = 0;
  reconnect_at_ = 0;
  begin_attempt();
}

void Session::begin_attempt() {
  state_ = SessionState::connecting;
  stats_.connection_attempts.fetch_add(1, std::memory_order_relaxed);
  deadline_ = now() + settings_.connect_timeout_ms;
  log(LogLevel::debug, "session", "connecting to " + transport_->endpoint());
  if (!transport_->open()) {
    on_lost("open failed");
  }
}

void Session::close() {
  if (state_ == SessionState::disconnected && halted_ && pending_.empty()) return;
  state_ = SessionState::closing;
  auto_reconnect_ = false;
  reconnect_at_ = 0;
  deadline_ = 0;
  transport_->close();
  outbox_.clear();
  halted_ = true;
  state_ = SessionState::disconnected;
  emit("close", "closed by caller");
  fail_pending(make_error(ErrorCode::connection_error, "session closed"), true);
}

void Session::mount(const std::string& space, SessionMount hooks) {
  mounts_[space] = std::move(hooks);
  if (state_ == SessionState::open && mounts_[space].since) {
    protocol::Invocation hello{client_id(), protocol::kHello, space,
                               protocol::hello_args(client_id(), mounts_[space].since()),
                               next_nonce_++};
    transmit(protocol::encode_frame(hello));
  }
}

void Session::unmount(const std::string& space) {
  mounts_.erase(space);
}

std::string Session::invoke(const std::string& subject, const std::string& command,
                            jsonlite::Object args, ResponseCallback callback,
                            bool persistent, bool unique) {
  protocol::Invocation inv{client_id(), command, subject, std::move(args),
                           unique ? next_nonce_++ : 0};
  const std::string ref = protocol::invocation_ref(inv);

  auto existing = pending_.find(ref);
  if (existing != pending_.end()) {
    // Identical invocation in flight: share its response.
    stats_.coalesced_invocations.fetch_add(1, std::memory_order_relaxed);
    if (callback) existing->second.callbacks.push_back(std::move(callback));
    return ref;
  }

  if (halted_ && !persistent) {
    if (callback) {
      callback(make_error(ErrorCode::connection_error,
                          "session is not connected: " + last_error_));
    }
    return ref;
  }

  Pending p;
  p.seq = next_seq_++;
  p.frame = protocol::encode_frame(inv);
  p.persistent = persistent;
  if (callback) p.callbacks.push_back(std::move(callback));
  const uint64_t seq = p.seq;
  const std::string frame = p.frame;
  pending_.emplace(ref, std::move(p));
  dispatch(seq, frame, ref);
  return ref;
}

void Session::cancel(const std::string& ref) {
  auto it = pending_.find(ref);
  if (it == pending_.end()) return;
  outbox_.erase(it->second.seq);
  pending_.erase(it);
}

void Session::notify(const std::string& subject, const std::string& command,
                     jsonlite::Object args, bool buffer) {
  protocol::Invocation inv{client_id(), command, subject, std::move(args), next_nonce_++};
  const std::string frame = protocol::encode_frame(inv);
  if (state_ == SessionState::open && transmit(frame)) return;
  if (buffer) outbox_[next_seq_++] = Outbound{frame, ""};
}

void Session::dispatch(uint64_t seq, const std::string& frame, const std::string& ref) {
  if (state_ == SessionState::open && outbox_.empty() && transmit(frame)) {
    auto it = pending_.find(ref);
    if (it != pending_.end()) it->second.sent = true;
    return;
  }
  outbox_[seq] = Outbound{frame, ref};
  if (state_ == SessionState::open) flush();
}

bool Session::transmit(const std::string& frame) {
  if (!transport_->send(frame)) return false;
  stats_.frames_sent.fetch_add(1, std::memory_order_relaxed);
  log(LogLevel::debug, "session", "-> " + frame);
  return true;
}

void Session::flush() {
  while (!outbox_.empty() && state_ == SessionState::open) {
    auto it = outbox_.begin();
    if (!transmit(it->second.frame)) return;
    if (!it->second.ref.empty()) {
      auto p = pending_.find(it->second.ref);
      if (p != pending_.end()) p->second.sent = true;
    }
    outbox_.erase(it);
  }
}

void Session::on_open() {
  state_ = SessionState::open;
  deadline_ = 0;
  failures_ = 0;
  last_error_.clear();
  log(LogLevel::info, "session", "connected to " + transport_->endpoint());
  emit("connect", transport_->endpoint());

  // Backfill handshake per mounted space, ahead of anything buffered.
  for (const auto& [space, hooks] : mounts_) {
    const int64_t since = hooks.since ? hooks.since() : kUnclaimedSince;
    protocol::Invocation hello{client_id(), protocol::kHello, space,
                               protocol::hello_args(client_id(), since), next_nonce_++};
    transmit(protocol::encode_frame(hello));
  }
  flush();

  // Hooks may invoke, which can touch mounts_.
  std::vector<std::function<void()>> opened;
  for (const auto& [space, hooks] : mounts_) {
    if (hooks.on_open) opened.push_back(hooks.on_open);
  }
  for (const auto& hook : opened) hook();
}

void Session::on_lost(const std::string& reason) {
  if (state_ == SessionState::disconnected || state_ == SessionState::closing) return;
  const bool was_open = state_ == SessionState::open;
  transport_->close();
  deadline_ = 0;
  last_error_ = reason;
  if (was_open) stats_.disconnects.fetch_add(1, std::memory_order_relaxed);

  // Everything that was on the wire goes back in line at its original place.
  size_t requeued = 0;
  for (auto& [ref, p] : pending_) {
    if (!p.sent) continue;
    outbox_[p.seq] = Outbound{p.frame, ref};
    p.sent = false;
    ++requeued;
  }

  state_ = SessionState::error;
  log(LogLevel::warn, "session",
      "connection lost (" + reason + "), " + std::to_string(requeued) + " invocation(s) requeued");
  emit("disconnect", reason, to_string(ErrorCode::connection_error));
  state_ = SessionState::disconnected;

  if (!auto_reconnect_) return;
  ++failures_;
  if (failures_ >= settings_.max_reconnect_attempts) {
    auto_reconnect_ = false;
    halted_ = true;
    reconnect_at_ = 0;
    log(LogLevel::error, "session",
        "giving up after " + std::to_string(failures_) + " failed attempt(s)");
    emit("halt", reason, to_string(ErrorCode::connection_error));
    fail_pending(make_error(ErrorCode::connection_error,
                            "connection unavailable after " + std::to_string(failures_) +
                                " attempt(s): " + reason),
                 false);
    return;
  }
  reconnect_at_ = now() + settings_.reconnect_delay_ms;
}

void Session::fail_pending(const Error& error, bool include_persistent) {
  std::vector<ResponseCallback> callbacks;
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (it->second.persistent && !include_persistent) {
      ++it;
      continue;
    }
    outbox_.erase(it->second.seq);
    for (auto& cb : it->second.callbacks) callbacks.push_back(std::move(cb));
    it = pending_.erase(it);
  }
  for (auto& cb : callbacks) cb(error);
}

void Session::on_frame(const std::string& line) {
  log(LogLevel::debug, "session", "<- " + line);
  auto inbound = protocol::decode_frame(line);
  if (!inbound) {
    stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed);
    log(LogLevel::warn, "session", "dropping frame: " + inbound.error().message);
    return;
  }

  if (auto* tr = std::get_if<protocol::TaskReturn>(&inbound.value())) {
    auto it = pending_.find(tr->job);
    if (it == pending_.end()) {
      log(LogLevel::debug, "session", "response for unknown " + tr->job);
      return;
    }
    std::vector<ResponseCallback> callbacks;
    if (it->second.persistent) {
      callbacks = it->second.callbacks;
    } else {
      callbacks = std::move(it->second.callbacks);
      outbox_.erase(it->second.seq);
      pending_.erase(it);
    }
    for (auto& cb : callbacks) {
      if (tr->ok) cb(Result<jsonlite::Value>(*tr->ok));
      else cb(Result<jsonlite::Value>(*tr->error));
    }
    return;
  }

  const auto& deliver = std::get<protocol::Deliver>(inbound.value());
  notify(deliver.stream_id, protocol::kAck,
         protocol::ack_args(deliver.stream_id, deliver.epoch), false);
  auto mount = mounts_.find(deliver.stream_id);
  if (mount == mounts_.end() || !mount->second.on_deliver) {
    log(LogLevel::debug, "session", "deliver for unmounted stream " + deliver.stream_id);
    return;
  }
  auto handler = mount->second.on_deliver;
  handler(deliver);
}

std::size_t Session::poll(int timeout_ms) {
  std::vector<TransportEvent> events;
  if (state_ == SessionState::connecting || state_ == SessionState::open) {
    events = transport_->poll(timeout_ms);
  } else if (timeout_ms > 0) {
    uint64_t wait = static_cast<uint64_t>(timeout_ms);
    if (reconnect_at_ != 0) {
      const uint64_t t = now();
      wait = reconnect_at_ > t ? std::min(wait, reconnect_at_ - t) : 0;
    }
    if (wait > 0) std::this_thread::sleep_for(std::chrono::milliseconds(wait));
  }

  for (const auto& ev : events) {
    switch (ev.kind) {
      case TransportEventKind::opened:
        if (state_ == SessionState::connecting) on_open();
        break;
      case TransportEventKind::message:
        stats_.frames_received.fetch_add(1, std::memory_order_relaxed);
        if (state_ == SessionState::open) on_frame(ev.data);
        break;
      case TransportEventKind::closed:
      case TransportEventKind::error:
        on_lost(ev.data.empty() ? "transport closed" : ev.data);
        break;
    }
  }
  tick(now());
  return events.size();
}

void Session::tick(uint64_t now) {
  if (state_ == SessionState::connecting && deadline_ != 0 && now >= deadline_) {
    stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
    log(LogLevel::warn, "session",
        "no handshake within " + std::to_string(settings_.connect_timeout_ms) + "ms");
    emit("timeout", transport_->endpoint(), to_string(ErrorCode::connection_error));
    on_lost("connect timeout");
  }

  if (state_ == SessionState::disconnected && auto_reconnect_ && reconnect_at_ != 0 &&
      now >= reconnect_at_) {
    reconnect_at_ = 0;
    stats_.reconnects.fetch_add(1, std::memory_order_relaxed);
    begin_attempt();
  }

  std::vector<std::function<void(uint64_t)>> ticks;
  for (const auto& [space, hooks] : mounts_) {
    if (hooks.on_tick) ticks.push_back(hooks.on_tick);
  }
  for (const auto& t : ticks) t(now);
}

}  // namespace strata
