#pragma once

// strata/observability.hpp — Logging, the replica event stream and counters.
//
// DESIGN:
//   - log() writes "[component] message" lines to stderr, filtered by
//     STRATA_LOG_LEVEL (debug|info|warn|error, default warn).
//   - emit_event() appends one JSON object per line to STRATA_EVENT_LOG when
//     set. This is the inspector channel: connection changes, frames, load,
//     pull and push outcomes. Emission never fails an operation.
//   - ReplicaStats / SessionStats are relaxed atomics so a monitoring thread
//     can read them while the owner thread drives the engine.

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace strata {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s, LogLevel def);

LogLevel log_threshold();
void set_log_threshold(LogLevel level);

void log(LogLevel level, std::string_view component, const std::string& message);

uint64_t now_unix_ms();

// ---------------------------------------------------------------------------
// ReplicaEvent — one line of the event stream
// ---------------------------------------------------------------------------
struct ReplicaEvent {
  std::string kind;        // "connect", "timeout", "load", "pull", "push", ...
  std::string space;
  uint64_t timestamp_unix_ms{0};
  uint64_t count{0};       // addresses / frames involved
  std::string error_code;  // empty on success
  std::string detail;

  std::string to_json() const;
};

void emit_event(const ReplicaEvent& ev);

// ---------------------------------------------------------------------------
// ReplicaStats — per-replica counters
// ---------------------------------------------------------------------------
struct ReplicaStats {
  std::atomic<uint64_t> loads{0};
  std::atomic<uint64_t> loads_from_heap{0};
  std::atomic<uint64_t> cache_hits{0};
  std::atomic<uint64_t> cache_misses{0};
  std::atomic<uint64_t> cache_errors{0};
  std::atomic<uint64_t> remote_fetches{0};
  std::atomic<uint64_t> unclaimed_recorded{0};
  std::atomic<uint64_t> background_syncs{0};
  std::atomic<uint64_t> pushes{0};
  std::atomic<uint64_t> commits{0};
  std::atomic<uint64_t> conflicts{0};
  std::atomic<uint64_t> push_failures{0};
  std::atomic<uint64_t> rejected_writes{0};
  std::atomic<uint64_t> deliveries{0};
  std::atomic<uint64_t> notifications{0};
  std::atomic<uint64_t> evictions{0};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// SessionStats — per-connection-manager counters
// ---------------------------------------------------------------------------
struct SessionStats {
  std::atomic<uint64_t> connection_attempts{0};
  std::atomic<uint64_t> reconnects{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> disconnects{0};
  std::atomic<uint64_t> frames_sent{0};
  std::atomic<uint64_t> frames_received{0};
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> coalesced_invocations{0};

  std::string to_json() const;
};

}  // namespace strata
