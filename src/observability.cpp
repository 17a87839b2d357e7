#include "strata/observability.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include "strata/jsonlite.hpp"

namespace strata {

namespace {

std::atomic<int> g_threshold{-1};

int threshold_from_env() {
  const char* e = std::getenv("STRATA_LOG_LEVEL");
  if (!e || !e[0]) return static_cast<int>(LogLevel::warn);
  return static_cast<int>(log_level_from_string(e, LogLevel::warn));
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

LogLevel log_level_from_string(const std::string& s, LogLevel def) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return def;
}

LogLevel log_threshold() {
  int t = g_threshold.load(std::memory_order_relaxed);
  if (t < 0) {
    t = threshold_from_env();
    g_threshold.store(t, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(t);
}

void set_log_threshold(LogLevel level) {
  g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

void log(LogLevel level, std::string_view component, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(log_threshold())) return;
  std::cerr << "[" << component << "] " << message << "\n";
}

uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string ReplicaEvent::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"kind\":\"" << jsonlite::escape(kind) << "\""
    << ",\"space\":\"" << jsonlite::escape(space) << "\""
    << ",\"timestamp_unix_ms\":" << timestamp_unix_ms
    << ",\"count\":" << count
    << ",\"error_code\":\"" << jsonlite::escape(error_code) << "\""
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\""
    << "}";
  return o.str();
}

void emit_event(const ReplicaEvent& ev) {
  const char* path = std::getenv("STRATA_EVENT_LOG");
  if (!path || !path[0]) return;

  std::ofstream ofs(path, std::ios::app);
  if (!ofs) return;
  ReplicaEvent stamped = ev;
  if (stamped.timestamp_unix_ms == 0) stamped.timestamp_unix_ms = now_unix_ms();
  ofs << stamped.to_json() << "\n";
}

std::string ReplicaStats::to_json() const {
  auto rd = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };
  std::ostringstream o;
  o << "{"
    << "\"loads\":" << rd(loads)
    << ",\"loads_from_heap\":" << rd(loads_from_heap)
    << ",\"cache_hits\":" << rd(cache_hits)
    << ",\"cache_misses\":" << rd(cache_misses)
    << ",\"cache_errors\":" << rd(cache_errors)
    << ",\"remote_fetches\":" << rd(remote_fetches)
    << ",\"unclaimed_recorded\":" << rd(unclaimed_recorded)
    << ",\"background_syncs\":" << rd(background_syncs)
    << ",\"pushes\":" << rd(pushes)
    << ",\"commits\":" << rd(commits)
    << ",\"conflicts\":" << rd(conflicts)
    << ",\"push_failures\":" << rd(push_failures)
    << ",\"rejected_writes\":" << rd(rejected_writes)
    << ",\"deliveries\":" << rd(deliveries)
    << ",\"notifications\":" << rd(notifications)
    << ",\"evictions\":" << rd(evictions)
    << "}";
  return o.str();
}

std::string SessionStats::to_json() const {
  auto rd = [](const std::atomic<uint64_t>& a) { return a.load(std::memory_order_relaxed); };
  std::ostringstream o;
  o << "{"
    << "\"connection_attempts\":" << rd(connection_attempts)
    << ",\"reconnects\":" << rd(reconnects)
    << ",\"timeouts\":" << rd(timeouts)
    << ",\"disconnects\":" << rd(disconnects)
    << ",\"frames_sent\":" << rd(frames_sent)
    << ",\"frames_received\":" << rd(frames_received)
    << ",\"protocol_errors\":" << rd(protocol_errors)
    << ",\"coalesced_invocations\":" << rd(coalesced_invocations)
    << "}";
  return o.str();
}

}  // namespace strata
