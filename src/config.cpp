#include "strata/config.hpp"

#include <cstdlib>
#include <sstream>
#include <unistd.h>  // getpid

#include "strata/jsonlite.hpp"

namespace strata {

namespace {

bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty()) return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    const uint64_t next = v * 10 + static_cast<uint64_t>(c - '0');
    if (next < v) return false;
    v = next;
  }
  out = v;
  return true;
}

Error invalid(const std::string& what) {
  return make_error(ErrorCode::config_invalid, what);
}

Result<Unit> check(const Settings& s) {
  if (s.connect_timeout_ms == 0) return invalid("connect_timeout_ms must be > 0");
  if (s.max_reconnect_attempts == 0) return invalid("max_reconnect_attempts must be > 0");
  if (s.cache_compression != "off" && s.cache_compression != "zstd") {
    return invalid("cache_compression must be off or zstd");
  }
  if (s.default_the.empty()) return invalid("default_the must not be empty");
  return Unit{};
}

}  // namespace

std::string default_client_id() {
  return "c-" + std::to_string(static_cast<long>(::getpid()));
}

Settings default_settings() {
  Settings s;
  s.client_id = default_client_id();
  return s;
}

std::string Settings::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"client_id\":\"" << jsonlite::escape(client_id) << "\""
    << ",\"connect_timeout_ms\":" << connect_timeout_ms
    << ",\"reconnect_delay_ms\":" << reconnect_delay_ms
    << ",\"max_reconnect_attempts\":" << max_reconnect_attempts
    << ",\"sync_debounce_ms\":" << sync_debounce_ms
    << ",\"max_subscriptions_per_space\":" << max_subscriptions_per_space
    << ",\"max_heap_entries\":" << max_heap_entries
    << ",\"cache_root\":\"" << jsonlite::escape(cache_root) << "\""
    << ",\"cache_compression\":\"" << jsonlite::escape(cache_compression) << "\""
    << ",\"default_the\":\"" << jsonlite::escape(default_the) << "\""
    << "}";
  return o.str();
}

Result<Settings> settings_from_json(const std::string& text, Settings base) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(text, &err);
  if (err) return invalid("settings: " + err->message);

  Settings s = std::move(base);
  auto u64_field = [&](const char* key, uint64_t& slot) -> bool {
    const auto* v = jsonlite::find(obj, key);
    if (!v) return true;
    if (!std::holds_alternative<std::uint64_t>(v->v)) return false;
    slot = std::get<std::uint64_t>(v->v);
    return true;
  };

  uint64_t attempts = s.max_reconnect_attempts;
  uint64_t subs = s.max_subscriptions_per_space;
  if (!u64_field("connect_timeout_ms", s.connect_timeout_ms) ||
      !u64_field("reconnect_delay_ms", s.reconnect_delay_ms) ||
      !u64_field("max_reconnect_attempts", attempts) ||
      !u64_field("sync_debounce_ms", s.sync_debounce_ms) ||
      !u64_field("max_subscriptions_per_space", subs) ||
      !u64_field("max_heap_entries", s.max_heap_entries)) {
    return invalid("settings: numeric field has the wrong type");
  }
  s.max_reconnect_attempts = static_cast<uint32_t>(attempts);
  s.max_subscriptions_per_space = static_cast<uint32_t>(subs);
  s.client_id = jsonlite::get_string(obj, "client_id", s.client_id);
  s.cache_root = jsonlite::get_string(obj, "cache_root", s.cache_root);
  s.cache_compression = jsonlite::get_string(obj, "cache_compression", s.cache_compression);
  s.default_the = jsonlite::get_string(obj, "default_the", s.default_the);

  auto ok = check(s);
  if (!ok) return ok.error();
  return s;
}

Result<Settings> apply_env(Settings base) {
  Settings s = std::move(base);

  auto str_env = [](const char* name, std::string& slot) {
    const char* e = std::getenv(name);
    if (e && e[0]) slot = e;
  };
  auto num_env = [](const char* name, uint64_t& slot) -> bool {
    const char* e = std::getenv(name);
    if (!e || !e[0]) return true;
    return parse_u64(e, slot);
  };

  str_env("STRATA_CLIENT_ID", s.client_id);
  str_env("STRATA_CACHE_ROOT", s.cache_root);
  str_env("STRATA_CACHE_COMPRESSION", s.cache_compression);
  str_env("STRATA_DEFAULT_THE", s.default_the);

  uint64_t attempts = s.max_reconnect_attempts;
  uint64_t subs = s.max_subscriptions_per_space;
  if (!num_env("STRATA_CONNECT_TIMEOUT_MS", s.connect_timeout_ms)) return invalid("STRATA_CONNECT_TIMEOUT_MS is not a number");
  if (!num_env("STRATA_RECONNECT_DELAY_MS", s.reconnect_delay_ms)) return invalid("STRATA_RECONNECT_DELAY_MS is not a number");
  if (!num_env("STRATA_MAX_RECONNECT_ATTEMPTS", attempts)) return invalid("STRATA_MAX_RECONNECT_ATTEMPTS is not a number");
  if (!num_env("STRATA_SYNC_DEBOUNCE_MS", s.sync_debounce_ms)) return invalid("STRATA_SYNC_DEBOUNCE_MS is not a number");
  if (!num_env("STRATA_MAX_SUBSCRIPTIONS", subs)) return invalid("STRATA_MAX_SUBSCRIPTIONS is not a number");
  if (!num_env("STRATA_MAX_HEAP_ENTRIES", s.max_heap_entries)) return invalid("STRATA_MAX_HEAP_ENTRIES is not a number");
  s.max_reconnect_attempts = static_cast<uint32_t>(attempts);
  s.max_subscriptions_per_space = static_cast<uint32_t>(subs);

  auto ok = check(s);
  if (!ok) return ok.error();
  return s;
}

Result<Settings> settings_from_env() {
  return apply_env(default_settings());
}

}  // namespace strata
