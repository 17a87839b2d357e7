#pragma once

// strata/config.hpp — Engine settings.
//
// Sources, later overriding earlier:
//   1. compiled defaults below
//   2. a JSON document (settings_from_json), e.g. the CLI's --config file
//   3. STRATA_* environment variables (apply_env)
//
// Variables:
//   STRATA_CLIENT_ID                  issuer / clientId in every invocation
//   STRATA_CONNECT_TIMEOUT_MS         watchdog window for connection establishment
//   STRATA_RECONNECT_DELAY_MS         pause between reconnect attempts
//   STRATA_MAX_RECONNECT_ATTEMPTS     consecutive failures before pending work fails
//   STRATA_SYNC_DEBOUNCE_MS           background pull coalescing window
//   STRATA_MAX_SUBSCRIPTIONS          per-space subscription cap
//   STRATA_MAX_HEAP_ENTRIES           LRU bound for the heap (0 = unbounded)
//   STRATA_CACHE_ROOT                 durable cache directory (empty = no cache)
//   STRATA_CACHE_COMPRESSION          "off" | "zstd"
//   STRATA_DEFAULT_THE                attribute kind used by Registry::sink/send

#include <cstdint>
#include <string>

#include "strata/types.hpp"

namespace strata {

struct Settings {
  std::string client_id;
  uint64_t connect_timeout_ms{30000};
  uint64_t reconnect_delay_ms{250};
  uint32_t max_reconnect_attempts{100};
  uint64_t sync_debounce_ms{1000};
  uint32_t max_subscriptions_per_space{50000};
  uint64_t max_heap_entries{0};
  std::string cache_root;
  std::string cache_compression{"off"};
  std::string default_the{"application/json"};

  std::string to_json() const;
};

// Default client id "c-<pid>" when none is configured.
std::string default_client_id();

Settings default_settings();
Result<Settings> settings_from_json(const std::string& text, Settings base = default_settings());
Result<Settings> apply_env(Settings base);
Result<Settings> settings_from_env();

}  // namespace strata
