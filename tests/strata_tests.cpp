#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "strata/cache.hpp"
#include "strata/config.hpp"
#include "strata/hash.hpp"
#include "strata/heap.hpp"
#include "strata/jsonlite.hpp"
#include "strata/nursery.hpp"
#include "strata/observability.hpp"
#include "strata/protocol.hpp"
#include "strata/pull_queue.hpp"
#include "strata/revision.hpp"
#include "strata/selector.hpp"
#include "strata/transport.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

const std::string kThe = "application/json";

strata::Revision asserted(const std::string& of, strata::jsonlite::Value value,
                          int64_t since, const strata::Revision* previous = nullptr) {
  const strata::Address address{kThe, of};
  auto built = strata::build_revision(previous, strata::Assert{address, std::move(value)});
  built->since = since;
  return *built;
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(strata::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(strata::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "{\"a\":1}";
  expect(strata::fact_hash(payload) != strata::invocation_hash(payload),
         "fact and job domains differ");
  expect(strata::schema_hash(payload) != strata::address_hash(payload),
         "schema and addr domains differ");
  expect(strata::fact_hash(payload) == strata::fact_hash(payload), "domain hash is deterministic");
  expect(strata::valid_digest(strata::fact_hash(payload)), "domain hash is a valid digest");
  expect(!strata::valid_digest("ABC"), "short digest rejected");
  expect(!strata::valid_digest(std::string(64, 'G')), "non-hex digest rejected");
}

// ============================================================================
// JSON
// ============================================================================

void test_json_canonical_key_order() {
  std::optional<strata::jsonlite::JsonError> err;
  auto obj = strata::jsonlite::parse("{\"b\":1,\"a\":[true,null,\"x\"]}", &err);
  expect(!err, "valid object parses");
  expect(strata::jsonlite::to_json(obj) == "{\"a\":[true,null,\"x\"],\"b\":1}",
         "keys serialize sorted");
}

void test_json_rejects_duplicates_and_depth() {
  std::optional<strata::jsonlite::JsonError> err;
  strata::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate key is an error");

  std::string deep;
  for (int i = 0; i < 300; ++i) deep += "[";
  for (int i = 0; i < 300; ++i) deep += "]";
  err.reset();
  strata::jsonlite::parse_value(deep, &err);
  expect(err.has_value(), "nesting beyond the depth limit is an error");
}

void test_json_integer_normalization() {
  std::optional<strata::jsonlite::JsonError> err;
  auto neg = strata::jsonlite::parse_value("-5", &err);
  expect(!err && std::holds_alternative<std::int64_t>(neg.v), "negative int stays signed");
  auto pos = strata::jsonlite::parse_value("7", &err);
  expect(std::holds_alternative<std::uint64_t>(pos.v), "non-negative int is unsigned");
  expect(strata::jsonlite::equal(pos, strata::jsonlite::Value{7}),
         "constructed and parsed ints compare equal");
}

// ============================================================================
// Revisions
// ============================================================================

void test_reference_excludes_since() {
  auto a = asserted("e1", strata::jsonlite::Value{1}, 1);
  auto b = a;
  b.since = 42;
  expect(strata::reference(a) == strata::reference(b), "since does not enter the reference");
  b.is = strata::jsonlite::Value{2};
  expect(strata::reference(a) != strata::reference(b), "value enters the reference");
}

void test_genesis_cause() {
  const strata::Address address{kThe, "e1"};
  auto first = strata::build_revision(nullptr, strata::Assert{address, strata::jsonlite::Value{1}});
  expect(first && first->cause == strata::genesis_reference(address),
         "first assertion names the genesis reference");

  const auto unclaimed = strata::unclaimed_revision(address);
  auto over_unclaimed =
      strata::build_revision(&unclaimed, strata::Assert{address, strata::jsonlite::Value{1}});
  expect(over_unclaimed->cause == strata::genesis_reference(address),
         "assertion over an unclaimed address names the genesis reference");
  expect(strata::validate_revision(*first).ok(), "genesis-caused assertion is valid");
}

void test_causal_chain() {
  auto v1 = asserted("e1", strata::jsonlite::Value{1}, 1);
  auto v2 = asserted("e1", strata::jsonlite::Value{2}, 2, &v1);
  expect(v2.cause == strata::reference(v1), "assertion chains on the current reference");

  auto retraction = strata::build_revision(&v2, strata::Retract{v2.address()});
  expect(retraction && retraction->retracted(), "retract produces a retraction");
  expect(retraction->cause == strata::reference(v2), "retraction chains on the current value");

  expect(!strata::build_revision(nullptr, strata::Retract{v2.address()}),
         "retracting nothing is a no-op");
  expect(!strata::build_revision(&*retraction, strata::Retract{v2.address()}),
         "retracting a retraction is a no-op");
}

void test_validate_revision() {
  strata::Revision r;
  r.the = kThe;
  r.of = "e1";
  r.is = strata::jsonlite::Value{1};
  auto no_cause = strata::validate_revision(r);
  expect(!no_cause && no_cause.error().code == strata::ErrorCode::invalid_revision,
         "assertion without cause is invalid");

  r.cause = strata::genesis_reference(r.address());
  r.of = "a/b";
  expect(!strata::validate_revision(r), "entity with '/' is invalid");
}

void test_reconcile_monotonic() {
  auto older = asserted("e1", strata::jsonlite::Value{1}, 1);
  auto newer = asserted("e1", strata::jsonlite::Value{2}, 2, &older);
  expect(strata::reconcile(&older, &newer) == &newer, "newer since wins");
  expect(strata::reconcile(&newer, &older) == &newer, "older since never replaces");
  auto tie = newer;
  expect(strata::reconcile(&newer, &tie) == &newer, "tie keeps what is held");
  expect(strata::reconcile(nullptr, &older) == &older, "anything beats nothing");
}

void test_archive_codec() {
  auto r = asserted("e1", strata::jsonlite::Value{"hello"}, 3);
  std::optional<strata::jsonlite::JsonError> err;
  auto decoded = strata::revision_from_archive(
      strata::jsonlite::parse_value(strata::revision_to_json(r), &err));
  expect(decoded.ok(), "archive decodes");
  expect(strata::reference(decoded.value()) == strata::reference(r), "archive keeps content");
  expect(decoded.value().since == 3, "archive keeps since");

  auto bad = strata::revision_from_archive(strata::jsonlite::Value{"nope"});
  expect(!bad && bad.error().code == strata::ErrorCode::protocol_error,
         "non-object archive is a protocol error");
}

void test_address_key() {
  auto a = strata::parse_address_key("e1/application/json");
  expect(a && a->of == "e1" && a->the == "application/json", "key splits at first slash");
  expect(!strata::parse_address_key("noslash"), "key without slash rejected");
}

// ============================================================================
// Heap / nursery / queue
// ============================================================================

void test_heap_batch_notifies_once() {
  strata::Heap heap;
  auto v1 = asserted("e1", strata::jsonlite::Value{1}, 1);
  auto v2 = asserted("e1", strata::jsonlite::Value{2}, 2, &v1);
  int calls = 0;
  int64_t seen_since = 0;
  heap.subscribe(v1.key(), [&](const strata::Revision* r) {
    ++calls;
    seen_since = r ? r->since : -100;
  });

  auto changed = heap.merge({v2, v1});
  expect(changed.size() == 1, "one key changed");
  expect(calls == 1, "one notification per changed key per batch");
  expect(seen_since == 2, "subscriber sees the final winner");

  changed = heap.merge({v2});
  expect(changed.empty() && calls == 1, "re-delivery is silent");
}

void test_heap_unsubscribe() {
  strata::Heap heap;
  int calls = 0;
  auto id = heap.subscribe("e1/" + kThe, [&](const strata::Revision*) { ++calls; });
  expect(heap.subscription_total() == 1, "subscription counted");
  expect(heap.unsubscribe("e1/" + kThe, id), "unsubscribe succeeds");
  expect(!heap.unsubscribe("e1/" + kThe, id), "second unsubscribe fails");
  heap.merge({asserted("e1", strata::jsonlite::Value{1}, 1)});
  expect(calls == 0, "no callback after unsubscribe");
}

void test_heap_eviction_respects_pins() {
  strata::Heap heap(2);
  heap.subscribe("a/" + kThe, [](const strata::Revision*) {});
  heap.merge({asserted("a", strata::jsonlite::Value{1}, 1)});
  heap.merge({asserted("b", strata::jsonlite::Value{1}, 2)});
  heap.merge({asserted("c", strata::jsonlite::Value{1}, 3)});
  heap.merge({asserted("d", strata::jsonlite::Value{1}, 4)});

  auto evicted = heap.evict([](const std::string& key) { return key == "d/" + kThe; });
  expect(heap.size() == 2, "heap trimmed to its bound");
  expect(heap.contains("a/" + kThe), "subscribed key survives");
  expect(heap.contains("d/" + kThe), "pinned key survives");
  expect(evicted.size() == 2, "two keys evicted");
}

void test_nursery_stacking() {
  strata::Nursery nursery;
  auto v1 = asserted("e1", strata::jsonlite::Value{1}, strata::kUnclaimedSince);
  auto v2 = asserted("e1", strata::jsonlite::Value{2}, strata::kUnclaimedSince, &v1);
  nursery.put(v1);
  nursery.put(v2);
  expect(!nursery.remove(v1), "an older staged write does not remove a newer one");
  expect(nursery.get(v2.key()) != nullptr, "newer staged write kept");
  expect(nursery.remove(v2), "own staged write removed");
  expect(nursery.size() == 0, "nursery empty");
}

void test_pull_queue_dedup() {
  strata::PullQueue queue;
  const strata::Address a{kThe, "a"};
  queue.add(strata::entries_for({a, a}));
  strata::SchemaContext ctx{strata::jsonlite::Value{"s"}, strata::jsonlite::Value{"r"}};
  queue.add({strata::LoadEntry{a, ctx}});
  expect(queue.size() == 2, "plain and schema variants are distinct");
  auto drained = queue.consume();
  expect(drained.size() == 2 && queue.empty(), "consume drains");
}

// ============================================================================
// Selectors
// ============================================================================

void test_selector_queries() {
  const strata::Address a{kThe, "a"};
  const strata::Address b{"text/plain", "b"};
  auto plain = strata::build_query(strata::entries_for({a, b}));
  expect(!strata::is_schema_query(plain), "plain entries build a select query");
  auto addresses = strata::query_addresses(plain);
  expect(addresses.size() == 2, "select names both addresses");

  strata::SchemaContext ctx{strata::jsonlite::Value{"s"}, strata::jsonlite::Value{"r"}};
  auto schema = strata::build_query({strata::LoadEntry{a, ctx}, strata::LoadEntry{b, std::nullopt}});
  expect(strata::is_schema_query(schema), "one schema entry switches to selectSchema");
  expect(strata::query_addresses(schema).size() == 2, "selectSchema names both addresses");

  strata::SchemaTracker tracker;
  tracker.add(a.key(), ctx.reference());
  expect(tracker.has(a.key(), ctx.reference()), "tracker remembers variant");
  strata::SchemaContext other{strata::jsonlite::Value{"t"}, strata::jsonlite::Value{"r"}};
  expect(!tracker.has(a.key(), other.reference()), "new variant is unknown");
  tracker.forget(a.key());
  expect(!tracker.has(a.key(), ctx.reference()), "forget drops variants");
}

// ============================================================================
// Protocol
// ============================================================================

void test_invocation_reference() {
  strata::protocol::Invocation inv{"c1", "get", "space", {}, 0};
  auto again = inv;
  expect(strata::protocol::invocation_ref(inv) == strata::protocol::invocation_ref(again),
         "identical invocations share a reference");
  again.nonce = 9;
  expect(strata::protocol::invocation_ref(inv) != strata::protocol::invocation_ref(again),
         "nonce separates invocations");
  expect(strata::protocol::invocation_ref(inv).rfind("job:", 0) == 0, "reference is job:");
}

void test_frame_roundtrip() {
  strata::protocol::Invocation inv{"c1", "tx", "space",
                                   strata::protocol::hello_args("c1", 4), 7};
  const std::string line = strata::protocol::encode_frame(inv);
  expect(line.find(strata::protocol::invocation_ref(inv)) != std::string::npos,
         "frame authorizes its own reference");
  auto decoded = strata::protocol::decode_invocation(line);
  expect(decoded.ok(), "frame decodes");
  expect(strata::protocol::invocation_ref(decoded.value()) == strata::protocol::invocation_ref(inv),
         "decoded invocation keeps its reference");
}

void test_decode_task_return() {
  const std::string job = "job:" + std::string(64, 'a');
  auto ok = strata::protocol::decode_frame(
      strata::protocol::encode_task_return(job, strata::jsonlite::Value{1}));
  expect(ok.ok(), "task return decodes");
  const auto& tr = std::get<strata::protocol::TaskReturn>(ok.value());
  expect(tr.job == job && tr.ok.has_value(), "ok payload kept");

  auto err = strata::protocol::decode_frame(strata::protocol::encode_task_error(
      job, strata::make_error(strata::ErrorCode::conflict_error, "stale", {"e1/" + kThe})));
  const auto& te = std::get<strata::protocol::TaskReturn>(err.value());
  expect(te.error && te.error->code == strata::ErrorCode::conflict_error,
         "ConflictError maps to conflict_error");
  expect(te.error->addresses.size() == 1, "conflicting refs kept");

  auto unknown = strata::protocol::decode_frame("{\"the\":\"mystery\"}");
  expect(!unknown && unknown.error().code == strata::ErrorCode::protocol_error,
         "unknown frame is a protocol error");
  auto garbage = strata::protocol::decode_frame("not json");
  expect(!garbage, "garbage is a protocol error");
}

void test_decode_deliver() {
  auto r = asserted("e1", strata::jsonlite::Value{1}, 5);
  strata::protocol::Deliver d;
  d.stream_id = "space";
  d.epoch = 3;
  d.docs.push_back({r.key(), "snapshot", r, 5});
  auto decoded = strata::protocol::decode_frame(strata::protocol::encode_deliver(d));
  expect(decoded.ok(), "deliver decodes");
  const auto& back = std::get<strata::protocol::Deliver>(decoded.value());
  expect(back.epoch == 3 && back.docs.size() == 1, "epoch and docs kept");
  expect(back.docs[0].revision.since == 5, "version becomes since");

  d.docs[0].doc_id = "other/" + kThe;
  auto mismatch = strata::protocol::decode_frame(strata::protocol::encode_deliver(d));
  expect(!mismatch && mismatch.error().code == strata::ErrorCode::protocol_error,
         "docId must match its body");
}

void test_decode_commit() {
  strata::Commit c;
  c.since = 4;
  c.rejected = {"e1/" + kThe};
  auto back = strata::protocol::decode_commit(strata::protocol::encode_commit(c));
  expect(back.ok() && back.value().since == 4, "commit since kept");
  expect(back.value().rejected.size() == 1, "rejected refs kept");

  auto missing = strata::protocol::decode_commit(strata::jsonlite::Object{});
  expect(!missing, "commit without since is a protocol error");
}

// ============================================================================
// Configuration
// ============================================================================

void test_settings_defaults() {
  const auto s = strata::default_settings();
  expect(s.connect_timeout_ms == 30000, "connect timeout default");
  expect(s.sync_debounce_ms == 1000, "debounce default");
  expect(s.max_reconnect_attempts == 100, "reconnect ceiling default");
  expect(s.max_subscriptions_per_space == 50000, "subscription cap default");
  expect(s.max_heap_entries == 0, "heap unbounded by default");
  expect(s.default_the == "application/json", "default attribute kind");
  expect(s.client_id.rfind("c-", 0) == 0, "client id derived from pid");
}

void test_settings_from_json() {
  auto s = strata::settings_from_json(
      "{\"connect_timeout_ms\":500,\"cache_compression\":\"zstd\",\"client_id\":\"me\"}");
  expect(s.ok(), "valid settings document accepted");
  expect(s.value().connect_timeout_ms == 500, "numeric override applied");
  expect(s.value().cache_compression == "zstd", "string override applied");
  expect(s.value().client_id == "me", "client id override applied");

  auto wrong_type = strata::settings_from_json("{\"sync_debounce_ms\":\"soon\"}");
  expect(!wrong_type && wrong_type.error().code == strata::ErrorCode::config_invalid,
         "wrong numeric type is config_invalid");
  auto bad_codec = strata::settings_from_json("{\"cache_compression\":\"lz4\"}");
  expect(!bad_codec, "unknown compression rejected");
  auto zero = strata::settings_from_json("{\"max_reconnect_attempts\":0}");
  expect(!zero, "zero reconnect ceiling rejected");
}

void test_settings_from_env() {
  ::setenv("STRATA_SYNC_DEBOUNCE_MS", "5", 1);
  ::setenv("STRATA_CLIENT_ID", "env-client", 1);
  auto s = strata::settings_from_env();
  expect(s.ok() && s.value().sync_debounce_ms == 5, "env numeric applied");
  expect(s.value().client_id == "env-client", "env string applied");

  ::setenv("STRATA_SYNC_DEBOUNCE_MS", "abc", 1);
  auto bad = strata::settings_from_env();
  expect(!bad && bad.error().code == strata::ErrorCode::config_invalid,
         "non-numeric env is config_invalid");
  ::unsetenv("STRATA_SYNC_DEBOUNCE_MS");
  ::unsetenv("STRATA_CLIENT_ID");
}

// ============================================================================
// Durable cache
// ============================================================================

fs::path fresh_dir(const std::string& name) {
  const fs::path tmp = fs::temp_directory_path() / name;
  fs::remove_all(tmp);
  return tmp;
}

void test_file_cache_persists() {
  const fs::path tmp = fresh_dir("strata_cache_persist_test");
  auto v1 = asserted("e1", strata::jsonlite::Value{1}, 1);
  {
    strata::FileRevisionCache cache(tmp.string());
    expect(cache.merge({v1}, strata::reconcile).ok(), "merge succeeds");
  }
  strata::FileRevisionCache reopened(tmp.string());
  auto pulled = reopened.pull({v1.address(), strata::Address{kThe, "missing"}});
  expect(pulled.ok(), "pull succeeds");
  expect(pulled.value().size() == 1, "only the stored address is returned");
  expect(strata::reference(pulled.value().at(v1.key())) == strata::reference(v1),
         "stored revision survives a new instance");
  fs::remove_all(tmp);
}

void test_file_cache_zstd() {
  const fs::path tmp = fresh_dir("strata_cache_zstd_test");
  strata::FileRevisionCache cache(tmp.string(), "zstd");
  auto big = asserted("e1", strata::jsonlite::Value{std::string(8192, 'z')}, 1);
  expect(cache.merge({big}, strata::reconcile).ok(), "compressed merge succeeds");
  auto entries = cache.scan();
  expect(entries.size() == 1 && entries[0].encoding == "zstd", "entry stored compressed");
  expect(entries[0].stored_size < entries[0].original_size, "compression shrinks the entry");
  auto back = cache.read(big.address());
  expect(back && strata::reference(*back) == strata::reference(big), "compressed entry reads back");
  fs::remove_all(tmp);
}

void test_file_cache_keeps_newer() {
  const fs::path tmp = fresh_dir("strata_cache_newer_test");
  strata::FileRevisionCache cache(tmp.string());
  auto v1 = asserted("e1", strata::jsonlite::Value{1}, 1);
  auto v2 = asserted("e1", strata::jsonlite::Value{2}, 2, &v1);
  cache.merge({v2}, strata::reconcile);
  cache.merge({v1}, strata::reconcile);
  auto back = cache.read(v1.address());
  expect(back && back->since == 2, "older revision does not overwrite newer");
  fs::remove_all(tmp);
}

void test_file_cache_corruption_is_miss() {
  const fs::path tmp = fresh_dir("strata_cache_corrupt_test");
  strata::FileRevisionCache cache(tmp.string());
  auto v1 = asserted("e1", strata::jsonlite::Value{"payload"}, 1);
  cache.merge({v1}, strata::reconcile);
  {
    std::fstream file(cache.revision_path(v1.address()),
                      std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open revision file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0xFF;
    file.seekp(0);
    file.write(&byte, 1);
  }
  expect(!cache.read(v1.address()), "corrupted entry reads as a miss");
  auto pulled = cache.pull({v1.address()});
  expect(pulled.ok() && pulled.value().empty(), "corruption is a miss, not an error");
  fs::remove_all(tmp);
}

void test_file_cache_scan_order() {
  const fs::path tmp = fresh_dir("strata_cache_scan_test");
  strata::FileRevisionCache cache(tmp.string());
  cache.merge({asserted("c", strata::jsonlite::Value{1}, 1), asserted("a", strata::jsonlite::Value{1}, 1),
               asserted("b", strata::jsonlite::Value{1}, 1)},
              strata::reconcile);
  auto all = cache.scan();
  expect(all.size() == 3, "scan sees every entry");
  expect(all[0].key == "a/" + kThe && all[2].key == "c/" + kThe, "scan is ordered by key");
  auto page = cache.scan(1, all[0].key);
  expect(page.size() == 1 && page[0].key == "b/" + kThe, "scan resumes after a key");
  fs::remove_all(tmp);
}

void test_file_cache_missing_root_is_store_error() {
  const fs::path tmp = fresh_dir("strata_cache_missing_test");
  strata::FileRevisionCache cache(tmp.string());
  fs::remove_all(tmp);
  auto pulled = cache.pull({strata::Address{kThe, "e1"}});
  expect(!pulled && pulled.error().code == strata::ErrorCode::store_error,
         "vanished root is a store error");
}

// ============================================================================
// Observability / versioning
// ============================================================================

void test_event_log() {
  const fs::path log = fs::temp_directory_path() / "strata_event_log_test.jsonl";
  fs::remove(log);
  ::setenv("STRATA_EVENT_LOG", log.string().c_str(), 1);
  strata::ReplicaEvent ev;
  ev.kind = "load";
  ev.space = "did:space";
  ev.count = 2;
  strata::emit_event(ev);
  ::unsetenv("STRATA_EVENT_LOG");

  std::ifstream ifs(log);
  std::string line;
  expect(static_cast<bool>(std::getline(ifs, line)), "event line written");
  std::optional<strata::jsonlite::JsonError> err;
  auto obj = strata::jsonlite::parse(line, &err);
  expect(!err, "event line is JSON");
  expect(strata::jsonlite::get_string(obj, "kind") == "load", "event kind recorded");
  expect(strata::jsonlite::get_u64(obj, "timestamp_unix_ms") > 0, "event timestamped");
  fs::remove(log);
}

void test_stats_json() {
  strata::ReplicaStats stats;
  stats.loads.fetch_add(3);
  std::optional<strata::jsonlite::JsonError> err;
  auto obj = strata::jsonlite::parse(stats.to_json(), &err);
  expect(!err && strata::jsonlite::get_u64(obj, "loads") == 3, "stats serialize as JSON");
}

void test_version_compatibility() {
  auto same = strata::version::check_compatibility(strata::version::PROTOCOL_FRAMING_VERSION);
  expect(same.ok, "own protocol version is compatible");
  auto other = strata::version::check_compatibility(strata::version::PROTOCOL_FRAMING_VERSION + 1);
  expect(!other.ok, "different protocol version is incompatible");
}

// ============================================================================
// Transport
// ============================================================================

// Listening socket on 127.0.0.1 with a kernel-chosen port.
struct LocalListener {
  LocalListener() {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    expect(fd >= 0, "listener socket");
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    sa.sin_port = 0;
    expect(::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0, "listener bind");
    expect(::listen(fd, 4) == 0, "listener listen");
    socklen_t len = sizeof(sa);
    expect(::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) == 0, "listener port");
    port = ntohs(sa.sin_port);
  }
  ~LocalListener() {
    if (fd >= 0) ::close(fd);
  }

  int fd{-1};
  uint16_t port{0};
};

std::vector<strata::TransportEvent> poll_for(strata::TcpTransport& t, std::size_t want,
                                             int rounds = 50) {
  std::vector<strata::TransportEvent> out;
  for (int i = 0; i < rounds && out.size() < want; ++i) {
    auto events = t.poll(20);
    out.insert(out.end(), events.begin(), events.end());
  }
  return out;
}

// Opens the transport against the listener; returns the server-side socket.
int accept_open(LocalListener& listener, strata::TcpTransport& t) {
  expect(t.open(), "transport open");
  const int peer = ::accept(listener.fd, nullptr, nullptr);
  expect(peer >= 0, "listener accepted");
  auto events = poll_for(t, 1);
  expect(events.size() == 1 && events[0].kind == strata::TransportEventKind::opened,
         "opened announced");
  return peer;
}

void write_raw(int fd, const std::string& bytes) {
  expect(::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) ==
             static_cast<ssize_t>(bytes.size()),
         "raw write");
}

std::vector<std::string> messages(const std::vector<strata::TransportEvent>& events) {
  std::vector<std::string> out;
  for (const auto& ev : events) {
    if (ev.kind == strata::TransportEventKind::message) out.push_back(ev.data);
  }
  return out;
}

void test_tcp_frame_split_across_reads() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port);
  const int peer = accept_open(listener, t);

  write_raw(peer, "{\"a\":");
  expect(poll_for(t, 1, 5).empty(), "partial frame held back");
  write_raw(peer, "1}\n");
  const auto got = messages(poll_for(t, 1));
  expect(got.size() == 1 && got[0] == "{\"a\":1}", "frame joined across reads");
  ::close(peer);
}

void test_tcp_crlf_and_blank_lines() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port);
  const int peer = accept_open(listener, t);

  write_raw(peer, "one\r\n\r\n\ntwo\n");
  const auto got = messages(poll_for(t, 2));
  expect(got.size() == 2 && got[0] == "one" && got[1] == "two",
         "carriage return stripped, blank lines skipped");
  ::close(peer);
}

void test_tcp_several_frames_in_one_read() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port);
  const int peer = accept_open(listener, t);

  write_raw(peer, "a\nb\nc\n");
  const auto got = messages(poll_for(t, 3));
  expect(got == std::vector<std::string>({"a", "b", "c"}), "frames emitted in order");
  ::close(peer);
}

void test_tcp_oversize_frame_closes() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port, 64);
  const int peer = accept_open(listener, t);

  write_raw(peer, "ok\n" + std::string(100, 'x'));
  const auto events = poll_for(t, 2);
  expect(events.size() == 2, "frame then close");
  expect(events[0].kind == strata::TransportEventKind::message && events[0].data == "ok",
         "complete frame before the oversize tail delivered");
  expect(events[1].kind == strata::TransportEventKind::closed, "oversize frame closes");
  expect(t.last_error() == "inbound frame too large", "reason recorded");
  expect(!t.send("late"), "closed transport refuses sends");
  ::close(peer);
}

void test_tcp_peer_close_after_last_frame() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port);
  const int peer = accept_open(listener, t);

  write_raw(peer, "last\r\n");
  ::close(peer);
  const auto events = poll_for(t, 2);
  expect(events.size() == 2, "frame then close");
  expect(events[0].kind == strata::TransportEventKind::message && events[0].data == "last",
         "final frame delivered");
  expect(events[1].kind == strata::TransportEventKind::closed, "peer close reported");
}

void test_tcp_send_reaches_peer() {
  LocalListener listener;
  strata::TcpTransport t("127.0.0.1", listener.port);
  const int peer = accept_open(listener, t);

  expect(t.send("{\"cmd\":\"hello\"}"), "send accepted while open");
  expect(t.send("second"), "second send accepted");
  std::string received;
  for (int i = 0; i < 50 && received.find("second\n") == std::string::npos; ++i) {
    poll_for(t, 1, 1);
    char buf[256];
    const ssize_t n = ::recv(peer, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) received.append(buf, static_cast<size_t>(n));
  }
  expect(received == "{\"cmd\":\"hello\"}\nsecond\n", "frames newline-terminated on the wire");
  ::close(peer);
}

void test_parse_endpoint() {
  std::string host;
  uint16_t port = 0;
  expect(strata::parse_endpoint("127.0.0.1:9000", host, port), "host:port parses");
  expect(host == "127.0.0.1" && port == 9000, "host and port split");
  expect(strata::parse_endpoint("::1:8080", host, port) && host == "::1" && port == 8080,
         "last colon separates the port");

  for (const std::string bad : {"", "localhost", ":80", "host:", "host:abc", "host:8o",
                                "host:0", "host:65536", "host:-1"}) {
    expect(!strata::parse_endpoint(bad, host, port), "rejects '" + bad + "'");
  }
}

}  // namespace

int main() {
  strata::set_log_threshold(strata::LogLevel::error);
  std::cout << "=== Strata Core Test Suite ===\n";

  std::cout << "\n[Hashing]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);

  std::cout << "\n[JSON]\n";
  run_test("canonical key order", test_json_canonical_key_order);
  run_test("duplicates and depth rejected", test_json_rejects_duplicates_and_depth);
  run_test("integer normalization", test_json_integer_normalization);

  std::cout << "\n[Revisions]\n";
  run_test("reference excludes since", test_reference_excludes_since);
  run_test("genesis cause", test_genesis_cause);
  run_test("causal chain", test_causal_chain);
  run_test("validate revision", test_validate_revision);
  run_test("reconcile monotonic", test_reconcile_monotonic);
  run_test("archive codec", test_archive_codec);
  run_test("address key", test_address_key);

  std::cout << "\n[Heap / nursery / queue]\n";
  run_test("heap batch notifies once", test_heap_batch_notifies_once);
  run_test("heap unsubscribe", test_heap_unsubscribe);
  run_test("heap eviction respects pins", test_heap_eviction_respects_pins);
  run_test("nursery stacking", test_nursery_stacking);
  run_test("pull queue dedup", test_pull_queue_dedup);

  std::cout << "\n[Selectors]\n";
  run_test("select and selectSchema", test_selector_queries);

  std::cout << "\n[Protocol]\n";
  run_test("invocation reference", test_invocation_reference);
  run_test("frame roundtrip", test_frame_roundtrip);
  run_test("task return decode", test_decode_task_return);
  run_test("deliver decode", test_decode_deliver);
  run_test("commit decode", test_decode_commit);

  std::cout << "\n[Configuration]\n";
  run_test("settings defaults", test_settings_defaults);
  run_test("settings from JSON", test_settings_from_json);
  run_test("settings from env", test_settings_from_env);

  std::cout << "\n[Durable cache]\n";
  run_test("file cache persists", test_file_cache_persists);
  run_test("file cache zstd", test_file_cache_zstd);
  run_test("file cache keeps newer", test_file_cache_keeps_newer);
  run_test("file cache corruption is a miss", test_file_cache_corruption_is_miss);
  run_test("file cache scan order", test_file_cache_scan_order);
  run_test("file cache missing root", test_file_cache_missing_root_is_store_error);

  std::cout << "\n[Transport]\n";
  run_test("tcp frame split across reads", test_tcp_frame_split_across_reads);
  run_test("tcp CRLF and blank lines", test_tcp_crlf_and_blank_lines);
  run_test("tcp several frames in one read", test_tcp_several_frames_in_one_read);
  run_test("tcp oversize frame closes", test_tcp_oversize_frame_closes);
  run_test("tcp peer close after last frame", test_tcp_peer_close_after_last_frame);
  run_test("tcp send reaches peer", test_tcp_send_reaches_peer);
  run_test("parse endpoint", test_parse_endpoint);

  std::cout << "\n[Observability / versioning]\n";
  run_test("event log", test_event_log);
  run_test("stats JSON", test_stats_json);
  run_test("version compatibility", test_version_compatibility);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
