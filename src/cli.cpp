#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <zstd.h>

#include "strata/cache.hpp"
#include "strata/config.hpp"
#include "strata/hash.hpp"
#include "strata/jsonlite.hpp"
#include "strata/observability.hpp"
#include "strata/registry.hpp"
#include "strata/revision.hpp"
#include "strata/transport.hpp"
#include "strata/version.hpp"

namespace {

std::string read_file(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (strata::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (strata::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

bool verify_zstd_roundtrip() {
  const std::string sample(4096, 'a');
  std::string packed(ZSTD_compressBound(sample.size()), '\0');
  const size_t n = ZSTD_compress(packed.data(), packed.size(), sample.data(),
                                 sample.size(), 3);
  if (ZSTD_isError(n))
    return false;
  std::string unpacked(sample.size(), '\0');
  const size_t m =
      ZSTD_decompress(unpacked.data(), unpacked.size(), packed.data(), n);
  return !ZSTD_isError(m) && m == sample.size() && unpacked == sample;
}

// Flags shared by the commands that talk to a remote.
struct Options {
  std::string endpoint;
  std::string space;
  std::string of;
  std::string the;
  std::string value;
  std::string config;
  std::string root;
  size_t count{0};
  size_t limit{0};
};

Options parse_options(int argc, char **argv, int first) {
  Options o;
  for (int i = first; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--endpoint" && i + 1 < argc)
      o.endpoint = argv[++i];
    else if (a == "--space" && i + 1 < argc)
      o.space = argv[++i];
    else if (a == "--of" && i + 1 < argc)
      o.of = argv[++i];
    else if (a == "--the" && i + 1 < argc)
      o.the = argv[++i];
    else if (a == "--value" && i + 1 < argc)
      o.value = argv[++i];
    else if (a == "--config" && i + 1 < argc)
      o.config = argv[++i];
    else if (a == "--root" && i + 1 < argc)
      o.root = argv[++i];
    else if (a == "--count" && i + 1 < argc)
      o.count = std::strtoull(argv[++i], nullptr, 10);
    else if (a == "--limit" && i + 1 < argc)
      o.limit = std::strtoull(argv[++i], nullptr, 10);
  }
  return o;
}

strata::Result<strata::Settings> load_settings(const Options &o) {
  strata::Settings base = strata::default_settings();
  if (!o.config.empty()) {
    auto from_file = strata::settings_from_json(read_file(o.config), base);
    if (!from_file)
      return from_file.error();
    base = from_file.value();
  }
  return strata::apply_env(base);
}

void print_error(const strata::Error &e) {
  std::cout << "{\"ok\":false,\"error\":" << e.to_json() << "}\n";
}

std::unique_ptr<strata::Registry> open_registry(const Options &o,
                                                const strata::Settings &s) {
  std::string host;
  uint16_t port = 0;
  if (!strata::parse_endpoint(o.endpoint, host, port)) {
    print_error(strata::make_error(strata::ErrorCode::config_invalid,
                                   "--endpoint must be host:port"));
    return nullptr;
  }
  auto registry = std::make_unique<strata::Registry>(
      std::make_unique<strata::TcpTransport>(host, port), s);
  registry->connect();
  return registry;
}

// Drives the registry until done is set.
void run_until(strata::Registry &registry, const bool &done) {
  while (!done)
    registry.poll(100);
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0)
      continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: strata <version|doctor|config show|get|put|retract|"
                 "watch|cache scan> [flags]\n";
    return 1;
  }

  if (cmd == "version") {
    const auto manifest = strata::version::current_manifest();
    std::cout << strata::version::manifest_to_json(manifest) << "\n";
    return 0;
  }

  if (cmd == "doctor") {
    std::vector<std::string> blockers;
    const auto h = strata::hash_runtime_info();
    if (h.primitive != "blake3")
      blockers.push_back("hash_primitive_not_blake3");
    if (!h.blake3_available)
      blockers.push_back("blake3_not_available");
    if (!verify_hash_vectors())
      blockers.push_back("hash_vectors_failed");
    if (!verify_zstd_roundtrip())
      blockers.push_back("zstd_roundtrip_failed");

    const auto o = parse_options(argc, argv, 2);
    auto settings = load_settings(o);
    if (!settings)
      blockers.push_back("config_invalid");

    std::cout << "{\"ok\":" << (blockers.empty() ? "true" : "false")
              << ",\"blockers\":[";
    for (size_t i = 0; i < blockers.size(); ++i) {
      if (i > 0)
        std::cout << ",";
      std::cout << "\"" << blockers[i] << "\"";
    }
    std::cout << "]";
    std::cout << ",\"semver\":\"" << strata::version::SEMVER << "\"";
    std::cout << ",\"protocol_framing_version\":"
              << strata::version::PROTOCOL_FRAMING_VERSION;
    std::cout << ",\"cache_format_version\":"
              << strata::version::CACHE_FORMAT_VERSION;
    std::cout << ",\"hash_primitive\":\"" << h.primitive << "\"";
    std::cout << ",\"hash_version\":\"" << h.version << "\"";
    std::cout << ",\"zstd_version\":\"" << ZSTD_versionString() << "\"";
    if (settings)
      std::cout << ",\"settings\":" << settings.value().to_json();
    else
      std::cout << ",\"config_error\":" << settings.error().to_json();
    std::cout << "}" << "\n";
    return blockers.empty() ? 0 : 2;
  }

  if (cmd == "config" && argc >= 3 && std::string(argv[2]) == "show") {
    const auto o = parse_options(argc, argv, 3);
    auto settings = load_settings(o);
    if (!settings) {
      print_error(settings.error());
      return 2;
    }
    std::cout << "{\"config\":" << settings.value().to_json() << "}\n";
    return 0;
  }

  if (cmd == "cache" && argc >= 3 && std::string(argv[2]) == "scan") {
    const auto o = parse_options(argc, argv, 3);
    if (o.root.empty()) {
      std::cerr << "usage: strata cache scan --root DIR [--limit N]\n";
      return 1;
    }
    strata::FileRevisionCache cache(o.root);
    std::cout << "{\"entries\":[";
    bool first = true;
    for (const auto &e : cache.scan(o.limit)) {
      if (!first)
        std::cout << ",";
      first = false;
      std::cout << "{\"key\":\"" << strata::jsonlite::escape(e.key)
                << "\",\"encoding\":\"" << e.encoding
                << "\",\"original_size\":" << e.original_size
                << ",\"stored_size\":" << e.stored_size << "}";
    }
    std::cout << "]}\n";
    return 0;
  }

  const bool remote_cmd =
      cmd == "get" || cmd == "put" || cmd == "retract" || cmd == "watch";
  if (!remote_cmd)
    return 1;

  const auto o = parse_options(argc, argv, 2);
  if (o.endpoint.empty() || o.space.empty() || o.of.empty()) {
    std::cerr << "usage: strata " << cmd
              << " --endpoint HOST:PORT --space SPACE --of ENTITY [--the KIND]"
              << (cmd == "put" ? " --value JSON" : "") << "\n";
    return 1;
  }
  auto settings = load_settings(o);
  if (!settings) {
    print_error(settings.error());
    return 2;
  }
  if (!o.the.empty())
    settings.value().default_the = o.the;
  auto registry = open_registry(o, settings.value());
  if (!registry)
    return 2;
  auto &replica = registry->mount(o.space);
  const strata::Address address{settings.value().default_the, o.of};

  if (cmd == "get") {
    bool done = false;
    int rc = 0;
    replica.load(std::vector<strata::Address>{address},
                 [&](strata::Result<std::vector<strata::Revision>> r) {
                   done = true;
                   if (!r) {
                     print_error(r.error());
                     rc = 2;
                     return;
                   }
                   const auto *current = replica.get(address);
                   std::cout << "{\"ok\":true,\"revision\":"
                             << (current ? strata::revision_to_json(*current)
                                         : std::string("null"))
                             << "}\n";
                 });
    run_until(*registry, done);
    return rc;
  }

  if (cmd == "put" || cmd == "retract") {
    std::vector<strata::Intent> intents;
    if (cmd == "put") {
      std::optional<strata::jsonlite::JsonError> err;
      auto value = strata::jsonlite::parse_value(o.value, &err);
      if (err) {
        print_error(strata::make_error(strata::ErrorCode::invalid_revision,
                                       "--value: " + err->message));
        return 2;
      }
      intents.push_back(strata::Assert{address, std::move(value)});
    } else {
      intents.push_back(strata::Retract{address});
    }
    bool done = false;
    int rc = 0;
    replica.push(intents, [&](strata::Result<strata::Commit> r) {
      done = true;
      if (!r) {
        print_error(r.error());
        rc = 2;
        return;
      }
      const auto &c = r.value();
      std::cout << "{\"ok\":" << (c.rejected.empty() ? "true" : "false")
                << ",\"since\":" << c.since
                << ",\"written\":" << c.revisions.size()
                << ",\"rejected\":" << c.rejected.size() << "}\n";
      if (!c.rejected.empty())
        rc = 2;
    });
    run_until(*registry, done);
    return rc;
  }

  // watch: print every change until --count changes were seen (0 = forever).
  size_t seen = 0;
  bool done = false;
  const auto id = registry->sink(
      o.space, o.of, [&](const strata::Revision *current) {
        std::cout << (current ? strata::revision_to_json(*current)
                              : std::string("null"))
                  << "\n";
        std::cout.flush();
        if (o.count != 0 && ++seen >= o.count)
          done = true;
      });
  if (id == 0) {
    print_error(strata::make_error(strata::ErrorCode::config_invalid,
                                   "subscription limit reached"));
    return 2;
  }
  while (!done && !registry->session().halted())
    registry->poll(100);
  if (!done) {
    strata::log(strata::LogLevel::error, "cli",
                "watch ended: " + registry->session().last_error());
    return 2;
  }
  return 0;
}
