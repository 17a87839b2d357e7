#pragma once

// strata/cache.hpp — Durable revision cache.
//
// The replica treats the cache as an opaque address -> revision store with
// batch pull and batch merge. It is optional: with NoCache the engine is
// correct, only colder after a restart.
//
// FAILURE POLICY:
//   Implementations report I/O trouble as ErrorCode::store_error. The replica
//   logs it and falls back to the remote; a cache can never fail a load or a
//   push. Corrupt or foreign-format entries are misses, not errors.
//
// FileRevisionCache layout (version::CACHE_FORMAT_VERSION):
//   <root>/revisions/AB/CD/<addr digest>        revision archive, maybe zstd
//   <root>/revisions/AB/CD/<addr digest>.meta   {key, encoding, sizes,
//                                                stored_blob_hash, format}
//   addr digest = BLAKE3("addr:" + "of/the"). Blob and meta are written with
//   tmp + rename, meta last, so a torn write leaves a blob without matching
//   meta and reads as a miss.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "strata/revision.hpp"
#include "strata/types.hpp"

namespace strata {

class IRevisionCache {
 public:
  virtual ~IRevisionCache() = default;

  // Returns the stored revision for each address found, keyed by address key.
  virtual Result<RevisionMap> pull(const std::vector<Address>& addresses) = 0;

  // Reconciles each incoming revision with the stored one and persists the
  // winners.
  virtual Result<Unit> merge(const std::vector<Revision>& revisions,
                             ReconcileFn reconcile) = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// NoCache — pulls nothing, discards everything
// ---------------------------------------------------------------------------
class NoCache final : public IRevisionCache {
 public:
  Result<RevisionMap> pull(const std::vector<Address>&) override { return RevisionMap{}; }
  Result<Unit> merge(const std::vector<Revision>&, ReconcileFn) override { return Unit{}; }
  std::string backend_id() const override { return "none"; }
};

// ---------------------------------------------------------------------------
// MemoryRevisionCache — process-local cache for tests and dev builds
// ---------------------------------------------------------------------------
class MemoryRevisionCache final : public IRevisionCache {
 public:
  Result<RevisionMap> pull(const std::vector<Address>& addresses) override;
  Result<Unit> merge(const std::vector<Revision>& revisions, ReconcileFn reconcile) override;
  std::string backend_id() const override { return "memory"; }

  const Revision* peek(const Address& address) const;
  std::size_t size() const { return entries_.size(); }
  std::size_t pulls() const { return pulls_; }

 private:
  RevisionMap entries_;
  std::size_t pulls_{0};
};

// ---------------------------------------------------------------------------
// FileRevisionCache — sharded files on the local filesystem
// ---------------------------------------------------------------------------
struct CacheEntryInfo {
  std::string key;
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint32_t format{0};
};

class FileRevisionCache final : public IRevisionCache {
 public:
  // compression: "off" or "zstd".
  explicit FileRevisionCache(std::string root, std::string compression = "off");

  Result<RevisionMap> pull(const std::vector<Address>& addresses) override;
  Result<Unit> merge(const std::vector<Revision>& revisions, ReconcileFn reconcile) override;
  std::string backend_id() const override { return "file"; }

  // Reads one address. nullopt on miss, integrity failure or foreign format.
  std::optional<Revision> read(const Address& address) const;

  // Entries ordered by address key. limit 0 = unlimited; start_after is an
  // address key to resume from.
  std::vector<CacheEntryInfo> scan(std::size_t limit = 0,
                                   const std::string& start_after = "") const;

  std::size_t size() const;
  const std::string& root() const { return root_; }

  std::string revision_path(const Address& address) const;
  std::string meta_path(const Address& address) const;

 private:
  bool write(const Revision& revision);
  std::optional<CacheEntryInfo> read_meta(const std::string& meta_file) const;

  std::string root_;
  std::string compression_;
};

}  // namespace strata
