#include "strata/cache.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>

#include <zstd.h>

#include "strata/hash.hpp"
#include "strata/jsonlite.hpp"
#include "strata/observability.hpp"
#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata {

namespace {

std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: write to temp file, then rename into place.
// On POSIX, rename() is atomic within the same filesystem.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

// ---------------------------------------------------------------------------
// MemoryRevisionCache
// ---------------------------------------------------------------------------

Result<RevisionMap> MemoryRevisionCache::pull(const std::vector<Address>& addresses) {
  ++pulls_;
  RevisionMap out;
  for (const auto& a : addresses) {
    auto it = entries_.find(a.key());
    if (it != entries_.end()) out.emplace(it->first, it->second);
  }
  return out;
}

Result<Unit> MemoryRevisionCache::merge(const std::vector<Revision>& revisions,
                                        ReconcileFn reconcile) {
  for (const auto& r : revisions) {
    auto it = entries_.find(r.key());
    const Revision* existing = it == entries_.end() ? nullptr : &it->second;
    if (reconcile(existing, &r) == &r) entries_[r.key()] = r;
  }
  return Unit{};
}

const Revision* MemoryRevisionCache::peek(const Address& address) const {
  auto it = entries_.find(address.key());
  return it == entries_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// FileRevisionCache
// ---------------------------------------------------------------------------

FileRevisionCache::FileRevisionCache(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "revisions", ec);
  if (ec) {
    log(LogLevel::warn, "cache", "cannot create " + root_ + ": " + ec.message());
  }
}

std::string FileRevisionCache::revision_path(const Address& address) const {
  const std::string digest = address_hash(address.key());
  return (fs::path(root_) / "revisions" / digest.substr(0, 2) / digest.substr(2, 2) / digest)
      .string();
}

std::string FileRevisionCache::meta_path(const Address& address) const {
  return revision_path(address) + ".meta";
}

std::optional<CacheEntryInfo> FileRevisionCache::read_meta(const std::string& meta_file) const {
  auto text = read_all(meta_file);
  if (!text) return std::nullopt;
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(*text, &err);
  if (err) return std::nullopt;

  CacheEntryInfo info;
  info.key = jsonlite::get_string(obj, "key");
  info.digest = jsonlite::get_string(obj, "digest");
  info.encoding = jsonlite::get_string(obj, "encoding", "identity");
  info.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size", 0));
  info.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size", 0));
  info.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  info.format = static_cast<uint32_t>(jsonlite::get_u64(obj, "format", 0));
  if (info.key.empty() || !valid_digest(info.digest)) return std::nullopt;
  return info;
}

std::optional<Revision> FileRevisionCache::read(const Address& address) const {
  const fs::path p = revision_path(address);
  auto meta = read_meta(meta_path(address));
  if (!meta) return std::nullopt;
  if (meta->format != version::CACHE_FORMAT_VERSION || meta->key != address.key()) {
    return std::nullopt;
  }

  auto data = read_all(p);
  if (!data) return std::nullopt;

  // Stored blob integrity (plain BLAKE3 over the bytes on disk).
  if (blake3_hex(*data) != meta->stored_blob_hash) {
    log(LogLevel::warn, "cache", "integrity failure for " + address.key());
    return std::nullopt;
  }

  if (meta->encoding == "zstd") {
    *data = decompress_zstd(*data, meta->original_size);
    if (data->empty()) return std::nullopt;
  }

  std::optional<jsonlite::JsonError> err;
  auto archive = jsonlite::parse_value(*data, &err);
  if (err) return std::nullopt;
  auto rev = revision_from_archive(archive);
  if (!rev || !(rev.value().address() == address)) return std::nullopt;
  return rev.value();
}

bool FileRevisionCache::write(const Revision& revision) {
  const Address address = revision.address();
  const std::string body = revision_to_json(revision);

  std::string stored = body;
  std::string encoding = "identity";
  if (compression_ == "zstd") {
    auto c = compress_zstd(body);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }

  if (!atomic_write(revision_path(address), stored)) return false;

  jsonlite::Object meta;
  meta["key"] = address.key();
  meta["digest"] = address_hash(address.key());
  meta["encoding"] = encoding;
  meta["original_size"] = static_cast<std::uint64_t>(body.size());
  meta["stored_size"] = static_cast<std::uint64_t>(stored.size());
  meta["stored_blob_hash"] = blake3_hex(stored);
  meta["format"] = static_cast<std::uint64_t>(version::CACHE_FORMAT_VERSION);
  return atomic_write(meta_path(address), jsonlite::to_json(meta));
}

Result<RevisionMap> FileRevisionCache::pull(const std::vector<Address>& addresses) {
  std::error_code ec;
  if (!fs::is_directory(fs::path(root_) / "revisions", ec)) {
    return make_error(ErrorCode::store_error, "cache root unavailable: " + root_);
  }
  RevisionMap out;
  for (const auto& a : addresses) {
    if (auto r = read(a)) out.emplace(a.key(), std::move(*r));
  }
  return out;
}

Result<Unit> FileRevisionCache::merge(const std::vector<Revision>& revisions,
                                      ReconcileFn reconcile) {
  std::vector<std::string> failed;
  for (const auto& r : revisions) {
    auto existing = read(r.address());
    const Revision* winner = reconcile(existing ? &*existing : nullptr, &r);
    if (winner != &r) continue;
    if (!write(r)) failed.push_back(r.key());
  }
  if (!failed.empty()) {
    return make_error(ErrorCode::store_error,
                      "failed to persist " + std::to_string(failed.size()) + " revision(s)",
                      std::move(failed));
  }
  return Unit{};
}

std::vector<CacheEntryInfo> FileRevisionCache::scan(std::size_t limit,
                                                     const std::string& start_after) const {
  std::vector<CacheEntryInfo> out;
  const fs::path dir = fs::path(root_) / "revisions";
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  for (auto it = fs::recursive_directory_iterator(dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension() != ".meta") continue;
    auto info = read_meta(it->path().string());
    if (!info || info->format != version::CACHE_FORMAT_VERSION) continue;
    if (!start_after.empty() && info->key <= start_after) continue;
    out.push_back(std::move(*info));
  }

  std::sort(out.begin(), out.end(),
            [](const CacheEntryInfo& a, const CacheEntryInfo& b) { return a.key < b.key; });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::size_t FileRevisionCache::size() const {
  return scan().size();
}

}  // namespace strata
