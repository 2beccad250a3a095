#include "arbiter/cas.hpp"

// EXTENSION_POINT: replicated_cas
//   To implement: a ReplicatingBackend that wraps two ICASBackend instances
//   and writes to both. Invariant: return success only after the primary
//   write confirms, and never change the "cas:" key scheme.

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(ARBITER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace fs = std::filesystem;

namespace arbiter {

namespace {
#if defined(ARBITER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: temp file, then rename into place.
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

std::string info_to_json(const CasObjectInfo& info) {
  jsonlite::Object o;
  o["digest"] = info.digest;
  o["encoding"] = info.encoding;
  o["original_size"] = static_cast<uint64_t>(info.original_size);
  o["stored_size"] = static_cast<uint64_t>(info.stored_size);
  o["stored_blob_hash"] = info.stored_blob_hash;
  o["created_at"] = info.created_at_unix_ms;
  return jsonlite::to_json(o);
}

std::optional<CasObjectInfo> info_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  CasObjectInfo inf;
  inf.digest = jsonlite::get_string(o, "digest");
  inf.encoding = jsonlite::get_string(o, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(o, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(o, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  inf.created_at_unix_ms = jsonlite::get_u64(o, "created_at");
  if (!is_hex_digest(inf.digest)) return std::nullopt;
  return inf;
}

std::string read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

bool atomic_write_file(const std::string& path, const std::string& data) {
  return atomic_write(fs::path(path), data);
}

// ---------------------------------------------------------------------------
// CasStore
// ---------------------------------------------------------------------------

CasStore::CasStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string CasStore::meta_path(const std::string& digest) const { return object_path(digest) + ".meta"; }

std::string CasStore::index_path() const { return (fs::path(root_) / "index.ndjson").string(); }

void CasStore::load_index() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_loaded_) return;
  std::ifstream ifs(index_path());
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    if (auto inf = info_from_json(line)) index_[inf->digest] = std::move(*inf);
  }
  index_loaded_ = true;
}

void CasStore::save_index_entry(const CasObjectInfo& info) const {
  const std::string line = info_to_json(info) + "\n";
  std::lock_guard<std::mutex> lk(index_mu_);
  std::ofstream ofs(index_path(), std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
}

std::string CasStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!is_hex_digest(digest)) return {};

  const fs::path target = object_path(digest);
  const fs::path meta = meta_path(digest);
  if (fs::exists(target) && fs::exists(meta)) {
    // Dedup hit: the existing object must still verify.
    auto existing = get(digest);
    if (!existing.has_value() || *existing != data) return {};
    return digest;
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(ARBITER_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(target, stored)) return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ms = now_unix_ms();

  if (!atomic_write(meta, info_to_json(info))) {
    std::error_code ec;
    fs::remove(target, ec);
    return {};
  }

  {
    std::lock_guard<std::mutex> lk(index_mu_);
    index_[digest] = info;
  }
  save_index_entry(info);
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(digest);
    if (it != index_.end()) return it->second;
  }
  // The sidecar is authoritative when the index lags (another process wrote).
  const fs::path mp = meta_path(digest);
  if (!fs::exists(mp)) return std::nullopt;
  auto inf = info_from_json(read_file(mp));
  if (!inf || inf->digest != digest) return std::nullopt;
  std::lock_guard<std::mutex> lk(index_mu_);
  index_[digest] = *inf;
  return inf;
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  const fs::path p = object_path(digest);
  if (!fs::exists(p)) return std::nullopt;
  std::string data = read_file(p);

  auto meta = info(digest);
  if (!meta) return std::nullopt;

  if (blake3_hex(data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(ARBITER_WITH_ZSTD)
    auto plain = decompress_zstd(data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(*plain);
#else
    return std::nullopt;
#endif
  }

  if (cas_content_hash(data) != digest) return std::nullopt;
  return data;
}

bool CasStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  return fs::exists(object_path(digest));
}

std::size_t CasStore::size() const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

// ---------------------------------------------------------------------------
// InMemoryCasBackend
// ---------------------------------------------------------------------------

std::string InMemoryCasBackend::put(const std::string& data, const std::string& /*compression*/) {
  const std::string digest = cas_content_hash(data);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(digest);
  if (it != objects_.end()) {
    return it->second.first == data ? digest : std::string{};
  }
  CasObjectInfo info;
  info.digest = digest;
  info.original_size = data.size();
  info.stored_size = data.size();
  info.stored_blob_hash = blake3_hex(data);
  info.created_at_unix_ms = now_unix_ms();
  objects_.emplace(digest, std::make_pair(data, std::move(info)));
  return digest;
}

std::optional<std::string> InMemoryCasBackend::get(const std::string& digest) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(digest);
  if (it == objects_.end()) return std::nullopt;
  const auto& [data, info] = it->second;
  if (blake3_hex(data) != info.stored_blob_hash) return std::nullopt;
  if (cas_content_hash(data) != digest) return std::nullopt;
  return data;
}

bool InMemoryCasBackend::contains(const std::string& digest) const {
  std::lock_guard<std::mutex> lk(mu_);
  return objects_.count(digest) != 0;
}

std::optional<CasObjectInfo> InMemoryCasBackend::info(const std::string& digest) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(digest);
  if (it == objects_.end()) return std::nullopt;
  return it->second.second;
}

std::size_t InMemoryCasBackend::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return objects_.size();
}

bool InMemoryCasBackend::corrupt_for_test(const std::string& digest, const std::string& bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(digest);
  if (it == objects_.end()) return false;
  it->second.first = bytes;
  return true;
}

}  // namespace arbiter
