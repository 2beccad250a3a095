#pragma once

// arbiter/cas.hpp — Content-addressable storage for decision payloads.
//
// The engine stores the canonical input, output and feature snapshot of every
// decision here; the ledger only carries their digests. Audit replay reads
// them back, so a CAS object is as durable as the trace that references it.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. CAS key = BLAKE3("cas:" || original_bytes) ALWAYS.
//   2. Writes are atomic: tmp+rename on the same filesystem.
//   3. Reads verify integrity: stored_blob_hash and the content digest are
//      both checked before data is returned.
//   4. Fail-closed: any integrity failure returns nullopt, never corrupted
//      data.
//   5. Deduplication: a second put() of the same content returns the same
//      digest.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace arbiter {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ms{0};
};

// Write via a sibling temp file and rename. Shared by the file-backed stores.
bool atomic_write_file(const std::string& path, const std::string& data);

// ---------------------------------------------------------------------------
// ICASBackend
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class ICASBackend {
 public:
  virtual ~ICASBackend() = default;

  // Store data. Returns the content digest on success, "" on failure.
  // compression: "off" (identity) or "zstd" (if built with ARBITER_WITH_ZSTD).
  virtual std::string put(const std::string& data, const std::string& compression = "off") = 0;

  // Returns nullopt if not found or integrity fails.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  virtual bool contains(const std::string& digest) const = 0;
  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;
  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore — local filesystem backend
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/AB/CD/<64-char-digest>
//   <root>/objects/AB/CD/<64-char-digest>.meta
//   <root>/index.ndjson
//
// EXTENSION_POINT: append_only_journal
//   Current: individual files per object.
//   Upgrade path: a journal that logs each put() for crash recovery of
//   objects whose final rename did not complete. objects/ stays the source
//   of truth.
class CasStore : public ICASBackend {
 public:
  explicit CasStore(std::string root = ".arbiter/cas/v2");

  std::string put(const std::string& data, const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string root_;
  mutable std::mutex index_mu_;
  mutable std::map<std::string, CasObjectInfo> index_;
  mutable bool index_loaded_{false};

  void load_index() const;
  void save_index_entry(const CasObjectInfo& info) const;
  std::string meta_path(const std::string& digest) const;
  std::string index_path() const;
};

// ---------------------------------------------------------------------------
// InMemoryCasBackend
// ---------------------------------------------------------------------------
// Same digest scheme and integrity checks as CasStore, no compression.
class InMemoryCasBackend : public ICASBackend {
 public:
  std::string put(const std::string& data, const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "memory"; }

  // Test hook: replace stored bytes without updating metadata.
  bool corrupt_for_test(const std::string& digest, const std::string& bytes);

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::pair<std::string, CasObjectInfo>> objects_;
};

}  // namespace arbiter
