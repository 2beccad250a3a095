#pragma once

// arbiter/kv_store.hpp — Versioned key-value store behind the registry.
//
// Every value carries a revision. Writers supply the revision they read;
// put_if() succeeds only if it still matches, so concurrent registry
// transitions on the same release cannot both win.
//
// INVARIANT: revisions for a key are strictly increasing, starting at 1.
// expected_revision == 0 means "the key must not exist yet".

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

struct VersionedValue {
  std::string value;
  uint64_t revision{0};
};

struct KvPutResult {
  Status status;
  uint64_t revision{0};  // new revision on success
};

class IVersionedKvStore {
 public:
  virtual ~IVersionedKvStore() = default;

  virtual std::optional<VersionedValue> get(const std::string& key) const = 0;

  // Compare-and-swap. Fails concurrent_modification when the stored revision
  // differs from expected_revision.
  virtual KvPutResult put_if(const std::string& key, const std::string& value,
                             uint64_t expected_revision) = 0;

  // Keys starting with prefix, sorted.
  virtual std::vector<std::string> keys(const std::string& prefix) const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryKvStore
// ---------------------------------------------------------------------------
class InMemoryKvStore : public IVersionedKvStore {
 public:
  std::optional<VersionedValue> get(const std::string& key) const override;
  KvPutResult put_if(const std::string& key, const std::string& value,
                     uint64_t expected_revision) override;
  std::vector<std::string> keys(const std::string& prefix) const override;

 private:
  mutable std::mutex mu_;
  std::map<std::string, VersionedValue> data_;
};

// ---------------------------------------------------------------------------
// FileKvStore — one JSON document per key under a root directory
// ---------------------------------------------------------------------------
// File name is the BLAKE3 digest of the key; the document carries the key,
// revision and value. Writes go through tmp+rename. The full key set is
// loaded at construction; this process is assumed to be the only writer.
class FileKvStore : public IVersionedKvStore {
 public:
  explicit FileKvStore(std::string root);

  std::optional<VersionedValue> get(const std::string& key) const override;
  KvPutResult put_if(const std::string& key, const std::string& value,
                     uint64_t expected_revision) override;
  std::vector<std::string> keys(const std::string& prefix) const override;

  const std::string& root() const { return root_; }
  // Documents that failed to parse during load.
  const std::vector<std::string>& load_errors() const { return load_errors_; }

 private:
  std::string root_;
  mutable std::mutex mu_;
  std::map<std::string, VersionedValue> data_;
  std::vector<std::string> load_errors_;

  std::string path_for(const std::string& key) const;
};

}  // namespace arbiter
