#pragma once

// arbiter/log_store.hpp — Append-only persistence behind the trace ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: lines are never modified or deleted through this API.
//   2. ORDERED: append_batch() writes lines in the order given, and batches
//      land in the order they are submitted.
//   3. STRUCTURED: every line is one canonical JSON object (NDJSON).
//   4. ALL-OR-REPORTED: a failed batch returns storage_error; the caller
//      decides whether to surface it. Nothing is silently dropped.
//
// The store knows nothing about hashing. Chain verification happens above it
// in ledger.hpp, which is what makes tampering at this layer detectable.

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

class ILogStore {
 public:
  virtual ~ILogStore() = default;

  virtual Status append_batch(const std::vector<std::string>& lines) = 0;

  // Every line currently stored, in append order.
  virtual Status read_all(std::vector<std::string>* lines) const = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// FileLogStore — NDJSON file
// ---------------------------------------------------------------------------
// Thread-safe. Each batch seeks to the end, writes, fflush()es and checks that
// the file grew by exactly the bytes written.
class FileLogStore : public ILogStore {
 public:
  explicit FileLogStore(std::string path);
  ~FileLogStore() override;

  FileLogStore(const FileLogStore&) = delete;
  FileLogStore& operator=(const FileLogStore&) = delete;

  Status append_batch(const std::vector<std::string>& lines) override;
  Status read_all(std::vector<std::string>* lines) const override;
  std::string backend_id() const override { return "file"; }

  const std::string& path() const { return path_; }
  uint64_t failure_count() const;

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// ---------------------------------------------------------------------------
// InMemoryLogStore
// ---------------------------------------------------------------------------
class InMemoryLogStore : public ILogStore {
 public:
  Status append_batch(const std::vector<std::string>& lines) override;
  Status read_all(std::vector<std::string>* lines) const override;
  std::string backend_id() const override { return "memory"; }

  // Failure injection: while set, every append_batch() fails.
  void set_fail_appends(bool fail);
  // Test hook: overwrite a stored line in place (simulates storage tampering).
  bool tamper_for_test(std::size_t index, std::string line);
  std::size_t size() const;

 private:
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
  bool fail_appends_{false};
};

}  // namespace arbiter
