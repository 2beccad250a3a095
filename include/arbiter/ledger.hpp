#pragma once

// arbiter/ledger.hpp — Immutable hash-chained trace ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. SINGLE WRITER: append() is serialized by one mutex. It is the only
//      global ordering point in the system.
//   2. CHAINED: chain_hash[i] = H_chain(prev_hash[i] || canonical(record[i]))
//      where prev_hash[i] = chain_hash[i-1] and prev_hash[0] is the genesis
//      hash. canonical() covers every field except chain_hash itself.
//   3. ARENA: records live in an append-only deque indexed by sequence.
//      Each entry stores the previous hash by value, so a reader never
//      follows a live reference into another record.
//   4. NEVER MUTATED: no API modifies or removes an appended record.
//   5. ORDERED DURABILITY: records reach the ILogStore in sequence order via
//      a background committer. Append ordering is decoupled from persistence
//      latency; flush() is the durability barrier.
//
// EXTENSION_POINT: sharded_ledger
//   Current: one global chain with one genesis hash.
//   Upgrade path: per-tenant chains whose genesis embeds the tenant id, plus a
//   periodic cross-link record carrying every shard's tail hash.

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "arbiter/log_store.hpp"
#include "arbiter/types.hpp"
#include "arbiter/version.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// TraceRecord
// ---------------------------------------------------------------------------
struct TraceRecord {
  std::string trace_id;
  uint64_t sequence{0};
  std::string event_type{"decision"};  // decision | governance
  std::string function_id;
  std::string version;
  std::string function_hash;           // logic_hash of the evaluated version
  std::string caller_id;               // verbatim; governance: the actor
  TimestampMs timestamp_unix_ms{0};
  TimestampMs as_of_unix_ms{0};
  std::string status{"OK"};            // OK | ERROR
  std::string error_code;              // empty when OK
  std::string input_hash;
  std::string output_hash;
  std::string feature_snapshot_ref;
  std::string detail;                  // canonical JSON (governance events, error message)
  uint32_t record_version{version::LEDGER_RECORD_VERSION};
  std::string prev_hash;
  std::string chain_hash;

  bool ok() const { return status == "OK"; }
  bool is_decision() const { return event_type == "decision"; }
};

// Canonical bytes hashed into the chain: every field except chain_hash.
std::string canonical_record(const TraceRecord& r);

// Full NDJSON line (canonical record plus chain_hash).
std::string record_to_json(const TraceRecord& r);

std::optional<TraceRecord> record_from_json(const std::string& line, std::string* error = nullptr);

// ---------------------------------------------------------------------------
// Integrity verification
// ---------------------------------------------------------------------------
struct IntegrityReport {
  bool ok{true};
  std::string first_broken_trace_id;    // empty when ok
  uint64_t first_broken_sequence{0};    // meaningful only when !ok
  uint64_t records_checked{0};
  std::string reason;

  std::string to_json() const;
};

// Verifies records[from, to) where records[i] must hold sequence i. The
// anchor for `from > 0` is the stored chain_hash of records[from - 1].
// Stops at the first broken link.
IntegrityReport verify_chain_records(const std::vector<TraceRecord>& records, uint64_t from = 0,
                                     uint64_t to = std::numeric_limits<uint64_t>::max());

// ---------------------------------------------------------------------------
// TraceLedger
// ---------------------------------------------------------------------------
struct LedgerOptions {
  size_t commit_batch{64};
  uint64_t flush_interval_ms{5};
};

struct AppendResult {
  Status status;
  TraceRecord record;        // as stored (sequence, prev_hash, chain_hash set)
  bool duplicate{false};     // trace_id already present; nothing appended
};

class TraceLedger {
 public:
  // store == nullptr: in-memory only. Otherwise existing lines are reloaded
  // and new records are committed to the store in the background. If the
  // reload fails, append() and flush() return storage_error.
  explicit TraceLedger(std::shared_ptr<ILogStore> store = nullptr, LedgerOptions options = {});
  ~TraceLedger();

  TraceLedger(const TraceLedger&) = delete;
  TraceLedger& operator=(const TraceLedger&) = delete;

  // Status of the reload performed by the constructor.
  const Status& load_status() const { return load_status_; }
  // Lines that could not be parsed on reload (kept as broken placeholders).
  uint64_t unparseable_on_load() const { return unparseable_on_load_; }

  // Assigns sequence, prev_hash and chain_hash. A trace_id that is already
  // present returns the stored record with duplicate=true.
  AppendResult append(TraceRecord record);

  std::optional<TraceRecord> get(const std::string& trace_id) const;

  // Records of function_id with timestamp in [start, end), in sequence order.
  std::vector<TraceRecord> range_query(const std::string& function_id, TimestampMs start,
                                       TimestampMs end) const;

  std::vector<TraceRecord> records(uint64_t from = 0,
                                   uint64_t to = std::numeric_limits<uint64_t>::max()) const;

  uint64_t size() const;
  std::string tail_hash() const;

  IntegrityReport verify_integrity(uint64_t from = 0,
                                   uint64_t to = std::numeric_limits<uint64_t>::max()) const;

  // Blocks until every appended record has been committed or a commit fails.
  Status flush();

  uint64_t committed_count() const;

 private:
  void committer_loop();
  void reload();

  std::shared_ptr<ILogStore> store_;
  LedgerOptions options_;
  Status load_status_;
  uint64_t unparseable_on_load_{0};

  std::mutex append_mu_;                 // single writer
  mutable std::shared_mutex rw_;         // arena readers vs writer
  std::deque<TraceRecord> arena_;
  std::unordered_map<std::string, uint64_t> by_id_;
  std::string tail_hash_;

  // Committer state
  mutable std::mutex commit_mu_;
  std::condition_variable commit_cv_;    // wakes the committer
  std::condition_variable flushed_cv_;   // wakes flush() waiters
  std::deque<std::string> pending_;
  uint64_t committed_{0};
  uint64_t enqueued_{0};
  uint64_t failure_generation_{0};
  size_t flush_waiters_{0};
  Status last_commit_error_;
  bool stopping_{false};
  std::thread committer_;
};

}  // namespace arbiter
