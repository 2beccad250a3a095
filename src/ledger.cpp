#include "arbiter/ledger.hpp"

// DESIGN INVARIANTS
//   - The canonical record is jsonlite canonical JSON (sorted keys, integers
//     as integers). record_from_json() followed by canonical_record() must
//     reproduce the hashed bytes exactly, or every reload would look tampered.
//   - verify never trusts a stored chain_hash for the record being checked;
//     it trusts only the predecessor's stored value as the link anchor.

#include <algorithm>
#include <chrono>

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/observability.hpp"

namespace arbiter {

namespace {

jsonlite::Object record_object(const TraceRecord& r) {
  jsonlite::Object o;
  o["trace_id"] = r.trace_id;
  o["sequence"] = r.sequence;
  o["event_type"] = r.event_type;
  o["function_id"] = r.function_id;
  o["version"] = r.version;
  o["function_hash"] = r.function_hash;
  o["caller_id"] = r.caller_id;
  o["timestamp_unix_ms"] = r.timestamp_unix_ms;
  o["as_of_unix_ms"] = r.as_of_unix_ms;
  o["status"] = r.status;
  o["error_code"] = r.error_code;
  o["input_hash"] = r.input_hash;
  o["output_hash"] = r.output_hash;
  o["feature_snapshot_ref"] = r.feature_snapshot_ref;
  o["detail"] = r.detail;
  o["record_version"] = r.record_version;
  o["prev_hash"] = r.prev_hash;
  return o;
}

bool require_string(const jsonlite::Object& o, const char* key, std::string* out) {
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_string()) return false;
  *out = std::get<std::string>(it->second.v);
  return true;
}

bool require_u64(const jsonlite::Object& o, const char* key, uint64_t* out) {
  auto it = o.find(key);
  if (it == o.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return false;
  *out = std::get<std::uint64_t>(it->second.v);
  return true;
}

TraceRecord unparseable_placeholder(uint64_t position, const std::string& why) {
  TraceRecord r;
  r.trace_id = "unparseable-line-" + std::to_string(position);
  r.sequence = position;
  r.event_type = "unparseable";
  r.status = "ERROR";
  r.detail = why;
  r.record_version = 0;
  return r;
}

// Shared by verify_chain_records() and TraceLedger (which verifies its deque
// in place under a shared lock).
template <typename Container>
IntegrityReport verify_range(const Container& records, uint64_t from, uint64_t to) {
  IntegrityReport rep;
  to = std::min<uint64_t>(to, records.size());
  auto broken = [&rep](const TraceRecord& r, uint64_t i, std::string reason) {
    rep.ok = false;
    rep.first_broken_trace_id = r.trace_id;
    rep.first_broken_sequence = i;
    rep.reason = std::move(reason);
  };

  for (uint64_t i = from; i < to; ++i) {
    const TraceRecord& r = records[i];
    if (r.event_type == "unparseable") {
      broken(r, i, "unparseable record: " + r.detail);
      return rep;
    }
    auto compat = version::check_record_compatibility(version::Format::ledger_record, r.record_version);
    if (!compat.ok) {
      broken(r, i, compat.description);
      return rep;
    }
    if (r.sequence != i) {
      broken(r, i, "sequence " + std::to_string(r.sequence) + " at position " + std::to_string(i));
      return rep;
    }
    const std::string& expected_prev = (i == 0) ? ledger_genesis_hash() : records[i - 1].chain_hash;
    if (!digest_equal(r.prev_hash, expected_prev)) {
      broken(r, i, "prev_hash does not link to the preceding record");
      return rep;
    }
    if (!digest_equal(chain_link_hash(r.prev_hash, canonical_record(r)), r.chain_hash)) {
      broken(r, i, "chain_hash does not match record contents");
      return rep;
    }
    ++rep.records_checked;
  }
  return rep;
}

}  // namespace

std::string canonical_record(const TraceRecord& r) { return jsonlite::to_json(record_object(r)); }

std::string record_to_json(const TraceRecord& r) {
  auto o = record_object(r);
  o["chain_hash"] = r.chain_hash;
  return jsonlite::to_json(o);
}

std::optional<TraceRecord> record_from_json(const std::string& line, std::string* error) {
  auto fail = [error](std::string msg) -> std::optional<TraceRecord> {
    if (error) *error = std::move(msg);
    return std::nullopt;
  };
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(line, &err);
  if (err) return fail(err->code + ": " + err->message);

  TraceRecord r;
  uint64_t record_version = 0;
  const bool complete =
      require_string(o, "trace_id", &r.trace_id) && require_u64(o, "sequence", &r.sequence) &&
      require_string(o, "event_type", &r.event_type) && require_string(o, "function_id", &r.function_id) &&
      require_string(o, "version", &r.version) && require_string(o, "function_hash", &r.function_hash) &&
      require_string(o, "caller_id", &r.caller_id) &&
      require_u64(o, "timestamp_unix_ms", &r.timestamp_unix_ms) &&
      require_u64(o, "as_of_unix_ms", &r.as_of_unix_ms) && require_string(o, "status", &r.status) &&
      require_string(o, "error_code", &r.error_code) && require_string(o, "input_hash", &r.input_hash) &&
      require_string(o, "output_hash", &r.output_hash) &&
      require_string(o, "feature_snapshot_ref", &r.feature_snapshot_ref) &&
      require_string(o, "detail", &r.detail) && require_u64(o, "record_version", &record_version) &&
      require_string(o, "prev_hash", &r.prev_hash) && require_string(o, "chain_hash", &r.chain_hash);
  if (!complete) return fail("trace record is missing a field or has a field of the wrong type");
  if (o.size() != 18) return fail("trace record carries unexpected fields");
  r.record_version = static_cast<uint32_t>(record_version);
  return r;
}

std::string IntegrityReport::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  o["records_checked"] = records_checked;
  if (ok) {
    o["first_broken_trace_id"] = nullptr;
  } else {
    o["first_broken_trace_id"] = first_broken_trace_id;
    o["first_broken_sequence"] = first_broken_sequence;
    o["reason"] = reason;
  }
  return jsonlite::to_json(o);
}

IntegrityReport verify_chain_records(const std::vector<TraceRecord>& records, uint64_t from, uint64_t to) {
  return verify_range(records, from, to);
}

// ---------------------------------------------------------------------------
// TraceLedger
// ---------------------------------------------------------------------------

TraceLedger::TraceLedger(std::shared_ptr<ILogStore> store, LedgerOptions options)
    : store_(std::move(store)), options_(options), tail_hash_(ledger_genesis_hash()) {
  if (options_.commit_batch == 0) options_.commit_batch = 1;
  if (!store_) return;
  reload();
  // Without the stored history the next sequence and prev_hash are unknown;
  // the ledger stays read-only and append() refuses.
  if (!load_status_.ok) return;
  committer_ = std::thread([this] { committer_loop(); });
}

TraceLedger::~TraceLedger() {
  if (!committer_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(commit_mu_);
    stopping_ = true;
  }
  commit_cv_.notify_all();
  committer_.join();
}

void TraceLedger::reload() {
  std::vector<std::string> lines;
  load_status_ = store_->read_all(&lines);
  if (!load_status_.ok) return;

  for (const auto& line : lines) {
    const uint64_t pos = arena_.size();
    std::string why;
    auto rec = record_from_json(line, &why);
    if (!rec) {
      ++unparseable_on_load_;
      arena_.push_back(unparseable_placeholder(pos, why));
      continue;
    }
    by_id_.emplace(rec->trace_id, pos);
    arena_.push_back(std::move(*rec));
  }
  if (!arena_.empty()) tail_hash_ = arena_.back().chain_hash;
  committed_ = enqueued_ = arena_.size();
}

AppendResult TraceLedger::append(TraceRecord record) {
  AppendResult out;
  if (record.trace_id.empty()) {
    out.status = Status::failure(ErrorCode::validation_error, "trace_id must not be empty");
    return out;
  }

  if (store_ && !load_status_.ok) {
    out.status = Status::failure(ErrorCode::storage_error,
                                 "ledger history failed to load: " + load_status_.message);
    return out;
  }

  std::lock_guard<std::mutex> writer(append_mu_);
  // Only this writer mutates the arena, so reads below need no rw_ lock.
  if (auto it = by_id_.find(record.trace_id); it != by_id_.end()) {
    out.record = arena_[it->second];
    out.duplicate = true;
    return out;
  }

  record.sequence = arena_.size();
  record.prev_hash = tail_hash_;
  record.record_version = version::LEDGER_RECORD_VERSION;
  if (record.timestamp_unix_ms == 0) record.timestamp_unix_ms = now_unix_ms();
  record.chain_hash = chain_link_hash(record.prev_hash, canonical_record(record));

  std::string line = store_ ? record_to_json(record) : std::string();
  {
    std::unique_lock<std::shared_mutex> lk(rw_);
    arena_.push_back(record);
    by_id_.emplace(record.trace_id, record.sequence);
    tail_hash_ = record.chain_hash;
  }
  global_engine_stats().ledger_appends.fetch_add(1, std::memory_order_relaxed);

  if (store_) {
    bool wake = false;
    {
      std::lock_guard<std::mutex> lk(commit_mu_);
      pending_.push_back(std::move(line));
      ++enqueued_;
      wake = pending_.size() >= options_.commit_batch;
    }
    if (wake) commit_cv_.notify_one();
  }

  out.record = std::move(record);
  return out;
}

void TraceLedger::committer_loop() {
  const auto interval = std::chrono::milliseconds(options_.flush_interval_ms);
  std::unique_lock<std::mutex> lk(commit_mu_);
  for (;;) {
    commit_cv_.wait_for(lk, interval, [this] {
      return stopping_ || pending_.size() >= options_.commit_batch ||
             (flush_waiters_ > 0 && !pending_.empty());
    });
    if (pending_.empty()) {
      if (stopping_) return;
      continue;
    }

    // Appenders only push_back, so the front n lines are stable while the
    // lock is released.
    const size_t n = std::min(options_.commit_batch, pending_.size());
    std::vector<std::string> batch(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
    lk.unlock();
    Status st = store_->append_batch(batch);
    lk.lock();

    const bool batch_ok = st.ok;
    auto& stats = global_engine_stats();
    if (batch_ok) {
      pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
      committed_ += n;
      stats.ledger_commit_batches.fetch_add(1, std::memory_order_relaxed);
    } else {
      last_commit_error_ = std::move(st);
      ++failure_generation_;
      stats.ledger_commit_failures.fetch_add(1, std::memory_order_relaxed);
    }
    flushed_cv_.notify_all();
    if (!batch_ok) {
      if (stopping_) return;  // the store refuses writes; do not spin on shutdown
      // Back off one interval before retrying the same batch.
      commit_cv_.wait_for(lk, interval, [this] { return stopping_; });
    }
  }
}

Status TraceLedger::flush() {
  if (!store_) return Status::success();
  if (!load_status_.ok) {
    return Status::failure(ErrorCode::storage_error, "ledger history failed to load: " + load_status_.message);
  }
  std::unique_lock<std::mutex> lk(commit_mu_);
  const uint64_t target = enqueued_;
  const uint64_t generation = failure_generation_;
  ++flush_waiters_;
  commit_cv_.notify_one();
  flushed_cv_.wait(lk, [&] { return committed_ >= target || failure_generation_ != generation; });
  --flush_waiters_;
  if (committed_ >= target) return Status::success();
  return last_commit_error_;
}

uint64_t TraceLedger::committed_count() const {
  std::lock_guard<std::mutex> lk(commit_mu_);
  return committed_;
}

std::optional<TraceRecord> TraceLedger::get(const std::string& trace_id) const {
  std::shared_lock<std::shared_mutex> lk(rw_);
  auto it = by_id_.find(trace_id);
  if (it == by_id_.end()) return std::nullopt;
  return arena_[it->second];
}

std::vector<TraceRecord> TraceLedger::range_query(const std::string& function_id, TimestampMs start,
                                                  TimestampMs end) const {
  std::vector<TraceRecord> out;
  std::shared_lock<std::shared_mutex> lk(rw_);
  for (const auto& r : arena_) {
    if (r.function_id == function_id && r.timestamp_unix_ms >= start && r.timestamp_unix_ms < end) {
      out.push_back(r);
    }
  }
  return out;
}

std::vector<TraceRecord> TraceLedger::records(uint64_t from, uint64_t to) const {
  std::shared_lock<std::shared_mutex> lk(rw_);
  to = std::min<uint64_t>(to, arena_.size());
  if (from >= to) return {};
  return std::vector<TraceRecord>(arena_.begin() + static_cast<std::ptrdiff_t>(from),
                                  arena_.begin() + static_cast<std::ptrdiff_t>(to));
}

uint64_t TraceLedger::size() const {
  std::shared_lock<std::shared_mutex> lk(rw_);
  return arena_.size();
}

std::string TraceLedger::tail_hash() const {
  std::shared_lock<std::shared_mutex> lk(rw_);
  return tail_hash_;
}

IntegrityReport TraceLedger::verify_integrity(uint64_t from, uint64_t to) const {
  std::shared_lock<std::shared_mutex> lk(rw_);
  return verify_range(arena_, from, to);
}

}  // namespace arbiter
