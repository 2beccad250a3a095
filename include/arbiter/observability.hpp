#pragma once

// arbiter/observability.hpp — Structured decision observability layer.
//
// DESIGN:
//   DecisionEvent is the canonical observable unit. Every execute() and every
//   audit replay emits one DecisionEvent, which is:
//     - recorded into the process-wide EngineStats (counters, latency
//       histogram, failure categories, recent-event ring);
//     - handed to a registered hook if one is installed;
//     - otherwise appended as one JSON line to the event log file named by
//       set_event_log_path() or the ARBITER_EVENT_LOG environment variable.
//
// Events carry digests and identifiers only, never input or output payloads.
// The trace ledger, not this layer, is the system of record.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Current: JSONL stream or in-memory accumulation.
//   Upgrade: implement an exporter hook that maps DecisionEvent to spans.
//   Invariant: event emission must NEVER fail an execute().

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// DecisionEvent — per-call observable unit
// ---------------------------------------------------------------------------
struct DecisionEvent {
  std::string kind{"execute"};  // execute | replay
  std::string trace_id;
  std::string function_id;
  std::string version;
  std::string caller_id;

  // Duration breakdown (nanoseconds)
  uint64_t duration_ns{0};
  uint64_t feature_fetch_ns{0};
  uint64_t eval_ns{0};
  uint64_t append_ns{0};

  uint32_t feature_fetch_attempts{0};
  size_t bytes_in{0};
  bool idempotent_hit{false};   // request_key matched an existing trace
  bool traced{true};            // false only for cancelled calls

  // Replay-only
  bool replay_match{false};
  std::string drift_classification;

  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
};

std::string decision_event_to_json(const DecisionEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
// Invariant: bucket boundaries are fixed; readers may have serialized them.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  // MICRO_DOCUMENTED: buckets_ aligned to 64-byte boundary to avoid false
  // sharing with count_/sum_us_ under concurrent record().
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// FailureCategoryStats — failures keyed by ErrorCode
// ---------------------------------------------------------------------------
class FailureCategoryStats {
 public:
  static constexpr size_t kCategories = static_cast<size_t>(ErrorCode::json_parse_error) + 1;

  void record(ErrorCode code);
  uint64_t count(ErrorCode code) const;
  uint64_t total() const;
  std::string to_json() const;  // only non-zero categories

 private:
  std::array<std::atomic<uint64_t>, kCategories> counts_{};
};

// ---------------------------------------------------------------------------
// EngineStats — process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the ring buffer uses a mutex.
class EngineStats {
 public:
  void record_event(const DecisionEvent& ev);
  std::string to_json() const;

  // --- Execution counters ---
  alignas(64) std::atomic<uint64_t> total_executions{0};
  alignas(64) std::atomic<uint64_t> successful_executions{0};
  alignas(64) std::atomic<uint64_t> failed_executions{0};
  alignas(64) std::atomic<uint64_t> cancelled_executions{0};
  alignas(64) std::atomic<uint64_t> idempotent_hits{0};
  alignas(64) std::atomic<uint64_t> feature_fetch_retries{0};

  // --- Replay counters ---
  alignas(64) std::atomic<uint64_t> replays{0};
  alignas(64) std::atomic<uint64_t> replay_matches{0};
  alignas(64) std::atomic<uint64_t> determinism_violations{0};

  // --- Ledger counters (updated by the committer) ---
  alignas(64) std::atomic<uint64_t> ledger_appends{0};
  alignas(64) std::atomic<uint64_t> ledger_commit_batches{0};
  alignas(64) std::atomic<uint64_t> ledger_commit_failures{0};

  FailureCategoryStats failure_categories;
  LatencyHistogram latency_histogram;

  // MICRO_OPT: O(1) circular buffer. ring_head_ always points to the next
  // slot to overwrite (the oldest entry once full).
  static constexpr size_t kMaxRecentEvents = 1000;
  std::vector<DecisionEvent> recent_events_snapshot() const;  // oldest first

 private:
  mutable std::mutex ring_mu_;
  std::vector<DecisionEvent> ring_buffer_;
  size_t ring_head_{0};
};

EngineStats& global_engine_stats();

// Record, then forward to the hook or the JSONL event log. Never throws.
void emit_decision_event(const DecisionEvent& ev);

using DecisionEventHook = void (*)(const DecisionEvent&);
void set_decision_event_hook(DecisionEventHook hook);

// Overrides ARBITER_EVENT_LOG. Empty string restores the environment lookup.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace arbiter
