#include "arbiter/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "arbiter/jsonlite.hpp"

namespace arbiter {

namespace {

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

}  // namespace

std::string decision_event_to_json(const DecisionEvent& ev) {
  jsonlite::Object o;
  o["kind"] = ev.kind;
  o["trace_id"] = ev.trace_id;
  o["function_id"] = ev.function_id;
  o["version"] = ev.version;
  o["caller_id"] = ev.caller_id;
  o["ok"] = ev.ok;
  o["error_code"] = to_string(ev.error_code);
  o["duration_ns"] = ev.duration_ns;
  o["feature_fetch_ns"] = ev.feature_fetch_ns;
  o["eval_ns"] = ev.eval_ns;
  o["append_ns"] = ev.append_ns;
  o["feature_fetch_attempts"] = ev.feature_fetch_attempts;
  o["bytes_in"] = static_cast<uint64_t>(ev.bytes_in);
  o["idempotent_hit"] = ev.idempotent_hit;
  o["traced"] = ev.traced;
  if (ev.kind == "replay") {
    o["replay_match"] = ev.replay_match;
    o["drift_classification"] = ev.drift_classification;
  }
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  std::string out;
  out.reserve(256);
  out += "{\"count\":" + std::to_string(count());
  out += ",\"mean_us\":" + fixed(mean_us(), "%.2f");
  out += ",\"p50_us\":" + fixed(p50, "%.2f");
  out += ",\"p95_us\":" + fixed(p95, "%.2f");
  out += ",\"p99_us\":" + fixed(p99, "%.2f");
  out += ",\"p50_ms\":" + fixed(p50 / 1000.0, "%.3f");
  out += ",\"p95_ms\":" + fixed(p95 / 1000.0, "%.3f");
  out += ",\"p99_ms\":" + fixed(p99 / 1000.0, "%.3f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// FailureCategoryStats
// ---------------------------------------------------------------------------

void FailureCategoryStats::record(ErrorCode code) {
  const auto i = static_cast<size_t>(code);
  if (i < kCategories) counts_[i].fetch_add(1, std::memory_order_relaxed);
}

uint64_t FailureCategoryStats::count(ErrorCode code) const {
  const auto i = static_cast<size_t>(code);
  return i < kCategories ? counts_[i].load(std::memory_order_relaxed) : 0;
}

uint64_t FailureCategoryStats::total() const {
  uint64_t sum = 0;
  for (const auto& c : counts_) sum += c.load(std::memory_order_relaxed);
  return sum;
}

std::string FailureCategoryStats::to_json() const {
  jsonlite::Object o;
  for (size_t i = 0; i < kCategories; ++i) {
    const uint64_t n = counts_[i].load(std::memory_order_relaxed);
    if (n > 0) o[to_string(static_cast<ErrorCode>(i))] = n;
  }
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_event(const DecisionEvent& ev) {
  if (ev.kind == "replay") {
    replays.fetch_add(1, std::memory_order_relaxed);
    if (ev.replay_match) replay_matches.fetch_add(1, std::memory_order_relaxed);
    if (ev.error_code == ErrorCode::determinism_violation) {
      determinism_violations.fetch_add(1, std::memory_order_relaxed);
    }
  } else {
    total_executions.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok) {
      successful_executions.fetch_add(1, std::memory_order_relaxed);
    } else if (ev.error_code == ErrorCode::cancelled) {
      cancelled_executions.fetch_add(1, std::memory_order_relaxed);
    } else {
      failed_executions.fetch_add(1, std::memory_order_relaxed);
    }
    if (ev.idempotent_hit) idempotent_hits.fetch_add(1, std::memory_order_relaxed);
    if (ev.feature_fetch_attempts > 1) {
      feature_fetch_retries.fetch_add(ev.feature_fetch_attempts - 1, std::memory_order_relaxed);
    }
    latency_histogram.record(ev.duration_ns);
  }
  if (!ev.ok && ev.error_code != ErrorCode::none) failure_categories.record(ev.error_code);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<DecisionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  std::vector<DecisionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  auto load = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };
  const uint64_t n_replays = replays.load(std::memory_order_relaxed);
  const double match_rate =
      n_replays > 0 ? static_cast<double>(replay_matches.load(std::memory_order_relaxed)) /
                          static_cast<double>(n_replays)
                    : 0.0;

  std::string out;
  out.reserve(1024);
  out += "{\"total_executions\":" + load(total_executions);
  out += ",\"successful_executions\":" + load(successful_executions);
  out += ",\"failed_executions\":" + load(failed_executions);
  out += ",\"cancelled_executions\":" + load(cancelled_executions);
  out += ",\"idempotent_hits\":" + load(idempotent_hits);
  out += ",\"feature_fetch_retries\":" + load(feature_fetch_retries);
  out += ",\"replay\":{\"replays\":" + load(replays);
  out += ",\"matches\":" + load(replay_matches);
  out += ",\"determinism_violations\":" + load(determinism_violations);
  out += ",\"match_rate\":" + fixed(match_rate, "%.6f") + "}";
  out += ",\"ledger\":{\"appends\":" + load(ledger_appends);
  out += ",\"commit_batches\":" + load(ledger_commit_batches);
  out += ",\"commit_failures\":" + load(ledger_commit_failures) + "}";
  out += ",\"latency\":" + latency_histogram.to_json();
  out += ",\"failure_categories\":" + failure_categories.to_json();
  out += "}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<DecisionEventHook> g_event_hook{nullptr};
std::mutex g_log_path_mu;
std::string g_log_path;  // overrides ARBITER_EVENT_LOG when non-empty
std::mutex g_log_write_mu;

std::string event_log_path() {
  {
    std::lock_guard<std::mutex> lk(g_log_path_mu);
    if (!g_log_path.empty()) return g_log_path;
  }
  const char* env = std::getenv("ARBITER_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}
}  // namespace

void set_decision_event_hook(DecisionEventHook hook) { g_event_hook.store(hook, std::memory_order_release); }

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_log_path_mu);
  g_log_path = path;
}

void emit_decision_event(const DecisionEvent& ev) {
  global_engine_stats().record_event(ev);

  if (DecisionEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const std::string path = event_log_path();
  if (path.empty()) return;

  const std::string line = decision_event_to_json(ev) + "\n";
  std::lock_guard<std::mutex> lk(g_log_write_mu);
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace arbiter
