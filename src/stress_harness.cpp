// stress_harness.cpp — Concurrent execution stress harness.
//
// Drives arbiter through the engine API against file-backed storage:
//   - one signed, ACTIVE rule-set function (loan_eligibility 1.0.0)
//   - 50 distinct caller ids
//   - 1,000 concurrent execute() calls (burst, one thread per call)
//   - mixed inputs: approve / decline / schema-invalid
//
// FAIL conditions (non-zero exit):
//   - decision record count != executions
//   - verify_integrity() false, live or after reopening the ledger file
//   - two records sharing a prev_hash (total order broken)
//   - any determinism violation in a replay sample
//   - any execute() that returned without a trace
//
// Produces: artifacts/reports/ARBITER_STRESS_REPORT.json

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "arbiter/audit.hpp"
#include "arbiter/cas.hpp"
#include "arbiter/config.hpp"
#include "arbiter/engine.hpp"
#include "arbiter/fakes.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/kv_store.hpp"
#include "arbiter/ledger.hpp"
#include "arbiter/log_store.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/registry.hpp"

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using Ms = std::chrono::duration<double, std::milli>;

namespace {

constexpr int kNumCallers = 50;
constexpr int kConcurrent = 1000;
constexpr size_t kReplaySample = 200;

const char* kRules = R"({
  "rules": [
    {"rule_id": "prime", "priority": 10, "match": "all",
     "conditions": [{"field": "credit_score", "operator": ">=", "value": 700},
                    {"field": "amount", "operator": "<=", "value": 10000}],
     "result": {"eligible": true, "reason": "prime"}}
  ],
  "default_result": {"eligible": false, "reason": "default"}
})";

const char* kInputSchema = R"({
  "credit_score": {"type": "integer", "required": true, "min": 300, "max": 850},
  "amount": {"type": "number", "required": true, "min": 0}
})";

const char* kOutputSchema = R"({
  "eligible": {"type": "boolean", "required": true, "decision": true},
  "reason": {"type": "string"}
})";

// ---- helpers ---------------------------------------------------------------

std::string fmt_double(double v, int prec = 3) {
  std::ostringstream oss;
  oss.precision(prec);
  oss << std::fixed << v;
  return oss.str();
}

std::string caller_id(int i) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "caller-%03d", i + 1);
  return buf;
}

double percentile(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  const std::size_t idx = static_cast<std::size_t>((sorted.size() - 1) * p);
  return sorted[std::min(idx, sorted.size() - 1)];
}

void write_report(const std::string& path, const std::string& json) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
  ofs << json;
}

// ---- statistics aggregator -------------------------------------------------

struct Stats {
  std::mutex mu;
  std::vector<double> latencies;
  std::map<std::string, int> error_dist;
  std::map<std::string, int> per_caller;
  int success{0};
  int failure{0};
  int untraced{0};

  void record(const std::string& caller, const arbiter::DecisionResult& r, double latency_ms) {
    std::lock_guard<std::mutex> lock(mu);
    latencies.push_back(latency_ms);
    per_caller[caller]++;
    if (!r.traced) ++untraced;
    if (r.status.ok) {
      ++success;
    } else {
      ++failure;
      error_dist[arbiter::to_string(r.status.code)]++;
    }
  }

  std::string to_json(double wall_s) const {
    std::vector<double> sorted_lat = latencies;
    std::sort(sorted_lat.begin(), sorted_lat.end());
    const int total = success + failure;
    std::ostringstream oss;
    oss << "{"
        << "\"total\":" << total << ",\"success\":" << success << ",\"failure\":" << failure
        << ",\"untraced\":" << untraced << ",\"callers\":" << per_caller.size()
        << ",\"throughput_ops_sec\":" << fmt_double(total / (wall_s > 0 ? wall_s : 1.0))
        << ",\"latency_ms\":{"
        << "\"p50\":" << fmt_double(percentile(sorted_lat, 0.50))
        << ",\"p95\":" << fmt_double(percentile(sorted_lat, 0.95))
        << ",\"p99\":" << fmt_double(percentile(sorted_lat, 0.99))
        << ",\"max\":" << fmt_double(sorted_lat.empty() ? 0.0 : sorted_lat.back()) << "}"
        << ",\"error_dist\":{";
    bool first = true;
    for (const auto& [code, cnt] : error_dist) {
      if (!first) oss << ",";
      first = false;
      oss << "\"" << code << "\":" << cnt;
    }
    oss << "}}";
    return oss.str();
  }
};

bool release(arbiter::DecisionRegistry& registry, const arbiter::KeyedBlake3Signer& signer) {
  using arbiter::SignerRole;
  arbiter::DraftRequest draft;
  draft.function_id = "loan_eligibility";
  draft.version = "1.0.0";
  draft.ruleset_json = kRules;
  draft.input_schema_json = kInputSchema;
  draft.output_schema_json = kOutputSchema;
  draft.metadata.author = "alice";

  auto reg = registry.register_draft(draft, "alice");
  if (!reg.status.ok) {
    std::cerr << "register_draft: " << reg.status.to_json() << "\n";
    return false;
  }
  if (!registry.request_release("loan_eligibility", "1.0.0", "alice").status.ok) return false;
  for (const auto& [who, role] : {std::pair<std::string, SignerRole>{"alice", SignerRole::owner},
                                  std::pair<std::string, SignerRole>{"bob", SignerRole::reviewer}}) {
    const auto artifact = registry.get("loan_eligibility", "1.0.0");
    const auto sig = signer.sign(arbiter::DecisionRegistry::release_payload(*artifact, role), who + "-key");
    auto st = registry.sign("loan_eligibility", "1.0.0", who, role, sig.signature, who + "-key");
    if (!st.status.ok) {
      std::cerr << "sign(" << who << "): " << st.status.to_json() << "\n";
      return false;
    }
  }
  auto act = registry.activate("loan_eligibility", "1.0.0", 1, "alice");
  if (!act.status.ok) {
    std::cerr << "activate: " << act.status.to_json() << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const auto base_tmp = fs::temp_directory_path() / "arbiter_stress_harness";
  fs::remove_all(base_tmp);
  fs::create_directories(base_tmp);

  const auto hi = arbiter::hash_runtime_info();
  if (!hi.blake3_available || hi.primitive != "blake3") {
    std::cerr << "FATAL: BLAKE3 not available, aborting stress harness\n";
    return 1;
  }

  arbiter::EngineConfig config;
  config.ledger_path = (base_tmp / "ledger.ndjson").string();
  config.cas_root = (base_tmp / "cas").string();
  config.registry_root = (base_tmp / "registry").string();
  std::vector<std::string> warnings;
  arbiter::apply_env_overrides(&config, &warnings);
  for (const auto& w : warnings) std::cerr << "[stress] config warning: " << w << "\n";

  arbiter::KeyedBlake3Signer signer;
  signer.add_key("alice-key", "alice secret");
  signer.add_key("bob-key", "bob secret");
  arbiter::PatternLegalReferenceValidator legal;
  auto features = std::make_shared<arbiter::InMemoryFeatureStore>();

  auto log_store = std::make_shared<arbiter::FileLogStore>(config.ledger_path);
  arbiter::CasStore cas(config.cas_root);
  Stats stats;
  double wall_s = 0.0;
  std::string replay_json = "null";
  uint64_t determinism_violations = 0;
  uint64_t decision_records = 0;
  uint64_t ledger_size = 0;
  bool prev_unique = true;
  bool live_integrity = false;

  {
    arbiter::TraceLedger ledger(log_store, config.ledger_options());
    arbiter::DecisionRegistry registry(std::make_shared<arbiter::FileKvStore>(config.registry_root), ledger,
                                       signer, legal);
    if (!release(registry, signer)) {
      std::cerr << "FATAL: could not release loan_eligibility\n";
      return 1;
    }
    arbiter::DecisionEngine engine(registry, ledger, cas, features, config);

    // ---- Burst: 1,000 concurrent executions ------------------------------
    std::cout << "[stress] concurrent: " << kConcurrent << " executions from " << kNumCallers << " callers...\n";
    const auto t0 = Clock::now();
    {
      std::vector<std::thread> threads;
      threads.reserve(kConcurrent);
      for (int i = 0; i < kConcurrent; ++i) {
        threads.emplace_back([&, i]() {
          arbiter::ExecuteRequest req;
          req.function_id = "loan_eligibility";
          req.caller_id = caller_id(i % kNumCallers);
          switch (i % 10) {
            case 9:  // schema-invalid: traced as ERROR
              req.input["credit_score"] = 10;
              req.input["amount"] = 5000;
              break;
            default:
              req.input["credit_score"] = 600 + (i % 200);
              req.input["amount"] = 1000 + (i % 13) * 1000;
              break;
          }
          const auto c0 = Clock::now();
          const auto r = engine.execute(req);
          stats.record(req.caller_id, r, Ms(Clock::now() - c0).count());
        });
      }
      for (auto& t : threads) t.join();
    }
    wall_s = std::chrono::duration<double>(Clock::now() - t0).count();
    std::cout << "[stress] concurrent done in " << fmt_double(wall_s) << "s\n";

    const auto flushed = ledger.flush();
    if (!flushed.ok) std::cerr << "[stress] flush: " << flushed.to_json() << "\n";

    // ---- Total order ------------------------------------------------------
    const auto records = ledger.records();
    ledger_size = records.size();
    std::set<std::string> prevs;
    for (const auto& r : records) {
      if (r.is_decision()) ++decision_records;
      if (!prevs.insert(r.prev_hash).second) prev_unique = false;
    }
    live_integrity = ledger.verify_integrity().ok;

    // ---- Determinism sample -----------------------------------------------
    arbiter::AuditService audit(registry, ledger, cas, engine);
    auto sample = audit.sample_traces("loan_eligibility", 0, arbiter::kOpenEnded, kReplaySample);
    const auto bulk = audit.bulk_replay("loan_eligibility", "1.0.0", sample, 8);
    determinism_violations = bulk.determinism_violations;
    std::ostringstream rj;
    rj << "{\"sample\":" << bulk.total << ",\"matches\":" << bulk.matches
       << ",\"match_rate\":" << fmt_double(bulk.match_rate, 6)
       << ",\"determinism_violations\":" << bulk.determinism_violations
       << ",\"gate\":\"" << (bulk.gate_passed ? "PASS" : "FAIL") << "\"}";
    replay_json = rj.str();
  }

  // ---- Reopen from disk ----------------------------------------------------
  bool reopened_integrity = false;
  uint64_t reopened_size = 0;
  {
    arbiter::TraceLedger reopened(std::make_shared<arbiter::FileLogStore>(config.ledger_path),
                                  config.ledger_options());
    reopened_size = reopened.size();
    reopened_integrity = reopened.load_status().ok && reopened.verify_integrity().ok;
  }

  const bool count_pass = decision_records == static_cast<uint64_t>(kConcurrent);
  const bool overall_pass = count_pass && live_integrity && reopened_integrity && reopened_size == ledger_size &&
                            prev_unique && determinism_violations == 0 && stats.untraced == 0;

  std::ostringstream report;
  report << "{"
         << "\"schema\":\"arbiter_stress_report_v1\""
         << ",\"pass\":" << (overall_pass ? "true" : "false")
         << ",\"concurrent\":" << stats.to_json(wall_s)
         << ",\"ledger\":{"
         << "\"records\":" << ledger_size
         << ",\"decision_records\":" << decision_records
         << ",\"prev_hash_unique\":" << (prev_unique ? "true" : "false")
         << ",\"integrity\":" << (live_integrity ? "true" : "false")
         << ",\"reopened_records\":" << reopened_size
         << ",\"reopened_integrity\":" << (reopened_integrity ? "true" : "false") << "}"
         << ",\"replay\":" << replay_json
         << ",\"engine_stats\":" << arbiter::global_engine_stats().to_json()
         << ",\"hash_primitive\":\"" << hi.primitive << "\""
         << "}";

  const std::string report_path = "artifacts/reports/ARBITER_STRESS_REPORT.json";
  write_report(report_path, report.str());
  std::cout << "[stress] report written: " << report_path << "\n";
  std::cout << "[stress] pass=" << (overall_pass ? "true" : "false") << "\n";

  fs::remove_all(base_tmp);
  return overall_pass ? 0 : 1;
}
