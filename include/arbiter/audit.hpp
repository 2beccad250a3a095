#pragma once

// arbiter/audit.hpp — Independent audit and replay over the trace ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. READ-ONLY: the service holds const references to the registry, ledger,
//      CAS and engine. It never appends to the ledger; its reports are
//      separate artifacts (to_json()).
//   2. RECORDED INPUTS ONLY: replay re-evaluates the input and feature
//      snapshot stored in CAS at execution time, at the recorded as_of. The
//      live feature store is never consulted.
//   3. DETERMINISM LAW: replay against the recorded version must reproduce
//      the recorded output_hash byte for byte. Any mismatch is a
//      determinism_violation and is never folded into another class.
//
// Drift classes:
//   identical    output_hash equal
//   regression   a decision field moved out of the positive set
//   improvement  a decision field moved into the positive set (and none out)
//   neutral      outputs differ but no decision field changed polarity
//   violation    determinism violation, replay failure, or missing evidence
//
// EXTENSION_POINT: drift_policies
//   classify_drift() is the only place that knows what "better" means. A
//   per-function policy (for example numeric score thresholds) can replace
//   it without touching replay().

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arbiter/cas.hpp"
#include "arbiter/engine.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/ledger.hpp"
#include "arbiter/registry.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// ChainReport — verify_chain() result
// ---------------------------------------------------------------------------
struct ChainReport {
  IntegrityReport integrity;
  uint64_t total_records{0};
  uint64_t decision_records{0};
  uint64_t governance_records{0};
  uint64_t ok_records{0};
  uint64_t error_records{0};
  // Distinct (function_id, version) pairs seen in decision records.
  std::vector<std::pair<std::string, std::string>> coverage;
  std::string tail_hash;

  bool ok() const { return integrity.ok; }
  std::string to_json() const;
};

enum class DriftClass { identical, regression, improvement, neutral, violation };

std::string to_string(DriftClass c);

struct DriftReport {
  std::string trace_id;
  std::string function_id;
  std::string original_version;
  std::string replayed_version;
  std::string original_output_hash;
  std::string replayed_output_hash;
  bool match{false};
  DriftClass classification{DriftClass::violation};
  bool determinism_violation{false};
  std::vector<std::string> changed_fields;  // top-level output keys that differ
  ErrorCode error_code{ErrorCode::none};
  std::string message;

  std::string to_json() const;
};

struct BulkReplayReport {
  std::string function_id;
  std::string version;
  uint64_t total{0};
  uint64_t matches{0};
  uint64_t regressions{0};
  uint64_t improvements{0};
  uint64_t neutral{0};
  uint64_t violations{0};
  uint64_t determinism_violations{0};
  double match_rate{0.0};
  double regression_ratio{0.0};
  bool gate_passed{false};
  std::vector<DriftReport> reports;  // same order as the requested sample

  std::string to_json() const;
};

// Output fields that decide the outcome when the schema marks none.
const std::vector<std::string>& well_known_decision_fields();

// True for boolean true and for the strings approved, allowed, valid, success
// and eligible (case-insensitive).
bool is_positive_decision(const jsonlite::Value* v);

// Compares two outputs of the same decision. changed_fields receives every
// top-level key whose value differs.
DriftClass classify_drift(const std::vector<std::string>& decision_fields, const jsonlite::Object& original,
                          const jsonlite::Object& replayed, std::vector<std::string>* changed_fields);

class AuditService {
 public:
  // Promotion gate: regression_ratio must stay below this and no sample may
  // be a violation.
  static constexpr double kMaxRegressionRatio = 0.05;

  AuditService(const DecisionRegistry& registry, const TraceLedger& ledger, const ICASBackend& cas,
               const DecisionEngine& engine);

  ChainReport verify_chain() const;

  // against_version == nullopt replays the recorded version (determinism
  // check); otherwise a shadow run of another version.
  DriftReport replay(const std::string& trace_id,
                     const std::optional<std::string>& against_version = std::nullopt) const;

  BulkReplayReport bulk_replay(const std::string& function_id, const std::string& version,
                               const std::vector<std::string>& trace_sample, size_t parallelism = 4) const;

  // Up to limit decision trace ids of function_id with timestamp in
  // [start, end), oldest first. limit == 0 means no limit.
  std::vector<std::string> sample_traces(const std::string& function_id, TimestampMs start, TimestampMs end,
                                         size_t limit = 0) const;

 private:
  DriftReport replay_record(const TraceRecord& record, const std::optional<std::string>& against_version) const;

  const DecisionRegistry& registry_;
  const TraceLedger& ledger_;
  const ICASBackend& cas_;
  const DecisionEngine& engine_;
};

}  // namespace arbiter
