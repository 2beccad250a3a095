#include "arbiter/audit.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <set>
#include <thread>

#include "arbiter/hash.hpp"
#include "arbiter/observability.hpp"

namespace arbiter {

namespace {

// Failures that reflect the environment at execution time rather than the
// logic itself. Replaying them cannot confirm or refute determinism.
bool environmental_failure(ErrorCode code) {
  switch (code) {
    case ErrorCode::inactive_function:
    case ErrorCode::version_not_found:
    case ErrorCode::execution_timeout:
    case ErrorCode::external_dependency:
    case ErrorCode::storage_error:
    case ErrorCode::cancelled:
      return true;
    default:
      return false;
  }
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

jsonlite::Array string_array(const std::vector<std::string>& v) {
  jsonlite::Array a;
  for (const auto& s : v) a.emplace_back(s);
  return a;
}

std::vector<std::string> decision_fields_for(const DecisionFunctionArtifact* original,
                                             const DecisionFunctionArtifact* replayed) {
  std::set<std::string> fields;
  for (const auto* a : {original, replayed}) {
    if (!a) continue;
    for (auto& f : a->output_schema.decision_fields()) fields.insert(std::move(f));
  }
  if (fields.empty()) return well_known_decision_fields();
  return {fields.begin(), fields.end()};
}

}  // namespace

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

std::string to_string(DriftClass c) {
  switch (c) {
    case DriftClass::identical:
      return "identical";
    case DriftClass::regression:
      return "regression";
    case DriftClass::improvement:
      return "improvement";
    case DriftClass::neutral:
      return "neutral";
    case DriftClass::violation:
      return "violation";
  }
  return "violation";
}

const std::vector<std::string>& well_known_decision_fields() {
  static const std::vector<std::string> fields = {"approved", "allowed", "valid",   "success",
                                                  "status",   "eligible", "decision"};
  return fields;
}

bool is_positive_decision(const jsonlite::Value* v) {
  if (!v) return false;
  if (const bool* b = std::get_if<bool>(&v->v)) return *b;
  if (const std::string* s = std::get_if<std::string>(&v->v)) {
    static const std::set<std::string> positive = {"approved", "allowed", "valid", "success", "eligible"};
    return positive.count(lower(*s)) != 0;
  }
  return false;
}

DriftClass classify_drift(const std::vector<std::string>& decision_fields, const jsonlite::Object& original,
                          const jsonlite::Object& replayed, std::vector<std::string>* changed_fields) {
  std::set<std::string> keys;
  for (const auto& [k, _] : original) keys.insert(k);
  for (const auto& [k, _] : replayed) keys.insert(k);
  std::vector<std::string> changed;
  for (const auto& k : keys) {
    auto a = original.find(k);
    auto b = replayed.find(k);
    if (a == original.end() || b == replayed.end() || !jsonlite::equal(a->second, b->second)) changed.push_back(k);
  }
  if (changed_fields) *changed_fields = changed;
  if (changed.empty()) return DriftClass::identical;

  bool regressed = false;
  bool improved = false;
  for (const auto& field : decision_fields) {
    const jsonlite::Value* a = jsonlite::find_path(original, field);
    const jsonlite::Value* b = jsonlite::find_path(replayed, field);
    if (!a && !b) continue;
    if (a && b && jsonlite::equal(*a, *b)) continue;
    const bool was = is_positive_decision(a);
    const bool now = is_positive_decision(b);
    if (was && !now) regressed = true;
    if (!was && now) improved = true;
  }
  if (regressed) return DriftClass::regression;
  if (improved) return DriftClass::improvement;
  return DriftClass::neutral;
}

// ---------------------------------------------------------------------------
// Report serialization
// ---------------------------------------------------------------------------

std::string ChainReport::to_json() const {
  jsonlite::Object o;
  o["integrity"] = jsonlite::parse_value(integrity.to_json());
  o["total_records"] = total_records;
  o["decision_records"] = decision_records;
  o["governance_records"] = governance_records;
  o["ok_records"] = ok_records;
  o["error_records"] = error_records;
  jsonlite::Array cov;
  for (const auto& [fn, ver] : coverage) {
    jsonlite::Object c;
    c["function_id"] = fn;
    c["version"] = ver;
    cov.emplace_back(std::move(c));
  }
  o["coverage"] = std::move(cov);
  o["tail_hash"] = tail_hash;
  return jsonlite::to_json(o);
}

std::string DriftReport::to_json() const {
  jsonlite::Object o;
  o["trace_id"] = trace_id;
  o["function_id"] = function_id;
  o["original_version"] = original_version;
  o["replayed_version"] = replayed_version;
  o["original_output_hash"] = original_output_hash;
  o["replayed_output_hash"] = replayed_output_hash;
  o["match"] = match;
  o["classification"] = to_string(classification);
  o["determinism_violation"] = determinism_violation;
  o["changed_fields"] = string_array(changed_fields);
  o["error_code"] = error_code == ErrorCode::none ? std::string() : to_string(error_code);
  o["message"] = message;
  return jsonlite::to_json(o);
}

std::string BulkReplayReport::to_json() const {
  jsonlite::Object o;
  o["function_id"] = function_id;
  o["version"] = version;
  o["total"] = total;
  o["matches"] = matches;
  o["regressions"] = regressions;
  o["improvements"] = improvements;
  o["neutral"] = neutral;
  o["violations"] = violations;
  o["determinism_violations"] = determinism_violations;
  o["match_rate"] = match_rate;
  o["regression_ratio"] = regression_ratio;
  o["gate"] = gate_passed ? "PASS" : "FAIL";
  jsonlite::Array rs;
  for (const auto& r : reports) rs.emplace_back(jsonlite::parse_value(r.to_json()));
  o["reports"] = std::move(rs);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// AuditService
// ---------------------------------------------------------------------------

AuditService::AuditService(const DecisionRegistry& registry, const TraceLedger& ledger, const ICASBackend& cas,
                           const DecisionEngine& engine)
    : registry_(registry), ledger_(ledger), cas_(cas), engine_(engine) {}

ChainReport AuditService::verify_chain() const {
  ChainReport report;
  const std::vector<TraceRecord> all = ledger_.records();
  report.integrity = ledger_.verify_integrity();
  report.total_records = all.size();
  report.tail_hash = all.empty() ? ledger_genesis_hash() : all.back().chain_hash;

  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& r : all) {
    if (r.is_decision()) {
      ++report.decision_records;
      if (!r.version.empty()) seen.emplace(r.function_id, r.version);
    } else if (r.event_type == "governance") {
      ++report.governance_records;
    }
    if (r.ok()) {
      ++report.ok_records;
    } else {
      ++report.error_records;
    }
  }
  report.coverage.assign(seen.begin(), seen.end());
  return report;
}

DriftReport AuditService::replay(const std::string& trace_id,
                                 const std::optional<std::string>& against_version) const {
  auto record = ledger_.get(trace_id);
  if (!record) {
    DriftReport r;
    r.trace_id = trace_id;
    r.error_code = ErrorCode::validation_error;
    r.message = "trace " + trace_id + " not found";
    return r;
  }
  return replay_record(*record, against_version);
}

DriftReport AuditService::replay_record(const TraceRecord& record,
                                        const std::optional<std::string>& against_version) const {
  const auto t0 = std::chrono::steady_clock::now();
  DriftReport r;
  r.trace_id = record.trace_id;
  r.function_id = record.function_id;
  r.original_version = record.version;
  r.replayed_version = against_version.value_or(record.version);
  r.original_output_hash = record.output_hash;
  const bool same_version = r.replayed_version == record.version;

  auto finish = [&]() -> DriftReport {
    DecisionEvent ev;
    ev.kind = "replay";
    ev.trace_id = r.trace_id;
    ev.function_id = r.function_id;
    ev.version = r.replayed_version;
    ev.replay_match = r.match;
    ev.drift_classification = to_string(r.classification);
    ev.ok = r.classification != DriftClass::violation;
    ev.error_code = r.determinism_violation ? ErrorCode::determinism_violation : r.error_code;
    ev.duration_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count());
    emit_decision_event(ev);
    return r;
  };
  auto violation = [&](ErrorCode code, std::string message) -> DriftReport {
    r.match = false;
    r.classification = DriftClass::violation;
    r.error_code = code;
    r.message = std::move(message);
    return finish();
  };

  if (!record.is_decision()) {
    return violation(ErrorCode::validation_error, "trace " + record.trace_id + " is not a decision record");
  }
  const std::optional<ErrorCode> original_error =
      record.ok() ? std::nullopt : error_code_from_string(record.error_code);
  if (!record.ok() && original_error && environmental_failure(*original_error)) {
    r.classification = DriftClass::neutral;
    r.error_code = *original_error;
    r.message = "original call failed with " + record.error_code + ", which replay cannot reproduce";
    return finish();
  }
  // Recorded evidence. A call rejected before its input was stored (an
  // oversized input, possibly before any version was resolved) has nothing
  // to re-evaluate.
  auto input_bytes = cas_.get(record.input_hash);
  if (!input_bytes && !record.ok()) {
    r.classification = DriftClass::neutral;
    r.error_code = original_error.value_or(ErrorCode::validation_error);
    r.message = "input of a rejected call was not retained; nothing to replay";
    return finish();
  }
  if (r.replayed_version.empty()) {
    return violation(ErrorCode::version_not_found, "record carries no version to replay");
  }

  ArtifactPtr original_artifact = record.version.empty() ? nullptr : registry_.get(record.function_id, record.version);
  ArtifactPtr replay_artifact = registry_.get(record.function_id, r.replayed_version);
  if (!replay_artifact) {
    return violation(ErrorCode::version_not_found, record.function_id + " " + r.replayed_version + " is not registered");
  }
  if (same_version && !digest_equal(replay_artifact->logic_hash, record.function_hash)) {
    r.determinism_violation = true;
    return violation(ErrorCode::determinism_violation,
                     "logic_hash of " + r.replayed_version + " differs from the hash recorded in the trace");
  }

  if (!input_bytes) return violation(ErrorCode::storage_error, "recorded input " + record.input_hash + " missing from CAS");
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object input = jsonlite::parse(*input_bytes, &err);
  if (err) return violation(ErrorCode::json_parse_error, "recorded input is not JSON: " + err->message);

  jsonlite::Object features;
  if (!record.feature_snapshot_ref.empty()) {
    auto snap_bytes = cas_.get(record.feature_snapshot_ref);
    if (!snap_bytes) {
      return violation(ErrorCode::storage_error,
                       "feature snapshot " + record.feature_snapshot_ref + " missing from CAS");
    }
    const jsonlite::Object snapshot = jsonlite::parse(*snap_bytes, &err);
    if (err) return violation(ErrorCode::json_parse_error, "feature snapshot is not JSON: " + err->message);
    if (const auto* fs = jsonlite::get_object(snapshot, "features")) {
      for (const auto& [name, entry] : *fs) {
        if (const auto* e = std::get_if<jsonlite::Object>(&entry.v)) {
          auto v = e->find("value");
          if (v != e->end()) features[name] = v->second;
        }
      }
    }
  }

  const EvaluationResult replayed =
      engine_.evaluate(record.function_id, r.replayed_version, input, features, record.as_of_unix_ms);
  r.replayed_output_hash = replayed.output_hash;

  // Original ERROR: compare error codes.
  if (!record.ok()) {
    if (!replayed.status.ok && to_string(replayed.status.code) == record.error_code) {
      r.match = true;
      r.classification = DriftClass::identical;
      r.error_code = replayed.status.code;
      r.message = "replay failed with the recorded error";
      return finish();
    }
    if (same_version) {
      r.determinism_violation = true;
      return violation(ErrorCode::determinism_violation,
                       "recorded " + record.error_code + " but replay produced " +
                           (replayed.status.ok ? std::string("OK") : to_string(replayed.status.code)));
    }
    if (replayed.status.ok) {
      r.classification = DriftClass::improvement;
      r.message = "recorded " + record.error_code + "; " + r.replayed_version + " succeeds";
      return finish();
    }
    return violation(replayed.status.code, replayed.status.message);
  }

  // Original OK.
  if (!replayed.status.ok) {
    if (same_version) {
      r.determinism_violation = true;
      return violation(ErrorCode::determinism_violation,
                       "recorded OK but replay failed: " + to_string(replayed.status.code) + ": " +
                           replayed.status.message);
    }
    return violation(replayed.status.code, replayed.status.message);
  }
  if (digest_equal(replayed.output_hash, record.output_hash)) {
    r.match = true;
    r.classification = DriftClass::identical;
    return finish();
  }

  auto original_bytes = cas_.get(record.output_hash);
  jsonlite::Object original_output;
  if (original_bytes) original_output = jsonlite::parse(*original_bytes);
  if (same_version) {
    if (original_bytes) classify_drift({}, original_output, replayed.output, &r.changed_fields);
    r.determinism_violation = true;
    return violation(ErrorCode::determinism_violation,
                     "replay of " + r.replayed_version + " produced " + replayed.output_hash + ", recorded " +
                         record.output_hash);
  }
  if (!original_bytes) {
    return violation(ErrorCode::storage_error, "recorded output " + record.output_hash + " missing from CAS");
  }
  r.classification = classify_drift(decision_fields_for(original_artifact.get(), replay_artifact.get()),
                                    original_output, replayed.output, &r.changed_fields);
  return finish();
}

BulkReplayReport AuditService::bulk_replay(const std::string& function_id, const std::string& version,
                                           const std::vector<std::string>& trace_sample, size_t parallelism) const {
  BulkReplayReport report;
  report.function_id = function_id;
  report.version = version;
  report.total = trace_sample.size();
  report.reports.resize(trace_sample.size());

  const size_t n_workers = std::max<size_t>(1, std::min(parallelism, trace_sample.size()));
  std::atomic<size_t> next_job{0};
  std::vector<std::thread> workers;
  workers.reserve(n_workers);
  for (size_t w = 0; w < n_workers; ++w) {
    workers.emplace_back([&]() {
      for (;;) {
        const size_t idx = next_job.fetch_add(1);
        if (idx >= trace_sample.size()) break;
        auto record = ledger_.get(trace_sample[idx]);
        DriftReport dr;
        if (!record) {
          dr.trace_id = trace_sample[idx];
          dr.error_code = ErrorCode::validation_error;
          dr.message = "trace not found";
        } else if (record->function_id != function_id) {
          dr.trace_id = record->trace_id;
          dr.function_id = record->function_id;
          dr.error_code = ErrorCode::validation_error;
          dr.message = "trace belongs to " + record->function_id;
        } else {
          dr = replay_record(*record, version);
        }
        report.reports[idx] = std::move(dr);
      }
    });
  }
  for (auto& t : workers) t.join();

  for (const auto& dr : report.reports) {
    if (dr.match) ++report.matches;
    if (dr.determinism_violation) ++report.determinism_violations;
    switch (dr.classification) {
      case DriftClass::regression:
        ++report.regressions;
        break;
      case DriftClass::improvement:
        ++report.improvements;
        break;
      case DriftClass::neutral:
        ++report.neutral;
        break;
      case DriftClass::violation:
        ++report.violations;
        break;
      case DriftClass::identical:
        break;
    }
  }
  if (report.total > 0) {
    report.match_rate = static_cast<double>(report.matches) / static_cast<double>(report.total);
    report.regression_ratio = static_cast<double>(report.regressions) / static_cast<double>(report.total);
  }
  report.gate_passed = report.total > 0 && report.regression_ratio < kMaxRegressionRatio && report.violations == 0;
  return report;
}

std::vector<std::string> AuditService::sample_traces(const std::string& function_id, TimestampMs start,
                                                     TimestampMs end, size_t limit) const {
  std::vector<std::string> out;
  for (const auto& r : ledger_.range_query(function_id, start, end)) {
    if (!r.is_decision()) continue;
    out.push_back(r.trace_id);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

}  // namespace arbiter
