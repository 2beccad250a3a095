#pragma once

// arbiter/engine.hpp — Deterministic decision engine.
//
// execute() runs one decision end to end:
//
//   intake -> canonical input -> resolve version -> validate input
//     -> point-in-time features -> evaluate (bounded) -> validate output
//     -> CAS (input, features, output) -> ledger append
//
// DESIGN INVARIANTS (must not be broken):
//   1. ONE TRACE PER CALL: every call past intake appends exactly one
//      TraceRecord, OK or ERROR. A call cancelled before the append point
//      appends nothing and returns ErrorCode::cancelled.
//   2. WHAT WAS HASHED IS WHAT RAN: logic evaluates the re-parsed canonical
//      input, so input_hash names exactly the bytes that were evaluated.
//   3. NO WALL CLOCK IN LOGIC: features are read at as_of, never "now", and
//      any value observed after as_of is refused.
//   4. STATELESS: concurrent execute() calls share nothing mutable except the
//      ledger append and the CAS. Registry lookups go through index snapshots.
//
// EXTENSION_POINT: feature_snapshot_format
//   The snapshot stored under feature_snapshot_ref is canonical JSON
//   {"as_of","entity_id","features":{name:{observed_at,value}}}. Replay
//   reads only "features". Additional provenance can be added without
//   breaking replay as long as that member keeps its shape.

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/cas.hpp"
#include "arbiter/config.hpp"
#include "arbiter/interfaces.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/ledger.hpp"
#include "arbiter/registry.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

struct ExecuteRequest {
  std::string function_id;
  std::optional<std::string> version;  // nullopt = version effective at as_of
  jsonlite::Object input;
  std::string caller_id;               // recorded verbatim
  TimestampMs as_of_unix_ms{0};        // 0 = now
  std::string request_key;             // non-empty: idempotent execution
  std::shared_ptr<std::atomic<bool>> cancel;
};

struct DecisionResult {
  Status status;
  std::string trace_id;
  std::string function_id;
  std::string version;
  jsonlite::Object output;
  std::string input_hash;
  std::string output_hash;
  std::string feature_snapshot_ref;
  bool idempotent_hit{false};  // request_key matched a recorded trace
  bool traced{false};          // a TraceRecord exists for this call

  std::string to_json() const;
};

// Side-effect-free evaluation used by replay: no feature fetch, no ledger.
struct EvaluationResult {
  Status status;
  jsonlite::Object output;
  std::string canonical_output;
  std::string output_hash;  // cas_content_hash(canonical_output)
};

class DecisionEngine {
 public:
  DecisionEngine(const DecisionRegistry& registry, TraceLedger& ledger, ICASBackend& cas,
                 std::shared_ptr<const IFeatureStore> features, EngineConfig config = {});

  DecisionResult execute(const ExecuteRequest& request);

  // Evaluates a pinned version (any status except DRAFT) against a recorded
  // input and feature snapshot. Input and output schemas are enforced.
  EvaluationResult evaluate(const std::string& function_id, const std::string& version,
                            const jsonlite::Object& input, const jsonlite::Object& features,
                            TimestampMs as_of_unix_ms) const;

  const EngineConfig& config() const { return config_; }
  const DecisionRegistry& registry() const { return registry_; }

 private:
  struct Fetched {
    Status status;
    jsonlite::Object values;    // name -> value, handed to logic
    jsonlite::Object snapshot;  // name -> {observed_at, value}
    uint32_t attempts{0};
  };

  Fetched fetch_features(const DecisionFunctionArtifact& artifact, const std::string& entity_id,
                         TimestampMs as_of, const std::shared_ptr<std::atomic<bool>>& cancel) const;

  DecisionResult recorded_result(const TraceRecord& record) const;

  const DecisionRegistry& registry_;
  TraceLedger& ledger_;
  ICASBackend& cas_;
  std::shared_ptr<const IFeatureStore> features_;
  EngineConfig config_;
};

}  // namespace arbiter
