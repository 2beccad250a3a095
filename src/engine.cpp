#include "arbiter/engine.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <system_error>
#include <thread>

#include "arbiter/hash.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/schema.hpp"

namespace arbiter {

namespace {

using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

// Granularity at which a bounded wait notices caller cancellation.
constexpr int64_t kPollSliceMs = 2;

template <typename T>
struct Bounded {
  std::optional<T> value;
  bool timed_out{false};
  bool cancelled{false};
  std::string spawn_error;
};

// Runs fn on a detached thread and waits at most timeout_ms for it. On
// timeout or caller cancellation *stop is raised and the thread is abandoned;
// fn must own everything it touches and must not throw.
template <typename T, typename Fn>
Bounded<T> run_bounded(Fn fn, uint64_t timeout_ms, const std::shared_ptr<std::atomic<bool>>& caller_cancel,
                       const std::shared_ptr<std::atomic<bool>>& stop) {
  Bounded<T> out;
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();
  try {
    std::thread([fn = std::move(fn), promise]() mutable { promise->set_value(fn()); }).detach();
  } catch (const std::system_error& e) {
    out.spawn_error = std::string("cannot start worker thread: ") + e.what();
    return out;
  }

  const auto deadline = Clock::now() + Millis(timeout_ms);
  for (;;) {
    const auto now = Clock::now();
    if (now >= deadline) {
      stop->store(true, std::memory_order_release);
      out.timed_out = true;
      return out;
    }
    const auto slice = std::min<Clock::duration>(deadline - now, Millis(kPollSliceMs));
    if (future.wait_for(slice) == std::future_status::ready) {
      out.value = future.get();
      return out;
    }
    if (caller_cancel && caller_cancel->load(std::memory_order_acquire)) {
      stop->store(true, std::memory_order_release);
      out.cancelled = true;
      return out;
    }
  }
}

struct EvalOutcome {
  jsonlite::Object output;
  ErrorCode code{ErrorCode::none};
  std::string message;
};

EvalOutcome run_logic(const Evaluatable& logic, const jsonlite::Object& input, const EvalContext& ctx) {
  EvalOutcome out;
  try {
    out.output = logic.execute(input, ctx);
  } catch (const EvaluationCancelled& e) {
    out.code = ErrorCode::cancelled;
    out.message = e.what();
  } catch (const std::exception& e) {
    out.code = ErrorCode::execution_error;
    out.message = e.what();
  } catch (...) {
    out.code = ErrorCode::execution_error;
    out.message = "decision logic threw a non-standard exception";
  }
  return out;
}

// execution_timeout_ms == 0 evaluates inline on the caller's thread.
EvalOutcome evaluate_bounded(std::shared_ptr<const Evaluatable> logic, jsonlite::Object input, EvalContext ctx,
                             uint64_t timeout_ms, const std::shared_ptr<std::atomic<bool>>& caller_cancel) {
  if (timeout_ms == 0) {
    ctx.cancel_flag = caller_cancel;
    return run_logic(*logic, input, ctx);
  }
  auto stop = std::make_shared<std::atomic<bool>>(false);
  ctx.cancel_flag = stop;
  auto bounded = run_bounded<EvalOutcome>(
      [logic = std::move(logic), input = std::move(input), ctx = std::move(ctx)]() {
        return run_logic(*logic, input, ctx);
      },
      timeout_ms, caller_cancel, stop);
  if (bounded.value) return std::move(*bounded.value);

  EvalOutcome out;
  if (bounded.cancelled) {
    out.code = ErrorCode::cancelled;
    out.message = "cancelled during evaluation";
  } else if (!bounded.spawn_error.empty()) {
    out.code = ErrorCode::execution_error;
    out.message = bounded.spawn_error;
  } else {
    out.code = ErrorCode::execution_timeout;
    out.message = "evaluation exceeded " + std::to_string(timeout_ms) + " ms";
  }
  return out;
}

std::string error_detail(const Status& st) {
  jsonlite::Object o;
  o["message"] = st.message;
  jsonlite::Array details;
  for (const auto& d : st.details) details.emplace_back(d);
  o["details"] = std::move(details);
  return jsonlite::to_json(o);
}

// Entity id for the feature store, read from metadata.entity_field.
std::optional<std::string> entity_id_of(const DecisionFunctionArtifact& artifact, const jsonlite::Object& input) {
  const jsonlite::Value* entity = jsonlite::find_path(input, artifact.metadata.entity_field);
  if (entity && entity->is_string()) return std::get<std::string>(entity->v);
  if (entity && std::holds_alternative<std::uint64_t>(entity->v)) {
    return std::to_string(std::get<std::uint64_t>(entity->v));
  }
  return std::nullopt;
}

Status entity_field_error(const DecisionFunctionArtifact& artifact) {
  return Status::failure(ErrorCode::validation_error, "entity field '" + artifact.metadata.entity_field +
                                                          "' must be a string or non-negative integer");
}

uint64_t elapsed_ns(Clock::time_point since) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - since).count());
}

}  // namespace

std::string DecisionResult::to_json() const {
  jsonlite::Object o;
  o["status"] = jsonlite::parse_value(status.to_json());
  o["trace_id"] = trace_id;
  o["function_id"] = function_id;
  o["version"] = version;
  o["output"] = output;
  o["input_hash"] = input_hash;
  o["output_hash"] = output_hash;
  o["feature_snapshot_ref"] = feature_snapshot_ref;
  o["idempotent_hit"] = idempotent_hit;
  o["traced"] = traced;
  return jsonlite::to_json(o);
}

DecisionEngine::DecisionEngine(const DecisionRegistry& registry, TraceLedger& ledger, ICASBackend& cas,
                               std::shared_ptr<const IFeatureStore> features, EngineConfig config)
    : registry_(registry), ledger_(ledger), cas_(cas), features_(std::move(features)), config_(std::move(config)) {}

// ---------------------------------------------------------------------------
// Feature fetch
// ---------------------------------------------------------------------------

DecisionEngine::Fetched DecisionEngine::fetch_features(const DecisionFunctionArtifact& artifact,
                                                       const std::string& entity_id, TimestampMs as_of,
                                                       const std::shared_ptr<std::atomic<bool>>& cancel) const {
  Fetched out;
  const std::vector<std::string>& names = artifact.metadata.features;
  if (!features_) {
    out.status = Status::failure(ErrorCode::external_dependency, "no feature store configured");
    return out;
  }

  const auto start = Clock::now();
  const auto budget = Millis(config_.feature_fetch_timeout_ms);
  uint64_t backoff_ms = config_.feature_fetch_backoff_ms;
  std::string last_error;

  for (uint32_t attempt = 1; attempt <= config_.feature_fetch_max_attempts; ++attempt) {
    const auto spent = Clock::now() - start;
    if (spent >= budget) {
      last_error = "fetch budget of " + std::to_string(config_.feature_fetch_timeout_ms) + " ms exhausted";
      break;
    }
    out.attempts = attempt;
    const auto remaining = std::chrono::duration_cast<Millis>(budget - spent);
    const uint64_t remaining_ms = std::max<int64_t>(1, remaining.count());

    auto stop = std::make_shared<std::atomic<bool>>(false);
    auto bounded = run_bounded<FeatureFetchResult>(
        [store = features_, entity_id, names, as_of]() {
          try {
            return store->get_features_at(entity_id, names, as_of);
          } catch (const std::exception& e) {
            FeatureFetchResult r;
            r.ok = false;
            r.retryable = true;
            r.error = e.what();
            return r;
          }
        },
        remaining_ms, cancel, stop);

    if (bounded.cancelled) {
      out.status = Status::failure(ErrorCode::cancelled, "cancelled during feature fetch");
      return out;
    }
    if (!bounded.value) {
      last_error = bounded.spawn_error.empty() ? "feature store did not answer within the fetch budget"
                                               : bounded.spawn_error;
      break;
    }

    FeatureFetchResult r = std::move(*bounded.value);
    if (r.ok) {
      for (const auto& name : names) {
        auto it = r.values.find(name);
        if (it == r.values.end()) continue;
        if (it->second.observed_at_unix_ms > as_of) {
          out.status = Status::failure(
              ErrorCode::external_dependency,
              "point-in-time violation: feature '" + name + "' observed at " +
                  format_iso8601_utc(it->second.observed_at_unix_ms) + " is later than as_of " +
                  format_iso8601_utc(as_of));
          return out;
        }
        out.values[name] = it->second.value;
        jsonlite::Object entry;
        entry["observed_at"] = it->second.observed_at_unix_ms;
        entry["value"] = it->second.value;
        out.snapshot[name] = std::move(entry);
      }
      out.status = Status::success();
      return out;
    }

    last_error = r.error;
    if (!r.retryable) break;
    if (attempt < config_.feature_fetch_max_attempts) {
      const auto left = budget - (Clock::now() - start);
      const auto pause = std::min<Clock::duration>(Millis(backoff_ms), left);
      if (pause > Clock::duration::zero()) std::this_thread::sleep_for(pause);
      backoff_ms *= 2;
    }
  }

  out.status = Status::failure(ErrorCode::external_dependency,
                               "feature fetch failed after " + std::to_string(out.attempts) +
                                   " attempt(s): " + last_error);
  return out;
}

// ---------------------------------------------------------------------------
// Idempotent replies
// ---------------------------------------------------------------------------

DecisionResult DecisionEngine::recorded_result(const TraceRecord& record) const {
  DecisionResult r;
  r.trace_id = record.trace_id;
  r.function_id = record.function_id;
  r.version = record.version;
  r.input_hash = record.input_hash;
  r.output_hash = record.output_hash;
  r.feature_snapshot_ref = record.feature_snapshot_ref;
  r.traced = true;
  r.idempotent_hit = true;

  if (!record.ok()) {
    const jsonlite::Object detail = jsonlite::parse(record.detail);
    r.status = Status::failure(error_code_from_string(record.error_code).value_or(ErrorCode::execution_error),
                               jsonlite::get_string(detail, "message", record.error_code),
                               jsonlite::get_string_array(detail, "details"));
    return r;
  }
  auto bytes = cas_.get(record.output_hash);
  if (!bytes) {
    r.status = Status::failure(ErrorCode::storage_error, "recorded output " + record.output_hash + " is missing from CAS");
    return r;
  }
  r.output = jsonlite::parse(*bytes);
  r.status = Status::success();
  return r;
}

// ---------------------------------------------------------------------------
// execute
// ---------------------------------------------------------------------------

DecisionResult DecisionEngine::execute(const ExecuteRequest& request) {
  const auto exec_start = Clock::now();
  DecisionEvent ev;
  ev.kind = "execute";
  ev.function_id = request.function_id;
  ev.caller_id = request.caller_id;

  DecisionResult result;
  result.function_id = request.function_id;

  auto emit = [&]() {
    ev.trace_id = result.trace_id;
    ev.version = result.version;
    ev.ok = result.status.ok;
    ev.error_code = result.status.code;
    ev.idempotent_hit = result.idempotent_hit;
    ev.traced = result.traced;
    ev.duration_ns = elapsed_ns(exec_start);
    emit_decision_event(ev);
  };
  auto caller_cancelled = [&request]() {
    return request.cancel && request.cancel->load(std::memory_order_acquire);
  };

  TraceRecord rec;
  rec.trace_id = request.request_key.empty() ? make_uuid_v4() : uuid_from_key(request.request_key);
  rec.event_type = "decision";
  rec.function_id = request.function_id;
  rec.version = request.version.value_or("");
  rec.caller_id = request.caller_id;

  // Single exit for every call past intake: cancelled calls leave no trace,
  // everything else appends exactly one record.
  auto conclude = [&](Status status) -> DecisionResult {
    if (status.code == ErrorCode::cancelled || caller_cancelled()) {
      result.trace_id.clear();
      result.output.clear();
      result.status = Status::failure(ErrorCode::cancelled, "execution cancelled before the trace was appended");
      result.traced = false;
      emit();
      return result;
    }
    rec.status = status.ok ? "OK" : "ERROR";
    rec.error_code = status.ok ? std::string() : to_string(status.code);
    if (!status.ok) {
      rec.output_hash.clear();
      rec.detail = error_detail(status);
    }

    AppendResult appended;
    {
      ScopeTimer t(ev.append_ns);
      appended = ledger_.append(rec);
    }
    if (!appended.status.ok) {
      result.status = Status::failure(ErrorCode::storage_error, "trace append failed: " + appended.status.message);
      result.traced = false;
      emit();
      return result;
    }
    if (appended.duplicate) {
      // A concurrent call carrying the same request key appended first.
      result = recorded_result(appended.record);
      emit();
      return result;
    }
    result.trace_id = appended.record.trace_id;
    result.version = appended.record.version;
    result.input_hash = appended.record.input_hash;
    result.output_hash = appended.record.output_hash;
    result.feature_snapshot_ref = appended.record.feature_snapshot_ref;
    result.traced = true;
    if (!status.ok) result.output.clear();
    result.status = std::move(status);
    emit();
    return result;
  };

  // Phase 0: Intake. Idempotent replies and early cancellation leave no new trace.
  if (!request.request_key.empty()) {
    if (auto prior = ledger_.get(rec.trace_id)) {
      if (prior->function_id != request.function_id || !prior->is_decision()) {
        result.status = Status::failure(ErrorCode::validation_error,
                                        "request_key was already used for a different request");
        emit();
        return result;
      }
      result = recorded_result(*prior);
      emit();
      return result;
    }
  }
  if (caller_cancelled()) return conclude(Status::failure(ErrorCode::cancelled, "cancelled"));
  result.trace_id = rec.trace_id;

  // Phase 1: Canonical input (determinism anchor).
  const TimestampMs as_of = request.as_of_unix_ms != 0 ? request.as_of_unix_ms : now_unix_ms();
  rec.as_of_unix_ms = as_of;
  const std::string canonical_input = jsonlite::to_json(request.input);
  ev.bytes_in = canonical_input.size();
  if (canonical_input.size() > config_.max_input_bytes) {
    rec.input_hash = cas_content_hash(canonical_input);
    return conclude(Status::failure(ErrorCode::validation_error,
                                    "input of " + std::to_string(canonical_input.size()) +
                                        " bytes exceeds max_input_bytes " + std::to_string(config_.max_input_bytes)));
  }
  rec.input_hash = cas_.put(canonical_input, config_.cas_compression);
  if (rec.input_hash.empty()) {
    rec.input_hash = cas_content_hash(canonical_input);
    return conclude(Status::failure(ErrorCode::storage_error, "cannot store input in CAS"));
  }
  std::optional<jsonlite::JsonError> parse_err;
  const jsonlite::Object input = jsonlite::parse(canonical_input, &parse_err);
  if (parse_err) {
    return conclude(Status::failure(ErrorCode::validation_error, "input is not canonical JSON: " + parse_err->message));
  }

  // Phase 2: Resolve the version effective at as_of.
  ArtifactPtr artifact;
  if (request.version) {
    artifact = registry_.get(request.function_id, *request.version);
    if (!artifact) {
      return conclude(Status::failure(ErrorCode::version_not_found,
                                      request.function_id + " " + *request.version + " is not registered"));
    }
    rec.function_hash = artifact->logic_hash;
    if (!registry_.index_snapshot()->is_effective(request.function_id, *request.version, as_of)) {
      return conclude(Status::failure(ErrorCode::inactive_function,
                                      request.function_id + " " + *request.version + " is not effective at " +
                                          format_iso8601_utc(as_of)));
    }
  } else {
    ResolveResult resolved = registry_.resolve_active(request.function_id, as_of);
    if (!resolved.status.ok) return conclude(std::move(resolved.status));
    artifact = std::move(resolved.artifact);
  }
  rec.version = artifact->version;
  rec.function_hash = artifact->logic_hash;
  result.version = artifact->version;

  // Phase 3: Input schema.
  if (auto violations = validate(artifact->input_schema, input); !violations.empty()) {
    return conclude(Status::failure(ErrorCode::validation_error, "input does not match input_schema",
                                    std::move(violations)));
  }

  // Phase 4: Point-in-time features, snapshotted to CAS for replay.
  Fetched fetched;
  std::string entity_id;
  if (!artifact->metadata.features.empty()) {
    auto entity = entity_id_of(*artifact, input);
    if (!entity) return conclude(entity_field_error(*artifact));
    entity_id = std::move(*entity);
    {
      ScopeTimer t(ev.feature_fetch_ns);
      fetched = fetch_features(*artifact, entity_id, as_of, request.cancel);
    }
    ev.feature_fetch_attempts = fetched.attempts;
    if (!fetched.status.ok) return conclude(std::move(fetched.status));
  }
  {
    jsonlite::Object snapshot;
    snapshot["as_of"] = as_of;
    snapshot["entity_id"] = entity_id;
    snapshot["features"] = fetched.snapshot;
    rec.feature_snapshot_ref = cas_.put(jsonlite::to_json(snapshot), config_.cas_compression);
    if (rec.feature_snapshot_ref.empty()) {
      return conclude(Status::failure(ErrorCode::storage_error, "cannot store feature snapshot in CAS"));
    }
  }

  // Phase 5: Evaluate, bounded by execution_timeout_ms.
  if (caller_cancelled()) return conclude(Status::failure(ErrorCode::cancelled, "cancelled"));
  EvalOutcome outcome;
  {
    ScopeTimer t(ev.eval_ns);
    EvalContext ctx;
    ctx.function_id = artifact->function_id;
    ctx.version = artifact->version;
    ctx.as_of_unix_ms = as_of;
    ctx.features = std::move(fetched.values);
    outcome = evaluate_bounded(artifact->logic, input, std::move(ctx), config_.execution_timeout_ms, request.cancel);
  }
  if (outcome.code != ErrorCode::none) return conclude(Status::failure(outcome.code, outcome.message));

  // Phase 6: Output schema.
  if (auto violations = validate(artifact->output_schema, outcome.output); !violations.empty()) {
    return conclude(Status::failure(ErrorCode::validation_error, "output does not match output_schema",
                                    std::move(violations)));
  }

  // Phase 7: Output to CAS.
  const std::string canonical_output = jsonlite::to_json(outcome.output);
  rec.output_hash = cas_.put(canonical_output, config_.cas_compression);
  if (rec.output_hash.empty()) {
    return conclude(Status::failure(ErrorCode::storage_error, "cannot store output in CAS"));
  }
  result.output = std::move(outcome.output);

  // Phase 8: Append.
  return conclude(Status::success());
}

// ---------------------------------------------------------------------------
// evaluate (replay path)
// ---------------------------------------------------------------------------

EvaluationResult DecisionEngine::evaluate(const std::string& function_id, const std::string& version,
                                          const jsonlite::Object& input, const jsonlite::Object& features,
                                          TimestampMs as_of_unix_ms) const {
  EvaluationResult out;
  ArtifactPtr artifact = registry_.get(function_id, version);
  if (!artifact) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + version + " is not registered");
    return out;
  }
  if (artifact->status == FunctionStatus::draft) {
    out.status = Status::failure(ErrorCode::inactive_function, function_id + " " + version + " is still a draft");
    return out;
  }

  const jsonlite::Object canonical = jsonlite::parse(jsonlite::to_json(input));
  if (auto violations = validate(artifact->input_schema, canonical); !violations.empty()) {
    out.status = Status::failure(ErrorCode::validation_error, "input does not match input_schema",
                                 std::move(violations));
    return out;
  }
  if (!artifact->metadata.features.empty() && !entity_id_of(*artifact, canonical)) {
    out.status = entity_field_error(*artifact);
    return out;
  }

  EvalContext ctx;
  ctx.function_id = function_id;
  ctx.version = version;
  ctx.as_of_unix_ms = as_of_unix_ms;
  ctx.features = features;
  EvalOutcome outcome = evaluate_bounded(artifact->logic, canonical, std::move(ctx), config_.execution_timeout_ms, nullptr);
  if (outcome.code != ErrorCode::none) {
    out.status = Status::failure(outcome.code, outcome.message);
    return out;
  }
  if (auto violations = validate(artifact->output_schema, outcome.output); !violations.empty()) {
    out.status = Status::failure(ErrorCode::validation_error, "output does not match output_schema",
                                 std::move(violations));
    return out;
  }
  out.canonical_output = jsonlite::to_json(outcome.output);
  out.output_hash = cas_content_hash(out.canonical_output);
  out.output = std::move(outcome.output);
  out.status = Status::success();
  return out;
}

}  // namespace arbiter
