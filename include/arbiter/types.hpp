#pragma once

// arbiter/types.hpp — Core error model and shared value types.
//
// ERROR MODEL:
//   Public operations never throw. They return Status (or a result struct that
//   carries the same ok/code/message/details fields). The only place an
//   exception is expected is inside native decision logic; the engine converts
//   std::exception into ErrorCode::execution_error.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. Artifacts shared between threads are handed
//   out as std::shared_ptr<const T> and never mutated after publication.

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

enum class ErrorCode {
  none,
  // Engine, surfaced to caller and always traced.
  validation_error,
  inactive_function,
  version_not_found,
  execution_timeout,
  execution_error,
  // Registry, block progression.
  duplicate_version,
  separation_of_duties,
  rule_conflict,
  legal_reference,
  invalid_state_transition,
  signature_invalid,
  concurrent_modification,
  // Dependencies and storage.
  external_dependency,
  storage_error,
  // Audit.
  chain_integrity,
  determinism_violation,
  // Misc.
  cancelled,
  json_parse_error,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& s);

struct Status {
  bool ok{true};
  ErrorCode code{ErrorCode::none};
  std::string message;
  std::vector<std::string> details;  // one entry per violation / conflict

  static Status success() { return Status{}; }
  static Status failure(ErrorCode code, std::string message,
                        std::vector<std::string> details = {}) {
    return Status{false, code, std::move(message), std::move(details)};
  }

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------
// All timestamps are UTC milliseconds since the Unix epoch.
using TimestampMs = uint64_t;
constexpr TimestampMs kOpenEnded = std::numeric_limits<TimestampMs>::max();

TimestampMs now_unix_ms();

// "2024-05-01T12:00:00.000Z"
std::string format_iso8601_utc(TimestampMs ts);
// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z" and "YYYY-MM-DD". nullopt on anything else.
std::optional<TimestampMs> parse_iso8601_utc(const std::string& s);

// Random RFC 4122 v4 UUID.
std::string make_uuid_v4();
// Deterministic UUID-shaped id derived from a request key (BLAKE3 based).
std::string uuid_from_key(const std::string& key);

// ---------------------------------------------------------------------------
// Release lifecycle
// ---------------------------------------------------------------------------
enum class FunctionStatus {
  draft,
  pending_review,
  approved,
  active,
  deprecated,
  retired,
};

std::string to_string(FunctionStatus s);
std::optional<FunctionStatus> function_status_from_string(const std::string& s);

enum class SignerRole { owner, reviewer };

std::string to_string(SignerRole r);
std::optional<SignerRole> signer_role_from_string(const std::string& s);

struct Signature {
  std::string signer_id;
  SignerRole role{SignerRole::owner};
  std::string signature_bytes;  // hex
  std::string key_id;
  TimestampMs timestamp_unix_ms{0};
};

}  // namespace arbiter
