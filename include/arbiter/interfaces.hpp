#pragma once

// arbiter/interfaces.hpp — Capability interfaces for external collaborators.
//
// The core never talks to a concrete provider. Every collaborator is a remote,
// fallible dependency: implementations report unavailability in-band
// (available=false / ok=false) instead of throwing, and must be safe for
// concurrent calls.
//
// RETRY POLICY (owned by the callers, not the implementations):
//   - IFeatureStore reads are idempotent; the engine retries them with
//     bounded exponential backoff when retryable=true.
//   - ISigner and ILegalReferenceValidator are consulted once. Failures fail
//     fast with external_dependency.
//
// In-memory implementations live in fakes.hpp.

#include <map>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// Legal Reference Validator
// ---------------------------------------------------------------------------
struct LegalReferenceCheck {
  bool available{true};  // false = validator could not be reached
  bool valid{false};
  std::string title;
  std::string section;
  std::string message;
};

class ILegalReferenceValidator {
 public:
  virtual ~ILegalReferenceValidator() = default;
  virtual LegalReferenceCheck validate(const std::string& iri) const = 0;
};

// ---------------------------------------------------------------------------
// Signer (KMS)
// ---------------------------------------------------------------------------
struct SignResult {
  bool ok{false};
  std::string signature;  // hex
  std::string error;
};

struct VerifyResult {
  bool available{true};
  bool valid{false};
  std::string error;
};

class ISigner {
 public:
  virtual ~ISigner() = default;
  virtual SignResult sign(const std::string& payload, const std::string& key_id) const = 0;
  virtual VerifyResult verify(const std::string& payload, const std::string& signature,
                              const std::string& key_id) const = 0;
};

// ---------------------------------------------------------------------------
// Feature Store
// ---------------------------------------------------------------------------
struct FeatureValue {
  jsonlite::Value value;
  TimestampMs observed_at_unix_ms{0};
};

struct FeatureFetchResult {
  bool ok{true};
  bool retryable{false};
  std::string error;
  // Names with no value known at as_of are absent.
  std::map<std::string, FeatureValue> values;
};

class IFeatureStore {
 public:
  virtual ~IFeatureStore() = default;

  // Point-in-time read: for each name, the latest value with
  // observed_at <= as_of. Values observed after as_of must never be returned.
  virtual FeatureFetchResult get_features_at(const std::string& entity_id,
                                             const std::vector<std::string>& names,
                                             TimestampMs as_of_unix_ms) const = 0;
};

}  // namespace arbiter
