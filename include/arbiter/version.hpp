#pragma once

// arbiter/version.hpp — Version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the ledger, CAS, rule-set and registry
//   layers. Every component that reads a versioned record checks its
//   constant here before interpreting the data.
//
// INVARIANT:
//   All version constants are compile-time. Readers call
//   check_record_compatibility() and refuse records from a newer format than
//   this build was compiled against.
//
// EXTENSION_POINT: format_migration
//   Current: hard-fail on a newer format.
//   Upgrade path: register per-format upgraders (v1 -> v2) applied on read,
//   so an old ledger can be verified by a newer build without rewriting it.

#include <cstdint>
#include <string>

namespace arbiter {
namespace version {

// ---------------------------------------------------------------------------
// LEDGER_RECORD_VERSION
// Shape of a TraceRecord as serialized into the chain. Part of the canonical
// bytes that are hashed, so any field change requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_RECORD_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32 bytes, hex-encoded to 64 chars) with the domain
// prefixes defined in hash.hpp.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CAS_FORMAT_VERSION
// Version 2 = AB/CD/<64-char-digest> sharding with JSON .meta sidecars.
// ---------------------------------------------------------------------------
constexpr uint32_t CAS_FORMAT_VERSION = 2;

// ---------------------------------------------------------------------------
// RULESET_FORMAT_VERSION
// JSON rule-set grammar (rules[], default_result). Adding an operator does
// not require a bump; changing evaluation order does.
// ---------------------------------------------------------------------------
constexpr uint32_t RULESET_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// REGISTRY_FORMAT_VERSION
// Artifact documents stored in the versioned KV store.
// ---------------------------------------------------------------------------
constexpr uint32_t REGISTRY_FORMAT_VERSION = 1;

constexpr const char* ENGINE_SEMVER = "1.0.0";

struct VersionManifest {
  uint32_t ledger_record{LEDGER_RECORD_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cas_format{CAS_FORMAT_VERSION};
  uint32_t ruleset_format{RULESET_FORMAT_VERSION};
  uint32_t registry_format{REGISTRY_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Record compatibility — called by every reader of a persisted format.
// Never throws.
// ---------------------------------------------------------------------------
enum class Format { ledger_record, cas, ruleset, registry };

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t supported{0};
  uint32_t found{0};
};

CompatibilityResult check_record_compatibility(Format format, uint32_t found_version);

}  // namespace version
}  // namespace arbiter
