#pragma once

// arbiter/config.hpp — Engine configuration.
//
// Precedence (highest first): ARBITER_* environment variables, the JSON
// config document, compiled defaults. Unknown keys are warnings, not errors,
// so a newer config can be read by an older build.
//
// Environment overrides:
//   ARBITER_EXECUTION_TIMEOUT_MS   execution_timeout_ms
//   ARBITER_LEDGER_PATH            ledger_path
//   ARBITER_CAS_ROOT               cas_root
//   ARBITER_CAS_COMPRESSION        cas_compression
//   ARBITER_REGISTRY_ROOT          registry_root
//   ARBITER_EVENT_LOG              event_log_path

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "arbiter/ledger.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

constexpr const char* kConfigVersion = "1";

struct EngineConfig {
  std::string config_version{kConfigVersion};

  // Engine
  uint64_t execution_timeout_ms{1000};     // 0 = evaluate inline, unbounded
  uint64_t feature_fetch_timeout_ms{500};  // budget across all attempts
  uint32_t feature_fetch_max_attempts{3};
  uint64_t feature_fetch_backoff_ms{5};    // doubled after each failed attempt
  size_t max_input_bytes{1u << 20};

  // Storage; empty paths select in-memory backends.
  std::string cas_root;
  std::string cas_compression{"off"};      // off | zstd
  std::string ledger_path;
  size_t ledger_commit_batch{64};
  uint64_t ledger_flush_interval_ms{5};
  std::string registry_root;

  std::string event_log_path;

  LedgerOptions ledger_options() const { return {ledger_commit_batch, ledger_flush_interval_ms}; }
  std::string to_json() const;
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Checks a config document without applying it.
ConfigValidationResult validate_config(const std::string& config_json);

struct ConfigLoadResult {
  Status status;
  EngineConfig config;
  std::vector<std::string> warnings;
};

// Validate, apply to defaults, then apply environment overrides.
// An empty document yields the defaults plus overrides.
ConfigLoadResult load_config(const std::string& config_json);
ConfigLoadResult load_config_file(const std::string& path);

// Applies ARBITER_* overrides in place. Malformed values are skipped with a
// warning.
void apply_env_overrides(EngineConfig* config, std::vector<std::string>* warnings);

}  // namespace arbiter
