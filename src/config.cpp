#include "arbiter/config.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>

#include "arbiter/jsonlite.hpp"

namespace arbiter {

namespace {

constexpr uint64_t kMaxTimeoutMs = 600000;

enum class Kind { u64, string };

struct KeySpec {
  Kind kind;
  uint64_t min{0};
  uint64_t max{UINT64_MAX};
};

const std::map<std::string, KeySpec>& known_keys() {
  static const std::map<std::string, KeySpec> keys = {
      {"config_version", {Kind::string}},
      {"execution_timeout_ms", {Kind::u64, 0, kMaxTimeoutMs}},
      {"feature_fetch_timeout_ms", {Kind::u64, 1, kMaxTimeoutMs}},
      {"feature_fetch_max_attempts", {Kind::u64, 1, 10}},
      {"feature_fetch_backoff_ms", {Kind::u64, 0, 10000}},
      {"max_input_bytes", {Kind::u64, 2, 1ull << 30}},
      {"cas_root", {Kind::string}},
      {"cas_compression", {Kind::string}},
      {"ledger_path", {Kind::string}},
      {"ledger_commit_batch", {Kind::u64, 1, 65536}},
      {"ledger_flush_interval_ms", {Kind::u64, 1, 60000}},
      {"registry_root", {Kind::string}},
      {"event_log_path", {Kind::string}},
  };
  return keys;
}

std::optional<uint64_t> parse_u64(const char* s) {
  if (!s || !*s) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || *end != '\0' || s[0] == '-') return std::nullopt;
  return static_cast<uint64_t>(v);
}

void apply(EngineConfig& c, const jsonlite::Object& o) {
  using namespace jsonlite;
  c.config_version = get_string(o, "config_version", c.config_version);
  c.execution_timeout_ms = get_u64(o, "execution_timeout_ms", c.execution_timeout_ms);
  c.feature_fetch_timeout_ms = get_u64(o, "feature_fetch_timeout_ms", c.feature_fetch_timeout_ms);
  c.feature_fetch_max_attempts =
      static_cast<uint32_t>(get_u64(o, "feature_fetch_max_attempts", c.feature_fetch_max_attempts));
  c.feature_fetch_backoff_ms = get_u64(o, "feature_fetch_backoff_ms", c.feature_fetch_backoff_ms);
  c.max_input_bytes = static_cast<size_t>(get_u64(o, "max_input_bytes", c.max_input_bytes));
  c.cas_root = get_string(o, "cas_root", c.cas_root);
  c.cas_compression = get_string(o, "cas_compression", c.cas_compression);
  c.ledger_path = get_string(o, "ledger_path", c.ledger_path);
  c.ledger_commit_batch = static_cast<size_t>(get_u64(o, "ledger_commit_batch", c.ledger_commit_batch));
  c.ledger_flush_interval_ms = get_u64(o, "ledger_flush_interval_ms", c.ledger_flush_interval_ms);
  c.registry_root = get_string(o, "registry_root", c.registry_root);
  c.event_log_path = get_string(o, "event_log_path", c.event_log_path);
}

}  // namespace

std::string EngineConfig::to_json() const {
  jsonlite::Object o;
  o["config_version"] = config_version;
  o["execution_timeout_ms"] = execution_timeout_ms;
  o["feature_fetch_timeout_ms"] = feature_fetch_timeout_ms;
  o["feature_fetch_max_attempts"] = feature_fetch_max_attempts;
  o["feature_fetch_backoff_ms"] = feature_fetch_backoff_ms;
  o["max_input_bytes"] = static_cast<uint64_t>(max_input_bytes);
  o["cas_root"] = cas_root;
  o["cas_compression"] = cas_compression;
  o["ledger_path"] = ledger_path;
  o["ledger_commit_batch"] = static_cast<uint64_t>(ledger_commit_batch);
  o["ledger_flush_interval_ms"] = ledger_flush_interval_ms;
  o["registry_root"] = registry_root;
  o["event_log_path"] = event_log_path;
  return jsonlite::to_json(o);
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Value doc = jsonlite::parse_value(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }
  if (!doc.is_object()) {
    r.errors.push_back("config must be a JSON object");
    return r;
  }
  const auto& o = std::get<jsonlite::Object>(doc.v);

  for (const auto& [key, value] : o) {
    auto spec = known_keys().find(key);
    if (spec == known_keys().end()) {
      r.warnings.push_back("unknown key '" + key + "' ignored");
      continue;
    }
    if (spec->second.kind == Kind::string) {
      if (!value.is_string()) r.errors.push_back("'" + key + "' must be a string");
      continue;
    }
    if (!std::holds_alternative<std::uint64_t>(value.v)) {
      r.errors.push_back("'" + key + "' must be a non-negative integer");
      continue;
    }
    const uint64_t n = std::get<std::uint64_t>(value.v);
    if (n < spec->second.min || n > spec->second.max) {
      r.errors.push_back("'" + key + "' out of range [" + std::to_string(spec->second.min) + ", " +
                         std::to_string(spec->second.max) + "]: " + std::to_string(n));
    }
  }

  r.config_version = jsonlite::get_string(o, "config_version", kConfigVersion);
  if (r.config_version != kConfigVersion) {
    r.errors.push_back("unsupported config_version '" + r.config_version + "'");
  }

  const std::string compression = jsonlite::get_string(o, "cas_compression", "off");
  if (compression != "off" && compression != "zstd") {
    r.errors.push_back("cas_compression must be 'off' or 'zstd'");
  }
#if !defined(ARBITER_WITH_ZSTD)
  if (compression == "zstd") r.warnings.push_back("cas_compression 'zstd' requested but zstd support is not built in; objects are stored uncompressed");
#endif

  const uint64_t timeout = jsonlite::get_u64(o, "execution_timeout_ms", 1000);
  const uint64_t fetch_timeout = jsonlite::get_u64(o, "feature_fetch_timeout_ms", 500);
  if (timeout != 0 && fetch_timeout >= timeout) {
    r.warnings.push_back("feature_fetch_timeout_ms >= execution_timeout_ms; feature retries can consume the whole budget");
  }

  r.ok = r.errors.empty();
  return r;
}

void apply_env_overrides(EngineConfig* config, std::vector<std::string>* warnings) {
  auto str = [](const char* name, std::string* out) {
    const char* e = std::getenv(name);
    if (e && e[0]) *out = e;
  };
  if (const char* e = std::getenv("ARBITER_EXECUTION_TIMEOUT_MS"); e && e[0]) {
    auto v = parse_u64(e);
    if (v && *v <= kMaxTimeoutMs) {
      config->execution_timeout_ms = *v;
    } else if (warnings) {
      warnings->push_back("ARBITER_EXECUTION_TIMEOUT_MS ignored: '" + std::string(e) + "'");
    }
  }
  str("ARBITER_LEDGER_PATH", &config->ledger_path);
  str("ARBITER_CAS_ROOT", &config->cas_root);
  str("ARBITER_REGISTRY_ROOT", &config->registry_root);
  str("ARBITER_EVENT_LOG", &config->event_log_path);
  if (const char* e = std::getenv("ARBITER_CAS_COMPRESSION"); e && e[0]) {
    const std::string v = e;
    if (v == "off" || v == "zstd") {
      config->cas_compression = v;
    } else if (warnings) {
      warnings->push_back("ARBITER_CAS_COMPRESSION ignored: '" + v + "'");
    }
  }
}

ConfigLoadResult load_config(const std::string& config_json) {
  ConfigLoadResult out;
  if (!config_json.empty()) {
    auto v = validate_config(config_json);
    out.warnings = v.warnings;
    if (!v.ok) {
      out.status = Status::failure(ErrorCode::validation_error, "invalid config", v.errors);
      return out;
    }
    arbiter::apply(out.config, jsonlite::parse(config_json));
  }
  apply_env_overrides(&out.config, &out.warnings);
  return out;
}

ConfigLoadResult load_config_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigLoadResult out;
    out.status = Status::failure(ErrorCode::storage_error, "cannot read config file: " + path);
    return out;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return load_config(text);
}

}  // namespace arbiter
