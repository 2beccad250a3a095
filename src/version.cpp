#include "arbiter/version.hpp"

#include <sstream>

namespace arbiter {
namespace version {

namespace {

uint32_t supported_version(Format format) {
  switch (format) {
    case Format::ledger_record: return LEDGER_RECORD_VERSION;
    case Format::cas:           return CAS_FORMAT_VERSION;
    case Format::ruleset:       return RULESET_FORMAT_VERSION;
    case Format::registry:      return REGISTRY_FORMAT_VERSION;
  }
  return 0;
}

const char* format_name(Format format) {
  switch (format) {
    case Format::ledger_record: return "ledger_record";
    case Format::cas:           return "cas";
    case Format::ruleset:       return "ruleset";
    case Format::registry:      return "registry";
  }
  return "unknown";
}

}  // namespace

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver   = ENGINE_SEMVER;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"build_timestamp\":\"" << m.build_timestamp << "\""
    << ",\"cas_format\":" << m.cas_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"ledger_record\":" << m.ledger_record
    << ",\"registry_format\":" << m.registry_format
    << ",\"ruleset_format\":" << m.ruleset_format
    << "}";
  return o.str();
}

CompatibilityResult check_record_compatibility(Format format, uint32_t found_version) {
  CompatibilityResult r;
  r.supported = supported_version(format);
  r.found = found_version;
  if (found_version == 0) {
    r.ok = false;
    r.error_code = "format_version_missing";
    r.description = std::string(format_name(format)) + " record carries no format version";
  } else if (found_version > r.supported) {
    r.ok = false;
    r.error_code = "format_version_unsupported";
    r.description = std::string(format_name(format)) + " format version " +
                    std::to_string(found_version) + " is newer than supported version " +
                    std::to_string(r.supported) + ". Upgrade the engine before reading.";
  }
  return r;
}

}  // namespace version
}  // namespace arbiter
