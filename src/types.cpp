#include "arbiter/types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>

#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"

namespace arbiter {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "none";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::inactive_function: return "inactive_function";
    case ErrorCode::version_not_found: return "version_not_found";
    case ErrorCode::execution_timeout: return "execution_timeout";
    case ErrorCode::execution_error: return "execution_error";
    case ErrorCode::duplicate_version: return "duplicate_version";
    case ErrorCode::separation_of_duties: return "separation_of_duties";
    case ErrorCode::rule_conflict: return "rule_conflict";
    case ErrorCode::legal_reference: return "legal_reference";
    case ErrorCode::invalid_state_transition: return "invalid_state_transition";
    case ErrorCode::signature_invalid: return "signature_invalid";
    case ErrorCode::concurrent_modification: return "concurrent_modification";
    case ErrorCode::external_dependency: return "external_dependency";
    case ErrorCode::storage_error: return "storage_error";
    case ErrorCode::chain_integrity: return "chain_integrity";
    case ErrorCode::determinism_violation: return "determinism_violation";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::json_parse_error: return "json_parse_error";
  }
  return "unknown";
}

std::optional<ErrorCode> error_code_from_string(const std::string& s) {
  static const ErrorCode kAll[] = {
      ErrorCode::none, ErrorCode::validation_error, ErrorCode::inactive_function,
      ErrorCode::version_not_found, ErrorCode::execution_timeout, ErrorCode::execution_error,
      ErrorCode::duplicate_version, ErrorCode::separation_of_duties, ErrorCode::rule_conflict,
      ErrorCode::legal_reference, ErrorCode::invalid_state_transition,
      ErrorCode::signature_invalid, ErrorCode::concurrent_modification,
      ErrorCode::external_dependency, ErrorCode::storage_error, ErrorCode::chain_integrity,
      ErrorCode::determinism_violation, ErrorCode::cancelled, ErrorCode::json_parse_error,
  };
  for (ErrorCode c : kAll) {
    if (to_string(c) == s) return c;
  }
  return std::nullopt;
}

std::string Status::to_json() const {
  jsonlite::Object o;
  o["ok"] = ok;
  o["error_code"] = ok ? std::string() : to_string(code);
  o["message"] = message;
  jsonlite::Array d;
  for (const auto& item : details) d.emplace_back(item);
  o["details"] = std::move(d);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------

TimestampMs now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<TimestampMs>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch())
          .count());
}

namespace {

// Days since 1970-01-01 for a proleptic Gregorian civil date (H. Hinnant).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

unsigned days_in_month(int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && ((y % 4 == 0 && y % 100 != 0) || y % 400 == 0)) return 29;
  return kDays[m - 1];
}

}  // namespace

std::string format_iso8601_utc(TimestampMs ts) {
  const std::time_t secs = static_cast<std::time_t>(ts / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<unsigned>(ts % 1000));
  return buf;
}

std::optional<TimestampMs> parse_iso8601_utc(const std::string& s) {
  int y = 0;
  unsigned mo = 0, d = 0, h = 0, mi = 0, sec = 0, ms = 0;
  int consumed = 0;
  if (s.size() == 10) {
    if (std::sscanf(s.c_str(), "%4d-%2u-%2u%n", &y, &mo, &d, &consumed) != 3 || consumed != 10) {
      return std::nullopt;
    }
  } else {
    if (std::sscanf(s.c_str(), "%4d-%2u-%2uT%2u:%2u:%2u%n", &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
      return std::nullopt;
    }
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
      ++pos;
      unsigned digits = 0;
      while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
        if (digits < 3) ms = ms * 10 + static_cast<unsigned>(s[pos] - '0');
        ++digits;
        ++pos;
      }
      if (digits == 0) return std::nullopt;
      for (; digits < 3; ++digits) ms *= 10;
    }
    if (pos + 1 != s.size() || s[pos] != 'Z') return std::nullopt;
  }
  if (y < 1970 || mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo) || h > 23 || mi > 59 || sec > 59) {
    return std::nullopt;
  }
  const int64_t days = days_from_civil(y, mo, d);
  const int64_t total_s = days * 86400 + h * 3600 + mi * 60 + sec;
  return static_cast<TimestampMs>(total_s) * 1000 + ms;
}

namespace {

std::string format_uuid(const unsigned char* b) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += kHex[b[i] >> 4];
    out += kHex[b[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string make_uuid_v4() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  unsigned char b[16];
  for (int i = 0; i < 16; i += 8) {
    const uint64_t r = rng();
    for (int k = 0; k < 8; ++k) b[i + k] = static_cast<unsigned char>(r >> (k * 8));
  }
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
  return format_uuid(b);
}

std::string uuid_from_key(const std::string& key) {
  const std::string digest = hash_bytes_blake3(hash_domain("trace-key:", key));
  unsigned char b[16];
  for (int i = 0; i < 16; ++i) b[i] = static_cast<unsigned char>(digest[static_cast<std::size_t>(i)]);
  // Version nibble 5 marks a name-derived id.
  b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x50);
  b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
  return format_uuid(b);
}

// ---------------------------------------------------------------------------
// Release lifecycle
// ---------------------------------------------------------------------------

std::string to_string(FunctionStatus s) {
  switch (s) {
    case FunctionStatus::draft: return "DRAFT";
    case FunctionStatus::pending_review: return "PENDING_REVIEW";
    case FunctionStatus::approved: return "APPROVED";
    case FunctionStatus::active: return "ACTIVE";
    case FunctionStatus::deprecated: return "DEPRECATED";
    case FunctionStatus::retired: return "RETIRED";
  }
  return "UNKNOWN";
}

std::optional<FunctionStatus> function_status_from_string(const std::string& s) {
  if (s == "DRAFT") return FunctionStatus::draft;
  if (s == "PENDING_REVIEW") return FunctionStatus::pending_review;
  if (s == "APPROVED") return FunctionStatus::approved;
  if (s == "ACTIVE") return FunctionStatus::active;
  if (s == "DEPRECATED") return FunctionStatus::deprecated;
  if (s == "RETIRED") return FunctionStatus::retired;
  return std::nullopt;
}

std::string to_string(SignerRole r) {
  return r == SignerRole::owner ? "OWNER" : "REVIEWER";
}

std::optional<SignerRole> signer_role_from_string(const std::string& s) {
  if (s == "OWNER") return SignerRole::owner;
  if (s == "REVIEWER") return SignerRole::reviewer;
  return std::nullopt;
}

}  // namespace arbiter
