#include "arbiter/fakes.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace arbiter {

// ---------------------------------------------------------------------------
// KeyedBlake3Signer
// ---------------------------------------------------------------------------

void KeyedBlake3Signer::add_key(const std::string& key_id, const std::string& secret_material) {
  std::lock_guard<std::mutex> lk(mu_);
  keys_[key_id] = derive_hash_key("arbiter 2024 release signing key", secret_material);
}

SignResult KeyedBlake3Signer::sign(const std::string& payload, const std::string& key_id) const {
  SignResult r;
  if (!available_.load()) {
    r.error = "signer unavailable";
    return r;
  }
  std::lock_guard<std::mutex> lk(mu_);
  auto it = keys_.find(key_id);
  if (it == keys_.end()) {
    r.error = "unknown key_id: " + key_id;
    return r;
  }
  r.ok = true;
  r.signature = keyed_hash_hex(it->second, payload);
  return r;
}

VerifyResult KeyedBlake3Signer::verify(const std::string& payload, const std::string& signature,
                                       const std::string& key_id) const {
  verify_calls_.fetch_add(1);
  VerifyResult r;
  if (!available_.load()) {
    r.available = false;
    r.error = "signer unavailable";
    return r;
  }
  std::lock_guard<std::mutex> lk(mu_);
  auto it = keys_.find(key_id);
  if (it == keys_.end()) {
    r.error = "unknown key_id: " + key_id;
    return r;
  }
  r.valid = digest_equal(keyed_hash_hex(it->second, payload), signature);
  if (!r.valid) r.error = "signature mismatch";
  return r;
}

// ---------------------------------------------------------------------------
// InMemoryFeatureStore
// ---------------------------------------------------------------------------

void InMemoryFeatureStore::put(const std::string& entity_id, const std::string& name,
                               jsonlite::Value value, TimestampMs observed_at_unix_ms,
                               uint64_t ttl_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& obs = data_[entity_id][name];
  Observation o{std::move(value), observed_at_unix_ms, ttl_ms};
  auto pos = std::upper_bound(obs.begin(), obs.end(), observed_at_unix_ms,
                              [](TimestampMs t, const Observation& x) { return t < x.observed_at; });
  obs.insert(pos, std::move(o));
}

FeatureFetchResult InMemoryFeatureStore::get_features_at(const std::string& entity_id,
                                                         const std::vector<std::string>& names,
                                                         TimestampMs as_of_unix_ms) const {
  calls_.fetch_add(1);
  if (const uint64_t ms = latency_ms_.load(); ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }

  FeatureFetchResult r;
  int pending = fail_next_.load();
  while (pending > 0 && !fail_next_.compare_exchange_weak(pending, pending - 1)) {
  }
  if (pending > 0) {
    r.ok = false;
    r.retryable = true;
    r.error = "feature store temporarily unavailable";
    return r;
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto eit = data_.find(entity_id);
  if (eit == data_.end()) return r;
  const bool leak = leak_future_.load();
  for (const auto& name : names) {
    auto nit = eit->second.find(name);
    if (nit == eit->second.end()) continue;
    const auto& obs = nit->second;
    if (leak && !obs.empty()) {
      r.values[name] = FeatureValue{obs.back().value, obs.back().observed_at};
      continue;
    }
    // Latest observation with observed_at <= as_of.
    auto it = std::upper_bound(obs.begin(), obs.end(), as_of_unix_ms,
                               [](TimestampMs t, const Observation& x) { return t < x.observed_at; });
    if (it == obs.begin()) continue;
    --it;
    if (it->ttl_ms != 0 && as_of_unix_ms >= it->observed_at + it->ttl_ms) continue;
    r.values[name] = FeatureValue{it->value, it->observed_at};
  }
  return r;
}

// ---------------------------------------------------------------------------
// PatternLegalReferenceValidator
// ---------------------------------------------------------------------------

PatternLegalReferenceValidator::PatternLegalReferenceValidator() {
  patterns_.emplace_back(R"(^https://finlex\.fi/fi/laki/ajantasa/\d{4}/\d+/?$)");
  patterns_.emplace_back(R"(^https://eur-lex\.europa\.eu/legal-content/EN/TXT/\?uri=CELEX:\d+[A-Z]?\d*$)");
}

void PatternLegalReferenceValidator::register_reference(const std::string& iri, const std::string& title,
                                                        const std::string& section) {
  std::lock_guard<std::mutex> lk(mu_);
  known_[iri] = {title, section};
}

LegalReferenceCheck PatternLegalReferenceValidator::validate(const std::string& iri) const {
  LegalReferenceCheck r;
  if (!available_.load()) {
    r.available = false;
    r.message = "legal reference validator unavailable";
    return r;
  }
  const bool matches = std::any_of(patterns_.begin(), patterns_.end(),
                                   [&](const std::regex& re) { return std::regex_match(iri, re); });
  if (!matches) {
    r.message = "unrecognised legal reference IRI: " + iri;
    return r;
  }
  r.valid = true;
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = known_.find(iri); it != known_.end()) {
    r.title = it->second.first;
    r.section = it->second.second;
  }
  return r;
}

}  // namespace arbiter
