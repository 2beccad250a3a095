#pragma once

// arbiter/fakes.hpp — In-memory implementations of the collaborator
// interfaces. They honour the same contracts as production providers and are
// what the test suite and the stress harness run against.

#include <atomic>
#include <map>
#include <mutex>
#include <regex>
#include <string>
#include <vector>

#include "arbiter/hash.hpp"
#include "arbiter/interfaces.hpp"

namespace arbiter {

// ---------------------------------------------------------------------------
// KeyedBlake3Signer — MAC-based signer
// ---------------------------------------------------------------------------
// signature = BLAKE3-keyed(key[key_id], payload). Keys are derived from
// caller-supplied secret material with BLAKE3 derive_key mode.
class KeyedBlake3Signer : public ISigner {
 public:
  void add_key(const std::string& key_id, const std::string& secret_material);
  void set_available(bool available) { available_.store(available); }

  SignResult sign(const std::string& payload, const std::string& key_id) const override;
  VerifyResult verify(const std::string& payload, const std::string& signature,
                      const std::string& key_id) const override;

  uint64_t verify_calls() const { return verify_calls_.load(); }

 private:
  mutable std::mutex mu_;
  std::map<std::string, HashKey> keys_;
  std::atomic<bool> available_{true};
  mutable std::atomic<uint64_t> verify_calls_{0};
};

// ---------------------------------------------------------------------------
// InMemoryFeatureStore — versioned point-in-time feature values
// ---------------------------------------------------------------------------
class InMemoryFeatureStore : public IFeatureStore {
 public:
  // ttl_ms == 0: the observation never expires. Otherwise it is only visible
  // for as_of in [observed_at, observed_at + ttl_ms).
  void put(const std::string& entity_id, const std::string& name, jsonlite::Value value,
           TimestampMs observed_at_unix_ms, uint64_t ttl_ms = 0);

  // Failure injection: the next n calls return a retryable error.
  void fail_next(int n) { fail_next_.store(n); }
  // Latency injection (milliseconds) applied to every call.
  void set_latency_ms(uint64_t ms) { latency_ms_.store(ms); }
  // Returns values observed after as_of (a broken store, for guard tests).
  void set_leak_future_values(bool leak) { leak_future_.store(leak); }

  uint64_t calls() const { return calls_.load(); }

  FeatureFetchResult get_features_at(const std::string& entity_id,
                                     const std::vector<std::string>& names,
                                     TimestampMs as_of_unix_ms) const override;

 private:
  struct Observation {
    jsonlite::Value value;
    TimestampMs observed_at{0};
    uint64_t ttl_ms{0};
  };
  mutable std::mutex mu_;
  // entity -> name -> observations ordered by observed_at
  std::map<std::string, std::map<std::string, std::vector<Observation>>> data_;
  mutable std::atomic<int> fail_next_{0};
  std::atomic<uint64_t> latency_ms_{0};
  std::atomic<bool> leak_future_{false};
  mutable std::atomic<uint64_t> calls_{0};
};

// ---------------------------------------------------------------------------
// PatternLegalReferenceValidator
// ---------------------------------------------------------------------------
// Accepts Finlex statute IRIs and EUR-Lex CELEX IRIs by pattern; known IRIs
// can be given a title and section.
class PatternLegalReferenceValidator : public ILegalReferenceValidator {
 public:
  PatternLegalReferenceValidator();

  void register_reference(const std::string& iri, const std::string& title,
                          const std::string& section);
  void set_available(bool available) { available_.store(available); }

  LegalReferenceCheck validate(const std::string& iri) const override;

 private:
  std::vector<std::regex> patterns_;
  mutable std::mutex mu_;
  std::map<std::string, std::pair<std::string, std::string>> known_;
  std::atomic<bool> available_{true};
};

}  // namespace arbiter
