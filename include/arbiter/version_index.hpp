#pragma once

// arbiter/version_index.hpp — Effective-dated version index.
//
// "Which version is active" is never a mutable pointer. It is a pure lookup
// over an immutable snapshot: resolve(function_id, as_of). Registry
// transitions build a new snapshot and publish it atomically; readers keep
// whatever snapshot they loaded for as long as they hold it.
//
// INVARIANTS:
//   - Windows of one function never overlap: each is [effective_from,
//     effective_until) and they are ordered by effective_from.
//   - At most one window per function is open-ended (kOpenEnded).
//   - Every published snapshot has a strictly larger generation.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/types.hpp"

namespace arbiter {

struct VersionWindow {
  std::string version;
  TimestampMs effective_from{0};
  TimestampMs effective_until{kOpenEnded};

  bool contains(TimestampMs t) const { return t >= effective_from && t < effective_until; }
};

class EffectiveVersionIndex {
 public:
  using Windows = std::map<std::string, std::vector<VersionWindow>>;

  EffectiveVersionIndex() = default;
  EffectiveVersionIndex(Windows windows, uint64_t generation)
      : windows_(std::move(windows)), generation_(generation) {}

  // Version effective for function_id at as_of, if any.
  std::optional<std::string> resolve(const std::string& function_id, TimestampMs as_of) const;

  bool is_effective(const std::string& function_id, const std::string& version,
                    TimestampMs as_of) const;

  std::vector<VersionWindow> windows(const std::string& function_id) const;
  std::optional<VersionWindow> window_of(const std::string& function_id,
                                         const std::string& version) const;

  uint64_t generation() const { return generation_; }

  // --- Pure builders: return a new snapshot, never modify this one. ---

  // Opens [from, inf) for version, closing the currently open window at from.
  // *closed_version receives the version whose window was closed (if any).
  // Fails invalid_state_transition if from precedes the open window's start
  // or the end of any closed window.
  std::optional<EffectiveVersionIndex> with_activation(const std::string& function_id,
                                                       const std::string& version, TimestampMs from,
                                                       std::string* closed_version,
                                                       Status* status) const;

  // Closes version's window at min(current end, sunset_at), never before its
  // start.
  EffectiveVersionIndex with_retirement(const std::string& function_id, const std::string& version,
                                        TimestampMs sunset_at) const;

  // Inserts a window as-is (registry reload).
  EffectiveVersionIndex with_window(const std::string& function_id, VersionWindow window) const;

  std::string to_json() const;

 private:
  Windows windows_;
  uint64_t generation_{0};
};

// Publication point for index snapshots.
class VersionIndexHolder {
 public:
  VersionIndexHolder() : current_(std::make_shared<const EffectiveVersionIndex>()) {}

  std::shared_ptr<const EffectiveVersionIndex> snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_;
  }

  void publish(std::shared_ptr<const EffectiveVersionIndex> next) {
    std::lock_guard<std::mutex> lk(mu_);
    current_ = std::move(next);
  }

 private:
  mutable std::mutex mu_;
  std::shared_ptr<const EffectiveVersionIndex> current_;
};

}  // namespace arbiter
