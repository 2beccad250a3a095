#pragma once

// arbiter/evaluatable.hpp — One execution contract for every kind of
// decision logic.
//
// The engine only ever sees Evaluatable::execute(input, context). Two
// variants exist:
//   NativeEvaluatable   — a C++ closure, identified by (symbol, revision).
//   RuleSetEvaluatable  — a declarative rule set (rules.hpp).
//
// CONTRACT for implementations:
//   - Pure: output depends only on (input, context.features, context.as_of).
//     No clocks, no I/O, no global mutable state.
//   - May throw std::exception; the engine records execution_error.
//   - Should poll context.cancelled() in long loops; a cancelled evaluation
//     may throw EvaluationCancelled. Its output is discarded either way.
//   - Thread-safe: one instance is shared by all concurrent executions.

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "arbiter/jsonlite.hpp"
#include "arbiter/rules.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

struct EvalContext {
  std::string function_id;
  std::string version;
  TimestampMs as_of_unix_ms{0};
  jsonlite::Object features;  // point-in-time feature values by name
  std::shared_ptr<std::atomic<bool>> cancel_flag;

  bool cancelled() const {
    return cancel_flag && cancel_flag->load(std::memory_order_acquire);
  }
};

class EvaluationCancelled : public std::runtime_error {
 public:
  EvaluationCancelled() : std::runtime_error("evaluation cancelled") {}
};

class Evaluatable {
 public:
  virtual ~Evaluatable() = default;

  virtual jsonlite::Object execute(const jsonlite::Object& input,
                                   const EvalContext& context) const = 0;

  // "native" | "ruleset"
  virtual std::string kind() const = 0;

  // Canonical JSON identifying the logic. logic_hash is computed over it.
  virtual std::string canonical_source() const = 0;
};

// logic_content_hash(logic.canonical_source())
std::string compute_logic_hash(const Evaluatable& logic);

using NativeFn =
    std::function<jsonlite::Object(const jsonlite::Object& input, const EvalContext& context)>;

class NativeEvaluatable : public Evaluatable {
 public:
  // revision: caller-assigned identifier of the code behind fn (for example a
  // build id or source digest). Changing the code without changing the
  // revision defeats the logic hash.
  NativeEvaluatable(std::string symbol, std::string revision, NativeFn fn);

  jsonlite::Object execute(const jsonlite::Object& input,
                           const EvalContext& context) const override;
  std::string kind() const override { return "native"; }
  std::string canonical_source() const override;

  const std::string& symbol() const { return symbol_; }
  const std::string& revision() const { return revision_; }

 private:
  std::string symbol_;
  std::string revision_;
  NativeFn fn_;
};

class RuleSetEvaluatable : public Evaluatable {
 public:
  explicit RuleSetEvaluatable(RuleSet rules);

  jsonlite::Object execute(const jsonlite::Object& input,
                           const EvalContext& context) const override;
  std::string kind() const override { return "ruleset"; }
  std::string canonical_source() const override;

  const RuleSet& rules() const { return rules_; }

 private:
  RuleSet rules_;
  std::string canonical_;
};

// ---------------------------------------------------------------------------
// NativeLogicCatalog — symbol table used to rehydrate native artifacts
// ---------------------------------------------------------------------------
// Native closures cannot be persisted. Artifacts store (symbol, revision);
// DecisionRegistry::load() resolves them here.
class NativeLogicCatalog {
 public:
  void add(std::shared_ptr<const NativeEvaluatable> logic);
  std::shared_ptr<const NativeEvaluatable> find(const std::string& symbol,
                                                const std::string& revision) const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<const NativeEvaluatable>> by_key_;
};

}  // namespace arbiter
