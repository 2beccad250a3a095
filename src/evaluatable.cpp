#include "arbiter/evaluatable.hpp"

#include "arbiter/hash.hpp"

namespace arbiter {

std::string compute_logic_hash(const Evaluatable& logic) {
  return logic_content_hash(logic.canonical_source());
}

// ---------------------------------------------------------------------------
// NativeEvaluatable
// ---------------------------------------------------------------------------

NativeEvaluatable::NativeEvaluatable(std::string symbol, std::string revision, NativeFn fn)
    : symbol_(std::move(symbol)), revision_(std::move(revision)), fn_(std::move(fn)) {}

jsonlite::Object NativeEvaluatable::execute(const jsonlite::Object& input,
                                            const EvalContext& context) const {
  if (!fn_) throw std::runtime_error("native logic '" + symbol_ + "' has no body");
  return fn_(input, context);
}

std::string NativeEvaluatable::canonical_source() const {
  jsonlite::Object o;
  o["kind"] = "native";
  o["symbol"] = symbol_;
  o["revision"] = revision_;
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// RuleSetEvaluatable
// ---------------------------------------------------------------------------

RuleSetEvaluatable::RuleSetEvaluatable(RuleSet rules) : rules_(std::move(rules)) {
  // The rule set is immutable from here on; serialize once. Keys are emitted
  // in sorted order to stay canonical.
  canonical_ = "{\"kind\":\"ruleset\",\"ruleset\":" + rules_.to_json() + "}";
}

jsonlite::Object RuleSetEvaluatable::execute(const jsonlite::Object& input,
                                             const EvalContext& context) const {
  auto m = evaluate_rules(rules_, input, context.features, [&context] {
    if (context.cancelled()) throw EvaluationCancelled();
    return false;
  });
  return std::move(m.output);
}

std::string RuleSetEvaluatable::canonical_source() const { return canonical_; }

// ---------------------------------------------------------------------------
// NativeLogicCatalog
// ---------------------------------------------------------------------------

void NativeLogicCatalog::add(std::shared_ptr<const NativeEvaluatable> logic) {
  if (!logic) return;
  std::lock_guard<std::mutex> lk(mu_);
  by_key_[logic->symbol() + "@" + logic->revision()] = std::move(logic);
}

std::shared_ptr<const NativeEvaluatable> NativeLogicCatalog::find(const std::string& symbol,
                                                                  const std::string& revision) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = by_key_.find(symbol + "@" + revision);
  return it == by_key_.end() ? nullptr : it->second;
}

}  // namespace arbiter
