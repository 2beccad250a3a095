#pragma once

// arbiter/rules.hpp — Declarative rule sets: parsing, evaluation and static
// conflict analysis.
//
// Rule set JSON:
//   {"rules": [
//      {"rule_id": "high_score", "priority": 10, "match": "all",
//       "conditions": [{"field": "credit_score", "operator": ">=", "value": 700},
//                      {"field": "amount", "operator": "<=", "value": 10000}],
//       "result": {"eligible": true}}],
//    "default_result": {"eligible": false}}
//
// EVALUATION:
//   Rules are tried in descending priority; equal priorities keep declaration
//   order. The first rule whose conditions match wins ("all" = AND, "any" =
//   OR). No match falls through to default_result. A condition on a missing
//   field is false. Fields are dotted paths into the input, or
//   "features.<name>" into the point-in-time feature snapshot.
//
// STATIC ANALYSIS (RuleAnalyzer::Check):
//   Equal-priority rules whose condition domains overlap and whose results
//   differ are conflicts. Overlap is computed exactly for ==, !=, <, <=, >,
//   >=, in and not_in. contains/regex families are not analyzable; a pair that
//   depends on them is listed as "unanalyzable — requires manual review"
//   unless its analyzable conditions already prove the pair disjoint.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"
#include "arbiter/schema.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

enum class RuleOperator {
  eq, ne, lt, le, gt, ge, in, not_in, contains, not_contains, regex, not_regex,
};

std::string to_string(RuleOperator op);
std::optional<RuleOperator> rule_operator_from_string(const std::string& s);

// True for operators whose satisfying domain can be computed.
bool is_analyzable(RuleOperator op);

struct Condition {
  std::string field;
  RuleOperator op{RuleOperator::eq};
  jsonlite::Value value;
  std::shared_ptr<const std::regex> compiled;  // regex / not_regex only
};

enum class MatchMode { all, any };

struct Rule {
  std::string rule_id;
  int64_t priority{0};
  MatchMode match{MatchMode::all};
  std::vector<Condition> conditions;
  jsonlite::Object result;
  bool enabled{true};
  std::string description;
};

struct RuleSet {
  std::vector<Rule> rules;  // declaration order
  std::optional<jsonlite::Object> default_result;

  std::string to_json() const;
};

// Parse and validate a rule set. Every syntax error is reported in
// Status::details.
std::optional<RuleSet> parse_ruleset(const jsonlite::Object& def, Status* status);
std::optional<RuleSet> parse_ruleset(const std::string& json, Status* status);

bool condition_holds(const Condition& c, const jsonlite::Object& input,
                     const jsonlite::Object& features);

struct RuleMatch {
  jsonlite::Object output;
  std::string rule_id;  // empty when default_result was used
  bool defaulted{false};
};

// Throws std::runtime_error when nothing matches and no default_result exists.
// cancelled (optional) is polled between rules.
RuleMatch evaluate_rules(const RuleSet& rules, const jsonlite::Object& input,
                         const jsonlite::Object& features,
                         const std::function<bool()>& cancelled = {});

// ---------------------------------------------------------------------------
// Static analysis
// ---------------------------------------------------------------------------
struct RuleConflict {
  std::string type;  // overlapping_conditions
  std::string rule_a;
  std::string rule_b;
  int64_t priority{0};
  std::string description;
};

struct RuleAnalysis {
  bool valid{true};                   // no conflicts
  std::vector<RuleConflict> conflicts;
  std::vector<std::string> unanalyzable;
  std::vector<std::string> warnings;

  struct Metrics {
    std::size_t total_rules{0};
    std::size_t enabled_rules{0};
    int64_t min_priority{0};
    int64_t max_priority{0};
    double avg_conditions{0.0};
  } metrics;

  std::string to_json() const;
};

class RuleAnalyzer {
 public:
  /**
   * @brief Statically analyzes a rule set.
   *
   * Checks for:
   * 1. Conflicts: equal-priority rules that can match the same input and
   *    produce different results.
   * 2. Unreachable rules: unsatisfiable conditions, or a rule fully covered
   *    by a higher-priority rule.
   * 3. References to fields the input schema / feature list does not declare,
   *    and operators applied to values of the wrong type.
   *
   * input_schema may be null (field checks are skipped).
   */
  static RuleAnalysis Check(const RuleSet& rules, const Schema* input_schema,
                            const std::vector<std::string>& declared_features);
};

}  // namespace arbiter
