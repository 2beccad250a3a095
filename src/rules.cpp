#include "arbiter/rules.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <sstream>
#include <stdexcept>

namespace arbiter {

std::string to_string(RuleOperator op) {
  switch (op) {
    case RuleOperator::eq: return "==";
    case RuleOperator::ne: return "!=";
    case RuleOperator::lt: return "<";
    case RuleOperator::le: return "<=";
    case RuleOperator::gt: return ">";
    case RuleOperator::ge: return ">=";
    case RuleOperator::in: return "in";
    case RuleOperator::not_in: return "not_in";
    case RuleOperator::contains: return "contains";
    case RuleOperator::not_contains: return "not_contains";
    case RuleOperator::regex: return "regex";
    case RuleOperator::not_regex: return "not_regex";
  }
  return "?";
}

std::optional<RuleOperator> rule_operator_from_string(const std::string& s) {
  if (s == "==" || s == "eq") return RuleOperator::eq;
  if (s == "!=" || s == "ne") return RuleOperator::ne;
  if (s == "<" || s == "lt") return RuleOperator::lt;
  if (s == "<=" || s == "le") return RuleOperator::le;
  if (s == ">" || s == "gt") return RuleOperator::gt;
  if (s == ">=" || s == "ge") return RuleOperator::ge;
  if (s == "in") return RuleOperator::in;
  if (s == "not_in") return RuleOperator::not_in;
  if (s == "contains") return RuleOperator::contains;
  if (s == "not_contains") return RuleOperator::not_contains;
  if (s == "regex") return RuleOperator::regex;
  if (s == "not_regex") return RuleOperator::not_regex;
  return std::nullopt;
}

bool is_analyzable(RuleOperator op) {
  switch (op) {
    case RuleOperator::eq:
    case RuleOperator::ne:
    case RuleOperator::lt:
    case RuleOperator::le:
    case RuleOperator::gt:
    case RuleOperator::ge:
    case RuleOperator::in:
    case RuleOperator::not_in:
      return true;
    default:
      return false;
  }
}

namespace {

bool is_range_op(RuleOperator op) {
  return op == RuleOperator::lt || op == RuleOperator::le || op == RuleOperator::gt ||
         op == RuleOperator::ge;
}

std::optional<int64_t> as_integer(const jsonlite::Value& v) {
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    if (*u > static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
    return static_cast<int64_t>(*u);
  }
  if (const auto* d = std::get_if<double>(&v.v)) {
    if (std::floor(*d) != *d || std::fabs(*d) > 9.0e15) return std::nullopt;
    return static_cast<int64_t>(*d);
  }
  return std::nullopt;
}

const char* match_name(MatchMode m) { return m == MatchMode::all ? "all" : "any"; }

}  // namespace

// ---------------------------------------------------------------------------
// Serialization / parsing
// ---------------------------------------------------------------------------

std::string RuleSet::to_json() const {
  jsonlite::Array rule_arr;
  for (const auto& r : rules) {
    jsonlite::Object ro;
    ro["rule_id"] = r.rule_id;
    ro["priority"] = r.priority;
    ro["match"] = match_name(r.match);
    ro["enabled"] = r.enabled;
    ro["result"] = r.result;
    if (!r.description.empty()) ro["description"] = r.description;
    jsonlite::Array conds;
    for (const auto& c : r.conditions) {
      jsonlite::Object co;
      co["field"] = c.field;
      co["operator"] = to_string(c.op);
      co["value"] = c.value;
      conds.emplace_back(std::move(co));
    }
    ro["conditions"] = std::move(conds);
    rule_arr.emplace_back(std::move(ro));
  }
  jsonlite::Object root;
  root["rules"] = std::move(rule_arr);
  root["default_result"] = default_result ? jsonlite::Value(*default_result) : jsonlite::Value(nullptr);
  return jsonlite::to_json(root);
}

std::optional<RuleSet> parse_ruleset(const jsonlite::Object& def, Status* status) {
  RuleSet rs;
  std::vector<std::string> errors;
  std::set<std::string> seen_ids;

  const auto* rules = jsonlite::get_array(def, "rules");
  if (!rules) {
    errors.push_back("'rules' must be an array");
  } else {
    for (std::size_t i = 0; i < rules->size(); ++i) {
      const std::string where = "rule[" + std::to_string(i) + "]";
      const auto* ro = std::get_if<jsonlite::Object>(&(*rules)[i].v);
      if (!ro) {
        errors.push_back(where + ": must be an object");
        continue;
      }
      Rule rule;
      rule.rule_id = jsonlite::get_string(*ro, "rule_id");
      const std::string label = where + (rule.rule_id.empty() ? "" : " '" + rule.rule_id + "'");
      if (rule.rule_id.empty()) {
        errors.push_back(label + ": missing rule_id");
      } else if (!seen_ids.insert(rule.rule_id).second) {
        errors.push_back(label + ": duplicate rule_id");
      }

      if (auto it = ro->find("priority"); it != ro->end()) {
        auto p = as_integer(it->second);
        if (!p) errors.push_back(label + ": priority must be an integer");
        else rule.priority = *p;
      }

      const std::string match = jsonlite::get_string(*ro, "match", "all");
      if (match == "all" || match == "and") rule.match = MatchMode::all;
      else if (match == "any" || match == "or") rule.match = MatchMode::any;
      else errors.push_back(label + ": match must be 'all' or 'any'");

      rule.enabled = jsonlite::get_bool(*ro, "enabled", true);
      rule.description = jsonlite::get_string(*ro, "description");

      if (const auto* res = jsonlite::get_object(*ro, "result")) {
        rule.result = *res;
      } else {
        errors.push_back(label + ": result must be an object");
      }

      if (auto it = ro->find("conditions"); it != ro->end()) {
        const auto* conds = std::get_if<jsonlite::Array>(&it->second.v);
        if (!conds) {
          errors.push_back(label + ": conditions must be an array");
        } else {
          for (std::size_t k = 0; k < conds->size(); ++k) {
            const std::string cwhere = label + " condition[" + std::to_string(k) + "]";
            const auto* co = std::get_if<jsonlite::Object>(&(*conds)[k].v);
            if (!co) {
              errors.push_back(cwhere + ": must be an object");
              continue;
            }
            Condition c;
            c.field = jsonlite::get_string(*co, "field");
            if (c.field.empty()) errors.push_back(cwhere + ": missing field");
            const std::string op_str = jsonlite::get_string(*co, "operator");
            auto op = rule_operator_from_string(op_str);
            if (!op) {
              errors.push_back(cwhere + ": unknown operator '" + op_str + "'");
              continue;
            }
            c.op = *op;
            auto vit = co->find("value");
            if (vit == co->end()) {
              errors.push_back(cwhere + ": missing value");
              continue;
            }
            c.value = vit->second;
            if ((c.op == RuleOperator::in || c.op == RuleOperator::not_in) && !c.value.is_array()) {
              errors.push_back(cwhere + ": operator " + op_str + " requires an array value");
            }
            if (is_range_op(c.op) && !c.value.is_number() && !c.value.is_string()) {
              errors.push_back(cwhere + ": operator " + op_str + " requires a number or string value");
            }
            if (c.op == RuleOperator::regex || c.op == RuleOperator::not_regex) {
              if (!c.value.is_string()) {
                errors.push_back(cwhere + ": regex value must be a string");
              } else {
                try {
                  c.compiled = std::make_shared<const std::regex>(std::get<std::string>(c.value.v));
                } catch (const std::regex_error& e) {
                  errors.push_back(cwhere + ": invalid regex: " + e.what());
                }
              }
            }
            rule.conditions.push_back(std::move(c));
          }
        }
      }
      rs.rules.push_back(std::move(rule));
    }
  }

  if (auto it = def.find("default_result"); it != def.end() && !it->second.is_null()) {
    if (const auto* d = std::get_if<jsonlite::Object>(&it->second.v)) {
      rs.default_result = *d;
    } else {
      errors.push_back("default_result must be an object or null");
    }
  }

  if (!errors.empty()) {
    if (status) *status = Status::failure(ErrorCode::validation_error, "invalid rule set", errors);
    return std::nullopt;
  }
  if (status) *status = Status::success();
  return rs;
}

std::optional<RuleSet> parse_ruleset(const std::string& json, Status* status) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (status) *status = Status::failure(ErrorCode::json_parse_error, err->message);
    return std::nullopt;
  }
  return parse_ruleset(obj, status);
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

namespace {

const jsonlite::Value* resolve_field(const std::string& field, const jsonlite::Object& input,
                                     const jsonlite::Object& features) {
  static const std::string kFeaturePrefix = "features.";
  if (field.compare(0, kFeaturePrefix.size(), kFeaturePrefix) == 0) {
    return jsonlite::find_path(features, field.substr(kFeaturePrefix.size()));
  }
  return jsonlite::find_path(input, field);
}

// -1/0/1 for comparable values (number/number or string/string).
std::optional<int> compare_values(const jsonlite::Value& a, const jsonlite::Value& b) {
  auto na = a.as_number();
  auto nb = b.as_number();
  if (na && nb) return (*na < *nb) ? -1 : (*na > *nb ? 1 : 0);
  if (a.is_string() && b.is_string()) {
    const int c = std::get<std::string>(a.v).compare(std::get<std::string>(b.v));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

bool array_contains(const jsonlite::Array& arr, const jsonlite::Value& v) {
  for (const auto& item : arr) {
    if (jsonlite::equal(item, v)) return true;
  }
  return false;
}

bool value_contains(const jsonlite::Value& haystack, const jsonlite::Value& needle) {
  if (haystack.is_string() && needle.is_string()) {
    return std::get<std::string>(haystack.v).find(std::get<std::string>(needle.v)) != std::string::npos;
  }
  if (const auto* arr = std::get_if<jsonlite::Array>(&haystack.v)) return array_contains(*arr, needle);
  return false;
}

}  // namespace

bool condition_holds(const Condition& c, const jsonlite::Object& input,
                     const jsonlite::Object& features) {
  const jsonlite::Value* actual = resolve_field(c.field, input, features);
  if (!actual || actual->is_null()) return false;

  switch (c.op) {
    case RuleOperator::eq: return jsonlite::equal(*actual, c.value);
    case RuleOperator::ne: return !jsonlite::equal(*actual, c.value);
    case RuleOperator::lt:
    case RuleOperator::le:
    case RuleOperator::gt:
    case RuleOperator::ge: {
      auto cmp = compare_values(*actual, c.value);
      if (!cmp) return false;
      if (c.op == RuleOperator::lt) return *cmp < 0;
      if (c.op == RuleOperator::le) return *cmp <= 0;
      if (c.op == RuleOperator::gt) return *cmp > 0;
      return *cmp >= 0;
    }
    case RuleOperator::in:
    case RuleOperator::not_in: {
      const auto* arr = std::get_if<jsonlite::Array>(&c.value.v);
      if (!arr) return false;
      const bool found = array_contains(*arr, *actual);
      return c.op == RuleOperator::in ? found : !found;
    }
    case RuleOperator::contains: return value_contains(*actual, c.value);
    case RuleOperator::not_contains: return !value_contains(*actual, c.value);
    case RuleOperator::regex:
    case RuleOperator::not_regex: {
      if (!actual->is_string() || !c.compiled) return false;
      const bool m = std::regex_search(std::get<std::string>(actual->v), *c.compiled);
      return c.op == RuleOperator::regex ? m : !m;
    }
  }
  return false;
}

RuleMatch evaluate_rules(const RuleSet& rules, const jsonlite::Object& input,
                         const jsonlite::Object& features,
                         const std::function<bool()>& cancelled) {
  std::vector<std::size_t> order(rules.rules.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return rules.rules[a].priority > rules.rules[b].priority;
  });

  for (std::size_t idx : order) {
    if (cancelled && cancelled()) throw std::runtime_error("evaluation cancelled");
    const Rule& r = rules.rules[idx];
    if (!r.enabled) continue;
    bool matched;
    if (r.conditions.empty()) {
      matched = true;
    } else if (r.match == MatchMode::all) {
      matched = std::all_of(r.conditions.begin(), r.conditions.end(),
                            [&](const Condition& c) { return condition_holds(c, input, features); });
    } else {
      matched = std::any_of(r.conditions.begin(), r.conditions.end(),
                            [&](const Condition& c) { return condition_holds(c, input, features); });
    }
    if (matched) return RuleMatch{r.result, r.rule_id, false};
  }
  if (rules.default_result) return RuleMatch{*rules.default_result, {}, true};
  throw std::runtime_error("no rule matched and no default_result defined");
}

// ---------------------------------------------------------------------------
// Static analysis
// ---------------------------------------------------------------------------
//
// Each rule is reduced to disjunctive normal form: "all" rules are a single
// conjunction, "any" rules one conjunction per condition. A conjunction maps
// field -> FieldConstraint, the set of values the field may take:
//   allowed   finite set from == / in (absent = unrestricted)
//   interval  numeric bounds from < <= > >= (absent = unrestricted)
//   excluded  finite set from != / not_in
// Fields are independent, so two conjunctions overlap iff every field's merged
// constraint is satisfiable.

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

struct Interval {
  double lo{-kInf};
  double hi{kInf};
  bool lo_incl{false};
  bool hi_incl{false};
};

bool interval_nonempty(const Interval& i) {
  return i.lo < i.hi || (i.lo == i.hi && i.lo_incl && i.hi_incl);
}

bool in_interval(double x, const Interval& i) {
  const bool above = x > i.lo || (x == i.lo && i.lo_incl);
  const bool below = x < i.hi || (x == i.hi && i.hi_incl);
  return above && below;
}

Interval intersect(const Interval& a, const Interval& b) {
  Interval r = a;
  if (b.lo > r.lo || (b.lo == r.lo && !b.lo_incl)) { r.lo = b.lo; r.lo_incl = b.lo_incl; }
  if (b.hi < r.hi || (b.hi == r.hi && !b.hi_incl)) { r.hi = b.hi; r.hi_incl = b.hi_incl; }
  return r;
}

bool interval_covers(const Interval& outer, const Interval& inner) {
  const bool lo_ok = outer.lo < inner.lo || (outer.lo == inner.lo && (outer.lo_incl || !inner.lo_incl));
  const bool hi_ok = outer.hi > inner.hi || (outer.hi == inner.hi && (outer.hi_incl || !inner.hi_incl));
  return lo_ok && hi_ok;
}

using ValueSet = std::map<std::string, jsonlite::Value>;  // canonical -> value

struct FieldConstraint {
  bool has_allowed{false};
  ValueSet allowed;
  bool has_interval{false};
  Interval interval;
  ValueSet excluded;
};

struct Conjunction {
  std::map<std::string, FieldConstraint> fields;
  std::vector<std::string> unanalyzable;  // descriptions of skipped conditions
};

void insert_value(ValueSet& set, const jsonlite::Value& v) { set.emplace(jsonlite::to_json(v), v); }

void restrict_allowed(FieldConstraint& fc, const ValueSet& values) {
  if (!fc.has_allowed) {
    fc.has_allowed = true;
    fc.allowed = values;
    return;
  }
  ValueSet kept;
  for (const auto& [k, v] : fc.allowed) {
    if (values.count(k)) kept.emplace(k, v);
  }
  fc.allowed = std::move(kept);
}

void restrict_interval(FieldConstraint& fc, const Interval& i) {
  fc.interval = fc.has_interval ? intersect(fc.interval, i) : i;
  fc.has_interval = true;
}

void add_condition(Conjunction& conj, const Condition& c) {
  const std::string why = "operator " + to_string(c.op) + " on field '" + c.field + "'";
  if (!is_analyzable(c.op)) {
    conj.unanalyzable.push_back(why);
    return;
  }
  FieldConstraint& fc = conj.fields[c.field];
  switch (c.op) {
    case RuleOperator::eq: {
      ValueSet s;
      insert_value(s, c.value);
      restrict_allowed(fc, s);
      break;
    }
    case RuleOperator::in: {
      ValueSet s;
      if (const auto* arr = std::get_if<jsonlite::Array>(&c.value.v)) {
        for (const auto& v : *arr) insert_value(s, v);
      }
      restrict_allowed(fc, s);
      break;
    }
    case RuleOperator::ne:
      insert_value(fc.excluded, c.value);
      break;
    case RuleOperator::not_in:
      if (const auto* arr = std::get_if<jsonlite::Array>(&c.value.v)) {
        for (const auto& v : *arr) insert_value(fc.excluded, v);
      }
      break;
    default: {
      auto n = c.value.as_number();
      if (!n) {
        // Lexicographic string ranges are evaluated but not analyzed.
        conj.unanalyzable.push_back(why + " with non-numeric bound");
        return;
      }
      Interval i;
      if (c.op == RuleOperator::lt) { i.hi = *n; i.hi_incl = false; }
      if (c.op == RuleOperator::le) { i.hi = *n; i.hi_incl = true; }
      if (c.op == RuleOperator::gt) { i.lo = *n; i.lo_incl = false; }
      if (c.op == RuleOperator::ge) { i.lo = *n; i.lo_incl = true; }
      restrict_interval(fc, i);
      break;
    }
  }
}

bool value_admitted(const FieldConstraint& fc, const std::string& canon, const jsonlite::Value& v) {
  if (fc.has_allowed && !fc.allowed.count(canon)) return false;
  if (fc.excluded.count(canon)) return false;
  if (fc.has_interval) {
    auto n = v.as_number();
    if (!n || !in_interval(*n, fc.interval)) return false;
  }
  return true;
}

bool satisfiable(const FieldConstraint& fc) {
  if (fc.has_allowed) {
    for (const auto& [canon, v] : fc.allowed) {
      if (value_admitted(fc, canon, v)) return true;
    }
    return false;
  }
  if (fc.has_interval) {
    if (!interval_nonempty(fc.interval)) return false;
    if (fc.interval.lo == fc.interval.hi) {
      return !fc.excluded.count(jsonlite::to_json(jsonlite::Value(fc.interval.lo)));
    }
    return true;
  }
  return true;
}

FieldConstraint merge(const FieldConstraint& a, const FieldConstraint& b) {
  FieldConstraint r = a;
  if (b.has_allowed) restrict_allowed(r, b.allowed);
  if (b.has_interval) restrict_interval(r, b.interval);
  for (const auto& kv : b.excluded) r.excluded.insert(kv);
  return r;
}

bool conjunction_satisfiable(const Conjunction& c) {
  for (const auto& [field, fc] : c.fields) {
    (void)field;
    if (!satisfiable(fc)) return false;
  }
  return true;
}

Conjunction merge(const Conjunction& a, const Conjunction& b) {
  Conjunction r = a;
  for (const auto& [field, fc] : b.fields) {
    auto it = r.fields.find(field);
    if (it == r.fields.end()) r.fields.emplace(field, fc);
    else it->second = merge(it->second, fc);
  }
  r.unanalyzable.insert(r.unanalyzable.end(), b.unanalyzable.begin(), b.unanalyzable.end());
  return r;
}

// True when every value admitted by inner is admitted by outer.
bool covers(const FieldConstraint& outer, const FieldConstraint& inner) {
  if (inner.has_allowed) {
    for (const auto& [canon, v] : inner.allowed) {
      if (!value_admitted(inner, canon, v)) continue;
      if (!value_admitted(outer, canon, v)) return false;
    }
    return true;
  }
  if (inner.has_interval) {
    if (inner.interval.lo == inner.interval.hi) {
      const jsonlite::Value point(inner.interval.lo);
      return value_admitted(outer, jsonlite::to_json(point), point);
    }
    if (outer.has_allowed) return false;
    if (outer.has_interval && !interval_covers(outer.interval, inner.interval)) return false;
    for (const auto& [canon, v] : outer.excluded) {
      auto n = v.as_number();
      if (n && in_interval(*n, inner.interval) && !inner.excluded.count(canon)) return false;
    }
    return true;
  }
  if (outer.has_allowed || outer.has_interval) return false;
  for (const auto& [canon, v] : outer.excluded) {
    (void)v;
    if (!inner.excluded.count(canon)) return false;
  }
  return true;
}

bool covers(const Conjunction& outer, const Conjunction& inner) {
  if (!outer.unanalyzable.empty()) return false;
  static const FieldConstraint kUnconstrained;
  for (const auto& [field, ofc] : outer.fields) {
    auto it = inner.fields.find(field);
    if (!covers(ofc, it == inner.fields.end() ? kUnconstrained : it->second)) return false;
  }
  return true;
}

std::vector<Conjunction> to_dnf(const Rule& r) {
  std::vector<Conjunction> out;
  if (r.conditions.empty() || r.match == MatchMode::all) {
    Conjunction c;
    for (const auto& cond : r.conditions) add_condition(c, cond);
    out.push_back(std::move(c));
    return out;
  }
  for (const auto& cond : r.conditions) {
    Conjunction c;
    add_condition(c, cond);
    out.push_back(std::move(c));
  }
  return out;
}

enum class Overlap { disjoint, overlap, unknown };

Overlap rules_overlap(const std::vector<Conjunction>& a, const std::vector<Conjunction>& b,
                      std::string* unknown_reason) {
  bool unknown = false;
  for (const auto& ca : a) {
    for (const auto& cb : b) {
      const Conjunction m = merge(ca, cb);
      if (!conjunction_satisfiable(m)) continue;
      if (m.unanalyzable.empty()) return Overlap::overlap;
      if (!unknown && unknown_reason) *unknown_reason = m.unanalyzable.front();
      unknown = true;
    }
  }
  return unknown ? Overlap::unknown : Overlap::disjoint;
}

std::string root_segment(const std::string& path) {
  const auto dot = path.find('.');
  return dot == std::string::npos ? path : path.substr(0, dot);
}

}  // namespace

RuleAnalysis RuleAnalyzer::Check(const RuleSet& rules, const Schema* input_schema,
                                 const std::vector<std::string>& declared_features) {
  RuleAnalysis result;

  // Metrics + per-rule warnings.
  std::size_t total_conditions = 0;
  bool first_enabled = true;
  for (const auto& r : rules.rules) {
    ++result.metrics.total_rules;
    if (!r.enabled) {
      result.warnings.push_back("rule '" + r.rule_id + "' is disabled");
      continue;
    }
    ++result.metrics.enabled_rules;
    total_conditions += r.conditions.size();
    if (first_enabled) {
      result.metrics.min_priority = result.metrics.max_priority = r.priority;
      first_enabled = false;
    } else {
      result.metrics.min_priority = std::min(result.metrics.min_priority, r.priority);
      result.metrics.max_priority = std::max(result.metrics.max_priority, r.priority);
    }
    if (r.conditions.empty()) {
      result.warnings.push_back("rule '" + r.rule_id + "' has no conditions and always matches");
    }

    for (const auto& c : r.conditions) {
      static const std::string kFeaturePrefix = "features.";
      if (c.field.compare(0, kFeaturePrefix.size(), kFeaturePrefix) == 0) {
        const std::string name = root_segment(c.field.substr(kFeaturePrefix.size()));
        if (std::find(declared_features.begin(), declared_features.end(), name) == declared_features.end()) {
          result.warnings.push_back("rule '" + r.rule_id + "': feature '" + name + "' is not declared");
        }
        continue;
      }
      if (!input_schema || input_schema->empty()) continue;
      const std::string root = root_segment(c.field);
      auto it = input_schema->fields.find(root);
      if (it == input_schema->fields.end()) {
        result.warnings.push_back("rule '" + r.rule_id + "': field '" + c.field +
                                  "' is not declared by the input schema");
        continue;
      }
      if (root != c.field) continue;
      const FieldType t = it->second.type;
      const bool numeric_field = t == FieldType::integer || t == FieldType::number;
      if (is_range_op(c.op) && !numeric_field && t != FieldType::string && t != FieldType::datetime) {
        result.warnings.push_back("rule '" + r.rule_id + "': type mismatch, operator " + to_string(c.op) +
                                  " on " + to_string(t) + " field '" + c.field + "'");
      } else if (is_range_op(c.op) && numeric_field && !c.value.is_number()) {
        result.warnings.push_back("rule '" + r.rule_id + "': type mismatch, numeric field '" + c.field +
                                  "' compared with " + jsonlite::type_name(c.value));
      } else if (c.op == RuleOperator::eq || c.op == RuleOperator::ne) {
        if ((numeric_field && !c.value.is_number()) ||
            (t == FieldType::boolean && !c.value.is_bool()) ||
            (t == FieldType::string && !c.value.is_string())) {
          result.warnings.push_back("rule '" + r.rule_id + "': type mismatch, " + to_string(t) + " field '" +
                                    c.field + "' compared with " + jsonlite::type_name(c.value));
        }
      }
    }
  }
  if (result.metrics.enabled_rules > 0) {
    result.metrics.avg_conditions =
        static_cast<double>(total_conditions) / static_cast<double>(result.metrics.enabled_rules);
  }

  // DNF per enabled rule.
  std::vector<const Rule*> enabled;
  std::vector<std::vector<Conjunction>> dnf;
  std::vector<bool> satisfiable_rule;
  for (const auto& r : rules.rules) {
    if (!r.enabled) continue;
    enabled.push_back(&r);
    dnf.push_back(to_dnf(r));
    const bool sat = std::any_of(dnf.back().begin(), dnf.back().end(),
                                 [](const Conjunction& c) { return conjunction_satisfiable(c); });
    satisfiable_rule.push_back(sat);
    if (!sat) {
      result.warnings.push_back("rule '" + r.rule_id + "' can never match (contradictory conditions)");
    }
  }

  // Pairwise: conflicts (equal priority) and shadowing (higher priority).
  for (std::size_t i = 0; i < enabled.size(); ++i) {
    for (std::size_t j = i + 1; j < enabled.size(); ++j) {
      const Rule& a = *enabled[i];
      const Rule& b = *enabled[j];
      if (!satisfiable_rule[i] || !satisfiable_rule[j]) continue;

      if (a.priority == b.priority) {
        const bool same_result = jsonlite::to_json(a.result) == jsonlite::to_json(b.result);
        if (same_result) continue;
        std::string reason;
        switch (rules_overlap(dnf[i], dnf[j], &reason)) {
          case Overlap::overlap: {
            RuleConflict c;
            c.type = "overlapping_conditions";
            c.rule_a = a.rule_id;
            c.rule_b = b.rule_id;
            c.priority = a.priority;
            c.description = "rules '" + a.rule_id + "' and '" + b.rule_id + "' share priority " +
                            std::to_string(a.priority) +
                            ", can match the same input and produce different results";
            result.conflicts.push_back(std::move(c));
            break;
          }
          case Overlap::unknown:
            result.unanalyzable.push_back("rules '" + a.rule_id + "' and '" + b.rule_id + "' (priority " +
                                          std::to_string(a.priority) +
                                          "): unanalyzable — requires manual review (" + reason + ")");
            break;
          case Overlap::disjoint:
            break;
        }
      }
    }
  }

  // Shadowing: a rule is unreachable if one earlier-evaluated single
  // conjunction rule covers all of its conjunctions.
  for (std::size_t j = 0; j < enabled.size(); ++j) {
    if (!satisfiable_rule[j]) continue;
    for (std::size_t i = 0; i < enabled.size(); ++i) {
      if (i == j) continue;
      const Rule& hi = *enabled[i];
      const Rule& lo = *enabled[j];
      const bool earlier = hi.priority > lo.priority || (hi.priority == lo.priority && i < j);
      if (!earlier || dnf[i].size() != 1) continue;
      const bool all_covered = std::all_of(dnf[j].begin(), dnf[j].end(), [&](const Conjunction& c) {
        return !conjunction_satisfiable(c) || covers(dnf[i].front(), c);
      });
      if (all_covered) {
        result.warnings.push_back("rule '" + lo.rule_id + "' is unreachable: shadowed by rule '" + hi.rule_id +
                                  "'");
        break;
      }
    }
  }

  result.valid = result.conflicts.empty();
  return result;
}

std::string RuleAnalysis::to_json() const {
  jsonlite::Object o;
  o["valid"] = valid;
  jsonlite::Array conf;
  for (const auto& c : conflicts) {
    jsonlite::Object co;
    co["type"] = c.type;
    co["rule_a"] = c.rule_a;
    co["rule_b"] = c.rule_b;
    co["priority"] = c.priority;
    co["description"] = c.description;
    conf.emplace_back(std::move(co));
  }
  o["conflicts"] = std::move(conf);
  jsonlite::Array un(unanalyzable.begin(), unanalyzable.end());
  o["unanalyzable"] = std::move(un);
  jsonlite::Array w(warnings.begin(), warnings.end());
  o["warnings"] = std::move(w);
  jsonlite::Object m;
  m["total_rules"] = metrics.total_rules;
  m["enabled_rules"] = metrics.enabled_rules;
  m["min_priority"] = metrics.min_priority;
  m["max_priority"] = metrics.max_priority;
  m["avg_conditions"] = metrics.avg_conditions;
  o["metrics"] = std::move(m);
  return jsonlite::to_json(o);
}

}  // namespace arbiter
