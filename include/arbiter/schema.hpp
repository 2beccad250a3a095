#pragma once

// arbiter/schema.hpp — Input/output contract of a decision function.
//
// Schema JSON is a flat object of field specs:
//
//   {"credit_score": {"type": "integer", "required": true, "min": 300, "max": 850},
//    "amount":       {"type": "number", "min": 0},
//    "eligible":     {"type": "boolean", "decision": true}}
//
// validate() collects EVERY violation; it never stops at the first one.
// Fields not declared by the schema are accepted unless "additional": false
// is present at the top level of the schema object.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "arbiter/jsonlite.hpp"
#include "arbiter/types.hpp"

namespace arbiter {

enum class FieldType { string, integer, number, boolean, object, array, datetime };

std::string to_string(FieldType t);
std::optional<FieldType> field_type_from_string(const std::string& s);

struct FieldSpec {
  std::string name;
  FieldType type{FieldType::string};
  bool required{false};
  std::vector<jsonlite::Value> enum_values;
  std::optional<double> min_value;
  std::optional<double> max_value;
  std::optional<std::string> pattern;  // ECMAScript regex, full match
  bool decision{false};                // decision-relevant for drift classification
};

struct Schema {
  std::map<std::string, FieldSpec> fields;
  bool allow_additional{true};

  bool empty() const { return fields.empty(); }
  bool has_field(const std::string& name) const { return fields.count(name) != 0; }
  std::vector<std::string> decision_fields() const;

  // Canonical JSON form (also the hashed form).
  std::string to_json() const;
};

// Parse a schema definition. Every malformed field spec is reported in
// Status::details.
std::optional<Schema> parse_schema(const jsonlite::Object& def, Status* status);
std::optional<Schema> parse_schema(const std::string& json, Status* status);

// Returns one human-readable entry per violation; empty means valid.
std::vector<std::string> validate(const Schema& schema, const jsonlite::Object& value);

}  // namespace arbiter
