#include "arbiter/schema.hpp"

#include <cmath>
#include <regex>

namespace arbiter {

std::string to_string(FieldType t) {
  switch (t) {
    case FieldType::string: return "string";
    case FieldType::integer: return "integer";
    case FieldType::number: return "number";
    case FieldType::boolean: return "boolean";
    case FieldType::object: return "object";
    case FieldType::array: return "array";
    case FieldType::datetime: return "datetime";
  }
  return "unknown";
}

std::optional<FieldType> field_type_from_string(const std::string& s) {
  if (s == "string") return FieldType::string;
  if (s == "integer") return FieldType::integer;
  if (s == "number" || s == "float") return FieldType::number;
  if (s == "boolean") return FieldType::boolean;
  if (s == "object") return FieldType::object;
  if (s == "array") return FieldType::array;
  if (s == "datetime") return FieldType::datetime;
  return std::nullopt;
}

std::vector<std::string> Schema::decision_fields() const {
  std::vector<std::string> out;
  for (const auto& [name, spec] : fields) {
    if (spec.decision) out.push_back(name);
  }
  return out;
}

std::string Schema::to_json() const {
  jsonlite::Object root;
  for (const auto& [name, spec] : fields) {
    jsonlite::Object f;
    f["type"] = to_string(spec.type);
    if (spec.required) f["required"] = true;
    if (!spec.enum_values.empty()) f["enum"] = jsonlite::Array(spec.enum_values);
    if (spec.min_value) f["min"] = *spec.min_value;
    if (spec.max_value) f["max"] = *spec.max_value;
    if (spec.pattern) f["pattern"] = *spec.pattern;
    if (spec.decision) f["decision"] = true;
    root[name] = std::move(f);
  }
  if (!allow_additional) root["additional"] = false;
  return jsonlite::to_json(root);
}

std::optional<Schema> parse_schema(const jsonlite::Object& def, Status* status) {
  Schema schema;
  std::vector<std::string> errors;

  for (const auto& [name, raw] : def) {
    if (name == "additional") {
      if (!raw.is_bool()) {
        errors.push_back("'additional' must be a boolean");
      } else {
        schema.allow_additional = std::get<bool>(raw.v);
      }
      continue;
    }
    const auto* spec_obj = std::get_if<jsonlite::Object>(&raw.v);
    if (!spec_obj) {
      errors.push_back("field '" + name + "': spec must be an object");
      continue;
    }
    FieldSpec spec;
    spec.name = name;
    const auto type_str = jsonlite::get_string(*spec_obj, "type");
    const auto type = field_type_from_string(type_str);
    if (!type) {
      errors.push_back("field '" + name + "': unknown type '" + type_str + "'");
      continue;
    }
    spec.type = *type;
    spec.required = jsonlite::get_bool(*spec_obj, "required", false);
    spec.decision = jsonlite::get_bool(*spec_obj, "decision", false);
    if (const auto* e = jsonlite::get_array(*spec_obj, "enum")) spec.enum_values = *e;
    if (auto it = spec_obj->find("min"); it != spec_obj->end()) {
      if (auto n = it->second.as_number()) spec.min_value = *n;
      else errors.push_back("field '" + name + "': min must be a number");
    }
    if (auto it = spec_obj->find("max"); it != spec_obj->end()) {
      if (auto n = it->second.as_number()) spec.max_value = *n;
      else errors.push_back("field '" + name + "': max must be a number");
    }
    if (spec.min_value && spec.max_value && *spec.min_value > *spec.max_value) {
      errors.push_back("field '" + name + "': min greater than max");
    }
    if (auto it = spec_obj->find("pattern"); it != spec_obj->end()) {
      if (!it->second.is_string()) {
        errors.push_back("field '" + name + "': pattern must be a string");
      } else {
        spec.pattern = std::get<std::string>(it->second.v);
        try {
          std::regex re(*spec.pattern);
        } catch (const std::regex_error& e) {
          errors.push_back("field '" + name + "': invalid pattern: " + e.what());
        }
      }
    }
    schema.fields.emplace(name, std::move(spec));
  }

  if (!errors.empty()) {
    if (status) *status = Status::failure(ErrorCode::validation_error, "invalid schema", errors);
    return std::nullopt;
  }
  if (status) *status = Status::success();
  return schema;
}

std::optional<Schema> parse_schema(const std::string& json, Status* status) {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(json, &err);
  if (err) {
    if (status) *status = Status::failure(ErrorCode::json_parse_error, err->message);
    return std::nullopt;
  }
  return parse_schema(obj, status);
}

namespace {

bool type_matches(FieldType t, const jsonlite::Value& v) {
  switch (t) {
    case FieldType::string: return v.is_string();
    case FieldType::integer: {
      if (std::holds_alternative<std::uint64_t>(v.v)) return true;
      if (const auto* d = std::get_if<double>(&v.v)) return std::floor(*d) == *d;
      return false;
    }
    case FieldType::number: return v.is_number();
    case FieldType::boolean: return v.is_bool();
    case FieldType::object: return v.is_object();
    case FieldType::array: return v.is_array();
    case FieldType::datetime:
      return v.is_string() && parse_iso8601_utc(std::get<std::string>(v.v)).has_value();
  }
  return false;
}

}  // namespace

std::vector<std::string> validate(const Schema& schema, const jsonlite::Object& value) {
  std::vector<std::string> violations;

  for (const auto& [name, spec] : schema.fields) {
    auto it = value.find(name);
    if (it == value.end() || it->second.is_null()) {
      if (spec.required) violations.push_back("field '" + name + "': required field missing");
      continue;
    }
    const auto& v = it->second;
    if (!type_matches(spec.type, v)) {
      violations.push_back("field '" + name + "': expected " + to_string(spec.type) + ", got " +
                           jsonlite::type_name(v));
      continue;
    }
    if (!spec.enum_values.empty()) {
      bool found = false;
      for (const auto& allowed : spec.enum_values) {
        if (jsonlite::equal(allowed, v)) { found = true; break; }
      }
      if (!found) {
        violations.push_back("field '" + name + "': value " + jsonlite::to_json(v) + " not in enum");
      }
    }
    if (auto n = v.as_number()) {
      if (spec.min_value && *n < *spec.min_value) {
        violations.push_back("field '" + name + "': value " + jsonlite::to_json(v) + " below minimum " +
                             jsonlite::format_double(*spec.min_value));
      }
      if (spec.max_value && *n > *spec.max_value) {
        violations.push_back("field '" + name + "': value " + jsonlite::to_json(v) + " above maximum " +
                             jsonlite::format_double(*spec.max_value));
      }
    }
    if (spec.pattern && v.is_string()) {
      try {
        if (!std::regex_match(std::get<std::string>(v.v), std::regex(*spec.pattern))) {
          violations.push_back("field '" + name + "': does not match pattern " + *spec.pattern);
        }
      } catch (const std::regex_error&) {
        violations.push_back("field '" + name + "': pattern cannot be evaluated");
      }
    }
  }

  if (!schema.allow_additional) {
    for (const auto& [name, v] : value) {
      (void)v;
      if (!schema.has_field(name)) violations.push_back("field '" + name + "': not declared by schema");
    }
  }
  return violations;
}

}  // namespace arbiter
