#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "arbiter/audit.hpp"
#include "arbiter/cas.hpp"
#include "arbiter/config.hpp"
#include "arbiter/engine.hpp"
#include "arbiter/evaluatable.hpp"
#include "arbiter/fakes.hpp"
#include "arbiter/hash.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/kv_store.hpp"
#include "arbiter/ledger.hpp"
#include "arbiter/log_store.hpp"
#include "arbiter/observability.hpp"
#include "arbiter/registry.hpp"
#include "arbiter/rules.hpp"
#include "arbiter/schema.hpp"
#include "arbiter/version.hpp"

namespace fs = std::filesystem;
namespace jsonlite = arbiter::jsonlite;

namespace {

int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("arbiter_tests_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

bool contains_text(const std::vector<std::string>& items, const std::string& needle) {
  return std::any_of(items.begin(), items.end(),
                     [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

// ---- shared fixtures -------------------------------------------------------

const char* kLoanRules = R"({
  "rules": [
    {"rule_id": "prime", "priority": 10, "match": "all",
     "conditions": [{"field": "credit_score", "operator": ">=", "value": 700},
                    {"field": "amount", "operator": "<=", "value": 10000}],
     "result": {"eligible": true, "reason": "prime"}}
  ],
  "default_result": {"eligible": false, "reason": "default"}
})";

const char* kLoanInputSchema = R"({
  "credit_score": {"type": "integer", "required": true, "min": 300, "max": 850},
  "amount": {"type": "number", "required": true, "min": 0}
})";

const char* kLoanOutputSchema = R"({
  "eligible": {"type": "boolean", "required": true, "decision": true},
  "reason": {"type": "string"}
})";

constexpr arbiter::TimestampMs kT1 = 1704067200000;  // 2024-01-01T00:00:00Z
constexpr arbiter::TimestampMs kT2 = 1717200000000;  // 2024-06-01T00:00:00Z
constexpr arbiter::TimestampMs kT3 = 1735689600000;  // 2025-01-01T00:00:00Z

std::string loan_rules_with_threshold(int threshold, const std::string& reason = "prime") {
  return std::string(R"({"rules": [{"rule_id": "prime", "priority": 10, "conditions": [)") +
         R"({"field": "credit_score", "operator": ">=", "value": )" + std::to_string(threshold) + "},"
         R"({"field": "amount", "operator": "<=", "value": 10000}],)"
         R"("result": {"eligible": true, "reason": ")" + reason + R"("}}],)"
         R"("default_result": {"eligible": false, "reason": "default"}})";
}

arbiter::DraftRequest loan_draft(const std::string& version, const std::string& rules = kLoanRules) {
  arbiter::DraftRequest req;
  req.function_id = "loan_eligibility";
  req.version = version;
  req.ruleset_json = rules;
  req.input_schema_json = kLoanInputSchema;
  req.output_schema_json = kLoanOutputSchema;
  req.metadata.author = "alice";
  req.metadata.description = "consumer loan eligibility";
  return req;
}

arbiter::DraftRequest native_draft(const std::string& function_id, const std::string& version,
                                   std::shared_ptr<const arbiter::NativeEvaluatable> logic,
                                   const std::string& output_schema = "{}") {
  arbiter::DraftRequest req;
  req.function_id = function_id;
  req.version = version;
  req.logic = std::move(logic);
  req.output_schema_json = output_schema;
  return req;
}

jsonlite::Object loan_input(int score, double amount = 5000) {
  jsonlite::Object in;
  in["credit_score"] = score;
  in["amount"] = amount;
  return in;
}

struct Fixture {
  explicit Fixture(arbiter::EngineConfig cfg = {}, std::shared_ptr<arbiter::ILogStore> store = nullptr)
      : ledger(std::move(store), cfg.ledger_options()),
        registry(kv, ledger, signer, legal),
        engine(registry, ledger, cas, features, cfg),
        audit(registry, ledger, cas, engine) {
    signer.add_key("alice-key", "alice secret material");
    signer.add_key("bob-key", "bob secret material");
    signer.add_key("carol-key", "carol secret material");
    legal.register_reference("https://finlex.fi/fi/laki/ajantasa/1999/544", "Henkilötietolaki", "5 §");
  }

  std::shared_ptr<arbiter::InMemoryKvStore> kv = std::make_shared<arbiter::InMemoryKvStore>();
  arbiter::KeyedBlake3Signer signer;
  arbiter::PatternLegalReferenceValidator legal;
  std::shared_ptr<arbiter::InMemoryFeatureStore> features = std::make_shared<arbiter::InMemoryFeatureStore>();
  arbiter::InMemoryCasBackend cas;
  arbiter::TraceLedger ledger;
  arbiter::DecisionRegistry registry;
  arbiter::DecisionEngine engine;
  arbiter::AuditService audit;
};

arbiter::RegistryResult sign_as(arbiter::DecisionRegistry& registry, const arbiter::KeyedBlake3Signer& signer,
                                const std::string& fn, const std::string& ver, const std::string& who,
                                arbiter::SignerRole role) {
  auto artifact = registry.get(fn, ver);
  expect(artifact != nullptr, "artifact " + fn + " " + ver + " exists before signing");
  const auto sig = signer.sign(arbiter::DecisionRegistry::release_payload(*artifact, role), who + "-key");
  expect(sig.ok, "fake signer produces a signature");
  return registry.sign(fn, ver, who, role, sig.signature, who + "-key");
}

// register -> release -> owner(alice) + reviewer(bob) -> activate
void release(arbiter::DecisionRegistry& registry, const arbiter::KeyedBlake3Signer& signer,
             const std::string& fn, const std::string& ver, arbiter::TimestampMs from) {
  auto r = registry.request_release(fn, ver, "alice");
  expect(r.status.ok, "request_release " + ver + ": " + r.status.message);
  r = sign_as(registry, signer, fn, ver, "alice", arbiter::SignerRole::owner);
  expect(r.status.ok, "owner signs " + ver + ": " + r.status.message);
  r = sign_as(registry, signer, fn, ver, "bob", arbiter::SignerRole::reviewer);
  expect(r.status.ok, "reviewer signs " + ver + ": " + r.status.message);
  expect(r.artifact->status == arbiter::FunctionStatus::approved, "two signatures approve " + ver);
  r = registry.activate(fn, ver, from, "alice");
  expect(r.status.ok, "activate " + ver + ": " + r.status.message);
}

void release(Fixture& f, const std::string& fn, const std::string& ver, arbiter::TimestampMs from) {
  release(f.registry, f.signer, fn, ver, from);
}

void register_loan(Fixture& f, const std::string& version, const std::string& rules = kLoanRules) {
  auto r = f.registry.register_draft(loan_draft(version, rules), "alice");
  expect(r.status.ok, "register loan " + version + ": " + r.status.message);
}

arbiter::DecisionResult run(Fixture& f, const std::string& fn, jsonlite::Object input,
                            arbiter::TimestampMs as_of = kT1 + 1000) {
  arbiter::ExecuteRequest req;
  req.function_id = fn;
  req.input = std::move(input);
  req.caller_id = "caller-1";
  req.as_of_unix_ms = as_of;
  return f.engine.execute(req);
}

uint64_t count_decisions(const arbiter::TraceLedger& ledger) {
  uint64_t n = 0;
  for (const auto& r : ledger.records()) n += r.is_decision() ? 1 : 0;
  return n;
}

// ============ Phase 1: Hashing and canonical JSON ============

void test_blake3_known_vectors() {
  auto info = arbiter::hash_runtime_info();
  expect(info.blake3_available, "BLAKE3 available");
  expect(info.primitive == "blake3", "primitive is blake3");
  expect(arbiter::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(arbiter::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_hash_domains_are_separated() {
  const std::string payload = "{\"a\":1}";
  std::set<std::string> digests = {
      arbiter::cas_content_hash(payload), arbiter::logic_content_hash(payload),
      arbiter::release_payload_hash(payload), arbiter::chain_link_hash(arbiter::ledger_genesis_hash(), payload),
      arbiter::blake3_hex(payload)};
  expect(digests.size() == 5, "every domain yields a distinct digest");
  for (const auto& d : digests) expect(arbiter::is_hex_digest(d), "digest is 64 lowercase hex");
  expect(arbiter::is_hex_digest(arbiter::ledger_genesis_hash()), "genesis hash is a digest");
  expect(!arbiter::is_hex_digest("ABC"), "short/uppercase is not a digest");
  expect(arbiter::digest_equal(arbiter::cas_content_hash("x"), arbiter::cas_content_hash("x")), "digest_equal");
}

void test_keyed_hash_depends_on_key() {
  const auto k1 = arbiter::derive_hash_key("arbiter test", "one");
  const auto k2 = arbiter::derive_hash_key("arbiter test", "two");
  expect(arbiter::keyed_hash_hex(k1, "payload") == arbiter::keyed_hash_hex(k1, "payload"), "keyed hash stable");
  expect(arbiter::keyed_hash_hex(k1, "payload") != arbiter::keyed_hash_hex(k2, "payload"), "key changes MAC");
}

void test_canonical_json_sorted_and_compact() {
  std::optional<jsonlite::JsonError> err;
  auto obj = jsonlite::parse(R"({ "b": 1, "a": [true, null, "x"], "c": {"z": 2, "y": 3} })", &err);
  expect(!err, "parse ok");
  expect(jsonlite::to_json(obj) == R"({"a":[true,null,"x"],"b":1,"c":{"y":3,"z":2}})", "keys sorted, compact");
  expect(jsonlite::canonicalize_json(R"({"b":1,"a":2})") == R"({"a":2,"b":1})", "canonicalize_json");
}

void test_doubles_round_trip_exactly() {
  const double values[] = {0.1, 0.1 + 0.2, 0.3, 10000.000000000002, -2.5, 1e-300, 123456789.123456789, 5.0};
  for (double d : values) {
    jsonlite::Object o;
    o["x"] = d;
    auto back = jsonlite::parse(jsonlite::to_json(o));
    auto x = back["x"].as_number();
    expect(x && *x == d, "double survives canonical form: " + jsonlite::to_json(o));
  }
  expect(jsonlite::format_double(0.1) == "0.1", "short form where it round-trips");
  expect(jsonlite::format_double(5.0) == "5", "integral double prints as an integer");
  expect(jsonlite::format_double(0.1 + 0.2) != jsonlite::format_double(0.3), "0.1+0.2 and 0.3 stay distinct");
  expect(jsonlite::format_double(10000.000000000002) != "10000", "no rounding to a neighbouring integer");
}

void test_duplicate_keys_rejected() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value(), "duplicate key rejected");
  expect(err->code == "json_duplicate_key", "duplicate key error code");
  err.reset();
  jsonlite::parse("{\"a\":", &err);
  expect(err.has_value() && err->code == "json_parse_error", "truncated JSON is a parse error");
}

void test_uuid_from_key_is_stable() {
  expect(arbiter::uuid_from_key("req-1") == arbiter::uuid_from_key("req-1"), "same key, same uuid");
  expect(arbiter::uuid_from_key("req-1") != arbiter::uuid_from_key("req-2"), "different key, different uuid");
  expect(arbiter::make_uuid_v4() != arbiter::make_uuid_v4(), "random uuids differ");
  expect(arbiter::make_uuid_v4().size() == 36, "uuid is 36 chars");
}

// ============ Phase 2: Schemas and rule sets ============

void test_schema_collects_all_violations() {
  arbiter::Status st;
  auto schema = arbiter::parse_schema(std::string(kLoanInputSchema), &st);
  expect(schema.has_value(), "schema parses: " + st.message);
  auto violations = arbiter::validate(*schema, loan_input(720));
  expect(violations.empty(), "valid input passes");

  jsonlite::Object bad;
  bad["credit_score"] = 900;
  violations = arbiter::validate(*schema, bad);
  expect(violations.size() == 2, "range and missing field both reported");
  expect(contains_text(violations, "above maximum"), "range violation reported");
  expect(contains_text(violations, "required field missing"), "missing field reported");

  bad["credit_score"] = "high";
  violations = arbiter::validate(*schema, bad);
  expect(contains_text(violations, "expected integer"), "type violation reported");
}

void test_schema_rejects_malformed_definitions() {
  arbiter::Status st;
  auto schema = arbiter::parse_schema(std::string(R"({"a": {"type": "strnig"}, "b": {"type": "number", "min": 5, "max": 1}})"), &st);
  expect(!schema.has_value(), "malformed schema rejected");
  expect(st.details.size() == 2, "both field errors enumerated");

  auto closed = arbiter::parse_schema(std::string(R"({"x": {"type": "string"}, "additional": false})"), &st);
  expect(closed.has_value() && !closed->allow_additional, "additional:false parsed");
  jsonlite::Object extra;
  extra["x"] = "ok";
  extra["y"] = 1;
  expect(contains_text(arbiter::validate(*closed, extra), "not declared"), "extra field rejected");
}

void test_schema_decision_fields() {
  arbiter::Status st;
  auto schema = arbiter::parse_schema(std::string(kLoanOutputSchema), &st);
  expect(schema.has_value(), "output schema parses");
  auto fields = schema->decision_fields();
  expect(fields.size() == 1 && fields[0] == "eligible", "eligible is the decision field");
}

void test_rules_priority_default_and_features() {
  arbiter::Status st;
  auto rules = arbiter::parse_ruleset(std::string(R"({
    "rules": [
      {"rule_id": "low_risk", "priority": 10,
       "conditions": [{"field": "features.risk", "operator": "<", "value": 0.3}], "result": {"tier": "A"}},
      {"rule_id": "scored", "priority": 5,
       "conditions": [{"field": "score", "operator": ">=", "value": 500}], "result": {"tier": "B"}}
    ],
    "default_result": {"tier": "C"}
  })"), &st);
  expect(rules.has_value(), "rule set parses: " + st.message);

  jsonlite::Object in;
  in["score"] = 600;
  jsonlite::Object feats;
  feats["risk"] = 0.1;
  auto m = arbiter::evaluate_rules(*rules, in, feats);
  expect(m.rule_id == "low_risk" && jsonlite::get_string(m.output, "tier") == "A", "highest priority wins");

  feats["risk"] = 0.5;
  m = arbiter::evaluate_rules(*rules, in, feats);
  expect(m.rule_id == "scored" && jsonlite::get_string(m.output, "tier") == "B", "next priority matches");

  m = arbiter::evaluate_rules(*rules, jsonlite::Object{}, jsonlite::Object{});
  expect(m.defaulted && jsonlite::get_string(m.output, "tier") == "C", "missing fields fall to default");
}

void test_rules_without_default_throw() {
  arbiter::Status st;
  auto rules = arbiter::parse_ruleset(std::string(R"({"rules": [{"rule_id": "a", "priority": 1,
      "conditions": [{"field": "x", "operator": "==", "value": 1}], "result": {"r": 1}}]})"), &st);
  expect(rules.has_value(), "parses");
  bool threw = false;
  try {
    arbiter::evaluate_rules(*rules, jsonlite::Object{}, jsonlite::Object{});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect(threw, "no match and no default throws");
}

void test_rules_syntax_errors_enumerated() {
  arbiter::Status st;
  auto rules = arbiter::parse_ruleset(std::string(R"({"rules": [
      {"rule_id": "a", "priority": 1, "conditions": [{"field": "x", "operator": "~~", "value": 1}], "result": {}},
      {"priority": 2, "conditions": [], "result": {"r": 1}}
  ]})"), &st);
  expect(!rules.has_value(), "invalid rule set rejected");
  expect(st.code == arbiter::ErrorCode::validation_error, "validation_error");
  expect(contains_text(st.details, "unknown operator"), "operator error listed");
  expect(contains_text(st.details, "missing rule_id"), "rule_id error listed");

  rules = arbiter::parse_ruleset(std::string("{not json"), &st);
  expect(!rules.has_value() && st.code == arbiter::ErrorCode::json_parse_error, "bad JSON is json_parse_error");
}

void test_analyzer_detects_overlap() {
  arbiter::Status st;
  auto rules = arbiter::parse_ruleset(std::string(R"({"rules": [
      {"rule_id": "approve", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": ">=", "value": 600}], "result": {"eligible": true}},
      {"rule_id": "deny", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": "<=", "value": 700}], "result": {"eligible": false}}
  ]})"), &st);
  expect(rules.has_value(), "parses");
  auto a = arbiter::RuleAnalyzer::Check(*rules, nullptr, {});
  expect(!a.valid && a.conflicts.size() == 1, "one conflict");
  expect(a.conflicts[0].rule_a == "approve" && a.conflicts[0].rule_b == "deny", "conflict names both rules");
  expect(a.conflicts[0].type == "overlapping_conditions", "conflict type");
  expect(a.metrics.total_rules == 2, "metrics count rules");
}

void test_analyzer_disjoint_and_unanalyzable() {
  arbiter::Status st;
  auto disjoint = arbiter::parse_ruleset(std::string(R"({"rules": [
      {"rule_id": "low", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": "<", "value": 600}], "result": {"band": "low"}},
      {"rule_id": "high", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": ">=", "value": 600}], "result": {"band": "high"}}
  ]})"), &st);
  expect(disjoint.has_value(), "parses");
  auto a = arbiter::RuleAnalyzer::Check(*disjoint, nullptr, {});
  expect(a.valid && a.unanalyzable.empty(), "disjoint ranges do not conflict");

  auto regex = arbiter::parse_ruleset(std::string(R"({"rules": [
      {"rule_id": "a_names", "priority": 5,
       "conditions": [{"field": "name", "operator": "regex", "value": "^A.*"}], "result": {"group": "a"}},
      {"rule_id": "b_names", "priority": 5,
       "conditions": [{"field": "name", "operator": "regex", "value": "^B.*"}], "result": {"group": "b"}}
  ]})"), &st);
  expect(regex.has_value(), "parses");
  a = arbiter::RuleAnalyzer::Check(*regex, nullptr, {});
  expect(a.valid, "regex pair is not a proven conflict");
  expect(a.unanalyzable.size() == 1, "regex pair flagged for manual review");
  expect(a.unanalyzable[0].find("requires manual review") != std::string::npos, "review wording");
}

void test_analyzer_warnings() {
  arbiter::Status st;
  auto schema = arbiter::parse_schema(std::string(R"({"credit_score": {"type": "integer"}})"), &st);
  auto rules = arbiter::parse_ruleset(std::string(R"({"rules": [
      {"rule_id": "broad", "priority": 10,
       "conditions": [{"field": "credit_score", "operator": ">=", "value": 600}], "result": {"ok": true}},
      {"rule_id": "narrow", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": ">=", "value": 700}], "result": {"ok": "maybe"}},
      {"rule_id": "income", "priority": 1,
       "conditions": [{"field": "income", "operator": ">", "value": 0},
                      {"field": "features.risk", "operator": "<", "value": 1}], "result": {"ok": false}},
      {"rule_id": "never", "priority": 0,
       "conditions": [{"field": "credit_score", "operator": ">", "value": 800},
                      {"field": "credit_score", "operator": "<", "value": 400}], "result": {"ok": false}},
      {"rule_id": "off", "priority": 0, "enabled": false,
       "conditions": [{"field": "credit_score", "operator": "==", "value": 1}], "result": {"ok": false}}
  ]})"), &st);
  expect(rules.has_value(), "parses: " + st.message);
  auto a = arbiter::RuleAnalyzer::Check(*rules, &*schema, {});
  expect(a.valid, "different priorities never conflict");
  expect(contains_text(a.warnings, "'narrow' is unreachable: shadowed by rule 'broad'"), "shadowing detected");
  expect(contains_text(a.warnings, "field 'income'"), "undeclared field warned");
  expect(contains_text(a.warnings, "feature 'risk' is not declared"), "undeclared feature warned");
  expect(contains_text(a.warnings, "'never' can never match"), "contradiction detected");
  expect(contains_text(a.warnings, "'off' is disabled"), "disabled rule warned");
}

// ============ Phase 3: Storage ============

void test_cas_memory_integrity() {
  arbiter::InMemoryCasBackend cas;
  const std::string digest = cas.put("{\"a\":1}");
  expect(digest == arbiter::cas_content_hash("{\"a\":1}"), "digest is the content hash");
  expect(cas.put("{\"a\":1}") == digest, "put is idempotent");
  expect(cas.size() == 1, "stored once");
  auto got = cas.get(digest);
  expect(got && *got == "{\"a\":1}", "get returns bytes");
  expect(cas.corrupt_for_test(digest, "{\"a\":2}"), "corrupt hook");
  expect(!cas.get(digest).has_value(), "corrupted object is not returned");
}

void test_cas_file_store_tamper() {
  const fs::path dir = fresh_dir("cas");
  arbiter::CasStore cas((dir / "cas").string());
  const std::string digest = cas.put("decision input");
  expect(!digest.empty(), "put ok");
  expect(cas.contains(digest), "contains");
  auto got = cas.get(digest);
  expect(got && *got == "decision input", "read back");

  {
    std::ofstream ofs(cas.object_path(digest), std::ios::binary | std::ios::trunc);
    ofs << "tampered bytes";
  }
  expect(!cas.get(digest).has_value(), "tampered object fails integrity check");
  fs::remove_all(dir);
}

void test_kv_compare_and_swap() {
  arbiter::InMemoryKvStore kv;
  auto r = kv.put_if("fn/a/1", "v1", 0);
  expect(r.status.ok && r.revision == 1, "create with expected 0");
  r = kv.put_if("fn/a/1", "again", 0);
  expect(!r.status.ok && r.status.code == arbiter::ErrorCode::concurrent_modification, "create twice fails");
  r = kv.put_if("fn/a/1", "v2", 1);
  expect(r.status.ok && r.revision == 2, "update with current revision");
  r = kv.put_if("fn/a/1", "v3", 1);
  expect(!r.status.ok && r.status.code == arbiter::ErrorCode::concurrent_modification, "stale revision fails");
  auto v = kv.get("fn/a/1");
  expect(v && v->value == "v2" && v->revision == 2, "value unchanged after failed CAS");
  kv.put_if("fn/b/1", "x", 0);
  kv.put_if("other", "x", 0);
  expect(kv.keys("fn/").size() == 2, "prefix scan");
}

void test_kv_file_store_reload() {
  const fs::path dir = fresh_dir("kv");
  {
    arbiter::FileKvStore kv((dir / "kv").string());
    expect(kv.put_if("fn/loan/1.0.0", "{\"x\":1}", 0).status.ok, "put");
    expect(kv.put_if("fn/loan/1.0.0", "{\"x\":2}", 1).status.ok, "update");
  }
  arbiter::FileKvStore kv((dir / "kv").string());
  expect(kv.load_errors().empty(), "clean reload");
  auto v = kv.get("fn/loan/1.0.0");
  expect(v && v->value == "{\"x\":2}" && v->revision == 2, "value and revision survive reopen");
  expect(!kv.put_if("fn/loan/1.0.0", "stale", 1).status.ok, "stale revision rejected after reopen");
  fs::remove_all(dir);
}

void test_log_stores() {
  arbiter::InMemoryLogStore mem;
  expect(mem.append_batch({"a", "b"}).ok, "memory append");
  mem.set_fail_appends(true);
  expect(!mem.append_batch({"c"}).ok, "failure injection");
  mem.set_fail_appends(false);
  std::vector<std::string> lines;
  expect(mem.read_all(&lines).ok && lines.size() == 2, "failed batch not stored");

  const fs::path dir = fresh_dir("log");
  arbiter::FileLogStore file((dir / "ledger.ndjson").string());
  expect(file.append_batch({"{\"n\":1}", "{\"n\":2}"}).ok, "file append");
  expect(file.append_batch({"{\"n\":3}"}).ok, "second batch");
  lines.clear();
  expect(file.read_all(&lines).ok && lines.size() == 3 && lines[2] == "{\"n\":3}", "file read back in order");
  expect(file.failure_count() == 0, "no write failures");
  fs::remove_all(dir);
}

// ============ Phase 4: Trace ledger ============

arbiter::TraceRecord make_record(int i) {
  arbiter::TraceRecord r;
  r.trace_id = "trace-" + std::to_string(i);
  r.function_id = "loan_eligibility";
  r.version = "1.0.0";
  r.function_hash = arbiter::logic_content_hash("logic");
  r.caller_id = "caller-" + std::to_string(i);
  r.as_of_unix_ms = kT1 + i;
  r.input_hash = arbiter::cas_content_hash("in" + std::to_string(i));
  r.output_hash = arbiter::cas_content_hash("out" + std::to_string(i));
  return r;
}

void test_ledger_append_links_chain() {
  arbiter::TraceLedger ledger;
  for (int i = 0; i < 5; ++i) {
    auto r = ledger.append(make_record(i));
    expect(r.status.ok && !r.duplicate, "append");
    expect(r.record.sequence == static_cast<uint64_t>(i), "dense sequence");
  }
  auto recs = ledger.records();
  expect(recs[0].prev_hash == arbiter::ledger_genesis_hash(), "first link anchored at genesis");
  for (size_t i = 1; i < recs.size(); ++i) {
    expect(recs[i].prev_hash == recs[i - 1].chain_hash, "prev_hash links to predecessor");
  }
  expect(ledger.tail_hash() == recs.back().chain_hash, "tail hash");
  auto report = ledger.verify_integrity();
  expect(report.ok && report.records_checked == 5, "untampered ledger verifies");
  expect(report.first_broken_trace_id.empty(), "no broken id");
}

void test_ledger_duplicate_trace_id() {
  arbiter::TraceLedger ledger;
  ledger.append(make_record(1));
  auto rec = make_record(1);
  rec.caller_id = "someone else";
  auto r = ledger.append(rec);
  expect(r.duplicate && r.record.caller_id == "caller-1", "duplicate returns the stored record");
  expect(ledger.size() == 1, "nothing appended");
  expect(!ledger.append(arbiter::TraceRecord{}).status.ok, "empty trace_id rejected");
}

void test_ledger_detects_any_field_mutation() {
  arbiter::TraceLedger ledger;
  for (int i = 0; i < 5; ++i) ledger.append(make_record(i));
  const auto pristine = ledger.records();

  std::vector<std::function<void(arbiter::TraceRecord&)>> mutations = {
      [](arbiter::TraceRecord& r) { r.caller_id = "mallory"; },
      [](arbiter::TraceRecord& r) { r.status = "ERROR"; },
      [](arbiter::TraceRecord& r) { r.error_code = "validation_error"; },
      [](arbiter::TraceRecord& r) { r.version = "9.9.9"; },
      [](arbiter::TraceRecord& r) { r.function_hash = arbiter::logic_content_hash("other"); },
      [](arbiter::TraceRecord& r) { r.input_hash = arbiter::cas_content_hash("other"); },
      [](arbiter::TraceRecord& r) { r.output_hash = arbiter::cas_content_hash("other"); },
      [](arbiter::TraceRecord& r) { r.feature_snapshot_ref = arbiter::cas_content_hash("snap"); },
      [](arbiter::TraceRecord& r) { r.timestamp_unix_ms += 1; },
      [](arbiter::TraceRecord& r) { r.as_of_unix_ms += 1; },
      [](arbiter::TraceRecord& r) { r.detail = "{\"message\":\"edited\"}"; },
      [](arbiter::TraceRecord& r) { r.prev_hash = arbiter::ledger_genesis_hash(); },
      [](arbiter::TraceRecord& r) { r.chain_hash = arbiter::blake3_hex("forged"); },
  };
  for (size_t m = 0; m < mutations.size(); ++m) {
    auto copy = pristine;
    mutations[m](copy[3]);
    auto report = arbiter::verify_chain_records(copy);
    expect(!report.ok, "mutation " + std::to_string(m) + " detected");
    expect(report.first_broken_sequence == 3, "mutation " + std::to_string(m) + " located at record 3");
    expect(report.first_broken_trace_id == "trace-3", "broken trace id reported");
  }

  auto dropped = pristine;
  dropped.erase(dropped.begin() + 2);
  expect(!arbiter::verify_chain_records(dropped).ok, "deleted record detected");

  auto swapped = pristine;
  std::swap(swapped[1], swapped[2]);
  auto report = arbiter::verify_chain_records(swapped);
  expect(!report.ok && report.first_broken_sequence == 1, "reordering detected at first moved record");
}

void test_ledger_range_verification() {
  arbiter::TraceLedger ledger;
  for (int i = 0; i < 6; ++i) ledger.append(make_record(i));
  auto report = ledger.verify_integrity(2, 5);
  expect(report.ok && report.records_checked == 3, "sub-range verifies from stored anchor");
}

void test_ledger_file_tamper_detected_on_reopen() {
  const fs::path dir = fresh_dir("ledger_file");
  const std::string path = (dir / "ledger.ndjson").string();
  {
    arbiter::TraceLedger ledger(std::make_shared<arbiter::FileLogStore>(path));
    for (int i = 0; i < 4; ++i) ledger.append(make_record(i));
    expect(ledger.flush().ok, "flush");
    expect(ledger.committed_count() == 4, "all committed");
  }
  {
    arbiter::TraceLedger reopened(std::make_shared<arbiter::FileLogStore>(path));
    expect(reopened.load_status().ok && reopened.size() == 4, "reload");
    expect(reopened.verify_integrity().ok, "reloaded chain verifies");
    expect(reopened.get("trace-2").has_value(), "lookup after reload");
  }

  std::vector<std::string> lines;
  {
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
  }
  expect(lines.size() == 4, "four lines on disk");
  const auto pos = lines[1].find("caller-1");
  expect(pos != std::string::npos, "caller id present in line");
  lines[1].replace(pos, 8, "caller-X");
  {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
  }

  arbiter::TraceLedger tampered(std::make_shared<arbiter::FileLogStore>(path));
  auto report = tampered.verify_integrity();
  expect(!report.ok, "edited line detected");
  expect(report.first_broken_sequence == 1 && report.first_broken_trace_id == "trace-1", "edited line located");
  fs::remove_all(dir);
}

void test_ledger_unparseable_line_on_reload() {
  auto store = std::make_shared<arbiter::InMemoryLogStore>();
  {
    arbiter::TraceLedger ledger(store);
    for (int i = 0; i < 4; ++i) ledger.append(make_record(i));
    expect(ledger.flush().ok, "flush");
  }
  expect(store->size() == 4, "store holds every line");
  expect(store->tamper_for_test(2, "{this is not a record"), "tamper hook");

  arbiter::TraceLedger reopened(store);
  expect(reopened.unparseable_on_load() == 1, "one unparseable line");
  expect(reopened.size() == 4, "placeholder keeps sequence dense");
  auto report = reopened.verify_integrity();
  expect(!report.ok && report.first_broken_sequence == 2, "placeholder breaks the chain at its position");
}

void test_ledger_commit_failure_surfaces_on_flush() {
  auto store = std::make_shared<arbiter::InMemoryLogStore>();
  arbiter::TraceLedger ledger(store);
  store->set_fail_appends(true);
  ledger.append(make_record(1));
  expect(!ledger.flush().ok, "flush reports the failed commit");
  store->set_fail_appends(false);
}

// Store whose history cannot be read back.
class UnreadableLogStore : public arbiter::ILogStore {
 public:
  arbiter::Status append_batch(const std::vector<std::string>& lines) override {
    appended_ += lines.size();
    return arbiter::Status::success();
  }
  arbiter::Status read_all(std::vector<std::string>*) const override {
    return arbiter::Status::failure(arbiter::ErrorCode::storage_error, "device not ready");
  }
  std::string backend_id() const override { return "unreadable"; }
  size_t appended() const { return appended_; }

 private:
  size_t appended_{0};
};

void test_ledger_refuses_appends_after_failed_load() {
  auto store = std::make_shared<UnreadableLogStore>();
  arbiter::TraceLedger ledger(store);
  expect(!ledger.load_status().ok, "load failure reported");
  auto r = ledger.append(make_record(1));
  expect(r.status.code == arbiter::ErrorCode::storage_error, "append refused without history");
  expect(ledger.size() == 0, "nothing appended");
  expect(ledger.flush().code == arbiter::ErrorCode::storage_error, "flush reports the load failure");
  expect(store->appended() == 0, "no line written after the unknown tail");
}

// ============ Phase 5: Registry and governance ============

void test_scenario_a_release_flow() {
  Fixture f;
  auto req = loan_draft("1.0.0");
  req.metadata.legal_references = {"https://finlex.fi/fi/laki/ajantasa/1999/544"};
  auto r = f.registry.register_draft(req, "alice");
  expect(r.status.ok, "register: " + r.status.message);
  expect(r.artifact->status == arbiter::FunctionStatus::draft, "starts as DRAFT");
  expect(arbiter::is_hex_digest(r.artifact->logic_hash), "logic hash assigned");
  expect(r.artifact->citations.size() == 1 && r.artifact->citations[0].title == "Henkilötietolaki",
         "citation resolved");

  release(f, "loan_eligibility", "1.0.0", kT1);
  auto a = f.registry.get("loan_eligibility", "1.0.0");
  expect(a->status == arbiter::FunctionStatus::active, "ACTIVE after activation");
  expect(a->signatures.size() == 2, "owner and reviewer signatures kept");
  expect(a->window && a->window->effective_from == kT1 && a->window->effective_until == arbiter::kOpenEnded,
         "open effective window");

  std::vector<std::string> events;
  for (const auto& rec : f.ledger.records()) {
    expect(rec.event_type == "governance", "registry writes governance records");
    events.push_back(jsonlite::get_string(jsonlite::parse(rec.detail), "event"));
  }
  const std::vector<std::string> expected = {"registered", "release_requested", "signed",
                                             "signed",     "approved",          "activated"};
  expect(events == expected, "governance events in order");

  auto resolved = f.registry.resolve_active("loan_eligibility", kT1 + 1);
  expect(resolved.status.ok && resolved.artifact->version == "1.0.0", "resolves active version");
  resolved = f.registry.resolve_active("loan_eligibility", kT1 - 1);
  expect(resolved.status.code == arbiter::ErrorCode::version_not_found, "nothing effective before window");
}

void test_scenario_b_conflicting_rules_rejected() {
  Fixture f;
  auto req = loan_draft("1.0.0", R"({"rules": [
      {"rule_id": "approve", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": ">=", "value": 600}], "result": {"eligible": true}},
      {"rule_id": "deny", "priority": 5,
       "conditions": [{"field": "credit_score", "operator": "<=", "value": 700}], "result": {"eligible": false}}
  ]})");
  auto r = f.registry.register_draft(req, "alice");
  expect(!r.status.ok && r.status.code == arbiter::ErrorCode::rule_conflict, "rule_conflict");
  expect(contains_text(r.status.details, "'approve' and 'deny'"), "conflict detail names the rules");
  expect(f.registry.get("loan_eligibility", "1.0.0") == nullptr, "nothing registered");
  expect(f.ledger.size() == 0, "no governance record");
  expect(f.signer.verify_calls() == 0, "signer never consulted");
}

void test_register_draft_validation() {
  Fixture f;
  register_loan(f, "1.0.0");
  auto r = f.registry.register_draft(loan_draft("1.0.0"), "alice");
  expect(r.status.code == arbiter::ErrorCode::duplicate_version, "duplicate version");

  auto bad_id = loan_draft("1.0.0");
  bad_id.function_id = "loan eligibility!";
  expect(f.registry.register_draft(bad_id, "alice").status.code == arbiter::ErrorCode::validation_error,
         "bad identifier");

  auto both = loan_draft("2.0.0");
  both.logic = std::make_shared<const arbiter::NativeEvaluatable>(
      "both", "r1", [](const jsonlite::Object&, const arbiter::EvalContext&) { return jsonlite::Object{}; });
  r = f.registry.register_draft(both, "alice");
  expect(r.status.code == arbiter::ErrorCode::validation_error, "native and rule set together rejected");

  auto bad_schema = loan_draft("3.0.0");
  bad_schema.input_schema_json = R"({"a": {"type": "nope"}})";
  bad_schema.output_schema_json = R"({"b": {"type": "nope"}})";
  r = f.registry.register_draft(bad_schema, "alice");
  expect(r.status.code == arbiter::ErrorCode::validation_error, "bad schema rejected");
  expect(contains_text(r.status.details, "input_schema") && contains_text(r.status.details, "output_schema"),
         "both schema errors enumerated");

  auto no_entity = loan_draft("4.0.0");
  no_entity.metadata.features = {"risk_score"};
  r = f.registry.register_draft(no_entity, "alice");
  expect(r.status.code == arbiter::ErrorCode::validation_error, "features require an entity field");
}

void test_legal_reference_checks() {
  Fixture f;
  auto req = loan_draft("1.0.0");
  req.metadata.legal_references = {"https://example.com/not-a-statute"};
  auto r = f.registry.register_draft(req, "alice");
  expect(r.status.code == arbiter::ErrorCode::legal_reference, "unrecognised IRI rejected");
  expect(contains_text(r.status.details, "example.com"), "rejected IRI listed");

  req.metadata.legal_references = {"https://eur-lex.europa.eu/legal-content/EN/TXT/?uri=CELEX:32016R0679"};
  f.legal.set_available(false);
  r = f.registry.register_draft(req, "alice");
  expect(r.status.code == arbiter::ErrorCode::external_dependency, "validator outage is external_dependency");
  f.legal.set_available(true);
  r = f.registry.register_draft(req, "alice");
  expect(r.status.ok, "EUR-Lex IRI accepted");
}

void test_review_notes_recorded() {
  Fixture f;
  auto req = loan_draft("1.0.0", R"({"rules": [
      {"rule_id": "a_names", "priority": 5,
       "conditions": [{"field": "name", "operator": "regex", "value": "^A.*"}], "result": {"eligible": true}},
      {"rule_id": "b_names", "priority": 5,
       "conditions": [{"field": "name", "operator": "regex", "value": "^B.*"}], "result": {"eligible": false}}
  ], "default_result": {"eligible": false}})");
  auto r = f.registry.register_draft(req, "alice");
  expect(r.status.ok, "unanalyzable pair is accepted: " + r.status.message);
  expect(contains_text(r.artifact->review_notes, "requires manual review"), "flagged for manual review");
}

void test_separation_of_duties() {
  Fixture f;
  register_loan(f, "1.0.0");
  expect(f.registry.request_release("loan_eligibility", "1.0.0", "alice").status.ok, "release requested");
  auto r = sign_as(f.registry, f.signer, "loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::owner);
  expect(r.status.ok, "owner signs");
  r = sign_as(f.registry, f.signer, "loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::reviewer);
  expect(r.status.code == arbiter::ErrorCode::separation_of_duties, "same signer as reviewer refused");

  auto a = f.registry.get("loan_eligibility", "1.0.0");
  expect(a->status == arbiter::FunctionStatus::pending_review, "still pending review");
  expect(a->rejected_signatures.size() == 1 && a->rejected_signatures[0].signer_id == "alice",
         "refused signature persisted");

  r = f.registry.activate("loan_eligibility", "1.0.0", kT1, "alice");
  expect(r.status.code == arbiter::ErrorCode::separation_of_duties, "activation refused for SoD");
  expect(f.registry.get("loan_eligibility", "1.0.0")->status != arbiter::FunctionStatus::active, "not active");

  r = sign_as(f.registry, f.signer, "loan_eligibility", "1.0.0", "bob", arbiter::SignerRole::reviewer);
  expect(r.status.ok && r.artifact->status == arbiter::FunctionStatus::approved, "distinct reviewer approves");
  expect(f.registry.activate("loan_eligibility", "1.0.0", kT1, "alice").status.ok, "activation after fix");
}

void test_signature_failures() {
  Fixture f;
  register_loan(f, "1.0.0");
  auto r = sign_as(f.registry, f.signer, "loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::owner);
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "cannot sign a DRAFT");

  f.registry.request_release("loan_eligibility", "1.0.0", "alice");
  r = f.registry.sign("loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::owner, "deadbeef", "alice-key");
  expect(r.status.code == arbiter::ErrorCode::signature_invalid, "forged signature rejected");

  // A signature over the owner payload does not verify for the reviewer role.
  auto a = f.registry.get("loan_eligibility", "1.0.0");
  const auto owner_sig =
      f.signer.sign(arbiter::DecisionRegistry::release_payload(*a, arbiter::SignerRole::owner), "bob-key");
  r = f.registry.sign("loan_eligibility", "1.0.0", "bob", arbiter::SignerRole::reviewer, owner_sig.signature,
                      "bob-key");
  expect(r.status.code == arbiter::ErrorCode::signature_invalid, "role is bound into the payload");

  r = f.registry.sign("loan_eligibility", "1.0.0", "dave", arbiter::SignerRole::owner, "00", "dave-key");
  expect(r.status.code == arbiter::ErrorCode::signature_invalid, "unknown key rejected");

  auto sig = f.signer.sign(arbiter::DecisionRegistry::release_payload(*a, arbiter::SignerRole::owner), "alice-key");
  f.signer.set_available(false);
  r = f.registry.sign("loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::owner, sig.signature, "alice-key");
  expect(r.status.code == arbiter::ErrorCode::external_dependency, "verification outage is external_dependency");
  f.signer.set_available(true);

  r = f.registry.sign("loan_eligibility", "1.0.0", "alice", arbiter::SignerRole::owner, sig.signature, "alice-key");
  expect(r.status.ok, "valid owner signature");
  r = sign_as(f.registry, f.signer, "loan_eligibility", "1.0.0", "carol", arbiter::SignerRole::owner);
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "role already signed");
  expect(f.registry.get("loan_eligibility", "1.0.0")->signatures.size() == 1, "one signature stored");
}

void test_invalid_transitions() {
  Fixture f;
  expect(f.registry.request_release("missing", "1.0.0", "alice").status.code ==
             arbiter::ErrorCode::version_not_found,
         "unknown version");
  register_loan(f, "1.0.0");
  auto r = f.registry.activate("loan_eligibility", "1.0.0", kT1, "alice");
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "DRAFT cannot activate");
  r = f.registry.retire("loan_eligibility", "1.0.0", kT1, "alice");
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "DRAFT cannot retire");
  expect(f.registry.request_release("loan_eligibility", "1.0.0", "alice").status.ok, "release");
  r = f.registry.request_release("loan_eligibility", "1.0.0", "alice");
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "release twice");
}

void test_supersede_and_retire() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  register_loan(f, "3.0.0", loan_rules_with_threshold(650));
  release(f, "loan_eligibility", "1.0.0", kT1);
  release(f, "loan_eligibility", "2.0.0", kT2);

  auto v1 = f.registry.get("loan_eligibility", "1.0.0");
  expect(v1->status == arbiter::FunctionStatus::deprecated, "superseded version is DEPRECATED");
  expect(v1->window->effective_until == kT2, "old window closed at the new start");

  expect(f.registry.resolve_active("loan_eligibility", kT2 - 1).artifact->version == "1.0.0", "v1 before T2");
  expect(f.registry.resolve_active("loan_eligibility", kT2).artifact->version == "2.0.0", "v2 from T2");

  auto r = f.registry.request_release("loan_eligibility", "3.0.0", "alice");
  sign_as(f.registry, f.signer, "loan_eligibility", "3.0.0", "alice", arbiter::SignerRole::owner);
  sign_as(f.registry, f.signer, "loan_eligibility", "3.0.0", "bob", arbiter::SignerRole::reviewer);
  r = f.registry.activate("loan_eligibility", "3.0.0", kT1 + 5, "alice");
  expect(r.status.code == arbiter::ErrorCode::invalid_state_transition, "windows may not overlap");

  r = f.registry.retire("loan_eligibility", "2.0.0", kT3, "alice");
  expect(r.status.ok && r.artifact->status == arbiter::FunctionStatus::retired, "retired");
  expect(f.registry.resolve_active("loan_eligibility", kT3 - 1).artifact->version == "2.0.0",
         "still effective before sunset");
  expect(f.registry.resolve_active("loan_eligibility", kT3).status.code == arbiter::ErrorCode::version_not_found,
         "nothing effective after sunset");
  expect(f.registry.retire("loan_eligibility", "2.0.0", kT3, "alice").status.code ==
             arbiter::ErrorCode::invalid_state_transition,
         "retire twice");

  r = f.registry.activate("loan_eligibility", "3.0.0", kT3, "alice");
  expect(r.status.ok, "activation after sunset: " + r.status.message);
  expect(f.registry.resolve_active("loan_eligibility", kT3 + 1).artifact->version == "3.0.0", "v3 effective");
  expect(f.registry.list_versions("loan_eligibility").size() == 3, "three versions listed");
}

// Simulates another registry writer committing between our read and write.
class RacingKvStore : public arbiter::IVersionedKvStore {
 public:
  explicit RacingKvStore(std::shared_ptr<arbiter::IVersionedKvStore> inner) : inner_(std::move(inner)) {}
  void arm() { armed_ = true; }

  std::optional<arbiter::VersionedValue> get(const std::string& key) const override { return inner_->get(key); }
  std::vector<std::string> keys(const std::string& prefix) const override { return inner_->keys(prefix); }

  arbiter::KvPutResult put_if(const std::string& key, const std::string& value,
                              uint64_t expected_revision) override {
    if (armed_ && expected_revision != 0) {
      armed_ = false;
      auto competing = inner_->put_if(key, value, expected_revision);
      expect(competing.status.ok, "competing writer commits first");
    }
    return inner_->put_if(key, value, expected_revision);
  }

 private:
  std::shared_ptr<arbiter::IVersionedKvStore> inner_;
  bool armed_{false};
};

void test_concurrent_modification() {
  auto racing = std::make_shared<RacingKvStore>(std::make_shared<arbiter::InMemoryKvStore>());
  arbiter::TraceLedger ledger;
  arbiter::KeyedBlake3Signer signer;
  arbiter::PatternLegalReferenceValidator legal;
  arbiter::DecisionRegistry registry(racing, ledger, signer, legal);
  expect(registry.register_draft(loan_draft("1.0.0"), "alice").status.ok, "register");
  const auto events_before = ledger.size();
  racing->arm();
  auto r = registry.request_release("loan_eligibility", "1.0.0", "alice");
  expect(r.status.code == arbiter::ErrorCode::concurrent_modification, "lost update detected");
  expect(ledger.size() == events_before, "no event for a failed transition");
}

void test_concurrent_activation_single_winner() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  for (const std::string v : {"1.0.0", "2.0.0"}) {
    f.registry.request_release("loan_eligibility", v, "alice");
    sign_as(f.registry, f.signer, "loan_eligibility", v, "alice", arbiter::SignerRole::owner);
    sign_as(f.registry, f.signer, "loan_eligibility", v, "bob", arbiter::SignerRole::reviewer);
  }
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (const std::string v : {"1.0.0", "2.0.0"}) {
    threads.emplace_back([&f, &ok, v] {
      if (f.registry.activate("loan_eligibility", v, kT1, "alice").status.ok) ok++;
    });
  }
  for (auto& t : threads) t.join();
  // Equal effective_from: the later activation leaves the earlier one an empty window.
  auto idx = f.registry.index_snapshot();
  expect(ok.load() >= 1, "at least one activation");
  expect(f.registry.resolve_active("loan_eligibility", kT1 + 1).status.ok, "exactly one version resolves");
  expect(idx->windows("loan_eligibility").size() == static_cast<size_t>(ok.load()), "one window per activation");
}

void test_registry_reload_from_file_store() {
  const fs::path dir = fresh_dir("registry");
  arbiter::TraceLedger ledger;
  arbiter::KeyedBlake3Signer signer;
  signer.add_key("alice-key", "alice secret material");
  signer.add_key("bob-key", "bob secret material");
  arbiter::PatternLegalReferenceValidator legal;

  auto native = std::make_shared<const arbiter::NativeEvaluatable>(
      "fraud.velocity", "build-7", [](const jsonlite::Object& in, const arbiter::EvalContext&) {
        jsonlite::Object out;
        out["flagged"] = jsonlite::get_u64(in, "transactions") > 10;
        return out;
      });
  std::string v1_hash;
  {
    arbiter::DecisionRegistry registry(std::make_shared<arbiter::FileKvStore>((dir / "kv").string()), ledger,
                                       signer, legal);
    expect(registry.register_draft(loan_draft("1.0.0"), "alice").status.ok, "register rule set");
    release(registry, signer, "loan_eligibility", "1.0.0", kT1);
    auto r = registry.register_draft(native_draft("fraud_check", "1.0.0", native), "alice");
    expect(r.status.ok, "register native: " + r.status.message);
    v1_hash = registry.get("loan_eligibility", "1.0.0")->logic_hash;
  }

  auto catalog = std::make_shared<arbiter::NativeLogicCatalog>();
  catalog->add(native);
  arbiter::DecisionRegistry reloaded(std::make_shared<arbiter::FileKvStore>((dir / "kv").string()), ledger, signer,
                                     legal, catalog);
  auto st = reloaded.load();
  expect(st.ok, "reload: " + st.message);
  auto a = reloaded.get("loan_eligibility", "1.0.0");
  expect(a && a->status == arbiter::FunctionStatus::active && a->logic_hash == v1_hash, "rule set rehydrated");
  expect(a->signatures.size() == 2, "signatures rehydrated");
  expect(reloaded.resolve_active("loan_eligibility", kT1 + 1).status.ok, "index rebuilt");
  auto fraud = reloaded.get("fraud_check", "1.0.0");
  expect(fraud && fraud->logic->kind() == "native", "native logic bound through the catalog");

  arbiter::DecisionRegistry without_catalog(std::make_shared<arbiter::FileKvStore>((dir / "kv").string()), ledger,
                                            signer, legal);
  st = without_catalog.load();
  expect(!st.ok && st.code == arbiter::ErrorCode::storage_error, "unbound native logic reported");
  expect(contains_text(st.details, "fraud_check"), "failing document named");
  expect(without_catalog.get("loan_eligibility", "1.0.0") != nullptr, "loadable documents still loaded");
  fs::remove_all(dir);
}

// ============ Phase 6: Decision engine ============

void test_execute_ok_traced() {
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  const auto before = f.ledger.size();

  auto r = run(f, "loan_eligibility", loan_input(720));
  expect(r.status.ok, "execute: " + r.status.message);
  expect(r.traced && !r.idempotent_hit, "traced");
  expect(jsonlite::get_bool(r.output, "eligible"), "prime applicant eligible");
  expect(r.version == "1.0.0", "resolved version reported");
  expect(f.ledger.size() == before + 1, "exactly one record appended");

  auto rec = f.ledger.get(r.trace_id);
  expect(rec && rec->is_decision() && rec->ok(), "decision record OK");
  expect(rec->caller_id == "caller-1", "caller recorded verbatim");
  expect(rec->as_of_unix_ms == kT1 + 1000, "as_of recorded");
  expect(rec->function_hash == f.registry.get("loan_eligibility", "1.0.0")->logic_hash, "function hash");
  expect(rec->input_hash == r.input_hash && rec->output_hash == r.output_hash, "hashes recorded");
  auto stored_out = f.cas.get(rec->output_hash);
  expect(stored_out && *stored_out == jsonlite::to_json(r.output), "output stored canonically in CAS");
  expect(f.cas.contains(rec->input_hash), "input stored in CAS");
}

void test_execute_errors_are_traced() {
  arbiter::EngineConfig cfg;
  cfg.max_input_bytes = 256;
  Fixture f(cfg);
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);

  jsonlite::Object bad;
  bad["credit_score"] = 900;
  auto r = run(f, "loan_eligibility", bad);
  expect(r.status.code == arbiter::ErrorCode::validation_error, "schema violation");
  expect(r.status.details.size() == 2, "all violations reported");
  expect(r.traced, "invalid input still traced");
  auto rec = f.ledger.get(r.trace_id);
  expect(rec && rec->status == "ERROR" && rec->error_code == "validation_error", "ERROR record");

  r = run(f, "loan_eligibility", loan_input(720), kT1 - 1);
  expect(r.status.code == arbiter::ErrorCode::version_not_found && r.traced, "nothing effective, traced");

  r = run(f, "no_such_function", loan_input(720));
  expect(r.status.code == arbiter::ErrorCode::version_not_found && r.traced, "unknown function, traced");

  auto big = loan_input(720);
  big["note"] = std::string(1024, 'x');
  r = run(f, "loan_eligibility", big);
  expect(r.status.code == arbiter::ErrorCode::validation_error && r.traced, "oversized input rejected");
  expect(!f.cas.contains(r.input_hash), "oversized input not retained");
}

void test_execute_keeps_full_precision() {
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);

  auto over = run(f, "loan_eligibility", loan_input(720, 10000.000000000002));
  expect(over.status.ok, "execute: " + over.status.message);
  expect(!jsonlite::get_bool(over.output, "eligible", true), "amount just above the limit is denied");

  auto at = run(f, "loan_eligibility", loan_input(720, 10000));
  expect(jsonlite::get_bool(at.output, "eligible"), "amount at the limit is granted");
  expect(over.input_hash != at.input_hash, "distinct inputs, distinct input hashes");

  auto stored = f.cas.get(over.input_hash);
  expect(stored.has_value(), "input retained");
  auto amount = jsonlite::parse(*stored)["amount"].as_number();
  expect(amount && *amount == 10000.000000000002, "recorded input is the value decided on");
}

void test_execute_pinned_version() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  release(f, "loan_eligibility", "1.0.0", kT1);

  arbiter::ExecuteRequest req;
  req.function_id = "loan_eligibility";
  req.version = "2.0.0";
  req.input = loan_input(720);
  req.as_of_unix_ms = kT1 + 1;
  auto r = f.engine.execute(req);
  expect(r.status.code == arbiter::ErrorCode::inactive_function, "pinned non-active version refused");
  expect(r.traced, "refusal traced");

  req.version = "1.0.0";
  r = f.engine.execute(req);
  expect(r.status.ok && r.version == "1.0.0", "pinned effective version runs");
}

void test_execute_idempotent() {
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  arbiter::ExecuteRequest req;
  req.function_id = "loan_eligibility";
  req.input = loan_input(720);
  req.as_of_unix_ms = kT1 + 1;
  req.request_key = "req-0001";
  auto first = f.engine.execute(req);
  const auto size = f.ledger.size();
  auto second = f.engine.execute(req);
  expect(first.status.ok && second.status.ok, "both succeed");
  expect(second.idempotent_hit && !first.idempotent_hit, "second call is a replayed reply");
  expect(first.trace_id == second.trace_id, "same trace id");
  expect(first.output_hash == second.output_hash && jsonlite::get_bool(second.output, "eligible"),
         "same output");
  expect(f.ledger.size() == size, "no second record");

  req.function_id = "other_function";
  auto misuse = f.engine.execute(req);
  expect(misuse.status.code == arbiter::ErrorCode::validation_error && !misuse.traced,
         "key reused for another function refused");
}

std::shared_ptr<const arbiter::NativeEvaluatable> waiting_logic(const std::string& symbol) {
  return std::make_shared<const arbiter::NativeEvaluatable>(
      symbol, "r1", [](const jsonlite::Object&, const arbiter::EvalContext& ctx) -> jsonlite::Object {
        for (int i = 0; i < 5000 && !ctx.cancelled(); ++i) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        throw arbiter::EvaluationCancelled();
      });
}

void test_execute_timeout() {
  arbiter::EngineConfig cfg;
  cfg.execution_timeout_ms = 50;
  cfg.feature_fetch_timeout_ms = 20;
  Fixture f(cfg);
  expect(f.registry.register_draft(native_draft("slow", "1.0.0", waiting_logic("slow")), "alice").status.ok,
         "register");
  release(f, "slow", "1.0.0", kT1);
  const auto t0 = std::chrono::steady_clock::now();
  auto r = run(f, "slow", jsonlite::Object{});
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(r.status.code == arbiter::ErrorCode::execution_timeout, "timeout reported");
  expect(r.traced && f.ledger.get(r.trace_id)->error_code == "execution_timeout", "timeout traced");
  expect(elapsed < std::chrono::seconds(2), "caller released at the deadline");
}

void test_execute_cancellation_not_traced() {
  arbiter::EngineConfig cfg;
  cfg.execution_timeout_ms = 5000;
  Fixture f(cfg);
  expect(f.registry.register_draft(native_draft("waits", "1.0.0", waiting_logic("waits")), "alice").status.ok,
         "register");
  release(f, "waits", "1.0.0", kT1);
  const auto before = f.ledger.size();

  arbiter::ExecuteRequest req;
  req.function_id = "waits";
  req.as_of_unix_ms = kT1 + 1;
  req.cancel = std::make_shared<std::atomic<bool>>(true);
  auto r = f.engine.execute(req);
  expect(r.status.code == arbiter::ErrorCode::cancelled && !r.traced, "pre-cancelled call");

  req.cancel = std::make_shared<std::atomic<bool>>(false);
  auto flag = req.cancel;
  std::thread canceller([flag] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    flag->store(true);
  });
  r = f.engine.execute(req);
  canceller.join();
  expect(r.status.code == arbiter::ErrorCode::cancelled, "cancelled mid-evaluation");
  expect(!r.traced && r.output.empty(), "no partial result");
  expect(f.ledger.size() == before, "nothing appended for cancelled calls");
}

void test_execute_logic_failures() {
  Fixture f;
  auto throwing = std::make_shared<const arbiter::NativeEvaluatable>(
      "throws", "r1", [](const jsonlite::Object&, const arbiter::EvalContext&) -> jsonlite::Object {
        throw std::runtime_error("division by zero");
      });
  auto wrong_type = std::make_shared<const arbiter::NativeEvaluatable>(
      "wrong", "r1", [](const jsonlite::Object&, const arbiter::EvalContext&) {
        jsonlite::Object out;
        out["eligible"] = "yes";
        return out;
      });
  expect(f.registry.register_draft(native_draft("throws", "1.0.0", throwing), "alice").status.ok, "register");
  expect(f.registry.register_draft(native_draft("wrong", "1.0.0", wrong_type, kLoanOutputSchema), "alice").status.ok,
         "register");
  release(f, "throws", "1.0.0", kT1);
  release(f, "wrong", "1.0.0", kT1);

  auto r = run(f, "throws", jsonlite::Object{});
  expect(r.status.code == arbiter::ErrorCode::execution_error && r.traced, "exception becomes execution_error");
  expect(r.status.message.find("division by zero") != std::string::npos, "message kept");

  r = run(f, "wrong", jsonlite::Object{});
  expect(r.status.code == arbiter::ErrorCode::validation_error && r.traced, "bad output rejected");
}

const char* kRiskRules = R"({
  "rules": [
    {"rule_id": "low_risk", "priority": 10,
     "conditions": [{"field": "features.risk_score", "operator": "<", "value": 0.5}],
     "result": {"approved": true}}
  ],
  "default_result": {"approved": false}
})";

void register_risk_gate(Fixture& f) {
  arbiter::DraftRequest req;
  req.function_id = "risk_gate";
  req.version = "1.0.0";
  req.ruleset_json = kRiskRules;
  req.input_schema_json = R"({"applicant_id": {"type": "string", "required": true}})";
  req.output_schema_json = R"({"approved": {"type": "boolean", "required": true, "decision": true}})";
  req.metadata.features = {"risk_score"};
  req.metadata.entity_field = "applicant_id";
  auto r = f.registry.register_draft(req, "alice");
  expect(r.status.ok, "register risk_gate: " + r.status.message);
  release(f, "risk_gate", "1.0.0", 1);
  f.features->put("app-1", "risk_score", 0.2, 100);
  f.features->put("app-1", "risk_score", 0.9, 300);
}

jsonlite::Object applicant(const std::string& id) {
  jsonlite::Object in;
  in["applicant_id"] = id;
  return in;
}

void test_features_point_in_time() {
  Fixture f;
  register_risk_gate(f);
  auto early = run(f, "risk_gate", applicant("app-1"), 200);
  expect(early.status.ok && jsonlite::get_bool(early.output, "approved"), "value as of 200 used");
  auto late = run(f, "risk_gate", applicant("app-1"), 400);
  expect(late.status.ok && !jsonlite::get_bool(late.output, "approved"), "value as of 400 used");

  auto snap = f.cas.get(early.feature_snapshot_ref);
  expect(snap.has_value(), "snapshot stored");
  auto obj = jsonlite::parse(*snap);
  const jsonlite::Value* observed = jsonlite::find_path(obj, "features.risk_score.observed_at");
  expect(observed && observed->as_number() && *observed->as_number() == 100, "snapshot keeps observation time");

  jsonlite::Object no_entity;
  auto r = run(f, "risk_gate", no_entity, 200);
  expect(r.status.code == arbiter::ErrorCode::validation_error, "missing entity id rejected");
}

void test_feature_fetch_retries() {
  arbiter::EngineConfig cfg;
  cfg.feature_fetch_backoff_ms = 1;
  Fixture f(cfg);
  register_risk_gate(f);
  const uint64_t retries_before = arbiter::global_engine_stats().feature_fetch_retries.load();

  f.features->fail_next(2);
  auto r = run(f, "risk_gate", applicant("app-1"), 200);
  expect(r.status.ok, "recovers within max attempts: " + r.status.message);
  expect(arbiter::global_engine_stats().feature_fetch_retries.load() >= retries_before + 2, "retries counted");

  f.features->fail_next(5);
  r = run(f, "risk_gate", applicant("app-1"), 200);
  expect(r.status.code == arbiter::ErrorCode::external_dependency, "exhausted retries");
  expect(r.traced && f.ledger.get(r.trace_id)->error_code == "external_dependency", "traced");
  f.features->fail_next(0);
}

void test_feature_store_future_leak_refused() {
  Fixture f;
  register_risk_gate(f);
  f.features->set_leak_future_values(true);
  auto r = run(f, "risk_gate", applicant("app-1"), 200);
  expect(r.status.code == arbiter::ErrorCode::external_dependency, "future value refused");
  expect(r.status.message.find("point-in-time") != std::string::npos, "reason given");
}

void test_evaluate_is_side_effect_free() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  release(f, "loan_eligibility", "1.0.0", kT1);
  const auto size = f.ledger.size();
  auto e = f.engine.evaluate("loan_eligibility", "1.0.0", loan_input(720), {}, kT1 + 1);
  expect(e.status.ok && jsonlite::get_bool(e.output, "eligible"), "evaluate");
  expect(e.output_hash == arbiter::cas_content_hash(e.canonical_output), "output hash");
  expect(f.ledger.size() == size, "no ledger writes");
  e = f.engine.evaluate("loan_eligibility", "2.0.0", loan_input(720), {}, kT1 + 1);
  expect(e.status.code == arbiter::ErrorCode::inactive_function, "drafts are not evaluable");
}

// ============ Phase 7: Audit and replay ============

void test_replay_determinism() {
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  auto ok = run(f, "loan_eligibility", loan_input(720));
  jsonlite::Object bad;
  bad["credit_score"] = 100;
  auto err = run(f, "loan_eligibility", bad);

  auto rep = f.audit.replay(ok.trace_id);
  expect(rep.match && rep.classification == arbiter::DriftClass::identical, "recorded version reproduces");
  expect(rep.replayed_output_hash == rep.original_output_hash, "same hash");
  rep = f.audit.replay(err.trace_id);
  expect(rep.match && rep.classification == arbiter::DriftClass::identical, "recorded error reproduces");

  rep = f.audit.replay("no-such-trace");
  expect(rep.classification == arbiter::DriftClass::violation, "missing trace is a violation");
}

void test_replay_oversized_unpinned_call_is_neutral() {
  arbiter::EngineConfig cfg;
  cfg.max_input_bytes = 256;
  Fixture f(cfg);
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);

  auto big = loan_input(720);
  big["note"] = std::string(1024, 'x');
  auto r = run(f, "loan_eligibility", big);
  expect(r.status.code == arbiter::ErrorCode::validation_error && r.traced, "oversized input traced");
  auto rec = f.ledger.get(r.trace_id);
  expect(rec && rec->version.empty(), "rejected before a version was resolved");

  auto drift = f.audit.replay(r.trace_id);
  expect(drift.classification == arbiter::DriftClass::neutral, "nothing to re-evaluate: " + drift.message);
  drift = f.audit.replay(r.trace_id, std::string("1.0.0"));
  expect(drift.classification == arbiter::DriftClass::neutral, "neutral against an explicit version too");
}

void test_replay_uses_recorded_features() {
  Fixture f;
  register_risk_gate(f);
  auto r = run(f, "risk_gate", applicant("app-1"), 200);
  f.features->put("app-1", "risk_score", 0.99, 150);
  auto rep = f.audit.replay(r.trace_id);
  expect(rep.match, "later writes to the feature store do not affect replay");
}

void test_replay_detects_nondeterminism() {
  static std::atomic<int> counter{0};
  Fixture f;
  auto impure = std::make_shared<const arbiter::NativeEvaluatable>(
      "impure", "r1", [](const jsonlite::Object&, const arbiter::EvalContext&) {
        jsonlite::Object out;
        out["n"] = counter.fetch_add(1);
        return out;
      });
  expect(f.registry.register_draft(native_draft("impure", "1.0.0", impure), "alice").status.ok, "register");
  release(f, "impure", "1.0.0", kT1);
  auto r = run(f, "impure", jsonlite::Object{});
  expect(r.status.ok, "execute");
  const uint64_t before = arbiter::global_engine_stats().determinism_violations.load();
  auto rep = f.audit.replay(r.trace_id);
  expect(!rep.match && rep.determinism_violation, "determinism violation");
  expect(rep.classification == arbiter::DriftClass::violation, "never folded into another class");
  expect(contains_text(rep.changed_fields, "n"), "changed field reported");
  expect(arbiter::global_engine_stats().determinism_violations.load() == before + 1, "counter bumped");
}

void test_shadow_replay_classification() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  register_loan(f, "3.0.0", loan_rules_with_threshold(650));
  register_loan(f, "4.0.0", loan_rules_with_threshold(700, "prime-v4"));
  release(f, "loan_eligibility", "1.0.0", kT1);
  for (const std::string v : {"2.0.0", "3.0.0", "4.0.0"}) {
    expect(f.registry.request_release("loan_eligibility", v, "alice").status.ok, "candidate " + v);
  }

  auto approved = run(f, "loan_eligibility", loan_input(720));
  auto declined = run(f, "loan_eligibility", loan_input(680));

  auto rep = f.audit.replay(approved.trace_id, std::string("2.0.0"));
  expect(rep.classification == arbiter::DriftClass::regression, "stricter candidate regresses");
  expect(!rep.determinism_violation, "shadow drift is not a determinism violation");
  rep = f.audit.replay(declined.trace_id, std::string("3.0.0"));
  expect(rep.classification == arbiter::DriftClass::improvement, "lenient candidate improves");
  rep = f.audit.replay(approved.trace_id, std::string("4.0.0"));
  expect(rep.classification == arbiter::DriftClass::neutral, "reason-only change is neutral");
  expect(rep.changed_fields.size() == 1 && rep.changed_fields[0] == "reason", "changed field listed");
  rep = f.audit.replay(declined.trace_id, std::string("2.0.0"));
  expect(rep.classification == arbiter::DriftClass::identical, "same decline is identical");
}

void test_classify_drift_direct() {
  jsonlite::Object a, b;
  a["status"] = "approved";
  b["status"] = "declined";
  std::vector<std::string> changed;
  expect(arbiter::classify_drift(arbiter::well_known_decision_fields(), a, b, &changed) ==
             arbiter::DriftClass::regression,
         "approved to declined regresses");
  expect(arbiter::classify_drift(arbiter::well_known_decision_fields(), b, a, &changed) ==
             arbiter::DriftClass::improvement,
         "declined to approved improves");
  jsonlite::Value yes(true);
  jsonlite::Value eligible("Eligible");
  expect(arbiter::is_positive_decision(&yes) && arbiter::is_positive_decision(&eligible), "positive values");
  expect(!arbiter::is_positive_decision(nullptr), "missing is not positive");
}

void test_bulk_replay_gate() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  release(f, "loan_eligibility", "1.0.0", kT1);
  expect(f.registry.request_release("loan_eligibility", "2.0.0", "alice").status.ok, "candidate");
  for (int score = 600; score < 800; score += 10) run(f, "loan_eligibility", loan_input(score));

  auto sample = f.audit.sample_traces("loan_eligibility", 0, arbiter::kOpenEnded);
  expect(sample.size() == 20, "every decision sampled");
  expect(f.audit.sample_traces("loan_eligibility", 0, arbiter::kOpenEnded, 5).size() == 5, "limit honored");

  auto same = f.audit.bulk_replay("loan_eligibility", "1.0.0", sample);
  expect(same.total == 20 && same.matches == 20 && same.match_rate == 1.0, "recorded version matches");
  expect(same.gate_passed, "gate passes");
  expect(same.reports.size() == 20 && same.reports[3].trace_id == sample[3], "reports keep sample order");

  auto candidate = f.audit.bulk_replay("loan_eligibility", "2.0.0", sample, 3);
  expect(candidate.regressions == 5, "scores 700..740 regress");
  expect(candidate.regression_ratio > arbiter::AuditService::kMaxRegressionRatio, "ratio above threshold");
  expect(!candidate.gate_passed, "gate fails");
  expect(candidate.to_json().find("\"gate\":\"FAIL\"") != std::string::npos, "report shows FAIL");

  auto empty = f.audit.bulk_replay("loan_eligibility", "1.0.0", {});
  expect(!empty.gate_passed, "empty sample never passes");
}

void test_verify_chain_report() {
  Fixture f;
  register_loan(f, "1.0.0");
  register_loan(f, "2.0.0", loan_rules_with_threshold(750));
  release(f, "loan_eligibility", "1.0.0", kT1);
  release(f, "loan_eligibility", "2.0.0", kT2);
  run(f, "loan_eligibility", loan_input(720), kT1 + 1);
  run(f, "loan_eligibility", loan_input(720), kT2 + 1);
  jsonlite::Object bad;
  run(f, "loan_eligibility", bad, kT2 + 1);

  auto report = f.audit.verify_chain();
  expect(report.ok(), "chain verifies");
  expect(report.decision_records == 3 && report.error_records == 1, "decision counts");
  expect(report.governance_records + report.decision_records == report.total_records, "totals add up");
  expect(report.coverage.size() == 2, "both versions covered");
  expect(report.tail_hash == f.ledger.tail_hash(), "tail hash");
}

// ============ Phase 8: Config, versioning, observability ============

void test_config_validation() {
  auto r = arbiter::validate_config(R"({"config_version": "1", "execution_timeout_ms": 250,
                                        "feature_fetch_timeout_ms": 100})");
  expect(r.ok && r.errors.empty() && r.warnings.empty(), "valid config");
  r = arbiter::validate_config(R"({"config_version": "1", "mystery": true})");
  expect(r.ok && contains_text(r.warnings, "mystery"), "unknown key warns");
  r = arbiter::validate_config(R"({"config_version": "2"})");
  expect(!r.ok, "unsupported config version");
  r = arbiter::validate_config(R"({"cas_compression": "lz4"})");
  expect(!r.ok, "unknown compression");
  r = arbiter::validate_config(R"({"execution_timeout_ms": "fast"})");
  expect(!r.ok, "wrong type");
  r = arbiter::validate_config(R"({"execution_timeout_ms": 100, "feature_fetch_timeout_ms": 200})");
  expect(r.ok && !r.warnings.empty(), "fetch budget above execution budget warns");
  r = arbiter::validate_config("[1,2]");
  expect(!r.ok, "non-object rejected");
}

void test_config_load_and_env_overrides() {
  auto loaded = arbiter::load_config("");
  expect(loaded.status.ok && loaded.config.execution_timeout_ms == 1000, "defaults");
  loaded = arbiter::load_config(R"({"execution_timeout_ms": 750, "ledger_commit_batch": 16})");
  expect(loaded.status.ok && loaded.config.execution_timeout_ms == 750, "document applied");
  expect(loaded.config.ledger_options().commit_batch == 16, "ledger options derived");

  setenv("ARBITER_EXECUTION_TIMEOUT_MS", "250", 1);
  loaded = arbiter::load_config(R"({"execution_timeout_ms": 750})");
  expect(loaded.config.execution_timeout_ms == 250, "environment overrides document");
  setenv("ARBITER_EXECUTION_TIMEOUT_MS", "soon", 1);
  loaded = arbiter::load_config("");
  expect(loaded.config.execution_timeout_ms == 1000 && contains_text(loaded.warnings, "ignored"),
         "malformed override skipped with warning");
  unsetenv("ARBITER_EXECUTION_TIMEOUT_MS");

  loaded = arbiter::load_config(R"({"config_version": "9"})");
  expect(!loaded.status.ok, "invalid document refused");

  const fs::path dir = fresh_dir("config");
  {
    std::ofstream ofs(dir / "arbiter.json");
    ofs << R"({"config_version": "1", "max_input_bytes": 4096})";
  }
  loaded = arbiter::load_config_file((dir / "arbiter.json").string());
  expect(loaded.status.ok && loaded.config.max_input_bytes == 4096, "file config");
  expect(!arbiter::load_config_file((dir / "missing.json").string()).status.ok, "missing file");
  fs::remove_all(dir);
}

void test_format_version_compatibility() {
  using arbiter::version::Format;
  auto r = arbiter::version::check_record_compatibility(Format::ledger_record,
                                                        arbiter::version::LEDGER_RECORD_VERSION);
  expect(r.ok, "current version ok");
  r = arbiter::version::check_record_compatibility(Format::ledger_record, 0);
  expect(!r.ok && r.error_code == "format_version_missing", "missing version");
  r = arbiter::version::check_record_compatibility(Format::registry, arbiter::version::REGISTRY_FORMAT_VERSION + 1);
  expect(!r.ok && r.error_code == "format_version_unsupported", "newer version refused");
  auto manifest = arbiter::version::manifest_to_json(arbiter::version::current_manifest());
  expect(manifest.find("ledger_record") != std::string::npos, "manifest lists formats");
}

std::atomic<int> g_hook_execute_events{0};
std::atomic<int> g_hook_replay_events{0};

void counting_hook(const arbiter::DecisionEvent& ev) {
  if (ev.kind == "execute") g_hook_execute_events++;
  if (ev.kind == "replay") g_hook_replay_events++;
}

void test_observability_counters_and_hook() {
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  auto& stats = arbiter::global_engine_stats();
  const uint64_t ok_before = stats.successful_executions.load();
  const uint64_t failed_before = stats.failed_executions.load();
  const uint64_t validation_before = stats.failure_categories.count(arbiter::ErrorCode::validation_error);

  arbiter::set_decision_event_hook(&counting_hook);
  auto r = run(f, "loan_eligibility", loan_input(720));
  run(f, "loan_eligibility", jsonlite::Object{});
  f.audit.replay(r.trace_id);
  arbiter::set_decision_event_hook(nullptr);

  expect(g_hook_execute_events.load() == 2 && g_hook_replay_events.load() == 1, "hook saw every event");
  expect(stats.successful_executions.load() == ok_before + 1, "success counted");
  expect(stats.failed_executions.load() == failed_before + 1, "failure counted");
  expect(stats.failure_categories.count(arbiter::ErrorCode::validation_error) == validation_before + 1,
         "failure categorised");
  auto recent = stats.recent_events_snapshot();
  expect(!recent.empty() && recent.back().kind == "replay", "recent events ring");
  expect(stats.to_json().find("\"latency\"") != std::string::npos, "stats JSON");
}

void test_event_log_jsonl() {
  const fs::path dir = fresh_dir("events");
  const std::string path = (dir / "events.jsonl").string();
  arbiter::set_event_log_path(path);
  Fixture f;
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  auto r = run(f, "loan_eligibility", loan_input(720));
  arbiter::set_event_log_path("");

  std::ifstream in(path);
  std::string line;
  int lines = 0;
  bool found = false;
  while (std::getline(in, line)) {
    ++lines;
    std::optional<jsonlite::JsonError> err;
    auto obj = jsonlite::parse(line, &err);
    expect(!err, "event line is JSON");
    if (jsonlite::get_string(obj, "trace_id") == r.trace_id) found = true;
  }
  expect(lines == 1 && found, "one event line for the execution");
  fs::remove_all(dir);
}

// ============ Phase 9: Concurrent execution ============

void test_concurrent_executions_single_chain() {
  auto store = std::make_shared<arbiter::InMemoryLogStore>();
  Fixture f({}, store);
  register_loan(f, "1.0.0");
  release(f, "loan_eligibility", "1.0.0", kT1);
  const uint64_t governance = f.ledger.size();

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> untraced{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&f, &untraced, t] {
      for (int i = 0; i < kPerThread; ++i) {
        arbiter::ExecuteRequest req;
        req.function_id = "loan_eligibility";
        req.input = i % 10 == 0 ? jsonlite::Object{} : loan_input(600 + (i * 7) % 250);
        req.caller_id = "caller-" + std::to_string(t);
        req.as_of_unix_ms = kT1 + 1;
        if (!f.engine.execute(req).traced) untraced++;
      }
    });
  }
  for (auto& t : threads) t.join();

  expect(untraced.load() == 0, "every call traced");
  expect(count_decisions(f.ledger) == kThreads * kPerThread, "one record per call");
  std::set<std::string> prev_hashes;
  for (const auto& r : f.ledger.records()) prev_hashes.insert(r.prev_hash);
  expect(prev_hashes.size() == f.ledger.size(), "no two records share a predecessor");
  expect(f.ledger.verify_integrity().ok, "chain verifies under concurrency");

  expect(f.ledger.flush().ok, "flush");
  arbiter::TraceLedger reopened(store);
  expect(reopened.size() == governance + kThreads * kPerThread, "all records persisted");
  expect(reopened.verify_integrity().ok, "persisted chain verifies");

  auto sample = f.audit.sample_traces("loan_eligibility", 0, arbiter::kOpenEnded, 50);
  auto bulk = f.audit.bulk_replay("loan_eligibility", "1.0.0", sample, 4);
  expect(bulk.determinism_violations == 0 && bulk.matches == 50, "replay sample deterministic");
}

}  // namespace

int main() {
  std::cout << "=== arbiter Test Suite ===\n";

  std::cout << "\n[Phase 1] Hashing and canonical JSON\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("Hash domains separated", test_hash_domains_are_separated);
  run_test("Keyed hash depends on key", test_keyed_hash_depends_on_key);
  run_test("Canonical JSON", test_canonical_json_sorted_and_compact);
  run_test("Doubles round-trip exactly", test_doubles_round_trip_exactly);
  run_test("Duplicate keys rejected", test_duplicate_keys_rejected);
  run_test("Deterministic trace ids", test_uuid_from_key_is_stable);

  std::cout << "\n[Phase 2] Schemas and rule sets\n";
  run_test("Schema collects all violations", test_schema_collects_all_violations);
  run_test("Schema rejects malformed definitions", test_schema_rejects_malformed_definitions);
  run_test("Schema decision fields", test_schema_decision_fields);
  run_test("Rule priority, default and features", test_rules_priority_default_and_features);
  run_test("No match without default throws", test_rules_without_default_throw);
  run_test("Rule syntax errors enumerated", test_rules_syntax_errors_enumerated);
  run_test("Analyzer detects overlap", test_analyzer_detects_overlap);
  run_test("Analyzer disjoint and unanalyzable", test_analyzer_disjoint_and_unanalyzable);
  run_test("Analyzer warnings", test_analyzer_warnings);

  std::cout << "\n[Phase 3] Storage\n";
  run_test("CAS in-memory integrity", test_cas_memory_integrity);
  run_test("CAS file tamper", test_cas_file_store_tamper);
  run_test("KV compare-and-swap", test_kv_compare_and_swap);
  run_test("KV file reload", test_kv_file_store_reload);
  run_test("Log stores", test_log_stores);

  std::cout << "\n[Phase 4] Trace ledger\n";
  run_test("Append links chain", test_ledger_append_links_chain);
  run_test("Duplicate trace id", test_ledger_duplicate_trace_id);
  run_test("Any field mutation detected", test_ledger_detects_any_field_mutation);
  run_test("Range verification", test_ledger_range_verification);
  run_test("File tamper detected on reopen", test_ledger_file_tamper_detected_on_reopen);
  run_test("Unparseable line on reload", test_ledger_unparseable_line_on_reload);
  run_test("Commit failure surfaces on flush", test_ledger_commit_failure_surfaces_on_flush);
  run_test("Appends refused after failed load", test_ledger_refuses_appends_after_failed_load);

  std::cout << "\n[Phase 5] Registry and governance\n";
  run_test("Release flow", test_scenario_a_release_flow);
  run_test("Conflicting rules rejected", test_scenario_b_conflicting_rules_rejected);
  run_test("Draft validation", test_register_draft_validation);
  run_test("Legal reference checks", test_legal_reference_checks);
  run_test("Review notes recorded", test_review_notes_recorded);
  run_test("Separation of duties", test_separation_of_duties);
  run_test("Signature failures", test_signature_failures);
  run_test("Invalid transitions", test_invalid_transitions);
  run_test("Supersede and retire", test_supersede_and_retire);
  run_test("Concurrent modification", test_concurrent_modification);
  run_test("Concurrent activation", test_concurrent_activation_single_winner);
  run_test("Reload from file store", test_registry_reload_from_file_store);

  std::cout << "\n[Phase 6] Decision engine\n";
  run_test("Execute OK traced", test_execute_ok_traced);
  run_test("Errors are traced", test_execute_errors_are_traced);
  run_test("Full numeric precision", test_execute_keeps_full_precision);
  run_test("Pinned version", test_execute_pinned_version);
  run_test("Idempotent execution", test_execute_idempotent);
  run_test("Timeout", test_execute_timeout);
  run_test("Cancellation not traced", test_execute_cancellation_not_traced);
  run_test("Logic failures", test_execute_logic_failures);
  run_test("Point-in-time features", test_features_point_in_time);
  run_test("Feature fetch retries", test_feature_fetch_retries);
  run_test("Future feature values refused", test_feature_store_future_leak_refused);
  run_test("Evaluate is side-effect free", test_evaluate_is_side_effect_free);

  std::cout << "\n[Phase 7] Audit and replay\n";
  run_test("Replay determinism", test_replay_determinism);
  run_test("Oversized call replays neutral", test_replay_oversized_unpinned_call_is_neutral);
  run_test("Replay uses recorded features", test_replay_uses_recorded_features);
  run_test("Replay detects nondeterminism", test_replay_detects_nondeterminism);
  run_test("Shadow replay classification", test_shadow_replay_classification);
  run_test("Drift classification", test_classify_drift_direct);
  run_test("Bulk replay gate", test_bulk_replay_gate);
  run_test("Chain report", test_verify_chain_report);

  std::cout << "\n[Phase 8] Config, versioning, observability\n";
  run_test("Config validation", test_config_validation);
  run_test("Config load and env overrides", test_config_load_and_env_overrides);
  run_test("Format version compatibility", test_format_version_compatibility);
  run_test("Counters and hook", test_observability_counters_and_hook);
  run_test("Event log JSONL", test_event_log_jsonl);

  std::cout << "\n[Phase 9] Concurrent execution\n";
  run_test("Concurrent executions share one chain", test_concurrent_executions_single_chain);

  std::cout << "\n=== Results: " << g_tests_passed << "/" << g_tests_run << " passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
