#include "arbiter/registry.hpp"

#include <algorithm>

#include "arbiter/hash.hpp"
#include "arbiter/rules.hpp"
#include "arbiter/version.hpp"

namespace arbiter {

namespace {

bool valid_identifier(const std::string& s) {
  if (s.empty() || s.size() > 128) return false;
  return std::all_of(s.begin(), s.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-' || c == '.';
  });
}

jsonlite::Array string_array(const std::vector<std::string>& v) {
  jsonlite::Array a;
  for (const auto& s : v) a.emplace_back(s);
  return a;
}

jsonlite::Object signature_to_object(const Signature& s) {
  jsonlite::Object o;
  o["signer_id"] = s.signer_id;
  o["role"] = to_string(s.role);
  o["signature"] = s.signature_bytes;
  o["key_id"] = s.key_id;
  o["timestamp_unix_ms"] = s.timestamp_unix_ms;
  return o;
}

std::optional<Signature> signature_from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;
  auto role = signer_role_from_string(jsonlite::get_string(*o, "role"));
  if (!role) return std::nullopt;
  Signature s;
  s.signer_id = jsonlite::get_string(*o, "signer_id");
  s.role = *role;
  s.signature_bytes = jsonlite::get_string(*o, "signature");
  s.key_id = jsonlite::get_string(*o, "key_id");
  s.timestamp_unix_ms = jsonlite::get_u64(*o, "timestamp_unix_ms");
  return s;
}

jsonlite::Array signatures_array(const std::vector<Signature>& sigs) {
  jsonlite::Array a;
  for (const auto& s : sigs) a.emplace_back(signature_to_object(s));
  return a;
}

std::vector<Signature> signatures_from(const jsonlite::Object& doc, const std::string& key) {
  std::vector<Signature> out;
  if (const auto* arr = jsonlite::get_array(doc, key)) {
    for (const auto& v : *arr) {
      if (auto s = signature_from_value(v)) out.push_back(std::move(*s));
    }
  }
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// ArtifactMetadata
// ---------------------------------------------------------------------------

jsonlite::Object ArtifactMetadata::to_object() const {
  jsonlite::Object o;
  o["author"] = author;
  o["description"] = description;
  o["tags"] = string_array(tags);
  o["legal_references"] = string_array(legal_references);
  o["features"] = string_array(features);
  o["entity_field"] = entity_field;
  return o;
}

ArtifactMetadata ArtifactMetadata::from_object(const jsonlite::Object& o) {
  ArtifactMetadata m;
  m.author = jsonlite::get_string(o, "author");
  m.description = jsonlite::get_string(o, "description");
  m.tags = jsonlite::get_string_array(o, "tags");
  m.legal_references = jsonlite::get_string_array(o, "legal_references");
  m.features = jsonlite::get_string_array(o, "features");
  m.entity_field = jsonlite::get_string(o, "entity_field");
  return m;
}

const Signature* DecisionFunctionArtifact::signature_for(SignerRole role) const {
  for (const auto& s : signatures) {
    if (s.role == role) return &s;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string DecisionRegistry::artifact_key(const std::string& function_id, const std::string& version) {
  return "fn/" + function_id + "/" + version;
}

std::string DecisionRegistry::release_payload(const DecisionFunctionArtifact& a, SignerRole role) {
  jsonlite::Object o;
  o["domain"] = "arbiter.release.v1";
  o["function_id"] = a.function_id;
  o["version"] = a.version;
  o["logic_hash"] = a.logic_hash;
  o["schema_hash"] = release_payload_hash(a.input_schema.to_json() + "\n" + a.output_schema.to_json());
  o["role"] = to_string(role);
  return jsonlite::to_json(o);
}

std::string DecisionRegistry::artifact_to_json(const DecisionFunctionArtifact& a) {
  jsonlite::Object o;
  o["format_version"] = version::REGISTRY_FORMAT_VERSION;
  o["function_id"] = a.function_id;
  o["version"] = a.version;
  o["logic_kind"] = a.logic ? a.logic->kind() : std::string();
  o["logic_source"] = a.logic_source;
  o["logic_hash"] = a.logic_hash;
  o["input_schema"] = a.input_schema.to_json();
  o["output_schema"] = a.output_schema.to_json();
  o["metadata"] = a.metadata.to_object();
  jsonlite::Array cites;
  for (const auto& c : a.citations) {
    jsonlite::Object co;
    co["iri"] = c.iri;
    co["title"] = c.title;
    co["section"] = c.section;
    cites.emplace_back(std::move(co));
  }
  o["citations"] = std::move(cites);
  o["status"] = to_string(a.status);
  o["signatures"] = signatures_array(a.signatures);
  o["rejected_signatures"] = signatures_array(a.rejected_signatures);
  o["review_notes"] = string_array(a.review_notes);
  o["created_by"] = a.created_by;
  o["created_at_unix_ms"] = a.created_at_unix_ms;
  if (a.window) {
    jsonlite::Object w;
    w["effective_from"] = a.window->effective_from;
    w["effective_until"] = a.window->effective_until == kOpenEnded ? jsonlite::Value(nullptr)
                                                                  : jsonlite::Value(a.window->effective_until);
    o["window"] = std::move(w);
  } else {
    o["window"] = nullptr;
  }
  return jsonlite::to_json(o);
}

std::optional<DecisionFunctionArtifact> DecisionRegistry::artifact_from_json(const std::string& text,
                                                                            std::string* error) const {
  auto fail = [error](std::string msg) -> std::optional<DecisionFunctionArtifact> {
    *error = std::move(msg);
    return std::nullopt;
  };
  std::optional<jsonlite::JsonError> err;
  const auto doc = jsonlite::parse(text, &err);
  if (err) return fail(err->message);

  auto compat = version::check_record_compatibility(version::Format::registry,
                                                    static_cast<uint32_t>(jsonlite::get_u64(doc, "format_version")));
  if (!compat.ok) return fail(compat.description);

  DecisionFunctionArtifact a;
  a.function_id = jsonlite::get_string(doc, "function_id");
  a.version = jsonlite::get_string(doc, "version");
  a.logic_source = jsonlite::get_string(doc, "logic_source");
  a.logic_hash = jsonlite::get_string(doc, "logic_hash");

  const auto source = jsonlite::parse(a.logic_source, &err);
  if (err) return fail("logic_source: " + err->message);
  const std::string kind = jsonlite::get_string(doc, "logic_kind");
  if (kind == "ruleset") {
    const auto* rs = jsonlite::get_object(source, "ruleset");
    if (!rs) return fail("logic_source has no ruleset");
    Status st;
    auto rules = parse_ruleset(*rs, &st);
    if (!rules) return fail("ruleset: " + st.message);
    a.logic = std::make_shared<const RuleSetEvaluatable>(std::move(*rules));
  } else if (kind == "native") {
    const std::string symbol = jsonlite::get_string(source, "symbol");
    const std::string revision = jsonlite::get_string(source, "revision");
    auto native = catalog_ ? catalog_->find(symbol, revision) : nullptr;
    if (!native) return fail("native logic " + symbol + "@" + revision + " is not in the catalog");
    a.logic = std::move(native);
  } else {
    return fail("unknown logic_kind '" + kind + "'");
  }
  if (compute_logic_hash(*a.logic) != a.logic_hash) {
    return fail("logic_hash does not match stored logic");
  }

  Status st;
  auto in = parse_schema(jsonlite::get_string(doc, "input_schema", "{}"), &st);
  auto out = parse_schema(jsonlite::get_string(doc, "output_schema", "{}"), &st);
  if (!in || !out) return fail("schema: " + st.message);
  a.input_schema = std::move(*in);
  a.output_schema = std::move(*out);

  if (const auto* m = jsonlite::get_object(doc, "metadata")) a.metadata = ArtifactMetadata::from_object(*m);
  if (const auto* cites = jsonlite::get_array(doc, "citations")) {
    for (const auto& v : *cites) {
      if (const auto* co = std::get_if<jsonlite::Object>(&v.v)) {
        a.citations.push_back({jsonlite::get_string(*co, "iri"), jsonlite::get_string(*co, "title"),
                               jsonlite::get_string(*co, "section")});
      }
    }
  }
  auto status = function_status_from_string(jsonlite::get_string(doc, "status"));
  if (!status) return fail("unknown status");
  a.status = *status;
  a.signatures = signatures_from(doc, "signatures");
  a.rejected_signatures = signatures_from(doc, "rejected_signatures");
  a.review_notes = jsonlite::get_string_array(doc, "review_notes");
  a.created_by = jsonlite::get_string(doc, "created_by");
  a.created_at_unix_ms = jsonlite::get_u64(doc, "created_at_unix_ms");
  if (const auto* w = jsonlite::get_object(doc, "window")) {
    VersionWindow vw;
    vw.version = a.version;
    vw.effective_from = jsonlite::get_u64(*w, "effective_from");
    vw.effective_until = jsonlite::get_u64(*w, "effective_until", kOpenEnded);
    a.window = vw;
  }
  return a;
}

// ---------------------------------------------------------------------------
// DecisionRegistry
// ---------------------------------------------------------------------------

DecisionRegistry::DecisionRegistry(std::shared_ptr<IVersionedKvStore> kv, TraceLedger& ledger,
                                   const ISigner& signer, const ILegalReferenceValidator& legal,
                                   std::shared_ptr<NativeLogicCatalog> catalog)
    : kv_(std::move(kv)),
      ledger_(ledger),
      signer_(signer),
      legal_(legal),
      catalog_(catalog ? std::move(catalog) : std::make_shared<NativeLogicCatalog>()) {}

ArtifactPtr DecisionRegistry::cached(const std::string& function_id, const std::string& version) const {
  std::shared_lock<std::shared_mutex> lk(cache_mu_);
  auto it = cache_.find(artifact_key(function_id, version));
  return it == cache_.end() ? nullptr : it->second;
}

ArtifactPtr DecisionRegistry::get(const std::string& function_id, const std::string& version) const {
  return cached(function_id, version);
}

std::vector<ArtifactPtr> DecisionRegistry::list_versions(const std::string& function_id) const {
  const std::string prefix = "fn/" + function_id + "/";
  std::vector<ArtifactPtr> out;
  std::shared_lock<std::shared_mutex> lk(cache_mu_);
  for (auto it = cache_.lower_bound(prefix); it != cache_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(),
            [](const ArtifactPtr& a, const ArtifactPtr& b) { return a->created_at_unix_ms < b->created_at_unix_ms; });
  return out;
}

Status DecisionRegistry::commit(const ArtifactPtr& before, std::shared_ptr<DecisionFunctionArtifact> after,
                                ArtifactPtr* stored) {
  const std::string key = artifact_key(after->function_id, after->version);
  const uint64_t expected = before ? before->revision : 0;
  auto put = kv_->put_if(key, artifact_to_json(*after), expected);
  if (!put.status.ok) {
    if (put.status.code == ErrorCode::concurrent_modification && !before) {
      return Status::failure(ErrorCode::duplicate_version,
                             after->function_id + " " + after->version + " is already registered");
    }
    return put.status;
  }
  after->revision = put.revision;
  ArtifactPtr frozen = std::move(after);
  {
    std::unique_lock<std::shared_mutex> lk(cache_mu_);
    cache_[key] = frozen;
  }
  if (stored) *stored = std::move(frozen);
  return Status::success();
}

Status DecisionRegistry::record_event(const DecisionFunctionArtifact& a, const std::string& event,
                                      const std::string& actor, jsonlite::Object extra) {
  extra["event"] = event;
  extra["status"] = to_string(a.status);
  TraceRecord r;
  r.trace_id = make_uuid_v4();
  r.event_type = "governance";
  r.function_id = a.function_id;
  r.version = a.version;
  r.function_hash = a.logic_hash;
  r.caller_id = actor;
  r.timestamp_unix_ms = now_unix_ms();
  r.as_of_unix_ms = r.timestamp_unix_ms;
  r.detail = jsonlite::to_json(extra);
  return ledger_.append(std::move(r)).status;
}

RegistryResult DecisionRegistry::register_draft(const DraftRequest& req, const std::string& actor) {
  RegistryResult out;
  auto fail = [&out](ErrorCode code, std::string msg, std::vector<std::string> details = {}) {
    out.status = Status::failure(code, std::move(msg), std::move(details));
    return out;
  };

  if (!valid_identifier(req.function_id) || !valid_identifier(req.version)) {
    return fail(ErrorCode::validation_error,
                "function_id and version must be non-empty and use only [A-Za-z0-9_.-]");
  }
  if (cached(req.function_id, req.version) || kv_->get(artifact_key(req.function_id, req.version))) {
    return fail(ErrorCode::duplicate_version, req.function_id + " " + req.version + " is already registered");
  }

  // --- Structure: logic and schemas, all errors enumerated ---
  std::vector<std::string> errors;
  auto artifact = std::make_shared<DecisionFunctionArtifact>();
  std::optional<RuleSet> rules;
  if (static_cast<bool>(req.logic) == !req.ruleset_json.empty()) {
    errors.push_back("exactly one of native logic or ruleset_json is required");
  } else if (req.logic) {
    artifact->logic = req.logic;
  } else {
    Status st;
    rules = parse_ruleset(req.ruleset_json, &st);
    if (!rules) {
      errors.push_back(st.message);
      errors.insert(errors.end(), st.details.begin(), st.details.end());
    }
  }
  Status in_st, out_st;
  auto in_schema = parse_schema(req.input_schema_json, &in_st);
  auto out_schema = parse_schema(req.output_schema_json, &out_st);
  if (!in_schema) {
    errors.push_back("input_schema: " + in_st.message);
    for (const auto& d : in_st.details) errors.push_back("input_schema: " + d);
  }
  if (!out_schema) {
    errors.push_back("output_schema: " + out_st.message);
    for (const auto& d : out_st.details) errors.push_back("output_schema: " + d);
  }
  if (!req.metadata.features.empty() && req.metadata.entity_field.empty()) {
    errors.push_back("metadata.entity_field is required when features are declared");
  }
  if (!errors.empty()) return fail(ErrorCode::validation_error, "malformed draft", std::move(errors));

  // --- Legal references: one validator call per IRI, never retried ---
  std::vector<std::string> rejected;
  for (const auto& iri : req.metadata.legal_references) {
    const LegalReferenceCheck check = legal_.validate(iri);
    if (!check.available) {
      return fail(ErrorCode::external_dependency, "legal reference validator unavailable: " + check.message);
    }
    if (!check.valid) {
      rejected.push_back(iri + (check.message.empty() ? "" : ": " + check.message));
      continue;
    }
    artifact->citations.push_back({iri, check.title, check.section});
  }
  if (!rejected.empty()) return fail(ErrorCode::legal_reference, "invalid legal reference", std::move(rejected));

  // --- Static rule analysis ---
  if (rules) {
    const RuleAnalysis analysis = RuleAnalyzer::Check(*rules, &*in_schema, req.metadata.features);
    if (!analysis.conflicts.empty()) {
      std::vector<std::string> details;
      for (const auto& c : analysis.conflicts) details.push_back(c.description);
      return fail(ErrorCode::rule_conflict, "rule set has conflicting equal-priority rules", std::move(details));
    }
    artifact->review_notes = analysis.unanalyzable;
    artifact->review_notes.insert(artifact->review_notes.end(), analysis.warnings.begin(),
                                  analysis.warnings.end());
    artifact->logic = std::make_shared<const RuleSetEvaluatable>(std::move(*rules));
  }
  if (auto native = std::dynamic_pointer_cast<const NativeEvaluatable>(artifact->logic)) {
    catalog_->add(native);
  }

  artifact->function_id = req.function_id;
  artifact->version = req.version;
  artifact->logic_source = artifact->logic->canonical_source();
  artifact->logic_hash = compute_logic_hash(*artifact->logic);
  artifact->input_schema = std::move(*in_schema);
  artifact->output_schema = std::move(*out_schema);
  artifact->metadata = req.metadata;
  artifact->status = FunctionStatus::draft;
  artifact->created_by = actor;
  artifact->created_at_unix_ms = now_unix_ms();

  ArtifactPtr stored;
  if (Status st = commit(nullptr, std::move(artifact), &stored); !st.ok) {
    out.status = std::move(st);
    return out;
  }
  jsonlite::Object extra;
  extra["logic_kind"] = stored->logic->kind();
  extra["review_notes"] = static_cast<uint64_t>(stored->review_notes.size());
  out.status = record_event(*stored, "registered", actor, std::move(extra));
  out.artifact = std::move(stored);
  return out;
}

RegistryResult DecisionRegistry::request_release(const std::string& function_id, const std::string& version,
                                                 const std::string& actor) {
  RegistryResult out;
  ArtifactPtr before = cached(function_id, version);
  if (!before) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + version + " not found");
    return out;
  }
  if (before->status != FunctionStatus::draft) {
    out.status = Status::failure(ErrorCode::invalid_state_transition,
                                 "request_release requires DRAFT, found " + to_string(before->status));
    out.artifact = before;
    return out;
  }
  auto after = std::make_shared<DecisionFunctionArtifact>(*before);
  after->status = FunctionStatus::pending_review;
  if (Status st = commit(before, std::move(after), &out.artifact); !st.ok) {
    out.status = std::move(st);
    return out;
  }
  out.status = record_event(*out.artifact, "release_requested", actor);
  return out;
}

RegistryResult DecisionRegistry::sign(const std::string& function_id, const std::string& version,
                                      const std::string& signer_id, SignerRole role,
                                      const std::string& signature_bytes, const std::string& key_id) {
  RegistryResult out;
  ArtifactPtr before = cached(function_id, version);
  if (!before) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + version + " not found");
    return out;
  }
  out.artifact = before;
  if (before->status != FunctionStatus::pending_review) {
    out.status = Status::failure(ErrorCode::invalid_state_transition,
                                 "sign requires PENDING_REVIEW, found " + to_string(before->status));
    return out;
  }
  if (signer_id.empty()) {
    out.status = Status::failure(ErrorCode::validation_error, "signer_id must not be empty");
    return out;
  }
  if (before->signature_for(role)) {
    out.status = Status::failure(ErrorCode::invalid_state_transition, to_string(role) + " has already signed");
    return out;
  }

  Signature sig{signer_id, role, signature_bytes, key_id, now_unix_ms()};
  const SignerRole other = role == SignerRole::owner ? SignerRole::reviewer : SignerRole::owner;
  if (const Signature* o = before->signature_for(other); o && o->signer_id == signer_id) {
    auto after = std::make_shared<DecisionFunctionArtifact>(*before);
    after->rejected_signatures.push_back(sig);
    Status st = commit(before, std::move(after), &out.artifact);
    out.status = st.ok ? Status::failure(ErrorCode::separation_of_duties,
                                         signer_id + " already signed as " + to_string(other) +
                                             " and cannot also sign as " + to_string(role))
                       : std::move(st);
    return out;
  }

  const VerifyResult vr = signer_.verify(release_payload(*before, role), signature_bytes, key_id);
  if (!vr.available) {
    out.status = Status::failure(ErrorCode::external_dependency, "signer unavailable: " + vr.error);
    return out;
  }
  if (!vr.valid) {
    out.status = Status::failure(ErrorCode::signature_invalid, "signature rejected: " + vr.error);
    return out;
  }

  auto after = std::make_shared<DecisionFunctionArtifact>(*before);
  after->signatures.push_back(sig);
  const bool approved = after->signature_for(SignerRole::owner) && after->signature_for(SignerRole::reviewer);
  if (approved) after->status = FunctionStatus::approved;
  if (Status st = commit(before, std::move(after), &out.artifact); !st.ok) {
    out.status = std::move(st);
    return out;
  }

  jsonlite::Object extra;
  extra["role"] = to_string(role);
  extra["key_id"] = key_id;
  out.status = record_event(*out.artifact, "signed", signer_id, std::move(extra));
  if (out.status.ok && approved) out.status = record_event(*out.artifact, "approved", signer_id);
  return out;
}

RegistryResult DecisionRegistry::activate(const std::string& function_id, const std::string& version,
                                          TimestampMs effective_from, const std::string& actor) {
  RegistryResult out;
  std::lock_guard<std::mutex> index_lock(index_write_mu_);
  ArtifactPtr before = cached(function_id, version);
  if (!before) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + version + " not found");
    return out;
  }
  out.artifact = before;
  if (before->status != FunctionStatus::approved) {
    if (!before->rejected_signatures.empty()) {
      out.status = Status::failure(ErrorCode::separation_of_duties,
                                   "release is not approved: a signer attempted to sign both roles");
    } else {
      out.status = Status::failure(ErrorCode::invalid_state_transition,
                                   "activate requires APPROVED, found " + to_string(before->status));
    }
    return out;
  }
  const Signature* owner = before->signature_for(SignerRole::owner);
  const Signature* reviewer = before->signature_for(SignerRole::reviewer);
  if (!owner || !reviewer || owner->signer_id == reviewer->signer_id) {
    out.status = Status::failure(ErrorCode::separation_of_duties,
                                 "owner and reviewer must be distinct verified signers");
    return out;
  }

  auto snapshot = index_.snapshot();
  std::string closed_version;
  Status st;
  auto next = snapshot->with_activation(function_id, version, effective_from, &closed_version, &st);
  if (!next) {
    out.status = std::move(st);
    return out;
  }

  auto after = std::make_shared<DecisionFunctionArtifact>(*before);
  after->status = FunctionStatus::active;
  after->window = VersionWindow{version, effective_from, kOpenEnded};
  if (Status cst = commit(before, std::move(after), &out.artifact); !cst.ok) {
    out.status = std::move(cst);
    return out;
  }

  // The new window is committed; publish even if superseding the old
  // version's record fails below, so resolution never disagrees with storage
  // about the new release.
  index_.publish(std::make_shared<const EffectiveVersionIndex>(std::move(*next)));

  jsonlite::Object extra;
  extra["effective_from"] = format_iso8601_utc(effective_from);
  if (!closed_version.empty()) extra["supersedes"] = closed_version;
  out.status = record_event(*out.artifact, "activated", actor, std::move(extra));

  if (!closed_version.empty()) {
    if (ArtifactPtr old = cached(function_id, closed_version)) {
      auto dep = std::make_shared<DecisionFunctionArtifact>(*old);
      if (dep->status == FunctionStatus::active) dep->status = FunctionStatus::deprecated;
      if (dep->window) dep->window->effective_until = effective_from;
      ArtifactPtr stored;
      Status dst = commit(old, std::move(dep), &stored);
      if (!dst.ok) {
        out.status = std::move(dst);
        return out;
      }
      jsonlite::Object dextra;
      dextra["effective_until"] = format_iso8601_utc(effective_from);
      dextra["superseded_by"] = version;
      Status est = record_event(*stored, "deprecated", actor, std::move(dextra));
      if (out.status.ok) out.status = std::move(est);
    }
  }
  return out;
}

RegistryResult DecisionRegistry::retire(const std::string& function_id, const std::string& version,
                                        TimestampMs sunset_at, const std::string& actor) {
  RegistryResult out;
  std::lock_guard<std::mutex> index_lock(index_write_mu_);
  ArtifactPtr before = cached(function_id, version);
  if (!before) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + version + " not found");
    return out;
  }
  out.artifact = before;
  if (before->status != FunctionStatus::active && before->status != FunctionStatus::deprecated) {
    out.status = Status::failure(ErrorCode::invalid_state_transition,
                                 "retire requires ACTIVE or DEPRECATED, found " + to_string(before->status));
    return out;
  }

  auto next = std::make_shared<const EffectiveVersionIndex>(
      index_.snapshot()->with_retirement(function_id, version, sunset_at));
  auto after = std::make_shared<DecisionFunctionArtifact>(*before);
  after->status = FunctionStatus::retired;
  after->window = next->window_of(function_id, version);
  if (Status st = commit(before, std::move(after), &out.artifact); !st.ok) {
    out.status = std::move(st);
    return out;
  }
  index_.publish(std::move(next));

  jsonlite::Object extra;
  extra["sunset_at"] = format_iso8601_utc(sunset_at);
  out.status = record_event(*out.artifact, "retired", actor, std::move(extra));
  return out;
}

ResolveResult DecisionRegistry::resolve_active(const std::string& function_id, TimestampMs as_of) const {
  ResolveResult out;
  auto version = index_.snapshot()->resolve(function_id, as_of);
  if (!version) {
    out.status = Status::failure(ErrorCode::version_not_found,
                                 "no version of " + function_id + " is effective at " + format_iso8601_utc(as_of));
    return out;
  }
  out.artifact = cached(function_id, *version);
  if (!out.artifact) {
    out.status = Status::failure(ErrorCode::version_not_found, function_id + " " + *version + " not loaded");
  }
  return out;
}

Status DecisionRegistry::load() {
  std::lock_guard<std::mutex> index_lock(index_write_mu_);
  std::vector<std::string> errors;
  std::map<std::string, ArtifactPtr> loaded;
  EffectiveVersionIndex index;

  for (const auto& key : kv_->keys("fn/")) {
    auto value = kv_->get(key);
    if (!value) continue;
    std::string why;
    auto a = artifact_from_json(value->value, &why);
    if (!a) {
      errors.push_back(key + ": " + why);
      continue;
    }
    if (artifact_key(a->function_id, a->version) != key) {
      errors.push_back(key + ": document names a different function or version");
      continue;
    }
    a->revision = value->revision;
    if (a->window) index = index.with_window(a->function_id, *a->window);
    loaded[key] = std::make_shared<const DecisionFunctionArtifact>(std::move(*a));
  }

  {
    std::unique_lock<std::shared_mutex> lk(cache_mu_);
    cache_ = std::move(loaded);
  }
  index_.publish(std::make_shared<const EffectiveVersionIndex>(std::move(index)));

  if (!errors.empty()) {
    return Status::failure(ErrorCode::storage_error, "some registry documents could not be loaded",
                           std::move(errors));
  }
  return Status::success();
}

}  // namespace arbiter
