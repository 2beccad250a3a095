#pragma once

// arbiter/registry.hpp — Versioned decision-function registry.
//
// Lifecycle of a release:
//
//   DRAFT --request_release--> PENDING_REVIEW --sign x2--> APPROVED
//     --activate--> ACTIVE --(superseded)--> DEPRECATED --retire--> RETIRED
//                   ACTIVE ----------------------------retire--> RETIRED
//
// Status records the governance decision, not the window. activate() with a
// future effective_from marks the new version ACTIVE and the one it
// supersedes DEPRECATED at once, while resolve_active() keeps returning the
// old version until effective_from. Use resolve_active() or the index
// snapshot to learn what is effective at a given time.
//
// DESIGN INVARIANTS (must not be broken):
//   1. FROZEN LOGIC: logic and logic_hash are fixed at register_draft(). No
//      operation replaces them; artifacts are shared as immutable snapshots
//      and every transition produces a new copy.
//   2. SEPARATION OF DUTIES: APPROVED requires one verified OWNER and one
//      verified REVIEWER signature from distinct signer ids.
//   3. OPTIMISTIC CONCURRENCY: every transition is a compare-and-swap on the
//      KV store revision. A lost race fails concurrent_modification; nothing
//      is merged.
//   4. GOVERNANCE TRAIL: every successful transition appends a governance
//      event to the trace ledger. Rejected attempts are returned, not logged.
//   5. RETIRED IS TERMINAL. Nothing is ever deleted.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "arbiter/evaluatable.hpp"
#include "arbiter/interfaces.hpp"
#include "arbiter/jsonlite.hpp"
#include "arbiter/kv_store.hpp"
#include "arbiter/ledger.hpp"
#include "arbiter/schema.hpp"
#include "arbiter/types.hpp"
#include "arbiter/version_index.hpp"

namespace arbiter {

struct ArtifactMetadata {
  std::string author;
  std::string description;
  std::vector<std::string> tags;
  std::vector<std::string> legal_references;  // IRIs
  std::vector<std::string> features;          // feature names fetched at execute()
  std::string entity_field;                   // input field holding the feature-store entity id

  jsonlite::Object to_object() const;
  static ArtifactMetadata from_object(const jsonlite::Object& o);
};

struct LegalCitation {
  std::string iri;
  std::string title;
  std::string section;
};

struct DecisionFunctionArtifact {
  std::string function_id;
  std::string version;
  std::shared_ptr<const Evaluatable> logic;
  std::string logic_source;  // canonical_source() of logic
  Schema input_schema;
  Schema output_schema;
  std::string logic_hash;
  ArtifactMetadata metadata;
  std::vector<LegalCitation> citations;
  FunctionStatus status{FunctionStatus::draft};
  std::vector<Signature> signatures;
  std::vector<Signature> rejected_signatures;  // refused for separation of duties
  std::vector<std::string> review_notes;
  std::string created_by;
  TimestampMs created_at_unix_ms{0};
  std::optional<VersionWindow> window;  // set once activated
  uint64_t revision{0};                 // KV revision this snapshot was read at

  const Signature* signature_for(SignerRole role) const;
};

using ArtifactPtr = std::shared_ptr<const DecisionFunctionArtifact>;

struct DraftRequest {
  std::string function_id;
  std::string version;
  // Exactly one of logic / ruleset_json.
  std::shared_ptr<const Evaluatable> logic;
  std::string ruleset_json;
  std::string input_schema_json{"{}"};
  std::string output_schema_json{"{}"};
  ArtifactMetadata metadata;
};

struct RegistryResult {
  Status status;
  ArtifactPtr artifact;  // state after the operation (null on most failures)
};

struct ResolveResult {
  Status status;
  ArtifactPtr artifact;
};

class DecisionRegistry {
 public:
  DecisionRegistry(std::shared_ptr<IVersionedKvStore> kv, TraceLedger& ledger, const ISigner& signer,
                   const ILegalReferenceValidator& legal,
                   std::shared_ptr<NativeLogicCatalog> catalog = nullptr);

  RegistryResult register_draft(const DraftRequest& request, const std::string& actor);
  RegistryResult request_release(const std::string& function_id, const std::string& version,
                                 const std::string& actor);
  RegistryResult sign(const std::string& function_id, const std::string& version,
                      const std::string& signer_id, SignerRole role, const std::string& signature_bytes,
                      const std::string& key_id);
  RegistryResult activate(const std::string& function_id, const std::string& version,
                          TimestampMs effective_from, const std::string& actor);
  RegistryResult retire(const std::string& function_id, const std::string& version,
                        TimestampMs sunset_at, const std::string& actor);

  // Pure lookup over the current index snapshot.
  ResolveResult resolve_active(const std::string& function_id, TimestampMs as_of) const;

  ArtifactPtr get(const std::string& function_id, const std::string& version) const;
  std::vector<ArtifactPtr> list_versions(const std::string& function_id) const;
  std::shared_ptr<const EffectiveVersionIndex> index_snapshot() const { return index_.snapshot(); }

  // Rehydrates artifacts and the version index from the KV store. Native
  // logic is resolved through the catalog. Unloadable documents are reported
  // in details and skipped.
  Status load();

  // The exact bytes a signer signs for a release and role.
  static std::string release_payload(const DecisionFunctionArtifact& artifact, SignerRole role);

  static std::string artifact_key(const std::string& function_id, const std::string& version);
  static std::string artifact_to_json(const DecisionFunctionArtifact& artifact);

 private:
  ArtifactPtr cached(const std::string& function_id, const std::string& version) const;
  Status commit(const ArtifactPtr& before, std::shared_ptr<DecisionFunctionArtifact> after,
                ArtifactPtr* stored);
  Status record_event(const DecisionFunctionArtifact& artifact, const std::string& event,
                      const std::string& actor, jsonlite::Object extra = {});
  std::optional<DecisionFunctionArtifact> artifact_from_json(const std::string& text,
                                                             std::string* error) const;

  std::shared_ptr<IVersionedKvStore> kv_;
  TraceLedger& ledger_;
  const ISigner& signer_;
  const ILegalReferenceValidator& legal_;
  std::shared_ptr<NativeLogicCatalog> catalog_;

  mutable std::shared_mutex cache_mu_;
  std::map<std::string, ArtifactPtr> cache_;  // key: artifact_key()

  std::mutex index_write_mu_;  // serializes activate/retire snapshot builds
  VersionIndexHolder index_;
};

}  // namespace arbiter
