#pragma once

// warden/resolver.hpp — Logical name → authorized connection descriptor.
//
// DESIGN:
//   resolve() is the single entry point callers use to reach a backend:
//
//     cache (single flight) ──miss──▶ storage.get_connection()
//          │
//          ▼
//     evaluation context (owner id from the name, ambient time, custom attrs)
//          │
//          ├── BooleanPolicy ─▶ evaluate_conditions()
//          └── VectorPolicy  ─▶ evaluate_vector_policy()
//          │
//          ▼
//     audit (exactly one terminal event per call) ─▶ ResolveResult
//
//   The caller never sees the physical address of a resource it was denied.
//
// INVARIANTS:
//   - Fail-closed: every error path denies. Storage failures surface as
//     storage_unavailable, never as not_found or policy_denied.
//   - Exactly one audit event per resolve() call.
//   - An audit write failure is counted and reported but never turns a grant
//     into a denial or the reverse.
//   - No retries. The deadline is checked before the storage fetch, after it,
//     and bounds the audit append.
//   - Never throws.
//
// Thread-safety: all public methods may be called concurrently. There is no
// lock held across different logical names.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "warden/audit.hpp"
#include "warden/cache.hpp"
#include "warden/observability.hpp"
#include "warden/policy.hpp"
#include "warden/registry.hpp"
#include "warden/storage.hpp"
#include "warden/token.hpp"
#include "warden/types.hpp"

namespace warden {

struct ResolverOptions {
  uint64_t cache_ttl_ms{DefinitionCache::kDefaultTtlMs};
  std::size_t cache_shards{DefinitionCache::kDefaultShards};
  Clock clock{wall_clock()};
  // Null => a fresh random key. Tokens then only verify within this resolver.
  std::shared_ptr<const SigningKey> signing_key;
};

struct ResolveOptions {
  std::string trace_id;            // generated when empty
  Deadline deadline{no_deadline()};
};

struct ResolveResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string reason;
  std::string trace_id;
  std::optional<ConnectionDescriptor> descriptor;   // set only when ok
  std::string granted_by;          // satisfying claim JSON or similarity line
  std::string granted_action;      // action a signed pointer redeems for
  std::string policy_kind;
  bool cache_hit{false};

  // Omits credential_ref.
  std::string to_json() const;
};

struct RedeemResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string reason;
  std::optional<Capability> capability;
};

class Resolver {
 public:
  Resolver(IStorageAdapter& storage,
           AuditLogger& audit,
           const Registry& registry,
           EventLog& ops,
           ResolverOptions options = {});

  Resolver(const Resolver&) = delete;
  Resolver& operator=(const Resolver&) = delete;

  ResolveResult resolve(const std::string& logical_name,
                        const SecurityContext& context,
                        const ResolveOptions& options = {});

  // Evict, write through, evict again. A lookup that started before the write
  // cannot repopulate the cache with the old definition afterwards.
  StorageStatus register_connection(const ResourceDefinition& definition,
                                    Deadline deadline = no_deadline());

  // No I/O. The token redeems only for `action`.
  CapabilityToken sign(const ConnectionDescriptor& descriptor,
                       const std::string& action,
                       uint64_t lifetime_seconds = CapabilityToken::kDefaultLifetimeSeconds);

  // Binds a transport-form token to this resolver's key and clock.
  TokenDecodeResult decode_token(const std::string& wire) const;

  // Validates the token against this resolver's key, rejects replays of a
  // nonce within its lifetime and maps the action to a typed capability.
  // An action other than the one the token was signed for is rejected as
  // unsupported_action. Failures are audited as pointer-validation failures.
  RedeemResult redeem(const CapabilityToken& token,
                      const std::string& action,
                      const std::string& caller_id,
                      const std::string& trace_id = "");

  CacheMetrics cache_metrics() const { return cache_.metrics(); }
  const ResolverStats& stats() const { return stats_; }
  const std::shared_ptr<const SigningKey>& signing_key() const { return key_; }

 private:
  ResolveResult finish(ResolveResult result,
                       ResolutionEvent ev,
                       const std::string& logical_name,
                       const std::string& caller_id,
                       Deadline deadline);

  EvaluationContext build_context(const std::string& logical_name,
                                  const SecurityContext& context) const;

  RedeemResult reject(const std::string& trace_id,
                      const CapabilityToken& token,
                      const std::string& caller_id,
                      ErrorCode error,
                      std::string reason,
                      Severity severity);

  IStorageAdapter& storage_;
  AuditLogger& audit_;
  const Registry& registry_;
  EventLog& ops_;
  Clock clock_;
  std::shared_ptr<const SigningKey> key_;
  DefinitionCache cache_;
  ResolverStats stats_;

  std::mutex nonce_mu_;
  std::map<std::string, uint64_t> redeemed_nonces_;   // nonce -> expires_at_unix_ms
};

// "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx", random.
std::string new_trace_id();

// Replaces every {ownerId} and {resourceId} in address.
std::string substitute_placeholders(const std::string& address, const std::string& owner_id);

}  // namespace warden
