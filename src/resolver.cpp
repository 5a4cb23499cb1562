#include "warden/resolver.hpp"
#include "warden/jsonlite.hpp"
#include "warden/vector_policy.hpp"

#include <algorithm>
#include <ctime>
#include <iterator>
#include <utility>
#include <variant>

namespace warden {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

struct Decision {
  bool met{false};
  bool malformed{false};
  std::string reason;
  std::string granted_by;
  std::string granted_action;
};

void replace_all(std::string& s, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

Severity severity_for(ErrorCode error) {
  return error == ErrorCode::token_expired || error == ErrorCode::unsupported_action
             ? Severity::warning
             : Severity::critical;
}

std::tm local_time(std::time_t secs) {
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &secs);
#else
  localtime_r(&secs, &local);
#endif
  return local;
}

// Policies may name wildcards or no action at all; those grant read only.
std::string grantable_action(const std::string& action) {
  return make_capability(action, ConnectionDescriptor{}) ? action
                                                         : std::string(kDefaultGrantedAction);
}

// A vector grant carries the caller's "action" coordinate when the policy
// declares one and the action maps to a capability. Anything else is read-only.
std::string vector_grant_action(const VectorPolicy& policy, const EvaluationContext& ctx) {
  const bool declared =
      std::any_of(policy.dimensions.begin(), policy.dimensions.end(),
                  [](const VectorDimension& dim) { return dim.name == kActionAttribute; });
  const auto it = ctx.attributes.find(kActionAttribute);
  if (!declared || it == ctx.attributes.end()) return kDefaultGrantedAction;
  const auto* action = std::get_if<std::string>(&it->second);
  return action ? grantable_action(*action) : std::string(kDefaultGrantedAction);
}

}  // namespace

std::string new_trace_id() {
  const std::string h = random_hex(16);
  return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
         h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::string substitute_placeholders(const std::string& address, const std::string& owner_id) {
  std::string out = address;
  replace_all(out, "{ownerId}", owner_id);
  replace_all(out, "{resourceId}", owner_id);
  return out;
}

std::string ResolveResult::to_json() const {
  jsonlite::Object o;
  o["ok"]       = jsonlite::Value{ok};
  o["trace_id"] = jsonlite::Value{trace_id};
  if (ok) {
    jsonlite::Object d;
    d["protocol"] = jsonlite::Value{descriptor ? descriptor->protocol : std::string()};
    d["address"]  = jsonlite::Value{descriptor ? descriptor->address : std::string()};
    o["descriptor"]     = jsonlite::Value{std::move(d)};
    o["granted_by"]     = jsonlite::Value{granted_by};
    o["granted_action"] = jsonlite::Value{granted_action};
  } else {
    o["error"]  = jsonlite::Value{to_string(error)};
    o["reason"] = jsonlite::Value{reason};
  }
  o["policy_kind"] = jsonlite::Value{policy_kind};
  o["cache_hit"]   = jsonlite::Value{cache_hit};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(IStorageAdapter& storage,
                   AuditLogger& audit,
                   const Registry& registry,
                   EventLog& ops,
                   ResolverOptions options)
    : storage_(storage),
      audit_(audit),
      registry_(registry),
      ops_(ops),
      clock_(options.clock ? options.clock : wall_clock()),
      key_(options.signing_key ? options.signing_key
                               : std::make_shared<const SigningKey>(generate_signing_key())),
      cache_(options.cache_ttl_ms, options.cache_shards, clock_) {}

EvaluationContext Resolver::build_context(const std::string& logical_name,
                                          const SecurityContext& context) const {
  EvaluationContext ctx;
  ctx.caller_id  = context.caller_id;
  ctx.owner_id   = registry_.derive_owner_id(logical_name).value_or("");
  ctx.on_call    = context.ambient.on_call;
  ctx.attributes = context.ambient.custom;

  if (context.ambient.hour && context.ambient.weekday) {
    ctx.hour    = *context.ambient.hour;
    ctx.weekday = *context.ambient.weekday;
  } else {
    const std::tm local = local_time(static_cast<std::time_t>(clock_() / 1000));
    ctx.hour    = context.ambient.hour.value_or(local.tm_hour);
    ctx.weekday = context.ambient.weekday.value_or(local.tm_wday);
  }

  // Built-ins are visible to vector dimensions unless the caller overrides them.
  ctx.attributes.emplace("hour", static_cast<double>(ctx.hour));
  ctx.attributes.emplace("weekday", static_cast<double>(ctx.weekday));
  ctx.attributes.emplace("on_call", ctx.on_call);
  return ctx;
}

ResolveResult Resolver::finish(ResolveResult result,
                               ResolutionEvent ev,
                               const std::string& logical_name,
                               const std::string& caller_id,
                               Deadline deadline) {
  bool audited = false;
  if (result.ok) {
    audited = audit_.log_handshake_success(result.trace_id, logical_name, caller_id,
                                           result.granted_by, deadline);
  } else {
    audited = audit_.log_handshake_failure(result.trace_id, logical_name, caller_id,
                                           result.reason, deadline);
  }
  if (!audited) stats_.audit_failures.fetch_add(1, std::memory_order_relaxed);

  ev.ok          = result.ok;
  ev.error       = result.error;
  ev.policy_kind = result.policy_kind;
  ev.cache_hit   = result.cache_hit;
  stats_.record_resolution(ev);
  ops_.emit_resolution(ev);
  return result;
}

ResolveResult Resolver::resolve(const std::string& logical_name,
                                const SecurityContext& context,
                                const ResolveOptions& options) {
  const auto started = std::chrono::steady_clock::now();
  const Deadline deadline = options.deadline;

  ResolveResult result;
  result.trace_id = options.trace_id.empty() ? new_trace_id() : options.trace_id;

  ResolutionEvent ev;
  ev.trace_id     = result.trace_id;
  ev.logical_name = logical_name;
  ev.caller_id    = context.caller_id;

  const auto elapsed_ns = [&started] {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count());
  };
  const auto fail = [&](ErrorCode code, std::string reason) {
    result.ok     = false;
    result.error  = code;
    result.reason = std::move(reason);
    ev.duration_ns = elapsed_ns();
    return finish(std::move(result), std::move(ev), logical_name, context.caller_id, deadline);
  };

  if (deadline_passed(deadline)) return fail(ErrorCode::deadline_exceeded, "deadline_exceeded");

  // 1. Definition lookup.
  const CacheLookup lookup = cache_.get_or_fetch(
      logical_name,
      [this, deadline](const std::string& name) {
        LookupResult r = storage_.get_connection(name, deadline);
        return FetchOutcome{r.ok, std::move(r.definition), std::move(r.error)};
      },
      deadline);
  result.cache_hit = lookup.hit;

  if (lookup.deadline_exceeded || (!lookup.ok && deadline_passed(deadline))) {
    return fail(ErrorCode::deadline_exceeded, "deadline_exceeded");
  }
  if (!lookup.ok) {
    jsonlite::Object fields;
    fields["trace_id"]     = jsonlite::Value{result.trace_id};
    fields["logical_name"] = jsonlite::Value{logical_name};
    fields["backend"]      = jsonlite::Value{storage_.backend_id()};
    fields["error"]        = jsonlite::Value{lookup.error};
    ops_.emit(Severity::warning, "storage_unavailable", std::move(fields));
    return fail(ErrorCode::storage_unavailable, "storage_unavailable");
  }
  if (!lookup.definition) return fail(ErrorCode::not_found, "not_found");
  if (deadline_passed(deadline)) return fail(ErrorCode::deadline_exceeded, "deadline_exceeded");

  const ResourceDefinition& def = *lookup.definition;
  result.policy_kind = policy_kind(def.policy);

  // 2. Policy evaluation.
  const EvaluationContext ctx = build_context(logical_name, context);
  const Decision decision = std::visit(
      overloaded{
          [&](const BooleanPolicy& p) {
            const ConditionResult cr = evaluate_conditions(p.rule, ctx, context.claims);
            Decision d;
            d.met            = cr.met;
            d.malformed      = cr.malformed;
            d.reason         = cr.reason;
            d.granted_by     = cr.claim ? describe_claim(*cr.claim) : std::string("policy conditions");
            d.granted_action = grantable_action(cr.granted_action);
            return d;
          },
          [&](const VectorPolicy& p) {
            const VectorResult vr = evaluate_vector_policy(p, ctx, registry_.vector_maps);
            Decision d;
            d.met        = vr.met;
            d.malformed  = vr.malformed;
            d.reason     = vr.reason;
            d.granted_by = vr.reason;
            if (vr.met) d.granted_action = vector_grant_action(p, ctx);
            return d;
          },
      },
      def.policy);

  if (!decision.met) {
    if (decision.malformed) {
      jsonlite::Object fields;
      fields["trace_id"]     = jsonlite::Value{result.trace_id};
      fields["logical_name"] = jsonlite::Value{logical_name};
      fields["reason"]       = jsonlite::Value{decision.reason};
      ops_.emit(Severity::warning, "malformed_policy", std::move(fields));
      return fail(ErrorCode::malformed_policy, decision.reason);
    }
    return fail(ErrorCode::policy_denied, decision.reason);
  }

  // 3. Grant.
  ConnectionDescriptor descriptor = def.connection;
  if (!ctx.owner_id.empty()) {
    descriptor.address = substitute_placeholders(descriptor.address, ctx.owner_id);
  }
  result.ok             = true;
  result.error          = ErrorCode::none;
  result.descriptor     = std::move(descriptor);
  result.granted_by     = decision.granted_by;
  result.granted_action = decision.granted_action;
  ev.duration_ns        = elapsed_ns();
  return finish(std::move(result), std::move(ev), logical_name, context.caller_id, deadline);
}

StorageStatus Resolver::register_connection(const ResourceDefinition& definition,
                                            Deadline deadline) {
  cache_.invalidate(definition.logical_name);
  StorageStatus st = storage_.register_connection(definition, deadline);
  cache_.invalidate(definition.logical_name);
  return st;
}

CapabilityToken Resolver::sign(const ConnectionDescriptor& descriptor,
                               const std::string& action,
                               uint64_t lifetime_seconds) {
  stats_.tokens_issued.fetch_add(1, std::memory_order_relaxed);
  return CapabilityToken::issue(descriptor, action, key_, clock_, lifetime_seconds);
}

TokenDecodeResult Resolver::decode_token(const std::string& wire) const {
  return CapabilityToken::decode(wire, key_, clock_);
}

RedeemResult Resolver::reject(const std::string& trace_id,
                              const CapabilityToken& token,
                              const std::string& caller_id,
                              ErrorCode error,
                              std::string reason,
                              Severity severity) {
  switch (error) {
    case ErrorCode::token_integrity_failed:
      stats_.integrity_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::token_expired:
      stats_.expired.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorCode::token_replayed:
      stats_.replayed.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      break;
  }

  if (!audit_.log_pointer_failure(trace_id, token.descriptor(), reason, caller_id, severity)) {
    stats_.audit_failures.fetch_add(1, std::memory_order_relaxed);
  }
  if (severity == Severity::critical) {
    jsonlite::Object fields;
    fields["trace_id"]  = jsonlite::Value{trace_id};
    fields["error"]     = jsonlite::Value{to_string(error)};
    fields["caller_id"] = jsonlite::Value{caller_id};
    fields["resource"]  = jsonlite::Value{physical_resource_json(token.descriptor())};
    ops_.emit(Severity::critical, "security_incident", std::move(fields));
  }

  RedeemResult r;
  r.error  = error;
  r.reason = std::move(reason);
  return r;
}

RedeemResult Resolver::redeem(const CapabilityToken& token,
                              const std::string& action,
                              const std::string& caller_id,
                              const std::string& trace_id) {
  const std::string trace = trace_id.empty() ? new_trace_id() : trace_id;
  stats_.redemptions.fetch_add(1, std::memory_order_relaxed);

  auto capability = make_capability(action, token.descriptor());
  if (!capability) {
    return reject(trace, token, caller_id, ErrorCode::unsupported_action,
                  "Unsupported action '" + action + "'", Severity::warning);
  }

  const uint64_t now = clock_();
  const ValidationResult v = token.verify(*key_, now);
  if (!v.valid) return reject(trace, token, caller_id, v.error, v.reason, severity_for(v.error));

  // The action is covered by the digest, so a mismatch is an escalation attempt.
  if (action != token.action()) {
    return reject(trace, token, caller_id, ErrorCode::unsupported_action,
                  "Pointer grants '" + token.action() + "', not '" + action + "'.",
                  Severity::critical);
  }

  bool first_use = false;
  {
    std::lock_guard<std::mutex> lk(nonce_mu_);
    for (auto it = redeemed_nonces_.begin(); it != redeemed_nonces_.end();) {
      it = (it->second < now) ? redeemed_nonces_.erase(it) : std::next(it);
    }
    first_use = redeemed_nonces_.emplace(token.nonce(), token.expires_at_unix_ms()).second;
  }
  if (!first_use) {
    return reject(trace, token, caller_id, ErrorCode::token_replayed,
                  "Pointer has already been redeemed.", Severity::critical);
  }

  RedeemResult r;
  r.ok         = true;
  r.capability = std::move(capability);
  return r;
}

}  // namespace warden
