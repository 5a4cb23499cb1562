#include "warden/policy.hpp"
#include "warden/jsonlite.hpp"
#include "warden/policy_codec.hpp"

#include <regex>
#include <utility>

namespace warden {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

ConditionResult fail(std::string reason, bool malformed = false) {
  ConditionResult r;
  r.met       = false;
  r.malformed = malformed;
  r.reason    = std::move(reason);
  return r;
}

ConditionResult evaluate_condition_tag(const std::string& tag, const EvaluationContext& ctx) {
  bool met = false;
  if (tag == "isOwner") {
    // An empty owner id never matches, even for an anonymous caller.
    met = !ctx.owner_id.empty() && ctx.caller_id == ctx.owner_id;
  } else if (tag == "isBusinessHours") {
    const bool business_day  = ctx.weekday >= 1 && ctx.weekday <= 5;
    const bool business_hour = ctx.hour >= 9 && ctx.hour < 17;
    met = business_day && business_hour;
  } else if (tag == "isOnCall") {
    met = ctx.on_call;
  } else {
    return fail("Unknown condition '" + tag + "'", true);
  }
  if (!met) return fail("Condition '" + tag + "' failed");
  ConditionResult ok;
  ok.met = true;
  return ok;
}

ConditionResult evaluate_node(const PolicyNode& node,
                              const EvaluationContext& ctx,
                              const std::vector<Claim>& claims,
                              std::size_t depth);

PermissionResult check_permission_at(const ClaimMatch& requirement,
                                     const std::vector<Claim>& claims,
                                     const EvaluationContext& ctx,
                                     std::size_t depth) {
  PermissionResult result;
  bool saw_malformed = false;
  for (const auto& claim : claims) {
    bool malformed = false;
    const bool action_match   = claim_field_matches(claim.action, requirement.action, &malformed);
    const bool resource_match = claim_field_matches(claim.resource_type, requirement.resource_type, &malformed);
    saw_malformed = saw_malformed || malformed;
    if (!action_match || !resource_match) continue;

    if (claim.condition) {
      const auto cond = evaluate_node(*claim.condition, ctx, claims, depth + 1);
      if (!cond.met) {
        saw_malformed = saw_malformed || cond.malformed;
        continue;
      }
    }
    result.met   = true;
    result.claim = claim;
    return result;
  }

  result.met       = false;
  result.malformed = saw_malformed;
  result.reason    = "No claim satisfied requirement: " + describe_requirement(requirement);
  if (saw_malformed) result.reason += " (malformed claim or condition ignored)";
  return result;
}

ConditionResult evaluate_node(const PolicyNode& node,
                              const EvaluationContext& ctx,
                              const std::vector<Claim>& claims,
                              std::size_t depth) {
  if (depth > kMaxPolicyDepth) {
    return fail("Policy nesting exceeds depth " + std::to_string(kMaxPolicyDepth), true);
  }

  return std::visit(
      overloaded{
          [&](const ClaimMatch& leaf) -> ConditionResult {
            auto perm = check_permission_at(leaf, claims, ctx, depth);
            if (!perm.met) return fail(perm.reason, perm.malformed);
            ConditionResult ok;
            ok.met            = true;
            ok.claim          = std::move(perm.claim);
            ok.granted_action = leaf.action;
            return ok;
          },
          [&](const ConditionRef& ref) -> ConditionResult {
            return evaluate_condition_tag(ref.tag, ctx);
          },
          [&](const AllOf& all) -> ConditionResult {
            if (all.clauses.empty()) return fail("AND block has no clauses", true);
            ConditionResult combined;
            combined.met = true;
            for (const auto& clause : all.clauses) {
              auto r = evaluate_node(clause, ctx, claims, depth + 1);
              if (!r.met) return fail("AND clause failed: " + r.reason, r.malformed);
              if (!combined.claim && r.claim) {
                combined.claim          = std::move(r.claim);
                combined.granted_action = std::move(r.granted_action);
              }
            }
            return combined;
          },
          [&](const AnyOf& any) -> ConditionResult {
            if (any.clauses.empty()) return fail("OR block has no clauses", true);
            std::string reasons;
            bool malformed = false;
            for (const auto& clause : any.clauses) {
              auto r = evaluate_node(clause, ctx, claims, depth + 1);
              if (r.met) return r;
              if (!reasons.empty()) reasons += ", ";
              reasons += r.reason;
              malformed = malformed || r.malformed;
            }
            return fail("OR block failed: [" + reasons + "]", malformed);
          },
          [&](const UnknownOperator& op) -> ConditionResult {
            return fail("Unknown operator '" + op.name + "'", true);
          },
      },
      node.v);
}

}  // namespace

PolicyNode require(std::string action, std::string resource_type) {
  return PolicyNode{ClaimMatch{std::move(action), std::move(resource_type)}};
}

PolicyNode condition(std::string tag) {
  return PolicyNode{ConditionRef{std::move(tag)}};
}

PolicyNode all_of(std::vector<PolicyNode> clauses) {
  return PolicyNode{AllOf{std::move(clauses)}};
}

PolicyNode any_of(std::vector<PolicyNode> clauses) {
  return PolicyNode{AnyOf{std::move(clauses)}};
}

bool claim_field_matches(const std::string& claim_value,
                         const std::string& required,
                         bool* malformed) {
  if (claim_value == kWildcard) return true;
  const std::string prefix = kRegexPrefix;
  if (claim_value.rfind(prefix, 0) == 0) {
    try {
      const std::regex pattern(claim_value.substr(prefix.size()));
      return std::regex_match(required, pattern);
    } catch (const std::regex_error&) {
      if (malformed) *malformed = true;
      return false;
    }
  }
  return claim_value == required;
}

PermissionResult check_permission(const ClaimMatch& requirement,
                                  const std::vector<Claim>& claims,
                                  const EvaluationContext& context) {
  return check_permission_at(requirement, claims, context, 0);
}

ConditionResult evaluate_conditions(const PolicyNode& node,
                                    const EvaluationContext& context,
                                    const std::vector<Claim>& claims) {
  return evaluate_node(node, context, claims, 0);
}

ConditionResult evaluate_conditions(const std::optional<PolicyNode>& node,
                                    const EvaluationContext& context,
                                    const std::vector<Claim>& claims) {
  if (!node) {
    ConditionResult ok;
    ok.met = true;
    return ok;
  }
  return evaluate_node(*node, context, claims, 0);
}

std::string describe_requirement(const ClaimMatch& requirement) {
  jsonlite::Object o;
  o["action"]       = jsonlite::Value{requirement.action};
  o["resourceType"] = jsonlite::Value{requirement.resource_type};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::string describe_claim(const Claim& claim) {
  return encode_claim(claim);
}

}  // namespace warden
