#pragma once

// warden/policy.hpp — Boolean attribute-based policy evaluation.
//
// DESIGN:
//   A boolean policy is a closed AST. Every node is exactly one of:
//     ClaimMatch      — requires a held claim with matching action/resourceType.
//     ConditionRef    — a named predicate over the request context
//                       (isOwner, isBusinessHours, isOnCall).
//     AllOf           — AND over clauses, short-circuits on the first failure.
//     AnyOf           — OR over clauses, returns on the first success.
//     UnknownOperator — produced only when decoding an operator this build does
//                       not recognize. Evaluates to a malformed denial.
//   The evaluator visits the variant exhaustively, so adding a node kind without
//   handling it is a compile error rather than a runtime default.
//
// INVARIANTS:
//   - Fail-closed: unknown condition tags, unknown operators, malformed claim
//     patterns and excessive nesting never grant. They return met=false with a
//     descriptive reason and malformed=true.
//   - Never throws.
//   - Claim conditions may themselves contain ClaimMatch nodes. Nesting is bounded
//     by kMaxPolicyDepth so a self-referential claim cannot recurse forever.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "warden/types.hpp"

namespace warden {

struct PolicyNode;

struct ClaimMatch {
  std::string action;
  std::string resource_type;
};

struct ConditionRef {
  std::string tag;
};

struct AllOf {
  std::vector<PolicyNode> clauses;
};

struct AnyOf {
  std::vector<PolicyNode> clauses;
};

struct UnknownOperator {
  std::string name;
};

struct PolicyNode {
  std::variant<ClaimMatch, ConditionRef, AllOf, AnyOf, UnknownOperator> v;
};

constexpr std::size_t kMaxPolicyDepth = 32;

// Builders for readable policy literals.
PolicyNode require(std::string action, std::string resource_type);
PolicyNode condition(std::string tag);
PolicyNode all_of(std::vector<PolicyNode> clauses);
PolicyNode any_of(std::vector<PolicyNode> clauses);

// Claim wildcard and pattern prefix, matched on the claim side only.
inline constexpr const char* kWildcard     = "*";
inline constexpr const char* kRegexPrefix  = "regex:";

// ---------------------------------------------------------------------------
// Claim — an assertion held by the caller
// ---------------------------------------------------------------------------
struct Claim {
  std::string action;                   // "read", "write", ... or "*"
  std::string resource_type;            // literal, "*", or "regex:<pattern>"
  std::optional<PolicyNode> condition;  // must hold for the claim to apply
};

// ---------------------------------------------------------------------------
// SecurityContext — per-request caller identity, claims and ambient attributes
// ---------------------------------------------------------------------------
struct SecurityContext {
  std::string caller_id;
  std::vector<Claim> claims;
  AmbientAttributes ambient;
};

// Fully resolved view used during evaluation. Built by the Resolver from a
// SecurityContext plus attributes derived from the logical name.
struct EvaluationContext {
  std::string caller_id;
  std::string owner_id;   // empty when the logical name carries no owner
  int hour{0};
  int weekday{0};
  bool on_call{false};
  std::map<std::string, AttributeValue> attributes;
};

struct ConditionResult {
  bool met{false};
  bool malformed{false};
  std::string reason;                 // empty when met
  std::optional<Claim> claim;         // first claim that satisfied a ClaimMatch
  std::string granted_action;         // action of that ClaimMatch requirement
};

struct PermissionResult {
  bool met{false};
  bool malformed{false};
  std::optional<Claim> claim;
  std::string reason;
};

// Returns the first claim whose action and resourceType match the requirement
// and whose own condition (if any) is satisfied.
PermissionResult check_permission(const ClaimMatch& requirement,
                                  const std::vector<Claim>& claims,
                                  const EvaluationContext& context);

// Evaluates a policy tree. An absent node is vacuously met.
ConditionResult evaluate_conditions(const PolicyNode& node,
                                    const EvaluationContext& context,
                                    const std::vector<Claim>& claims);
ConditionResult evaluate_conditions(const std::optional<PolicyNode>& node,
                                    const EvaluationContext& context,
                                    const std::vector<Claim>& claims);

// Matches one claim field against the required value. Sets *malformed when a
// regex pattern fails to compile; a malformed pattern never matches.
bool claim_field_matches(const std::string& claim_value,
                         const std::string& required,
                         bool* malformed);

// {"action":"read","resourceType":"report"}
std::string describe_requirement(const ClaimMatch& requirement);
// Same, plus "conditions" when present.
std::string describe_claim(const Claim& claim);

}  // namespace warden
