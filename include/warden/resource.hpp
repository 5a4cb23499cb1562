#pragma once

// warden/resource.hpp — Resource definitions as stored and cached.

#include <string>
#include <variant>

#include "warden/policy.hpp"
#include "warden/types.hpp"
#include "warden/vector_policy.hpp"

namespace warden {

struct BooleanPolicy {
  PolicyNode rule;
};

// Exactly one kind per resource. There is no fallback between kinds.
using AccessPolicy = std::variant<BooleanPolicy, VectorPolicy>;

struct ResourceDefinition {
  std::string logical_name;
  ConnectionDescriptor connection;
  AccessPolicy policy;
};

// "boolean" | "vector"
inline const char* policy_kind(const AccessPolicy& policy) {
  return std::holds_alternative<VectorPolicy>(policy) ? "vector" : "boolean";
}

}  // namespace warden
