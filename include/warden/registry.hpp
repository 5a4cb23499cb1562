#pragma once

// warden/registry.hpp — Startup-time naming conventions and value maps.
//
// A Registry is a plain value built once (usually from BrokerConfig) and passed
// by reference into each Resolver. There is no process-wide registry.

#include <optional>
#include <string>
#include <vector>

#include "warden/vector_policy.hpp"

namespace warden {

struct Registry {
  // Logical-name prefixes whose second segment is the owning principal, e.g.
  // "reports" makes "reports/acct-42" owned by "acct-42". When empty, any
  // "category/rest" name yields "rest".
  std::vector<std::string> owner_categories;

  // Named category tables for categorical vector dimensions.
  VectorMaps vector_maps;

  std::optional<std::string> derive_owner_id(const std::string& logical_name) const;
};

}  // namespace warden
