#include "warden/registry.hpp"

#include <algorithm>

namespace warden {

std::optional<std::string> Registry::derive_owner_id(const std::string& logical_name) const {
  const auto slash = logical_name.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= logical_name.size()) {
    return std::nullopt;
  }

  const std::string category = logical_name.substr(0, slash);
  if (!owner_categories.empty() &&
      std::find(owner_categories.begin(), owner_categories.end(), category) ==
          owner_categories.end()) {
    return std::nullopt;
  }
  return logical_name.substr(slash + 1);
}

}  // namespace warden
