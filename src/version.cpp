#include "warden/version.hpp"

#include <sstream>

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "0.0.0-dev"
#endif

namespace warden {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.semver          = WARDEN_VERSION;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"hash_algorithm\":" << m.hash_algorithm
    << ",\"token_format\":" << m.token_format
    << ",\"policy_schema\":" << m.policy_schema
    << ",\"audit_log\":" << m.audit_log
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace warden
