#include "warden/types.hpp"
#include "warden/jsonlite.hpp"

namespace warden {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::policy_denied: return "policy_denied";
    case ErrorCode::malformed_policy: return "malformed_policy";
    case ErrorCode::storage_unavailable: return "storage_unavailable";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::token_integrity_failed: return "integrity_check_failed";
    case ErrorCode::token_expired: return "pointer_expired";
    case ErrorCode::token_replayed: return "pointer_replayed";
    case ErrorCode::unsupported_action: return "unsupported_action";
    case ErrorCode::config_invalid: return "config_invalid";
  }
  return "";
}

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::info: return "info";
    case Severity::warning: return "warning";
    case Severity::critical: return "critical";
  }
  return "info";
}

uint64_t system_now_unix_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

Clock wall_clock() { return [] { return system_now_unix_ms(); }; }

bool deadline_passed(Deadline d) {
  if (d == no_deadline()) return false;
  return std::chrono::steady_clock::now() > d;
}

Deadline deadline_after(std::chrono::milliseconds budget) {
  return std::chrono::steady_clock::now() + budget;
}

std::string physical_resource_json(const ConnectionDescriptor& d) {
  jsonlite::Object o;
  o["protocol"] = jsonlite::Value{d.protocol};
  o["address"]  = jsonlite::Value{d.address};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace warden
