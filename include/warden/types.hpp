#pragma once

// warden/types.hpp — Core value types shared by every Warden component.
//
// MEMORY OWNERSHIP:
//   - All string members are value-owned. No borrowed references.
//   - ConnectionDescriptor is a plain value; every copy is independent. The
//     capability token keeps its own copy and never hands out a reference to it.
//
// ERROR MODEL:
//   Public operations never throw. Failures are reported as an ErrorCode plus a
//   human-readable reason inside the returned result struct. Reasons never carry
//   credential material.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace warden {

enum class ErrorCode {
  none,
  not_found,
  policy_denied,
  malformed_policy,
  storage_unavailable,
  deadline_exceeded,
  token_integrity_failed,
  token_expired,
  token_replayed,
  unsupported_action,
  config_invalid,
};

std::string to_string(ErrorCode code);

// Severity shared by audit events and the operational event log.
enum class Severity { info, warning, critical };

std::string to_string(Severity severity);

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------
// Wall-clock source in unix milliseconds. Injected everywhere expiry is
// computed so tests can drive time explicitly.
using Clock = std::function<uint64_t()>;

uint64_t system_now_unix_ms();
Clock wall_clock();

// Request deadline on the monotonic clock. Bounds the storage fetch and the
// audit append of a single resolution.
using Deadline = std::chrono::steady_clock::time_point;

inline Deadline no_deadline() { return Deadline::max(); }
bool deadline_passed(Deadline d);
Deadline deadline_after(std::chrono::milliseconds budget);

// ---------------------------------------------------------------------------
// ConnectionDescriptor — how to reach a physical resource
// ---------------------------------------------------------------------------
// address may contain {ownerId} / {resourceId} placeholders until resolution
// substitutes them. credential_ref is an opaque encrypted blob reference and
// must never be logged.
struct ConnectionDescriptor {
  std::string protocol;        // "file", "https", "sql", ...
  std::string address;
  std::string credential_ref;

  bool operator==(const ConnectionDescriptor&) const = default;
};

// Renders protocol and address only. Safe for audit and denial reasons.
std::string physical_resource_json(const ConnectionDescriptor& d);

// ---------------------------------------------------------------------------
// Ambient request attributes
// ---------------------------------------------------------------------------
using AttributeValue = std::variant<double, std::string, bool>;

struct AmbientAttributes {
  std::optional<int> hour;     // 0-23, local time. Filled from the wall clock if absent.
  std::optional<int> weekday;  // 0=Sunday ... 6=Saturday. Filled if absent.
  bool on_call{false};
  std::map<std::string, AttributeValue> custom;
};

}  // namespace warden
