#pragma once

// warden/audit.hpp — Hash-chained, append-only security audit trail.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: events are never modified or deleted once handed to storage.
//   2. SEQUENTIAL: each event carries a monotonically increasing sequence number,
//      assigned under the logger's mutex.
//   3. CHAINED: previous_digest is hash_domain("audit:", json) of the previous
//      event, forming a tamper-evident chain. The first event chains to 64 zeros.
//   4. FAIL-SAFE: a write failure is counted and reported on the operational
//      event log. It never changes an authorization decision.
//   5. REDACTED: credential references never appear in an event. Resources are
//      rendered as protocol + address or as the logical name.
//
// Sequence numbers are per logger instance. A second process appending to the
// same store starts its own chain at sequence 1.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "warden/types.hpp"

namespace warden {

class IStorageAdapter;
class EventLog;

enum class AuditEventKind {
  handshake_success,
  handshake_failure,
  pointer_validation_failure,
};

// "HANDSHAKE_SUCCESS" | "HANDSHAKE_FAILURE" | "POINTER_VALIDATION_FAILURE"
std::string to_string(AuditEventKind kind);

// ---------------------------------------------------------------------------
// AuditEvent — one security-relevant outcome
// ---------------------------------------------------------------------------
struct AuditEvent {
  uint64_t    sequence{0};
  std::string previous_digest;
  std::string trace_id;
  uint64_t    timestamp_unix_ms{0};
  AuditEventKind kind{AuditEventKind::handshake_failure};
  Severity    severity{Severity::info};
  std::string reason;          // grant basis on success, denial reason otherwise
  std::string caller_id;       // "anonymous" when unknown
  std::string resource;        // logical name or physical_resource_json()
};

// Single-line JSON, keys sorted. This exact rendering is what gets chained.
std::string audit_event_to_json(const AuditEvent& event);

inline constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

// Recomputes the chain over events in append order. An event with sequence 1
// restarts from the genesis digest. Returns the index of the first event that
// breaks the chain, or events.size() if intact.
std::size_t verify_chain(const std::vector<AuditEvent>& events);

// ---------------------------------------------------------------------------
// AuditLogger
// ---------------------------------------------------------------------------
// Thread-safe. All three log_* calls return true when storage acknowledged the
// append and false otherwise; callers treat false as informational only.
class AuditLogger {
 public:
  // ops may be null, in which case failures are only counted.
  AuditLogger(IStorageAdapter& storage, EventLog* ops, Clock clock = wall_clock());

  bool log_handshake_success(const std::string& trace_id,
                             const std::string& resource,
                             const std::string& caller_id,
                             const std::string& granted_by,
                             Deadline deadline = no_deadline());

  bool log_handshake_failure(const std::string& trace_id,
                             const std::string& resource,
                             const std::string& caller_id,
                             const std::string& reason,
                             Deadline deadline = no_deadline());

  // Token redemption failure. severity: critical for integrity failures and
  // replays, warning for expiry.
  bool log_pointer_failure(const std::string& trace_id,
                           const ConnectionDescriptor& descriptor,
                           const std::string& reason,
                           const std::string& caller_id,
                           Severity severity,
                           Deadline deadline = no_deadline());

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  std::string last_digest() const;

 private:
  bool append(AuditEvent event, Deadline deadline);

  IStorageAdapter& storage_;
  EventLog* ops_;
  Clock clock_;

  mutable std::mutex mu_;
  uint64_t seq_{0};
  uint64_t entry_count_{0};
  uint64_t failure_count_{0};
  std::string last_digest_{kGenesisDigest};
};

}  // namespace warden
