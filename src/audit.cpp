#include "warden/audit.hpp"
#include "warden/hash.hpp"
#include "warden/jsonlite.hpp"
#include "warden/observability.hpp"
#include "warden/storage.hpp"
#include "warden/version.hpp"

#include <utility>

namespace warden {

namespace {

std::string caller_or_anonymous(const std::string& caller_id) {
  return caller_id.empty() ? std::string("anonymous") : caller_id;
}

}  // namespace

std::string to_string(AuditEventKind kind) {
  switch (kind) {
    case AuditEventKind::handshake_success: return "HANDSHAKE_SUCCESS";
    case AuditEventKind::handshake_failure: return "HANDSHAKE_FAILURE";
    case AuditEventKind::pointer_validation_failure: return "POINTER_VALIDATION_FAILURE";
  }
  return "HANDSHAKE_FAILURE";
}

// ---------------------------------------------------------------------------
// AuditEvent → JSON
// ---------------------------------------------------------------------------
std::string audit_event_to_json(const AuditEvent& e) {
  jsonlite::Object o;
  o["v"]                 = jsonlite::Value{static_cast<uint64_t>(version::AUDIT_LOG_VERSION)};
  o["seq"]               = jsonlite::Value{e.sequence};
  o["prev"]              = jsonlite::Value{e.previous_digest};
  o["trace_id"]          = jsonlite::Value{e.trace_id};
  o["timestamp_unix_ms"] = jsonlite::Value{e.timestamp_unix_ms};
  o["type"]              = jsonlite::Value{to_string(e.kind)};
  o["severity"]          = jsonlite::Value{to_string(e.severity)};
  o["reason"]            = jsonlite::Value{e.reason};
  o["user_id"]           = jsonlite::Value{e.caller_id};
  o["resource"]          = jsonlite::Value{e.resource};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

std::size_t verify_chain(const std::vector<AuditEvent>& events) {
  std::string expected = kGenesisDigest;
  uint64_t expected_seq = 1;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].sequence == 1) {
      expected     = kGenesisDigest;
      expected_seq = 1;
    }
    if (events[i].sequence != expected_seq || events[i].previous_digest != expected) return i;
    expected = hash_domain("audit:", audit_event_to_json(events[i]));
    ++expected_seq;
  }
  return events.size();
}

// ---------------------------------------------------------------------------
// AuditLogger
// ---------------------------------------------------------------------------

AuditLogger::AuditLogger(IStorageAdapter& storage, EventLog* ops, Clock clock)
    : storage_(storage), ops_(ops), clock_(std::move(clock)) {}

bool AuditLogger::log_handshake_success(const std::string& trace_id,
                                        const std::string& resource,
                                        const std::string& caller_id,
                                        const std::string& granted_by,
                                        Deadline deadline) {
  AuditEvent e;
  e.trace_id  = trace_id;
  e.kind      = AuditEventKind::handshake_success;
  e.severity  = Severity::info;
  e.reason    = "Granted by " + granted_by;
  e.caller_id = caller_or_anonymous(caller_id);
  e.resource  = resource;
  return append(std::move(e), deadline);
}

bool AuditLogger::log_handshake_failure(const std::string& trace_id,
                                        const std::string& resource,
                                        const std::string& caller_id,
                                        const std::string& reason,
                                        Deadline deadline) {
  AuditEvent e;
  e.trace_id  = trace_id;
  e.kind      = AuditEventKind::handshake_failure;
  e.severity  = Severity::warning;
  e.reason    = reason;
  e.caller_id = caller_or_anonymous(caller_id);
  e.resource  = resource;
  return append(std::move(e), deadline);
}

bool AuditLogger::log_pointer_failure(const std::string& trace_id,
                                      const ConnectionDescriptor& descriptor,
                                      const std::string& reason,
                                      const std::string& caller_id,
                                      Severity severity,
                                      Deadline deadline) {
  AuditEvent e;
  e.trace_id  = trace_id;
  e.kind      = AuditEventKind::pointer_validation_failure;
  e.severity  = severity;
  e.reason    = reason;
  e.caller_id = caller_or_anonymous(caller_id);
  e.resource  = physical_resource_json(descriptor);
  return append(std::move(e), deadline);
}

bool AuditLogger::append(AuditEvent event, Deadline deadline) {
  std::lock_guard<std::mutex> lk(mu_);

  std::string failure;
  if (deadline_passed(deadline)) {
    failure = "deadline exceeded before audit append";
  } else {
    event.sequence          = seq_ + 1;
    event.previous_digest   = last_digest_;
    event.timestamp_unix_ms = clock_();

    const StorageStatus st = storage_.log_event(event, deadline);
    if (st.ok) {
      // Only an acknowledged append advances the chain, so the stored sequence
      // never has a gap the chain does not account for.
      seq_         = event.sequence;
      last_digest_ = hash_domain("audit:", audit_event_to_json(event));
      ++entry_count_;
      return true;
    }
    failure = st.error;
  }

  ++failure_count_;
  if (ops_) {
    jsonlite::Object fields;
    fields["trace_id"] = jsonlite::Value{event.trace_id};
    fields["type"]     = jsonlite::Value{to_string(event.kind)};
    fields["resource"] = jsonlite::Value{event.resource};
    fields["error"]    = jsonlite::Value{failure};
    fields["backend"]  = jsonlite::Value{storage_.backend_id()};
    ops_->emit(Severity::critical, "audit_write_failure", std::move(fields));
  }
  return false;
}

uint64_t AuditLogger::entry_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entry_count_;
}

uint64_t AuditLogger::failure_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failure_count_;
}

std::string AuditLogger::last_digest() const {
  std::lock_guard<std::mutex> lk(mu_);
  return last_digest_;
}

}  // namespace warden
