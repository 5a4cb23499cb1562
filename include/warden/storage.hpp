#pragma once

// warden/storage.hpp — Storage adapter contract and the two shipped backends.
//
// DESIGN:
//   The resolver and the audit logger see storage only through IStorageAdapter.
//   Every I/O call takes the request Deadline; a backend that cannot honour it
//   returns an error rather than blocking past it.
//
// INVARIANTS:
//   - get_connection() distinguishes "no such name" (ok=true, definition empty)
//     from "could not ask" (ok=false). The resolver maps the second case to
//     storage_unavailable, never to not_found.
//   - log_event() is append-only. Adapters never rewrite or delete audit rows.
//   - A stored policy that no longer decodes is returned as an UnknownOperator
//     rule so it is denied as malformed rather than silently dropped.
//   - Never throws.
//
// EXTENSION_POINT: storage_backends
//   Current: in-process map (tests, embedding) and SQLite (single node).
//   Upgrade: a networked backend (PostgreSQL, etcd) implements the same five
//   calls. Invariant: register_connection() must be durable before it returns.

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/resource.hpp"
#include "warden/types.hpp"

namespace warden {

struct StorageStatus {
  bool ok{false};
  std::string error;   // empty when ok
};

struct LookupResult {
  bool ok{false};
  std::optional<ResourceDefinition> definition;   // empty + ok => not registered
  std::string error;
};

// ---------------------------------------------------------------------------
// IStorageAdapter
// ---------------------------------------------------------------------------
class IStorageAdapter {
 public:
  virtual ~IStorageAdapter() = default;

  // Create schema / open handles. Idempotent.
  virtual StorageStatus init() = 0;

  // Insert or replace by logical name.
  virtual StorageStatus register_connection(const ResourceDefinition& definition,
                                            Deadline deadline = no_deadline()) = 0;

  virtual LookupResult get_connection(const std::string& logical_name,
                                      Deadline deadline = no_deadline()) = 0;

  virtual StorageStatus log_event(const AuditEvent& event,
                                  Deadline deadline = no_deadline()) = 0;

  virtual void close() = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryStorage — mutex-guarded maps, nothing persisted
// ---------------------------------------------------------------------------
class MemoryStorage : public IStorageAdapter {
 public:
  StorageStatus init() override;
  StorageStatus register_connection(const ResourceDefinition& definition,
                                    Deadline deadline = no_deadline()) override;
  LookupResult get_connection(const std::string& logical_name,
                              Deadline deadline = no_deadline()) override;
  StorageStatus log_event(const AuditEvent& event,
                          Deadline deadline = no_deadline()) override;
  void close() override;
  std::string backend_id() const override { return "memory"; }

  std::vector<AuditEvent> audit_events() const;
  std::size_t connection_count() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, ResourceDefinition> connections_;
  std::vector<AuditEvent> audit_;
};

// ---------------------------------------------------------------------------
// SqliteStorage — single-file SQLite database, WAL journal
// ---------------------------------------------------------------------------
// Tables:
//   connections(logical_name PK, protocol, address, encrypted_credentials,
//               required_permission)   -- required_permission = policy JSON
//   audit_logs(id, seq, prev_digest, trace_id, timestamp_unix_ms, type,
//              severity, reason, user_id, resource)
//
// One connection guarded by a mutex. Long statements are interrupted through a
// progress handler once the call's deadline has passed.
class SqliteStorage : public IStorageAdapter {
 public:
  explicit SqliteStorage(std::string path);
  ~SqliteStorage() override;

  SqliteStorage(const SqliteStorage&) = delete;
  SqliteStorage& operator=(const SqliteStorage&) = delete;

  StorageStatus init() override;
  StorageStatus register_connection(const ResourceDefinition& definition,
                                    Deadline deadline = no_deadline()) override;
  LookupResult get_connection(const std::string& logical_name,
                              Deadline deadline = no_deadline()) override;
  StorageStatus log_event(const AuditEvent& event,
                          Deadline deadline = no_deadline()) override;
  void close() override;
  std::string backend_id() const override { return "sqlite:" + path_; }

  // Most recent events first. limit 0 = all.
  std::vector<AuditEvent> read_audit_log(std::size_t limit = 0) const;

  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

}  // namespace warden
