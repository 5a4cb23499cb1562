#include "warden/storage.hpp"
#include "warden/policy_codec.hpp"

#include <sqlite3.h>

#include <utility>

namespace warden {

namespace {

const char* kSchema =
    "CREATE TABLE IF NOT EXISTS connections ("
    "logical_name TEXT PRIMARY KEY,"
    "protocol TEXT NOT NULL,"
    "address TEXT NOT NULL,"
    "encrypted_credentials TEXT,"
    "required_permission TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS audit_logs ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "seq INTEGER NOT NULL,"
    "prev_digest TEXT NOT NULL,"
    "trace_id TEXT,"
    "timestamp_unix_ms INTEGER NOT NULL,"
    "type TEXT NOT NULL,"
    "severity TEXT NOT NULL,"
    "reason TEXT,"
    "user_id TEXT,"
    "resource TEXT"
    ");";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

AuditEventKind kind_from_string(const std::string& s) {
  if (s == "HANDSHAKE_SUCCESS") return AuditEventKind::handshake_success;
  if (s == "POINTER_VALIDATION_FAILURE") return AuditEventKind::pointer_validation_failure;
  return AuditEventKind::handshake_failure;
}

Severity severity_from_string(const std::string& s) {
  if (s == "critical") return Severity::critical;
  if (s == "warning") return Severity::warning;
  return Severity::info;
}

// Progress handler: non-zero aborts the running statement with SQLITE_INTERRUPT.
int deadline_progress(void* arg) {
  const auto* deadline = static_cast<const Deadline*>(arg);
  return deadline_passed(*deadline) ? 1 : 0;
}

}  // namespace

struct SqliteStorage::Impl {
  sqlite3* db{nullptr};
  mutable std::mutex mu;
  Deadline current_deadline{no_deadline()};

  std::string last_error() const {
    return db ? std::string(sqlite3_errmsg(db)) : std::string("database not open");
  }

  // Caller holds mu.
  void arm(Deadline d) { current_deadline = d; }
  void disarm() { current_deadline = no_deadline(); }
};

SqliteStorage::SqliteStorage(std::string path)
    : path_(std::move(path)), impl_(std::make_unique<Impl>()) {}

SqliteStorage::~SqliteStorage() { close(); }

StorageStatus SqliteStorage::init() {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (impl_->db) return StorageStatus{true, ""};

  int rc = sqlite3_open(path_.c_str(), &impl_->db);
  if (rc != SQLITE_OK) {
    std::string err = impl_->last_error();
    sqlite3_close(impl_->db);
    impl_->db = nullptr;
    return StorageStatus{false, "sqlite open failed: " + err};
  }

  char* err_msg = nullptr;
  rc = sqlite3_exec(impl_->db, kSchema, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string err = err_msg ? err_msg : "schema creation failed";
    sqlite3_free(err_msg);
    sqlite3_close(impl_->db);
    impl_->db = nullptr;
    return StorageStatus{false, "sqlite schema: " + err};
  }

  sqlite3_exec(impl_->db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
  sqlite3_exec(impl_->db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
  sqlite3_busy_timeout(impl_->db, 2000);
  sqlite3_progress_handler(impl_->db, 1000, deadline_progress, &impl_->current_deadline);
  return StorageStatus{true, ""};
}

void SqliteStorage::close() {
  if (!impl_) return;
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (impl_->db) {
    sqlite3_close(impl_->db);
    impl_->db = nullptr;
  }
}

StorageStatus SqliteStorage::register_connection(const ResourceDefinition& definition,
                                                 Deadline deadline) {
  if (definition.logical_name.empty()) return StorageStatus{false, "logical name is empty"};
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->db) return StorageStatus{false, "database not open"};
  if (deadline_passed(deadline)) return StorageStatus{false, "deadline exceeded"};

  const char* sql =
      "INSERT INTO connections (logical_name, protocol, address, encrypted_credentials, "
      "required_permission) VALUES (?, ?, ?, ?, ?) "
      "ON CONFLICT(logical_name) DO UPDATE SET protocol = excluded.protocol, "
      "address = excluded.address, encrypted_credentials = excluded.encrypted_credentials, "
      "required_permission = excluded.required_permission;";

  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return StorageStatus{false, "sqlite prepare: " + impl_->last_error()};
  }

  const std::string policy = encode_policy(definition.policy);
  const auto& c = definition.connection;
  sqlite3_bind_text(stmt, 1, definition.logical_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, c.protocol.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, c.address.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, c.credential_ref.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, policy.c_str(), -1, SQLITE_TRANSIENT);

  impl_->arm(deadline);
  const int rc = sqlite3_step(stmt);
  impl_->disarm();
  sqlite3_finalize(stmt);

  if (rc == SQLITE_INTERRUPT) return StorageStatus{false, "deadline exceeded"};
  if (rc != SQLITE_DONE) return StorageStatus{false, "sqlite upsert: " + impl_->last_error()};
  return StorageStatus{true, ""};
}

LookupResult SqliteStorage::get_connection(const std::string& logical_name, Deadline deadline) {
  LookupResult r;
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->db) {
    r.error = "database not open";
    return r;
  }
  if (deadline_passed(deadline)) {
    r.error = "deadline exceeded";
    return r;
  }

  const char* sql =
      "SELECT protocol, address, encrypted_credentials, required_permission "
      "FROM connections WHERE logical_name = ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    r.error = "sqlite prepare: " + impl_->last_error();
    return r;
  }
  sqlite3_bind_text(stmt, 1, logical_name.c_str(), -1, SQLITE_TRANSIENT);

  impl_->arm(deadline);
  const int rc = sqlite3_step(stmt);
  impl_->disarm();

  if (rc == SQLITE_ROW) {
    ResourceDefinition def;
    def.logical_name              = logical_name;
    def.connection.protocol       = column_text(stmt, 0);
    def.connection.address        = column_text(stmt, 1);
    def.connection.credential_ref = column_text(stmt, 2);

    auto decoded = decode_policy(column_text(stmt, 3));
    if (decoded.ok) {
      def.policy = std::move(decoded.policy);
    } else {
      def.policy = BooleanPolicy{PolicyNode{UnknownOperator{"undecodable: " + decoded.error}}};
    }
    r.ok         = true;
    r.definition = std::move(def);
  } else if (rc == SQLITE_DONE) {
    r.ok = true;
  } else if (rc == SQLITE_INTERRUPT) {
    r.error = "deadline exceeded";
  } else {
    r.error = "sqlite select: " + impl_->last_error();
  }
  sqlite3_finalize(stmt);
  return r;
}

StorageStatus SqliteStorage::log_event(const AuditEvent& event, Deadline deadline) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->db) return StorageStatus{false, "database not open"};
  if (deadline_passed(deadline)) return StorageStatus{false, "deadline exceeded"};

  const char* sql =
      "INSERT INTO audit_logs (seq, prev_digest, trace_id, timestamp_unix_ms, type, "
      "severity, reason, user_id, resource) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return StorageStatus{false, "sqlite prepare: " + impl_->last_error()};
  }

  const std::string type     = to_string(event.kind);
  const std::string severity = to_string(event.severity);
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(event.sequence));
  sqlite3_bind_text(stmt, 2, event.previous_digest.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(event.timestamp_unix_ms));
  sqlite3_bind_text(stmt, 5, type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, severity.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, event.reason.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, event.caller_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 9, event.resource.c_str(), -1, SQLITE_TRANSIENT);

  impl_->arm(deadline);
  const int rc = sqlite3_step(stmt);
  impl_->disarm();
  sqlite3_finalize(stmt);

  if (rc == SQLITE_INTERRUPT) return StorageStatus{false, "deadline exceeded"};
  if (rc != SQLITE_DONE) return StorageStatus{false, "sqlite insert: " + impl_->last_error()};
  return StorageStatus{true, ""};
}

std::vector<AuditEvent> SqliteStorage::read_audit_log(std::size_t limit) const {
  std::vector<AuditEvent> out;
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->db) return out;

  const char* sql =
      "SELECT seq, prev_digest, trace_id, timestamp_unix_ms, type, severity, reason, "
      "user_id, resource FROM audit_logs ORDER BY id DESC LIMIT ?;";
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return out;
  sqlite3_bind_int64(stmt, 1, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  while (sqlite3_step(stmt) == SQLITE_ROW) {
    AuditEvent e;
    e.sequence          = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    e.previous_digest   = column_text(stmt, 1);
    e.trace_id          = column_text(stmt, 2);
    e.timestamp_unix_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    e.kind              = kind_from_string(column_text(stmt, 4));
    e.severity          = severity_from_string(column_text(stmt, 5));
    e.reason            = column_text(stmt, 6);
    e.caller_id         = column_text(stmt, 7);
    e.resource          = column_text(stmt, 8);
    out.push_back(std::move(e));
  }
  sqlite3_finalize(stmt);
  return out;
}

}  // namespace warden
