#include "warden/storage.hpp"

namespace warden {

StorageStatus MemoryStorage::init() { return StorageStatus{true, ""}; }

StorageStatus MemoryStorage::register_connection(const ResourceDefinition& definition,
                                                 Deadline deadline) {
  if (deadline_passed(deadline)) return StorageStatus{false, "deadline exceeded"};
  if (definition.logical_name.empty()) return StorageStatus{false, "logical name is empty"};
  std::lock_guard<std::mutex> lk(mu_);
  connections_.insert_or_assign(definition.logical_name, definition);
  return StorageStatus{true, ""};
}

LookupResult MemoryStorage::get_connection(const std::string& logical_name, Deadline deadline) {
  LookupResult r;
  if (deadline_passed(deadline)) {
    r.error = "deadline exceeded";
    return r;
  }
  std::lock_guard<std::mutex> lk(mu_);
  r.ok = true;
  const auto it = connections_.find(logical_name);
  if (it != connections_.end()) r.definition = it->second;
  return r;
}

StorageStatus MemoryStorage::log_event(const AuditEvent& event, Deadline deadline) {
  if (deadline_passed(deadline)) return StorageStatus{false, "deadline exceeded"};
  std::lock_guard<std::mutex> lk(mu_);
  audit_.push_back(event);
  return StorageStatus{true, ""};
}

void MemoryStorage::close() {}

std::vector<AuditEvent> MemoryStorage::audit_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  return audit_;
}

std::size_t MemoryStorage::connection_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connections_.size();
}

}  // namespace warden
