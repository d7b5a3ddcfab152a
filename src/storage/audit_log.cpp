#include "uidgen/storage/audit_log.h"

namespace uidgen::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  topics_.insert(event.topic);
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& topic) const {
  if (topic.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  filtered.reserve(events_.size());
  for (const auto& event : events_) {
    if (event.topic == topic) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

std::vector<std::string> InMemoryAuditLog::list_topics() const {
  return {topics_.begin(), topics_.end()};
}

}  // namespace uidgen::storage
