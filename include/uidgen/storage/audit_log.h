#pragma once

#include "uidgen/storage/audit_event.h"

#include <set>
#include <string>
#include <vector>

namespace uidgen::storage {

// Default topic under which generated identifiers are recorded and published.
inline constexpr const char* kDefaultAuditTopic = "uuid-audit-log";

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  // Implementations backed by storage throw std::runtime_error when an operation fails,
  // including a duplicate event_id on append.
  virtual void append(const AuditEvent& event) = 0;
  // Events recorded under topic, in append order.
  // An empty topic returns every event; append order is preserved within each topic.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& topic) const = 0;
  // Distinct topics present in this log, sorted.
  [[nodiscard]] virtual std::vector<std::string> list_topics() const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& topic) const override;
  [[nodiscard]] std::vector<std::string> list_topics() const override;

 private:
  std::vector<AuditEvent> events_;
  std::set<std::string> topics_;
};

}  // namespace uidgen::storage
