#pragma once

#include "uidgen/core/listener.h"
#include "uidgen/core/time_source.h"
#include "uidgen/storage/audit_log.h"

#include <string>

namespace uidgen::publish {

// AuditLogListener records every generated identifier as an AuditEvent under one topic.
//
// Event layout:
//   event_id   "evt-{unique_id}"
//   topic      configured topic
//   unique_id  canonical text form
//   payload    {"node_address":..,"sequence":..,"timestamp":..,"unique_id":".."}
//   created_at ISO 8601 UTC instant read from the time source
//
// Holds references (not ownership); the log and time source must outlive the listener.
// Exceptions from IAuditLog::append propagate to the generator's caller.
class AuditLogListener final : public core::IUniqueIdListener {
 public:
  AuditLogListener(storage::IAuditLog& audit_log, std::string topic,
                   core::ITimeSource& time_source);

  void on_generated(const core::UniqueId& id) override;

  [[nodiscard]] const std::string& topic() const { return topic_; }

 private:
  storage::IAuditLog& audit_log_;
  std::string topic_;
  core::ITimeSource& time_source_;
};

}  // namespace uidgen::publish
