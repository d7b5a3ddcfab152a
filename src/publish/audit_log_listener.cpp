#include "uidgen/publish/audit_log_listener.h"

#include "uidgen/core/time.h"
#include "uidgen/core/unique_id_json.h"

#include <nlohmann/json.hpp>

namespace uidgen::publish {

AuditLogListener::AuditLogListener(storage::IAuditLog& audit_log, std::string topic,
                                   core::ITimeSource& time_source)
    : audit_log_(audit_log), topic_(std::move(topic)), time_source_(time_source) {}

void AuditLogListener::on_generated(const core::UniqueId& id) {
  const std::string text = id.to_string();

  nlohmann::json payload = core::unique_id_to_json(id);
  payload["unique_id"] = text;

  audit_log_.append({"evt-" + text, topic_, text, payload.dump(),
                     core::to_iso8601(time_source_.now())});
}

}  // namespace uidgen::publish
