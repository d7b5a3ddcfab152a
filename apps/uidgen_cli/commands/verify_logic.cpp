#include "verify_logic.h"

#include "uidgen/storage/audit_ordering.h"

#include <nlohmann/json.hpp>

#include <ostream>

namespace uidgen::cli {

int execute_verify(const std::string& topic, const storage::IAuditLog& audit_log,
                   std::ostream& out, std::ostream& err) {
  const auto events = audit_log.query(topic);
  if (events.empty()) {
    err << "Warning: no audit events recorded under topic '" << topic << "'\n";
  }
  const auto result = storage::verify_ordering(events);

  nlohmann::json summary;
  summary["topic"] = topic;
  summary["events"] = events.size();
  summary["valid"] = result.valid;
  if (!result.valid) {
    summary["first_invalid_index"] = result.first_invalid_index;
    summary["first_invalid_id"] = events[result.first_invalid_index].unique_id;
    summary["error"] = result.error;
  }

  out << summary.dump(2) << "\n";
  return result.valid ? 0 : 1;
}

}  // namespace uidgen::cli
