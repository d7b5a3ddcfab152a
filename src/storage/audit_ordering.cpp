#include "uidgen/storage/audit_ordering.h"

#include "uidgen/core/result.h"
#include "uidgen/core/unique_id.h"

#include <optional>

namespace uidgen::storage {

OrderingVerificationResult verify_ordering(const std::vector<AuditEvent>& events) {
  std::optional<core::UniqueId> previous;

  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto parsed = core::parse_unique_id(events[i].unique_id);
    if (!parsed.has_value()) {
      return {false, i,
              "malformed unique_id at index " + std::to_string(i) + ": " +
                  core::parse_error_to_string(parsed.error())};
    }

    const core::UniqueId& current = parsed.value();
    if (previous.has_value()) {
      if (current == *previous) {
        return {false, i, "duplicate unique_id at index " + std::to_string(i)};
      }
      if (current < *previous) {
        return {false, i, "unique_id out of order at index " + std::to_string(i)};
      }
    }
    previous = current;
  }

  return {true, events.size(), ""};
}

}  // namespace uidgen::storage
