#pragma once

#include "uidgen/storage/audit_event.h"

#include <cstddef>
#include <string>
#include <vector>

namespace uidgen::storage {

// Result of verifying the identifier ordering of an audit topic.
struct OrderingVerificationResult {
  bool valid{false};                  // NOLINT(readability-identifier-naming)
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;                  // NOLINT(readability-identifier-naming)
};

// Verify that the identifiers recorded in a sequence of audit events are well-formed and
// strictly increasing in UniqueId order (which also rules out duplicates).
//
// Events must be in append order (as returned by IAuditLog::query).
//
// Returns:
//   valid == true,  first_invalid_index == events.size()  — every id parses and increases
//   valid == false, first_invalid_index == N              — event N is malformed, repeated,
//                                                           or orders before event N-1
[[nodiscard]] OrderingVerificationResult verify_ordering(const std::vector<AuditEvent>& events);

}  // namespace uidgen::storage
