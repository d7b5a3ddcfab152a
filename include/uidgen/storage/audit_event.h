#pragma once

#include <string>

namespace uidgen::storage {

// AuditEvent records one generated identifier under a topic.
// unique_id holds the canonical text form; payload holds the JSON rendering.
struct AuditEvent {
  std::string event_id;    // NOLINT(readability-identifier-naming)
  std::string topic;       // NOLINT(readability-identifier-naming)
  std::string unique_id;   // NOLINT(readability-identifier-naming)
  std::string payload;     // NOLINT(readability-identifier-naming)
  std::string created_at;  // NOLINT(readability-identifier-naming)
};

}  // namespace uidgen::storage
