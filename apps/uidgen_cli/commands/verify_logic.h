#pragma once

#include "uidgen/storage/audit_log.h"

#include <iosfwd>
#include <string>

namespace uidgen::cli {

// execute_verify checks that the identifiers recorded under topic are strictly increasing
// and prints a JSON summary to out. Returns 0 when the topic verifies, 1 otherwise.
// A topic with no events verifies, but a warning goes to err since that usually means a
// mistyped topic. Exceptions from the audit log propagate.
// Takes only the IAuditLog interface; no concrete storage headers in this TU.
int execute_verify(const std::string& topic, const storage::IAuditLog& audit_log,
                   std::ostream& out, std::ostream& err);

}  // namespace uidgen::cli
