#include "uidgen/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uidgen::core {

std::string to_iso8601(const Timestamp ts) {
  const auto time_t_value = Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(ts));

  std::tm utc{};
  if (gmtime_r(&time_t_value, &utc) == nullptr) {
    throw std::runtime_error("Timestamp out of calendar range");
  }

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace uidgen::core
