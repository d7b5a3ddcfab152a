#include "uidgen/core/time_source.h"

namespace uidgen::core {

Timestamp SystemTimeSource::now() {
  return Clock::now();
}

Timestamp FixedTimeSource::now() {
  return fixed_time_;
}

}  // namespace uidgen::core
