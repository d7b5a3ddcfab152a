#include "uidgen/core/uuid_generator.h"

#include "uidgen/core/node_address.h"
#include "uidgen/core/time.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace uidgen::core {

UuidGenerator::UuidGenerator(const GeneratorOptions& options)
    : time_source_(options.time_source != nullptr ? options.time_source : &system_time_source_),
      listener_(options.listener),
      node_address_(options.node_address.has_value() ? options.node_address.value()
                                                     : resolve_default_node_address()) {
  if (options.resume_after.has_value()) {
    last_timestamp_ = options.resume_after->timestamp();
    sequence_ = options.resume_after->sequence();
  }
}

UniqueId UuidGenerator::generate() {
  const std::int64_t timestamp = to_ticks(time_source_->now());

  if (timestamp == last_timestamp_) {
    if (sequence_ == std::numeric_limits<std::int32_t>::max()) {
      throw std::overflow_error("Sequence numbers exhausted for tick " +
                                std::to_string(timestamp));
    }
    ++sequence_;
  } else {
    sequence_ = 0;
  }
  last_timestamp_ = timestamp;

  const UniqueId id{timestamp, node_address_, sequence_};
  if (listener_ != nullptr) {
    listener_->on_generated(id);
  }
  return id;
}

}  // namespace uidgen::core
