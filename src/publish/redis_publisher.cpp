#include "uidgen/publish/redis_publisher.h"

#include <sw/redis++/redis++.h>

#include <stdexcept>

namespace uidgen::publish {

RedisPublisher::RedisPublisher(const RedisConfig& config, std::string channel)
    : channel_(std::move(channel)) {
  try {
    redis_ = std::make_unique<sw::redis::Redis>(redis_connection_uri(config));
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis at " +
                             redis_config_to_log_string(config) + ": " + e.what());
  }
}

RedisPublisher::~RedisPublisher() = default;

void RedisPublisher::on_generated(const core::UniqueId& id) {
  deliveries_ += redis_->publish(channel_, id.to_string());
  ++published_;
}

}  // namespace uidgen::publish
