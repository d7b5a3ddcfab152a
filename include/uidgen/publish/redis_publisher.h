#pragma once

#include "uidgen/core/listener.h"
#include "uidgen/publish/redis_config.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace uidgen::publish {

// RedisPublisher PUBLISHes the canonical text form of every generated identifier on a
// Redis channel, so downstream consumers can subscribe to the id stream.
//
// Publishing is synchronous, inside generate(). A Redis error while publishing
// propagates to the generator's caller as a std::exception.
class RedisPublisher final : public core::IUniqueIdListener {
 public:
  // Connects to config and sends PING.
  // Throws std::runtime_error if the connection fails.
  RedisPublisher(const RedisConfig& config, std::string channel);

  ~RedisPublisher() override;

  // Disable copy/move (unique_ptr to connection)
  RedisPublisher(const RedisPublisher&) = delete;
  RedisPublisher& operator=(const RedisPublisher&) = delete;
  RedisPublisher(RedisPublisher&&) = delete;
  RedisPublisher& operator=(RedisPublisher&&) = delete;

  void on_generated(const core::UniqueId& id) override;

  [[nodiscard]] const std::string& channel() const { return channel_; }
  // Number of identifiers published so far.
  [[nodiscard]] long long published() const { return published_; }
  // Total subscriber deliveries reported by Redis across all PUBLISH calls.
  [[nodiscard]] long long deliveries() const { return deliveries_; }

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
  std::string channel_;
  long long published_{0};
  long long deliveries_{0};
};

}  // namespace uidgen::publish
