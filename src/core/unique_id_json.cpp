#include "uidgen/core/unique_id_json.h"

#include <cstdint>

namespace uidgen::core {

nlohmann::json unique_id_to_json(const UniqueId& id) {
  nlohmann::json j;
  j["timestamp"] = id.timestamp();
  j["node_address"] = id.node_address();
  j["sequence"] = id.sequence();
  return j;
}

UniqueId unique_id_from_json(const nlohmann::json& j) {
  return UniqueId{j.at("timestamp").get<std::int64_t>(), j.at("node_address").get<std::int64_t>(),
                  j.at("sequence").get<std::int32_t>()};
}

}  // namespace uidgen::core
