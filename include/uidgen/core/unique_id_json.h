#pragma once

#include "uidgen/core/unique_id.h"

#include <nlohmann/json.hpp>

namespace uidgen::core {

/// Serialize UniqueId to JSON: {"node_address": .., "sequence": .., "timestamp": ..}
[[nodiscard]] nlohmann::json unique_id_to_json(const UniqueId& id);

/// Deserialize UniqueId from JSON.
/// Throws nlohmann::json::exception if a field is missing or has the wrong type.
[[nodiscard]] UniqueId unique_id_from_json(const nlohmann::json& j);

}  // namespace uidgen::core
