#pragma once

#include "snowid/core/id.h"

#include <nlohmann/json.hpp>

namespace snowid::codec {

/// Describe an ID as a JSON object:
///   {"id", "text", "unix_millis", "time", "node_id", "sequence"}
/// "unix_millis" and "time" are the generation time (Unix epoch, UTC).
[[nodiscard]] nlohmann::json id_to_json(core::SnowflakeId id);

}  // namespace snowid::codec
