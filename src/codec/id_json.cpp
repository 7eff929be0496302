#include "snowid/codec/id_json.h"

#include "snowid/codec/codec.h"
#include "snowid/core/time.h"

namespace snowid::codec {

nlohmann::json id_to_json(const core::SnowflakeId id) {
  const core::IdFields fields = core::decompose(id);
  const core::Timestamp created = core::generation_time(id);

  nlohmann::json j;
  j["id"] = id.value;
  j["text"] = encode_to_string(id);
  j["unix_millis"] = core::to_unix_millis(created);
  j["time"] = core::format_iso8601_millis(created);
  j["node_id"] = fields.node_id;
  j["sequence"] = fields.sequence;
  return j;
}

}  // namespace snowid::codec
