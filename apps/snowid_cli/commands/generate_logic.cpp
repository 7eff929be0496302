#include "generate_logic.h"

#include "snowid/codec/id_json.h"

int execute_generate(snowid::generator::IIdGenerator& generator, const int node_id,
                     const int count, const bool pretty, std::ostream& out) {
  for (int i = 0; i < count; ++i) {
    const auto id = generator.generate(node_id);
    out << snowid::codec::id_to_json(id).dump(pretty ? 2 : -1) << "\n";
  }
  return 0;
}
