#pragma once

#include "snowid/generator/id_generator.h"

#include <ostream>

// execute_generate: generate count ids for node_id and write one JSON object
// per line to out. Takes only the generator interface so tests can inject a
// generator driven by a manual clock.
int execute_generate(snowid::generator::IIdGenerator& generator, int node_id, int count,
                     bool pretty, std::ostream& out);
