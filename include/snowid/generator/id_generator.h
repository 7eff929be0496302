#pragma once

#include "snowid/core/id.h"

namespace snowid::generator {

// Abstract ID generator interface for dependency injection.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate the next ID for node_id.
  // Precondition: core::is_valid_node_id(node_id). Implementations treat a
  // violation as a programming error and terminate the process.
  virtual core::SnowflakeId generate(int node_id) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

}  // namespace snowid::generator
