#pragma once

#include <cstdint>

// Schema type: query error code.
// Audit workflow: read path failure taxonomy.
namespace vigil::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace vigil::schema
