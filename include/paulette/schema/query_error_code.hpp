#pragma once

#include <cstdint>

namespace paulette::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  not_initialized = 4,
  not_for_sale = 5,
  external_call_failed = 6,
};

}  // namespace paulette::schema
