#pragma once

#include <paulette/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace paulette::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"paulette-offices"};
  std::string version{"0.1.0"};
  uint64_t last_sequence{};
  hash32_t last_state_root{};
  contract_id_t contract_id{};
};

using app_info_t = app_info<1>;

}  // namespace paulette::schema
