#pragma once

#include <paulette/schema/enum_string.hpp>
#include <paulette/schema/office_record.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: office status.
// Office workflow: Lifecycle state of an office id. Uninitialized and
// "record removed" are the same state.
namespace paulette::schema {

enum class office_status_t : uint8_t {
  uninitialized = 0,
  for_sale = 1,
  bought = 2
};

inline constexpr auto kOfficeStatusMappings = std::array{
    enum_mapping_t<office_status_t>{"uninitialized",
                                    office_status_t::uninitialized},
    enum_mapping_t<office_status_t>{"for_sale", office_status_t::for_sale},
    enum_mapping_t<office_status_t>{"bought", office_status_t::bought}};

template <>
inline std::optional<office_status_t> try_from_string<office_status_t>(
    const std::string_view value) {
  return from_string(value, kOfficeStatusMappings);
}

inline constexpr std::string_view to_string(const office_status_t value) {
  return to_string(value, kOfficeStatusMappings);
}

inline office_status_t status_of(const std::optional<office_record_t>& record) {
  if (!record) {
    return office_status_t::uninitialized;
  }
  return std::holds_alternative<for_sale_record_t>(*record)
             ? office_status_t::for_sale
             : office_status_t::bought;
}

}  // namespace paulette::schema
