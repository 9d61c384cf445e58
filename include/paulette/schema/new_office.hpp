#pragma once
#include <paulette/schema/admin_auth.hpp>
#include <paulette/schema/auction_parameters.hpp>
#include <paulette/schema/primitives.hpp>

namespace paulette::schema {

template <uint16_t Version>
struct new_office;

template <>
struct new_office<1> final {
  uint16_t version{1};
  admin_auth_t auth{};
  office_id_t office_id{};
  auction_id_t auction_id{};
  auction_parameters_t auction{};
};

using new_office_t = new_office<1>;

}  // namespace paulette::schema
