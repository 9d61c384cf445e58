#pragma once
#include <paulette/schema/admin_auth.hpp>
#include <paulette/schema/auction_parameters.hpp>
#include <paulette/schema/primitives.hpp>

namespace paulette::schema {

template <uint16_t Version>
struct revoke_office;

template <>
struct revoke_office<1> final {
  uint16_t version{1};
  admin_auth_t auth{};
  office_id_t office_id{};
  auction_id_t auction_id{};
  auction_parameters_t auction{};
};

using revoke_office_t = revoke_office<1>;

}  // namespace paulette::schema
