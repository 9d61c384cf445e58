#pragma once
#include <paulette/schema/primitives.hpp>

namespace paulette::schema {

template <uint16_t Version>
struct buy_office;

template <>
struct buy_office<1> final {
  uint16_t version{1};
  office_id_t office_id{};
  signer_id_t buyer{};
};

using buy_office_t = buy_office<1>;

}  // namespace paulette::schema
