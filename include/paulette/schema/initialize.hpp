#pragma once
#include <paulette/schema/primitives.hpp>

namespace paulette::schema {

template <uint16_t Version>
struct initialize;

template <>
struct initialize<1> final {
  uint16_t version{1};
  signer_id_t admin{};
  token_id_t token_id{};
  amount_t tax;
};

using initialize_t = initialize<1>;

}  // namespace paulette::schema
