#pragma once
#include <paulette/schema/primitives.hpp>

// Schema type: auction parameters.
// Office workflow: Dutch auction curve handed to the external auction module
// when an office is listed.
namespace paulette::schema {

template <uint16_t Version>
struct auction_parameters;

template <>
struct auction_parameters<1> final {
  uint16_t version{1};
  amount_t start_price;
  amount_t min_price;
  amount_t slope;
};

using auction_parameters_t = auction_parameters<1>;

}  // namespace paulette::schema
