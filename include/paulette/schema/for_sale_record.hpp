#pragma once
#include <paulette/schema/primitives.hpp>

// Schema type: for sale record.
// Office workflow: Office awaiting purchase through the referenced auction.
namespace paulette::schema {

template <uint16_t Version>
struct for_sale_record;

template <>
struct for_sale_record<1> final {
  uint16_t version{1};
  auction_id_t auction_id{};
};

using for_sale_record_t = for_sale_record<1>;

}  // namespace paulette::schema
