#pragma once
#include <paulette/schema/primitives.hpp>

// Schema type: pay tax.
// Office workflow: Renewal payment. The payer need not be the holder; anyone
// may keep an office alive.
namespace paulette::schema {

template <uint16_t Version>
struct pay_tax;

template <>
struct pay_tax<1> final {
  uint16_t version{1};
  office_id_t office_id{};
  signer_id_t payer{};
};

using pay_tax_t = pay_tax<1>;

}  // namespace paulette::schema
