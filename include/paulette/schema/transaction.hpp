#pragma once
#include <paulette/schema/buy_office.hpp>
#include <paulette/schema/initialize.hpp>
#include <paulette/schema/new_office.hpp>
#include <paulette/schema/pay_tax.hpp>
#include <paulette/schema/primitives.hpp>
#include <paulette/schema/revoke_office.hpp>
#include <variant>

namespace paulette::schema {

using transaction_payload_t = std::variant<initialize_t,
                                           new_office_t,
                                           buy_office_t,
                                           pay_tax_t,
                                           revoke_office_t>;

template <uint16_t Version>
struct transaction;

/// `invoker` is the identity the host authenticated for this call. Invoker
/// mode authorizations resolve to it.
template <>
struct transaction<1> final {
  uint16_t version{1};
  signer_id_t invoker{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace paulette::schema
