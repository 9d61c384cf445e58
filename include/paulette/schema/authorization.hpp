#pragma once
#include <paulette/schema/primitives.hpp>
#include <variant>

// Schema type: authorization.
// Office workflow: Proof attached to administrator-gated calls. Invoker mode
// authorizes as the transaction invoker; signed mode carries an explicit
// signer and a signature over the call's signing payload.
namespace paulette::schema {

struct invoker_authorization_t final {
  bool operator==(const invoker_authorization_t&) const = default;
};

template <uint16_t Version>
struct signed_authorization;

template <>
struct signed_authorization<1> final {
  uint16_t version{1};
  signer_id_t signer{};
  signature_t signature{};
};

using signed_authorization_t = signed_authorization<1>;
using authorization_t =
    std::variant<invoker_authorization_t, signed_authorization_t>;

}  // namespace paulette::schema
