#pragma once
#include <paulette/schema/authorization.hpp>
#include <cstdint>

// Schema type: admin auth.
// Office workflow: Authorization plus the replay-protection nonce the caller
// expects to consume. Invoker mode always presents nonce 0.
namespace paulette::schema {

template <uint16_t Version>
struct admin_auth;

template <>
struct admin_auth<1> final {
  uint16_t version{1};
  authorization_t authorization{};
  uint64_t nonce{};
};

using admin_auth_t = admin_auth<1>;

}  // namespace paulette::schema
