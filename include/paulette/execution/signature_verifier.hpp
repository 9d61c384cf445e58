#pragma once

#include <paulette/schema/primitives.hpp>
#include <functional>

namespace paulette::execution {

/// Checks `signature` over the admin signing digest for `signer`.
using signature_verifier_t =
    std::function<bool(const paulette::schema::bytes_view_t& message,
                       const paulette::schema::signer_id_t& signer,
                       const paulette::schema::signature_t& signature)>;

}  // namespace paulette::execution
