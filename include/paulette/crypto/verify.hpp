#pragma once

#include <paulette/schema/primitives.hpp>

namespace paulette::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for `signer`. Named signers have no key
/// material and never verify. A signature of the wrong scheme for the signer
/// is rejected.
bool verify_signature(const paulette::schema::bytes_view_t& message,
                      const paulette::schema::signer_id_t& signer,
                      const paulette::schema::signature_t& signature);

}  // namespace paulette::crypto
