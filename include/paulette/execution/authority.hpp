#pragma once

#include <paulette/execution/operation_error.hpp>
#include <paulette/execution/signature_verifier.hpp>
#include <paulette/execution/staged_state.hpp>
#include <paulette/schema/authorization.hpp>
#include <paulette/schema/new_office.hpp>
#include <paulette/schema/primitives.hpp>
#include <paulette/schema/revoke_office.hpp>
#include <string_view>

// Administrator authentication and per-identity replay protection.
namespace paulette::execution {

inline constexpr std::string_view kAdminSigningDomain{"paulette.admin.v1"};

/// Identity an authorization speaks for: the host-authenticated invoker in
/// invoker mode, the embedded signer in signed mode.
paulette::schema::signer_id_t resolve_signer(
    const paulette::schema::signer_id_t& invoker,
    const paulette::schema::authorization_t& authorization);

/// Digest a signed admin call commits to:
/// blake3(SCALE(tuple{domain, contract_id, operation, nonce, arguments})).
paulette::schema::hash32_t make_signing_digest(
    staged_state::encoder_t& encoder,
    const paulette::schema::contract_id_t& contract_id,
    std::string_view operation,
    uint64_t nonce,
    const paulette::schema::bytes_t& arguments);

paulette::schema::hash32_t make_signing_digest(
    staged_state::encoder_t& encoder,
    const paulette::schema::contract_id_t& contract_id,
    const paulette::schema::new_office_t& call);

paulette::schema::hash32_t make_signing_digest(
    staged_state::encoder_t& encoder,
    const paulette::schema::contract_id_t& contract_id,
    const paulette::schema::revoke_office_t& call);

/// Fails `unauthorized` unless the resolved signer is `admin`. In signed mode
/// the signature over `digest` is checked next when `verifier` is set;
/// failure is `signature_verification_failed`.
operation_status_t check_admin(
    const paulette::schema::signer_id_t& admin,
    const paulette::schema::signer_id_t& invoker,
    const paulette::schema::authorization_t& authorization,
    const paulette::schema::hash32_t& digest,
    const signature_verifier_t& verifier);

/// Stored nonce for `signer`, zero when none has been consumed.
uint64_t stored_nonce(const staged_state& state,
                      const paulette::schema::signer_id_t& signer);

/// Invoker mode requires nonce 0 and leaves state untouched. Signed mode
/// requires the stored nonce and stages its successor.
operation_status_t verify_and_consume_nonce(
    staged_state& state,
    const paulette::schema::signer_id_t& invoker,
    const paulette::schema::authorization_t& authorization,
    uint64_t supplied_nonce);

}  // namespace paulette::execution
