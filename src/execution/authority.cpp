#include <paulette/blake3/hash.hpp>
#include <paulette/execution/authority.hpp>
#include <paulette/schema/key/engine_keys.hpp>
#include <string>
#include <tuple>

using namespace paulette::schema;

namespace paulette::execution {

namespace {

template <typename Call>
bytes_t encode_listing_arguments(staged_state::encoder_t& encoder,
                                 const Call& call) {
  return encoder.encode(
      std::tuple{call.office_id, call.auction_id, call.auction});
}

}  // namespace

signer_id_t resolve_signer(const signer_id_t& invoker,
                           const authorization_t& authorization) {
  return std::visit(
      overloaded{[&](const invoker_authorization_t&) { return invoker; },
                 [](const signed_authorization_t& value) {
                   return value.signer;
                 }},
      authorization);
}

hash32_t make_signing_digest(staged_state::encoder_t& encoder,
                             const contract_id_t& contract_id,
                             const std::string_view operation,
                             const uint64_t nonce,
                             const bytes_t& arguments) {
  auto payload = encoder.encode(std::tuple{std::string{kAdminSigningDomain},
                                           contract_id, std::string{operation},
                                           nonce, arguments});
  return paulette::blake3::hash(bytes_view_t{payload.data(), payload.size()});
}

hash32_t make_signing_digest(staged_state::encoder_t& encoder,
                             const contract_id_t& contract_id,
                             const new_office_t& call) {
  return make_signing_digest(encoder, contract_id, "new_office",
                             call.auth.nonce,
                             encode_listing_arguments(encoder, call));
}

hash32_t make_signing_digest(staged_state::encoder_t& encoder,
                             const contract_id_t& contract_id,
                             const revoke_office_t& call) {
  return make_signing_digest(encoder, contract_id, "revoke",
                             call.auth.nonce,
                             encode_listing_arguments(encoder, call));
}

operation_status_t check_admin(const signer_id_t& admin,
                               const signer_id_t& invoker,
                               const authorization_t& authorization,
                               const hash32_t& digest,
                               const signature_verifier_t& verifier) {
  auto signer = resolve_signer(invoker, authorization);
  if (signer != admin) {
    return operation_error{
        .code = transaction_error_code::unauthorized,
        .info = to_string(signer) + " is not the administrator"};
  }

  const auto* signed_auth = std::get_if<signed_authorization_t>(&authorization);
  if (signed_auth == nullptr || !verifier) {
    return std::nullopt;
  }
  if (!verifier(bytes_view_t{digest.data(), digest.size()}, signed_auth->signer,
                signed_auth->signature)) {
    return operation_error{
        .code = transaction_error_code::signature_verification_failed,
        .info = "admin signature does not match signing payload"};
  }
  return std::nullopt;
}

uint64_t stored_nonce(const staged_state& state, const signer_id_t& signer) {
  auto encoder = staged_state::encoder_t{};
  auto key = key::make_nonce_key(encoder, signer);
  return state.get<uint64_t>(bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

operation_status_t verify_and_consume_nonce(staged_state& state,
                                            const signer_id_t& invoker,
                                            const authorization_t& authorization,
                                            const uint64_t supplied_nonce) {
  if (std::holds_alternative<invoker_authorization_t>(authorization)) {
    if (supplied_nonce != 0) {
      return operation_error{
          .code = transaction_error_code::invoker_nonce_mismatch,
          .info = "invoker calls must present nonce 0, got " +
                  std::to_string(supplied_nonce)};
    }
    return std::nullopt;
  }

  auto signer = resolve_signer(invoker, authorization);
  auto expected = stored_nonce(state, signer);
  if (supplied_nonce != expected) {
    return operation_error{
        .code = transaction_error_code::incorrect_nonce,
        .info = "expected nonce " + std::to_string(expected) + ", got " +
                std::to_string(supplied_nonce)};
  }
  auto encoder = staged_state::encoder_t{};
  auto key = key::make_nonce_key(encoder, signer);
  state.put(bytes_view_t{key.data(), key.size()}, expected + 1);
  return std::nullopt;
}

}  // namespace paulette::execution
