#pragma once

#include <paulette/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: transaction error code.
// Office workflow: Stable numeric failure taxonomy. Every code aborts the
// whole operation; 0 is success.
namespace paulette::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  already_initialized = 10,
  not_initialized = 11,
  unauthorized = 12,
  signature_verification_failed = 13,
  incorrect_nonce = 14,
  invoker_nonce_mismatch = 15,
  duplicate_id = 16,
  not_for_sale = 17,
  not_found = 18,
  bid_rejected = 19,
  not_expired = 20,
  transfer_failed = 21,
  external_call_failed = 22,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    enum_mapping_t<transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    enum_mapping_t<transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    enum_mapping_t<transaction_error_code>{
        "already_initialized", transaction_error_code::already_initialized},
    enum_mapping_t<transaction_error_code>{
        "not_initialized", transaction_error_code::not_initialized},
    enum_mapping_t<transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    enum_mapping_t<transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    enum_mapping_t<transaction_error_code>{
        "incorrect_nonce", transaction_error_code::incorrect_nonce},
    enum_mapping_t<transaction_error_code>{
        "invoker_nonce_mismatch",
        transaction_error_code::invoker_nonce_mismatch},
    enum_mapping_t<transaction_error_code>{
        "duplicate_id", transaction_error_code::duplicate_id},
    enum_mapping_t<transaction_error_code>{
        "not_for_sale", transaction_error_code::not_for_sale},
    enum_mapping_t<transaction_error_code>{
        "not_found", transaction_error_code::not_found},
    enum_mapping_t<transaction_error_code>{
        "bid_rejected", transaction_error_code::bid_rejected},
    enum_mapping_t<transaction_error_code>{
        "not_expired", transaction_error_code::not_expired},
    enum_mapping_t<transaction_error_code>{
        "transfer_failed", transaction_error_code::transfer_failed},
    enum_mapping_t<transaction_error_code>{
        "external_call_failed",
        transaction_error_code::external_call_failed}};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings);
}

}  // namespace paulette::schema
