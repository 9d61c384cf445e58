#pragma once

#include <paulette/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Office workflow: Canonical key prefixes and key codecs for contract
// configuration, office records, nonces and history.
namespace paulette::schema::key {

inline constexpr std::string_view kAdminKey{"SYS|STATE|ADMIN"};
inline constexpr std::string_view kTokenKey{"SYS|STATE|TOKEN"};
inline constexpr std::string_view kTaxKey{"SYS|STATE|TAX"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kForSaleKeyPrefix{"SYS|STATE|FOR_SALE|"};
inline constexpr std::string_view kBoughtKeyPrefix{"SYS|STATE|BOUGHT|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

template <typename Encoder, typename T>
paulette::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
paulette::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
paulette::schema::bytes_t make_admin_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAdminKey);
}

template <typename Encoder>
paulette::schema::bytes_t make_token_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTokenKey);
}

template <typename Encoder>
paulette::schema::bytes_t make_tax_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTaxKey);
}

template <typename Encoder>
paulette::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const paulette::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
paulette::schema::bytes_t make_for_sale_key(
    Encoder& encoder,
    const paulette::schema::office_id_t& office_id) {
  return make_prefixed_key(encoder, kForSaleKeyPrefix, office_id);
}

template <typename Encoder>
paulette::schema::bytes_t make_bought_key(
    Encoder& encoder,
    const paulette::schema::office_id_t& office_id) {
  return make_prefixed_key(encoder, kBoughtKeyPrefix, office_id);
}

/// History keys encode the sequence big-endian so lexicographic key order is
/// sequence order.
template <typename Encoder>
paulette::schema::bytes_t make_history_key(Encoder& encoder,
                                           const uint64_t sequence) {
  auto big_endian = std::array<uint8_t, 8>{};
  for (size_t i = 0; i < big_endian.size(); ++i) {
    big_endian[i] =
        static_cast<uint8_t>((sequence >> ((big_endian.size() - 1 - i) * 8)) &
                             0xFFu);
  }
  return make_prefixed_key(encoder, kHistoryPrefix, big_endian);
}

template <typename Encoder>
std::optional<uint64_t> parse_history_key(
    Encoder& encoder,
    const paulette::schema::bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kHistoryPrefix);
  if (key.size() != prefix.size() + 8 ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto sequence = uint64_t{};
  for (size_t i = prefix.size(); i < key.size(); ++i) {
    sequence = (sequence << 8u) | key[i];
  }
  return sequence;
}

}  // namespace paulette::schema::key
