#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace paulette::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using office_id_t = std::array<uint8_t, 16>;
using auction_id_t = hash32_t;
using token_id_t = hash32_t;
using contract_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

/// Office ids are accepted as 32 hex digits (optionally 0x-prefixed) or as
/// exactly 16 raw bytes.
std::optional<office_id_t> try_make_office_id(const std::string_view& bytes);
office_id_t make_office_id(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

/// Decimal text form used on the wire and on the command line.
std::optional<amount_t> try_make_amount(const std::string_view decimal);
std::string to_string(const amount_t& amount);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  auto operator<=>(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  auto operator<=>(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;  // Contract or on-ledger identity reference
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Short printable form for logs: kind prefix plus leading key bytes.
std::string to_string(const signer_id_t& signer);

}  // namespace paulette::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
