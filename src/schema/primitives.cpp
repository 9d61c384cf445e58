#include <paulette/common/critical.hpp>
#include <paulette/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace paulette::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

// Raw input of exactly N bytes is taken verbatim, anything else must be hex.
template <size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view input) {
  auto out = std::array<uint8_t, N>{};
  if (input.size() == N) {
    std::copy_n(std::begin(input), out.size(), std::begin(out));
    return out;
  }
  auto decoded = try_from_hex_internal(input);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    paulette::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_fixed<32>(normalize_hex(bytes));
  if (!hash) {
    paulette::common::critical("invalid 32 byte hash input");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_fixed<32>(normalize_hex(bytes));
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<office_id_t> try_make_office_id(const std::string_view& bytes) {
  return try_make_fixed<16>(normalize_hex(bytes));
}

office_id_t make_office_id(const std::string_view& bytes) {
  auto id = try_make_office_id(bytes);
  if (!id) {
    paulette::common::critical("invalid office id input");
  }
  return *id;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    paulette::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    compact.push_back(ch);
  }

  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto decode_char = [](const char ch) -> std::optional<uint8_t> {
    if (ch >= 'A' && ch <= 'Z') {
      return static_cast<uint8_t>(ch - 'A');
    }
    if (ch >= 'a' && ch <= 'z') {
      return static_cast<uint8_t>(ch - 'a' + 26);
    }
    if (ch >= '0' && ch <= '9') {
      return static_cast<uint8_t>(ch - '0' + 52);
    }
    if (ch == '+') {
      return uint8_t{62};
    }
    if (ch == '/') {
      return uint8_t{63};
    }
    return std::nullopt;
  };

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);

  for (size_t i = 0; i < compact.size(); i += 4) {
    auto v0 = decode_char(compact[i]);
    auto v1 = decode_char(compact[i + 1]);
    if (!v0 || !v1) {
      return std::nullopt;
    }
    auto value = (static_cast<uint32_t>(*v0) << 18u) |
                 (static_cast<uint32_t>(*v1) << 12u);

    auto is_last_chunk = (i + 4) == compact.size();
    auto c2 = compact[i + 2];
    auto c3 = compact[i + 3];
    if (c2 == '=') {
      if (c3 != '=' || !is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      continue;
    }

    auto v2 = decode_char(c2);
    if (!v2) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v2) << 6u;
    if (c3 == '=') {
      if (!is_last_chunk) {
        return std::nullopt;
      }
      out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
      continue;
    }

    auto v3 = decode_char(c3);
    if (!v3) {
      return std::nullopt;
    }
    value |= static_cast<uint32_t>(*v3);
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
  }

  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    paulette::common::critical("invalid base64 input");
  }
  return *decoded;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty() || decimal.size() > 78) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::uint512_t{};
  for (const auto ch : decimal) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    value = (value * 10) + static_cast<unsigned>(ch - '0');
  }
  if (value > boost::multiprecision::uint512_t{
                  std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return amount_t{value};
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::string to_string(const signer_id_t& signer) {
  auto out = std::string{};
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          out = "ed25519:" +
                                to_hex(bytes_view_t{value.public_key.data(), 8});
                        },
                        [&](const secp256k1_signer_id& value) {
                          out = "secp256k1:" +
                                to_hex(bytes_view_t{value.public_key.data(), 8});
                        },
                        [&](const named_signer_t& value) {
                          out = "named:" + to_hex(bytes_view_t{value.data(), 8});
                        }},
             signer);
  return out;
}

}  // namespace paulette::schema
