#pragma once

#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace paulette::testing {

using scale_encoder_t = paulette::schema::encoding::encoder<
    paulette::schema::encoding::scale_encoder_tag>;

inline paulette::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = paulette::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline paulette::schema::office_id_t make_office_id(const uint8_t seed) {
  auto out = paulette::schema::office_id_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i));
  }
  return out;
}

inline paulette::schema::signer_id_t make_named_signer(const uint8_t seed) {
  auto named = paulette::schema::named_signer_t{};
  named[0] = seed;
  return paulette::schema::signer_id_t{
      std::in_place_type<paulette::schema::named_signer_t>, named};
}

inline paulette::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = paulette::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline paulette::schema::bytes_view_t view(
    const paulette::schema::bytes_t& bytes) {
  return paulette::schema::bytes_view_t{bytes.data(), bytes.size()};
}

template <typename T>
T decode_value(const paulette::schema::bytes_t& bytes) {
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(view(bytes));
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace paulette::testing
