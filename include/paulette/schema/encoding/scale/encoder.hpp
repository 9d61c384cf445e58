#pragma once
#include <paulette/common/critical.hpp>
#include <paulette/schema/encoding/encoder.hpp>
#include <paulette/schema/encoding/scale/admin_auth.hpp>
#include <paulette/schema/encoding/scale/auction_parameters.hpp>
#include <paulette/schema/encoding/scale/authorization.hpp>
#include <paulette/schema/encoding/scale/bought_record.hpp>
#include <paulette/schema/encoding/scale/buy_office.hpp>
#include <paulette/schema/encoding/scale/for_sale_record.hpp>
#include <paulette/schema/encoding/scale/history_entry.hpp>
#include <paulette/schema/encoding/scale/initialize.hpp>
#include <paulette/schema/encoding/scale/new_office.hpp>
#include <paulette/schema/encoding/scale/pay_tax.hpp>
#include <paulette/schema/encoding/scale/primitives.hpp>
#include <paulette/schema/encoding/scale/revoke_office.hpp>
#include <paulette/schema/encoding/scale/transaction.hpp>
#include <paulette/schema/encoding/scale/transaction_event.hpp>
#include <paulette/schema/encoding/scale/transaction_event_attribute.hpp>
#include <paulette/schema/encoding/scale/transaction_result.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace paulette::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  paulette::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, paulette::schema::bytes_t& out);

  template <typename T>
  T decode(const paulette::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const paulette::schema::bytes_view_t& bytes);
};

template <typename T>
paulette::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    paulette::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        paulette::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

/// Decoding untrusted bytes must go through try_decode; decode is for values
/// this process wrote itself and treats corruption as fatal.
template <typename T>
T encoder<scale_encoder_tag>::decode(
    const paulette::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    paulette::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const paulette::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace paulette::schema::encoding
