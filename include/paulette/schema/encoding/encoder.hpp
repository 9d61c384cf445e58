#pragma once
#include <paulette/schema/primitives.hpp>
#include <optional>
#include <span>

namespace paulette::schema::encoding {

/// Encoder front end selected at build time through a library tag.
/// Storage values, keys, transactions and signing payloads all go through
/// the same specialization so their byte layouts agree.
template <typename Library>
struct encoder {
  template <typename T>
  paulette::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, paulette::schema::bytes_t& out);

  template <typename T>
  T decode(const paulette::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const paulette::schema::bytes_view_t& bytes);
};

}  // namespace paulette::schema::encoding
