#pragma once

#include <paulette/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Office workflow: Read API envelope carrying a SCALE encoded value, the key
// echo and error metadata.
namespace paulette::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  uint64_t sequence{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace paulette::schema
