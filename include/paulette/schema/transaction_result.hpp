#pragma once

#include <paulette/schema/primitives.hpp>
#include <paulette/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Office workflow: Outcome envelope of one atomic operation. `code` is 0 or a
// transaction_error_code; `events` is empty unless the operation committed.
namespace paulette::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace paulette::schema
