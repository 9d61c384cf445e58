#pragma once

#include <paulette/schema/primitives.hpp>
#include <cstdint>

// Schema type: history entry.
// Office workflow: Audit row for each committed operation: sequence, ledger
// time and the encoded transaction.
namespace paulette::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_seconds_t timestamp{};
  uint32_t code{};
  bytes_t tx;
};

using history_entry_t = history_entry<1>;

}  // namespace paulette::schema
