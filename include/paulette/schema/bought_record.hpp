#pragma once
#include <paulette/schema/primitives.hpp>

// Schema type: bought record.
// Office workflow: Occupied office. `expires_at` only moves forward;
// `last_paid_at` is the purchase time or the latest tax payment.
namespace paulette::schema {

template <uint16_t Version>
struct bought_record;

template <>
struct bought_record<1> final {
  uint16_t version{1};
  signer_id_t holder{};
  timestamp_seconds_t expires_at{};
  timestamp_seconds_t last_paid_at{};
};

using bought_record_t = bought_record<1>;

}  // namespace paulette::schema
