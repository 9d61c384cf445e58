#pragma once
#include <blake3.h>
#include <paulette/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace paulette::blake3 {

/// Incremental BLAKE3 hasher. Used where a digest is built from several
/// pieces, e.g. chaining the ledger state root.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const paulette::schema::bytes_view_t& bytes);

  paulette::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

paulette::schema::hash32_t hash(const std::string_view& str);
paulette::schema::hash32_t hash(const paulette::schema::bytes_view_t& bytes);

}  // namespace paulette::blake3
