#pragma once

#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace paulette::execution {

/// Per-operation write overlay on top of committed storage. Reads see staged
/// writes first. Nothing reaches storage until commit(); dropping the overlay
/// discards the operation.
class staged_state final {
 public:
  using encoder_t = paulette::schema::encoding::encoder<
      paulette::schema::encoding::scale_encoder_tag>;
  using storage_t =
      paulette::storage::storage<paulette::storage::rocksdb_storage_tag>;

  staged_state(encoder_t& encoder, const storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  staged_state(const staged_state&) = delete;
  staged_state& operator=(const staged_state&) = delete;

  template <typename T>
  std::optional<T> get(const paulette::schema::bytes_view_t& key) const {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(
        paulette::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const paulette::schema::bytes_view_t& key, const T& value) {
    writes_[paulette::schema::make_bytes(key)] = encoder_.encode(value);
  }

  std::optional<paulette::schema::bytes_t> get_raw(
      const paulette::schema::bytes_view_t& key) const {
    auto staged = writes_.find(paulette::schema::make_bytes(key));
    if (staged != std::end(writes_)) {
      return staged->second;
    }
    return storage_.get_raw(key);
  }

  bool has(const paulette::schema::bytes_view_t& key) const {
    return get_raw(key).has_value();
  }

  void remove(const paulette::schema::bytes_view_t& key) {
    writes_[paulette::schema::make_bytes(key)] = std::nullopt;
  }

  bool empty() const { return writes_.empty(); }

  /// Write all staged mutations, plus the checkpoint when given, in one
  /// atomic batch and clear the overlay.
  void commit(const std::optional<paulette::storage::committed_state>&
                  checkpoint = std::nullopt) {
    auto writes = std::vector<paulette::storage::pending_write_t>{};
    writes.reserve(writes_.size());
    for (auto& [key, value] : writes_) {
      writes.emplace_back(key, std::move(value));
    }
    storage_.apply(writes, checkpoint);
    writes_.clear();
  }

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
  std::map<paulette::schema::bytes_t, std::optional<paulette::schema::bytes_t>>
      writes_;
};

}  // namespace paulette::execution
