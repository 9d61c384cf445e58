#pragma once
#include <paulette/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace paulette::storage {

using key_value_entry_t =
    std::pair<paulette::schema::bytes_t, paulette::schema::bytes_t>;

/// A staged mutation. An empty value deletes the key.
using pending_write_t = std::pair<paulette::schema::bytes_t,
                                  std::optional<paulette::schema::bytes_t>>;

/// Last committed ledger checkpoint persisted by the storage backend.
struct committed_state final {
  uint64_t sequence{};
  paulette::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const paulette::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const paulette::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<paulette::schema::bytes_t> get_raw(
      const paulette::schema::bytes_view_t& key) const;

  bool has(const paulette::schema::bytes_view_t& key) const;

  void remove(const paulette::schema::bytes_view_t& key) const;

  /// Apply every write, and optionally the new checkpoint, in one atomic
  /// batch. Nothing is visible to readers until the batch lands.
  void apply(const std::vector<pending_write_t>& writes,
             const std::optional<committed_state>& checkpoint) const;

  /// Load the most recent committed checkpoint (sequence + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (sequence + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Key-value pairs with `first <= key <= last`, in key order, stopping
  /// after `limit` entries.
  std::vector<key_value_entry_t> list_range(
      const paulette::schema::bytes_view_t& first,
      const paulette::schema::bytes_view_t& last,
      std::size_t limit) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace paulette::storage
