#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <paulette/common/critical.hpp>
#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace paulette::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const paulette::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline paulette::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const paulette::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const paulette::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<paulette::schema::bytes_t> get_raw(
      const paulette::schema::bytes_view_t& key) const;
  bool has(const paulette::schema::bytes_view_t& key) const;
  void remove(const paulette::schema::bytes_view_t& key) const;
  void apply(const std::vector<pending_write_t>& writes,
             const std::optional<committed_state>& checkpoint) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_range(
      const paulette::schema::bytes_view_t& first,
      const paulette::schema::bytes_view_t& last,
      std::size_t limit) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const paulette::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      paulette::schema::bytes_view_t{raw->data(), raw->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const paulette::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    paulette::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(paulette::schema::bytes_view_t{encoded_value.data(),
                                                      encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    paulette::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace paulette::storage
