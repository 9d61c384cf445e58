#include <paulette/common/critical.hpp>
#include <paulette/schema/key/engine_keys.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
#include <tuple>

namespace paulette::storage {

namespace {

using encoder_t = paulette::schema::encoding::encoder<
    paulette::schema::encoding::scale_encoder_tag>;

void require_database(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    paulette::common::critical("RocksDB database is not initialized");
  }
}

paulette::schema::bytes_t encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.sequence, state.state_root});
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    paulette::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened ledger store at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<paulette::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const paulette::schema::bytes_view_t& key) const {
  require_database(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    paulette::common::critical("Failed to get value from RocksDB");
  }
  return paulette::schema::bytes_t(std::begin(value), std::end(value));
}

bool storage<rocksdb_storage_tag>::has(
    const paulette::schema::bytes_view_t& key) const {
  return get_raw(key).has_value();
}

void storage<rocksdb_storage_tag>::remove(
    const paulette::schema::bytes_view_t& key) const {
  require_database(database);
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    paulette::common::critical("Failed to delete key from RocksDB");
  }
}

void storage<rocksdb_storage_tag>::apply(
    const std::vector<pending_write_t>& writes,
    const std::optional<committed_state>& checkpoint) const {
  require_database(database);
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        paulette::schema::bytes_view_t{key.data(), key.size()});
    auto status = value.has_value()
                      ? batch.Put(key_slice,
                                  detail::to_slice(paulette::schema::bytes_view_t{
                                      value->data(), value->size()}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      paulette::common::critical("failed staging write batch entry");
    }
  }
  if (checkpoint) {
    auto encoded = encode_committed_state(*checkpoint);
    auto status = batch.Put(
        std::string{paulette::schema::key::kCommittedStateKey},
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                                 encoded.size()});
    if (!status.ok()) {
      paulette::common::critical("failed staging committed state");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    paulette::common::critical("failed to commit write batch");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_database(database);
  auto committed_raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{paulette::schema::key::kCommittedStateKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    paulette::common::critical("failed to load committed state");
  }

  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, paulette::schema::hash32_t>>(
          paulette::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    paulette::common::critical("failed to decode committed state");
  }
  return committed_state{.sequence = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  apply({}, state);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const paulette::schema::bytes_view_t& first,
    const paulette::schema::bytes_view_t& last,
    const std::size_t limit) const {
  require_database(database);

  auto entries = std::vector<key_value_entry_t>{};
  if (limit == 0) {
    return entries;
  }
  auto upper = detail::to_slice(last);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(first)); iterator->Valid();
       iterator->Next()) {
    if (iterator->key().compare(upper) > 0) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    if (entries.size() == limit) {
      break;
    }
  }
  if (!iterator->status().ok()) {
    spdlog::error("Range scan failed: {}", iterator->status().ToString());
    paulette::common::critical("failed to scan RocksDB range");
  }
  return entries;
}

}  // namespace paulette::storage
