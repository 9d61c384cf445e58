#include <paulette/execution/staged_state.hpp>
#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
#include <paulette/storage/storage.hpp>
#include <paulette/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using storage_t =
    paulette::storage::storage<paulette::storage::rocksdb_storage_tag>;
using encoder_t = paulette::testing::scale_encoder_t;

using paulette::testing::make_hash;
using paulette::testing::view;

paulette::schema::bytes_t key_of(const std::string& text) {
  return paulette::schema::make_bytes(text);
}

class scratch_db final {
 public:
  explicit scratch_db(const std::string_view prefix)
      : path_{paulette::testing::make_db_path(prefix)} {}
  ~scratch_db() { paulette::testing::remove_path(path_); }

  scratch_db(const scratch_db&) = delete;
  scratch_db& operator=(const scratch_db&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = paulette::storage::committed_state{};
  EXPECT_EQ(committed.sequence, 0u);
  EXPECT_EQ(committed.state_root, paulette::schema::make_zero_hash());

  auto entry = paulette::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, put_get_has_remove) {
  auto db = scratch_db{"paulette_storage_kv"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  auto key = key_of("alpha");

  EXPECT_FALSE(storage.has(view(key)));
  EXPECT_FALSE(storage.get<uint64_t>(encoder, view(key)).has_value());

  storage.put(encoder, view(key), uint64_t{77});
  EXPECT_TRUE(storage.has(view(key)));
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key)), uint64_t{77});

  storage.remove(view(key));
  EXPECT_FALSE(storage.has(view(key)));
}

TEST(storage_types, committed_state_round_trips) {
  auto db = scratch_db{"paulette_storage_committed"};
  {
    auto storage =
        paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
            db.path());
    EXPECT_FALSE(storage.load_committed_state().has_value());
    storage.save_committed_state(paulette::storage::committed_state{
        .sequence = 42, .state_root = make_hash(10)});
  }
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto loaded = storage.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->sequence, 42u);
  EXPECT_EQ(loaded->state_root, make_hash(10));
}

TEST(storage_types, apply_writes_deletes_and_checkpoint_together) {
  auto db = scratch_db{"paulette_storage_apply"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  storage.put(encoder, view(key_of("stale")), uint64_t{1});

  auto writes = std::vector<paulette::storage::pending_write_t>{
      {key_of("fresh"), encoder.encode(uint64_t{2})},
      {key_of("stale"), std::nullopt}};
  storage.apply(writes, paulette::storage::committed_state{
                            .sequence = 3, .state_root = make_hash(1)});

  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key_of("fresh"))),
            uint64_t{2});
  EXPECT_FALSE(storage.has(view(key_of("stale"))));
  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->sequence, 3u);
  EXPECT_EQ(committed->state_root, make_hash(1));
}

TEST(storage_types, apply_without_checkpoint_leaves_it_untouched) {
  auto db = scratch_db{"paulette_storage_apply_plain"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  storage.save_committed_state(
      paulette::storage::committed_state{.sequence = 9, .state_root = {}});
  storage.apply({{key_of("k"), encoder.encode(uint64_t{5})}}, std::nullopt);
  EXPECT_EQ(storage.load_committed_state()->sequence, 9u);
}

TEST(storage_types, list_range_returns_inclusive_bounds_in_order) {
  auto db = scratch_db{"paulette_storage_range"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  storage.put(encoder, view(key_of("office|d")), uint64_t{4});
  storage.put(encoder, view(key_of("office|b")), uint64_t{2});
  storage.put(encoder, view(key_of("office|a")), uint64_t{1});
  storage.put(encoder, view(key_of("office|c")), uint64_t{3});
  storage.put(encoder, view(key_of("nonce|a")), uint64_t{9});

  auto entries = storage.list_range(view(key_of("office|b")),
                                    view(key_of("office|c")), 10);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, key_of("office|b"));
  EXPECT_EQ(entries[1].first, key_of("office|c"));
  EXPECT_EQ(encoder.decode<uint64_t>(view(entries[1].second)), 3u);

  EXPECT_TRUE(storage
                  .list_range(view(key_of("office|e")),
                              view(key_of("office|z")), 10)
                  .empty());
}

TEST(storage_types, list_range_stops_at_limit) {
  auto db = scratch_db{"paulette_storage_range_limit"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  for (auto i = 0; i < 5; ++i) {
    storage.put(encoder, view(key_of("row|" + std::to_string(i))),
                static_cast<uint64_t>(i));
  }

  auto entries =
      storage.list_range(view(key_of("row|0")), view(key_of("row|4")), 3);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[2].first, key_of("row|2"));
  EXPECT_TRUE(
      storage.list_range(view(key_of("row|0")), view(key_of("row|4")), 0)
          .empty());
}

TEST(storage_types, staged_state_reads_through_and_discards_on_drop) {
  auto db = scratch_db{"paulette_storage_staged"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  storage.put(encoder, view(key_of("kept")), uint64_t{1});
  {
    auto state = paulette::execution::staged_state{encoder, storage};
    EXPECT_TRUE(state.empty());
    EXPECT_EQ(state.get<uint64_t>(view(key_of("kept"))), uint64_t{1});

    state.put(view(key_of("kept")), uint64_t{2});
    state.put(view(key_of("added")), uint64_t{3});
    state.remove(view(key_of("kept")));
    EXPECT_FALSE(state.has(view(key_of("kept"))));
    EXPECT_EQ(state.get<uint64_t>(view(key_of("added"))), uint64_t{3});
  }
  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key_of("kept"))), uint64_t{1});
  EXPECT_FALSE(storage.has(view(key_of("added"))));
}

TEST(storage_types, staged_state_commit_lands_every_write) {
  auto db = scratch_db{"paulette_storage_staged_commit"};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db.path());
  auto encoder = encoder_t{};
  storage.put(encoder, view(key_of("gone")), uint64_t{1});

  auto state = paulette::execution::staged_state{encoder, storage};
  state.put(view(key_of("new")), uint64_t{4});
  state.remove(view(key_of("gone")));
  state.commit(paulette::storage::committed_state{.sequence = 1,
                                                  .state_root = make_hash(4)});
  EXPECT_TRUE(state.empty());

  EXPECT_EQ(storage.get<uint64_t>(encoder, view(key_of("new"))), uint64_t{4});
  EXPECT_FALSE(storage.has(view(key_of("gone"))));
  EXPECT_EQ(storage.load_committed_state()->state_root, make_hash(4));
}
