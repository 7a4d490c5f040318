#include <rndr/schema/encoding/scale/encoder.hpp>
#include <rndr/storage/rocksdb/storage.hpp>
#include <rndr/storage/storage.hpp>
#include <rndr/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using encoder_t = rndr::schema::encoding::encoder<
    rndr::schema::encoding::scale_encoder_tag>;

rndr::schema::bytes_t make_key(const std::string& text) {
  return rndr::schema::make_bytes(text);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = rndr::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);

  auto entry = rndr::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, fresh_database_has_no_checkpoint) {
  auto db = rndr::testing::make_db_path("rndr_storage_fresh");
  {
    auto storage =
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    auto key = make_key("missing");
    EXPECT_FALSE(
        storage.get_raw(rndr::schema::bytes_view_t{key.data(), key.size()})
            .has_value());
  }
  rndr::testing::remove_path(db);
}

TEST(storage_types, commit_block_applies_rows_and_checkpoint_together) {
  auto db = rndr::testing::make_db_path("rndr_storage_commit");
  {
    auto encoder = encoder_t{};
    auto storage =
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(db);
    auto kept = make_key("row|kept");
    auto dropped = make_key("row|dropped");
    storage.put(encoder, rndr::schema::bytes_view_t{dropped.data(),
                                                     dropped.size()},
                uint64_t{9});

    auto writes = std::vector<rndr::storage::write_entry_t>{
        {kept, encoder.encode(uint64_t{42})}, {dropped, std::nullopt}};
    storage.commit_block(
        writes, rndr::storage::committed_state{
                    .height = 5, .state_root = rndr::testing::make_hash(3)});

    auto value = storage.get<uint64_t>(
        encoder, rndr::schema::bytes_view_t{kept.data(), kept.size()});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42u);
    EXPECT_FALSE(storage
                     .get_raw(rndr::schema::bytes_view_t{dropped.data(),
                                                         dropped.size()})
                     .has_value());

    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 5);
    EXPECT_EQ(committed->state_root, rndr::testing::make_hash(3));
  }
  rndr::testing::remove_path(db);
}

TEST(storage_types, committed_state_survives_reopen) {
  auto db = rndr::testing::make_db_path("rndr_storage_reopen");
  {
    auto storage =
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(db);
    storage.commit_block({}, rndr::storage::committed_state{
                                 .height = 42,
                                 .state_root = rndr::testing::make_hash(10)});
  }
  {
    auto storage =
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->state_root, rndr::testing::make_hash(10));
  }
  rndr::testing::remove_path(db);
}

TEST(storage_types, list_by_prefix_returns_only_matching_keys_in_order) {
  auto db = rndr::testing::make_db_path("rndr_storage_prefix");
  {
    auto encoder = encoder_t{};
    auto storage =
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(db);
    auto writes = std::vector<rndr::storage::write_entry_t>{
        {make_key("BAL|a|2"), encoder.encode(uint64_t{2})},
        {make_key("BAL|a|1"), encoder.encode(uint64_t{1})},
        {make_key("BAL|b|1"), encoder.encode(uint64_t{3})},
        {make_key("ALW|a|1"), encoder.encode(uint64_t{4})}};
    storage.commit_block(writes, rndr::storage::committed_state{
                                     .height = 1,
                                     .state_root = rndr::testing::make_hash(1)});

    auto prefix = make_key("BAL|a|");
    auto entries = storage.list_by_prefix(
        rndr::schema::bytes_view_t{prefix.data(), prefix.size()});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, make_key("BAL|a|1"));
    EXPECT_EQ(entries[1].first, make_key("BAL|a|2"));

    auto none = make_key("NONE|");
    EXPECT_TRUE(storage
                    .list_by_prefix(
                        rndr::schema::bytes_view_t{none.data(), none.size()})
                    .empty());
  }
  rndr::testing::remove_path(db);
}
