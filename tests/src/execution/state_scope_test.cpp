#include <rndr/execution/events.hpp>
#include <rndr/execution/state_scope.hpp>
#include <rndr/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

class state_scope_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = rndr::testing::make_db_path("rndr_state_scope");
    storage_ = std::make_unique<rndr::execution::storage_t>(
        rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(
            db_path_));
  }

  void TearDown() override {
    storage_.reset();
    rndr::testing::remove_path(db_path_);
  }

  rndr::schema::bytes_t key(const std::string& text) {
    return rndr::schema::make_bytes(text);
  }

  std::string db_path_;
  rndr::execution::encoder_t encoder_;
  std::unique_ptr<rndr::execution::storage_t> storage_;
};

}  // namespace

TEST_F(state_scope_test, reads_fall_through_to_committed_storage) {
  storage_->commit_block(
      {{key("a"), encoder_.encode(uint64_t{7})}},
      rndr::storage::committed_state{
          .height = 1, .state_root = rndr::testing::make_hash(1)});

  auto root = rndr::execution::state_scope{encoder_, *storage_};
  auto child = rndr::execution::state_scope{root};
  EXPECT_EQ(child.get<uint64_t>(key("a")).value_or(0), 7u);
  EXPECT_FALSE(child.get<uint64_t>(key("b")).has_value());
}

TEST_F(state_scope_test, child_writes_are_invisible_until_commit) {
  auto root = rndr::execution::state_scope{encoder_, *storage_};
  {
    auto child = rndr::execution::state_scope{root};
    child.put(key("a"), uint64_t{1});
    child.emit(rndr::testing::make_account(1),
               rndr::execution::make_event("noted", {{"k", "v"}}));
    EXPECT_TRUE(child.get<uint64_t>(key("a")).has_value());
    EXPECT_FALSE(root.get<uint64_t>(key("a")).has_value());
  }
  // Dropped without commit.
  EXPECT_FALSE(root.get<uint64_t>(key("a")).has_value());
  EXPECT_TRUE(root.events().empty());

  {
    auto child = rndr::execution::state_scope{root};
    child.put(key("a"), uint64_t{2});
    child.emit(rndr::testing::make_account(1),
               rndr::execution::make_event("noted", {{"k", "v"}}));
    child.commit();
  }
  EXPECT_EQ(root.get<uint64_t>(key("a")).value_or(0), 2u);
  ASSERT_EQ(root.events().size(), 1u);
  EXPECT_EQ(root.events()[0].event.type, "noted");
  EXPECT_EQ(root.events()[0].contract, rndr::testing::make_account(1));
}

TEST_F(state_scope_test, erase_shadows_committed_rows) {
  storage_->commit_block(
      {{key("a"), encoder_.encode(uint64_t{7})}},
      rndr::storage::committed_state{
          .height = 1, .state_root = rndr::testing::make_hash(1)});

  auto root = rndr::execution::state_scope{encoder_, *storage_};
  auto child = rndr::execution::state_scope{root};
  child.erase(key("a"));
  EXPECT_FALSE(child.get_raw(key("a")).has_value());
  EXPECT_TRUE(root.get_raw(key("a")).has_value());
  child.commit();
  EXPECT_FALSE(root.get_raw(key("a")).has_value());

  auto writes = root.take_writes();
  ASSERT_EQ(writes.size(), 1u);
  EXPECT_EQ(writes[0].first, key("a"));
  EXPECT_FALSE(writes[0].second.has_value());

  storage_->commit_block(writes,
                         rndr::storage::committed_state{
                             .height = 2,
                             .state_root = rndr::testing::make_hash(2)});
  auto erased = key("a");
  EXPECT_FALSE(
      storage_
          ->get_raw(rndr::schema::bytes_view_t{erased.data(), erased.size()})
          .has_value());
}

TEST_F(state_scope_test, nested_scopes_fold_outward_one_level_at_a_time) {
  auto root = rndr::execution::state_scope{encoder_, *storage_};
  auto outer = rndr::execution::state_scope{root};
  {
    auto inner = rndr::execution::state_scope{outer};
    inner.put(key("x"), uint64_t{3});
    inner.commit();
  }
  EXPECT_TRUE(outer.get<uint64_t>(key("x")).has_value());
  EXPECT_FALSE(root.get<uint64_t>(key("x")).has_value());
  outer.commit();
  EXPECT_EQ(root.get<uint64_t>(key("x")).value_or(0), 3u);
  EXPECT_TRUE(root.is_root());
  EXPECT_FALSE(outer.is_root());
}
