#include <conduit/storage/overlay.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <conduit/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using conduit::testing::make_db_path;
using conduit::testing::make_hash;
using conduit::testing::remove_path;
using conduit::testing::scale_encoder_t;

conduit::schema::bytes_t key(const std::string_view text) {
  return conduit::schema::make_bytes(text);
}

conduit::schema::bytes_view_t view(const conduit::schema::bytes_t& bytes) {
  return conduit::schema::make_bytes_view(bytes);
}

}  // namespace

TEST(storage, load_committed_state_is_empty_for_fresh_database) {
  auto db = make_db_path("conduit_storage_fresh");
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  remove_path(db);
}

TEST(storage, commit_persists_writes_and_checkpoint_across_reopen) {
  auto db = make_db_path("conduit_storage_commit");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    auto writes = std::vector<conduit::storage::write_entry_t>{};
    writes.emplace_back(key("A|1"), encoder.encode(uint64_t{11}));
    writes.emplace_back(key("A|2"), encoder.encode(uint64_t{22}));
    storage.commit(writes, conduit::storage::committed_state{
                               .height = 42, .state_root = make_hash(10)});
  }
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, 42);
    EXPECT_EQ(loaded->state_root, make_hash(10));
    EXPECT_EQ(storage.get<uint64_t>(encoder, view(key("A|2"))),
              std::optional<uint64_t>{22});
  }
  remove_path(db);
}

TEST(storage, commit_applies_deletes) {
  auto db = make_db_path("conduit_storage_delete");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view(key("B|1")), uint64_t{1});
    auto writes = std::vector<conduit::storage::write_entry_t>{};
    writes.emplace_back(key("B|1"), std::nullopt);
    storage.commit(writes, conduit::storage::committed_state{
                       .height = 1, .state_root = make_hash(1)});
    EXPECT_FALSE(storage.get_raw(view(key("B|1"))).has_value());
  }
  remove_path(db);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto db = make_db_path("conduit_storage_prefix");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view(key("P|a")), uint64_t{1});
    storage.put(encoder, view(key("P|b")), uint64_t{2});
    storage.put(encoder, view(key("Q|a")), uint64_t{3});

    auto entries = storage.list_by_prefix(view(key("P|")));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, key("P|a"));
    EXPECT_EQ(entries[1].first, key("P|b"));
  }
  remove_path(db);
}

TEST(overlay, reads_fall_through_to_parent_and_storage) {
  auto db = make_db_path("conduit_overlay_layers");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view(key("K|base")), uint64_t{1});

    auto block = conduit::storage::overlay{storage};
    block.put(encoder, view(key("K|block")), uint64_t{2});
    auto tx = conduit::storage::overlay{block};
    tx.put(encoder, view(key("K|tx")), uint64_t{3});

    EXPECT_EQ(tx.get<uint64_t>(encoder, view(key("K|base"))),
              std::optional<uint64_t>{1});
    EXPECT_EQ(tx.get<uint64_t>(encoder, view(key("K|block"))),
              std::optional<uint64_t>{2});
    EXPECT_EQ(tx.get<uint64_t>(encoder, view(key("K|tx"))),
              std::optional<uint64_t>{3});
    EXPECT_FALSE(block.contains(view(key("K|tx"))));
    EXPECT_FALSE(storage.get_raw(view(key("K|block"))).has_value());
  }
  remove_path(db);
}

TEST(overlay, discard_drops_child_writes_and_merge_keeps_them) {
  auto db = make_db_path("conduit_overlay_discard");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    auto block = conduit::storage::overlay{storage};

    {
      auto failed = conduit::storage::overlay{block};
      failed.put(encoder, view(key("T|dropped")), uint64_t{9});
      failed.discard();
      EXPECT_TRUE(failed.empty());
    }
    EXPECT_FALSE(block.contains(view(key("T|dropped"))));

    {
      auto applied = conduit::storage::overlay{block};
      applied.put(encoder, view(key("T|kept")), uint64_t{7});
      applied.merge_into_parent();
    }
    EXPECT_EQ(block.get<uint64_t>(encoder, view(key("T|kept"))),
              std::optional<uint64_t>{7});
    ASSERT_EQ(block.writes().size(), 1u);
    EXPECT_EQ(block.writes()[0].first, key("T|kept"));
  }
  remove_path(db);
}

TEST(overlay, erase_masks_committed_value_in_reads_and_listings) {
  auto db = make_db_path("conduit_overlay_tombstone");
  auto encoder = scale_encoder_t{};
  {
    auto storage =
        conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
            db);
    storage.put(encoder, view(key("L|1")), uint64_t{1});
    storage.put(encoder, view(key("L|2")), uint64_t{2});

    auto state = conduit::storage::overlay{storage};
    state.erase(view(key("L|1")));
    state.put(encoder, view(key("L|3")), uint64_t{3});

    EXPECT_FALSE(state.contains(view(key("L|1"))));
    auto entries = state.list_by_prefix(view(key("L|")));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, key("L|2"));
    EXPECT_EQ(entries[1].first, key("L|3"));

    storage.commit(state.writes(), conduit::storage::committed_state{
                                       .height = 3,
                                       .state_root = make_hash(3)});
    EXPECT_FALSE(storage.get_raw(view(key("L|1"))).has_value());
    EXPECT_TRUE(storage.get_raw(view(key("L|3"))).has_value());
  }
  remove_path(db);
}
