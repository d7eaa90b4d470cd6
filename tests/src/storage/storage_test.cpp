#include <gtest/gtest.h>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/file_lock.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <tally/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace {

using storage_t =
    tally::storage::storage<tally::storage::rocksdb_storage_tag>;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

tally::storage::key_value_entry_t row(const std::string& key,
                                      const std::string& value) {
  return {tally::schema::make_bytes(key), tally::schema::make_bytes(value)};
}

}  // namespace

TEST(storage, put_then_get_round_trips_through_encoder) {
  auto db = tally::testing::make_db_path("tally_storage_put");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = tally::schema::make_bytes(std::string_view{"K"});
    storage.put(encoder, tally::schema::make_bytes_view(key), uint64_t{42});

    auto loaded = storage.get<encoder_t, uint64_t>(
        encoder, tally::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);

    auto missing_key = tally::schema::make_bytes(std::string_view{"missing"});
    EXPECT_FALSE((storage.get<encoder_t, uint64_t>(
                      encoder, tally::schema::make_bytes_view(missing_key)))
                     .has_value());
  }
  tally::testing::remove_path(db);
}

TEST(storage, prefix_listing_respects_bounds_and_direction) {
  auto db = tally::testing::make_db_path("tally_storage_prefix");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto batch = tally::storage::write_batch{};
    batch.puts = {row("A|1", "a1"), row("B|1", "b1"), row("B|2", "b2"),
                  row("B|3", "b3"), row("C|1", "c1")};
    storage.commit(batch);

    auto prefix = tally::schema::make_bytes(std::string_view{"B|"});
    auto forward = storage.list_by_prefix(tally::schema::make_bytes_view(prefix));
    ASSERT_EQ(forward.size(), 3u);
    EXPECT_EQ(tally::schema::make_string(forward.front().second), "b1");

    auto reverse = storage.list_by_prefix_reverse(
        tally::schema::make_bytes_view(prefix), 0);
    ASSERT_EQ(reverse.size(), 3u);
    EXPECT_EQ(tally::schema::make_string(reverse[0].second), "b3");
    EXPECT_EQ(tally::schema::make_string(reverse[2].second), "b1");

    auto limited = storage.list_by_prefix_reverse(
        tally::schema::make_bytes_view(prefix), 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(tally::schema::make_string(limited[1].second), "b2");

    auto last = tally::schema::make_bytes(std::string_view{"C|"});
    auto tail =
        storage.list_by_prefix_reverse(tally::schema::make_bytes_view(last), 0);
    ASSERT_EQ(tail.size(), 1u);
  }
  tally::testing::remove_path(db);
}

TEST(storage, batch_applies_deletes_and_puts_together) {
  auto db = tally::testing::make_db_path("tally_storage_batch");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto first = tally::storage::write_batch{};
    first.puts = {row("X|1", "one"), row("X|2", "two")};
    storage.commit(first);

    auto second = tally::storage::write_batch{};
    second.deletes = {tally::schema::make_bytes(std::string_view{"X|1"})};
    second.puts = {row("X|3", "three")};
    storage.commit(second);

    auto prefix = tally::schema::make_bytes(std::string_view{"X|"});
    auto rows = storage.list_by_prefix(tally::schema::make_bytes_view(prefix));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(tally::schema::make_string(rows[0].first), "X|2");
    EXPECT_EQ(tally::schema::make_string(rows[1].first), "X|3");
  }
  tally::testing::remove_path(db);
}

TEST(storage, read_only_open_of_missing_store_is_empty) {
  auto db = tally::testing::make_db_path("tally_storage_missing");
  auto reader =
      tally::storage::make_read_only_storage<tally::storage::rocksdb_storage_tag>(
          db);
  EXPECT_FALSE(reader.has_value());
}

TEST(storage, read_only_open_sees_committed_data) {
  auto db = tally::testing::make_db_path("tally_storage_reader");
  {
    auto writer =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto batch = tally::storage::write_batch{};
    batch.puts = {row("R|1", "r1")};
    writer.commit(batch);
  }
  {
    auto reader = tally::storage::make_read_only_storage<
        tally::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(reader.has_value());
    auto prefix = tally::schema::make_bytes(std::string_view{"R|"});
    EXPECT_EQ(reader->list_by_prefix(tally::schema::make_bytes_view(prefix)).size(),
              1u);
  }
  tally::testing::remove_path(db);
}

TEST(file_lock, second_holder_waits_for_release) {
  auto path = tally::testing::make_db_path("tally_file_lock") + ".lock";
  auto acquired = std::atomic<bool>{false};
  auto waiter = std::thread{};
  {
    auto held = tally::storage::file_lock{path};
    waiter = std::thread{[&] {
      auto second = tally::storage::file_lock{path};
      acquired = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());
  }
  waiter.join();
  EXPECT_TRUE(acquired.load());
  tally::testing::remove_path(path);
}

TEST(file_lock, shared_holders_coexist_and_block_a_writer) {
  auto store = tally::testing::make_db_path("tally_file_lock_shared");
  auto path = tally::storage::lock_path_for(store);
  EXPECT_EQ(path, store + ".lock");

  auto acquired = std::atomic<bool>{false};
  auto writer = std::thread{};
  {
    auto first =
        tally::storage::file_lock{path, tally::storage::lock_mode_t::shared};
    auto second =
        tally::storage::file_lock{path, tally::storage::lock_mode_t::shared};
    EXPECT_EQ(second.mode(), tally::storage::lock_mode_t::shared);
    writer = std::thread{[&] {
      auto exclusive = tally::storage::file_lock{path};
      acquired = true;
    }};
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());
  }
  writer.join();
  EXPECT_TRUE(acquired.load());
  tally::testing::remove_path(path);
}
