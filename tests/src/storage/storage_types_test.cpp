#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/ledger_keys.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/storage/storage.hpp>
#include <provenance/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using encoder_t = provenance::schema::encoding::scale_encoder_t;
using provenance::testing::make_db_path;
using provenance::testing::make_hash;
using provenance::testing::remove_path;

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto committed = provenance::storage::committed_state{};
  EXPECT_EQ(committed.total_submissions, 0u);
  EXPECT_EQ(committed.state_root, provenance::schema::make_zero_hash());

  auto entry = provenance::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, committed_state_round_trips_through_batch) {
  auto db = make_db_path("provenance_storage_committed");
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = provenance::storage::committed_state{
        .total_submissions = 42, .state_root = make_hash(10)};
    storage.commit_batch({provenance::storage::make_committed_state_entry(state)});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->total_submissions, state.total_submissions);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  remove_path(db);
}

TEST(storage_types, get_returns_nullopt_for_missing_keys) {
  auto db = make_db_path("provenance_storage_missing");
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = provenance::schema::key::make_submission_key(make_hash(1));
    EXPECT_FALSE(storage
                     .get<provenance::schema::hash32_t>(
                         encoder, provenance::schema::make_bytes_view(key))
                     .has_value());

    storage.put(encoder, provenance::schema::make_bytes_view(key),
                make_hash(2));
    auto loaded = storage.get<provenance::schema::hash32_t>(
        encoder, provenance::schema::make_bytes_view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, make_hash(2));
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_returns_only_that_keyspace_in_order) {
  auto db = make_db_path("provenance_storage_prefix");
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    namespace key = provenance::schema::key;

    // Written out of order; the ordered position encoding restores it.
    storage.commit_batch(std::vector<provenance::storage::key_value_entry_t>{
        provenance::storage::make_entry(encoder, key::make_history_key(300),
                                        make_hash(3)),
        provenance::storage::make_entry(encoder, key::make_history_key(0),
                                        make_hash(1)),
        provenance::storage::make_entry(encoder, key::make_history_key(2),
                                        make_hash(2)),
        provenance::storage::make_entry(
            encoder, key::make_submission_key(make_hash(1)), uint64_t{9})});

    auto rows = storage.list_by_prefix(provenance::schema::make_bytes_view(
        key::make_prefix_key(key::kHistoryKeyPrefix)));
    ASSERT_EQ(rows.size(), 3u);
    auto expected = std::vector{make_hash(1), make_hash(2), make_hash(3)};
    for (std::size_t i = 0; i < rows.size(); ++i) {
      auto value = encoder.try_decode<provenance::schema::hash32_t>(
          provenance::schema::make_bytes_view(rows[i].second));
      ASSERT_TRUE(value.has_value());
      EXPECT_EQ(*value, expected[i]);
    }

    auto submissions = storage.list_by_prefix(provenance::schema::make_bytes_view(
        key::make_prefix_key(key::kSubmissionKeyPrefix)));
    ASSERT_EQ(submissions.size(), 1u);
    EXPECT_EQ(submissions[0].first, key::make_submission_key(make_hash(1)));
  }
  remove_path(db);
}

TEST(storage_types, storage_reopens_with_committed_rows) {
  auto db = make_db_path("provenance_storage_reopen");
  auto encoder = encoder_t{};
  auto key = provenance::schema::key::make_prefix_key(
      provenance::schema::key::kAdminNonceKey);
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, provenance::schema::make_bytes_view(key),
                uint64_t{17});
  }
  {
    auto storage = provenance::storage::make_storage<
        provenance::storage::rocksdb_storage_tag>(db);
    auto nonce = storage.get<uint64_t>(
        encoder, provenance::schema::make_bytes_view(key));
    ASSERT_TRUE(nonce.has_value());
    EXPECT_EQ(*nonce, 17u);
  }
  remove_path(db);
}
