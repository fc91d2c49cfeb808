#include <sentinel/blake3/hash.hpp>
#include <sentinel/schema/encoding/scale/ledger_rows.hpp>
#include <sentinel/schema/key/ledger_keys.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/storage/storage.hpp>
#include <sentinel/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t =
    sentinel::storage::storage<sentinel::storage::rocksdb_storage_tag>;
using sentinel::testing::make_account;

sentinel::schema::ledger_event_t make_event(
    const sentinel::schema::sequence_t sequence,
    const sentinel::schema::amount_t amount) {
  return sentinel::schema::ledger_event_t{
      .sequence = sequence,
      .kind = sentinel::schema::event_kind_t::mint,
      .actor = make_account(1),
      .counterparty = make_account(2),
      .amount = amount};
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto changeset = sentinel::storage::ledger_changeset{};
  EXPECT_TRUE(changeset.empty());

  auto head = sentinel::schema::event_head{};
  EXPECT_EQ(head.count, 0u);
  EXPECT_EQ(head.digest, sentinel::schema::make_zero_hash());
}

TEST(storage_types, empty_database_reads_as_uninitialized) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_empty");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    EXPECT_FALSE(storage.load_registry().has_value());
    EXPECT_EQ(storage.load_supply(), 0u);
    EXPECT_FALSE(storage.load_balance(make_account(3)).has_value());
    EXPECT_TRUE(storage.list_balances().empty());
    EXPECT_EQ(storage.load_event_head().count, 0u);
    EXPECT_TRUE(storage.load_events(1, 100).empty());
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_types, changeset_applies_registry_supply_and_balances) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_apply");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto record = sentinel::schema::registry_record_t{
        .descriptor = {.name = "Sentinel Dollar",
                       .symbol = "SUSD",
                       .decimals = 6},
        .issuer = make_account(9)};
    auto changeset = sentinel::storage::ledger_changeset{};
    changeset.registry = record;
    changeset.supply = 150;
    changeset.balances.emplace_back(make_account(20), 100);
    changeset.balances.emplace_back(make_account(10), 50);
    storage.apply(changeset);

    auto loaded = storage.load_registry();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->descriptor, record.descriptor);
    EXPECT_EQ(loaded->issuer, record.issuer);
    EXPECT_EQ(storage.load_supply(), 150u);
    EXPECT_EQ(storage.load_balance(make_account(20)).value_or(0), 100u);

    auto balances = storage.list_balances();
    ASSERT_EQ(balances.size(), 2u);
    EXPECT_EQ(balances[0].first, make_account(10));
    EXPECT_EQ(balances[0].second, 50u);
    EXPECT_EQ(balances[1].first, make_account(20));
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_types, event_log_chains_digest_over_encoded_events) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_events");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto first = sentinel::storage::ledger_changeset{};
    first.events.push_back(make_event(1, 10));
    first.events.push_back(make_event(2, 20));
    storage.apply(first);

    auto second = sentinel::storage::ledger_changeset{};
    second.events.push_back(make_event(3, 30));
    storage.apply(second);

    auto expected = sentinel::schema::make_zero_hash();
    for (const auto sequence : {1u, 2u, 3u}) {
      auto encoded = sentinel::schema::encoding::scale::encode_row(
          make_event(sequence, sequence * 10));
      expected = sentinel::blake3::chain(
          expected, sentinel::schema::make_bytes_view(encoded));
    }
    auto head = storage.load_event_head();
    EXPECT_EQ(head.count, 3u);
    EXPECT_EQ(head.digest, expected);

    auto events = storage.load_events(2, 3);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], make_event(2, 20));
    EXPECT_EQ(events[1], make_event(3, 30));
    EXPECT_TRUE(storage.load_events(3, 2).empty());
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_types, rows_reject_truncated_bytes) {
  auto encoded = sentinel::schema::encoding::scale::encode_row(make_event(7, 70));
  auto decoded = sentinel::schema::encoding::scale::decode_ledger_event(
      sentinel::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, make_event(7, 70));

  encoded.resize(encoded.size() - 1);
  EXPECT_FALSE(sentinel::schema::encoding::scale::decode_ledger_event(
                   sentinel::schema::make_bytes_view(encoded))
                   .has_value());
  auto amount = sentinel::schema::bytes_t{0x01, 0x02};
  EXPECT_FALSE(sentinel::schema::encoding::scale::decode_amount(
                   sentinel::schema::make_bytes_view(amount))
                   .has_value());
}

TEST(storage_types, event_keys_sort_by_sequence) {
  auto low = sentinel::schema::key::make_event_key(255);
  auto high = sentinel::schema::key::make_event_key(256);
  EXPECT_LT(low, high);
}

TEST(storage_types, balance_keys_parse_back_to_owner) {
  auto owner = make_account(42);
  auto key = sentinel::schema::key::make_balance_key(owner);
  auto parsed = sentinel::schema::key::parse_balance_key(key);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, owner);

  auto foreign = sentinel::schema::key::make_host_activity_key(owner);
  EXPECT_FALSE(sentinel::schema::key::parse_balance_key(foreign).has_value());
}

TEST(storage_types, host_counters_round_trip) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_counters");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto key = sentinel::schema::key::make_host_reference_key(make_account(5));
    auto view = sentinel::schema::make_bytes_view(key);
    EXPECT_FALSE(storage.load_counter(view).has_value());
    storage.save_counter(view, 1234);
    EXPECT_EQ(storage.load_counter(view).value_or(0), 1234u);
  }
  sentinel::testing::remove_path(db);
}
