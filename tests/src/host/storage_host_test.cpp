#include <sentinel/execution/hooks.hpp>
#include <sentinel/execution/ledger.hpp>
#include <sentinel/host/storage_host.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/testing/common.hpp>
#include <gtest/gtest.h>

using sentinel::schema::ledger_error_code;
using sentinel::testing::make_account;

TEST(storage_host, counters_default_to_zero) {
  auto db = sentinel::testing::make_db_path("sentinel_host_defaults");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto host = sentinel::host::storage_host{storage};
    EXPECT_EQ(host.activity_counter(make_account(1)), 0u);
    EXPECT_EQ(host.reference_balance(make_account(1)), 0u);
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_host, activity_counter_only_moves_forward) {
  auto db = sentinel::testing::make_db_path("sentinel_host_activity");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto host = sentinel::host::storage_host{storage};
    auto account = make_account(2);
    host.record_activity(account);
    host.record_activity(account);
    EXPECT_EQ(host.activity_counter(account), 2u);

    EXPECT_TRUE(host.set_activity_counter(account, 5));
    EXPECT_FALSE(host.set_activity_counter(account, 4));
    EXPECT_EQ(host.activity_counter(account), 5u);
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_host, counters_survive_reopen) {
  auto db = sentinel::testing::make_db_path("sentinel_host_reopen");
  auto account = make_account(3);
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto host = sentinel::host::storage_host{storage};
    host.record_activity(account);
    host.set_reference_balance(account, 2500);
  }
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto host = sentinel::host::storage_host{storage};
    EXPECT_EQ(host.activity_counter(account), 1u);
    EXPECT_EQ(host.reference_balance(account), 2500u);
  }
  sentinel::testing::remove_path(db);
}

TEST(storage_host, drives_standard_hooks_over_shared_database) {
  auto db = sentinel::testing::make_db_path("sentinel_host_ledger");
  {
    auto storage =
        sentinel::storage::make_storage<sentinel::storage::rocksdb_storage_tag>(
            db);
    auto host = sentinel::host::storage_host{storage};
    auto ledger = sentinel::execution::ledger{
        storage, sentinel::execution::make_standard_hooks(host)};
    auto issuer = make_account(1);
    auto alice = make_account(40);
    auto bob = make_account(80);

    ASSERT_TRUE(ledger.initialize(issuer, "Sentinel Dollar", "SUSD", 8).ok());
    ASSERT_TRUE(ledger.mint(issuer, alice, 100).ok());
    EXPECT_EQ(ledger.transfer(alice, bob, 10).error(),
              ledger_error_code::inactive_account);

    host.record_activity(alice);
    host.record_activity(bob);
    host.set_reference_balance(bob, 1001);
    ASSERT_TRUE(ledger.transfer(alice, bob, 10).ok());
    EXPECT_EQ(ledger.balance_of(bob), 10u);
    EXPECT_TRUE(ledger.audit().ok);
  }
  sentinel::testing::remove_path(db);
}
