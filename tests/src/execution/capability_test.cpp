#include <sentinel/execution/account_store.hpp>
#include <sentinel/execution/capability.hpp>
#include <sentinel/execution/fungible_amount.hpp>
#include <sentinel/testing/common.hpp>
#include <sentinel/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <type_traits>

namespace execution = sentinel::execution;

static_assert(!std::is_default_constructible_v<execution::mint_capability>);
static_assert(!std::is_default_constructible_v<execution::burn_capability>);
static_assert(!std::is_default_constructible_v<execution::extend_capability>);
static_assert(
    !std::is_default_constructible_v<execution::transfer_capability>);
static_assert(!std::is_copy_constructible_v<execution::mint_capability>);
static_assert(!std::is_move_constructible_v<execution::transfer_capability>);
static_assert(!std::is_default_constructible_v<execution::capability_bundle>);
static_assert(!std::is_copy_constructible_v<execution::capability_bundle>);

static_assert(!std::is_copy_constructible_v<execution::fungible_amount>);
static_assert(std::is_move_constructible_v<execution::fungible_amount>);
static_assert(!std::is_move_assignable_v<execution::fungible_amount>);
static_assert(
    !std::is_constructible_v<execution::fungible_amount,
                             sentinel::schema::amount_t>);

static_assert(!std::is_copy_constructible_v<execution::account_store>);
static_assert(
    !std::is_constructible_v<execution::account_store,
                             sentinel::schema::account_id_t,
                             sentinel::schema::amount_t>);

TEST(capability, detached_amount_is_credited_exactly_once) {
  auto fixture = sentinel::testing::ledger_fixture{"sentinel_capability_once"};
  auto issuer = sentinel::testing::make_account(1);
  auto alice = sentinel::testing::make_account(40);
  auto bob = sentinel::testing::make_account(80);
  ASSERT_TRUE(fixture.ledger().initialize(issuer, "Sentinel Dollar", "SUSD", 8)
                  .ok());
  fixture.host().make_eligible(alice);
  fixture.host().make_eligible(bob);
  ASSERT_TRUE(fixture.ledger().mint(issuer, alice, 100).ok());

  ASSERT_TRUE(fixture.ledger().transfer(alice, bob, 30).ok());
  EXPECT_EQ(fixture.ledger().balance_of(alice), 70u);
  EXPECT_EQ(fixture.ledger().balance_of(bob), 30u);
  EXPECT_EQ(fixture.ledger().total_supply(), 100u);
}

TEST(capability, bundle_is_rematerialized_for_issuer_after_reopen) {
  auto fixture = sentinel::testing::ledger_fixture{"sentinel_capability_reopen"};
  auto issuer = sentinel::testing::make_account(1);
  auto alice = sentinel::testing::make_account(40);
  ASSERT_TRUE(fixture.ledger().initialize(issuer, "Sentinel Dollar", "SUSD", 8)
                  .ok());
  fixture.reopen();

  EXPECT_TRUE(fixture.ledger().mint(issuer, alice, 5).ok());
  EXPECT_EQ(fixture.ledger().mint(alice, alice, 5).error(),
            sentinel::schema::ledger_error_code::unauthorized);
  EXPECT_EQ(fixture.ledger().balance_of(alice), 5u);
}
