#include <sentinel/execution/hooks.hpp>
#include <sentinel/testing/common.hpp>
#include <sentinel/testing/memory_host.hpp>
#include <gtest/gtest.h>

#include <limits>

using sentinel::execution::hook_context;
using sentinel::execution::hook_parameters;
using sentinel::schema::ledger_error_code;
using sentinel::testing::make_account;

TEST(hooks, activity_gate_requires_a_committed_transaction) {
  auto host = sentinel::testing::memory_host{};
  auto account = make_account(1);
  EXPECT_EQ(sentinel::execution::check_activity(host, account),
            ledger_error_code::inactive_account);
  host.set_activity(account, 1);
  EXPECT_EQ(sentinel::execution::check_activity(host, account),
            ledger_error_code::ok);
}

TEST(hooks, cap_gate_requires_balance_strictly_above_twice_amount) {
  auto parameters = hook_parameters{};
  auto at_cap = hook_context{.owner = make_account(1), .balance = 100,
                             .amount = 50};
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(at_cap, parameters),
            ledger_error_code::cap_exceeded);

  auto above_cap = hook_context{.owner = make_account(1), .balance = 101,
                                .amount = 50};
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(above_cap, parameters),
            ledger_error_code::ok);
}

TEST(hooks, cap_gate_uses_integer_division) {
  auto parameters = hook_parameters{.cap_rate = 150, .scale_factor = 100};
  // 3 * 150 / 100 == 4
  auto context = hook_context{.owner = make_account(1), .balance = 5,
                              .amount = 3};
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(context, parameters),
            ledger_error_code::ok);
  context.balance = 4;
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(context, parameters),
            ledger_error_code::cap_exceeded);
}

TEST(hooks, cap_gate_does_not_wrap_for_large_amounts) {
  auto parameters = hook_parameters{};
  auto context = hook_context{
      .owner = make_account(1),
      .balance = std::numeric_limits<sentinel::schema::amount_t>::max(),
      .amount = std::numeric_limits<sentinel::schema::amount_t>::max() / 2 + 1};
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(context, parameters),
            ledger_error_code::cap_exceeded);
}

TEST(hooks, zero_amount_passes_cap_gate_with_positive_balance) {
  auto parameters = hook_parameters{};
  auto context = hook_context{.owner = make_account(1), .balance = 1,
                              .amount = 0};
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(context, parameters),
            ledger_error_code::ok);
  context.balance = 0;
  EXPECT_EQ(sentinel::execution::check_withdraw_cap(context, parameters),
            ledger_error_code::cap_exceeded);
}

TEST(hooks, reference_balance_gate_is_strict_at_floor) {
  auto host = sentinel::testing::memory_host{};
  auto parameters = hook_parameters{};
  auto context = hook_context{.owner = make_account(2), .balance = 0,
                              .amount = 10};
  host.set_reference(context.owner, 1000);
  EXPECT_EQ(
      sentinel::execution::check_reference_balance(host, context, parameters),
      ledger_error_code::minimum_balance_not_met);
  host.set_reference(context.owner, 1001);
  EXPECT_EQ(
      sentinel::execution::check_reference_balance(host, context, parameters),
      ledger_error_code::ok);
}

TEST(hooks, standard_withdraw_hook_checks_activity_before_cap) {
  auto host = sentinel::testing::memory_host{};
  auto hooks = sentinel::execution::make_standard_hooks(host);
  auto context = hook_context{.owner = make_account(3), .balance = 0,
                              .amount = 10};
  EXPECT_EQ(hooks.withdraw(context), ledger_error_code::inactive_account);
  host.set_activity(context.owner, 1);
  EXPECT_EQ(hooks.withdraw(context), ledger_error_code::cap_exceeded);
  context.balance = 21;
  EXPECT_EQ(hooks.withdraw(context), ledger_error_code::ok);
}

TEST(hooks, standard_deposit_hook_checks_activity_before_reference) {
  auto host = sentinel::testing::memory_host{};
  auto hooks = sentinel::execution::make_standard_hooks(host);
  auto context = hook_context{.owner = make_account(4), .balance = 0,
                              .amount = 10};
  EXPECT_EQ(hooks.deposit(context), ledger_error_code::inactive_account);
  host.set_activity(context.owner, 1);
  EXPECT_EQ(hooks.deposit(context), ledger_error_code::minimum_balance_not_met);
  host.set_reference(context.owner, 5000);
  EXPECT_EQ(hooks.deposit(context), ledger_error_code::ok);
}

TEST(hooks, standard_hooks_read_host_state_at_call_time) {
  auto host = sentinel::testing::memory_host{};
  auto hooks = sentinel::execution::make_standard_hooks(
      host, hook_parameters{.reference_floor = 10});
  auto context = hook_context{.owner = make_account(5), .balance = 0,
                              .amount = 1};
  host.set_activity(context.owner, 3);
  host.set_reference(context.owner, 11);
  EXPECT_EQ(hooks.deposit(context), ledger_error_code::ok);
  host.set_reference(context.owner, 10);
  EXPECT_EQ(hooks.deposit(context), ledger_error_code::minimum_balance_not_met);
}
