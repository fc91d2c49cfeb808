#pragma once

#include <sentinel/execution/account_store.hpp>
#include <sentinel/execution/capability.hpp>
#include <sentinel/execution/fungible_amount.hpp>
#include <sentinel/execution/hooks.hpp>
#include <sentinel/schema/ledger_error_code.hpp>

#include <optional>

namespace sentinel::execution {

/// Routes every hook-mediated debit and credit through the bound hooks before
/// the store is touched. Hooks are bound at construction and cannot be
/// replaced.
class hook_dispatcher final {
 public:
  explicit hook_dispatcher(hook_set hooks);
  hook_dispatcher(const hook_dispatcher&) = delete;
  hook_dispatcher& operator=(const hook_dispatcher&) = delete;

  /// Run the withdraw hook, then detach `amount` from `store`.
  ///
  /// On rejection returns std::nullopt, leaves `store` untouched and sets
  /// `error` to the failing gate.
  std::optional<fungible_amount> withdraw(
      account_store& store,
      sentinel::schema::amount_t amount,
      const transfer_capability& capability,
      sentinel::schema::ledger_error_code& error) const;

  /// Run the deposit hook, then absorb `amount` into `store`.
  ///
  /// `amount` is consumed only when the result is `ok`.
  sentinel::schema::ledger_error_code deposit(
      account_store& store,
      fungible_amount&& amount,
      const transfer_capability& capability) const;

 private:
  hook_set hooks_;
};

}  // namespace sentinel::execution
