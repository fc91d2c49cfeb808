#pragma once

#include <sentinel/execution/capability.hpp>
#include <sentinel/execution/fungible_amount.hpp>
#include <sentinel/schema/primitives.hpp>

namespace sentinel::execution {

/// Balance cell of one owner for the deployed asset.
///
/// Creating a store needs the extend capability; every mutation needs the
/// transfer capability (hook-mediated path) or the mint capability (issuance
/// path). The balance can never go below zero.
class account_store final {
 public:
  account_store(const sentinel::schema::account_id_t& owner,
                sentinel::schema::amount_t balance,
                const extend_capability& capability);
  account_store(const account_store&) = delete;
  account_store& operator=(const account_store&) = delete;
  account_store(account_store&&) = default;
  account_store& operator=(account_store&&) = delete;
  ~account_store() = default;

  const sentinel::schema::account_id_t& owner() const { return owner_; }
  sentinel::schema::amount_t balance() const { return balance_; }

  /// Detach `amount` units. Callers check `amount <= balance()` first.
  fungible_amount withdraw(sentinel::schema::amount_t amount,
                           const transfer_capability& capability);

  /// Absorb a detached amount. Callers check for balance overflow first.
  void deposit(fungible_amount&& amount, const transfer_capability& capability);
  void deposit(fungible_amount&& amount, const mint_capability& capability);

 private:
  void credit(fungible_amount&& amount);

  sentinel::schema::account_id_t owner_;
  sentinel::schema::amount_t balance_{};
};

}  // namespace sentinel::execution
