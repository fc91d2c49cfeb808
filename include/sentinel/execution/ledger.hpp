#pragma once

#include <sentinel/execution/asset_registry.hpp>
#include <sentinel/execution/hook_dispatcher.hpp>
#include <sentinel/execution/hooks.hpp>
#include <sentinel/execution/working_set.hpp>
#include <sentinel/schema/asset_descriptor.hpp>
#include <sentinel/schema/operation_result.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sentinel::execution {

/// Single fungible asset ledger with hook-gated transfers.
///
/// Every public mutation runs as one atomic unit: gates are evaluated against
/// a working set, and the working set is written to storage in one batch only
/// when every gate passed. A rejected operation leaves no trace.
///
/// The ledger takes no locks; the embedding host serializes operations.
class ledger final {
 public:
  /// Bind storage and hooks. Loads the registry when the deployment was
  /// initialized by an earlier process.
  ledger(storage_t& storage, hook_set hooks);
  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;
  ledger(ledger&&) = delete;
  ledger& operator=(ledger&&) = delete;

  /// Register the asset. Callable once per deployment; `issuer` becomes the
  /// holder of the mint and burn capabilities.
  sentinel::schema::operation_result_t initialize(
      const sentinel::schema::account_id_t& issuer,
      std::string name,
      std::string symbol,
      uint8_t decimals);

  /// Issue `amount` new units to `to`. Issuer only; bypasses the deposit hook.
  sentinel::schema::operation_result_t mint(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::account_id_t& to,
      sentinel::schema::amount_t amount);

  /// Destroy `amount` units held by `from`. Issuer only; the debit goes
  /// through the withdraw hook.
  sentinel::schema::operation_result_t burn(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::account_id_t& from,
      sentinel::schema::amount_t amount);

  /// Move `amount` units from `caller` to `to` through both hooks.
  sentinel::schema::operation_result_t transfer(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::account_id_t& to,
      sentinel::schema::amount_t amount);

  sentinel::schema::amount_t balance_of(
      const sentinel::schema::account_id_t& account) const;
  sentinel::schema::amount_t total_supply() const;
  std::optional<sentinel::schema::asset_descriptor_t> asset_descriptor() const;

  /// Recompute the sum of all balances and compare it with the supply
  /// counter.
  sentinel::schema::audit_result audit() const;

 private:
  sentinel::schema::operation_result_t commit(working_set&& set,
                                              std::string_view codespace,
                                              std::string info);

  storage_t& storage_;
  asset_registry registry_;
  hook_dispatcher dispatcher_;
};

}  // namespace sentinel::execution
