#pragma once

#include <sentinel/execution/host.hpp>
#include <sentinel/schema/ledger_error_code.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <functional>

namespace sentinel::execution {

inline constexpr uint64_t kDefaultCapRate = 200;
inline constexpr uint64_t kDefaultScaleFactor = 100;
inline constexpr sentinel::schema::amount_t kDefaultReferenceFloor = 1000;

/// Read-only view handed to a hook. Hooks see balances by value and have no
/// way to reach the store they are judging.
struct hook_context final {
  sentinel::schema::account_id_t owner{};
  sentinel::schema::amount_t balance{};
  sentinel::schema::amount_t amount{};
};

/// A hook returns `ledger_error_code::ok` to let the mutation proceed, or the
/// code of the gate that rejected it.
using hook_predicate_t =
    std::function<sentinel::schema::ledger_error_code(const hook_context&)>;

struct hook_set final {
  hook_predicate_t withdraw;
  hook_predicate_t deposit;
};

struct hook_parameters final {
  uint64_t cap_rate{kDefaultCapRate};
  uint64_t scale_factor{kDefaultScaleFactor};
  sentinel::schema::amount_t reference_floor{kDefaultReferenceFloor};
};

/// Fails with `inactive_account` unless the host saw at least one committed
/// transaction of `account`.
sentinel::schema::ledger_error_code check_activity(
    const host_interface& host,
    const sentinel::schema::account_id_t& account);

/// Fails with `cap_exceeded` unless
/// `balance > amount * cap_rate / scale_factor` (integer division).
sentinel::schema::ledger_error_code check_withdraw_cap(
    const hook_context& context,
    const hook_parameters& parameters);

/// Fails with `minimum_balance_not_met` unless the owner's reference-currency
/// balance is strictly above the floor.
sentinel::schema::ledger_error_code check_reference_balance(
    const host_interface& host,
    const hook_context& context,
    const hook_parameters& parameters);

/// Withdraw hook = activity gate then cap gate; deposit hook = activity gate
/// then reference balance gate. The host must outlive the returned hooks.
hook_set make_standard_hooks(const host_interface& host,
                             const hook_parameters& parameters = {});

}  // namespace sentinel::execution
