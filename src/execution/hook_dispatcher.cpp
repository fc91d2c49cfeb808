#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/hook_dispatcher.hpp>
#include <sentinel/schema/primitives.hpp>

#include <limits>
#include <utility>

using sentinel::schema::ledger_error_code;

namespace sentinel::execution {

hook_dispatcher::hook_dispatcher(hook_set hooks) : hooks_{std::move(hooks)} {
  if (!hooks_.withdraw || !hooks_.deposit) {
    sentinel::common::critical("hook dispatcher requires both hooks");
  }
}

std::optional<fungible_amount> hook_dispatcher::withdraw(
    account_store& store,
    const sentinel::schema::amount_t amount,
    const transfer_capability& capability,
    ledger_error_code& error) const {
  auto context = hook_context{
      .owner = store.owner(), .balance = store.balance(), .amount = amount};
  error = hooks_.withdraw(context);
  if (error != ledger_error_code::ok) {
    spdlog::debug("Withdraw hook rejected {} from {}: {}", amount,
                  sentinel::schema::to_hex(context.owner),
                  sentinel::schema::to_string(error));
    return std::nullopt;
  }
  if (amount > store.balance()) {
    error = ledger_error_code::insufficient_balance;
    return std::nullopt;
  }
  return store.withdraw(amount, capability);
}

ledger_error_code hook_dispatcher::deposit(
    account_store& store,
    fungible_amount&& amount,
    const transfer_capability& capability) const {
  auto context = hook_context{.owner = store.owner(),
                              .balance = store.balance(),
                              .amount = amount.value()};
  auto error = hooks_.deposit(context);
  if (error != ledger_error_code::ok) {
    spdlog::debug("Deposit hook rejected {} to {}: {}", context.amount,
                  sentinel::schema::to_hex(context.owner),
                  sentinel::schema::to_string(error));
    return error;
  }
  if (std::numeric_limits<sentinel::schema::amount_t>::max() -
          store.balance() <
      amount.value()) {
    return ledger_error_code::overflow;
  }
  store.deposit(std::move(amount), capability);
  return ledger_error_code::ok;
}

}  // namespace sentinel::execution
