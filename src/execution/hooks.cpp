#include <sentinel/common/critical.hpp>
#include <sentinel/execution/hooks.hpp>

using sentinel::schema::ledger_error_code;

namespace sentinel::execution {

ledger_error_code check_activity(const host_interface& host,
                                 const sentinel::schema::account_id_t& account) {
  if (host.activity_counter(account) == 0) {
    return ledger_error_code::inactive_account;
  }
  return ledger_error_code::ok;
}

ledger_error_code check_withdraw_cap(const hook_context& context,
                                     const hook_parameters& parameters) {
  // The cap is taken relative to the requested amount, not to the balance
  // left after the withdraw.
  const sentinel::schema::wide_amount_t max_cap =
      sentinel::schema::wide_amount_t{context.amount} * parameters.cap_rate /
      parameters.scale_factor;
  if (sentinel::schema::wide_amount_t{context.balance} <= max_cap) {
    return ledger_error_code::cap_exceeded;
  }
  return ledger_error_code::ok;
}

ledger_error_code check_reference_balance(const host_interface& host,
                                          const hook_context& context,
                                          const hook_parameters& parameters) {
  if (host.reference_balance(context.owner) <= parameters.reference_floor) {
    return ledger_error_code::minimum_balance_not_met;
  }
  return ledger_error_code::ok;
}

hook_set make_standard_hooks(const host_interface& host,
                             const hook_parameters& parameters) {
  if (parameters.scale_factor == 0) {
    sentinel::common::critical("withdraw cap scale factor must be non-zero");
  }
  auto withdraw = [&host, parameters](const hook_context& context) {
    if (auto code = check_activity(host, context.owner);
        code != ledger_error_code::ok) {
      return code;
    }
    return check_withdraw_cap(context, parameters);
  };
  auto deposit = [&host, parameters](const hook_context& context) {
    if (auto code = check_activity(host, context.owner);
        code != ledger_error_code::ok) {
      return code;
    }
    return check_reference_balance(host, context, parameters);
  };
  return hook_set{.withdraw = withdraw, .deposit = deposit};
}

}  // namespace sentinel::execution
