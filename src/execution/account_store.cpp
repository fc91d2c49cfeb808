#include <sentinel/execution/account_store.hpp>
#include <sentinel/execution/fungible_amount.hpp>
#include <sentinel/common/critical.hpp>

#include <limits>

namespace sentinel::execution {

fungible_amount fungible_amount::mint(const sentinel::schema::amount_t value,
                                      const mint_capability&) {
  return fungible_amount{value};
}

sentinel::schema::amount_t fungible_amount::burn(fungible_amount&& amount,
                                                 const burn_capability&) {
  return amount.consume();
}

account_store::account_store(const sentinel::schema::account_id_t& owner,
                             const sentinel::schema::amount_t balance,
                             const extend_capability&)
    : owner_{owner}, balance_{balance} {}

fungible_amount account_store::withdraw(const sentinel::schema::amount_t amount,
                                        const transfer_capability&) {
  if (amount > balance_) {
    sentinel::common::critical("account store withdraw exceeds balance");
  }
  balance_ -= amount;
  return fungible_amount{amount};
}

void account_store::deposit(fungible_amount&& amount,
                            const transfer_capability&) {
  credit(std::move(amount));
}

void account_store::deposit(fungible_amount&& amount, const mint_capability&) {
  credit(std::move(amount));
}

void account_store::credit(fungible_amount&& amount) {
  if (std::numeric_limits<sentinel::schema::amount_t>::max() - balance_ <
      amount.value()) {
    sentinel::common::critical("account store deposit overflows balance");
  }
  balance_ += amount.consume();
}

}  // namespace sentinel::execution
