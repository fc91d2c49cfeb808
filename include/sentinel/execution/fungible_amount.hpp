#pragma once

#include <sentinel/execution/capability.hpp>
#include <sentinel/schema/primitives.hpp>

#include <utility>

namespace sentinel::execution {

class account_store;

/// Units detached from a store and not yet bound to a destination.
///
/// Move-only; a moved-from or consumed amount holds zero, so the same units
/// cannot be deposited twice. New units only come from `mint` and units only
/// leave circulation through `burn`, each gated by its capability.
class fungible_amount final {
 public:
  fungible_amount(const fungible_amount&) = delete;
  fungible_amount& operator=(const fungible_amount&) = delete;
  fungible_amount(fungible_amount&& other) noexcept
      : value_{std::exchange(other.value_, 0)} {}
  fungible_amount& operator=(fungible_amount&&) = delete;
  ~fungible_amount() = default;

  sentinel::schema::amount_t value() const { return value_; }

  static fungible_amount mint(sentinel::schema::amount_t value,
                              const mint_capability& capability);
  static sentinel::schema::amount_t burn(fungible_amount&& amount,
                                         const burn_capability& capability);

 private:
  friend class account_store;

  explicit fungible_amount(const sentinel::schema::amount_t value)
      : value_{value} {}

  sentinel::schema::amount_t consume() { return std::exchange(value_, 0); }

  sentinel::schema::amount_t value_{};
};

}  // namespace sentinel::execution
