#pragma once

#include <sentinel/schema/primitives.hpp>

#include <cstdint>

namespace sentinel::execution {

/// Read-only oracles the embedding host provides to the hooks.
class host_interface {
 public:
  host_interface() = default;
  host_interface(const host_interface&) = delete;
  host_interface& operator=(const host_interface&) = delete;
  virtual ~host_interface() = default;

  /// Number of committed host transactions of `account`. Monotonically
  /// non-decreasing; zero means the account was never active.
  virtual uint64_t activity_counter(
      const sentinel::schema::account_id_t& account) const = 0;

  /// Balance of `account` in the host's reference currency.
  virtual sentinel::schema::amount_t reference_balance(
      const sentinel::schema::account_id_t& account) const = 0;
};

}  // namespace sentinel::execution
