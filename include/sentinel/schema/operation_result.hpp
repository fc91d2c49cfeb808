#pragma once

#include <sentinel/schema/ledger_error_code.hpp>
#include <sentinel/schema/ledger_event.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sentinel::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<ledger_event_t> events;

  bool ok() const { return code == 0; }
  ledger_error_code error() const {
    return static_cast<ledger_error_code>(code);
  }
};

using operation_result_t = operation_result<1>;

/// Outcome of recomputing the balance sum against the supply counter.
struct audit_result final {
  bool ok{};
  amount_t total_supply{};
  wide_amount_t balance_sum{};
  uint64_t accounts{};
};

}  // namespace sentinel::schema
