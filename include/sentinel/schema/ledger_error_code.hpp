#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sentinel::schema {

enum class ledger_error_code : uint32_t {
  ok = 0,
  already_initialized = 1,
  unauthorized = 2,
  inactive_account = 3,
  cap_exceeded = 4,
  minimum_balance_not_met = 5,
  insufficient_balance = 6,
  overflow = 7,
  not_initialized = 8,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    std::pair<std::string_view, ledger_error_code>{"ok", ledger_error_code::ok},
    std::pair<std::string_view, ledger_error_code>{
        "already_initialized", ledger_error_code::already_initialized},
    std::pair<std::string_view, ledger_error_code>{
        "unauthorized", ledger_error_code::unauthorized},
    std::pair<std::string_view, ledger_error_code>{
        "inactive_account", ledger_error_code::inactive_account},
    std::pair<std::string_view, ledger_error_code>{
        "cap_exceeded", ledger_error_code::cap_exceeded},
    std::pair<std::string_view, ledger_error_code>{
        "minimum_balance_not_met", ledger_error_code::minimum_balance_not_met},
    std::pair<std::string_view, ledger_error_code>{
        "insufficient_balance", ledger_error_code::insufficient_balance},
    std::pair<std::string_view, ledger_error_code>{"overflow",
                                                   ledger_error_code::overflow},
    std::pair<std::string_view, ledger_error_code>{
        "not_initialized", ledger_error_code::not_initialized},
};

template <>
inline std::optional<ledger_error_code> try_from_string<ledger_error_code>(
    const std::string_view value) {
  return from_string(value, kLedgerErrorCodeMappings);
}

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

}  // namespace sentinel::schema
