#pragma once
#include <sentinel/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace sentinel::schema::key {

inline constexpr auto kRegistryKey = std::string_view{"SYS|ASSET|REGISTRY"};
inline constexpr auto kSupplyKey = std::string_view{"SYS|ASSET|SUPPLY"};
inline constexpr auto kEventHeadKey = std::string_view{"SYS|EVT|HEAD"};
inline constexpr auto kBalancePrefix = std::string_view{"STATE|BALANCE|"};
inline constexpr auto kEventPrefix = std::string_view{"LOG|EVENT|"};
inline constexpr auto kHostActivityPrefix = std::string_view{"HOST|ACTIVITY|"};
inline constexpr auto kHostReferencePrefix =
    std::string_view{"HOST|REFERENCE|"};

sentinel::schema::bytes_t make_balance_key(const account_id_t& owner);
sentinel::schema::bytes_t make_event_key(sequence_t sequence);
sentinel::schema::bytes_t make_host_activity_key(const account_id_t& account);
sentinel::schema::bytes_t make_host_reference_key(const account_id_t& account);

/// Recover the owner from a balance key, or std::nullopt for foreign keys.
std::optional<account_id_t> parse_balance_key(const bytes_view_t& key);

}  // namespace sentinel::schema::key
