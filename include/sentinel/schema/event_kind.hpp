#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sentinel::schema {

enum class event_kind_t : uint8_t { mint = 0, burn = 1 };

inline constexpr auto kEventKindMappings = std::array{
    std::pair<std::string_view, event_kind_t>{"mint", event_kind_t::mint},
    std::pair<std::string_view, event_kind_t>{"burn", event_kind_t::burn},
};

template <>
inline std::optional<event_kind_t> try_from_string<event_kind_t>(
    const std::string_view value) {
  return from_string(value, kEventKindMappings);
}

inline constexpr std::string_view to_string(const event_kind_t value) {
  return to_string(value, kEventKindMappings).value_or("unknown");
}

}  // namespace sentinel::schema
