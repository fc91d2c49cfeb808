#pragma once
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct asset_descriptor;

template <>
struct asset_descriptor<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  uint8_t decimals{};
};

using asset_descriptor_t = asset_descriptor<1>;

inline bool operator==(const asset_descriptor_t& lhs,
                       const asset_descriptor_t& rhs) {
  return lhs.version == rhs.version && lhs.name == rhs.name &&
         lhs.symbol == rhs.symbol && lhs.decimals == rhs.decimals;
}

/// Registry row persisted once per deployment.
///
/// The issuer is the account the identity provider resolves to the mint and
/// burn capabilities.
template <uint16_t Version>
struct registry_record;

template <>
struct registry_record<1> final {
  uint16_t version{1};
  asset_descriptor_t descriptor;
  account_id_t issuer{};
};

using registry_record_t = registry_record<1>;

}  // namespace sentinel::schema
