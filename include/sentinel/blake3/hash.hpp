#pragma once
#include <sentinel/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace sentinel::blake3 {

sentinel::schema::hash32_t hash(const std::string_view& str);
sentinel::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash `seed || bytes`; used to chain digests over an append-only log.
sentinel::schema::hash32_t chain(const sentinel::schema::hash32_t& seed,
                                 const std::span<const uint8_t>& bytes);

}  // namespace sentinel::blake3
