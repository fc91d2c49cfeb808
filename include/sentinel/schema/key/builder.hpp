#pragma once
#include <sentinel/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace sentinel::schema::key {

struct builder final {
  sentinel::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Integers are written big-endian so that byte-wise key order matches
  /// numeric order under a common prefix.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), bytes, bytes + sizeof(T));
    return *this;
  }
};

}  // namespace sentinel::schema::key
