#pragma once
#include <sentinel/schema/primitives.hpp>
#include <optional>
#include <span>

namespace sentinel::schema::encoding {

// Encoder backend is a build time choice expressed by a library tag:
//   auto enc = encoder<scale_encoder_tag>{};
// Hot swapping backends is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  sentinel::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const sentinel::schema::bytes_view_t& bytes);
};

}  // namespace sentinel::schema::encoding
