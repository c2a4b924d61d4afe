#pragma once
#include <strata/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strata::schema::encoding {

// Encoding backend is a build time choice: callers name the library tag,
// e.g. encoder<scale_encoder_tag>. Hot swapping is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  strata::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strata::schema::bytes_t& out);

  template <typename T>
  T decode(const strata::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strata::schema::bytes_view_t& bytes);
};

}  // namespace strata::schema::encoding
