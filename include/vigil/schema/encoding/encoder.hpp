#pragma once
#include <vigil/schema/primitives.hpp>
#include <optional>
#include <span>

namespace vigil::schema::encoding {

// The codec is chosen at build time through the tag type. Record layouts on
// the ledger are defined by the codec's output, so swapping the tag is a
// ledger format change.
template <typename Library>
struct encoder {
  template <typename T>
  vigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vigil::schema::bytes_t& out);

  template <typename T>
  T decode(const vigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vigil::schema::bytes_view_t& bytes);
};

}  // namespace vigil::schema::encoding
