#pragma once
#include <vigil/common/critical.hpp>
#include <vigil/schema/encoding/encoder.hpp>
#include <vigil/schema/encoding/scale/authority_record.hpp>
#include <vigil/schema/encoding/scale/event_kind.hpp>
#include <vigil/schema/encoding/scale/event_record.hpp>
#include <vigil/schema/encoding/scale/notification.hpp>
#include <vigil/schema/encoding/scale/record_account.hpp>
#include <vigil/schema/encoding/scale/transaction.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace vigil::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  vigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vigil::schema::bytes_t& out);

  template <typename T>
  T decode(const vigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vigil::schema::bytes_view_t& bytes);
};

template <typename T>
vigil::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    vigil::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        vigil::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const vigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    vigil::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const vigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace vigil::schema::encoding
