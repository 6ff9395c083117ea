#pragma once
#include <blake3.h>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace vigil::blake3 {

/// Incremental BLAKE3 hasher producing 32 byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  vigil::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

vigil::schema::hash32_t hash(const std::string_view& str);
vigil::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace vigil::blake3
