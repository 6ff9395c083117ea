#pragma once

#include <vigil/crypto/verify.hpp>
#include <vigil/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace vigil::testing {

inline vigil::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = vigil::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Arbitrary 32 byte identity; only usable with strict crypto disabled.
inline vigil::schema::identity_t make_identity(const uint8_t seed) {
  return make_hash(seed);
}

inline vigil::crypto::ed25519_seed_t make_seed(const uint8_t seed) {
  auto out = vigil::crypto::ed25519_seed_t{};
  out.fill(seed);
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace vigil::testing
