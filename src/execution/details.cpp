#include <vigil/common/critical.hpp>
#include <vigil/crypto/verify.hpp>
#include <vigil/execution/details.hpp>
#include <algorithm>
#include <limits>

namespace vigil::execution {

vigil::schema::hash32_t hash_details(const std::string_view details) {
  auto digest = vigil::crypto::sha256(vigil::schema::make_bytes_view(details));
  if (!digest) {
    vigil::common::critical("OpenSSL failed to compute SHA-256");
  }
  return *digest;
}

uint16_t details_length(const std::string_view details) {
  return static_cast<uint16_t>(std::min<size_t>(
      details.size(), std::numeric_limits<uint16_t>::max()));
}

bool verify_event_details(const vigil::schema::event_record_t& record,
                          const std::string_view details) {
  return hash_details(details) == record.content_digest;
}

}  // namespace vigil::execution
