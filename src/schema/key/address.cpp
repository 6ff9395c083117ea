#include <boost/endian/buffers.hpp>
#include <vigil/blake3/hash.hpp>
#include <vigil/common/critical.hpp>
#include <vigil/crypto/curve25519.hpp>
#include <vigil/schema/key/address.hpp>

#include <algorithm>
#include <array>

namespace vigil::schema::key {

namespace {

vigil::schema::bytes_view_t seed(const std::string_view& value) {
  return vigil::schema::make_bytes_view(value);
}

derived_address derive_or_fail(const seeds_t& seeds) {
  auto derived = derive_address(seeds);
  if (!derived) {
    vigil::common::critical("no off-curve address exists for record seeds");
  }
  return *derived;
}

}  // namespace

const vigil::schema::hash32_t& program_id() {
  static const auto id = vigil::blake3::hash(kProgramSeed);
  return id;
}

std::optional<vigil::schema::address_t> create_address(
    const seeds_t& seeds,
    const vigil::schema::address_proof_t proof) {
  auto hasher = vigil::blake3::hasher{};
  for (const auto& value : seeds) {
    hasher.update(value);
  }
  auto proof_seed = std::array<uint8_t, 1>{proof};
  hasher.update(proof_seed).update(program_id()).update(kDerivedAddressMarker);

  auto candidate = hasher.finalize();
  if (vigil::crypto::is_on_curve(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

std::optional<derived_address> derive_address(const seeds_t& seeds) {
  for (auto proof = 255; proof >= 0; --proof) {
    auto narrowed = static_cast<vigil::schema::address_proof_t>(proof);
    if (auto address = create_address(seeds, narrowed)) {
      return derived_address{.address = *address, .proof = narrowed};
    }
  }
  return std::nullopt;
}

derived_address derive_authority_address(
    const vigil::schema::identity_t& owner) {
  return derive_or_fail(seeds_t{seed(kAuthoritySeed), owner});
}

derived_address derive_event_address(const vigil::schema::identity_t& owner,
                                     const uint64_t sequence_index) {
  auto index = boost::endian::little_uint64_buf_t{sequence_index};
  return derive_or_fail(
      seeds_t{seed(kEventSeed), owner,
              vigil::schema::bytes_view_t{index.data(), sizeof(index)}});
}

bool verify_authority_address(const vigil::schema::address_t& address,
                              const vigil::schema::identity_t& owner,
                              const vigil::schema::address_proof_t proof) {
  auto expected = create_address(seeds_t{seed(kAuthoritySeed), owner}, proof);
  return expected.has_value() && *expected == address;
}

bool verify_event_address(const vigil::schema::address_t& address,
                          const vigil::schema::identity_t& owner,
                          const uint64_t sequence_index,
                          const vigil::schema::address_proof_t proof) {
  auto index = boost::endian::little_uint64_buf_t{sequence_index};
  auto expected = create_address(
      seeds_t{seed(kEventSeed), owner,
              vigil::schema::bytes_view_t{index.data(), sizeof(index)}},
      proof);
  return expected.has_value() && *expected == address;
}

vigil::schema::type_tag_t make_type_tag(const std::string_view type_name) {
  auto digest =
      vigil::blake3::hasher{}.update("account:").update(type_name).finalize();
  auto tag = vigil::schema::type_tag_t{};
  std::copy_n(std::begin(digest), tag.size(), std::begin(tag));
  return tag;
}

}  // namespace vigil::schema::key
