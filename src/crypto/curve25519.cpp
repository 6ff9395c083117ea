#include <vigil/crypto/curve25519.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

namespace vigil::crypto {

namespace {

using boost::multiprecision::cpp_int;

const cpp_int& field_prime() {
  static const auto prime = (cpp_int{1} << 255) - 19;
  return prime;
}

cpp_int invert(const cpp_int& value) {
  const auto& p = field_prime();
  return boost::multiprecision::powm(value, p - 2, p);
}

// Twisted Edwards constant d = -121665 / 121666 mod p.
const cpp_int& edwards_d() {
  static const auto d = [] {
    const auto& p = field_prime();
    return ((p - 121665) * invert(cpp_int{121666})) % p;
  }();
  return d;
}

}  // namespace

bool is_on_curve(const vigil::schema::hash32_t& point) {
  const auto& p = field_prime();

  // Little-endian y coordinate; the top bit carries the sign of x.
  auto y = cpp_int{point[31] & 0x7Fu};
  for (auto i = 30; i >= 0; --i) {
    y = (y << 8) | point[static_cast<size_t>(i)];
  }
  y %= p;

  // x^2 = (y^2 - 1) / (d*y^2 + 1)
  const auto y2 = (y * y) % p;
  const auto u = (y2 + p - 1) % p;
  const auto v = ((edwards_d() * y2) + 1) % p;
  const auto x2 = (u * invert(v)) % p;
  if (x2 == 0) {
    return true;
  }
  return boost::multiprecision::powm(x2, (p - 1) / 2, p) == 1;
}

}  // namespace vigil::crypto
