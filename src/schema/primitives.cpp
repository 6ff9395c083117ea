#include <vigil/common/critical.hpp>
#include <vigil/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace vigil::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Table = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

std::string_view strip_hex_prefix(std::string_view input) {
  if (input.starts_with("0x") || input.starts_with("0X")) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base64_value(const char c) {
  auto position = kBase64Table.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    vigil::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32(bytes);
  if (!hash) {
    vigil::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return try_make_hash32(std::string_view{bytes});
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  auto decoded = try_from_hex(bytes);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHexDigits[(value >> 4u) & 0x0Fu]);
    out.push_back(kHexDigits[value & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = strip_hex_prefix(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto out = bytes_t{};
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_value(hex[i]);
    auto low = hex_value(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return out;
}

bytes_t from_hex(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    vigil::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);
  for (size_t i = 0; i < bytes.size(); i += 3) {
    auto remaining = bytes.size() - i;
    auto value = static_cast<uint32_t>(bytes[i]) << 16u;
    if (remaining > 1) {
      value |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
    }
    if (remaining > 2) {
      value |= static_cast<uint32_t>(bytes[i + 2]);
    }
    out.push_back(kBase64Table[(value >> 18u) & 0x3Fu]);
    out.push_back(kBase64Table[(value >> 12u) & 0x3Fu]);
    out.push_back(remaining > 1 ? kBase64Table[(value >> 6u) & 0x3Fu] : '=');
    out.push_back(remaining > 2 ? kBase64Table[value & 0x3Fu] : '=');
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(std::string_view encoded) {
  auto compact = std::string{};
  compact.reserve(encoded.size());
  std::copy_if(std::begin(encoded), std::end(encoded),
               std::back_inserter(compact), [](const char ch) {
                 return std::isspace(static_cast<unsigned char>(ch)) == 0;
               });
  if ((compact.size() % 4) != 0) {
    return std::nullopt;
  }

  auto out = bytes_t{};
  out.reserve((compact.size() / 4) * 3);
  for (size_t i = 0; i < compact.size(); i += 4) {
    auto is_last = (i + 4) == compact.size();
    auto padding = size_t{0};
    if (compact[i + 3] == '=') {
      padding = compact[i + 2] == '=' ? 2 : 1;
    }
    if (padding > 0 && !is_last) {
      return std::nullopt;
    }

    auto value = uint32_t{0};
    for (size_t j = 0; j < 4 - padding; ++j) {
      auto sextet = base64_value(compact[i + j]);
      if (!sextet) {
        return std::nullopt;
      }
      value |= static_cast<uint32_t>(*sextet) << (18u - (6u * j));
    }
    out.push_back(static_cast<uint8_t>((value >> 16u) & 0xFFu));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((value >> 8u) & 0xFFu));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(value & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded) {
    vigil::common::critical("invalid base64 input");
  }
  return *decoded;
}

}  // namespace vigil::schema
