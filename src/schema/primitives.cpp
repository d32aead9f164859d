#include <conduit/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace conduit::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
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

bytes_t make_bytes(const address_t& address) {
  return bytes_t{std::begin(address), std::end(address)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
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
  auto hash = hash32_t{};
  std::copy_n(std::begin(bytes), std::min(bytes.size(), hash.size()),
              std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  return try_make_hash32(bytes).value_or(make_zero_hash());
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  auto decoded = try_from_hex(bytes);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  return make_hash32(*decoded);
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

bool is_zero(const hash32_t& hash) {
  return std::ranges::all_of(hash, [](const uint8_t b) { return b == 0; });
}

std::optional<address_t> try_make_address(const bytes_view_t& bytes) {
  auto address = address_t{};
  if (bytes.size() != address.size()) {
    return std::nullopt;
  }
  std::copy_n(std::begin(bytes), address.size(), std::begin(address));
  return address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_address(bytes_view_t{decoded->data(), decoded->size()});
}

bool is_zero(const address_t& address) {
  return address == kNativeAsset;
}

std::optional<bytes_t> try_from_hex(const std::string_view& input) {
  auto hex = normalize_hex(input);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto value : bytes) {
    out.push_back(kHex[(value >> 4u) & 0x0Fu]);
    out.push_back(kHex[value & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const address_t& address) {
  return to_hex(bytes_view_t{address.data(), address.size()});
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable = std::string_view{
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto i = size_t{0};
  while (i + 3 <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[i]) << 16u) |
                 (static_cast<uint32_t>(bytes[i + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[i + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    i += 3;
  }
  if (i < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[i]) << 16u;
    if ((i + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[i + 1]) << 8u;
    }
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back((i + 1) < bytes.size() ? kTable[(value >> 6u) & 0x3Fu]
                                         : '=');
    out.push_back('=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view& encoded) {
  if ((encoded.size() % 4) != 0) {
    return std::nullopt;
  }
  auto sextet = [](const char c) -> std::optional<uint32_t> {
    if (c >= 'A' && c <= 'Z') {
      return static_cast<uint32_t>(c - 'A');
    }
    if (c >= 'a' && c <= 'z') {
      return static_cast<uint32_t>(c - 'a' + 26);
    }
    if (c >= '0' && c <= '9') {
      return static_cast<uint32_t>(c - '0' + 52);
    }
    if (c == '+') {
      return 62u;
    }
    if (c == '/') {
      return 63u;
    }
    return std::nullopt;
  };

  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);
  for (size_t i = 0; i < encoded.size(); i += 4) {
    const auto last_group = (i + 4) == encoded.size();
    auto padding = size_t{0};
    auto value = uint32_t{0};
    for (size_t j = 0; j < 4; ++j) {
      const auto c = encoded[i + j];
      if (c == '=' && last_group && j >= 2) {
        ++padding;
        value <<= 6u;
        continue;
      }
      auto bits = sextet(c);
      if (!bits || padding > 0) {
        return std::nullopt;
      }
      value = (value << 6u) | *bits;
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

std::optional<amount_t> try_make_amount(const std::string_view& decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }
  static const auto kMax = std::numeric_limits<amount_t>::max();
  auto value = amount_t{0};
  for (const auto c : decimal) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = (value * 10) + digit;
  }
  return value;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace conduit::schema
