#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace conduit::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using chain_selector_t = uint64_t;
using message_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;

// The zero address selects the native asset wherever an asset is expected.
inline constexpr auto kNativeAsset = address_t{};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::optional<address_t> try_make_address(const bytes_view_t& bytes);
std::optional<address_t> try_make_address(const std::string_view& hex);
bytes_t make_bytes(const address_t& address);
bool is_zero(const address_t& address);

std::optional<bytes_t> try_from_hex(const std::string_view& hex);
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::string to_hex(const hash32_t& hash);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view& encoded);

std::optional<amount_t> try_make_amount(const std::string_view& decimal);
std::string to_string(const amount_t& amount);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using named_signer_t = hash32_t;  // On chain identity reference
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace conduit::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
