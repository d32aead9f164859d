#pragma once

#include <conduit/crypto/verify.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::testing {

using scale_encoder_t = conduit::schema::encoding::scale_encoder_t;

inline conduit::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = conduit::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline conduit::schema::address_t make_address(const uint8_t seed) {
  auto out = conduit::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline conduit::schema::signer_id_t make_named_signer(const uint8_t seed) {
  auto named = conduit::schema::named_signer_t{};
  named[0] = seed;
  return conduit::schema::signer_id_t{named};
}

/// Account address the engine derives for `signer`.
inline conduit::schema::address_t address_of(
    const conduit::schema::signer_id_t& signer) {
  return conduit::crypto::derive_address(signer);
}

inline conduit::schema::bytes_view_t view(const conduit::schema::bytes_t& b) {
  return conduit::schema::bytes_view_t{b.data(), b.size()};
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

}  // namespace conduit::testing
