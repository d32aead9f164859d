#pragma once

#include <conduit/schema/primitives.hpp>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>

namespace conduit::testing {

/// Throwaway ed25519 key pair backed by OpenSSL.
class ed25519_key final {
 public:
  static std::optional<ed25519_key> generate() {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      return std::nullopt;
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      return std::nullopt;
    }
    auto key = ed25519_key{raw};
    auto size = key.public_key_.size();
    if (EVP_PKEY_get_raw_public_key(raw, key.public_key_.data(), &size) != 1 ||
        size != key.public_key_.size()) {
      return std::nullopt;
    }
    return key;
  }

  conduit::schema::signer_id_t signer() const {
    return conduit::schema::signer_id_t{
        conduit::schema::ed25519_signer_id{.public_key = public_key_}};
  }

  std::optional<conduit::schema::ed25519_signature_t> sign(
      const conduit::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1) {
      return std::nullopt;
    }
    auto signature = conduit::schema::ed25519_signature_t{};
    auto size = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1 ||
        size != signature.size()) {
      return std::nullopt;
    }
    return signature;
  }

 private:
  explicit ed25519_key(EVP_PKEY* key) : key_{key, EVP_PKEY_free} {}

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  std::array<uint8_t, 32> public_key_{};
};

}  // namespace conduit::testing
