#include <conduit/crypto/verify.hpp>

#include <conduit/blake3/hash.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace conduit::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

evp_pkey_ptr make_ed25519_key(
    const conduit::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(
    const conduit::schema::secp256k1_signer_id& signer) {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// 65-byte relay signatures carry the recovery id either first or last.
// Recovery ids are 0..3 or 27 and above.
std::optional<std::array<uint8_t, 64>> compact_rs(
    const conduit::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  auto out = std::array<uint8_t, 64>{};
  if (is_recovery_id(signature[0])) {
    std::copy_n(signature.data() + 1, out.size(), out.data());
    return out;
  }
  if (is_recovery_id(signature[64])) {
    std::copy_n(signature.data(), out.size(), out.data());
    return out;
  }
  return std::nullopt;
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& rs) {
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(rs.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(rs.data() + 32, 32, nullptr), BN_free};
  if (!sig || !r || !s ||
      ECDSA_SIG_set0(sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }
  auto size = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (size <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(size));
  auto* cursor = der.data();
  i2d_ECDSA_SIG(sig.get(), &cursor);
  return der;
}

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const conduit::schema::bytes_view_t& message,
                   const uint8_t* signature,
                   const size_t signature_size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || key == nullptr) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size,
                          message.data(), message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                               EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const conduit::schema::bytes_view_t& message,
                      const conduit::schema::signer_id_t& signer,
                      const conduit::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const conduit::schema::ed25519_signer_id& value) {
            const auto* sig =
                std::get_if<conduit::schema::ed25519_signature_t>(&signature);
            if (sig == nullptr) {
              return false;
            }
            auto key = make_ed25519_key(value);
            return digest_verify(key.get(), nullptr, message, sig->data(),
                                 sig->size());
          },
          [&](const conduit::schema::secp256k1_signer_id& value) {
            const auto* sig =
                std::get_if<conduit::schema::secp256k1_signature_t>(
                    &signature);
            if (sig == nullptr) {
              return false;
            }
            auto rs = compact_rs(*sig);
            if (!rs) {
              return false;
            }
            auto der = der_encode(*rs);
            if (!der) {
              return false;
            }
            auto key = make_secp256k1_key(value);
            return digest_verify(key.get(), EVP_sha256(), message, der->data(),
                                 der->size());
          },
          [](const conduit::schema::named_signer_t&) { return false; }},
      signer);
}

conduit::schema::address_t derive_address(
    const conduit::schema::signer_id_t& signer) {
  auto encoder = conduit::schema::encoding::encoder<
      conduit::schema::encoding::scale_encoder_tag>{};
  auto encoded = encoder.encode(signer);
  auto digest = conduit::blake3::hash(
      conduit::schema::bytes_view_t{encoded.data(), encoded.size()});
  auto address = conduit::schema::address_t{};
  std::copy(std::end(digest) - address.size(), std::end(digest),
            std::begin(address));
  return address;
}

}  // namespace conduit::crypto
