#pragma once

#include <conduit/schema/primitives.hpp>

namespace conduit::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

bool verify_signature(const conduit::schema::bytes_view_t& message,
                      const conduit::schema::signer_id_t& signer,
                      const conduit::schema::signature_t& signature);

/// Account address of a signer: trailing 20 bytes of
/// blake3(SCALE(signer_id)). Stable across key types.
conduit::schema::address_t derive_address(
    const conduit::schema::signer_id_t& signer);

}  // namespace conduit::crypto
