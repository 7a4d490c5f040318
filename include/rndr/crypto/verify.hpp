#pragma once

#include <rndr/schema/primitives.hpp>

namespace rndr::crypto {

bool available();

bool verify_signature(const rndr::schema::bytes_view_t& message,
                      const rndr::schema::signer_id_t& signer,
                      const rndr::schema::signature_t& signature);

/// Ledger address of a signer.
///
/// Key signers map to the trailing 20 bytes of blake3(public key); a named
/// signer already is an address.
rndr::schema::address_t signer_address(const rndr::schema::signer_id_t& signer);

}  // namespace rndr::crypto
