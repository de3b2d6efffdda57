#pragma once

#include <provenance/schema/primitives.hpp>
#include <optional>

namespace provenance::crypto {

bool available();

/// Interpret raw public key bytes: 32 bytes is Ed25519, 33 bytes is a
/// compressed secp256k1 point that must lie on the curve. Anything else has
/// no signer.
std::optional<provenance::schema::signer_id_t> try_make_signer(
    const provenance::schema::bytes_view_t& public_key);

/// Shape signature bytes for `signer`. secp256k1 accepts 64-byte compact
/// `r || s` or 65-byte `r || s || v`; the recovery byte is not used.
std::optional<provenance::schema::signature_t> try_make_signature(
    const provenance::schema::signer_id_t& signer,
    const provenance::schema::bytes_view_t& signature);

bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::signer_id_t& signer,
                      const provenance::schema::signature_t& signature);

bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::bytes_view_t& public_key,
                      const provenance::schema::bytes_view_t& signature);

}  // namespace provenance::crypto
