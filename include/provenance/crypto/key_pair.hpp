#pragma once

#include <openssl/types.h>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/signature_scheme.hpp>
#include <memory>
#include <optional>

namespace provenance::crypto {

/// Private signing key held by devices and administrators. Public keys are
/// exported in the raw form accepted by `try_make_signer`; signatures in the
/// form accepted by `try_make_signature` (secp256k1 as compact `r || s`).
class key_pair final {
 public:
  static std::optional<key_pair> generate(
      provenance::schema::signature_scheme scheme);
  static std::optional<key_pair> from_private_key(
      provenance::schema::signature_scheme scheme,
      const provenance::schema::bytes_view_t& private_key);

  provenance::schema::signature_scheme scheme() const { return scheme_; }
  const provenance::schema::bytes_t& public_key() const { return public_key_; }
  provenance::schema::bytes_t private_key() const;

  std::optional<provenance::schema::bytes_t> sign(
      const provenance::schema::bytes_view_t& message) const;

 private:
  key_pair(provenance::schema::signature_scheme scheme,
           std::shared_ptr<EVP_PKEY> pkey,
           provenance::schema::bytes_t public_key);

  provenance::schema::signature_scheme scheme_;
  std::shared_ptr<EVP_PKEY> pkey_;
  provenance::schema::bytes_t public_key_;
};

}  // namespace provenance::crypto
