#include <provenance/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace provenance::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool openssl_has_secp256k1() {
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  return static_cast<bool>(ctx);
}

bool verify_ed25519(const provenance::schema::bytes_view_t& message,
                    const provenance::schema::ed25519_signer_id& signer,
                    const provenance::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

// Recovery ids are small values (0..3) or legacy Ethereum style (27+).
bool is_recovery_id(const uint8_t value) {
  return value <= 3 || value >= 27;
}

// Values in 4..26 mark neither end as the recovery byte.
std::optional<std::array<uint8_t, 64>> canonical_secp_signature(
    const provenance::schema::secp256k1_signature_t& signature) {
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

// Parses a compressed point; fails for encodings that are not on the curve.
evp_pkey_ptr make_secp256k1_public_key(
    const std::array<uint8_t, 33>& public_key) {
  auto pkey = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return pkey;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) == 1) {
    pkey.reset(raw_pkey);
  }
  return pkey;
}

bool verify_secp256k1(
    const provenance::schema::bytes_view_t& message,
    const provenance::schema::secp256k1_signer_id& signer,
    const provenance::schema::secp256k1_signature_t& signature) {
  auto compact_signature = canonical_secp_signature(signature);
  if (!compact_signature.has_value()) {
    return false;
  }

  auto pkey = make_secp256k1_public_key(signer.public_key);
  if (!pkey) {
    return false;
  }

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }

  auto r =
      bignum_ptr{BN_bin2bn(compact_signature->data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact_signature->data() + 32, 32, nullptr),
                      BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return false;
  }
  // ECDSA_SIG now owns r and s.
  r.release();
  s.release();

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

std::optional<provenance::schema::signer_id_t> try_make_signer(
    const provenance::schema::bytes_view_t& public_key) {
  if (public_key.size() == 32) {
    auto signer = provenance::schema::ed25519_signer_id{};
    std::copy(std::begin(public_key), std::end(public_key),
              std::begin(signer.public_key));
    return provenance::schema::signer_id_t{signer};
  }
  if (public_key.size() == 33 &&
      (public_key[0] == 0x02 || public_key[0] == 0x03)) {
    auto signer = provenance::schema::secp256k1_signer_id{};
    std::copy(std::begin(public_key), std::end(public_key),
              std::begin(signer.public_key));
    if (!make_secp256k1_public_key(signer.public_key)) {
      return std::nullopt;
    }
    return provenance::schema::signer_id_t{signer};
  }
  return std::nullopt;
}

std::optional<provenance::schema::signature_t> try_make_signature(
    const provenance::schema::signer_id_t& signer,
    const provenance::schema::bytes_view_t& signature) {
  return std::visit(
      overloaded{
          [&](const provenance::schema::ed25519_signer_id&)
              -> std::optional<provenance::schema::signature_t> {
            if (signature.size() != 64) {
              return std::nullopt;
            }
            auto out = provenance::schema::ed25519_signature_t{};
            std::copy(std::begin(signature), std::end(signature),
                      std::begin(out));
            return provenance::schema::signature_t{out};
          },
          [&](const provenance::schema::secp256k1_signer_id&)
              -> std::optional<provenance::schema::signature_t> {
            auto out = provenance::schema::secp256k1_signature_t{};
            if (signature.size() == 64) {
              out[0] = 0;
              std::copy(std::begin(signature), std::end(signature),
                        std::begin(out) + 1);
              return provenance::schema::signature_t{out};
            }
            // r || s || v; stored as 0 || r || s once v is checked.
            if (signature.size() == 65 && is_recovery_id(signature[64])) {
              out[0] = 0;
              std::copy_n(std::begin(signature), 64, std::begin(out) + 1);
              return provenance::schema::signature_t{out};
            }
            return std::nullopt;
          }},
      signer);
}

bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::signer_id_t& signer,
                      const provenance::schema::signature_t& signature) {
  auto verified = false;
  std::visit(
      overloaded{
          [&](const provenance::schema::ed25519_signer_id& value) {
            if (!std::holds_alternative<
                    provenance::schema::ed25519_signature_t>(signature)) {
              return;
            }
            verified = verify_ed25519(
                message, value,
                std::get<provenance::schema::ed25519_signature_t>(signature));
          },
          [&](const provenance::schema::secp256k1_signer_id& value) {
            if (!std::holds_alternative<
                    provenance::schema::secp256k1_signature_t>(signature)) {
              return;
            }
            verified = verify_secp256k1(
                message, value,
                std::get<provenance::schema::secp256k1_signature_t>(
                    signature));
          }},
      signer);
  return verified;
}

bool verify_signature(const provenance::schema::bytes_view_t& message,
                      const provenance::schema::bytes_view_t& public_key,
                      const provenance::schema::bytes_view_t& signature) {
  auto signer = try_make_signer(public_key);
  if (!signer) {
    return false;
  }
  auto shaped = try_make_signature(*signer, signature);
  if (!shaped) {
    return false;
  }
  return verify_signature(message, *signer, *shaped);
}

}  // namespace provenance::crypto
