#include <provenance/crypto/key_pair.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstring>
#include <memory>
#include <optional>
#include <vector>

namespace provenance::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

std::shared_ptr<EVP_PKEY> adopt(EVP_PKEY* pkey) {
  return std::shared_ptr<EVP_PKEY>{pkey, EVP_PKEY_free};
}

std::optional<provenance::schema::bytes_t> ed25519_public_key(EVP_PKEY* pkey) {
  auto out = provenance::schema::bytes_t(32);
  auto size = out.size();
  if (EVP_PKEY_get_raw_public_key(pkey, out.data(), &size) != 1 ||
      size != out.size()) {
    return std::nullopt;
  }
  return out;
}

// Compressed SEC1 encoding of the secp256k1 public point.
std::optional<provenance::schema::bytes_t> secp256k1_public_key(
    EVP_PKEY* pkey) {
  auto encoded = std::array<uint8_t, 65>{};
  auto size = size_t{};
  if (EVP_PKEY_get_octet_string_param(pkey, OSSL_PKEY_PARAM_PUB_KEY,
                                      encoded.data(), encoded.size(),
                                      &size) != 1) {
    return std::nullopt;
  }
  if (size == 33) {
    return provenance::schema::bytes_t{encoded.data(), encoded.data() + 33};
  }
  if (size == 65 && encoded[0] == 0x04) {
    auto out = provenance::schema::bytes_t{};
    out.reserve(33);
    out.push_back(static_cast<uint8_t>(0x02 | (encoded[64] & 0x01)));
    out.insert(std::end(out), encoded.data() + 1, encoded.data() + 33);
    return out;
  }
  return std::nullopt;
}

std::optional<provenance::schema::bytes_t> export_public_key(
    const provenance::schema::signature_scheme scheme,
    EVP_PKEY* pkey) {
  switch (scheme) {
    case provenance::schema::signature_scheme::ed25519:
      return ed25519_public_key(pkey);
    case provenance::schema::signature_scheme::secp256k1:
      return secp256k1_public_key(pkey);
  }
  return std::nullopt;
}

EVP_PKEY* secp256k1_from_private_key(
    const provenance::schema::bytes_view_t& private_key) {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_free};
  if (!group || !ctx || !scalar || BN_is_zero(scalar.get()) ||
      BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return nullptr;
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return nullptr;
  }
  auto public_key = std::array<uint8_t, 33>{};
  if (EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_COMPRESSED, public_key.data(),
                         public_key.size(), ctx.get()) != public_key.size()) {
    return nullptr;
  }

  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return nullptr;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return nullptr;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return nullptr;
  }
  auto* pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return nullptr;
  }
  return pkey;
}

std::optional<provenance::schema::bytes_t> sign_ed25519(
    EVP_PKEY* pkey,
    const provenance::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey) != 1) {
    return std::nullopt;
  }
  auto signature = provenance::schema::bytes_t(64);
  auto size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1 ||
      size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

std::optional<provenance::schema::bytes_t> sign_secp256k1(
    EVP_PKEY* pkey,
    const provenance::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) !=
          1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto compact = provenance::schema::bytes_t(64);
  if (BN_bn2binpad(r, compact.data(), 32) != 32 ||
      BN_bn2binpad(s, compact.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  return compact;
}

}  // namespace

key_pair::key_pair(const provenance::schema::signature_scheme scheme,
                   std::shared_ptr<EVP_PKEY> pkey,
                   provenance::schema::bytes_t public_key)
    : scheme_{scheme},
      pkey_{std::move(pkey)},
      public_key_{std::move(public_key)} {}

std::optional<key_pair> key_pair::generate(
    const provenance::schema::signature_scheme scheme) {
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  switch (scheme) {
    case provenance::schema::signature_scheme::ed25519: {
      auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                  EVP_PKEY_CTX_free};
      if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
          EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        spdlog::error("Ed25519 key generation failed");
        return std::nullopt;
      }
      break;
    }
    case provenance::schema::signature_scheme::secp256k1:
      raw = EVP_EC_gen("secp256k1");
      if (raw == nullptr) {
        spdlog::error("secp256k1 key generation failed");
        return std::nullopt;
      }
      break;
  }
  auto pkey = adopt(raw);
  auto public_key = export_public_key(scheme, pkey.get());
  if (!public_key) {
    return std::nullopt;
  }
  return key_pair{scheme, std::move(pkey), std::move(*public_key)};
}

std::optional<key_pair> key_pair::from_private_key(
    const provenance::schema::signature_scheme scheme,
    const provenance::schema::bytes_view_t& private_key) {
  if (private_key.size() != 32) {
    return std::nullopt;
  }
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  switch (scheme) {
    case provenance::schema::signature_scheme::ed25519:
      raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                         private_key.data(),
                                         private_key.size());
      break;
    case provenance::schema::signature_scheme::secp256k1:
      raw = secp256k1_from_private_key(private_key);
      break;
  }
  if (raw == nullptr) {
    return std::nullopt;
  }
  auto pkey = adopt(raw);
  auto public_key = export_public_key(scheme, pkey.get());
  if (!public_key) {
    return std::nullopt;
  }
  return key_pair{scheme, std::move(pkey), std::move(*public_key)};
}

provenance::schema::bytes_t key_pair::private_key() const {
  auto out = provenance::schema::bytes_t(32);
  switch (scheme_) {
    case provenance::schema::signature_scheme::ed25519: {
      auto size = out.size();
      if (EVP_PKEY_get_raw_private_key(pkey_.get(), out.data(), &size) != 1) {
        return {};
      }
      break;
    }
    case provenance::schema::signature_scheme::secp256k1: {
      auto* raw = static_cast<BIGNUM*>(nullptr);
      if (EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw) !=
          1) {
        return {};
      }
      auto scalar = bignum_ptr{raw, BN_free};
      if (BN_bn2binpad(scalar.get(), out.data(), 32) != 32) {
        return {};
      }
      break;
    }
  }
  return out;
}

std::optional<provenance::schema::bytes_t> key_pair::sign(
    const provenance::schema::bytes_view_t& message) const {
  switch (scheme_) {
    case provenance::schema::signature_scheme::ed25519:
      return sign_ed25519(pkey_.get(), message);
    case provenance::schema::signature_scheme::secp256k1:
      return sign_secp256k1(pkey_.get(), message);
  }
  return std::nullopt;
}

}  // namespace provenance::crypto
