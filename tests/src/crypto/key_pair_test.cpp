#include <gtest/gtest.h>
#include <provenance/crypto/key_pair.hpp>
#include <provenance/crypto/verify.hpp>

#include <string_view>
#include <vector>

namespace {

using provenance::schema::signature_scheme;

provenance::schema::bytes_t make_message() {
  return provenance::schema::make_bytes(std::string_view{"sensor-frame-0001"});
}

}  // namespace

TEST(crypto_key_pair, ed25519_keys_sign_and_verify) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = provenance::crypto::key_pair::generate(signature_scheme::ed25519);
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->scheme(), signature_scheme::ed25519);
  EXPECT_EQ(key->public_key().size(), 32u);
  EXPECT_EQ(key->private_key().size(), 32u);

  auto message = make_message();
  auto signature = key->sign(provenance::schema::make_bytes_view(message));
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(signature->size(), 64u);
  EXPECT_TRUE(provenance::crypto::verify_signature(
      provenance::schema::make_bytes_view(message),
      provenance::schema::make_bytes_view(key->public_key()),
      provenance::schema::make_bytes_view(*signature)));

  message[0] ^= 0x01;
  EXPECT_FALSE(provenance::crypto::verify_signature(
      provenance::schema::make_bytes_view(message),
      provenance::schema::make_bytes_view(key->public_key()),
      provenance::schema::make_bytes_view(*signature)));
}

TEST(crypto_key_pair, secp256k1_keys_sign_compact_signatures) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key =
      provenance::crypto::key_pair::generate(signature_scheme::secp256k1);
  ASSERT_TRUE(key.has_value());
  ASSERT_EQ(key->public_key().size(), 33u);
  EXPECT_TRUE(key->public_key()[0] == 0x02 || key->public_key()[0] == 0x03);

  auto message = make_message();
  auto signature = key->sign(provenance::schema::make_bytes_view(message));
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(signature->size(), 64u);
  EXPECT_TRUE(provenance::crypto::verify_signature(
      provenance::schema::make_bytes_view(message),
      provenance::schema::make_bytes_view(key->public_key()),
      provenance::schema::make_bytes_view(*signature)));

  // Trailing recovery byte, as produced by most wallets.
  auto with_recovery = *signature;
  with_recovery.push_back(27);
  EXPECT_TRUE(provenance::crypto::verify_signature(
      provenance::schema::make_bytes_view(message),
      provenance::schema::make_bytes_view(key->public_key()),
      provenance::schema::make_bytes_view(with_recovery)));
}

TEST(crypto_key_pair, private_key_import_reproduces_public_key) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  for (auto scheme : {signature_scheme::ed25519, signature_scheme::secp256k1}) {
    auto original = provenance::crypto::key_pair::generate(scheme);
    ASSERT_TRUE(original.has_value());
    auto secret = original->private_key();
    auto imported = provenance::crypto::key_pair::from_private_key(
        scheme, provenance::schema::make_bytes_view(secret));
    ASSERT_TRUE(imported.has_value());
    EXPECT_EQ(imported->public_key(), original->public_key());
    EXPECT_EQ(imported->private_key(), secret);

    auto message = make_message();
    auto signature =
        imported->sign(provenance::schema::make_bytes_view(message));
    ASSERT_TRUE(signature.has_value());
    EXPECT_TRUE(provenance::crypto::verify_signature(
        provenance::schema::make_bytes_view(message),
        provenance::schema::make_bytes_view(original->public_key()),
        provenance::schema::make_bytes_view(*signature)));
  }
}

TEST(crypto_key_pair, rejects_malformed_private_keys) {
  auto short_key = provenance::schema::bytes_t(31, 0x11);
  EXPECT_FALSE(provenance::crypto::key_pair::from_private_key(
                   signature_scheme::ed25519,
                   provenance::schema::make_bytes_view(short_key))
                   .has_value());

  auto zero_scalar = provenance::schema::bytes_t(32, 0x00);
  EXPECT_FALSE(provenance::crypto::key_pair::from_private_key(
                   signature_scheme::secp256k1,
                   provenance::schema::make_bytes_view(zero_scalar))
                   .has_value());

  // Above the secp256k1 group order.
  auto oversized_scalar = provenance::schema::bytes_t(32, 0xFF);
  EXPECT_FALSE(provenance::crypto::key_pair::from_private_key(
                   signature_scheme::secp256k1,
                   provenance::schema::make_bytes_view(oversized_scalar))
                   .has_value());
}

TEST(crypto_key_pair, signature_from_other_key_does_not_verify) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer =
      provenance::crypto::key_pair::generate(signature_scheme::ed25519);
  auto other =
      provenance::crypto::key_pair::generate(signature_scheme::ed25519);
  ASSERT_TRUE(signer.has_value());
  ASSERT_TRUE(other.has_value());

  auto message = make_message();
  auto signature = signer->sign(provenance::schema::make_bytes_view(message));
  ASSERT_TRUE(signature.has_value());
  EXPECT_FALSE(provenance::crypto::verify_signature(
      provenance::schema::make_bytes_view(message),
      provenance::schema::make_bytes_view(other->public_key()),
      provenance::schema::make_bytes_view(*signature)));
}
