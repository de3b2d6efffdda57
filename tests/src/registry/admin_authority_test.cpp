#include <gtest/gtest.h>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/schema/key/ledger_keys.hpp>
#include <provenance/testing/ledger_fixture.hpp>

#include <string>

namespace {

using provenance::schema::admin_operation;
using provenance::schema::error_code;
using provenance::testing::make_hash;

provenance::schema::bytes_t make_subject(const uint8_t seed) {
  return provenance::registry::make_set_device_active_subject(make_hash(seed),
                                                              false);
}

}  // namespace

TEST(admin_authority, accepts_grant_and_advances_nonce) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_accept"};
  auto& authority = fixture.authority();
  EXPECT_EQ(authority.next_nonce(), 1u);

  auto subject = make_subject(1);
  auto grant = fixture.grant(admin_operation::set_device_active, subject);
  EXPECT_EQ(grant.nonce, 1u);
  auto outcome = authority.authorize(admin_operation::set_device_active,
                                     provenance::schema::make_bytes_view(subject),
                                     grant);
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(authority.next_nonce(), 2u);

  const auto& [key, value] = *outcome.value;
  EXPECT_EQ(key, provenance::schema::key::make_prefix_key(
                     provenance::schema::key::kAdminNonceKey));
  EXPECT_EQ(value, fixture.encoder().encode(uint64_t{2}));
}

TEST(admin_authority, replayed_grant_is_rejected) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_replay"};
  auto& authority = fixture.authority();
  auto subject = make_subject(2);
  auto view = provenance::schema::make_bytes_view(subject);
  auto grant = fixture.grant(admin_operation::set_device_active, subject);

  ASSERT_TRUE(
      authority.authorize(admin_operation::set_device_active, view, grant).ok());
  auto replay =
      authority.authorize(admin_operation::set_device_active, view, grant);
  EXPECT_EQ(replay.code, error_code::admin_nonce_mismatch);
  EXPECT_EQ(replay.kind(), provenance::schema::error_kind::authorization);
  EXPECT_EQ(replay.codespace, provenance::registry::kAdminCodespace);
  EXPECT_EQ(authority.next_nonce(), 2u);
}

TEST(admin_authority, grant_signed_by_other_key_does_not_consume_nonce) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_wrong"};
  auto& authority = fixture.authority();
  auto impostor = provenance::crypto::key_pair::generate(
      provenance::schema::signature_scheme::ed25519);
  ASSERT_TRUE(impostor.has_value());

  auto subject = make_subject(3);
  auto view = provenance::schema::make_bytes_view(subject);
  auto forged = provenance::testing::make_grant(
      *impostor, authority, admin_operation::set_device_active, subject);
  auto outcome =
      authority.authorize(admin_operation::set_device_active, view, forged);
  EXPECT_EQ(outcome.code, error_code::admin_signature_invalid);
  EXPECT_EQ(authority.next_nonce(), 1u);

  auto genuine = fixture.grant(admin_operation::set_device_active, subject);
  EXPECT_TRUE(
      authority.authorize(admin_operation::set_device_active, view, genuine)
          .ok());
}

TEST(admin_authority, grant_is_bound_to_operation_and_subject) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_bound"};
  auto& authority = fixture.authority();
  auto subject = make_subject(4);
  auto grant = fixture.grant(admin_operation::set_device_active, subject);

  auto other_subject = make_subject(5);
  EXPECT_EQ(authority
                .authorize(admin_operation::set_device_active,
                           provenance::schema::make_bytes_view(other_subject),
                           grant)
                .code,
            error_code::admin_signature_invalid);
  EXPECT_EQ(authority
                .authorize(admin_operation::set_verifier_active,
                           provenance::schema::make_bytes_view(subject), grant)
                .code,
            error_code::admin_signature_invalid);

  auto malformed = grant;
  malformed.signature.resize(10);
  EXPECT_EQ(authority
                .authorize(admin_operation::set_device_active,
                           provenance::schema::make_bytes_view(subject),
                           malformed)
                .code,
            error_code::admin_signature_invalid);
  EXPECT_EQ(authority.next_nonce(), 1u);
}

TEST(admin_authority, future_nonce_is_rejected) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_future"};
  auto& authority = fixture.authority();
  auto subject = make_subject(6);
  auto grant = provenance::schema::admin_grant_t{};
  grant.nonce = 5;
  auto challenge = provenance::registry::make_admin_challenge(
      admin_operation::set_device_active,
      provenance::schema::make_bytes_view(subject), grant.nonce);
  grant.signature =
      fixture.admin().sign(provenance::schema::make_bytes_view(challenge)).value();

  auto outcome = authority.authorize(
      admin_operation::set_device_active,
      provenance::schema::make_bytes_view(subject), grant);
  EXPECT_EQ(outcome.code, error_code::admin_nonce_mismatch);
}

TEST(admin_authority, nonce_survives_restart) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_restart"};
  for (uint8_t seed = 10; seed < 13; ++seed) {
    auto subject = make_subject(seed);
    auto grant = fixture.grant(admin_operation::set_device_active, subject);
    auto outcome = fixture.authority().authorize(
        admin_operation::set_device_active,
        provenance::schema::make_bytes_view(subject), grant);
    ASSERT_TRUE(outcome.ok());
    fixture.storage().commit_batch({*outcome.value});
  }
  EXPECT_EQ(fixture.authority().next_nonce(), 4u);

  fixture.reopen();
  EXPECT_EQ(fixture.authority().next_nonce(), 4u);
}

TEST(admin_authority, nonce_is_persisted_with_the_mutation) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_admin_batch"};

  // An accepted grant whose row never reaches storage is not durable.
  auto subject = make_subject(30);
  auto grant = fixture.grant(admin_operation::set_device_active, subject);
  ASSERT_TRUE(fixture.authority()
                  .authorize(admin_operation::set_device_active,
                             provenance::schema::make_bytes_view(subject),
                             grant)
                  .ok());
  fixture.reopen();
  EXPECT_EQ(fixture.authority().next_nonce(), 1u);

  ASSERT_TRUE(fixture.register_verifier(make_hash(31)).ok());
  ASSERT_TRUE(fixture.set_verifier_active(make_hash(31), false).ok());
  fixture.reopen();
  EXPECT_EQ(fixture.authority().next_nonce(), 3u);
  ASSERT_TRUE(fixture.registry().get_verifier(make_hash(31)).ok());
  EXPECT_FALSE(fixture.registry().is_verifier_active(make_hash(31)));
}

TEST(admin_authority, secp256k1_administrator_is_supported) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{
      "provenance_admin_secp", provenance::schema::signature_scheme::secp256k1};
  EXPECT_TRUE(std::holds_alternative<provenance::schema::secp256k1_signer_id>(
      fixture.authority().administrator()));

  auto subject = make_subject(20);
  auto grant = fixture.grant(admin_operation::set_device_active, subject);
  EXPECT_TRUE(fixture.authority()
                  .authorize(admin_operation::set_device_active,
                             provenance::schema::make_bytes_view(subject), grant)
                  .ok());
}
