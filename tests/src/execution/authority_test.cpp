#include <paulette/blake3/hash.hpp>
#include <paulette/crypto/verify.hpp>
#include <paulette/execution/authority.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
#include <paulette/testing/common.hpp>
#include <paulette/testing/execution_fixture.hpp>
#include <paulette/testing/signing.hpp>
#include <gtest/gtest.h>

#include <string>
#include <tuple>

namespace {

using paulette::schema::transaction_error_code;
using paulette::testing::make_hash;
using paulette::testing::make_named_signer;

class authority_test : public ::testing::Test {
 protected:
  authority_test()
      : db_path_{paulette::testing::make_db_path("paulette_authority")},
        storage_{paulette::storage::make_storage<
            paulette::storage::rocksdb_storage_tag>(db_path_)} {}

  ~authority_test() override { paulette::testing::remove_path(db_path_); }

  paulette::execution::staged_state make_state() {
    return paulette::execution::staged_state{encoder_, storage_};
  }

  std::string db_path_;
  paulette::testing::scale_encoder_t encoder_;
  paulette::storage::storage<paulette::storage::rocksdb_storage_tag> storage_;
};

paulette::schema::new_office_t sample_listing(
    const paulette::schema::admin_auth_t& auth) {
  return paulette::testing::make_new_office(
      paulette::testing::make_office_id(1), make_hash(0xA1),
      paulette::testing::make_auction(5, 1, 900), auth);
}

const auto kRefuseAll = paulette::execution::signature_verifier_t{
    [](const paulette::schema::bytes_view_t&,
       const paulette::schema::signer_id_t&,
       const paulette::schema::signature_t&) { return false; }};

}  // namespace

TEST(authority, resolve_signer_follows_authorization_mode) {
  auto invoker = make_named_signer(1);
  auto signer = make_named_signer(2);
  EXPECT_EQ(paulette::execution::resolve_signer(
                invoker, paulette::schema::invoker_authorization_t{}),
            invoker);
  EXPECT_EQ(paulette::execution::resolve_signer(
                invoker,
                paulette::schema::signed_authorization_t{
                    .version = 1,
                    .signer = signer,
                    .signature = paulette::schema::ed25519_signature_t{}}),
            signer);
}

TEST(authority, signing_digest_commits_to_domain_and_arguments) {
  auto encoder = paulette::testing::scale_encoder_t{};
  auto contract = make_hash(0xC0);
  auto arguments = paulette::schema::bytes_t{0x01, 0x02};
  auto expected_payload =
      encoder.encode(std::tuple{std::string{"paulette.admin.v1"}, contract,
                                std::string{"new_office"}, uint64_t{4},
                                arguments});
  EXPECT_EQ(paulette::execution::make_signing_digest(encoder, contract,
                                                     "new_office", 4,
                                                     arguments),
            paulette::blake3::hash(paulette::testing::view(expected_payload)));
}

TEST(authority, signing_digest_separates_operations_contracts_and_nonces) {
  auto encoder = paulette::testing::scale_encoder_t{};
  auto listing =
      sample_listing(paulette::testing::signed_auth(make_named_signer(1), 0));
  auto revoke = paulette::testing::make_revoke(
      listing.office_id, listing.auction_id, listing.auction, listing.auth);

  auto base =
      paulette::execution::make_signing_digest(encoder, make_hash(1), listing);
  EXPECT_EQ(base, paulette::execution::make_signing_digest(encoder,
                                                           make_hash(1),
                                                           listing));
  EXPECT_NE(base,
            paulette::execution::make_signing_digest(encoder, make_hash(1),
                                                     revoke));
  EXPECT_NE(base,
            paulette::execution::make_signing_digest(encoder, make_hash(2),
                                                     listing));

  auto next_nonce = listing;
  next_nonce.auth.nonce = 1;
  EXPECT_NE(base, paulette::execution::make_signing_digest(
                      encoder, make_hash(1), next_nonce));

  auto other_price = listing;
  other_price.auction.start_price = 6;
  EXPECT_NE(base, paulette::execution::make_signing_digest(
                      encoder, make_hash(1), other_price));
}

TEST(authority, check_admin_rejects_non_admin_invoker) {
  auto error = paulette::execution::check_admin(
      make_named_signer(1), make_named_signer(2),
      paulette::schema::invoker_authorization_t{}, make_hash(0), {});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::unauthorized);
}

TEST(authority, check_admin_accepts_admin_invoker_without_signature_check) {
  auto error = paulette::execution::check_admin(
      make_named_signer(1), make_named_signer(1),
      paulette::schema::invoker_authorization_t{}, make_hash(0), kRefuseAll);
  EXPECT_FALSE(error.has_value());
}

TEST(authority, check_admin_checks_identity_before_signature) {
  auto auth = paulette::schema::signed_authorization_t{
      .version = 1,
      .signer = make_named_signer(2),
      .signature = paulette::schema::ed25519_signature_t{}};
  auto error = paulette::execution::check_admin(
      make_named_signer(1), make_named_signer(1), auth, make_hash(0),
      kRefuseAll);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::unauthorized);
}

TEST(authority, check_admin_reports_bad_signature) {
  auto admin = make_named_signer(1);
  auto auth = paulette::schema::signed_authorization_t{
      .version = 1,
      .signer = admin,
      .signature = paulette::schema::ed25519_signature_t{}};
  auto error = paulette::execution::check_admin(
      admin, make_named_signer(9), auth, make_hash(0), kRefuseAll);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::signature_verification_failed);

  EXPECT_FALSE(paulette::execution::check_admin(admin, make_named_signer(9),
                                                auth, make_hash(0), {})
                   .has_value());
}

TEST(authority, check_admin_verifies_real_ed25519_signature) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = paulette::testing::ed25519_key{};
  auto digest = make_hash(0x33);
  auto auth = paulette::schema::signed_authorization_t{
      .version = 1,
      .signer = key.signer(),
      .signature = key.sign(
          paulette::schema::bytes_view_t{digest.data(), digest.size()})};
  EXPECT_FALSE(paulette::execution::check_admin(
                   key.signer(), make_named_signer(9), auth, digest,
                   paulette::crypto::verify_signature)
                   .has_value());

  auto error = paulette::execution::check_admin(
      key.signer(), make_named_signer(9), auth, make_hash(0x34),
      paulette::crypto::verify_signature);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::signature_verification_failed);
}

TEST_F(authority_test, invoker_mode_requires_nonce_zero_and_stages_nothing) {
  auto state = make_state();
  auto invoker = make_named_signer(1);
  EXPECT_FALSE(paulette::execution::verify_and_consume_nonce(
                   state, invoker, paulette::schema::invoker_authorization_t{},
                   0)
                   .has_value());
  EXPECT_TRUE(state.empty());

  auto error = paulette::execution::verify_and_consume_nonce(
      state, invoker, paulette::schema::invoker_authorization_t{}, 1);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::invoker_nonce_mismatch);
}

TEST_F(authority_test, signed_mode_consumes_expected_nonce) {
  auto state = make_state();
  auto signer = make_named_signer(5);
  auto auth = paulette::schema::signed_authorization_t{
      .version = 1,
      .signer = signer,
      .signature = paulette::schema::ed25519_signature_t{}};

  EXPECT_EQ(paulette::execution::stored_nonce(state, signer), 0u);
  EXPECT_FALSE(paulette::execution::verify_and_consume_nonce(
                   state, make_named_signer(9), auth, 0)
                   .has_value());
  EXPECT_EQ(paulette::execution::stored_nonce(state, signer), 1u);
  EXPECT_EQ(paulette::execution::stored_nonce(state, make_named_signer(9)), 0u);

  auto replay = paulette::execution::verify_and_consume_nonce(
      state, make_named_signer(9), auth, 0);
  ASSERT_TRUE(replay.has_value());
  EXPECT_EQ(replay->code, transaction_error_code::incorrect_nonce);

  auto skipped = paulette::execution::verify_and_consume_nonce(
      state, make_named_signer(9), auth, 2);
  ASSERT_TRUE(skipped.has_value());
  EXPECT_EQ(skipped->code, transaction_error_code::incorrect_nonce);
  EXPECT_EQ(paulette::execution::stored_nonce(state, signer), 1u);
}
