#include <paulette/blake3/hash.hpp>
#include <paulette/crypto/verify.hpp>
#include <paulette/testing/common.hpp>
#include <paulette/testing/signing.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <vector>

namespace {

paulette::schema::bytes_view_t view_of(const std::vector<uint8_t>& bytes) {
  return paulette::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = paulette::testing::ed25519_key{};
  auto message = std::vector<uint8_t>{'o', 'f', 'f', 'i', 'c', 'e'};
  auto signature =
      paulette::schema::signature_t{key.sign(view_of(message))};

  EXPECT_TRUE(paulette::crypto::verify_signature(view_of(message),
                                                 key.signer(), signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(paulette::crypto::verify_signature(view_of(message),
                                                  key.signer(), signature));
}

TEST(crypto_verify, rejects_ed25519_signature_from_another_key) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = paulette::testing::ed25519_key{};
  auto other = paulette::testing::ed25519_key{};
  auto message = std::vector<uint8_t>{'l', 'e', 'd', 'g', 'e', 'r'};
  auto signature =
      paulette::schema::signature_t{other.sign(view_of(message))};
  EXPECT_FALSE(paulette::crypto::verify_signature(view_of(message),
                                                  key.signer(), signature));
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = paulette::testing::make_secp_fixture(
      std::vector<uint8_t>{'s', 'e', 'c', 'p', '-', 'm', 's', 'g'});
  ASSERT_TRUE(fixture.has_value());

  auto signer = paulette::schema::signer_id_t{fixture->signer};
  auto signature = paulette::schema::signature_t{fixture->signature};
  EXPECT_TRUE(paulette::crypto::verify_signature(view_of(fixture->message),
                                                 signer, signature));

  auto tampered = fixture->message;
  tampered.back() ^= 0x01;
  EXPECT_FALSE(
      paulette::crypto::verify_signature(view_of(tampered), signer, signature));
}

TEST(crypto_verify, accepts_secp256k1_recovery_byte_at_the_end) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  // Retry until r starts with a byte that cannot be mistaken for a leading
  // recovery id.
  for (auto attempt = 0; attempt < 64; ++attempt) {
    auto fixture = paulette::testing::make_secp_fixture(
        std::vector<uint8_t>{'t', 'a', 'i', 'l'});
    ASSERT_TRUE(fixture.has_value());
    const auto r0 = fixture->signature[1];
    if (r0 <= 3 || r0 >= 27) {
      continue;
    }
    auto trailing = paulette::schema::secp256k1_signature_t{};
    std::copy(std::next(std::begin(fixture->signature)),
              std::end(fixture->signature), std::begin(trailing));
    trailing[64] = 27;
    EXPECT_TRUE(paulette::crypto::verify_signature(
        view_of(fixture->message),
        paulette::schema::signer_id_t{fixture->signer},
        paulette::schema::signature_t{trailing}));
    return;
  }
  GTEST_SKIP() << "no signature with an unambiguous leading byte";
}

TEST(crypto_verify, verifies_signatures_over_blake3_digests) {
  if (!paulette::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = paulette::testing::ed25519_key{};
  auto digest = paulette::blake3::hash(std::string_view{"paulette.admin.v1"});
  auto message = paulette::schema::bytes_view_t{digest.data(), digest.size()};
  EXPECT_TRUE(paulette::crypto::verify_signature(
      message, key.signer(), paulette::schema::signature_t{key.sign(message)}));
}

TEST(crypto_verify, rejects_signature_of_the_wrong_scheme) {
  auto key = paulette::testing::ed25519_key{};
  auto message = std::vector<uint8_t>{'x'};
  EXPECT_FALSE(paulette::crypto::verify_signature(
      view_of(message), key.signer(),
      paulette::schema::signature_t{paulette::schema::secp256k1_signature_t{}}));
}

TEST(crypto_verify, named_signers_never_verify) {
  auto message = std::vector<uint8_t>{'x'};
  EXPECT_FALSE(paulette::crypto::verify_signature(
      view_of(message), paulette::testing::make_named_signer(1),
      paulette::schema::signature_t{paulette::schema::ed25519_signature_t{}}));
}

TEST(crypto_verify, rejects_malformed_secp256k1_public_key) {
  auto signer = paulette::schema::secp256k1_signer_id{};
  signer.public_key[0] = 0x05;
  auto message = std::vector<uint8_t>{'x'};
  EXPECT_FALSE(paulette::crypto::verify_signature(
      view_of(message), paulette::schema::signer_id_t{signer},
      paulette::schema::signature_t{paulette::schema::secp256k1_signature_t{}}));
}

TEST(blake3_hash, incremental_matches_one_shot) {
  auto one_shot = paulette::blake3::hash(std::string_view{"office-ledger"});
  auto incremental = paulette::blake3::hasher{}
                         .update(std::string_view{"office"})
                         .update(std::string_view{"-ledger"})
                         .finalize();
  EXPECT_EQ(one_shot, incremental);
  EXPECT_NE(one_shot, paulette::blake3::hash(std::string_view{"office"}));
}

TEST(blake3_hash, matches_published_empty_input_vector) {
  auto digest = paulette::blake3::hash(std::string_view{});
  EXPECT_EQ(paulette::schema::to_hex(
                paulette::schema::bytes_view_t{digest.data(), digest.size()}),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}
