#include <gtest/gtest.h>
#include <paulette/blake3/hash.hpp>
#include <paulette/execution/authority.hpp>
#include <paulette/schema/primitives.hpp>
#include <paulette/schema/transaction.hpp>
#include <paulette/testing/common.hpp>
#include <paulette/testing/execution_fixture.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <sys/wait.h>

#ifndef PAULETTE_TRANSACTION_BUILDER_PATH
#define PAULETTE_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

constexpr auto kAdmin =
    "named:ad00000000000000000000000000000000000000000000000000000000000000";
constexpr auto kBuyer =
    "named:b100000000000000000000000000000000000000000000000000000000000000";
constexpr auto kTokenId =
    "707172737475767778797a7b7c7d7e7f808182838485868788898a8b8c8d8e8f";
constexpr auto kOfficeId = "0f0e0d0c0b0a09080706050403020100";
constexpr auto kAuctionId =
    "a1a2a3a4a5a6a7a8a9aaabacadaeafb0b1b2b3b4b5b6b7b8b9babbbcbdbebfc0";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{PAULETTE_TRANSACTION_BUILDER_PATH};
}

bool builder_available() {
  auto builder = builder_path();
  return !builder.empty() && std::filesystem::exists(builder);
}

paulette::schema::transaction_t decode_transaction(const std::string& base64) {
  return paulette::testing::decode_value<paulette::schema::transaction_t>(
      paulette::schema::from_base64(base64));
}

std::string listing_args() {
  return std::string{"--office-id "} + kOfficeId + " --auction-id " +
         kAuctionId + " --start-price 5 --min-price 1 --slope 900";
}

}  // namespace

TEST(transaction_builder, builds_initialize_transaction) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto output = run_command(builder_path(), "transaction",
                            std::string{"--payload initialize --invoker "} +
                                kAdmin + " --admin " + kAdmin +
                                " --token-id " + kTokenId + " --tax 20");
  auto tx = decode_transaction(output);
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.invoker, paulette::testing::make_named_signer(0xAD));
  const auto* op = std::get_if<paulette::schema::initialize_t>(&tx.payload);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->admin, paulette::testing::make_named_signer(0xAD));
  EXPECT_EQ(op->token_id, paulette::schema::make_hash32(kTokenId));
  EXPECT_EQ(op->tax, 20);
}

TEST(transaction_builder, listing_uses_invoker_mode_without_signer) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto output = run_command(
      builder_path(), "tx",
      std::string{"--payload new_office --invoker "} + kAdmin + " " +
          listing_args());
  auto tx = decode_transaction(output);
  const auto* op = std::get_if<paulette::schema::new_office_t>(&tx.payload);
  ASSERT_NE(op, nullptr);
  EXPECT_TRUE(std::holds_alternative<paulette::schema::invoker_authorization_t>(
      op->auth.authorization));
  EXPECT_EQ(op->auth.nonce, 0u);
  EXPECT_EQ(op->office_id, paulette::schema::make_office_id(kOfficeId));
  EXPECT_EQ(op->auction.slope, 900);
}

TEST(transaction_builder, signed_revoke_carries_signer_signature_and_nonce) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto signature = std::string(128, 'a');
  auto output = run_command(
      builder_path(), "transaction",
      std::string{"--payload revoke --invoker "} + kBuyer + " --signer " +
          kAdmin + " --nonce 4 --signature-hex " + signature + " " +
          listing_args());
  auto tx = decode_transaction(output);
  const auto* op = std::get_if<paulette::schema::revoke_office_t>(&tx.payload);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->auth.nonce, 4u);
  const auto* signed_auth =
      std::get_if<paulette::schema::signed_authorization_t>(
          &op->auth.authorization);
  ASSERT_NE(signed_auth, nullptr);
  EXPECT_EQ(signed_auth->signer, paulette::testing::make_named_signer(0xAD));
  const auto* bytes =
      std::get_if<paulette::schema::ed25519_signature_t>(
          &signed_auth->signature);
  ASSERT_NE(bytes, nullptr);
  EXPECT_EQ((*bytes)[0], 0xAA);
  EXPECT_EQ((*bytes)[63], 0xAA);
}

TEST(transaction_builder, signing_digest_matches_engine_digest) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto contract = paulette::testing::make_hash(0xC0);
  auto contract_hex = paulette::schema::to_hex(
      paulette::schema::bytes_view_t{contract.data(), contract.size()});
  auto output = run_command(
      builder_path(), "signing-digest",
      "--payload new_office --contract-id " + contract_hex + " --signer " +
          kAdmin + " --nonce 2 " + listing_args());

  auto encoder = paulette::testing::scale_encoder_t{};
  auto listing = paulette::testing::make_new_office(
      paulette::schema::make_office_id(kOfficeId),
      paulette::schema::make_hash32(kAuctionId),
      paulette::testing::make_auction(5, 1, 900),
      paulette::testing::signed_auth(
          paulette::testing::make_named_signer(0xAD), 2));
  auto digest =
      paulette::execution::make_signing_digest(encoder, contract, listing);
  EXPECT_EQ(output, paulette::schema::to_hex(paulette::schema::bytes_view_t{
                        digest.data(), digest.size()}));
}

TEST(transaction_builder, query_data_encodes_route_arguments) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto price = run_command(builder_path(), "query-data",
                           std::string{"--path /office/price --office-id "} +
                               kOfficeId);
  EXPECT_EQ(paulette::schema::from_base64(price),
            paulette::schema::from_hex(kOfficeId));

  auto range = run_command(builder_path(), "query-data",
                           "--path /history/range --from 2 --to 7");
  auto [from, to] =
      paulette::testing::decode_value<std::tuple<uint64_t, uint64_t>>(
          paulette::schema::from_base64(range));
  EXPECT_EQ(from, 2u);
  EXPECT_EQ(to, 7u);

  auto nonce =
      run_command(builder_path(), "query-data", "--path /admin/nonce");
  EXPECT_TRUE(nonce.empty());
}

TEST(transaction_builder, contract_id_hashes_name) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto output =
      run_command(builder_path(), "contract-id", "--name office-ledger");
  auto expected = paulette::blake3::hash(std::string_view{"office-ledger"});
  EXPECT_EQ(output, paulette::schema::to_hex(paulette::schema::bytes_view_t{
                        expected.data(), expected.size()}));
}

TEST(transaction_builder, rejects_malformed_identity) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto [exit_code, output] = run_capture(
      shell_quote(builder_path()) +
      " transaction --payload buy --invoker named:zz --buyer named:zz"
      " --office-id " +
      kOfficeId + " 2>/dev/null");
  EXPECT_NE(exit_code, 0);
}

TEST(transaction_builder, built_transactions_execute_on_the_engine) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction builder binary not available: "
                 << builder_path();
  }
  auto fixture =
      paulette::testing::execution_fixture{"paulette_tools_execute"};
  auto init = run_command(builder_path(), "transaction",
                          std::string{"--payload initialize --invoker "} +
                              kAdmin + " --admin " + kAdmin + " --token-id " +
                              kTokenId + " --tax 20");
  auto listing = run_command(
      builder_path(), "transaction",
      std::string{"--payload new_office --invoker "} + kAdmin + " " +
          listing_args());

  for (const auto& encoded : {init, listing}) {
    auto raw = paulette::schema::from_base64(encoded);
    auto result = fixture.engine().execute(paulette::testing::view(raw));
    EXPECT_EQ(result.code, 0u) << result.info;
  }
  EXPECT_EQ(fixture.engine().info().last_sequence, 2u);
}
