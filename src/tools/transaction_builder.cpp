#include <boost/program_options.hpp>
#include <paulette/blake3/hash.hpp>
#include <paulette/common/critical.hpp>
#include <paulette/execution/authority.hpp>
#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = paulette::schema::encoding::encoder<
    paulette::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    paulette::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

template <size_t N>
std::array<uint8_t, N> parse_fixed(const std::string_view hex,
                                   const std::string_view what) {
  auto bytes = paulette::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    paulette::common::critical(std::string{what} + " must be " +
                               std::to_string(N) + " bytes of hex");
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

// Identities are written kind:hex with kind one of ed25519, secp256k1 or
// named. A bare hex value is a named identity.
paulette::schema::signer_id_t parse_identity(const std::string_view text) {
  auto separator = text.find(':');
  auto kind = separator == std::string_view::npos ? std::string_view{"named"}
                                                  : text.substr(0, separator);
  auto hex = separator == std::string_view::npos ? text
                                                 : text.substr(separator + 1);
  if (kind == "ed25519") {
    return paulette::schema::ed25519_signer_id{
        .public_key = parse_fixed<32>(hex, "ed25519 key")};
  }
  if (kind == "secp256k1") {
    return paulette::schema::secp256k1_signer_id{
        .public_key = parse_fixed<33>(hex, "secp256k1 key")};
  }
  if (kind == "named") {
    return paulette::schema::signer_id_t{
        std::in_place_type<paulette::schema::named_signer_t>,
        parse_fixed<32>(hex, "named identity")};
  }
  paulette::common::critical("identity kind must be ed25519|secp256k1|named");
}

paulette::schema::amount_t parse_amount(const po::variables_map& vm,
                                        const std::string& name) {
  auto amount = paulette::schema::try_make_amount(require(vm, name));
  if (!amount) {
    paulette::common::critical("--" + name + " must be a decimal amount");
  }
  return *amount;
}

paulette::schema::office_id_t get_office_id(const po::variables_map& vm) {
  return parse_fixed<16>(require(vm, "office-id"), "office id");
}

paulette::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  return parse_fixed<32>(require(vm, name), name);
}

paulette::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = require(vm, "signature-hex");
  if (kind == "ed25519") {
    return parse_fixed<64>(hex, "ed25519 signature");
  }
  if (kind == "secp256k1") {
    return parse_fixed<65>(hex, "secp256k1 signature");
  }
  paulette::common::critical("signature-kind must be ed25519|secp256k1");
}

// Signed when --signer is given, invoker mode otherwise.
paulette::schema::admin_auth_t make_admin_auth(const po::variables_map& vm) {
  auto auth = paulette::schema::admin_auth_t{};
  auth.nonce = vm["nonce"].as<uint64_t>();
  if (vm.contains("signer")) {
    auto signed_auth = paulette::schema::signed_authorization_t{};
    signed_auth.signer = parse_identity(require(vm, "signer"));
    signed_auth.signature = vm.contains("signature-hex")
                                ? make_signature(vm)
                                : paulette::schema::signature_t{};
    auth.authorization = signed_auth;
  } else {
    auth.authorization = paulette::schema::invoker_authorization_t{};
  }
  return auth;
}

paulette::schema::auction_parameters_t make_auction(
    const po::variables_map& vm) {
  auto auction = paulette::schema::auction_parameters_t{};
  auction.start_price = parse_amount(vm, "start-price");
  auction.min_price = parse_amount(vm, "min-price");
  auction.slope = parse_amount(vm, "slope");
  return auction;
}

template <typename Listing>
Listing make_listing(const po::variables_map& vm) {
  auto listing = Listing{};
  listing.auth = make_admin_auth(vm);
  listing.office_id = get_office_id(vm);
  listing.auction_id = get_hash32(vm, "auction-id");
  listing.auction = make_auction(vm);
  return listing;
}

paulette::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = require(vm, "payload");
  if (payload == "initialize") {
    auto op = paulette::schema::initialize_t{};
    op.admin = parse_identity(require(vm, "admin"));
    op.token_id = get_hash32(vm, "token-id");
    op.tax = parse_amount(vm, "tax");
    return op;
  }
  if (payload == "new_office") {
    return make_listing<paulette::schema::new_office_t>(vm);
  }
  if (payload == "revoke") {
    return make_listing<paulette::schema::revoke_office_t>(vm);
  }
  if (payload == "buy") {
    auto op = paulette::schema::buy_office_t{};
    op.office_id = get_office_id(vm);
    op.buyer = parse_identity(require(vm, "buyer"));
    return op;
  }
  if (payload == "pay_tax") {
    auto op = paulette::schema::pay_tax_t{};
    op.office_id = get_office_id(vm);
    op.payer = parse_identity(require(vm, "payer"));
    return op;
  }
  paulette::common::critical(
      "payload must be initialize|new_office|buy|pay_tax|revoke");
}

paulette::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = require(vm, "path");
  if (path == "/admin/nonce" || path == "/contract/config" ||
      path == "/vault/balance" || path == "/engine/info") {
    return {};
  }
  if (path == "/office/price" || path == "/office/state") {
    return encoder.encode(get_office_id(vm));
  }
  if (path == "/history/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  paulette::common::critical("unsupported query path");
}

paulette::schema::hash32_t build_signing_digest(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto contract_id = get_hash32(vm, "contract-id");
  auto payload = require(vm, "payload");
  if (payload == "new_office") {
    return paulette::execution::make_signing_digest(
        encoder, contract_id, make_listing<paulette::schema::new_office_t>(vm));
  }
  if (payload == "revoke") {
    return paulette::execution::make_signing_digest(
        encoder, contract_id,
        make_listing<paulette::schema::revoke_office_t>(vm));
  }
  paulette::common::critical("only new_office and revoke are admin signed");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  paulette_tx transaction [options]\n"
            << "  paulette_tx query-data [options]\n"
            << "  paulette_tx signing-digest [options]\n"
            << "  paulette_tx contract-id --name <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"paulette_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-data|signing-digest|contract-id")(
      "payload", po::value<std::string>(),
      "initialize|new_office|buy|pay_tax|revoke")(
      "invoker", po::value<std::string>(), "calling identity kind:hex")(
      "path", po::value<std::string>(), "query path")(
      "contract-id", po::value<std::string>(), "32-byte contract id hex")(
      "name", po::value<std::string>(), "contract name to derive an id from")(
      "nonce", po::value<uint64_t>()->default_value(0), "admin nonce")(
      "signer", po::value<std::string>(),
      "admin signer kind:hex; omit for invoker mode")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex", po::value<std::string>(),
                           "signature bytes hex")(
      "admin", po::value<std::string>(), "administrator kind:hex")(
      "token-id", po::value<std::string>(), "32-byte token id hex")(
      "tax", po::value<std::string>(), "tax per renewal period")(
      "office-id", po::value<std::string>(), "16-byte office id hex")(
      "auction-id", po::value<std::string>(), "32-byte auction id hex")(
      "start-price", po::value<std::string>(), "auction start price")(
      "min-price", po::value<std::string>(), "auction floor price")(
      "slope", po::value<std::string>(), "seconds per unit of price decay")(
      "buyer", po::value<std::string>(), "buyer kind:hex")(
      "payer", po::value<std::string>(), "tax payer kind:hex")(
      "from", po::value<uint64_t>()->default_value(1), "history range from")(
      "to", po::value<uint64_t>()->default_value(1), "history range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto transaction = paulette::schema::transaction_t{};
    transaction.invoker = parse_identity(require(vm, "invoker"));
    transaction.payload = build_payload(vm);
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << paulette::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-data") {
    std::cout << paulette::schema::to_base64(build_query_data(vm)) << '\n';
    return 0;
  }

  if (command == "signing-digest") {
    auto digest = build_signing_digest(vm);
    std::cout << paulette::schema::to_hex(
                     paulette::schema::bytes_view_t{digest})
              << '\n';
    return 0;
  }

  if (command == "contract-id") {
    auto contract_id = paulette::blake3::hash(std::string_view{require(vm, "name")});
    std::cout << paulette::schema::to_hex(
                     paulette::schema::bytes_view_t{contract_id})
              << '\n';
    return 0;
  }

  paulette::common::critical(
      "command must be transaction|query-data|signing-digest|contract-id");
}
