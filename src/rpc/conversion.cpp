#include <paulette/rpc/conversion.hpp>
#include <algorithm>
#include <array>
#include <iterator>

using namespace paulette::schema;

namespace paulette::rpc {

namespace {

template <size_t N>
std::optional<std::array<uint8_t, N>> try_fixed(const std::string& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto output = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(output));
  return output;
}

template <size_t N>
std::string to_wire(const std::array<uint8_t, N>& bytes) {
  return std::string(std::begin(bytes), std::end(bytes));
}

}  // namespace

void to_proto(const signer_id_t& signer, paulette::v1::Identity* identity) {
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          identity->set_ed25519(to_wire(value.public_key));
                        },
                        [&](const secp256k1_signer_id& value) {
                          identity->set_secp256k1(to_wire(value.public_key));
                        },
                        [&](const named_signer_t& value) {
                          identity->set_named(to_wire(value));
                        }},
             signer);
}

std::optional<signer_id_t> try_from_proto(
    const paulette::v1::Identity& identity) {
  if (identity.has_ed25519()) {
    if (auto key = try_fixed<32>(identity.ed25519())) {
      return signer_id_t{ed25519_signer_id{.public_key = *key}};
    }
  } else if (identity.has_secp256k1()) {
    if (auto key = try_fixed<33>(identity.secp256k1())) {
      return signer_id_t{secp256k1_signer_id{.public_key = *key}};
    }
  } else if (identity.has_named()) {
    if (auto key = try_fixed<32>(identity.named())) {
      return signer_id_t{std::in_place_type<named_signer_t>, *key};
    }
  }
  return std::nullopt;
}

std::string to_proto(const hash32_t& hash) {
  return to_wire(hash);
}

std::optional<hash32_t> try_hash32_from_proto(const std::string& bytes) {
  return try_fixed<32>(bytes);
}

void to_proto(const transaction_result_t& result,
              paulette::v1::SubmitResponse* response) {
  response->set_code(result.code);
  response->set_data(make_string(result.data));
  response->set_log(result.log);
  response->set_info(result.info);
  response->set_codespace(result.codespace);
  for (const auto& event : result.events) {
    auto* proto_event = response->add_events();
    proto_event->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* proto_attribute = proto_event->add_attributes();
      proto_attribute->set_key(attribute.key);
      proto_attribute->set_value(attribute.value);
      proto_attribute->set_index(attribute.index);
    }
  }
}

void to_proto(const query_result_t& result,
              paulette::v1::QueryResponse* response) {
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_info(result.info);
  response->set_key(make_string(result.key));
  response->set_value(make_string(result.value));
  response->set_sequence(result.sequence);
  response->set_codespace(result.codespace);
}

void to_proto(const app_info_t& info, paulette::v1::InfoResponse* response) {
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_last_sequence(info.last_sequence);
  response->set_last_state_root(to_proto(info.last_state_root));
  response->set_contract_id(to_proto(info.contract_id));
}

}  // namespace paulette::rpc
