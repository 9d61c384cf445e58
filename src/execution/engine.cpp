#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <paulette/blake3/hash.hpp>
#include <paulette/crypto/verify.hpp>
#include <paulette/execution/authority.hpp>
#include <paulette/execution/engine.hpp>
#include <paulette/schema/encoding/scale/encoder.hpp>
#include <paulette/schema/key/engine_keys.hpp>
#include <paulette/schema/office_status.hpp>
#include <paulette/schema/query_error_code.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace paulette::schema;

namespace {

inline constexpr auto kExecuteCodespace = std::string_view{"paulette.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"paulette.query"};

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

std::string hex(const bytes_view_t& bytes) {
  return to_hex(bytes);
}

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = false) {
  auto result = transaction_event_attribute_t{};
  result.key = std::move(key);
  result.value = std::move(value);
  result.index = index;
  return result;
}

transaction_event_t make_event(
    std::string type,
    std::vector<transaction_event_attribute_t> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  event.attributes = std::move(attributes);
  return event;
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{[](const initialize_t&) { return std::string_view{"initialize"}; },
                 [](const new_office_t&) { return std::string_view{"new_office"}; },
                 [](const buy_office_t&) { return std::string_view{"buy"}; },
                 [](const pay_tax_t&) { return std::string_view{"pay_tax"}; },
                 [](const revoke_office_t&) { return std::string_view{"revoke"}; }},
      payload);
}

hash32_t fold_state_root(const hash32_t& previous,
                         const bytes_t& tx,
                         const uint64_t sequence) {
  auto encoder = paulette::execution::engine::encoder_t{};
  auto suffix = encoder.encode(sequence);
  return paulette::blake3::hasher{}
      .update(bytes_view_t{previous})
      .update(view(tx))
      .update(view(suffix))
      .finalize();
}

std::optional<timestamp_seconds_t> extend_expiry(
    const timestamp_seconds_t base) {
  constexpr auto kPeriod = paulette::execution::kRenewalPeriodSeconds;
  if (base > std::numeric_limits<timestamp_seconds_t>::max() - kPeriod) {
    return std::nullopt;
  }
  return base + kPeriod;
}

std::string status_name(const std::optional<office_record_t>& record) {
  return std::string{to_string(status_of(record))};
}

void reject_query(query_result_t& result,
                  const query_error_code code,
                  std::string log,
                  std::string info = {}) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
}

}  // namespace

namespace paulette::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               auction_port& auction,
               token_port& token,
               const time_source& clock,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      auction_{auction},
      token_{token},
      clock_{clock},
      options_{std::move(options)},
      signature_verifier_{paulette::crypto::verify_signature},
      last_state_root_{make_zero_hash()} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (options_.strict_crypto && !paulette::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1; signed admin calls "
                 "will fail verification");
  }
  if (!options_.strict_crypto) {
    spdlog::warn("Strict crypto disabled; admin signatures are not verified");
  }
  spdlog::info("Office ledger ready at sequence {} for contract {}",
               last_sequence_, hex(bytes_view_t{options_.contract_id}));
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto result = transaction_result_t{};
  result.codespace = std::string{kExecuteCodespace};
  if (raw_tx.empty()) {
    result.code = static_cast<uint32_t>(transaction_error_code::invalid_transaction);
    result.log = "invalid transaction";
    result.info = "empty transaction";
    return result;
  }
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    result.code = static_cast<uint32_t>(transaction_error_code::invalid_transaction);
    result.log = "invalid transaction";
    result.info = "failed to decode transaction bytes";
    return result;
  }
  return execute_locked(*tx, make_bytes(raw_tx));
}

transaction_result_t engine::execute(const transaction_t& tx) {
  auto lock = std::scoped_lock{mutex_};
  return execute_locked(tx, encoder_.encode(tx));
}

transaction_result_t engine::execute_locked(const transaction_t& tx,
                                            const bytes_t& raw_tx) {
  auto result = transaction_result_t{};
  result.codespace = std::string{kExecuteCodespace};
  if (tx.version != 1) {
    result.code = static_cast<uint32_t>(
        transaction_error_code::unsupported_transaction_version);
    result.log = std::string{
        to_string(transaction_error_code::unsupported_transaction_version)};
    result.info = "expected version 1, got " + std::to_string(tx.version);
    return result;
  }

  const auto operation = payload_name(tx.payload);
  const auto now = clock_.now();
  auto state = staged_state{encoder_, storage_};
  auto outcome = operation_outcome{};
  try {
    outcome = apply(state, tx.invoker, tx.payload, now);
  } catch (const std::exception& ex) {
    spdlog::error("{} failed in an external call: {}", operation, ex.what());
    outcome = rejected(transaction_error_code::external_call_failed, ex.what());
  }

  if (outcome.status) {
    spdlog::warn("Rejected {} from {}: {} ({})", operation,
                 to_string(tx.invoker), to_string(outcome.status->code),
                 outcome.status->info);
    result.code = static_cast<uint32_t>(outcome.status->code);
    result.log = std::string{to_string(outcome.status->code)};
    result.info = std::move(outcome.status->info);
    return result;
  }

  const auto sequence = last_sequence_ + 1;
  const auto state_root = fold_state_root(last_state_root_, raw_tx, sequence);
  auto entry = history_entry_t{};
  entry.sequence = sequence;
  entry.timestamp = now;
  entry.code = 0;
  entry.tx = raw_tx;
  auto history_key = key::make_history_key(encoder_, sequence);
  state.put(view(history_key), entry);
  state.commit(paulette::storage::committed_state{.sequence = sequence,
                                                  .state_root = state_root});
  last_sequence_ = sequence;
  last_state_root_ = state_root;

  spdlog::info("Committed {} at sequence {} (time {})", operation, sequence,
               now);
  result.code = 0;
  result.log = "ok";
  result.info = std::string{operation};
  result.data = encoder_.encode(std::tuple{sequence, state_root});
  result.events = std::move(outcome.events);
  return result;
}

engine::operation_outcome engine::rejected(const transaction_error_code code,
                                           std::string info) {
  return {.status = operation_error{.code = code, .info = std::move(info)},
          .events = {}};
}

engine::operation_outcome engine::apply(staged_state& state,
                                        const signer_id_t& invoker,
                                        const transaction_payload_t& payload,
                                        const timestamp_seconds_t now) {
  const auto config = load_config(state);
  const auto uninitialized = [] {
    return rejected(transaction_error_code::not_initialized,
                    "contract has not been initialized");
  };
  return std::visit(
      overloaded{
          [&](const initialize_t& op) { return initialize(state, config, op); },
          [&](const new_office_t& op) {
            return config ? new_office(state, *config, invoker, op)
                          : uninitialized();
          },
          [&](const buy_office_t& op) {
            return config ? buy(state, op, now) : uninitialized();
          },
          [&](const pay_tax_t& op) {
            return config ? pay_tax(state, *config, op, now) : uninitialized();
          },
          [&](const revoke_office_t& op) {
            return config ? revoke(state, *config, invoker, op, now)
                          : uninitialized();
          }},
      payload);
}

engine::operation_outcome engine::initialize(
    staged_state& state,
    const std::optional<contract_config>& config,
    const initialize_t& op) {
  if (config) {
    return rejected(transaction_error_code::already_initialized,
                    "administrator is already " + to_string(config->admin));
  }
  auto admin_key = key::make_admin_key(encoder_);
  auto token_key = key::make_token_key(encoder_);
  auto tax_key = key::make_tax_key(encoder_);
  state.put(view(admin_key), op.admin);
  state.put(view(token_key), op.token_id);
  state.put(view(tax_key), op.tax);

  return {.status = std::nullopt,
          .events = {make_event(
              "contract_initialized",
              {attribute("admin", to_string(op.admin), true),
               attribute("token_id", hex(bytes_view_t{op.token_id})),
               attribute("tax", to_string(op.tax))})}};
}

engine::operation_outcome engine::new_office(staged_state& state,
                                             const contract_config& config,
                                             const signer_id_t& invoker,
                                             const new_office_t& op) {
  const auto digest = make_signing_digest(encoder_, options_.contract_id, op);
  if (auto error = authorize_admin(state, config, invoker, op.auth, digest)) {
    return {.status = std::move(error), .events = {}};
  }

  const auto office = hex(bytes_view_t{op.office_id});
  if (auto existing = load_office(state, op.office_id)) {
    return rejected(transaction_error_code::duplicate_id,
                    "office " + office + " is already " +
                        status_name(existing));
  }

  auction_.initialize(op.auction_id, config.admin, config.token_id, op.auction);
  auto for_sale_key = key::make_for_sale_key(encoder_, op.office_id);
  auto record = for_sale_record_t{};
  record.auction_id = op.auction_id;
  state.put(view(for_sale_key), record);

  return {.status = std::nullopt,
          .events = {make_event(
              "office_listed",
              {attribute("office_id", office, true),
               attribute("auction_id", hex(bytes_view_t{op.auction_id}), true),
               attribute("start_price", to_string(op.auction.start_price)),
               attribute("min_price", to_string(op.auction.min_price)),
               attribute("slope", to_string(op.auction.slope))})}};
}

engine::operation_outcome engine::buy(staged_state& state,
                                      const buy_office_t& op,
                                      const timestamp_seconds_t now) {
  const auto office = hex(bytes_view_t{op.office_id});
  auto for_sale_key = key::make_for_sale_key(encoder_, op.office_id);
  auto for_sale = state.get<for_sale_record_t>(view(for_sale_key));
  if (!for_sale) {
    return rejected(transaction_error_code::not_for_sale,
                    "office " + office + " is not for sale");
  }
  const auto expires_at = extend_expiry(now);
  if (!expires_at) {
    return rejected(transaction_error_code::invalid_transaction,
                    "expiry overflows at time " + std::to_string(now));
  }
  if (!auction_.buy(for_sale->auction_id, op.buyer)) {
    return rejected(transaction_error_code::bid_rejected,
                    "auction rejected bid from " + to_string(op.buyer));
  }

  auto record = bought_record_t{};
  record.holder = op.buyer;
  record.expires_at = *expires_at;
  record.last_paid_at = now;
  auto bought_key = key::make_bought_key(encoder_, op.office_id);
  state.remove(view(for_sale_key));
  state.put(view(bought_key), record);

  return {.status = std::nullopt,
          .events = {make_event(
              "office_bought",
              {attribute("office_id", office, true),
               attribute("holder", to_string(op.buyer), true),
               attribute("expires_at", std::to_string(record.expires_at))})}};
}

// The bought record is checked before any tokens move so a tax payment for an
// unknown office never reaches the token module.
engine::operation_outcome engine::pay_tax(staged_state& state,
                                          const contract_config& config,
                                          const pay_tax_t& op,
                                          const timestamp_seconds_t now) {
  const auto office = hex(bytes_view_t{op.office_id});
  auto bought_key = key::make_bought_key(encoder_, op.office_id);
  auto record = state.get<bought_record_t>(view(bought_key));
  if (!record) {
    return rejected(transaction_error_code::not_found,
                    "office " + office + " has no holder");
  }
  const auto expires_at = extend_expiry(record->expires_at);
  if (!expires_at) {
    return rejected(transaction_error_code::invalid_transaction,
                    "expiry of office " + office + " overflows");
  }

  const auto contract =
      signer_id_t{std::in_place_type<named_signer_t>, options_.contract_id};
  if (!token_.transfer_from(config.token_id, contract, op.payer, config.admin,
                            config.tax)) {
    return rejected(transaction_error_code::transfer_failed,
                    "token refused tax transfer of " + to_string(config.tax) +
                        " from " + to_string(op.payer));
  }

  record->expires_at = *expires_at;
  record->last_paid_at = now;
  state.put(view(bought_key), *record);

  return {.status = std::nullopt,
          .events = {make_event(
              "tax_paid",
              {attribute("office_id", office, true),
               attribute("payer", to_string(op.payer), true),
               attribute("amount", to_string(config.tax)),
               attribute("expires_at", std::to_string(record->expires_at))})}};
}

engine::operation_outcome engine::revoke(staged_state& state,
                                         const contract_config& config,
                                         const signer_id_t& invoker,
                                         const revoke_office_t& op,
                                         const timestamp_seconds_t now) {
  const auto digest = make_signing_digest(encoder_, options_.contract_id, op);
  if (auto error = authorize_admin(state, config, invoker, op.auth, digest)) {
    return {.status = std::move(error), .events = {}};
  }

  const auto office = hex(bytes_view_t{op.office_id});
  auto bought_key = key::make_bought_key(encoder_, op.office_id);
  auto record = state.get<bought_record_t>(view(bought_key));
  if (!record) {
    return rejected(transaction_error_code::not_found,
                    "office " + office + " is " +
                        status_name(load_office(state, op.office_id)) +
                        ", not bought");
  }
  if (now <= record->expires_at) {
    return rejected(transaction_error_code::not_expired,
                    "office " + office + " expires at " +
                        std::to_string(record->expires_at) + ", now " +
                        std::to_string(now));
  }

  state.remove(view(bought_key));
  auction_.initialize(op.auction_id, config.admin, config.token_id, op.auction);
  auto for_sale_key = key::make_for_sale_key(encoder_, op.office_id);
  auto listing = for_sale_record_t{};
  listing.auction_id = op.auction_id;
  state.put(view(for_sale_key), listing);

  return {.status = std::nullopt,
          .events = {make_event(
              "office_revoked",
              {attribute("office_id", office, true),
               attribute("previous_holder", to_string(record->holder), true),
               attribute("auction_id", hex(bytes_view_t{op.auction_id}),
                         true)})}};
}

// Invoker mode is honoured only when the host authenticated the invoker or
// strict crypto is off.
operation_status_t engine::authorize_admin(staged_state& state,
                                           const contract_config& config,
                                           const signer_id_t& invoker,
                                           const admin_auth_t& auth,
                                           const hash32_t& digest) const {
  if (options_.strict_crypto && !options_.invoker_authenticated &&
      std::holds_alternative<invoker_authorization_t>(auth.authorization)) {
    return operation_error{
        .code = transaction_error_code::unauthorized,
        .info = "invoker is not authenticated by this host; sign the call as " +
                to_string(config.admin)};
  }
  if (auto error = check_admin(config.admin, invoker, auth.authorization,
                               digest, active_verifier())) {
    return error;
  }
  return verify_and_consume_nonce(state, invoker, auth.authorization,
                                  auth.nonce);
}

query_result_t engine::nonce() const {
  auto lock = std::scoped_lock{mutex_};
  return nonce_locked();
}

query_result_t engine::nonce_locked() const {
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  result.sequence = last_sequence_;
  auto state = staged_state{encoder_, storage_};
  auto config = load_config(state);
  if (!config) {
    reject_query(result, query_error_code::not_initialized,
                 "contract has not been initialized");
    return result;
  }
  result.value = encoder_.encode(stored_nonce(state, config->admin));
  return result;
}

query_result_t engine::get_price(const office_id_t& office_id) {
  auto lock = std::scoped_lock{mutex_};
  return get_price_locked(bytes_view_t{office_id});
}

query_result_t engine::get_price_locked(const bytes_view_t& data) {
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  result.sequence = last_sequence_;
  result.key = make_bytes(data);
  auto office_id = encoder_.try_decode<office_id_t>(data);
  if (!office_id || data.size() != office_id->size()) {
    reject_query(result, query_error_code::invalid_key,
                 "office id must be 16 bytes");
    return result;
  }
  auto state = staged_state{encoder_, storage_};
  if (!load_config(state)) {
    reject_query(result, query_error_code::not_initialized,
                 "contract has not been initialized");
    return result;
  }
  auto for_sale_key = key::make_for_sale_key(encoder_, *office_id);
  auto for_sale = state.get<for_sale_record_t>(view(for_sale_key));
  if (!for_sale) {
    reject_query(result, query_error_code::not_for_sale,
                 "office is not for sale", hex(data));
    return result;
  }
  try {
    result.value = encoder_.encode(auction_.price(for_sale->auction_id));
  } catch (const std::exception& ex) {
    spdlog::error("Price lookup failed in an external call: {}", ex.what());
    reject_query(result, query_error_code::external_call_failed,
                 "external call failed", ex.what());
  }
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};
  result.sequence = last_sequence_;
  result.key = make_bytes(data);

  try {
    if (path == "/admin/nonce") {
      return nonce_locked();
    }
    if (path == "/office/price") {
      return get_price_locked(data);
    }
    if (path == "/engine/info") {
      result.value = encoder_.encode(
          std::tuple{last_sequence_, last_state_root_, options_.contract_id});
      return result;
    }
    if (path == "/history/range") {
      auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
      if (!range || std::get<0>(*range) > std::get<1>(*range)) {
        reject_query(result, query_error_code::invalid_key,
                     "history range must be tuple{from, to} with from <= to");
        return result;
      }
      if (std::get<1>(*range) - std::get<0>(*range) >= kMaxHistoryRange) {
        reject_query(result, query_error_code::invalid_key,
                     "history range spans more than " +
                         std::to_string(kMaxHistoryRange) + " entries");
        return result;
      }
      result.value = encoder_.encode(
          history_locked(std::get<0>(*range), std::get<1>(*range)));
      return result;
    }

    auto state = staged_state{encoder_, storage_};
    auto config = load_config(state);
    if (path == "/office/state") {
      auto office_id = encoder_.try_decode<office_id_t>(data);
      if (!office_id || data.size() != office_id->size()) {
        reject_query(result, query_error_code::invalid_key,
                     "office id must be 16 bytes");
        return result;
      }
      auto record = load_office(state, *office_id);
      if (!record) {
        reject_query(result, query_error_code::not_found,
                     "office is uninitialized", hex(data));
        return result;
      }
      result.value = encoder_.encode(*record);
      return result;
    }
    if (path == "/contract/config" || path == "/vault/balance") {
      if (!config) {
        reject_query(result, query_error_code::not_initialized,
                     "contract has not been initialized");
        return result;
      }
      if (path == "/contract/config") {
        result.value = encoder_.encode(
            std::tuple{config->admin, config->token_id, config->tax});
      } else {
        result.value =
            encoder_.encode(token_.balance_of(config->token_id, config->admin));
      }
      return result;
    }
  } catch (const std::exception& ex) {
    spdlog::error("Query {} failed in an external call: {}", path, ex.what());
    reject_query(result, query_error_code::external_call_failed,
                 "external call failed", ex.what());
    return result;
  }

  reject_query(result, query_error_code::unsupported_path,
               "unsupported query path", std::string{path});
  return result;
}

std::vector<history_entry_t> engine::history(const uint64_t from,
                                             const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  return history_locked(from, to);
}

std::vector<history_entry_t> engine::history_locked(const uint64_t from,
                                                    const uint64_t to) const {
  auto output = std::vector<history_entry_t>{};
  if (from > to) {
    return output;
  }
  const auto last = to - from >= kMaxHistoryRange ? from + kMaxHistoryRange - 1
                                                  : to;
  auto first_key = key::make_history_key(encoder_, from);
  auto last_key = key::make_history_key(encoder_, last);
  for (const auto& [entry_key, value] : storage_.list_range(
           view(first_key), view(last_key), kMaxHistoryRange)) {
    if (!key::parse_history_key(encoder_, view(entry_key))) {
      continue;
    }
    output.push_back(encoder_.decode<history_entry_t>(view(value)));
  }
  return output;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_sequence = last_sequence_;
  result.last_state_root = last_state_root_;
  result.contract_id = options_.contract_id;
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

signature_verifier_t engine::active_verifier() const {
  if (!options_.strict_crypto) {
    return {};
  }
  return signature_verifier_;
}

std::optional<engine::contract_config> engine::load_config(
    const staged_state& state) const {
  auto admin_key = key::make_admin_key(encoder_);
  auto admin = state.get<signer_id_t>(view(admin_key));
  if (!admin) {
    return std::nullopt;
  }
  auto token_key = key::make_token_key(encoder_);
  auto tax_key = key::make_tax_key(encoder_);
  auto token_id = state.get<token_id_t>(view(token_key));
  auto tax = state.get<amount_t>(view(tax_key));
  if (!token_id || !tax) {
    paulette::common::critical("contract configuration is incomplete");
  }
  return contract_config{.admin = std::move(*admin),
                         .token_id = *token_id,
                         .tax = std::move(*tax)};
}

std::optional<office_record_t> engine::load_office(
    const staged_state& state,
    const office_id_t& office_id) const {
  auto for_sale_key = key::make_for_sale_key(encoder_, office_id);
  if (auto record = state.get<for_sale_record_t>(view(for_sale_key))) {
    return office_record_t{*record};
  }
  auto bought_key = key::make_bought_key(encoder_, office_id);
  if (auto record = state.get<bought_record_t>(view(bought_key))) {
    return office_record_t{*record};
  }
  return std::nullopt;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger checkpoint");
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    last_state_root_ = committed->state_root;
    return;
  }
  storage_.save_committed_state(paulette::storage::committed_state{
      .sequence = last_sequence_, .state_root = last_state_root_});
}

}  // namespace paulette::execution
