#pragma once

#include <paulette/execution/operation_error.hpp>
#include <paulette/execution/ports.hpp>
#include <paulette/execution/signature_verifier.hpp>
#include <paulette/execution/staged_state.hpp>
#include <paulette/schema/admin_auth.hpp>
#include <paulette/schema/app_info.hpp>
#include <paulette/schema/encoding/encoder.hpp>
#include <paulette/schema/history_entry.hpp>
#include <paulette/schema/office_record.hpp>
#include <paulette/schema/primitives.hpp>
#include <paulette/schema/query_result.hpp>
#include <paulette/schema/transaction.hpp>
#include <paulette/schema/transaction_error_code.hpp>
#include <paulette/schema/transaction_event.hpp>
#include <paulette/schema/transaction_result.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paulette::execution {

/// One renewal period: added to expiry on purchase and on every tax payment.
inline constexpr paulette::schema::duration_seconds_t kRenewalPeriodSeconds{
    604800};

/// Most history rows one /history/range query may span.
inline constexpr uint64_t kMaxHistoryRange{1000};

struct engine_options final {
  /// Identity of this ledger instance. It is the spender on tax transfers
  /// and is bound into every admin signing digest.
  paulette::schema::contract_id_t contract_id{};
  /// Verify admin signatures. When false, signed calls are checked for
  /// identity and nonce only.
  bool strict_crypto{true};
  /// The host authenticated `tx.invoker` before submitting. When false and
  /// strict_crypto is set, administrator calls must carry signed
  /// authorization.
  bool invoker_authenticated{false};
};

/// Office lifecycle state machine.
///
/// Each transaction runs to completion under the engine mutex against a
/// staged overlay. The overlay, the history row and the new checkpoint land
/// in one storage batch, or not at all.
class engine final {
 public:
  using encoder_t = staged_state::encoder_t;
  using storage_t = staged_state::storage_t;

  engine(encoder_t& encoder,
         storage_t& storage,
         auction_port& auction,
         token_port& token,
         const time_source& clock,
         engine_options options = {});

  /// Decode and execute a SCALE encoded transaction.
  paulette::schema::transaction_result_t execute(
      const paulette::schema::bytes_view_t& raw_tx);

  paulette::schema::transaction_result_t execute(
      const paulette::schema::transaction_t& tx);

  /// The administrator's stored nonce as SCALE uint64.
  paulette::schema::query_result_t nonce() const;

  /// The live auction price of a ForSale office as SCALE amount.
  paulette::schema::query_result_t get_price(
      const paulette::schema::office_id_t& office_id);

  /// Read-path routes: /admin/nonce, /office/price, /office/state,
  /// /contract/config, /vault/balance, /engine/info, /history/range.
  paulette::schema::query_result_t query(
      std::string_view path,
      const paulette::schema::bytes_view_t& data);

  /// Committed history rows in the inclusive sequence range, at most
  /// kMaxHistoryRange of them starting at `from`.
  std::vector<paulette::schema::history_entry_t> history(uint64_t from,
                                                         uint64_t to) const;

  paulette::schema::app_info_t info() const;

  /// Replace the admin signature check. Ignored unless strict_crypto is set.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  struct operation_outcome final {
    operation_status_t status;
    std::vector<paulette::schema::transaction_event_t> events;
  };

  /// Administrator, token and tax rate, present once initialized.
  struct contract_config final {
    paulette::schema::signer_id_t admin;
    paulette::schema::token_id_t token_id;
    paulette::schema::amount_t tax;
  };

  static operation_outcome rejected(
      paulette::schema::transaction_error_code code,
      std::string info);

  operation_outcome apply(staged_state& state,
                          const paulette::schema::signer_id_t& invoker,
                          const paulette::schema::transaction_payload_t& payload,
                          paulette::schema::timestamp_seconds_t now);

  /// Invoker-mode gate, administrator check, then nonce consumption.
  operation_status_t authorize_admin(
      staged_state& state,
      const contract_config& config,
      const paulette::schema::signer_id_t& invoker,
      const paulette::schema::admin_auth_t& auth,
      const paulette::schema::hash32_t& digest) const;

  operation_outcome initialize(staged_state& state,
                               const std::optional<contract_config>& config,
                               const paulette::schema::initialize_t& op);
  operation_outcome new_office(staged_state& state,
                               const contract_config& config,
                               const paulette::schema::signer_id_t& invoker,
                               const paulette::schema::new_office_t& op);
  operation_outcome buy(staged_state& state,
                        const paulette::schema::buy_office_t& op,
                        paulette::schema::timestamp_seconds_t now);
  operation_outcome pay_tax(staged_state& state,
                            const contract_config& config,
                            const paulette::schema::pay_tax_t& op,
                            paulette::schema::timestamp_seconds_t now);
  operation_outcome revoke(staged_state& state,
                           const contract_config& config,
                           const paulette::schema::signer_id_t& invoker,
                           const paulette::schema::revoke_office_t& op,
                           paulette::schema::timestamp_seconds_t now);

  paulette::schema::transaction_result_t execute_locked(
      const paulette::schema::transaction_t& tx,
      const paulette::schema::bytes_t& raw_tx);

  paulette::schema::query_result_t nonce_locked() const;
  paulette::schema::query_result_t get_price_locked(
      const paulette::schema::bytes_view_t& data);

  std::optional<contract_config> load_config(const staged_state& state) const;

  std::vector<paulette::schema::history_entry_t> history_locked(
      uint64_t from,
      uint64_t to) const;

  /// The admin signature check in force: none unless strict_crypto is set.
  signature_verifier_t active_verifier() const;

  std::optional<paulette::schema::office_record_t> load_office(
      const staged_state& state,
      const paulette::schema::office_id_t& office_id) const;

  /// Loads the committed sequence and state root at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  auction_port& auction_;
  token_port& token_;
  const time_source& clock_;
  engine_options options_;
  signature_verifier_t signature_verifier_;
  uint64_t last_sequence_{};
  paulette::schema::hash32_t last_state_root_{};
};

}  // namespace paulette::execution
