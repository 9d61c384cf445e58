#pragma once

#include <paulette/schema/auction_parameters.hpp>
#include <paulette/schema/primitives.hpp>

// Boundaries to the modules the office ledger consumes but does not own.
// Implementations may throw; the engine turns any std::exception raised from
// a port into an external_call_failed result and discards the operation.
namespace paulette::execution {

/// One Dutch auction instance per auction id.
class auction_port {
 public:
  virtual ~auction_port() = default;

  /// Create the auction. The seller is the administrator and the auction is
  /// denominated in the contract's token.
  virtual void initialize(
      const paulette::schema::auction_id_t& auction_id,
      const paulette::schema::signer_id_t& seller,
      const paulette::schema::token_id_t& token_id,
      const paulette::schema::auction_parameters_t& parameters) = 0;

  /// Place a bid at the live price. False when the auction rejects it.
  virtual bool buy(const paulette::schema::auction_id_t& auction_id,
                   const paulette::schema::signer_id_t& buyer) = 0;

  /// Live, time-decayed price.
  virtual paulette::schema::amount_t price(
      const paulette::schema::auction_id_t& auction_id) = 0;
};

class token_port {
 public:
  virtual ~token_port() = default;

  /// Move `amount` from `from` to `to` against an allowance `from` granted to
  /// `spender`. False when the token module refuses the transfer.
  virtual bool transfer_from(const paulette::schema::token_id_t& token_id,
                             const paulette::schema::signer_id_t& spender,
                             const paulette::schema::signer_id_t& from,
                             const paulette::schema::signer_id_t& to,
                             const paulette::schema::amount_t& amount) = 0;

  virtual paulette::schema::amount_t balance_of(
      const paulette::schema::token_id_t& token_id,
      const paulette::schema::signer_id_t& owner) = 0;
};

class time_source {
 public:
  virtual ~time_source() = default;

  virtual paulette::schema::timestamp_seconds_t now() const = 0;
};

/// Wall clock, whole seconds since the Unix epoch.
class system_time_source final : public time_source {
 public:
  paulette::schema::timestamp_seconds_t now() const override;
};

}  // namespace paulette::execution
