#pragma once

#include <grpcpp/grpcpp.h>
#include <paulette/execution/ports.hpp>
#include <paulette/v1/auction.grpc.pb.h>
#include <chrono>
#include <memory>

namespace paulette::rpc {

/// auction_port backed by a remote paulette.v1.DutchAuction service. Every
/// failure is thrown as call_error.
class auction_client final : public paulette::execution::auction_port {
 public:
  explicit auction_client(
      const std::shared_ptr<grpc::ChannelInterface>& channel,
      std::chrono::milliseconds deadline = std::chrono::seconds{5});

  void initialize(
      const paulette::schema::auction_id_t& auction_id,
      const paulette::schema::signer_id_t& seller,
      const paulette::schema::token_id_t& token_id,
      const paulette::schema::auction_parameters_t& parameters) override;

  bool buy(const paulette::schema::auction_id_t& auction_id,
           const paulette::schema::signer_id_t& buyer) override;

  paulette::schema::amount_t price(
      const paulette::schema::auction_id_t& auction_id) override;

 private:
  std::unique_ptr<paulette::v1::DutchAuction::Stub> stub_;
  std::chrono::milliseconds deadline_;
};

}  // namespace paulette::rpc
