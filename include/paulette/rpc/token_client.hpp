#pragma once

#include <grpcpp/grpcpp.h>
#include <paulette/execution/ports.hpp>
#include <paulette/v1/token.grpc.pb.h>
#include <chrono>
#include <memory>

namespace paulette::rpc {

/// token_port backed by a remote paulette.v1.Token service. Every failure is
/// thrown as call_error.
class token_client final : public paulette::execution::token_port {
 public:
  explicit token_client(
      const std::shared_ptr<grpc::ChannelInterface>& channel,
      std::chrono::milliseconds deadline = std::chrono::seconds{5});

  bool transfer_from(const paulette::schema::token_id_t& token_id,
                     const paulette::schema::signer_id_t& spender,
                     const paulette::schema::signer_id_t& from,
                     const paulette::schema::signer_id_t& to,
                     const paulette::schema::amount_t& amount) override;

  paulette::schema::amount_t balance_of(
      const paulette::schema::token_id_t& token_id,
      const paulette::schema::signer_id_t& owner) override;

 private:
  std::unique_ptr<paulette::v1::Token::Stub> stub_;
  std::chrono::milliseconds deadline_;
};

}  // namespace paulette::rpc
