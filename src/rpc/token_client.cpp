#include <paulette/rpc/call_error.hpp>
#include <paulette/rpc/conversion.hpp>
#include <paulette/rpc/token_client.hpp>

using namespace paulette::schema;

namespace paulette::rpc {

token_client::token_client(
    const std::shared_ptr<grpc::ChannelInterface>& channel,
    const std::chrono::milliseconds deadline)
    : stub_{paulette::v1::Token::NewStub(channel)}, deadline_{deadline} {}

bool token_client::transfer_from(const token_id_t& token_id,
                                 const signer_id_t& spender,
                                 const signer_id_t& from,
                                 const signer_id_t& to,
                                 const amount_t& amount) {
  auto request = paulette::v1::TransferFromRequest{};
  request.set_token_id(to_proto(token_id));
  to_proto(spender, request.mutable_spender());
  to_proto(from, request.mutable_from());
  to_proto(to, request.mutable_to());
  request.set_amount(to_string(amount));

  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() + deadline_);
  auto response = paulette::v1::TransferFromResponse{};
  auto status = stub_->TransferFrom(&context, request, &response);
  if (!status.ok()) {
    throw call_error{"Token.TransferFrom", status};
  }
  return response.transferred();
}

amount_t token_client::balance_of(const token_id_t& token_id,
                                  const signer_id_t& owner) {
  auto request = paulette::v1::BalanceOfRequest{};
  request.set_token_id(to_proto(token_id));
  to_proto(owner, request.mutable_owner());

  auto context = grpc::ClientContext{};
  context.set_deadline(std::chrono::system_clock::now() + deadline_);
  auto response = paulette::v1::BalanceOfResponse{};
  auto status = stub_->BalanceOf(&context, request, &response);
  if (!status.ok()) {
    throw call_error{"Token.BalanceOf", status};
  }
  auto balance = try_make_amount(response.balance());
  if (!balance) {
    throw call_error{"Token.BalanceOf",
                     "balance '" + response.balance() + "' is not an amount"};
  }
  return *balance;
}

}  // namespace paulette::rpc
