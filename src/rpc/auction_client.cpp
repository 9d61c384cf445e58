#include <spdlog/spdlog.h>
#include <paulette/rpc/auction_client.hpp>
#include <paulette/rpc/call_error.hpp>
#include <paulette/rpc/conversion.hpp>

using namespace paulette::schema;

namespace paulette::rpc {

namespace {

void prepare(grpc::ClientContext& context,
             const std::chrono::milliseconds deadline) {
  context.set_deadline(std::chrono::system_clock::now() + deadline);
}

}  // namespace

auction_client::auction_client(
    const std::shared_ptr<grpc::ChannelInterface>& channel,
    const std::chrono::milliseconds deadline)
    : stub_{paulette::v1::DutchAuction::NewStub(channel)},
      deadline_{deadline} {}

void auction_client::initialize(const auction_id_t& auction_id,
                                const signer_id_t& seller,
                                const token_id_t& token_id,
                                const auction_parameters_t& parameters) {
  auto request = paulette::v1::InitializeAuctionRequest{};
  request.set_auction_id(to_proto(auction_id));
  to_proto(seller, request.mutable_seller());
  request.set_token_id(to_proto(token_id));
  request.set_start_price(to_string(parameters.start_price));
  request.set_min_price(to_string(parameters.min_price));
  request.set_slope(to_string(parameters.slope));

  auto context = grpc::ClientContext{};
  prepare(context, deadline_);
  auto response = paulette::v1::InitializeAuctionResponse{};
  auto status = stub_->Initialize(&context, request, &response);
  if (!status.ok()) {
    throw call_error{"DutchAuction.Initialize", status};
  }
  spdlog::debug("Created auction {}", to_hex(bytes_view_t{auction_id}));
}

bool auction_client::buy(const auction_id_t& auction_id,
                         const signer_id_t& buyer) {
  auto request = paulette::v1::BuyRequest{};
  request.set_auction_id(to_proto(auction_id));
  to_proto(buyer, request.mutable_buyer());

  auto context = grpc::ClientContext{};
  prepare(context, deadline_);
  auto response = paulette::v1::BuyResponse{};
  auto status = stub_->Buy(&context, request, &response);
  if (!status.ok()) {
    throw call_error{"DutchAuction.Buy", status};
  }
  return response.accepted();
}

amount_t auction_client::price(const auction_id_t& auction_id) {
  auto request = paulette::v1::GetPriceRequest{};
  request.set_auction_id(to_proto(auction_id));

  auto context = grpc::ClientContext{};
  prepare(context, deadline_);
  auto response = paulette::v1::GetPriceResponse{};
  auto status = stub_->GetPrice(&context, request, &response);
  if (!status.ok()) {
    throw call_error{"DutchAuction.GetPrice", status};
  }
  auto price = try_make_amount(response.price());
  if (!price) {
    throw call_error{"DutchAuction.GetPrice",
                     "price '" + response.price() + "' is not an amount"};
  }
  return *price;
}

}  // namespace paulette::rpc
