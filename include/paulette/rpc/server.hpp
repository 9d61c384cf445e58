#pragma once

#include <paulette/execution/engine.hpp>
#include <paulette/v1/office_ledger.grpc.pb.h>

namespace paulette::rpc {

/// Callback listener exposing the office ledger over gRPC.
///
/// - Submit: execute one SCALE encoded transaction.
/// - Query: read-path route lookup (see engine::query).
/// - Info: ledger metadata, last sequence and state root.
struct listener final : public paulette::v1::OfficeLedger::CallbackService {
  explicit listener(paulette::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const paulette::v1::SubmitRequest* request,
      paulette::v1::SubmitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const paulette::v1::QueryRequest* request,
      paulette::v1::QueryResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const paulette::v1::InfoRequest* request,
      paulette::v1::InfoResponse* response) override final;

  paulette::execution::engine& execution_engine_;
};

}  // namespace paulette::rpc
