#include <spdlog/spdlog.h>
#include <paulette/rpc/conversion.hpp>
#include <paulette/rpc/server.hpp>

using namespace paulette::rpc;
using namespace paulette::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

bytes_view_t make_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

}  // namespace

listener::listener(paulette::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const paulette::v1::SubmitRequest* request,
    paulette::v1::SubmitResponse* response) {
  spdlog::debug("Submit from {} ({} bytes)", context->peer(),
                request->tx().size());
  to_proto(execution_engine_.execute(make_view(request->tx())), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const paulette::v1::QueryRequest* request,
    paulette::v1::QueryResponse* response) {
  to_proto(execution_engine_.query(request->path(), make_view(request->data())),
           response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const paulette::v1::InfoRequest* /*request*/,
    paulette::v1::InfoResponse* response) {
  to_proto(execution_engine_.info(), response);
  return finish_ok(context);
}
