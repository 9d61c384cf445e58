#pragma once

#include <grpcpp/support/status.h>
#include <stdexcept>
#include <string>

namespace paulette::rpc {

/// A call to an external module did not complete with an OK status or
/// returned a reply that could not be read.
class call_error final : public std::runtime_error {
 public:
  call_error(const std::string& method, const grpc::Status& status)
      : std::runtime_error{method + " failed: " + status.error_message()},
        code_{status.error_code()} {}

  call_error(const std::string& method, const std::string& reason)
      : std::runtime_error{method + " failed: " + reason},
        code_{grpc::StatusCode::INTERNAL} {}

  grpc::StatusCode code() const noexcept { return code_; }

 private:
  grpc::StatusCode code_;
};

}  // namespace paulette::rpc
