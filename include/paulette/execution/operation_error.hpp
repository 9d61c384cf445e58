#pragma once

#include <paulette/schema/transaction_error_code.hpp>
#include <optional>
#include <string>

namespace paulette::execution {

/// Why an operation was rejected. `info` carries detail for operators and
/// clients; the code is what callers branch on.
struct operation_error final {
  paulette::schema::transaction_error_code code;
  std::string info;
};

/// Empty when the step succeeded.
using operation_status_t = std::optional<operation_error>;

}  // namespace paulette::execution
