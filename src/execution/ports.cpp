#include <paulette/execution/ports.hpp>
#include <chrono>

namespace paulette::execution {

paulette::schema::timestamp_seconds_t system_time_source::now() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<paulette::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

}  // namespace paulette::execution
