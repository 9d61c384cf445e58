#include <paulette/blake3/hash.hpp>
#include <tuple>

namespace paulette::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const paulette::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

paulette::schema::hash32_t hasher::finalize() const {
  // Finalizing does not consume the state, more input may follow.
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<paulette::schema::hash32_t>);
  auto output = paulette::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

paulette::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

paulette::schema::hash32_t hash(const paulette::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace paulette::blake3
