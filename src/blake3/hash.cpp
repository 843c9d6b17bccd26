#include <capvault/blake3/hash.hpp>

namespace capvault::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const capvault::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

capvault::schema::hash32_t hasher::finalize() const {
  auto output = capvault::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

capvault::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

capvault::schema::hash32_t hash(const capvault::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace capvault::blake3
