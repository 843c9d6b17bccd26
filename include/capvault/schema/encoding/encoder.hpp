#pragma once
#include <capvault/schema/primitives.hpp>
#include <optional>
#include <span>

namespace capvault::schema::encoding {

// The wire format is a build-time choice made through the tag type; SCALE is
// the only backend.
template <typename Library>
struct encoder {
  template <typename T>
  capvault::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, capvault::schema::bytes_t& out);

  template <typename T>
  T decode(const capvault::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const capvault::schema::bytes_view_t& bytes);
};

}  // namespace capvault::schema::encoding
