#pragma once
#include <capvault/common/critical.hpp>
#include <capvault/schema/encoding/encoder.hpp>
#include <capvault/schema/encoding/scale/asset_kind.hpp>
#include <capvault/schema/encoding/scale/balance_state.hpp>
#include <capvault/schema/encoding/scale/deposit_native.hpp>
#include <capvault/schema/encoding/scale/deposit_token.hpp>
#include <capvault/schema/encoding/scale/ledger_config.hpp>
#include <capvault/schema/encoding/scale/ledger_event.hpp>
#include <capvault/schema/encoding/scale/ledger_event_type.hpp>
#include <capvault/schema/encoding/scale/ledger_info.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>
#include <capvault/schema/encoding/scale/transaction.hpp>
#include <capvault/schema/encoding/scale/transaction_event.hpp>
#include <capvault/schema/encoding/scale/withdraw_native.hpp>
#include <capvault/schema/encoding/scale/withdraw_token.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace capvault::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  capvault::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, capvault::schema::bytes_t& out);

  template <typename T>
  T decode(const capvault::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const capvault::schema::bytes_view_t& bytes);
};

template <typename T>
capvault::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    capvault::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        capvault::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const capvault::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    capvault::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const capvault::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace capvault::schema::encoding

namespace capvault {

using scale_encoder_t =
    schema::encoding::encoder<schema::encoding::scale_encoder_tag>;

}  // namespace capvault
